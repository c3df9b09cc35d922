/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_CTL_BLOCK_COMMANDS_HPP
#define ELECTIONGUARD_CTL_BLOCK_COMMANDS_HPP

namespace electionguard_ctl {

/**
 * @brief Pad the content of a file into a fixed-size block
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code
 */
int block_pad(int argc, char** argv);

/**
 * @brief Recover the payload of a padded block
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code
 */
int block_unpad(int argc, char** argv);

} // namespace electionguard_ctl

#endif // ELECTIONGUARD_CTL_BLOCK_COMMANDS_HPP
