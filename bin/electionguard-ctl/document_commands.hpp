/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_CTL_DOCUMENT_COMMANDS_HPP
#define ELECTIONGUARD_CTL_DOCUMENT_COMMANDS_HPP

#include <string>
#include <vector>

namespace electionguard_ctl {

/**
 * @brief Names of the record types accepted by document commands
 */
std::vector<std::string> document_types();

/**
 * @brief Load a JSON document as a record type, optionally rewriting it
 * in canonical form
 * @param argc Argument count
 * @param argv Argument vector
 * @return Exit code
 */
int document_check(int argc, char** argv);

} // namespace electionguard_ctl

#endif // ELECTIONGUARD_CTL_DOCUMENT_COMMANDS_HPP
