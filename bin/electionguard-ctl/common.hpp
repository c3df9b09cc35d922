/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_CTL_COMMON_HPP
#define ELECTIONGUARD_CTL_COMMON_HPP

#include <electionguard/PaddedBlock.hpp>
#include <electionguard/SerializationContext.hpp>
#include <string>
#include <vector>

namespace electionguard_ctl {

/**
 * @brief Build the SerializationContext described by a JSON configuration file
 * @param filename Path to the JSON file, or an empty string for the default context
 * @return SerializationContext
 */
electionguard::SerializationContext load_context(const std::string& filename);

/**
 * @brief Read a whole file as bytes
 * @param filename Path to the file
 * @return File content
 */
electionguard::Bytes read_binary_file(const std::string& filename);

/**
 * @brief Write bytes to a file, replacing its content
 * @param filename Path to the file
 * @param data Content to write
 */
void write_binary_file(const std::string& filename, const electionguard::Bytes& data);

} // namespace electionguard_ctl

#endif // ELECTIONGUARD_CTL_COMMON_HPP
