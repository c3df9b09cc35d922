/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "common.hpp"
#include <electionguard/DocumentIO.hpp>
#include <electionguard/Exception.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>

namespace electionguard_ctl {

electionguard::SerializationContext load_context(const std::string& filename) {
    if (filename.empty()) {
        return electionguard::SerializationContext{};
    }
    auto config = electionguard::readDocument(filename);
    spdlog::debug("Serialization config: {}", config.dump());
    return electionguard::SerializationContext::FromDocument(config);
}

electionguard::Bytes read_binary_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw electionguard::Exception{"Failed to open file: " + filename};
    }
    electionguard::Bytes data{std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw electionguard::Exception{"Failed to read file: " + filename};
    }
    return data;
}

void write_binary_file(const std::string& filename, const electionguard::Bytes& data) {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw electionguard::Exception{"Failed to open file for writing: " + filename};
    }
    file.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file) {
        throw electionguard::Exception{"Failed to write file: " + filename};
    }
}

} // namespace electionguard_ctl
