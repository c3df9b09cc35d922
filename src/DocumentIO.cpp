/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/DocumentIO.hpp"
#include "electionguard/Exception.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace electionguard {

namespace fs = std::filesystem;

std::string constructPath(const std::string& name,
                          const std::string& directory,
                          const std::string& extension) {
    return (fs::path(directory) / (name + "." + extension)).string();
}

Document readDocument(std::istream& stream) {
    std::stringstream buffer;
    buffer << stream.rdbuf();
    if(stream.bad())
        throw Exception{"Failed to read JSON stream"};
    return Document{buffer.str()};
}

Document readDocument(const std::string& path) {
    std::error_code ec;
    if(!fs::is_regular_file(path, ec))
        throw Exception{"Not a regular file: " + path};
    std::ifstream file(path);
    if(!file.is_open())
        throw Exception{"Failed to open file: " + path};
    spdlog::debug("Reading JSON document from {}", path);
    try {
        return readDocument(file);
    } catch(const ParseError& ex) {
        throw ParseError{"In file " + path + ": " + ex.what()};
    }
}

std::string writeDocument(const Document& doc,
                          const std::string& name,
                          const std::string& directory,
                          int indent) {
    if(!directory.empty()) {
        try {
            fs::create_directories(directory);
        } catch(const fs::filesystem_error& e) {
            throw Exception{
                "Failed to create directory: " + std::string(e.what())
            };
        }
    }

    const auto content = doc.dump(indent);
    const auto path = constructPath(name, directory);
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if(!file.is_open())
        throw Exception{"Failed to open file for writing: " + path};
    file << content;
    file.flush();
    if(!file)
        throw Exception{"Failed to write file: " + path};
    spdlog::debug("Wrote JSON document to {}", path);
    return path;
}

}
