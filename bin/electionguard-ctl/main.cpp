/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "block_commands.hpp"
#include "document_commands.hpp"
#include <spdlog/spdlog.h>
#include <iostream>

void print_usage() {
    std::cout << "Usage: electionguard-ctl <command> <action> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  block pad         Pad a file into a fixed-size block\n";
    std::cout << "  block unpad       Recover the payload of a padded block\n";
    std::cout << "  document check    Check a JSON document against a record type\n";
    std::cout << "\nFor help on a specific command, use:\n";
    std::cout << "  electionguard-ctl block pad --help\n";
    std::cout << "  electionguard-ctl block unpad --help\n";
    std::cout << "  electionguard-ctl document check --help\n";
}

int main(int argc, char** argv) {
    // Configure spdlog
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command != "block" && command != "document") {
        spdlog::error("Unknown command: {}", command);
        print_usage();
        return 1;
    }

    if (argc < 3) {
        std::cerr << "Error: '" << command << "' command requires an action\n";
        print_usage();
        return 1;
    }

    std::string action = argv[2];

    // Remove the first two arguments (command and action)
    if (command == "block" && action == "pad") {
        return electionguard_ctl::block_pad(argc - 2, argv + 2);
    } else if (command == "block" && action == "unpad") {
        return electionguard_ctl::block_unpad(argc - 2, argv + 2);
    } else if (command == "document" && action == "check") {
        return electionguard_ctl::document_check(argc - 2, argv + 2);
    }

    spdlog::error("Unknown {} action: {}", command, action);
    print_usage();
    return 1;
}
