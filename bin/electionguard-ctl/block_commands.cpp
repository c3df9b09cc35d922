/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "block_commands.hpp"
#include "common.hpp"
#include <electionguard/PaddedBlock.hpp>
#include <electionguard/Exception.hpp>
#include <tclap/CmdLine.h>
#include <spdlog/spdlog.h>

namespace electionguard_ctl {

int block_pad(int argc, char** argv) {
    try {
        TCLAP::CmdLine cmd("Pad a file into a fixed-size block", ' ', "1.0");

        TCLAP::ValueArg<std::string> inArg("", "in", "Input file", true, "", "filename", cmd);
        TCLAP::ValueArg<std::string> outArg("", "out", "Output file", true, "", "filename", cmd);
        TCLAP::ValueArg<size_t> sizeArg("", "block-size", "Total block size in bytes", false, 512, "size", cmd);
        TCLAP::SwitchArg truncateArg("", "allow-truncation", "Cut inputs that exceed the block capacity", cmd, false);

        std::vector<std::string> allowed_levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
        TCLAP::ValuesConstraint<std::string> level_constraint(allowed_levels);
        TCLAP::ValueArg<std::string> loggingArg("", "logging", "Logging level", false, "info", &level_constraint, cmd);

        cmd.parse(argc, argv);

        // Set logging level
        spdlog::set_level(spdlog::level::from_str(loggingArg.getValue()));

        auto size = electionguard::blockSizeFromBytes(sizeArg.getValue());
        auto payload = read_binary_file(inArg.getValue());
        spdlog::debug("Read {} bytes from {}", payload.size(), inArg.getValue());

        if (payload.size() > electionguard::capacity(size) && truncateArg.getValue()) {
            spdlog::warn("Input of {} bytes truncated to {} bytes",
                         payload.size(), electionguard::capacity(size));
        }

        auto block = electionguard::PaddedBlock::Encode(payload, size, truncateArg.getValue());
        write_binary_file(outArg.getValue(), block.bytes());

        spdlog::info("Wrote {}-byte block ({} bytes of padding) to {}",
                     block.bytes().size(), block.paddingLength(), outArg.getValue());
        return 0;

    } catch (TCLAP::ArgException& e) {
        spdlog::error("Argument error: {} for arg {}", e.error(), e.argId());
        return 1;
    } catch (const electionguard::TruncationError& e) {
        spdlog::error("{} (use --allow-truncation to cut the input)", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}

int block_unpad(int argc, char** argv) {
    try {
        TCLAP::CmdLine cmd("Recover the payload of a padded block", ' ', "1.0");

        TCLAP::ValueArg<std::string> inArg("", "in", "Input block file", true, "", "filename", cmd);
        TCLAP::ValueArg<std::string> outArg("", "out", "Output file", true, "", "filename", cmd);
        TCLAP::ValueArg<size_t> sizeArg("", "block-size", "Total block size in bytes", false, 512, "size", cmd);

        std::vector<std::string> allowed_levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
        TCLAP::ValuesConstraint<std::string> level_constraint(allowed_levels);
        TCLAP::ValueArg<std::string> loggingArg("", "logging", "Logging level", false, "info", &level_constraint, cmd);

        cmd.parse(argc, argv);

        // Set logging level
        spdlog::set_level(spdlog::level::from_str(loggingArg.getValue()));

        auto size = electionguard::blockSizeFromBytes(sizeArg.getValue());
        auto data = read_binary_file(inArg.getValue());

        auto payload = electionguard::removePadding(data, size);
        write_binary_file(outArg.getValue(), payload);

        spdlog::info("Wrote {}-byte payload to {}", payload.size(), outArg.getValue());
        return 0;

    } catch (TCLAP::ArgException& e) {
        spdlog::error("Argument error: {} for arg {}", e.error(), e.argId());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}

} // namespace electionguard_ctl
