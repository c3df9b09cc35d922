/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "document_commands.hpp"
#include "common.hpp"
#include <electionguard/DocumentIO.hpp>
#include <electionguard/ElectionRecords.hpp>
#include <electionguard/Exception.hpp>
#include <tclap/CmdLine.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <functional>
#include <map>

namespace electionguard_ctl {

namespace {

/**
 * @brief Loads the input file as a T and, if out_dir is not empty,
 * writes it back to <out_dir>/<name>.json.
 */
template<typename T>
void check_document(const std::string& input,
                    const std::string& out_dir,
                    const std::string& name,
                    const electionguard::SerializationContext& ctx) {
    auto value = electionguard::fromFile<T>(input, ctx);
    spdlog::info("{} is valid", input);
    if (!out_dir.empty()) {
        auto path = electionguard::toFile(value, name, out_dir, ctx);
        spdlog::info("Wrote canonical document to {}", path);
    }
}

using CheckFunction = std::function<void(const std::string&,
                                         const std::string&,
                                         const std::string&,
                                         const electionguard::SerializationContext&)>;

const std::map<std::string, CheckFunction>& check_functions() {
    static const std::map<std::string, CheckFunction> functions = {
        {"constants", check_document<electionguard::ElectionConstants>},
        {"context",   check_document<electionguard::CiphertextElectionContext>},
        {"guardian",  check_document<electionguard::GuardianRecord>},
        {"guardians", check_document<std::vector<electionguard::GuardianRecord>>},
        {"proof",     check_document<electionguard::SchnorrProof>},
        {"ballot",    check_document<electionguard::SubmittedBallotInfo>},
        {"ballots",   check_document<std::vector<electionguard::SubmittedBallotInfo>>},
        {"manifest",  check_document<electionguard::ManifestInfo>}
    };
    return functions;
}

} // namespace

std::vector<std::string> document_types() {
    std::vector<std::string> types;
    for (const auto& [name, fn] : check_functions()) {
        types.push_back(name);
    }
    return types;
}

int document_check(int argc, char** argv) {
    try {
        TCLAP::CmdLine cmd("Check that a JSON document has the shape of a record type", ' ', "1.0");

        std::vector<std::string> allowed_types = document_types();
        TCLAP::ValuesConstraint<std::string> type_constraint(allowed_types);
        TCLAP::ValueArg<std::string> typeArg("", "type", "Record type", true, "", &type_constraint, cmd);
        TCLAP::ValueArg<std::string> inArg("", "in", "Input JSON file", true, "", "filename", cmd);
        TCLAP::ValueArg<std::string> outArg("", "out", "Directory in which to write the canonical document", false, "", "directory", cmd);
        TCLAP::ValueArg<std::string> nameArg("", "name", "Name of the canonical document (without extension)", false, "", "string", cmd);
        TCLAP::ValueArg<std::string> configArg("", "config", "Serialization config file", false, "", "filename", cmd);

        std::vector<std::string> allowed_levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
        TCLAP::ValuesConstraint<std::string> level_constraint(allowed_levels);
        TCLAP::ValueArg<std::string> loggingArg("", "logging", "Logging level", false, "info", &level_constraint, cmd);

        cmd.parse(argc, argv);

        // Set logging level
        spdlog::set_level(spdlog::level::from_str(loggingArg.getValue()));

        auto ctx = load_context(configArg.getValue());

        // Default output name is the input's file name without extension
        std::string name = nameArg.getValue();
        if (name.empty()) {
            name = std::filesystem::path(inArg.getValue()).stem().string();
        }

        spdlog::debug("Checking {} as {}", inArg.getValue(), typeArg.getValue());
        check_functions().at(typeArg.getValue())(
            inArg.getValue(), outArg.getValue(), name, ctx);
        return 0;

    } catch (TCLAP::ArgException& e) {
        spdlog::error("Argument error: {} for arg {}", e.error(), e.argId());
        return 1;
    } catch (const electionguard::ParseError& e) {
        spdlog::error("Invalid document: {}", e.what());
        return 2;
    } catch (const electionguard::UnsupportedTypeError& e) {
        spdlog::error("Unsupported type: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}

} // namespace electionguard_ctl
