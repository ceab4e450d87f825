/**
 * @file Cli.cpp
 * @brief Command line driver over a state file
 */

#include "fieldmerge/Cli.hpp"
#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fieldmerge/Config.hpp"
#include "fieldmerge/Loader.hpp"
#include "fieldmerge/State.hpp"
#include "fieldmerge/Updater.hpp"
#include "fieldmerge/Util.hpp"

using nlohmann::json;

namespace fieldmerge {

namespace {

std::string render(const Config& cfg, const json& doc) {
    if (cfg.get<std::string>("output.format", "json") == "toml") {
        return Config::render_toml(doc);
    }
    return doc.dump(cfg.get<int>("output.indent", 2));
}

void report_paths(std::ostream& err, const char* label, const FieldSet& paths) {
    for (const auto& p : paths) {
        err << label << ": " << p << "\n";
    }
}

} // namespace

int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("fieldmerge", "Merge structured objects while tracking field ownership per manager");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("s,schema", "Path to JSON/TOML schema document", cxxopts::value<std::string>())
            ("t,type", "Schema type of the object", cxxopts::value<std::string>())
            ("state", "Path to JSON state file (object + managedFields)", cxxopts::value<std::string>())
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("overrides", "Comma-separated dot.key:value settings", cxxopts::value<std::string>()->default_value(""))
            ("f,force", "apply: take conflicting fields instead of failing")
            ("v,verbose", "Report changed and pruned paths on stderr")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n";
            out << "Commands: apply MANAGER VERSION FILE [--force] | force-apply MANAGER VERSION FILE"
                         " | update MANAGER VERSION FILE | show | owners PATH\n";
            return 0;
        }

        LoadOptions load;
        load.prefix = "FIELDMERGE";
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        Config cfg = Config::load(load);

        const bool verbose = result.count("verbose") > 0;

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() != want) {
                err << "Error: command '" << cmd << "' takes " << (want - 1) << " argument(s)\n";
                return false;
            }
            return true;
        };

        for (const char* required : {"schema", "type", "state"}) {
            if (!result.count(required)) {
                err << "Error: --" << required << " must be provided\n";
                return 1;
            }
        }
        const std::string state_path = result["state"].as<std::string>();
        const std::string type = result["type"].as<std::string>();
        auto schema = load_schema_file(result["schema"].as<std::string>());

        State state = load_state(state_path, schema, type);

        // APPLY / FORCE-APPLY / UPDATE
        if (cmd == "apply" || cmd == "force-apply" || cmd == "update") {
            if (!expect_args(4)) return 1;
            const std::string& manager = cmdv[1];
            const std::string& version = cmdv[2];

            Operation op = Operation::Update;
            if (cmd == "apply") op = result.count("force") ? Operation::ForceApply : Operation::Apply;
            if (cmd == "force-apply") op = Operation::ForceApply;

            TypedValue incoming(schema, type, load_config_file(cmdv[3]));
            Updater updater(UpdaterOptions::from_config(cfg));

            MergeResult merged = updater.run(op, state.object, state.managed, incoming, manager, version);
            if (verbose) {
                err << to_string(op) << " by \"" << manager << "\" (" << version << ")\n";
                report_paths(err, "changed", merged.changed);
                report_paths(err, "pruned", merged.pruned);
            }

            state = State{std::move(merged.object), std::move(merged.managed)};
            save_state(state_path, state, cfg.get<int>("output.indent", 2));
            out << render(cfg, state.object.value()) << "\n";
            return 0;
        }

        // SHOW
        if (cmd == "show") {
            if (!expect_args(1)) return 1;
            out << render(cfg, state_to_json(state)) << "\n";
            return 0;
        }

        // OWNERS
        if (cmd == "owners") {
            if (!expect_args(2)) return 1;
            const auto owners = state.managed.owners(FieldPath::parse(cmdv[1]));
            for (const auto& name : owners) {
                out << name << "\n";
            }
            return owners.empty() ? 1 : 0;
        }

        err << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ConflictError& ce) {
        err << ce.what() << "\n";
        return kExitConflict;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace fieldmerge
