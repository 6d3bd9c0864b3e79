#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "strata/Commands.hpp"
#include "strata/Logging.hpp"
#include "strata/Options.hpp"

using namespace strata;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("strata", "Merge override objects with a template, driven by a merge schema");
        options.positional_help("COMMAND");

        // Global options
        options.add_options()
            ("s,schema", "Schema descriptor (JSON/TOML)", cxxopts::value<std::string>())
            ("t,template", "Template object (JSON/TOML)", cxxopts::value<std::string>())
            ("o,override", "Override object or list of overrides (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("c,config", "Run configuration file (JSON/TOML, section [strata])", cxxopts::value<std::string>())
            ("select", "Print only this dot-path of each result", cxxopts::value<std::string>())
            ("indent", "JSON indentation, -1 for compact output", cxxopts::value<int>())
            ("keep-going", "Merge every override and report failures per item")
            ("log-level", "quiet, error, warning, info, debug or trace", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({""}) << "\n";
            std::cout << "Commands: merge | patch | schema\n";
            return 0;
        }

        // defaults -> config file -> flags
        RunOptions run;
        if (result.count("config")) load_run_config(run, result["config"].as<std::string>());
        if (result.count("schema")) run.schema_path = result["schema"].as<std::string>();
        if (result.count("template")) run.template_path = result["template"].as<std::string>();
        if (result.count("override")) {
            run.override_paths = result["override"].as<std::vector<std::string>>();
        }
        if (result.count("select")) run.select = result["select"].as<std::string>();
        if (result.count("indent")) run.indent = result["indent"].as<int>();
        if (result.count("keep-going")) run.keep_going = true;
        if (result.count("log-level")) run.log_level = result["log-level"].as<std::string>();

        if (run.indent < -1 || run.indent > 16) {
            std::cerr << "Error: --indent must be from -1 to 16\n";
            return 1;
        }
        set_log_level(run.log_level);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.size() != 1) {
            std::cerr << "Error: expected exactly one command\n";
            return 1;
        }
        const std::string& cmd = cmdv[0];

        CommandResult out;
        if (cmd == "merge") {
            out = run_merge_command(run);
        } else if (cmd == "patch") {
            out = run_patch_command(run);
        } else if (cmd == "schema") {
            out = run_schema_command(run);
        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            return 1;
        }

        std::cout << out.output.dump(run.indent) << "\n";
        return out.exit_code;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
