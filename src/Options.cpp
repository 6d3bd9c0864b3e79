/**
 * @file Options.cpp
 * @brief Loading of the CLI run configuration
 */

#include "strata/Options.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Logging.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace strata {

void apply_run_config(RunOptions& opts, const Value& config, const std::string& base_dir) {
    if (!config.is_object()) {
        throw ConfigError("config document must be an object, got " + type_name(config));
    }
    auto section = config.find("strata");
    if (section == config.end()) {
        return;
    }
    if (!section->is_object()) {
        throw ConfigError("'strata' must be a table, got " + type_name(*section));
    }

    if (auto it = section->find("log_level"); it != section->end()) {
        if (!it->is_string()) {
            throw ConfigError("'strata.log_level' must be a string, got " + type_name(*it));
        }
        // Fail on unknown names here rather than at first use
        parse_log_level(it->get<std::string>());
        opts.log_level = it->get<std::string>();
    }

    if (auto it = section->find("indent"); it != section->end()) {
        if (!it->is_number_integer() ||
            (it->is_number_unsigned() && it->get<unsigned long long>() > 16) ||
            (!it->is_number_unsigned() && (it->get<long long>() < -1 || it->get<long long>() > 16))) {
            throw ConfigError("'strata.indent' must be an integer from -1 to 16");
        }
        opts.indent = it->get<int>();
    }

    if (auto it = section->find("keep_going"); it != section->end()) {
        if (!it->is_boolean()) {
            throw ConfigError("'strata.keep_going' must be a boolean, got " + type_name(*it));
        }
        opts.keep_going = it->get<bool>();
    }

    if (auto it = section->find("schema"); it != section->end()) {
        if (!it->is_string()) {
            throw ConfigError("'strata.schema' must be a string, got " + type_name(*it));
        }
        fs::path schema = it->get<std::string>();
        if (schema.is_relative() && !base_dir.empty()) {
            schema = fs::path(base_dir) / schema;
        }
        opts.schema_path = schema.string();
    }
}

void load_run_config(RunOptions& opts, const std::string& path) {
    const Value config = load_document(path);
    apply_run_config(opts, config, fs::path(path).parent_path().string());
}

} // namespace strata
