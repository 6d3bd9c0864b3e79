/**
 * @file Options.hpp
 * @brief Run configuration of the strata command line tool
 *
 * Precedence (lowest to highest):
 * 1. Built-in defaults (RunOptions{})
 * 2. Config file given by --config, section [strata]
 * 3. Command line flags
 *
 * Config file example (TOML):
 * ```toml
 * [strata]
 * log_level = "debug"
 * indent = 4
 * keep_going = true
 * schema = "container.schema.json"
 * ```
 */

#ifndef STRATA_OPTIONS_HPP
#define STRATA_OPTIONS_HPP

#include "strata/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Everything a CLI command needs to run
 */
struct RunOptions {
    std::string log_level = "warning";
    int indent = 2; ///< -1 prints compact JSON, at most 16
    bool keep_going = false;
    std::optional<std::string> schema_path;
    std::optional<std::string> template_path;
    std::vector<std::string> override_paths;
    std::optional<std::string> select; ///< Dot-path printed instead of whole results
};

/**
 * @brief Apply the [strata] section of a config document
 *
 * Unknown keys are ignored. A relative "schema" path is resolved against
 * @p base_dir.
 *
 * @param opts Options to update
 * @param config Parsed config document
 * @param base_dir Directory of the config file ("" for none)
 * @throws ConfigError if a known key holds a value of the wrong type
 */
void apply_run_config(RunOptions& opts, const Value& config, const std::string& base_dir = "");

/**
 * @brief Load a JSON/TOML config file on top of @p opts
 * @throws FileNotFoundError, DocumentParseError, ConfigError
 */
void load_run_config(RunOptions& opts, const std::string& path);

} // namespace strata

#endif // STRATA_OPTIONS_HPP
