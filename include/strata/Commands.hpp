/**
 * @file Commands.hpp
 * @brief Subcommands of the strata command line tool
 *
 * - merge:  merge every override with the template
 * - patch:  show the patch computed for every override
 * - schema: print the resolved schema with defaults filled in
 *
 * The functions return the JSON document to print plus an exit code, so
 * they can be tested without running the binary.
 */

#ifndef STRATA_COMMANDS_HPP
#define STRATA_COMMANDS_HPP

#include "strata/Options.hpp"
#include "strata/Schema.hpp"
#include "strata/Value.hpp"

#include <memory>
#include <vector>

namespace strata {

/**
 * @brief Output and exit status of a command
 */
struct CommandResult {
    Value output;
    int exit_code = 0;
};

/**
 * @brief Resolve the schema named by the options (open schema if none)
 * @throws FileNotFoundError, DocumentParseError, SchemaResolutionError
 */
std::shared_ptr<const Schema> load_schema(const RunOptions& opts);

/**
 * @brief Load all override files, in order
 * @throws ConfigError if no override file is given
 */
std::vector<Value> load_all_overrides(const RunOptions& opts);

/**
 * @brief merge: merge each override with the template
 *
 * Fail-fast unless opts.keep_going: the first failure throws
 * BatchMergeError. With keep_going the output lists one
 * {"ok": true, "value": ...} or {"ok": false, "error": "..."} entry per
 * override and the exit code is 1 if any failed.
 *
 * @throws ConfigError if --template is missing
 */
CommandResult run_merge_command(const RunOptions& opts);

/**
 * @brief patch: compute the patch of each override against "{}"
 */
CommandResult run_patch_command(const RunOptions& opts);

/**
 * @brief schema: resolve and describe the schema
 */
CommandResult run_schema_command(const RunOptions& opts);

} // namespace strata

#endif // STRATA_COMMANDS_HPP
