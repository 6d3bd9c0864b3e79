/**
 * @file Commands.cpp
 * @brief Implementation of the CLI subcommands
 */

#include "strata/Commands.hpp"
#include "strata/DotPath.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Logging.hpp"
#include "strata/Merge.hpp"
#include "strata/Patch.hpp"

#include <iterator>

namespace strata {

namespace {

Value select(const Value& merged, const RunOptions& opts) {
    if (!opts.select) {
        return merged;
    }
    const Value* found = find_by_dot(merged, *opts.select);
    return found ? *found : Value(nullptr);
}

} // anonymous namespace

std::shared_ptr<const Schema> load_schema(const RunOptions& opts) {
    if (!opts.schema_path) {
        return Schema::open();
    }
    return Schema::resolve(load_document(*opts.schema_path));
}

std::vector<Value> load_all_overrides(const RunOptions& opts) {
    if (opts.override_paths.empty()) {
        throw ConfigError("at least one --override file is required");
    }
    std::vector<Value> overrides;
    for (const auto& path : opts.override_paths) {
        auto loaded = load_overrides(path);
        logger()->debug("loaded {} overrides from '{}'", loaded.size(), path);
        overrides.insert(overrides.end(), std::make_move_iterator(loaded.begin()),
                         std::make_move_iterator(loaded.end()));
    }
    return overrides;
}

CommandResult run_merge_command(const RunOptions& opts) {
    if (!opts.template_path) {
        throw ConfigError("--template is required for 'merge'");
    }

    const MergeMetadata md = build_merge_metadata(load_document(*opts.template_path),
                                                  Value::object(), load_schema(opts));
    const std::vector<Value> overrides = load_all_overrides(opts);

    CommandResult result;
    result.output = Value::array();

    if (!opts.keep_going) {
        for (auto& merged : merge_all_with_template(md, overrides)) {
            result.output.push_back(select(merged, opts));
        }
        return result;
    }

    for (auto& outcome : merge_each(md, overrides)) {
        if (outcome.ok()) {
            result.output.push_back(Value{{"ok", true}, {"value", select(*outcome.value, opts)}});
            continue;
        }
        try {
            std::rethrow_exception(outcome.error);
        } catch (const Error& e) {
            result.output.push_back(Value{{"ok", false}, {"error", e.what()}});
        }
        result.exit_code = 1;
    }
    return result;
}

CommandResult run_patch_command(const RunOptions& opts) {
    const auto schema = load_schema(opts);
    const Value empty = Value::object();

    CommandResult result;
    result.output = Value::array();
    for (const auto& item : load_all_overrides(opts)) {
        result.output.push_back(compute_patch(empty, item, *schema));
    }
    return result;
}

CommandResult run_schema_command(const RunOptions& opts) {
    CommandResult result;
    result.output = load_schema(opts)->describe();
    return result;
}

} // namespace strata
