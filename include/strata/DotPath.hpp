/**
 * @file DotPath.hpp
 * @brief Field paths for diagnostics and value selection
 *
 * Errors raised by the merge engine name the offending field with a
 * dot-separated path. List elements are addressed by position
 * ("args[2]") or, inside merge-by-key lists, by their key
 * ("env[name=\"HOME\"].value").
 *
 * The CLI uses find_by_dot() to print a single field of each merged
 * result, e.g. "resources.limits.cpu" or "env.0.name".
 */

#ifndef STRATA_DOTPATH_HPP
#define STRATA_DOTPATH_HPP

#include "strata/Value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped.
 *
 * Examples:
 * - "resources.limits" → ["resources", "limits"]
 * - "env.0.name" → ["env", "0", "name"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Path of an object member below @p parent
 *
 * child_path("", "env") → "env", child_path("resources", "limits") →
 * "resources.limits"
 */
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Path of a list element addressed by position
 *
 * index_path("args", 2) → "args[2]"
 */
std::string index_path(const std::string& parent, std::size_t index);

/**
 * @brief Path of a list element addressed by its merge key
 *
 * keyed_path("env", "name", "HOME") → "env[name=\"HOME\"]"
 */
std::string keyed_path(const std::string& parent, const std::string& key_field,
                       const Value& key_value);

/**
 * @brief Look up a value by dot-path
 *
 * Object members are addressed by name, array elements by decimal index.
 *
 * @param data Root value
 * @param path Dot-separated path ("" addresses the root)
 * @return Pointer into @p data, or nullptr if the path does not resolve
 */
const Value* find_by_dot(const Value& data, const std::string& path);

} // namespace strata

#endif // STRATA_DOTPATH_HPP
