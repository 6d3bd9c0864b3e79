/**
 * @file Value.hpp
 * @brief Interchange tree used by the merge engine
 *
 * Uses nlohmann::json as the underlying value model. Templates,
 * overrides, patches and schema descriptors are all expressed as Values:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

/**
 * @brief JSON-like value type for serialized objects
 *
 * Any type with nlohmann::json `to_json`/`from_json` overloads can be
 * converted to and from a Value, which is what the typed merge layer
 * relies on.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return "null", "boolean", "integer", "float", "string", "array",
 *         "object" or "binary"
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace strata

#endif // STRATA_VALUE_HPP
