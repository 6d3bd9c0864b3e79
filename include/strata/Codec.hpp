/**
 * @file Codec.hpp
 * @brief Conversion between domain objects and the interchange tree
 *
 * Domain types take part in merging through nlohmann::json's ADL hooks:
 * ```cpp
 * struct Port { std::string name; int container_port = 0; };
 * void to_json(strata::Value& j, const Port& p);
 * void from_json(const strata::Value& j, Port& p);
 * ```
 * An unset field must serialize exactly like the same field of a
 * default-constructed instance. Use std::optional for fields that need
 * to distinguish "explicitly empty" from "not set" (e.g. a list an
 * override wants to clear).
 */

#ifndef STRATA_CODEC_HPP
#define STRATA_CODEC_HPP

#include "strata/Errors.hpp"
#include "strata/Value.hpp"

#include <exception>
#include <string>

namespace strata {

/**
 * @brief Check that a serialized tree can be merged and round-tripped
 *
 * The root must be an object, and no member may hold a non-finite
 * number or binary data (neither survives the JSON interchange form).
 *
 * @param value Serialized tree
 * @param subject Role of the value for error messages ("template", ...)
 * @throws SerializationError naming the offending field
 */
void ensure_serializable(const Value& value, const std::string& subject);

/**
 * @brief Convert a domain object into the interchange tree
 * @throws SerializationError if the object's to_json fails
 */
template <typename T>
Value serialize(const T& object, const std::string& subject) {
    try {
        return Value(object);
    } catch (const std::exception& e) {
        throw SerializationError(subject, e.what());
    }
}

/**
 * @brief Convert a merged tree back into a domain object
 * @throws DeserializationError if the object's from_json fails
 */
template <typename T>
T deserialize(const Value& value) {
    try {
        return value.get<T>();
    } catch (const std::exception& e) {
        throw DeserializationError(e.what());
    }
}

} // namespace strata

#endif // STRATA_CODEC_HPP
