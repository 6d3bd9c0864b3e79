/**
 * @file Codec.cpp
 * @brief Validation of serialized trees
 */

#include "strata/Codec.hpp"
#include "strata/DotPath.hpp"

#include <cmath>

namespace strata {

namespace {

void check_representable(const Value& value, const std::string& subject, const std::string& path) {
    if (value.is_number_float() && !std::isfinite(value.get<double>())) {
        throw SerializationError(subject, "field '" + path + "' holds a non-finite number");
    }
    if (value.is_binary()) {
        throw SerializationError(subject, "field '" + path + "' holds binary data");
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            check_representable(it.value(), subject, child_path(path, it.key()));
        }
    } else if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            check_representable(value[i], subject, index_path(path, i));
        }
    }
}

} // anonymous namespace

void ensure_serializable(const Value& value, const std::string& subject) {
    if (!value.is_object()) {
        throw SerializationError(subject, "expected an object, got " + type_name(value));
    }
    check_representable(value, subject, "");
}

} // namespace strata
