/**
 * @file Patch.cpp
 * @brief Implementation of patch computation and schema-aware apply
 */

#include "strata/Patch.hpp"
#include "strata/DotPath.hpp"
#include "strata/Errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace strata {

namespace {

/**
 * @brief Field lookup for the members of one object
 *
 * Struct-like objects resolve members through their schema; every value
 * of a map shares one field description.
 */
struct Members {
    const Schema* schema = nullptr;
    const FieldSchema* uniform = nullptr;

    const FieldSchema* lookup(const std::string& key) const {
        if (uniform) return uniform;
        return schema ? schema->field(key) : nullptr;
    }
};

FieldSchema map_value_field(const FieldSchema& map) {
    FieldSchema value;
    value.name = map.name;
    value.kind = map.element_kind;
    value.element_kind = map.element_kind;
    value.element = map.element;
    value.strategy = MergeStrategy::Merge;
    return value;
}

/**
 * @brief Members of an object-valued field
 * @param field Field description, null for an open field
 * @param map_value Storage for the shared value field of a map
 */
Members members_of(const FieldSchema* field, FieldSchema& map_value) {
    if (!field) {
        return {};
    }
    if (field->kind == FieldKind::Map) {
        map_value = map_value_field(*field);
        return {nullptr, &map_value};
    }
    return {field->element.get(), nullptr};
}

// ============================================================================
// Shape validation
// ============================================================================

void validate_shape(const Value& value, const FieldSchema* field, const std::string& path);

void validate_members(const Value& object, const Members& members, const std::string& path) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.key() == kPatchDirective) continue;
        validate_shape(it.value(), members.lookup(it.key()), child_path(path, it.key()));
    }
}

void validate_shape(const Value& value, const FieldSchema* field, const std::string& path) {
    if (value.is_null() || !field) {
        return;
    }

    switch (field->kind) {
        case FieldKind::Scalar:
            if (is_container(value)) {
                throw PatchComputationError(path, "expected scalar, got " + type_name(value));
            }
            return;

        case FieldKind::Object:
        case FieldKind::Map: {
            if (!value.is_object()) {
                throw PatchComputationError(path, "expected object, got " + type_name(value));
            }
            FieldSchema map_value;
            validate_members(value, members_of(field, map_value), path);
            return;
        }

        case FieldKind::List: {
            if (!value.is_array()) {
                throw PatchComputationError(path, "expected array, got " + type_name(value));
            }
            const Members elements{field->element.get(), nullptr};
            for (std::size_t i = 0; i < value.size(); ++i) {
                const Value& element = value[i];
                if (field->element_kind == FieldKind::Object) {
                    if (!element.is_object()) {
                        throw PatchComputationError(index_path(path, i),
                                                    "expected object element, got " + type_name(element));
                    }
                    validate_members(element, elements, index_path(path, i));
                } else if (is_container(element)) {
                    throw PatchComputationError(index_path(path, i),
                                                "expected scalar element, got " + type_name(element));
                }
            }
            return;
        }
    }
}

// ============================================================================
// Diff
// ============================================================================

bool same_shape(const Value& a, const Value& b) {
    return a.is_object() == b.is_object() && a.is_array() == b.is_array();
}

Value diff_members(const Value& original, const Value& modified, const Members& members,
                   const std::string& path) {
    Value patch = Value::object();

    for (auto it = modified.begin(); it != modified.end(); ++it) {
        const std::string& key = it.key();
        const Value& mod = it.value();
        auto orig = original.find(key);
        const bool had = orig != original.end() && !orig->is_null();

        // Explicit null deletes, unless the zero value holds null as well
        if (mod.is_null()) {
            if (orig == original.end() || had) patch[key] = nullptr;
            continue;
        }
        if (!had) {
            patch[key] = mod;
            continue;
        }
        if (*orig == mod) {
            continue;
        }

        const std::string member_path = child_path(path, key);
        if (!same_shape(*orig, mod)) {
            throw PatchComputationError(member_path, "type mismatch: zero value holds " +
                                                         type_name(*orig) + ", override holds " +
                                                         type_name(mod));
        }

        const FieldSchema* field = members.lookup(key);
        if (mod.is_object() && !mod.contains(kPatchDirective) &&
            (!field || field->merges_members())) {
            FieldSchema map_value;
            Value sub = diff_members(*orig, mod, members_of(field, map_value), member_path);
            if (!sub.empty()) {
                patch[key] = std::move(sub);
            }
        } else {
            patch[key] = mod;
        }
    }

    // Set in the zero value, unset in the override
    for (auto it = original.begin(); it != original.end(); ++it) {
        if (!it->is_null() && !modified.contains(it.key())) {
            patch[it.key()] = nullptr;
        }
    }

    return patch;
}

// ============================================================================
// Apply
// ============================================================================

/**
 * @brief Directive of a patch object ("" when absent)
 */
std::string directive_of(const Value& patch, const std::string& path) {
    auto it = patch.find(kPatchDirective);
    if (it == patch.end()) {
        return "";
    }
    if (!it->is_string()) {
        throw PatchApplicationError(path, "'$patch' must be a string, got " + type_name(*it));
    }
    std::string directive = it->get<std::string>();
    if (directive != "replace" && directive != "delete" && directive != "merge") {
        throw PatchApplicationError(path, "unknown directive '$patch: " + directive + "'");
    }
    return directive;
}

Value apply_value(const Value* current, const Value& patch, const FieldSchema* field,
                  const std::string& path);

Value apply_members(const Value& current, const Value& patch, const Members& members,
                    const std::string& path) {
    const std::string directive = directive_of(patch, path);
    if (directive == "delete") {
        throw PatchApplicationError(path, "'$patch: delete' is only allowed on fields and list elements");
    }

    Value result = (directive == "replace" || !current.is_object()) ? Value::object() : current;

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const std::string& key = it.key();
        if (key == kPatchDirective) continue;

        const Value& value = it.value();
        const std::string member_path = child_path(path, key);
        if (value.is_null() ||
            (value.is_object() && directive_of(value, member_path) == "delete")) {
            result.erase(key);
            continue;
        }

        auto cur = result.find(key);
        const Value* existing = (cur == result.end() || cur->is_null()) ? nullptr : &*cur;
        Value merged = apply_value(existing, value, members.lookup(key), member_path);
        result[key] = std::move(merged);
    }

    return result;
}

const Value& merge_key_of(const Value& element, const std::string& key, const std::string& path) {
    if (!element.is_object()) {
        throw PatchApplicationError(path, "list element must be an object, got " + type_name(element));
    }
    auto it = element.find(key);
    if (it == element.end() || it->is_null()) {
        throw PatchApplicationError(path, "list element is missing merge key '" + key + "'");
    }
    if (is_container(*it)) {
        throw PatchApplicationError(path, "merge key '" + key + "' must be a scalar, got " +
                                              type_name(*it));
    }
    return *it;
}

Value merge_keyed_list(const Value& current, const Value& patch, const FieldSchema& field,
                       const std::string& path) {
    const std::string& key = *field.merge_key;
    const Members members{field.element.get(), nullptr};

    std::map<std::string, std::size_t> positions;
    std::vector<Value> elements;
    elements.reserve(current.size());
    for (std::size_t i = 0; i < current.size(); ++i) {
        const Value& k = merge_key_of(current[i], key, index_path(path, i));
        if (!positions.emplace(k.dump(), i).second) {
            throw PatchApplicationError(keyed_path(path, key, k), "duplicate merge key in template list");
        }
        elements.push_back(current[i]);
    }

    std::vector<bool> deleted(elements.size(), false);
    std::vector<bool> touched(elements.size(), false);
    std::vector<Value> appended;
    // Positions in patch order; values >= elements.size() address appended
    std::vector<std::size_t> patch_order;
    std::set<std::string> seen;

    for (std::size_t j = 0; j < patch.size(); ++j) {
        const Value& element = patch[j];
        const Value& k = merge_key_of(element, key, index_path(path, j));
        const std::string element_path = keyed_path(path, key, k);
        if (!seen.insert(k.dump()).second) {
            throw PatchApplicationError(element_path, "duplicate merge key in override list");
        }
        const bool remove = directive_of(element, element_path) == "delete";

        auto pos = positions.find(k.dump());
        if (pos != positions.end()) {
            const std::size_t i = pos->second;
            touched[i] = true;
            if (remove) {
                deleted[i] = true;
            } else {
                elements[i] = apply_members(elements[i], element, members, element_path);
            }
            patch_order.push_back(i);
        } else if (!remove) {
            appended.push_back(apply_members(Value::object(), element, members, element_path));
            patch_order.push_back(elements.size() + appended.size() - 1);
        }
    }

    Value result = Value::array();
    auto emit = [&](std::size_t idx) {
        if (idx >= elements.size()) {
            result.push_back(appended[idx - elements.size()]);
        } else if (!deleted[idx]) {
            result.push_back(elements[idx]);
        }
    };

    if (field.order == ListOrder::TemplateFirst) {
        for (std::size_t i = 0; i < elements.size(); ++i) emit(i);
        for (const auto& element : appended) result.push_back(element);
    } else {
        for (std::size_t idx : patch_order) emit(idx);
        for (std::size_t i = 0; i < elements.size(); ++i) {
            if (!touched[i]) emit(i);
        }
    }

    return result;
}

Value union_list(const Value& current, const Value& patch, const std::string& path) {
    Value result = current;
    for (std::size_t j = 0; j < patch.size(); ++j) {
        const Value& item = patch[j];
        if (is_container(item)) {
            throw PatchApplicationError(index_path(path, j),
                                        "expected scalar element, got " + type_name(item));
        }
        if (std::find(result.begin(), result.end(), item) == result.end()) {
            result.push_back(item);
        }
    }
    return result;
}

Value apply_value(const Value* current, const Value& patch, const FieldSchema* field,
                  const std::string& path) {
    // Open field: objects merge, everything else replaces
    if (!field) {
        if (patch.is_object()) {
            return apply_members(current && current->is_object() ? *current : Value::object(),
                                 patch, Members{}, path);
        }
        return patch;
    }

    switch (field->kind) {
        case FieldKind::Scalar:
            if (is_container(patch)) {
                throw PatchApplicationError(path, "expected scalar, got " + type_name(patch));
            }
            return patch;

        case FieldKind::Object:
        case FieldKind::Map: {
            if (!patch.is_object()) {
                throw PatchApplicationError(path, "expected object, got " + type_name(patch));
            }
            if (current && !current->is_object()) {
                throw PatchApplicationError(path, "template holds " + type_name(*current) +
                                                      " where an object is expected");
            }
            FieldSchema map_value;
            const Members members = members_of(field, map_value);
            if (!current || field->strategy == MergeStrategy::Replace) {
                return apply_members(Value::object(), patch, members, path);
            }
            return apply_members(*current, patch, members, path);
        }

        case FieldKind::List: {
            if (!patch.is_array()) {
                throw PatchApplicationError(path, "expected array, got " + type_name(patch));
            }
            if (current && !current->is_array()) {
                throw PatchApplicationError(path, "template holds " + type_name(*current) +
                                                      " where an array is expected");
            }
            // An explicitly empty list clears the inherited one
            if (patch.empty() || field->strategy == MergeStrategy::Replace) {
                return patch;
            }
            const Value base = current ? *current : Value::array();
            if (field->is_keyed_list()) {
                return merge_keyed_list(base, patch, *field, path);
            }
            return union_list(base, patch, path);
        }
    }

    return patch;
}

} // anonymous namespace

Value compute_patch(const Value& original, const Value& modified, const Schema& schema) {
    if (!original.is_object()) {
        throw PatchComputationError("", "zero value must be an object, got " + type_name(original));
    }
    if (!modified.is_object()) {
        throw PatchComputationError("", "override must be an object, got " + type_name(modified));
    }

    const Members root{&schema, nullptr};
    validate_members(modified, root, "");
    return diff_members(original, modified, root, "");
}

Value apply_patch(const Value& current, const Value& patch, const Schema& schema) {
    if (!current.is_object()) {
        throw PatchApplicationError("", "template must be an object, got " + type_name(current));
    }
    if (!patch.is_object()) {
        throw PatchApplicationError("", "patch must be an object, got " + type_name(patch));
    }
    return apply_members(current, patch, Members{&schema, nullptr}, "");
}

} // namespace strata
