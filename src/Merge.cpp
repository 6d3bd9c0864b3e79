/**
 * @file Merge.cpp
 * @brief Implementation of the three-way merge
 */

#include "strata/Merge.hpp"
#include "strata/Patch.hpp"

namespace strata {

namespace {

/**
 * @brief Turn list fields the override provided but the merge dropped
 *        into empty lists
 *
 * Descends into object fields; list elements and map values are left
 * alone.
 */
void restore_explicit_lists(Value& merged, const Value& override_value, const Schema& schema) {
    for (const auto& [name, field] : schema.fields()) {
        auto provided = override_value.find(name);
        if (provided == override_value.end()) continue;

        auto result = merged.find(name);
        if (field.kind == FieldKind::List && provided->is_array()) {
            if (result == merged.end() || result->is_null()) {
                merged[name] = Value::array();
            }
        } else if (field.kind == FieldKind::Object && provided->is_object() &&
                   result != merged.end() && result->is_object()) {
            restore_explicit_lists(*result, *provided, *field.element);
        }
    }
}

} // anonymous namespace

Value merge_with_template(const MergeMetadata& md, const Value& override_value) {
    ensure_serializable(override_value, "override");

    const Value patch = compute_patch(md.empty_value(), override_value, md.schema());
    if (logger()->should_log(spdlog::level::trace)) {
        logger()->trace("patch: {}", patch.dump());
    }

    Value merged = apply_patch(md.template_value(), patch, md.schema());
    restore_explicit_lists(merged, override_value, md.schema());
    return merged;
}

} // namespace strata
