/**
 * @file Schema.hpp
 * @brief Resolved per-field merge annotations
 *
 * A Schema is the lookup table the merge engine consults for every field
 * it visits: what kind of value the field holds and, for composite
 * fields, how template and override values are combined. It is resolved
 * once from a declarative descriptor and then shared read-only.
 *
 * Descriptor format (JSON or TOML):
 * ```json
 * {
 *   "fields": {
 *     "image": { "kind": "scalar" },
 *     "args":  { "kind": "list" },
 *     "env":   { "kind": "list", "strategy": "merge", "mergeKey": "name",
 *                "schema": { "fields": { "value": { "kind": "scalar" } } } },
 *     "labels": { "kind": "map" },
 *     "resources": { "kind": "object", "schema": { "fields": { ... } } }
 *   }
 * }
 * ```
 *
 * Field attributes:
 * - kind: "scalar" | "object" | "list" | "map" (required)
 * - strategy: "replace" | "merge" (lists default to replace, objects and
 *   maps to merge)
 * - mergeKey: element field identifying the same logical element
 *   (merge lists of objects only, required there)
 * - elements: "scalar" | "object" (lists and maps; defaults to "object"
 *   when schema or mergeKey is given)
 * - schema: nested descriptor for objects and object elements
 * - order: "template" | "override" (merge lists only)
 *
 * Fields not named by a schema are open: objects merge recursively and
 * everything else is replaced.
 */

#ifndef STRATA_SCHEMA_HPP
#define STRATA_SCHEMA_HPP

#include "strata/Value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace strata {

/**
 * @brief Shape of a field value
 */
enum class FieldKind {
    Scalar,
    Object,
    List,
    Map
};

/**
 * @brief How a composite field combines template and override values
 */
enum class MergeStrategy {
    Replace, ///< Override value wins wholesale
    Merge    ///< Combine element-wise (by key for lists, by member for objects)
};

/**
 * @brief Order of the elements of a merged merge-by-key list
 */
enum class ListOrder {
    TemplateFirst, ///< Template elements in place, then override-only elements
    OverrideFirst  ///< Override elements, then template-only elements
};

const char* to_string(FieldKind kind) noexcept;
const char* to_string(MergeStrategy strategy) noexcept;
const char* to_string(ListOrder order) noexcept;

class Schema;

/**
 * @brief Merge annotations of a single field
 */
struct FieldSchema {
    std::string name;
    FieldKind kind = FieldKind::Scalar;

    /// Kind of list elements or map values (Scalar or Object)
    FieldKind element_kind = FieldKind::Scalar;

    /// Schema of the object, or of object elements; null for scalar elements
    std::shared_ptr<const Schema> element;

    MergeStrategy strategy = MergeStrategy::Replace;
    std::optional<std::string> merge_key;
    ListOrder order = ListOrder::TemplateFirst;

    /// List whose object elements are merged by merge_key
    bool is_keyed_list() const noexcept {
        return kind == FieldKind::List && strategy == MergeStrategy::Merge && merge_key.has_value();
    }

    /// List of scalars merged as an ordered set union
    bool is_union_list() const noexcept {
        return kind == FieldKind::List && strategy == MergeStrategy::Merge &&
               element_kind == FieldKind::Scalar;
    }

    /// Object or map whose members are merged recursively
    bool merges_members() const noexcept {
        return (kind == FieldKind::Object || kind == FieldKind::Map) &&
               strategy == MergeStrategy::Merge;
    }
};

/**
 * @brief Immutable field table of one object type
 */
class Schema {
public:
    /// Open schema: no field carries annotations
    Schema() = default;

    /**
     * @brief Resolve a declarative descriptor
     *
     * @param descriptor Object with an optional "fields" member
     * @return Shared read-only schema
     * @throws SchemaResolutionError if the descriptor is malformed or
     *         carries conflicting annotations
     */
    static std::shared_ptr<const Schema> resolve(const Value& descriptor);

    /**
     * @brief Shared open schema
     */
    static std::shared_ptr<const Schema> open();

    /**
     * @brief Look up a field
     * @return The field's annotations, or nullptr for an open field
     */
    const FieldSchema* field(const std::string& name) const;

    const std::map<std::string, FieldSchema>& fields() const noexcept {
        return fields_;
    }

    bool empty() const noexcept {
        return fields_.empty();
    }

    /**
     * @brief Render the resolved table back into descriptor form
     *
     * Defaults are written out explicitly, so describe() of a resolved
     * schema resolves to an identical schema.
     */
    Value describe() const;

private:
    std::map<std::string, FieldSchema> fields_;

    static std::shared_ptr<const Schema> resolve_at(const Value& descriptor,
                                                    const std::string& path);
    static FieldSchema resolve_field(const std::string& name, const Value& descriptor,
                                     const std::string& path);
};

} // namespace strata

#endif // STRATA_SCHEMA_HPP
