/**
 * @file Metadata.hpp
 * @brief Reusable merge metadata of one template
 *
 * Merging N overrides against one template serializes the template and
 * the zero value and resolves the schema once, here, instead of once per
 * override. A MergeMetadata never changes after construction, so any
 * number of threads may merge against the same instance concurrently.
 */

#ifndef STRATA_METADATA_HPP
#define STRATA_METADATA_HPP

#include "strata/Codec.hpp"
#include "strata/Schema.hpp"
#include "strata/Value.hpp"

#include <memory>

namespace strata {

/**
 * @brief Serialized template, serialized zero value and resolved schema
 */
class MergeMetadata {
public:
    /**
     * @brief Construct from already serialized values
     * @throws SerializationError if either value is not a mergeable object
     * @throws SchemaResolutionError if @p schema is null
     */
    MergeMetadata(Value template_value, Value empty_value, std::shared_ptr<const Schema> schema);

    /// Serialized template ("current" side of the three-way merge)
    const Value& template_value() const noexcept { return template_; }

    /// Serialized zero value ("original" side of the three-way merge)
    const Value& empty_value() const noexcept { return empty_; }

    const Schema& schema() const noexcept { return *schema_; }

    const std::shared_ptr<const Schema>& schema_ptr() const noexcept { return schema_; }

private:
    Value template_;
    Value empty_;
    std::shared_ptr<const Schema> schema_;
};

/**
 * @brief Build merge metadata from serialized values
 *
 * @param template_value Serialized template
 * @param zero_value Serialized instance with nothing set
 * @param schema Resolved schema of the type
 * @throws SerializationError, SchemaResolutionError
 */
MergeMetadata build_merge_metadata(const Value& template_value, const Value& zero_value,
                                   std::shared_ptr<const Schema> schema);

/**
 * @brief Build merge metadata, resolving a schema descriptor first
 * @throws SerializationError, SchemaResolutionError
 */
MergeMetadata build_merge_metadata(const Value& template_value, const Value& zero_value,
                                   const Value& schema_descriptor);

/**
 * @brief Build merge metadata with an empty object as zero value
 * @throws SerializationError, SchemaResolutionError
 */
MergeMetadata build_merge_metadata(const Value& template_value, std::shared_ptr<const Schema> schema);

/**
 * @brief Build merge metadata from domain objects
 *
 * The zero value must truly represent "nothing set": a type whose
 * default-constructed fields carry non-empty defaults yields wrong
 * merges. This is not validated.
 */
template <typename T>
MergeMetadata build_merge_metadata(const T& template_object, const T& zero_object,
                                   std::shared_ptr<const Schema> schema) {
    return build_merge_metadata(serialize(template_object, "template"),
                                serialize(zero_object, "zero value"), std::move(schema));
}

/**
 * @brief Build merge metadata using a default-constructed T as zero value
 */
template <typename T>
MergeMetadata build_merge_metadata(const T& template_object, std::shared_ptr<const Schema> schema) {
    return build_merge_metadata(template_object, T{}, std::move(schema));
}

} // namespace strata

#endif // STRATA_METADATA_HPP
