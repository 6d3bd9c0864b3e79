/**
 * @file Metadata.cpp
 * @brief Construction of merge metadata
 */

#include "strata/Metadata.hpp"
#include "strata/Errors.hpp"
#include "strata/Logging.hpp"

namespace strata {

MergeMetadata::MergeMetadata(Value template_value, Value empty_value,
                             std::shared_ptr<const Schema> schema)
    : template_(std::move(template_value))
    , empty_(std::move(empty_value))
    , schema_(std::move(schema))
{
    if (!schema_) {
        throw SchemaResolutionError("", "no schema given");
    }
    ensure_serializable(template_, "template");
    ensure_serializable(empty_, "zero value");
}

MergeMetadata build_merge_metadata(const Value& template_value, const Value& zero_value,
                                   std::shared_ptr<const Schema> schema) {
    MergeMetadata md(template_value, zero_value, std::move(schema));
    logger()->debug("built merge metadata: {} template fields, {} schema fields",
                    md.template_value().size(), md.schema().fields().size());
    return md;
}

MergeMetadata build_merge_metadata(const Value& template_value, const Value& zero_value,
                                   const Value& schema_descriptor) {
    return build_merge_metadata(template_value, zero_value, Schema::resolve(schema_descriptor));
}

MergeMetadata build_merge_metadata(const Value& template_value, std::shared_ptr<const Schema> schema) {
    return build_merge_metadata(template_value, Value::object(), std::move(schema));
}

} // namespace strata
