/**
 * @file Merge.hpp
 * @brief Three-way merge of overrides with a template
 *
 * Each override is merged as "original = zero value, modified = override,
 * current = template": the patch from the zero value to the override
 * captures exactly what the override sets, and applying it onto the
 * template leaves every unset field inherited.
 *
 * Example:
 * ```cpp
 * auto schema = Schema::resolve(R"({"fields": {"env": {
 *     "kind": "list", "strategy": "merge", "mergeKey": "name"}}})"_json);
 * Value tmpl = {{"image", "alpine"},
 *               {"env", {{{"name", "A"}, {"value", "1"}}}}};
 * auto md = build_merge_metadata(tmpl, Value::object(), schema);
 *
 * Value step = {{"env", {{{"name", "B"}, {"value", "2"}}}}};
 * auto merged = merge_with_template(md, step);
 * // {"image": "alpine", "env": [{"name": "A", ...}, {"name": "B", ...}]}
 * ```
 */

#ifndef STRATA_MERGE_HPP
#define STRATA_MERGE_HPP

#include "strata/Codec.hpp"
#include "strata/Errors.hpp"
#include "strata/Logging.hpp"
#include "strata/Metadata.hpp"
#include "strata/Value.hpp"

#include <exception>
#include <optional>
#include <vector>

namespace strata {

/**
 * @brief Merge one serialized override with the template
 *
 * List fields the override provides as an array come out as an array
 * (possibly empty) even when the merge dropped them, so an override's
 * explicit empty list is never turned into "absent".
 *
 * @param md Metadata of the template
 * @param override_value Serialized override
 * @return Merged tree; @p md and @p override_value are untouched
 * @throws SerializationError, PatchComputationError, PatchApplicationError
 */
Value merge_with_template(const MergeMetadata& md, const Value& override_value);

/**
 * @brief Merge one domain object with the template
 * @throws SerializationError, PatchComputationError, PatchApplicationError,
 *         DeserializationError
 */
template <typename T>
T merge_with_template(const MergeMetadata& md, const T& override_object) {
    return deserialize<T>(merge_with_template(md, serialize(override_object, "override")));
}

/**
 * @brief Merge every override with the template, fail-fast
 *
 * Results keep the input order. The first failing override aborts the
 * batch and no partial results are returned.
 *
 * @throws BatchMergeError with the failing index; the original error is
 *         nested (std::rethrow_if_nested)
 */
template <typename T>
std::vector<T> merge_all_with_template(const MergeMetadata& md, const std::vector<T>& overrides) {
    logger()->debug("merging {} overrides with template", overrides.size());
    std::vector<T> merged;
    merged.reserve(overrides.size());
    for (std::size_t i = 0; i < overrides.size(); ++i) {
        try {
            merged.push_back(merge_with_template(md, overrides[i]));
        } catch (const Error& e) {
            logger()->debug("override #{} failed: {}", i, e.what());
            std::throw_with_nested(BatchMergeError(i, e.what()));
        }
    }
    return merged;
}

/**
 * @brief Merge overrides with an optional template
 *
 * Without a template the overrides are returned unchanged. Otherwise the
 * metadata is built once, with a default-constructed T (an empty object
 * for Value) as zero value.
 *
 * @throws SerializationError, SchemaResolutionError from building the
 *         metadata; BatchMergeError from merging
 */
template <typename T>
std::vector<T> merge_all_with_template(const std::optional<T>& template_object,
                                       std::vector<T> overrides,
                                       std::shared_ptr<const Schema> schema) {
    if (!template_object) {
        return overrides;
    }
    const MergeMetadata md = build_merge_metadata(*template_object, std::move(schema));
    return merge_all_with_template(md, overrides);
}

/**
 * @brief Result of one override in merge_each()
 */
template <typename T>
struct MergeOutcome {
    std::optional<T> value;
    std::exception_ptr error;

    bool ok() const noexcept {
        return error == nullptr;
    }
};

/**
 * @brief Merge every override independently
 *
 * A failing override records its exception and never affects its
 * siblings.
 */
template <typename T>
std::vector<MergeOutcome<T>> merge_each(const MergeMetadata& md, const std::vector<T>& overrides) {
    std::vector<MergeOutcome<T>> outcomes(overrides.size());
    std::size_t failed = 0;
    for (std::size_t i = 0; i < overrides.size(); ++i) {
        try {
            outcomes[i].value = merge_with_template(md, overrides[i]);
        } catch (const Error& e) {
            logger()->debug("override #{} failed: {}", i, e.what());
            outcomes[i].error = std::current_exception();
            ++failed;
        }
    }
    logger()->debug("merged {} overrides, {} failed", overrides.size(), failed);
    return outcomes;
}

} // namespace strata

#endif // STRATA_MERGE_HPP
