/**
 * @file Patch.hpp
 * @brief Diff and schema-aware apply of merge patches
 *
 * A patch is an object tree describing what an override explicitly sets:
 * - a member with a non-null value sets (or, for objects, merges) it
 * - a member with null deletes the field
 * - an object carrying "$patch": "replace" replaces the current value
 *   wholesale; "$patch": "delete" deletes it; "$patch": "merge" is the
 *   default behavior spelled out
 *
 * Inside a merge-by-key list, an element {"$patch": "delete", <key>: k}
 * removes the element keyed k.
 */

#ifndef STRATA_PATCH_HPP
#define STRATA_PATCH_HPP

#include "strata/Schema.hpp"
#include "strata/Value.hpp"

namespace strata {

/// Member name of patch directives
inline constexpr const char* kPatchDirective = "$patch";

/**
 * @brief Compute the patch that turns @p original into @p modified
 *
 * Members whose serialized value differs are recorded; nested objects
 * that merge member-wise are diffed recursively, lists and scalars are
 * recorded whole. A member set in @p original but absent or null in
 * @p modified is recorded as null (deletion), and so is an explicit null
 * in @p modified unless @p original holds null there as well.
 *
 * @param original Serialized zero value
 * @param modified Serialized override
 * @param schema Merge table of the root type
 * @return Patch object (empty when nothing is set)
 * @throws PatchComputationError if @p modified contradicts the schema or
 *         its shape clashes with @p original
 *
 * Example:
 * ```cpp
 * Value empty = {{"image", ""}};
 * Value over = {{"image", "alpine"}, {"args", {"-v"}}};
 * compute_patch(empty, over, Schema{});
 * // {"image": "alpine", "args": ["-v"]}
 * ```
 */
Value compute_patch(const Value& original, const Value& modified, const Schema& schema);

/**
 * @brief Apply @p patch onto @p current following the schema
 *
 * - scalars and replace-strategy objects: patch value wins
 * - merge-strategy objects, maps and open objects: merged member-wise
 * - replace-strategy lists: patch list replaces the current list
 * - merge-strategy lists: merged by merge key (objects) or as an ordered
 *   set union (scalars)
 * - an empty patch list always clears the current list
 *
 * @param current Serialized template
 * @param patch Patch from compute_patch()
 * @param schema Merge table of the root type
 * @return New merged tree; the inputs are not modified
 * @throws PatchApplicationError for missing or duplicate merge keys,
 *         unknown directives and type conflicts
 */
Value apply_patch(const Value& current, const Value& patch, const Schema& schema);

} // namespace strata

#endif // STRATA_PATCH_HPP
