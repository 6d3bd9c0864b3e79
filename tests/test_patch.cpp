/**
 * @file test_patch.cpp
 * @brief Tests for patch computation and schema-aware apply (GoogleTest)
 */

#include <gtest/gtest.h>
#include "strata/Patch.hpp"
#include "strata/Errors.hpp"

using namespace strata;

namespace {

std::shared_ptr<const Schema> keyed_schema(const std::string& order = "template") {
    return Schema::resolve({{"fields", {
        {"items", {{"kind", "list"}, {"strategy", "merge"}, {"mergeKey", "key"},
                   {"order", order}}},
        {"tags", {{"kind", "list"}, {"strategy", "merge"}}},
        {"args", {{"kind", "list"}}},
        {"name", {{"kind", "scalar"}}}
    }}});
}

} // namespace

// ============================================================================
// compute_patch
// ============================================================================

TEST(ComputePatch, NothingSetYieldsEmptyPatch) {
    Value empty = {{"image", ""}, {"args", Value::array()}};
    auto patch = compute_patch(empty, empty, Schema{});
    EXPECT_TRUE(patch.is_object());
    EXPECT_TRUE(patch.empty());
}

TEST(ComputePatch, RecordsSetFields) {
    Value empty = {{"image", ""}};
    Value over = {{"image", "alpine"}, {"args", {"-v"}}};
    auto patch = compute_patch(empty, over, Schema{});
    EXPECT_EQ(patch, Value({{"image", "alpine"}, {"args", {"-v"}}}));
}

TEST(ComputePatch, NestedObjectsDiffedRecursively) {
    Value empty = {{"resources", {{"limits", Value::object()}, {"requests", Value::object()}}}};
    Value over = {{"resources", {{"limits", {{"cpu", "1"}}}, {"requests", Value::object()}}}};
    auto patch = compute_patch(empty, over, Schema{});
    EXPECT_EQ(patch, Value({{"resources", {{"limits", {{"cpu", "1"}}}}}}));
}

TEST(ComputePatch, FieldUnsetInOverrideRecordedAsDeletion) {
    Value empty = {{"workingDir", "/"}};
    EXPECT_EQ(compute_patch(empty, Value::object(), Schema{}), Value({{"workingDir", nullptr}}));
    EXPECT_EQ(compute_patch(empty, {{"workingDir", nullptr}}, Schema{}),
              Value({{"workingDir", nullptr}}));
}

TEST(ComputePatch, ExplicitNullRecordedAsDeletion) {
    auto patch = compute_patch(Value::object(), {{"workingDir", nullptr}}, Schema{});
    EXPECT_EQ(patch, Value({{"workingDir", nullptr}}));
}

TEST(ComputePatch, NullInBothIsUnset) {
    auto patch = compute_patch({{"workingDir", nullptr}}, {{"workingDir", nullptr}}, Schema{});
    EXPECT_TRUE(patch.empty());
}

TEST(ComputePatch, NestedNullIndependentOfZeroValueShape) {
    Value over = {{"resources", {{"limits", {{"memory", nullptr}}}}}};
    Value expected = over;

    EXPECT_EQ(compute_patch(Value::object(), over, Schema{}), expected);
    EXPECT_EQ(compute_patch({{"resources", {{"limits", Value::object()}}}}, over, Schema{}), expected);
}

TEST(ComputePatch, ListsRecordedWhole) {
    Value empty = {{"args", {"a"}}};
    Value over = {{"args", {"a", "b"}}};
    EXPECT_EQ(compute_patch(empty, over, Schema{}), Value({{"args", {"a", "b"}}}));
}

TEST(ComputePatch, ExplicitEmptyListRecorded) {
    auto patch = compute_patch(Value::object(), {{"args", Value::array()}}, Schema{});
    ASSERT_TRUE(patch.contains("args"));
    EXPECT_TRUE(patch["args"].is_array());
    EXPECT_TRUE(patch["args"].empty());
}

TEST(ComputePatch, ReplaceStrategyObjectRecordedWhole) {
    auto schema = Schema::resolve({{"fields", {
        {"resources", {{"kind", "object"}, {"strategy", "replace"}}}
    }}});
    Value empty = {{"resources", {{"a", 1}}}};
    Value over = {{"resources", {{"a", 1}, {"b", 2}}}};
    EXPECT_EQ(compute_patch(empty, over, *schema), Value({{"resources", {{"a", 1}, {"b", 2}}}}));
}

TEST(ComputePatch, DirectiveObjectRecordedWhole) {
    Value empty = {{"labels", {{"a", "1"}}}};
    Value over = {{"labels", {{"$patch", "replace"}, {"a", "1"}}}};
    EXPECT_EQ(compute_patch(empty, over, Schema{}), over);
}

TEST(ComputePatch, ListFieldGivenScalar) {
    try {
        compute_patch(Value::object(), {{"args", "-v"}}, *keyed_schema());
        FAIL() << "Expected PatchComputationError";
    } catch (const PatchComputationError& e) {
        EXPECT_EQ(e.path(), "args");
    }
}

TEST(ComputePatch, ScalarFieldGivenObject) {
    EXPECT_THROW(compute_patch(Value::object(), {{"name", {{"first", "a"}}}}, *keyed_schema()),
                 PatchComputationError);
}

TEST(ComputePatch, KeyedListElementNotObject) {
    try {
        compute_patch(Value::object(), {{"items", {1}}}, *keyed_schema());
        FAIL() << "Expected PatchComputationError";
    } catch (const PatchComputationError& e) {
        EXPECT_EQ(e.path(), "items[0]");
    }
}

TEST(ComputePatch, NestedElementFieldChecked) {
    auto schema = Schema::resolve({{"fields", {
        {"env", {{"kind", "list"}, {"strategy", "merge"}, {"mergeKey", "name"},
                 {"schema", {{"fields", {{"value", {{"kind", "scalar"}}}}}}}}}
    }}});
    Value over = {{"env", {{{"name", "A"}, {"value", {{"nested", 1}}}}}}};
    try {
        compute_patch(Value::object(), over, *schema);
        FAIL() << "Expected PatchComputationError";
    } catch (const PatchComputationError& e) {
        EXPECT_EQ(e.path(), "env[0].value");
    }
}

TEST(ComputePatch, ShapeClashWithZeroValue) {
    try {
        compute_patch({{"a", {{"x", 1}}}}, {{"a", {1}}}, Schema{});
        FAIL() << "Expected PatchComputationError";
    } catch (const PatchComputationError& e) {
        EXPECT_EQ(e.path(), "a");
    }
}

TEST(ComputePatch, RootsMustBeObjects) {
    EXPECT_THROW(compute_patch(Value::array(), Value::object(), Schema{}), PatchComputationError);
    EXPECT_THROW(compute_patch(Value::object(), "x", Schema{}), PatchComputationError);
}

// ============================================================================
// apply_patch: scalars and objects
// ============================================================================

TEST(ApplyPatch, ScalarReplacedAndUnsetKept) {
    Value current = {{"image", "alpine"}, {"workingDir", "/src"}};
    auto result = apply_patch(current, {{"image", "busybox"}}, Schema{});
    EXPECT_EQ(result["image"], "busybox");
    EXPECT_EQ(result["workingDir"], "/src");
}

TEST(ApplyPatch, NullDeletes) {
    auto result = apply_patch({{"a", 1}, {"b", 2}}, {{"a", nullptr}}, Schema{});
    EXPECT_EQ(result, Value({{"b", 2}}));
}

TEST(ApplyPatch, OpenObjectsMergeRecursively) {
    Value current = {{"db", {{"host", "a"}, {"port", 1}}}};
    auto result = apply_patch(current, {{"db", {{"port", 2}}}}, Schema{});
    EXPECT_EQ(result["db"]["host"], "a");
    EXPECT_EQ(result["db"]["port"], 2);
}

TEST(ApplyPatch, ScalarReplacesObjectOnOpenField) {
    auto result = apply_patch({{"db", {{"host", "a"}}}}, {{"db", "string"}}, Schema{});
    EXPECT_EQ(result["db"], "string");
}

TEST(ApplyPatch, ObjectReplacesScalarOnOpenField) {
    auto result = apply_patch({{"port", 5432}}, {{"port", {{"value", 8080}}}}, Schema{});
    EXPECT_TRUE(result["port"].is_object());
    EXPECT_EQ(result["port"]["value"], 8080);
}

TEST(ApplyPatch, ReplaceStrategyObject) {
    auto schema = Schema::resolve({{"fields", {
        {"resources", {{"kind", "object"}, {"strategy", "replace"}}}
    }}});
    Value current = {{"resources", {{"limits", {{"cpu", "1"}}}, {"requests", {{"cpu", "1"}}}}}};
    auto result = apply_patch(current, {{"resources", {{"limits", {{"cpu", "2"}}}}}}, *schema);
    EXPECT_EQ(result["resources"], Value({{"limits", {{"cpu", "2"}}}}));
}

TEST(ApplyPatch, DeclaredObjectOverScalarTemplate) {
    auto schema = Schema::resolve({{"fields", {{"resources", {{"kind", "object"}}}}}});
    try {
        apply_patch({{"resources", "big"}}, {{"resources", {{"cpu", "1"}}}}, *schema);
        FAIL() << "Expected PatchApplicationError";
    } catch (const PatchApplicationError& e) {
        EXPECT_EQ(e.path(), "resources");
    }
}

TEST(ApplyPatch, MapOfObjectsMergesPerEntry) {
    auto schema = Schema::resolve({{"fields", {
        {"sidecars", {{"kind", "map"}, {"schema", {{"fields", {
            {"ports", {{"kind", "list"}, {"strategy", "merge"}, {"mergeKey", "containerPort"}}}
        }}}}}}
    }}});
    Value current = {{"sidecars", {
        {"proxy", {{"image", "envoy"}, {"ports", {{{"containerPort", 80}, {"name", "http"}}}}}},
        {"logger", {{"image", "fluentd"}}}
    }}};
    Value patch = {{"sidecars", {
        {"proxy", {{"ports", {{{"containerPort", 443}, {"name", "https"}}}}}}
    }}};
    auto result = apply_patch(current, patch, *schema);

    EXPECT_EQ(result["sidecars"]["proxy"]["image"], "envoy");
    ASSERT_EQ(result["sidecars"]["proxy"]["ports"].size(), 2u);
    EXPECT_EQ(result["sidecars"]["proxy"]["ports"][0]["containerPort"], 80);
    EXPECT_EQ(result["sidecars"]["proxy"]["ports"][1]["containerPort"], 443);
    EXPECT_EQ(result["sidecars"]["logger"]["image"], "fluentd");
}

TEST(ApplyPatch, MapOfScalarsRejectsObjectValue) {
    auto schema = Schema::resolve({{"fields", {{"labels", {{"kind", "map"}}}}}});
    EXPECT_THROW(apply_patch({{"labels", {{"a", "1"}}}}, {{"labels", {{"a", {{"x", 1}}}}}}, *schema),
                 PatchApplicationError);
}

TEST(ApplyPatch, InputsUntouched) {
    Value current = {{"items", {{{"key", "a"}, {"x", 1}}}}};
    Value patch = {{"items", {{{"key", "a"}, {"x", 2}}}}};
    const Value current_copy = current;
    const Value patch_copy = patch;
    apply_patch(current, patch, *keyed_schema());
    EXPECT_EQ(current, current_copy);
    EXPECT_EQ(patch, patch_copy);
}

// ============================================================================
// apply_patch: lists
// ============================================================================

TEST(ApplyPatchList, MergeByKey) {
    Value current = {{"items", {{{"key", "a"}, {"x", 1}}, {{"key", "b"}, {"x", 2}}}}};
    Value patch = {{"items", {{{"key", "a"}, {"x", 9}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    Value expected = {{{"key", "a"}, {"x", 9}}, {{"key", "b"}, {"x", 2}}};
    EXPECT_EQ(result["items"], expected);
}

TEST(ApplyPatchList, MatchedElementKeepsUnsetFields) {
    Value current = {{"items", {{{"key", "a"}, {"x", 1}, {"y", 1}}}}};
    Value patch = {{"items", {{{"key", "a"}, {"x", 2}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    EXPECT_EQ(result["items"][0], Value({{"key", "a"}, {"x", 2}, {"y", 1}}));
}

TEST(ApplyPatchList, NewElementsAppended) {
    Value current = {{"items", {{{"key", "a"}}, {{"key", "b"}}}}};
    Value patch = {{"items", {{{"key", "c"}}, {{"key", "a"}, {"x", 1}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    ASSERT_EQ(result["items"].size(), 3u);
    EXPECT_EQ(result["items"][0]["key"], "a");
    EXPECT_EQ(result["items"][0]["x"], 1);
    EXPECT_EQ(result["items"][1]["key"], "b");
    EXPECT_EQ(result["items"][2]["key"], "c");
}

TEST(ApplyPatchList, OverrideFirstOrder) {
    Value current = {{"items", {{{"key", "a"}}, {{"key", "b"}}, {{"key", "c"}}}}};
    Value patch = {{"items", {{{"key", "c"}, {"x", 1}}, {{"key", "d"}}}}};
    auto result = apply_patch(current, patch, *keyed_schema("override"));
    ASSERT_EQ(result["items"].size(), 4u);
    EXPECT_EQ(result["items"][0], Value({{"key", "c"}, {"x", 1}}));
    EXPECT_EQ(result["items"][1]["key"], "d");
    EXPECT_EQ(result["items"][2]["key"], "a");
    EXPECT_EQ(result["items"][3]["key"], "b");
}

TEST(ApplyPatchList, NoTemplateList) {
    Value patch = {{"items", {{{"key", "a"}, {"x", 1}}}}};
    auto result = apply_patch(Value::object(), patch, *keyed_schema());
    EXPECT_EQ(result["items"], patch["items"]);
}

TEST(ApplyPatchList, NumericMergeKey) {
    auto schema = Schema::resolve({{"fields", {
        {"ports", {{"kind", "list"}, {"strategy", "merge"}, {"mergeKey", "containerPort"}}}
    }}});
    Value current = {{"ports", {{{"containerPort", 80}, {"protocol", "TCP"}}}}};
    Value patch = {{"ports", {{{"containerPort", 80}, {"name", "http"}}}}};
    auto result = apply_patch(current, patch, *schema);
    ASSERT_EQ(result["ports"].size(), 1u);
    EXPECT_EQ(result["ports"][0], Value({{"containerPort", 80}, {"name", "http"}, {"protocol", "TCP"}}));
}

TEST(ApplyPatchList, DeleteDirectiveRemovesElement) {
    Value current = {{"items", {{{"key", "a"}}, {{"key", "b"}}}}};
    Value patch = {{"items", {{{"$patch", "delete"}, {"key", "a"}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    ASSERT_EQ(result["items"].size(), 1u);
    EXPECT_EQ(result["items"][0]["key"], "b");
}

TEST(ApplyPatchList, DeleteDirectiveForUnknownKeyIsNoop) {
    Value current = {{"items", {{{"key", "a"}}}}};
    Value patch = {{"items", {{{"$patch", "delete"}, {"key", "z"}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    EXPECT_EQ(result["items"], current["items"]);
}

TEST(ApplyPatchList, ReplaceDirectiveOnElement) {
    Value current = {{"items", {{{"key", "a"}, {"x", 1}, {"y", 1}}}}};
    Value patch = {{"items", {{{"$patch", "replace"}, {"key", "a"}, {"x", 2}}}}};
    auto result = apply_patch(current, patch, *keyed_schema());
    EXPECT_EQ(result["items"][0], Value({{"key", "a"}, {"x", 2}}));
}

TEST(ApplyPatchList, ReplaceStrategy) {
    auto result = apply_patch({{"args", {1, 2, 3}}}, {{"args", {9}}}, *keyed_schema());
    EXPECT_EQ(result["args"], Value({9}));
}

TEST(ApplyPatchList, UndeclaredListReplaced) {
    auto result = apply_patch({{"volumes", {1, 2, 3}}}, {{"volumes", {9}}}, Schema{});
    EXPECT_EQ(result["volumes"], Value({9}));
}

TEST(ApplyPatchList, ScalarUnion) {
    auto result = apply_patch({{"tags", {"a", "b"}}}, {{"tags", {"b", "c"}}}, *keyed_schema());
    EXPECT_EQ(result["tags"], Value({"a", "b", "c"}));
}

TEST(ApplyPatchList, EmptyPatchListClearsEveryStrategy) {
    Value current = {
        {"items", {{{"key", "a"}}}},
        {"tags", {"a"}},
        {"args", {"a"}}
    };
    Value patch = {{"items", Value::array()}, {"tags", Value::array()}, {"args", Value::array()}};
    auto result = apply_patch(current, patch, *keyed_schema());
    EXPECT_EQ(result["items"], Value::array());
    EXPECT_EQ(result["tags"], Value::array());
    EXPECT_EQ(result["args"], Value::array());
}

// ============================================================================
// apply_patch: errors
// ============================================================================

TEST(ApplyPatchErrors, MissingMergeKeyInPatch) {
    try {
        apply_patch({{"items", Value::array()}}, {{"items", {{{"x", 1}}}}}, *keyed_schema());
        FAIL() << "Expected PatchApplicationError";
    } catch (const PatchApplicationError& e) {
        EXPECT_EQ(e.path(), "items[0]");
    }
}

TEST(ApplyPatchErrors, MissingMergeKeyInTemplate) {
    Value current = {{"items", {{{"key", "a"}}, {{"x", 1}}}}};
    try {
        apply_patch(current, {{"items", {{{"key", "a"}}}}}, *keyed_schema());
        FAIL() << "Expected PatchApplicationError";
    } catch (const PatchApplicationError& e) {
        EXPECT_EQ(e.path(), "items[1]");
    }
}

TEST(ApplyPatchErrors, DuplicateKeyInPatch) {
    Value patch = {{"items", {{{"key", "a"}, {"x", 1}}, {{"key", "a"}, {"x", 2}}}}};
    try {
        apply_patch(Value::object(), patch, *keyed_schema());
        FAIL() << "Expected PatchApplicationError";
    } catch (const PatchApplicationError& e) {
        EXPECT_EQ(e.path(), "items[key=\"a\"]");
    }
}

TEST(ApplyPatchErrors, DuplicateKeyInTemplate) {
    Value current = {{"items", {{{"key", "a"}}, {{"key", "a"}}}}};
    EXPECT_THROW(apply_patch(current, {{"items", {{{"key", "b"}}}}}, *keyed_schema()),
                 PatchApplicationError);
}

TEST(ApplyPatchErrors, ContainerMergeKey) {
    Value patch = {{"items", {{{"key", {1, 2}}}}}};
    EXPECT_THROW(apply_patch(Value::object(), patch, *keyed_schema()), PatchApplicationError);
}

TEST(ApplyPatchErrors, ListFieldGivenObject) {
    EXPECT_THROW(apply_patch({{"args", {1}}}, {{"args", {{"a", 1}}}}, *keyed_schema()),
                 PatchApplicationError);
}

TEST(ApplyPatchErrors, TemplateListNotArray) {
    EXPECT_THROW(apply_patch({{"items", "a"}}, {{"items", {{{"key", "a"}}}}}, *keyed_schema()),
                 PatchApplicationError);
}

TEST(ApplyPatchErrors, UnknownDirective) {
    EXPECT_THROW(apply_patch({{"labels", {{"a", "1"}}}}, {{"labels", {{"$patch", "append"}}}}, Schema{}),
                 PatchApplicationError);
}

TEST(ApplyPatchErrors, DeleteDirectiveAtRoot) {
    EXPECT_THROW(apply_patch({{"a", 1}}, {{"$patch", "delete"}}, Schema{}), PatchApplicationError);
}

TEST(ApplyPatchErrors, RootsMustBeObjects) {
    EXPECT_THROW(apply_patch(Value::array(), Value::object(), Schema{}), PatchApplicationError);
    EXPECT_THROW(apply_patch(Value::object(), Value::array(), Schema{}), PatchApplicationError);
}

// ============================================================================
// Directives on objects
// ============================================================================

TEST(ApplyPatchDirectives, ReplaceObject) {
    Value current = {{"labels", {{"a", "1"}, {"b", "2"}}}};
    auto result = apply_patch(current, {{"labels", {{"$patch", "replace"}, {"c", "3"}}}}, Schema{});
    EXPECT_EQ(result["labels"], Value({{"c", "3"}}));
}

TEST(ApplyPatchDirectives, DeleteField) {
    Value current = {{"labels", {{"a", "1"}}}, {"image", "alpine"}};
    auto result = apply_patch(current, {{"labels", {{"$patch", "delete"}}}}, Schema{});
    EXPECT_FALSE(result.contains("labels"));
    EXPECT_EQ(result["image"], "alpine");
}

TEST(ApplyPatchDirectives, ExplicitMergeIsDefault) {
    Value current = {{"labels", {{"a", "1"}}}};
    auto result = apply_patch(current, {{"labels", {{"$patch", "merge"}, {"b", "2"}}}}, Schema{});
    EXPECT_EQ(result["labels"], Value({{"a", "1"}, {"b", "2"}}));
}
