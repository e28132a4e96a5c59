/**
 * @file test_compose.cpp
 * @brief Tests for merge patch composition using Google Test
 */

#include <gtest/gtest.h>
#include "mergepatch/Compose.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Equality.hpp"
#include "mergepatch/Errors.hpp"
#include "mergepatch/Merge.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace mergepatch;

// ============================================================================
// Literal compositions
// ============================================================================

TEST(MergeMergePatches, SimplePatchesAreMerged) {
    EXPECT_EQ(merge_merge_patches(R"({"add1": 1})", R"({"add2": 2})"), R"({"add1":1,"add2":2})");
}

TEST(MergeMergePatches, NullsAreKept) {
    EXPECT_EQ(merge_merge_patches(R"({"del1": null})", R"({"del2": null})"),
              R"({"del1":null,"del2":null})");
}

TEST(MergeMergePatches, NullsAreKeptInComplexObjects) {
    const char* p2 =
        R"({"request":{"object":{"complex_object_array":["value1","value2","value3"],)"
        R"("complex_object_map":{"key1":"value1","key2":"value2","key3":"value3"},)"
        R"("simple_object_bool":false,"simple_object_float":-5.5,"simple_object_int":5,)"
        R"("simple_object_null":null,"simple_object_string":"example"}}})";
    EXPECT_EQ(merge_merge_patches("{}", p2), p2);
}

TEST(MergeMergePatches, AddThenDeleteStaysDeleted) {
    EXPECT_EQ(merge_merge_patches(R"({"k": "v"})", R"({"k": null})"), R"({"k":null})");
}

TEST(MergeMergePatches, DeleteThenAddStaysAdded) {
    EXPECT_EQ(merge_merge_patches(R"({"k": null})", R"({"k": "v"})"), R"({"k":"v"})");
}

TEST(MergeMergePatches, ObjectOverridesArray) {
    EXPECT_EQ(merge_merge_patches("[]", R"({"del": null, "add": "a"})"), R"({"add":"a","del":null})");
}

TEST(MergeMergePatches, ArrayOverridesObject) {
    EXPECT_EQ(merge_merge_patches(R"({"del": null, "add": "a"})", "[]"), "[]");
}

TEST(MergeMergePatches, ScalarSecondPatchWins) {
    EXPECT_EQ(merge_merge_patches(R"({"a": 1})", "null"), "null");
    EXPECT_EQ(merge_merge_patches(R"({"a": 1})", "\"s\""), "\"s\"");
}

TEST(MergeMergePatches, NestedObjectsCompose) {
    auto out = merge_merge_patches(R"({"b": {"c": 5, "keep": true}})", R"({"b": {"d": null, "e": 1}})");
    EXPECT_EQ(out, R"({"b":{"c":5,"d":null,"e":1,"keep":true}})");
}

TEST(MergeMergePatches, LaterScalarReplacesEarlierObject) {
    EXPECT_EQ(merge_merge_patches(R"({"n": {"x": 2}})", R"({"n": "flat"})"), R"({"n":"flat"})");
}

TEST(MergeMergePatches, ParseErrors) {
    EXPECT_THROW(merge_merge_patches("{", "{}"), ParseError);
    EXPECT_THROW(merge_merge_patches("{}", "}"), ParseError);
}

// ============================================================================
// Equivalence with sequential application
// ============================================================================

TEST(ComposeEquivalence, MatchesSequentialApply) {
    const std::vector<std::string> documents = {
        "{}",
        R"({"a":1,"b":{"c":2,"d":[1,2]}})",
        R"({"k":"v","n":{"x":1},"del1":0})",
        "[1,2]",
        R"("text")",
        "null",
    };

    const std::vector<std::pair<std::string, std::string>> patches = {
        {R"({"add1":1})", R"({"add2":2})"},
        {R"({"del1":null})", R"({"del2":null})"},
        {R"({"k":"atd"})", R"({"k":null})"},
        {R"({"k":null})", R"({"k":"dta"})"},
        {R"({"del":null,"add":"a"})", "[]"},
        {R"({"b":{"c":5}})", R"({"b":{"d":null,"e":1}})"},
        {R"({"a":{"x":1}})", R"({"a":{"x":null}})"},
        {R"({"n":{"x":2}})", R"({"n":"flat"})"},
        {R"({"n":{"y":[1,null]}})", R"({"n":{"x":null,"z":{"deep":true}}})"},
        {"[]", "7"},
    };

    for (const auto& doc : documents) {
        for (const auto& [p1, p2] : patches) {
            SCOPED_TRACE(doc + " | " + p1 + " | " + p2);
            const Value x = decode(doc);
            const Value first = decode(p1);
            const Value second = decode(p2);

            const Value sequential = merge_patch(merge_patch(x, first), second);
            const Value combined = merge_patch(x, compose(first, second));

            EXPECT_TRUE(equal(sequential, combined))
                << sequential.dump() << " vs " << combined.dump();
        }
    }
}

// ============================================================================
// Value-level API
// ============================================================================

TEST(ComposeValue, DoesNotModifyLvalueFirstPatch) {
    Value p1 = {{"a", {{"b", 1}}}};
    const Value before = p1;
    Value p2 = {{"a", {{"c", 2}}}};

    auto out = compose(p1, p2);

    EXPECT_EQ(p1, before);
    EXPECT_EQ(out, Value::parse(R"({"a":{"b":1,"c":2}})"));
}

TEST(ComposeValue, DepthLimit) {
    Value p1 = {{"a", {{"b", {{"c", 1}}}}}};
    Value p2 = {{"a", {{"b", {{"d", 1}}}}}};
    EXPECT_THROW(compose(p1, p2, 2), DepthLimitError);
    EXPECT_NO_THROW(compose(p1, p2, 3));
}
