/**
 * @file test_typed_value.cpp
 * @brief Unit tests for TypedValue (GoogleTest)
 *
 * Tests cover:
 * - Validation against the schema
 * - Field set enumeration per container flavour
 * - Comparison (added / modified / removed)
 * - Merge per container flavour
 * - Path removal
 */

#include <gtest/gtest.h>
#include "fieldmerge/TypedValue.hpp"
#include "fieldmerge/Errors.hpp"
#include "test_fixtures.hpp"

using namespace fieldmerge;
using namespace fieldmerge::test;

// ============================================================================
// Validation
// ============================================================================

TEST(TypedValueValidation, AcceptsConformingValue) {
    EXPECT_NO_THROW(leaf(R"({"numeric":1,"string":"s","bool":true})"));
    EXPECT_NO_THROW(leaf(R"({"numeric":1.5})"));
    EXPECT_NO_THROW(nested(R"({"ports":[{"name":"http","port":80}],"set":[1,2]})"));
}

TEST(TypedValueValidation, NullRootIsEmpty) {
    TypedValue v(test_schema(), "leafFields", Value());
    EXPECT_EQ(v.value(), Value::object());
    EXPECT_TRUE(v.to_field_set().empty());
}

TEST(TypedValueValidation, NestedNullIsAccepted) {
    EXPECT_EQ(leaf(R"({"string":null})").to_field_set(), set_of({".string"}));
}

TEST(TypedValueValidation, WrongScalarKind) {
    EXPECT_THROW(leaf(R"({"numeric":"one"})"), ValidationError);
    EXPECT_THROW(leaf(R"({"bool":1})"), ValidationError);
    EXPECT_THROW(nested(R"({"tags":[1]})"), ValidationError);
}

TEST(TypedValueValidation, UndeclaredField) {
    try {
        leaf(R"({"other":1})");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.path(), ".other");
    }
}

TEST(TypedValueValidation, ContainerShape) {
    EXPECT_THROW(TypedValue(test_schema(), "leafFields", Value::array()), ValidationError);
    EXPECT_THROW(nested(R"({"labels":[]})"), ValidationError);
    EXPECT_THROW(nested(R"({"ports":{}})"), ValidationError);
}

TEST(TypedValueValidation, AssociativeListRules) {
    EXPECT_THROW(nested(R"({"set":[1,1]})"), ValidationError);
    EXPECT_THROW(nested(R"({"ports":[{"name":"a"},{"name":"a","port":1}]})"), ValidationError);
    EXPECT_THROW(nested(R"({"ports":[{"port":1}]})"), ValidationError);
    EXPECT_THROW(nested(R"({"ports":["http"]})"), ValidationError);
}

TEST(TypedValueValidation, UnknownType) {
    EXPECT_THROW(TypedValue(test_schema(), "missing", Value::object()), SchemaError);
}

// ============================================================================
// Field sets
// ============================================================================

TEST(TypedValueFieldSet, Leaves) {
    EXPECT_EQ(leaf(R"({"numeric":1,"string":"s"})").to_field_set(),
              set_of({".numeric", ".string"}));
}

TEST(TypedValueFieldSet, SeparableMapListsContainerAndEntries) {
    EXPECT_EQ(nested(R"({"labels":{"a":"1","b":"2"}})").to_field_set(),
              set_of({".labels", ".labels.a", ".labels.b"}));
}

TEST(TypedValueFieldSet, AtomicContainersAreOnePath) {
    EXPECT_EQ(nested(R"({"tags":["x","y"],"atomicMap":{"a":"1"}})").to_field_set(),
              set_of({".tags", ".atomicMap"}));
}

TEST(TypedValueFieldSet, ListItemAddressing) {
    EXPECT_EQ(nested(R"({"items":["a","b"]})").to_field_set(),
              set_of({".items", ".items[0]", ".items[1]"}));
    EXPECT_EQ(nested(R"({"set":[3,1]})").to_field_set(),
              set_of({".set", ".set[=1]", ".set[=3]"}));
    EXPECT_EQ(nested(R"({"ports":[{"name":"http","port":80}]})").to_field_set(),
              set_of({".ports", ".ports[name=\"http\"]", ".ports[name=\"http\"].name",
                      ".ports[name=\"http\"].port"}));
}

// ============================================================================
// Comparison
// ============================================================================

TEST(TypedValueCompare, IdenticalIsSame) {
    auto v = nested(R"({"labels":{"a":"1"},"ports":[{"name":"http","port":80}]})");
    EXPECT_TRUE(v.compare(v).is_same());
}

TEST(TypedValueCompare, LeafChanges) {
    auto cmp = leaf(R"({"numeric":1,"string":"s"})")
                   .compare(leaf(R"({"numeric":2,"bool":true})"));
    EXPECT_EQ(cmp.added, set_of({".bool"}));
    EXPECT_EQ(cmp.modified, set_of({".numeric"}));
    EXPECT_EQ(cmp.removed, set_of({".string"}));
    EXPECT_EQ(cmp.changed(), set_of({".bool", ".numeric"}));
}

TEST(TypedValueCompare, NestedMapEntries) {
    auto cmp = nested(R"({"labels":{"x":"1"}})").compare(nested(R"({"labels":{"x":"2","y":"3"}})"));
    EXPECT_EQ(cmp.added, set_of({".labels.y"}));
    EXPECT_EQ(cmp.modified, set_of({".labels.x"}));
    EXPECT_TRUE(cmp.removed.empty());
}

TEST(TypedValueCompare, AddedContainerBringsDescendants) {
    auto cmp = nested("{}").compare(nested(R"({"ports":[{"name":"http","port":80}]})"));
    EXPECT_EQ(cmp.added, set_of({".ports", ".ports[name=\"http\"]", ".ports[name=\"http\"].name",
                                 ".ports[name=\"http\"].port"}));
}

TEST(TypedValueCompare, AtomicListIsModifiedAsWhole) {
    auto cmp = nested(R"({"tags":["a"]})").compare(nested(R"({"tags":["a","b"]})"));
    EXPECT_EQ(cmp.modified, set_of({".tags"}));
    EXPECT_TRUE(cmp.added.empty());
}

TEST(TypedValueCompare, KeyedItemsMatchRegardlessOfOrder) {
    auto lhs = nested(R"({"ports":[{"name":"a","port":1},{"name":"b","port":2}]})");
    auto rhs = nested(R"({"ports":[{"name":"b","port":2},{"name":"a","port":5}]})");
    auto cmp = lhs.compare(rhs);
    EXPECT_EQ(cmp.modified, set_of({".ports[name=\"a\"].port"}));
    EXPECT_TRUE(cmp.added.empty());
    EXPECT_TRUE(cmp.removed.empty());
}

TEST(TypedValueCompare, DifferentTypesRejected) {
    EXPECT_THROW(leaf("{}").compare(nested("{}")), ValidationError);
}

TEST(TypedValueCompare, ToString) {
    auto cmp = leaf(R"({"numeric":1})").compare(leaf(R"({"numeric":2})"));
    EXPECT_EQ(cmp.to_string(),
              "- Added Fields:\n- Modified Fields:\n.numeric\n- Removed Fields:\n");
}

// ============================================================================
// Merge
// ============================================================================

TEST(TypedValueMerge, OverridesWinAtLeaves) {
    auto merged = leaf(R"({"numeric":1,"string":"a"})").merge(leaf(R"({"string":"b","bool":true})"));
    EXPECT_EQ(merged.value(), Value::parse(R"({"numeric":1,"string":"b","bool":true})"));
}

TEST(TypedValueMerge, SeparableMapMergesByKey) {
    auto merged = nested(R"({"labels":{"a":"1"}})").merge(nested(R"({"labels":{"b":"2"}})"));
    EXPECT_EQ(merged.value()["labels"], Value::parse(R"({"a":"1","b":"2"})"));
}

TEST(TypedValueMerge, AtomicContainersAreReplaced) {
    auto merged = nested(R"({"atomicMap":{"a":"1"},"tags":["x","y"]})")
                      .merge(nested(R"({"atomicMap":{"b":"2"},"tags":["z"]})"));
    EXPECT_EQ(merged.value()["atomicMap"], Value::parse(R"({"b":"2"})"));
    EXPECT_EQ(merged.value()["tags"], Value::parse(R"(["z"])"));
}

TEST(TypedValueMerge, GranularListMergesByIndex) {
    auto merged = nested(R"({"items":["a","b","c"]})").merge(nested(R"({"items":["x"]})"));
    EXPECT_EQ(merged.value()["items"], Value::parse(R"(["x","b","c"])"));
}

TEST(TypedValueMerge, SetListUnions) {
    auto merged = nested(R"({"set":[1,2]})").merge(nested(R"({"set":[2,3]})"));
    EXPECT_EQ(merged.value()["set"], Value::parse("[1,2,3]"));
}

TEST(TypedValueMerge, KeyedListMergesItems) {
    auto merged = nested(R"({"ports":[{"name":"http","port":80,"protocol":"TCP"}]})")
                      .merge(nested(R"({"ports":[{"name":"http","port":8080},{"name":"https","port":443}]})"));
    EXPECT_EQ(merged.value()["ports"], Value::parse(R"([
        {"name":"http","port":8080,"protocol":"TCP"},
        {"name":"https","port":443}])"));
}

TEST(TypedValueMerge, NestedNullReplaces) {
    auto merged = leaf(R"({"string":"a"})").merge(leaf(R"({"string":null})"));
    EXPECT_TRUE(merged.value()["string"].is_null());
}

TEST(TypedValueMerge, InputsUnchanged) {
    auto lhs = leaf(R"({"numeric":1})");
    auto rhs = leaf(R"({"numeric":2})");
    (void)lhs.merge(rhs);
    EXPECT_EQ(lhs.value()["numeric"], 1);
    EXPECT_EQ(rhs.value()["numeric"], 2);
}

TEST(TypedValueMerge, MergedChangesAreSubsetOfOverrides) {
    auto live = nested(R"({"name":"a","labels":{"x":"1"},"ports":[{"name":"http","port":80}]})");
    auto incoming = nested(R"({"labels":{"x":"2","y":"1"},"ports":[{"name":"http","port":81}]})");
    auto changed = live.compare(live.merge(incoming)).changed();
    EXPECT_EQ(changed.difference(incoming.to_field_set()), FieldSet());
}

// ============================================================================
// Removal
// ============================================================================

TEST(TypedValueRemove, RemovesLeavesAndItems) {
    auto v = nested(R"({"name":"n","labels":{"x":"1","y":"2"},
                        "ports":[{"name":"a","port":1},{"name":"b","port":2}]})");
    auto out = v.remove_paths(set_of({".labels.x", ".ports[name=\"a\"]"}));
    EXPECT_EQ(out.value(), Value::parse(R"({"name":"n","labels":{"y":"2"},
                                            "ports":[{"name":"b","port":2}]})"));
}

TEST(TypedValueRemove, IndexesRemovedHighestFirst) {
    auto out = nested(R"({"items":["a","b","c"]})").remove_paths(set_of({".items[0]", ".items[2]"}));
    EXPECT_EQ(out.value()["items"], Value::parse(R"(["b"])"));
}

TEST(TypedValueRemove, MissingPathIsIgnored) {
    auto v = leaf(R"({"numeric":1})");
    EXPECT_EQ(v.remove_paths(set_of({".string"})), v);
}

TEST(TypedValueRemove, RootEmptiesValue) {
    auto out = leaf(R"({"numeric":1})").remove_paths(set_of({"."}));
    EXPECT_EQ(out.value(), Value::object());
}
