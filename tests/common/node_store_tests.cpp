/**
 * @file node_store_tests.cpp
 * Unit tests for incrgraph::NodeStore
 */
#include <gtest/gtest.h>
#include "incrgraph/common/node_store.hpp"
#include "incrgraph/common/value_box.inline.hpp"

using namespace incrgraph;

namespace
{

EqualityFn int_equals()
{
    return [](const ValueBox& a, const ValueBox& b) { return a.as<int>() == b.as<int>(); };
}

ComputeFn constant(int value)
{
    return [value]() { return ValueBox::of(value); };
}

} // namespace

// ============================================================================
// Identity allocation
// ============================================================================

TEST(NodeStoreTests, Ids_StartAtOneAndIncrement)
{
    NodeStore store;
    EXPECT_EQ(store.next_id(), 1u);
    NodeId a = store.create_source(ValueBox::of(1), int_equals(), std::nullopt).id;
    NodeId b = store.create_derived(constant(2), int_equals(), std::nullopt).id;
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(store.next_id(), 3u);
}

TEST(NodeStoreTests, Ids_NotReusedAfterErase)
{
    NodeStore store;
    NodeId a = store.create_source(ValueBox::of(1), int_equals(), std::nullopt).id;
    EXPECT_TRUE(store.erase(a));
    NodeId b = store.create_source(ValueBox::of(1), int_equals(), std::nullopt).id;
    EXPECT_NE(a, b);
    EXPECT_FALSE(store.contains(a));
}

// ============================================================================
// Node variants
// ============================================================================

TEST(NodeStoreTests, CreateSource_HoldsValue)
{
    NodeStore store;
    NodeRecord& record = store.create_source(ValueBox::of(7), int_equals(), std::string("a"));
    EXPECT_EQ(record.kind(), NodeKind::Source);
    ASSERT_NE(record.as_source(), nullptr);
    EXPECT_EQ(record.as_source()->value.as<int>(), 7);
    EXPECT_EQ(record.as_derived(), nullptr);
    EXPECT_TRUE(record.observers.empty());
}

TEST(NodeStoreTests, CreateDerived_StartsDirtyWithoutValue)
{
    NodeStore store;
    NodeRecord& record = store.create_derived(constant(3), int_equals(), std::nullopt);
    EXPECT_EQ(record.kind(), NodeKind::Derived);
    ASSERT_NE(record.as_derived(), nullptr);
    EXPECT_TRUE(record.as_derived()->dirty);
    EXPECT_FALSE(record.as_derived()->evaluating);
    EXPECT_FALSE(record.as_derived()->cached.has_value());
}

TEST(NodeStoreTests, Name_UsesLabelWhenPresent)
{
    NodeStore store;
    NodeRecord& labelled = store.create_source(ValueBox::of(1), int_equals(), std::string("price"));
    NodeRecord& anonymous = store.create_source(ValueBox::of(1), int_equals(), std::nullopt);
    EXPECT_EQ(labelled.name(), "price#1");
    EXPECT_EQ(anonymous.name(), "#2");
}

TEST(NodeStoreTests, Create_RejectsEmptyArguments)
{
    NodeStore store;
    EXPECT_THROW(store.create_source(ValueBox::of(1), EqualityFn{}, std::nullopt), std::invalid_argument);
    EXPECT_THROW(store.create_source(ValueBox{}, int_equals(), std::nullopt), std::invalid_argument);
    EXPECT_THROW(store.create_derived(ComputeFn{}, int_equals(), std::nullopt), std::invalid_argument);
    EXPECT_THROW(store.create_derived(constant(1), EqualityFn{}, std::nullopt), std::invalid_argument);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.next_id(), 1u);
}

// ============================================================================
// Lookup
// ============================================================================

TEST(NodeStoreTests, At_UnknownIdThrows)
{
    NodeStore store;
    try
    {
        store.at(42);
        FAIL() << "Expected EngineError";
    }
    catch (const EngineError& e)
    {
        EXPECT_EQ(e.code(), EngineErrorCode::UnknownNode);
    }
}

TEST(NodeStoreTests, Find_UnknownIdReturnsNull)
{
    NodeStore store;
    EXPECT_EQ(store.find(1), nullptr);
}

TEST(NodeStoreTests, References_StableAcrossInsertions)
{
    NodeStore store;
    NodeRecord& first = store.create_source(ValueBox::of(1), int_equals(), std::nullopt);
    for (int i = 0; i < 1000; ++i)
    {
        store.create_source(ValueBox::of(i), int_equals(), std::nullopt);
    }
    EXPECT_EQ(&first, &store.at(1));
    EXPECT_EQ(first.as_source()->value.as<int>(), 1);
}

TEST(NodeStoreTests, Ids_AreSorted)
{
    NodeStore store;
    for (int i = 0; i < 5; ++i)
    {
        store.create_source(ValueBox::of(i), int_equals(), std::nullopt);
    }
    store.erase(3);
    EXPECT_EQ(store.ids(), (std::vector<NodeId>{1, 2, 4, 5}));
    EXPECT_EQ(store.size(), 4u);
}
