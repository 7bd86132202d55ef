/**
 * @file value_box_tests.cpp
 * Unit tests for incrgraph::ValueBox
 */
#include <gtest/gtest.h>
#include "incrgraph/common/value_box.hpp"
#include "incrgraph/common/value_box.inline.hpp"

#include <string>
#include <vector>

using namespace incrgraph;

// =============================================================================
// Basic functionality
// =============================================================================

class ValueBoxTests : public ::testing::Test
{
protected:
    ValueBox box;
};

TEST_F(ValueBoxTests, DefaultConstructed_IsEmpty)
{
    EXPECT_FALSE(box.has_value());
    EXPECT_EQ(box.type(), std::type_index{typeid(void)});
}

TEST_F(ValueBoxTests, Set_StoresValueAndType)
{
    box.set(42);
    EXPECT_TRUE(box.has_value());
    EXPECT_TRUE(box.has_type<int>());
    EXPECT_FALSE(box.has_type<double>());
    EXPECT_EQ(box.as<int>(), 42);
}

TEST_F(ValueBoxTests, Of_BuildsFilledBox)
{
    ValueBox other = ValueBox::of(std::string("abc"));
    EXPECT_TRUE(other.has_type<std::string>());
    EXPECT_EQ(other.as<std::string>(), "abc");
}

TEST_F(ValueBoxTests, TryAs_ReturnsPointerOnMatch)
{
    box.set(42);
    const int* ptr = box.try_as<int>();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 42);
}

TEST_F(ValueBoxTests, TryAs_ReturnsNullptrOnMismatchOrEmpty)
{
    EXPECT_EQ(box.try_as<int>(), nullptr);
    box.set(42);
    EXPECT_EQ(box.try_as<double>(), nullptr);
}

TEST_F(ValueBoxTests, Reset_ClearsValue)
{
    box.set(42);
    box.reset();
    EXPECT_FALSE(box.has_value());
    EXPECT_EQ(box.type(), std::type_index{typeid(void)});
}

// =============================================================================
// Exceptions
// =============================================================================

TEST_F(ValueBoxTests, As_ThrowsOnEmpty)
{
    EXPECT_THROW((void)box.as<int>(), ValueEmptyError);
}

TEST_F(ValueBoxTests, As_ThrowsOnTypeMismatch)
{
    box.set(42);
    EXPECT_THROW((void)box.as<double>(), ValueTypeError);
}

// =============================================================================
// Sharing
// =============================================================================

TEST_F(ValueBoxTests, Copy_SharesStorage)
{
    box.set(42);
    ValueBox copy = box;
    EXPECT_TRUE(copy.same_storage(box));
    EXPECT_EQ(copy.as<int>(), 42);
}

TEST_F(ValueBoxTests, SetAfterCopy_LeavesCopyUntouched)
{
    box.set(42);
    ValueBox copy = box;
    box.set(100);
    EXPECT_FALSE(copy.same_storage(box));
    EXPECT_EQ(copy.as<int>(), 42);
    EXPECT_EQ(box.as<int>(), 100);
}

TEST_F(ValueBoxTests, EmptyBoxes_ShareNullStorage)
{
    ValueBox other;
    EXPECT_TRUE(other.same_storage(box));
}

// =============================================================================
// Type handling
// =============================================================================

TEST_F(ValueBoxTests, WorksWithVector)
{
    box.set(std::vector<int>{1, 2, 3});
    const auto& vec = box.as<std::vector<int>>();
    ASSERT_EQ(vec.size(), 3u);
    EXPECT_EQ(vec[2], 3);
}

TEST_F(ValueBoxTests, TypeDecay_ConstIsStripped)
{
    const int x = 42;
    box.set(x);
    EXPECT_TRUE(box.has_type<int>());
}

TEST_F(ValueBoxTests, OverwriteValue_ChangesType)
{
    box.set(42);
    box.set(std::string("hello"));
    EXPECT_FALSE(box.has_type<int>());
    EXPECT_EQ(box.as<std::string>(), "hello");
}
