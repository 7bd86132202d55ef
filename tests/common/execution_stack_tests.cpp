/**
 * @file execution_stack_tests.cpp
 * Unit tests for incrgraph::ExecutionStack and incrgraph::ExecutionFrame
 */
#include <gtest/gtest.h>
#include "incrgraph/common/execution_stack.hpp"

#include <stdexcept>

using namespace incrgraph;

// ============================================================================
// ExecutionStack
// ============================================================================

TEST(ExecutionStackTests, Construction_DefaultIsEmpty)
{
    ExecutionStack stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.depth(), 0u);
    EXPECT_FALSE(stack.top().has_value());
}

TEST(ExecutionStackTests, PushPop_TracksTop)
{
    ExecutionStack stack;
    stack.push(3);
    stack.push(5);
    EXPECT_EQ(stack.top(), std::optional<NodeId>{5});
    EXPECT_TRUE(stack.contains(3));
    EXPECT_EQ(stack.frames(), (std::vector<NodeId>{3, 5}));

    stack.pop(5);
    EXPECT_EQ(stack.top(), std::optional<NodeId>{3});
    EXPECT_FALSE(stack.contains(5));
}

TEST(ExecutionStackTests, Pop_WrongTopThrows)
{
    ExecutionStack stack;
    stack.push(3);
    stack.push(5);
    try
    {
        stack.pop(3);
        FAIL() << "Expected EngineError";
    }
    catch (const EngineError& e)
    {
        EXPECT_EQ(e.code(), EngineErrorCode::InvalidState);
    }
    EXPECT_EQ(stack.depth(), 2u);
}

TEST(ExecutionStackTests, Pop_EmptyThrows)
{
    ExecutionStack stack;
    EXPECT_THROW(stack.pop(1), EngineError);
}

TEST(ExecutionStackTests, Push_BeyondMaxDepthThrows)
{
    ExecutionStack stack(2);
    stack.push(1);
    stack.push(2);
    try
    {
        stack.push(3);
        FAIL() << "Expected EngineError";
    }
    catch (const EngineError& e)
    {
        EXPECT_EQ(e.code(), EngineErrorCode::EvaluationDepthExceeded);
    }
    EXPECT_EQ(stack.depth(), 2u);
}

TEST(ExecutionStackTests, MaxDepthZero_IsUnlimited)
{
    ExecutionStack stack;
    for (NodeId id = 1; id <= 10000; ++id)
    {
        stack.push(id);
    }
    EXPECT_EQ(stack.depth(), 10000u);
}

// ============================================================================
// ExecutionFrame
// ============================================================================

TEST(ExecutionFrameTests, Scope_PushesAndPops)
{
    ExecutionStack stack;
    {
        ExecutionFrame outer(stack, 1);
        {
            ExecutionFrame inner(stack, 2);
            EXPECT_EQ(stack.top(), std::optional<NodeId>{2});
        }
        EXPECT_EQ(stack.top(), std::optional<NodeId>{1});
    }
    EXPECT_TRUE(stack.empty());
}

TEST(ExecutionFrameTests, Exception_StillPops)
{
    ExecutionStack stack;
    try
    {
        ExecutionFrame frame(stack, 7);
        throw std::runtime_error("computation failed");
    }
    catch (const std::runtime_error&)
    {
        // Expected
    }
    EXPECT_TRUE(stack.empty());
}

TEST(ExecutionFrameTests, DepthExceeded_LeavesStackUnchanged)
{
    ExecutionStack stack(1);
    ExecutionFrame outer(stack, 1);
    EXPECT_THROW(ExecutionFrame(stack, 2), EngineError);
    EXPECT_EQ(stack.depth(), 1u);
    EXPECT_EQ(stack.top(), std::optional<NodeId>{1});
}
