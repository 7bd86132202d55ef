/**
 * @file execution_stack.cpp
 */
#include "incrgraph/common/execution_stack.hpp"

#include <algorithm>

namespace incrgraph
{

ExecutionStack::ExecutionStack(size_t max_depth)
    : m_max_depth(max_depth)
{
}

void ExecutionStack::push(NodeId id)
{
    if (m_max_depth != 0 && m_frames.size() >= m_max_depth)
    {
        throw EngineError(
            EngineErrorCode::EvaluationDepthExceeded,
            "Evaluating node " + std::to_string(id) + " would exceed the maximum depth of " +
                std::to_string(m_max_depth));
    }
    m_frames.push_back(id);
}

void ExecutionStack::pop(NodeId id)
{
    if (m_frames.empty())
    {
        throw EngineError(
            EngineErrorCode::InvalidState,
            "Cannot pop node " + std::to_string(id) + " from an empty execution stack");
    }
    if (m_frames.back() != id)
    {
        throw EngineError(
            EngineErrorCode::InvalidState,
            "Cannot pop node " + std::to_string(id) + "; node " +
                std::to_string(m_frames.back()) + " is on top of the execution stack");
    }
    m_frames.pop_back();
}

bool ExecutionStack::contains(NodeId id) const noexcept
{
    return std::find(m_frames.begin(), m_frames.end(), id) != m_frames.end();
}

ExecutionFrame::ExecutionFrame(ExecutionStack& stack, NodeId id)
    : m_stack(stack)
    , m_id(id)
{
    m_stack.push(m_id);
}

ExecutionFrame::~ExecutionFrame()
{
    // Frames nest strictly, so our entry is on top here.
    if (!m_stack.empty() && m_stack.top() == m_id)
    {
        m_stack.pop(m_id);
    }
}

} // namespace incrgraph
