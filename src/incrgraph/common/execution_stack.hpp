/**
 * @file execution_stack.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"
#include "incrgraph/common/engine_exceptions.hpp"

namespace incrgraph
{

/**
 * @brief The ordered sequence of derived nodes currently being evaluated.
 *
 * @details
 * The top of the stack is the node to which reads are attributed. Nested
 * reads of derived nodes push further entries; each evaluation pops its own
 * entry when its computation returns or throws (see `ExecutionFrame`).
 *
 * @par Depth limit
 * A non-zero `max_depth` bounds the number of entries. `push()` beyond the
 * limit throws `EngineError` with `EvaluationDepthExceeded` and leaves the
 * stack unchanged.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class ExecutionStack
{
public:
    /**
     * @param max_depth Maximum number of entries; 0 means unlimited.
     */
    explicit ExecutionStack(size_t max_depth = 0);

    void push(NodeId id);

    /**
     * @brief Pop the top entry.
     * @param id The node expected on top.
     * @throw EngineError with `InvalidState` if the stack is empty or `id` is
     *        not on top.
     */
    void pop(NodeId id);

    bool empty() const noexcept
    {
        return m_frames.empty();
    }

    size_t depth() const noexcept
    {
        return m_frames.size();
    }

    size_t max_depth() const noexcept
    {
        return m_max_depth;
    }

    /**
     * @brief The node reads are currently attributed to, if any.
     */
    std::optional<NodeId> top() const noexcept
    {
        if (m_frames.empty())
        {
            return std::nullopt;
        }
        return m_frames.back();
    }

    bool contains(NodeId id) const noexcept;

    /**
     * @brief The entries from bottom to top.
     */
    const std::vector<NodeId>& frames() const noexcept
    {
        return m_frames;
    }

private:
    size_t m_max_depth;
    std::vector<NodeId> m_frames;
};

/**
 * @brief Scoped entry on an ExecutionStack.
 *
 * @details
 * Pushes on construction and pops on destruction, so the entry is removed
 * on every exit path of the evaluation, including exceptions thrown by the
 * computation or the equality predicate.
 */
class ExecutionFrame
{
public:
    ExecutionFrame(ExecutionStack& stack, NodeId id);
    ~ExecutionFrame();

    ExecutionFrame(const ExecutionFrame&) = delete;
    ExecutionFrame& operator=(const ExecutionFrame&) = delete;
    ExecutionFrame(ExecutionFrame&&) = delete;
    ExecutionFrame& operator=(ExecutionFrame&&) = delete;

private:
    ExecutionStack& m_stack;
    NodeId m_id;
};

} // namespace incrgraph
