/**
 * @file engine_enums.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"

namespace incrgraph
{

// ============================================================================
// Identity type aliases
// ============================================================================

/**
 * @brief Type alias for node identities.
 *
 * @details
 * `NodeId` identifies a node within one `Engine`. Identities are allocated
 * sequentially starting at 1 and are never reused, even after disposal.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using NodeId = std::uint64_t;

/**
 * @brief Sentinel value that never identifies a node.
 */
inline constexpr NodeId invalid_node_id = 0;

/**
 * @brief Type alias for observer registration slots.
 *
 * @details
 * `SlotId` identifies one registration in an `ObserverList`. Registering the
 * same callable twice yields two distinct slots.
 */
using SlotId = std::uint64_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief The two node variants.
 *
 * @details
 * A `Source` node holds a value that is written directly by the host code.
 * A `Derived` node holds a computation whose result is memoized and
 * recomputed on demand after an upstream change.
 */
enum class NodeKind
{
    Source,
    Derived
};

/**
 * @brief Evaluation state of a derived node.
 *
 * @details
 * - `Uninitialized`: never evaluated; no cached value.
 * - `Clean`: cached value valid.
 * - `Dirty`: cached value may be stale; recomputed on the next read.
 * - `Evaluating`: on the execution stack, mid-computation.
 *
 * Transitions: Uninitialized -> Evaluating -> Clean at construction;
 * Clean -> Dirty when propagation reaches the node; Dirty -> Evaluating ->
 * Clean on the next read. A failed evaluation returns the node to Dirty (or
 * Uninitialized if it never completed one).
 */
enum class DerivedState
{
    Uninitialized,
    Clean,
    Dirty,
    Evaluating
};

/**
 * @brief Get a printable name for a node kind.
 */
inline const char* to_string(NodeKind kind) noexcept
{
    switch (kind)
    {
    case NodeKind::Source:
        return "source";
    case NodeKind::Derived:
        return "derived";
    }
    return "unknown";
}

/**
 * @brief Get a printable name for a derived state.
 */
inline const char* to_string(DerivedState state) noexcept
{
    switch (state)
    {
    case DerivedState::Uninitialized:
        return "uninitialized";
    case DerivedState::Clean:
        return "clean";
    case DerivedState::Dirty:
        return "dirty";
    case DerivedState::Evaluating:
        return "evaluating";
    }
    return "unknown";
}

} // namespace incrgraph
