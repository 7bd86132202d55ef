/**
 * @file dependency_registry.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"

#include <set>

namespace incrgraph
{

/**
 * @brief The set of edges "derived node X read node Y", keyed by node identity.
 *
 * @details
 * `DependencyRegistry` records, for each derived node, the nodes it read
 * during its most recent evaluation (forward edges), and maintains the
 * reverse index from each node to the derived nodes that read it
 * (dependents), which is what propagation walks.
 *
 * @par Edge semantics
 * - The source of an edge is always a derived node; the target may be either kind.
 * - Edges are deduplicated: reading the same node twice in one evaluation
 *   records one edge. `add_dependency()` reports whether the edge was new.
 * - Forward edges keep first-read order. Dependents are reported in
 *   ascending id order, which is also creation order.
 * - `clear_dependencies_of()` discards every edge whose source is the node;
 *   the engine calls it at the start of each evaluation so dependency sets
 *   follow the most recent evaluation only.
 *
 * @par Ownership
 * Only identities are stored, never node references, so the registry does
 * not participate in node lifetime.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class DependencyRegistry
{
public:
    /**
     * @brief Record that `from` read `to`.
     * @return True if the edge was new, false if it was already recorded.
     * @throw std::invalid_argument if `from == to`.
     */
    bool add_dependency(NodeId from, NodeId to);

    /**
     * @brief Discard every edge whose source is `from`.
     * @return The number of edges removed.
     */
    size_t clear_dependencies_of(NodeId from);

    /**
     * @brief Remove every edge where `id` is source or target.
     * @return The former dependents of `id`, in ascending order.
     */
    std::vector<NodeId> remove_node(NodeId id);

    /**
     * @brief Nodes read by `from` during its most recent evaluation, in first-read order.
     */
    std::vector<NodeId> dependencies_of(NodeId from) const;

    /**
     * @brief Derived nodes that read `to`, in ascending order.
     */
    std::vector<NodeId> dependents_of(NodeId to) const;

    bool has_dependency(NodeId from, NodeId to) const;

    /**
     * @brief Total number of edges.
     */
    size_t edge_count() const noexcept
    {
        return m_edge_count;
    }

    /**
     * @brief Visit the dependents of `to` in ascending order, without copying.
     */
    template <typename Fn>
    void for_each_dependent(NodeId to, Fn&& fn) const
    {
        auto it = m_reverse.find(to);
        if (it == m_reverse.end())
        {
            return;
        }
        for (NodeId from : it->second)
        {
            fn(from);
        }
    }

private:
    /// Forward edges: derived node -> nodes it read, in first-read order.
    std::unordered_map<NodeId, std::vector<NodeId>> m_forward;

    /// Reverse index: node -> derived nodes that read it.
    std::unordered_map<NodeId, std::set<NodeId>> m_reverse;

    size_t m_edge_count = 0;

    void erase_reverse(NodeId to, NodeId from);
};

} // namespace incrgraph
