/**
 * @file propagation.hpp
 * @brief Propagator marks the transitive dependents of a changed node dirty.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/dependency_registry.hpp"
#include "incrgraph/common/node_store.hpp"

namespace incrgraph
{

/**
 * @brief Outcome of one propagation pass.
 */
struct PropagationResult
{
    /**
     * @brief The node whose change started the pass.
     */
    NodeId origin{invalid_node_id};

    /**
     * @brief Every node reached, each exactly once, in visit order.
     * @details The origin is first, followed by its direct and indirect
     *          dependents in depth-first pre-order. Dependents of one node
     *          are taken in ascending id (creation) order, not in the order
     *          their edges were recorded.
     */
    std::vector<NodeId> visited;

    /**
     * @brief Number of derived nodes whose dirty flag went from clear to set.
     */
    size_t newly_dirtied{0};
};

/**
 * @brief Walks the dependency registry backwards from a changed node.
 *
 * @details
 * `propagate()` visits the origin, then every derived node that read it,
 * transitively. Each reached node is visited, marked dirty and recorded
 * exactly once, even when several paths lead to it (diamond topologies).
 * The walk uses an explicit worklist and an owned visited set, so graph
 * depth is not limited by the call stack.
 *
 * Propagation only marks nodes dirty. It never recomputes values and never
 * invokes observers; the caller dispatches notifications for
 * `PropagationResult::visited` afterwards.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class Propagator
{
public:
    Propagator(const DependencyRegistry& registry, NodeStore& store);

    /**
     * @brief Mark all transitive dependents of `origin` dirty.
     * @param origin The node whose value just changed. The origin itself is
     *        visited but not marked dirty.
     * @return The visit order and dirtying count.
     */
    PropagationResult propagate(NodeId origin);

private:
    const DependencyRegistry& m_registry;
    NodeStore& m_store;
};

} // namespace incrgraph
