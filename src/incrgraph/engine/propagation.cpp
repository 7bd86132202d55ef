/**
 * @file propagation.cpp
 */
#include "incrgraph/engine/propagation.hpp"

namespace incrgraph
{

Propagator::Propagator(const DependencyRegistry& registry, NodeStore& store)
    : m_registry(registry)
    , m_store(store)
{
}

PropagationResult Propagator::propagate(NodeId origin)
{
    PropagationResult result;
    result.origin = origin;

    std::unordered_set<NodeId> visited;
    std::vector<NodeId> worklist;
    std::vector<NodeId> children;
    worklist.push_back(origin);

    // Iterative DFS; a node is visited when popped, which yields pre-order.
    while (!worklist.empty())
    {
        NodeId current = worklist.back();
        worklist.pop_back();

        if (!visited.insert(current).second)
        {
            continue;
        }
        result.visited.push_back(current);

        if (current != origin)
        {
            NodeRecord* record = m_store.find(current);
            DerivedBody* derived = record ? record->as_derived() : nullptr;
            if (derived && !derived->dirty)
            {
                derived->dirty = true;
                ++result.newly_dirtied;
            }
        }

        // Push in reverse so the smallest id is visited first.
        children.clear();
        m_registry.for_each_dependent(current, [&](NodeId dependent) {
            if (visited.count(dependent) == 0)
            {
                children.push_back(dependent);
            }
        });
        worklist.insert(worklist.end(), children.rbegin(), children.rend());
    }

    return result;
}

} // namespace incrgraph
