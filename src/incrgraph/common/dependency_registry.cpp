/**
 * @file dependency_registry.cpp
 */
#include "incrgraph/common/dependency_registry.hpp"

#include <algorithm>

namespace incrgraph
{

bool DependencyRegistry::add_dependency(NodeId from, NodeId to)
{
    if (from == to)
    {
        throw std::invalid_argument(
            "DependencyRegistry::add_dependency: node " + std::to_string(from) +
            " cannot depend on itself");
    }

    bool inserted = m_reverse[to].insert(from).second;
    if (!inserted)
    {
        return false;
    }

    m_forward[from].push_back(to);
    ++m_edge_count;
    return true;
}

size_t DependencyRegistry::clear_dependencies_of(NodeId from)
{
    auto it = m_forward.find(from);
    if (it == m_forward.end())
    {
        return 0;
    }

    size_t removed = it->second.size();
    for (NodeId to : it->second)
    {
        erase_reverse(to, from);
    }
    m_forward.erase(it);
    m_edge_count -= removed;
    return removed;
}

std::vector<NodeId> DependencyRegistry::remove_node(NodeId id)
{
    // Outgoing edges
    clear_dependencies_of(id);

    // Incoming edges: drop `id` from each dependent's forward list
    std::vector<NodeId> former_dependents;
    auto it = m_reverse.find(id);
    if (it == m_reverse.end())
    {
        return former_dependents;
    }

    former_dependents.assign(it->second.begin(), it->second.end());
    m_reverse.erase(it);

    for (NodeId from : former_dependents)
    {
        auto fwd = m_forward.find(from);
        if (fwd == m_forward.end())
        {
            continue;
        }
        auto& targets = fwd->second;
        auto pos = std::find(targets.begin(), targets.end(), id);
        if (pos != targets.end())
        {
            targets.erase(pos);
            --m_edge_count;
        }
        if (targets.empty())
        {
            m_forward.erase(fwd);
        }
    }

    return former_dependents;
}

std::vector<NodeId> DependencyRegistry::dependencies_of(NodeId from) const
{
    auto it = m_forward.find(from);
    if (it == m_forward.end())
    {
        return {};
    }
    return it->second;
}

std::vector<NodeId> DependencyRegistry::dependents_of(NodeId to) const
{
    std::vector<NodeId> result;
    for_each_dependent(to, [&result](NodeId from) { result.push_back(from); });
    return result;
}

bool DependencyRegistry::has_dependency(NodeId from, NodeId to) const
{
    auto it = m_reverse.find(to);
    return it != m_reverse.end() && it->second.count(from) > 0;
}

void DependencyRegistry::erase_reverse(NodeId to, NodeId from)
{
    auto it = m_reverse.find(to);
    if (it == m_reverse.end())
    {
        return;
    }
    it->second.erase(from);
    if (it->second.empty())
    {
        m_reverse.erase(it);
    }
}

} // namespace incrgraph
