/**
 * @file node_store.cpp
 */
#include "incrgraph/common/node_store.hpp"

#include <algorithm>

namespace incrgraph
{

NodeRecord& NodeStore::create_source(ValueBox initial,
                                     EqualityFn equals,
                                     std::optional<std::string> label)
{
    if (!equals)
    {
        throw std::invalid_argument("NodeStore::create_source: empty equality predicate");
    }
    if (!initial.has_value())
    {
        throw std::invalid_argument("NodeStore::create_source: empty initial value");
    }

    NodeRecord record;
    record.id = m_next_id;
    record.label = std::move(label);
    record.equals = std::move(equals);
    record.body = SourceBody{std::move(initial)};
    return insert(std::move(record));
}

NodeRecord& NodeStore::create_derived(ComputeFn compute,
                                      EqualityFn equals,
                                      std::optional<std::string> label)
{
    if (!compute)
    {
        throw std::invalid_argument("NodeStore::create_derived: empty computation");
    }
    if (!equals)
    {
        throw std::invalid_argument("NodeStore::create_derived: empty equality predicate");
    }

    NodeRecord record;
    record.id = m_next_id;
    record.label = std::move(label);
    record.equals = std::move(equals);
    record.body = DerivedBody{std::move(compute), ValueBox{}, true, false};
    return insert(std::move(record));
}

NodeRecord& NodeStore::insert(NodeRecord record)
{
    NodeId id = record.id;
    auto owned = std::make_unique<NodeRecord>(std::move(record));
    NodeRecord& ref = *owned;
    m_nodes.emplace(id, std::move(owned));
    ++m_next_id;
    return ref;
}

NodeRecord& NodeStore::at(NodeId id)
{
    NodeRecord* record = find(id);
    if (!record)
    {
        throw EngineError(
            EngineErrorCode::UnknownNode,
            "Node " + std::to_string(id) + " does not exist");
    }
    return *record;
}

const NodeRecord& NodeStore::at(NodeId id) const
{
    const NodeRecord* record = find(id);
    if (!record)
    {
        throw EngineError(
            EngineErrorCode::UnknownNode,
            "Node " + std::to_string(id) + " does not exist");
    }
    return *record;
}

NodeRecord* NodeStore::find(NodeId id) noexcept
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : it->second.get();
}

const NodeRecord* NodeStore::find(NodeId id) const noexcept
{
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : it->second.get();
}

bool NodeStore::erase(NodeId id)
{
    return m_nodes.erase(id) > 0;
}

std::vector<NodeId> NodeStore::ids() const
{
    std::vector<NodeId> result;
    result.reserve(m_nodes.size());
    for (const auto& [id, record] : m_nodes)
    {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace incrgraph
