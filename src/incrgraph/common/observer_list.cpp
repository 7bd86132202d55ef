/**
 * @file observer_list.cpp
 */
#include "incrgraph/common/observer_list.hpp"

namespace incrgraph
{

SlotId ObserverList::add(Callback callback)
{
    if (!callback)
    {
        throw std::invalid_argument("ObserverList::add: empty callback");
    }

    SlotId slot = m_next_slot++;
    auto it = m_entries.insert(m_entries.end(), Entry{slot, std::move(callback)});
    m_index.emplace(slot, it);
    return slot;
}

bool ObserverList::remove(SlotId slot)
{
    auto found = m_index.find(slot);
    if (found == m_index.end())
    {
        return false;
    }
    m_entries.erase(found->second);
    m_index.erase(found);
    return true;
}

bool ObserverList::invoke(SlotId slot) const
{
    auto found = m_index.find(slot);
    if (found == m_index.end())
    {
        return false;
    }

    // Copy first: the callback may remove itself or destroy this list.
    Callback callback = found->second->callback;
    callback();
    return true;
}

std::vector<SlotId> ObserverList::slots() const
{
    std::vector<SlotId> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        result.push_back(entry.slot);
    }
    return result;
}

} // namespace incrgraph
