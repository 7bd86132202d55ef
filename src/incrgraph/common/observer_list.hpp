/**
 * @file observer_list.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"

namespace incrgraph
{

/**
 * @brief Ordered collection of observer callbacks with stable registration slots.
 *
 * @details
 * Each call to `add()` creates a new registration and returns its `SlotId`.
 * Registrations are kept in insertion order. `remove(slot)` erases exactly
 * that registration in O(1) average time; other registrations of the same
 * callable are unaffected.
 *
 * @par Dispatch
 * Callers that dispatch to the observers take a snapshot with `slots()` and
 * then `invoke()` each slot in turn. A slot removed after the snapshot is
 * skipped; a slot added after the snapshot is not part of it. `invoke()`
 * copies the callback before calling it and does not touch the list after the
 * call returns, so a callback may remove its own registration or cause the
 * list to be destroyed.
 *
 * @par Thread safety
 * - No internal synchronization; not thread-safe.
 */
class ObserverList
{
public:
    using Callback = std::function<void()>;

    ObserverList() = default;

    ObserverList(const ObserverList&) = delete;
    ObserverList& operator=(const ObserverList&) = delete;
    ObserverList(ObserverList&&) = default;
    ObserverList& operator=(ObserverList&&) = default;

    /**
     * @brief Register a callback.
     * @param callback The callback to register. Must not be empty.
     * @return The slot of the new registration.
     * @throw std::invalid_argument if `callback` is empty.
     */
    SlotId add(Callback callback);

    /**
     * @brief Remove one registration.
     * @return True if the slot was registered, false if it was already removed.
     */
    bool remove(SlotId slot);

    /**
     * @brief Check whether a slot is currently registered.
     */
    bool contains(SlotId slot) const noexcept
    {
        return m_index.count(slot) > 0;
    }

    /**
     * @brief Invoke the callback registered under `slot`, if any.
     * @return True if a callback was invoked.
     */
    bool invoke(SlotId slot) const;

    /**
     * @brief Snapshot of the registered slots, in registration order.
     */
    std::vector<SlotId> slots() const;

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    void clear() noexcept
    {
        m_entries.clear();
        m_index.clear();
    }

private:
    struct Entry
    {
        SlotId slot;
        Callback callback;
    };

    SlotId m_next_slot{1};
    std::list<Entry> m_entries;
    std::unordered_map<SlotId, std::list<Entry>::iterator> m_index;
};

} // namespace incrgraph
