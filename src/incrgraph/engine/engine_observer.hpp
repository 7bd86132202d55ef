/**
 * @file engine_observer.hpp
 * @brief IEngineObserver lifecycle hooks.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/node_store.hpp"
#include "incrgraph/engine/propagation.hpp"

namespace incrgraph
{

/**
 * @brief Receives lifecycle events from an Engine.
 *
 * @details
 * All hooks have empty default implementations; override the ones of
 * interest. Hooks are called synchronously on the thread running the engine
 * operation. The `NodeRecord` passed in is only valid for the duration of
 * the call.
 *
 * Exceptions thrown by a hook propagate to the caller of the engine
 * operation that raised the event.
 *
 * @par Reentrancy
 * Hooks must not call back into the engine.
 */
class IEngineObserver
{
public:
    using ptr = std::shared_ptr<IEngineObserver>;

    virtual ~IEngineObserver() = default;

    /// A node was added to the store. Derived nodes have not been evaluated yet.
    virtual void on_node_created(const NodeRecord& node) {}

    /// A derived node is about to run its computation.
    virtual void on_before_evaluation(const NodeRecord& node) {}

    /// A derived node completed an evaluation.
    /// `value_changed` is false when the equality predicate kept the old cached value.
    virtual void on_after_evaluation(const NodeRecord& node, bool value_changed) {}

    /// A derived node's computation or equality predicate threw.
    virtual void on_evaluation_failed(const NodeRecord& node, std::exception_ptr error) {}

    /// A source node received a new value.
    virtual void on_write(const NodeRecord& node) {}

    /// A write was discarded because the predicate reported the value equal.
    virtual void on_write_skipped(const NodeRecord& node) {}

    /// A propagation pass finished; notifications follow.
    virtual void on_propagation(const PropagationResult& result) {}

    /// Observers of `node` are about to be invoked.
    virtual void on_notify(const NodeRecord& node, size_t observer_count) {}

    /// A node is about to be removed.
    virtual void on_dispose(const NodeRecord& node) {}
};

} // namespace incrgraph
