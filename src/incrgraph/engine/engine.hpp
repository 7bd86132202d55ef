/**
 * @file engine.hpp
 * @brief Engine, the incremental computation graph.
 * @see engine.inline.hpp for the typed node operations.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/dependency_registry.hpp"
#include "incrgraph/common/engine_enums.hpp"
#include "incrgraph/common/engine_exceptions.hpp"
#include "incrgraph/common/execution_stack.hpp"
#include "incrgraph/common/node_store.hpp"
#include "incrgraph/common/value_box.hpp"
#include "incrgraph/engine/engine_config.hpp"
#include "incrgraph/engine/engine_observer.hpp"
#include "incrgraph/engine/engine_stats.hpp"
#include "incrgraph/engine/handles.hpp"
#include "incrgraph/engine/propagation.hpp"

namespace incrgraph
{

/**
 * @brief An incremental computation graph of source and derived nodes.
 *
 * @details
 * Source nodes hold values written by the host code. Derived nodes hold a
 * computation; its result is cached and recomputed only when a node it read
 * during its last evaluation has changed. Dependencies are discovered
 * automatically: every read performed inside a computation is attributed to
 * the derived node being evaluated.
 *
 * @par Operations
 * - `create_source()` / `create_derived()`: add nodes. A derived node is
 *   evaluated once before its handle is returned.
 * - `read()`: get the current value, evaluating a derived node if it is
 *   dirty or was never evaluated.
 * - `write()` / `update()`: change a source node. An equal value (per the
 *   node's predicate) is ignored. Otherwise every transitive dependent is
 *   marked dirty and the observers of the source and of each dependent are
 *   invoked once, in visit order.
 * - `subscribe()`: register an observer callback on any node.
 * - `dispose()`: remove a node together with its edges and observers.
 *
 * @par Laziness
 * Notification does not recompute. An observer firing means something
 * upstream changed; the new value is computed by the next `read()`.
 *
 * @par Errors
 * Exceptions from computations and equality predicates propagate to the
 * caller of the triggering read. The evaluation's stack entry is always
 * removed and the node stays dirty, so the next read retries the computation.
 * Engine misuse is reported with `EngineError`.
 *
 * @par Reentrancy
 * A computation that causes its own node to be evaluated again (directly,
 * through a cycle, or through a write that leads back to it) is a caller
 * error; the engine throws `EngineError` with `ReentrantEvaluation`.
 * Writes from inside a computation are otherwise not guarded against.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - All operations on one engine must run sequentially.
 */
class Engine
{
public:
    explicit Engine(EngineConfig config = {});

    Engine(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine& operator=(Engine&&) = delete;

    // -------------------------------------------------------------------------
    // Typed node operations (engine.inline.hpp)
    // -------------------------------------------------------------------------

    /**
     * @brief Create a source node.
     * @param initial The initial value.
     * @param options Equality predicate and label.
     */
    template <typename T>
    Source<T> create_source(T initial, NodeOptions<detail::identity_t<T>> options = {});

    /**
     * @brief Create a derived node and evaluate it once.
     * @param computation Zero-argument callable producing the node value.
     * @param options Equality predicate and label.
     * @return Handle to a node that already holds a cached value and its
     *         first dependency set.
     * @note If the first evaluation throws, the node is removed and the
     *       exception propagates.
     */
    template <typename F, typename T = std::decay_t<std::invoke_result_t<F&>>>
    Derived<T> create_derived(F computation, NodeOptions<T> options = {});

    template <typename T>
    T read(const Source<T>& node);

    template <typename T>
    T read(const Derived<T>& node);

    /**
     * @brief Write a source node.
     * @note No effect if `value` compares equal to the current value.
     */
    template <typename T>
    void write(const Source<T>& node, detail::identity_t<T> value);

    /**
     * @brief Read, transform and write back a source node.
     * @note Not atomic with respect to writes performed by `transform`.
     */
    template <typename T, typename F>
    void update(const Source<T>& node, F&& transform);

    // -------------------------------------------------------------------------
    // Observation and disposal
    // -------------------------------------------------------------------------

    /**
     * @brief Register a callback invoked whenever a change reaches `node`.
     * @return The registration; call `unsubscribe()` on it to remove it.
     * @throw EngineError with `UnknownNode` if the node does not exist.
     * @throw std::invalid_argument if `callback` is empty.
     */
    Subscription subscribe(const NodeHandle& node, std::function<void()> callback);

    /**
     * @brief Remove a node, its edges and its observers.
     *
     * @details
     * Derived nodes that read `node` during their last evaluation, and all of
     * their transitive dependents, are marked dirty and their observers are
     * notified once, as after a write. A dependent that still reads `node`
     * when re-evaluated throws `EngineError` with `UnknownNode`.
     *
     * @throw EngineError with `UnknownNode` if the node does not exist, or
     *        `InvalidState` if the node is currently being evaluated.
     */
    void dispose(const NodeHandle& node);

    // -------------------------------------------------------------------------
    // Type-erased node operations
    // -------------------------------------------------------------------------

    NodeId create_source_node(ValueBox initial,
                              EqualityFn equals,
                              std::optional<std::string> label = std::nullopt);

    NodeId create_derived_node(ComputeFn compute,
                               EqualityFn equals,
                               std::optional<std::string> label = std::nullopt);

    /**
     * @brief Read a node by id.
     * @return Reference to the node's current (source) or cached (derived)
     *         value. Valid until the next engine operation.
     */
    const ValueBox& read_value(NodeId id);

    /**
     * @brief Write a source node by id.
     * @throw EngineError with `NodeKindMismatch` if the node is derived.
     * @throw ValueTypeError if `value` holds a different type than the node.
     */
    void write_value(NodeId id, ValueBox value);

    void dispose_node(NodeId id);

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    size_t node_count() const noexcept
    {
        return m_store->size();
    }

    bool contains(NodeId id) const noexcept
    {
        return m_store->contains(id);
    }

    NodeKind kind(NodeId id) const;

    const std::optional<std::string>& label(NodeId id) const;

    /**
     * @brief Diagnostic name of a node: `label#id` or `#id`.
     */
    std::string name(NodeId id) const;

    /**
     * @brief Whether a derived node is dirty. Source nodes are never dirty.
     */
    bool is_dirty(NodeId id) const;

    /**
     * @throw EngineError with `NodeKindMismatch` for source nodes.
     */
    DerivedState derived_state(NodeId id) const;

    size_t observer_count(NodeId id) const;

    std::vector<NodeId> dependencies_of(NodeId id) const
    {
        return m_registry.dependencies_of(id);
    }

    std::vector<NodeId> dependents_of(NodeId id) const
    {
        return m_registry.dependents_of(id);
    }

    size_t edge_count() const noexcept
    {
        return m_registry.edge_count();
    }

    /**
     * @brief Number of derived nodes currently evaluating.
     */
    size_t evaluation_depth() const noexcept
    {
        return m_stack.depth();
    }

    const EngineStats& stats() const noexcept
    {
        return m_stats;
    }

    void reset_stats() noexcept
    {
        m_stats = EngineStats{};
    }

    const EngineConfig& config() const noexcept
    {
        return m_config;
    }

    void add_observer(IEngineObserver::ptr observer);

    void remove_observer(const IEngineObserver::ptr& observer);

private:
    /// Attribute a read of `id` to the node on top of the execution stack.
    void track_read(NodeId id);

    /// Run the evaluation protocol of a derived node.
    void evaluate(NodeRecord& record, DerivedBody& derived);

    /// Invoke the observers of each node, in order.
    void dispatch_notifications(const std::vector<NodeId>& nodes);

    template <typename Fn>
    void for_each_observer(Fn&& fn)
    {
        for (const auto& observer : m_observers)
        {
            fn(*observer);
        }
    }

    EngineConfig m_config;

    /// Shared so that Subscription can outlive the engine safely.
    std::shared_ptr<NodeStore> m_store;

    DependencyRegistry m_registry;
    ExecutionStack m_stack;
    Propagator m_propagator;
    std::vector<IEngineObserver::ptr> m_observers;
    EngineStats m_stats;
};

/**
 * @brief Factory function to create an Engine.
 * @param config Configuration options.
 * @return Shared pointer to the engine.
 */
inline std::shared_ptr<Engine> make_engine(EngineConfig config = {})
{
    return std::make_shared<Engine>(std::move(config));
}

} // namespace incrgraph
