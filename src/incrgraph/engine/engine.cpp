/**
 * @file engine.cpp
 */
#include "incrgraph/engine/engine.hpp"

#include <algorithm>

namespace incrgraph
{

namespace
{

/// Holds DerivedBody::evaluating for the lifetime of one computation call.
class EvaluatingScope
{
public:
    explicit EvaluatingScope(DerivedBody& derived)
        : m_derived(derived)
    {
        m_derived.evaluating = true;
    }

    ~EvaluatingScope()
    {
        m_derived.evaluating = false;
    }

    EvaluatingScope(const EvaluatingScope&) = delete;
    EvaluatingScope& operator=(const EvaluatingScope&) = delete;

private:
    DerivedBody& m_derived;
};

} // namespace

// ============================================================================
// Constructor
// ============================================================================

Engine::Engine(EngineConfig config)
    : m_config{std::move(config)}
    , m_store{std::make_shared<NodeStore>()}
    , m_registry{}
    , m_stack{m_config.max_evaluation_depth}
    , m_propagator{m_registry, *m_store}
    , m_observers{}
    , m_stats{}
{
    for (auto& observer : m_config.observers)
    {
        add_observer(observer);
    }
}

// ============================================================================
// Node creation
// ============================================================================

NodeId Engine::create_source_node(ValueBox initial,
                                  EqualityFn equals,
                                  std::optional<std::string> label)
{
    NodeRecord& record = m_store->create_source(std::move(initial), std::move(equals), std::move(label));
    if (m_config.collect_stats)
    {
        ++m_stats.nodes_created;
    }
    for_each_observer([&](IEngineObserver& o) { o.on_node_created(record); });
    return record.id;
}

NodeId Engine::create_derived_node(ComputeFn compute,
                                   EqualityFn equals,
                                   std::optional<std::string> label)
{
    NodeRecord& record = m_store->create_derived(std::move(compute), std::move(equals), std::move(label));
    NodeId id = record.id;
    for_each_observer([&](IEngineObserver& o) { o.on_node_created(record); });

    try
    {
        evaluate(record, std::get<DerivedBody>(record.body));
    }
    catch (...)
    {
        // No handle escapes, so the half-built node is removed again.
        for_each_observer([&](IEngineObserver& o) { o.on_dispose(record); });
        m_registry.remove_node(id);
        m_store->erase(id);
        throw;
    }

    if (m_config.collect_stats)
    {
        ++m_stats.nodes_created;
    }
    return id;
}

// ============================================================================
// Read and evaluation
// ============================================================================

const ValueBox& Engine::read_value(NodeId id)
{
    NodeRecord& record = m_store->at(id);

    if (SourceBody* source = record.as_source())
    {
        track_read(id);
        return source->value;
    }

    DerivedBody& derived = std::get<DerivedBody>(record.body);
    if (derived.evaluating)
    {
        throw EngineError(
            EngineErrorCode::ReentrantEvaluation,
            "Node " + record.name() + " was read while it is being evaluated");
    }

    track_read(id);

    if (!derived.cached.has_value() || derived.dirty)
    {
        evaluate(record, derived);
    }
    else if (m_config.collect_stats)
    {
        ++m_stats.cache_hits;
    }

    return derived.cached;
}

void Engine::track_read(NodeId id)
{
    if (auto reader = m_stack.top())
    {
        m_registry.add_dependency(*reader, id);
    }
}

void Engine::evaluate(NodeRecord& record, DerivedBody& derived)
{
    for_each_observer([&](IEngineObserver& o) { o.on_before_evaluation(record); });

    bool value_changed = false;
    try
    {
        ValueBox next;
        {
            ExecutionFrame frame(m_stack, record.id);
            m_registry.clear_dependencies_of(record.id);
            EvaluatingScope scope(derived);
            next = derived.compute();
        }

        value_changed = !derived.cached.has_value() || !record.equals(derived.cached, next);
        derived.dirty = false;
        if (value_changed)
        {
            derived.cached = std::move(next);
        }
    }
    catch (...)
    {
        if (m_config.collect_stats)
        {
            ++m_stats.evaluation_failures;
        }
        std::exception_ptr error = std::current_exception();
        for_each_observer([&](IEngineObserver& o) { o.on_evaluation_failed(record, error); });
        throw;
    }

    if (m_config.collect_stats)
    {
        ++m_stats.evaluations;
        if (!value_changed)
        {
            ++m_stats.unchanged_results;
        }
    }
    for_each_observer([&](IEngineObserver& o) { o.on_after_evaluation(record, value_changed); });
}

// ============================================================================
// Write, propagation and notification
// ============================================================================

void Engine::write_value(NodeId id, ValueBox value)
{
    NodeRecord& record = m_store->at(id);
    SourceBody* source = record.as_source();
    if (!source)
    {
        throw EngineError(
            EngineErrorCode::NodeKindMismatch,
            "Node " + record.name() + " is a derived node and cannot be written");
    }
    if (value.type() != source->value.type())
    {
        throw ValueTypeError(
            "Cannot write a value of type " + std::string{value.type().name()} +
            " to node " + record.name() + " holding " + std::string{source->value.type().name()});
    }

    if (m_config.collect_stats)
    {
        ++m_stats.writes;
    }

    if (record.equals(source->value, value))
    {
        if (m_config.collect_stats)
        {
            ++m_stats.writes_skipped;
        }
        for_each_observer([&](IEngineObserver& o) { o.on_write_skipped(record); });
        return;
    }

    source->value = std::move(value);
    for_each_observer([&](IEngineObserver& o) { o.on_write(record); });

    PropagationResult result = m_propagator.propagate(id);
    if (m_config.collect_stats)
    {
        ++m_stats.propagations;
        m_stats.nodes_dirtied += result.newly_dirtied;
    }
    for_each_observer([&](IEngineObserver& o) { o.on_propagation(result); });

    dispatch_notifications(result.visited);
}

void Engine::dispatch_notifications(const std::vector<NodeId>& nodes)
{
    for (NodeId id : nodes)
    {
        const NodeRecord* record = m_store->find(id);
        if (!record || record->observers.empty())
        {
            continue;
        }

        std::vector<SlotId> slots = record->observers.slots();
        for_each_observer([&](IEngineObserver& o) { o.on_notify(*record, slots.size()); });

        for (SlotId slot : slots)
        {
            // A callback may dispose the node; look it up again each time.
            record = m_store->find(id);
            if (!record)
            {
                break;
            }
            if (record->observers.invoke(slot) && m_config.collect_stats)
            {
                ++m_stats.notifications;
            }
        }
    }
}

// ============================================================================
// Observation and disposal
// ============================================================================

Subscription Engine::subscribe(const NodeHandle& node, std::function<void()> callback)
{
    NodeRecord& record = m_store->at(node.id());
    SlotId slot = record.observers.add(std::move(callback));
    return Subscription{m_store, node.id(), slot};
}

void Subscription::unsubscribe()
{
    auto store = m_store.lock();
    if (!store)
    {
        return;
    }
    if (NodeRecord* record = store->find(m_node))
    {
        record->observers.remove(m_slot);
    }
    m_store.reset();
}

bool Subscription::active() const
{
    auto store = m_store.lock();
    if (!store)
    {
        return false;
    }
    const NodeRecord* record = store->find(m_node);
    return record && record->observers.contains(m_slot);
}

void Engine::dispose(const NodeHandle& node)
{
    dispose_node(node.id());
}

void Engine::dispose_node(NodeId id)
{
    NodeRecord& record = m_store->at(id);
    if (const DerivedBody* derived = record.as_derived(); derived && derived->evaluating)
    {
        throw EngineError(
            EngineErrorCode::InvalidState,
            "Cannot dispose node " + record.name() + " while it is being evaluated");
    }

    for_each_observer([&](IEngineObserver& o) { o.on_dispose(record); });

    std::vector<NodeId> former_dependents = m_registry.remove_node(id);
    m_store->erase(id);
    if (m_config.collect_stats)
    {
        ++m_stats.nodes_disposed;
    }

    // Everything downstream of the disposed node is stale now. Each former
    // dependent is dirtied and propagated from like a changed node; nodes
    // reachable from several of them are dirtied and notified once.
    std::vector<NodeId> reached;
    std::unordered_set<NodeId> seen;
    for (NodeId dependent : former_dependents)
    {
        if (seen.count(dependent) > 0)
        {
            continue;
        }

        NodeRecord* dep_record = m_store->find(dependent);
        DerivedBody* dep_derived = dep_record ? dep_record->as_derived() : nullptr;
        size_t dirtied = 0;
        if (dep_derived && !dep_derived->dirty)
        {
            dep_derived->dirty = true;
            ++dirtied;
        }

        PropagationResult result = m_propagator.propagate(dependent);
        dirtied += result.newly_dirtied;
        if (m_config.collect_stats)
        {
            m_stats.nodes_dirtied += dirtied;
        }
        for_each_observer([&](IEngineObserver& o) { o.on_propagation(result); });

        for (NodeId visited : result.visited)
        {
            if (seen.insert(visited).second)
            {
                reached.push_back(visited);
            }
        }
    }

    dispatch_notifications(reached);
}

// ============================================================================
// Inspection
// ============================================================================

NodeKind Engine::kind(NodeId id) const
{
    return m_store->at(id).kind();
}

const std::optional<std::string>& Engine::label(NodeId id) const
{
    return m_store->at(id).label;
}

std::string Engine::name(NodeId id) const
{
    return m_store->at(id).name();
}

bool Engine::is_dirty(NodeId id) const
{
    const DerivedBody* derived = m_store->at(id).as_derived();
    return derived && derived->dirty;
}

DerivedState Engine::derived_state(NodeId id) const
{
    const NodeRecord& record = m_store->at(id);
    const DerivedBody* derived = record.as_derived();
    if (!derived)
    {
        throw EngineError(
            EngineErrorCode::NodeKindMismatch,
            "Node " + record.name() + " is a source node and has no evaluation state");
    }
    if (derived->evaluating)
    {
        return DerivedState::Evaluating;
    }
    if (!derived->cached.has_value())
    {
        return DerivedState::Uninitialized;
    }
    return derived->dirty ? DerivedState::Dirty : DerivedState::Clean;
}

size_t Engine::observer_count(NodeId id) const
{
    return m_store->at(id).observers.size();
}

void Engine::add_observer(IEngineObserver::ptr observer)
{
    if (!observer)
    {
        throw std::invalid_argument("Engine::add_observer: null observer");
    }
    m_observers.push_back(std::move(observer));
}

void Engine::remove_observer(const IEngineObserver::ptr& observer)
{
    m_observers.erase(
        std::remove(m_observers.begin(), m_observers.end(), observer),
        m_observers.end());
}

} // namespace incrgraph
