/**
 * @file node_store.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"
#include "incrgraph/common/engine_exceptions.hpp"
#include "incrgraph/common/observer_list.hpp"
#include "incrgraph/common/value_box.hpp"

namespace incrgraph
{

/**
 * @brief Type-erased equality predicate over node values.
 */
using EqualityFn = std::function<bool(const ValueBox&, const ValueBox&)>;

/**
 * @brief Type-erased zero-argument computation of a derived node.
 */
using ComputeFn = std::function<ValueBox()>;

/**
 * @brief Payload of a source node.
 */
struct SourceBody
{
    ValueBox value;
};

/**
 * @brief Payload of a derived node.
 *
 * @details
 * `cached` is empty until the first completed evaluation. `dirty` starts
 * true and is cleared only by a completed evaluation. `evaluating` is true
 * while the node is on the execution stack.
 */
struct DerivedBody
{
    ComputeFn compute;
    ValueBox cached;
    bool dirty{true};
    bool evaluating{false};
};

/**
 * @brief One node of the graph: identity, metadata, observers and payload.
 *
 * @details
 * The payload is a closed two-case variant. Access sites use `std::visit`
 * or `std::get_if` and handle both cases.
 */
struct NodeRecord
{
    NodeId id{invalid_node_id};
    std::optional<std::string> label;
    EqualityFn equals;
    ObserverList observers;
    std::variant<SourceBody, DerivedBody> body;

    NodeKind kind() const noexcept
    {
        return std::holds_alternative<SourceBody>(body) ? NodeKind::Source : NodeKind::Derived;
    }

    /**
     * @brief Diagnostic name: `label#id` when labelled, otherwise `#id`.
     */
    std::string name() const
    {
        return label.value_or(std::string{}) + "#" + std::to_string(id);
    }

    SourceBody* as_source() noexcept
    {
        return std::get_if<SourceBody>(&body);
    }

    DerivedBody* as_derived() noexcept
    {
        return std::get_if<DerivedBody>(&body);
    }

    const DerivedBody* as_derived() const noexcept
    {
        return std::get_if<DerivedBody>(&body);
    }
};

/**
 * @brief Owns the nodes of one engine and allocates their identities.
 *
 * @details
 * Identities are allocated sequentially from 1 and never reused within one
 * store, including after `erase()`. Records are heap-allocated, so a
 * `NodeRecord&` stays valid while other nodes are created or erased; it is
 * invalidated only by erasing that node.
 *
 * @par Thread safety
 * - No internal synchronization.
 */
class NodeStore
{
public:
    NodeStore() = default;

    NodeStore(const NodeStore&) = delete;
    NodeStore& operator=(const NodeStore&) = delete;

    /**
     * @brief Create a source node.
     * @throw std::invalid_argument if `equals` is empty or `initial` holds no value.
     */
    NodeRecord& create_source(ValueBox initial,
                              EqualityFn equals,
                              std::optional<std::string> label);

    /**
     * @brief Create a derived node in the `Uninitialized` state.
     * @throw std::invalid_argument if `compute` or `equals` is empty.
     */
    NodeRecord& create_derived(ComputeFn compute,
                               EqualityFn equals,
                               std::optional<std::string> label);

    /**
     * @brief Look up a live node.
     * @throw EngineError with `UnknownNode` if the id does not refer to a live node.
     */
    NodeRecord& at(NodeId id);
    const NodeRecord& at(NodeId id) const;

    /**
     * @brief Look up a live node without throwing.
     * @return Pointer to the record, or nullptr.
     */
    NodeRecord* find(NodeId id) noexcept;
    const NodeRecord* find(NodeId id) const noexcept;

    bool contains(NodeId id) const noexcept
    {
        return m_nodes.count(id) > 0;
    }

    /**
     * @brief Remove a node.
     * @return True if the node existed.
     */
    bool erase(NodeId id);

    size_t size() const noexcept
    {
        return m_nodes.size();
    }

    /**
     * @brief The identity the next created node will receive.
     */
    NodeId next_id() const noexcept
    {
        return m_next_id;
    }

    /**
     * @brief Ids of all live nodes, in ascending order.
     */
    std::vector<NodeId> ids() const;

private:
    NodeRecord& insert(NodeRecord record);

    NodeId m_next_id{1};
    std::unordered_map<NodeId, std::unique_ptr<NodeRecord>> m_nodes;
};

} // namespace incrgraph
