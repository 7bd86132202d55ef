/**
 * @file handles.hpp
 * @brief Typed node handles, NodeOptions and Subscription.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"

namespace incrgraph
{

class Engine;
class NodeStore;

namespace detail
{

template <typename T>
struct identity
{
    using type = T;
};

/**
 * @brief Blocks template argument deduction for a parameter.
 */
template <typename T>
using identity_t = typename identity<T>::type;

template <typename T, typename = void>
struct is_equality_comparable : std::false_type
{
};

template <typename T>
struct is_equality_comparable<
    T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type
{
};

/**
 * @brief Default node equality: `operator==` when available, otherwise never equal.
 */
template <typename T>
bool default_equals(const T& a, const T& b)
{
    if constexpr (is_equality_comparable<T>::value)
    {
        return static_cast<bool>(a == b);
    }
    else
    {
        return false;
    }
}

} // namespace detail

/**
 * @brief Untyped reference to a node of an Engine.
 *
 * @details
 * A handle is a plain value holding the node identity. It does not own the
 * node and stays copyable after the node is disposed; using it afterwards
 * makes the engine throw `EngineError` with `UnknownNode`.
 * A default-constructed handle holds `invalid_node_id`.
 */
class NodeHandle
{
public:
    NodeHandle() = default;

    NodeId id() const noexcept
    {
        return m_id;
    }

    NodeKind kind() const noexcept
    {
        return m_kind;
    }

    bool valid() const noexcept
    {
        return m_id != invalid_node_id;
    }

    friend bool operator==(const NodeHandle& a, const NodeHandle& b) noexcept
    {
        return a.m_id == b.m_id;
    }

    friend bool operator!=(const NodeHandle& a, const NodeHandle& b) noexcept
    {
        return a.m_id != b.m_id;
    }

protected:
    NodeHandle(NodeId id, NodeKind kind) noexcept
        : m_id(id)
        , m_kind(kind)
    {
    }

private:
    NodeId m_id{invalid_node_id};
    NodeKind m_kind{NodeKind::Source};
};

/**
 * @brief Handle to a source node holding a `T`.
 */
template <typename T>
class Source : public NodeHandle
{
public:
    using value_type = T;

    Source() = default;

private:
    friend class Engine;

    explicit Source(NodeId id) noexcept
        : NodeHandle(id, NodeKind::Source)
    {
    }
};

/**
 * @brief Handle to a derived node computing a `T`.
 */
template <typename T>
class Derived : public NodeHandle
{
public:
    using value_type = T;

    Derived() = default;

private:
    friend class Engine;

    explicit Derived(NodeId id) noexcept
        : NodeHandle(id, NodeKind::Derived)
    {
    }
};

/**
 * @brief Options recognized when creating a node.
 *
 * @details
 * - `equals` decides whether a new value is a semantic change. When empty,
 *   `operator==` is used if `T` has one; otherwise values never compare equal.
 * - `label` is used only in diagnostics and traces.
 */
template <typename T>
struct NodeOptions
{
    using Equals = std::function<bool(const T&, const T&)>;

    NodeOptions() = default;

    explicit NodeOptions(std::string label_)
        : label(std::move(label_))
    {
    }

    explicit NodeOptions(Equals equals_)
        : equals(std::move(equals_))
    {
    }

    NodeOptions(std::string label_, Equals equals_)
        : equals(std::move(equals_))
        , label(std::move(label_))
    {
    }

    Equals equals{};
    std::optional<std::string> label{};
};

/**
 * @brief One observer registration, returned by `Engine::subscribe()`.
 *
 * @details
 * `unsubscribe()` removes exactly this registration; other registrations of
 * the same callable on the same node stay active. It is idempotent and safe
 * to call after the node was disposed or the engine destroyed.
 * Destroying a Subscription does not unsubscribe.
 */
class Subscription
{
public:
    Subscription() = default;

    void unsubscribe();

    /**
     * @brief Same as `unsubscribe()`.
     */
    void operator()()
    {
        unsubscribe();
    }

    /**
     * @brief Check whether the registration is still in place.
     */
    bool active() const;

    NodeId node() const noexcept
    {
        return m_node;
    }

    SlotId slot() const noexcept
    {
        return m_slot;
    }

private:
    friend class Engine;

    Subscription(std::weak_ptr<NodeStore> store, NodeId node, SlotId slot)
        : m_store(std::move(store))
        , m_node(node)
        , m_slot(slot)
    {
    }

    std::weak_ptr<NodeStore> m_store{};
    NodeId m_node{invalid_node_id};
    SlotId m_slot{0};
};

} // namespace incrgraph
