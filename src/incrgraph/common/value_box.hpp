/**
 * @file value_box.hpp
 * @brief Definition of ValueBox, the type-erased value held by graph nodes.
 * @see value_box.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "incrgraph/common/common.hpp"

namespace incrgraph
{

/**
 * @brief Thrown when a node value is read or written as the wrong type.
 *
 * @details
 * Raised by `ValueBox::as()` and by `Engine::write_value()` when the new
 * value's type differs from the type the source node was created with.
 */
class ValueTypeError : public std::runtime_error
{
public:
    explicit ValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Thrown when reading a box that holds no value, such as the cache of
 *        a derived node that has never completed an evaluation.
 */
class ValueEmptyError : public std::runtime_error
{
public:
    ValueEmptyError()
        : std::runtime_error("ValueBox is empty")
    {}
};

/**
 * @brief The value slot of a graph node, with its type erased.
 *
 * @details
 * The engine stores every node value as a ValueBox so that nodes of different
 * value types live in one store. A source node's box is replaced on each
 * accepted write. A derived node's box is its cache: it stays empty until the
 * first completed evaluation and is replaced only when the node's equality
 * predicate reports a changed result. Equality predicates and typed reads
 * unwrap the box with `as<T>()`, which checks the stored type.
 *
 * @par Invariants
 * - The stored type is `typeid(void)` exactly when the box is empty.
 *
 * @par Ownership
 * - Copies share the stored value. `set()` always allocates a fresh value, so
 *   a box handed out by `Engine::read_value()` is never changed behind the
 *   caller's back by a later write; the engine just points the node at new
 *   storage.
 */
class ValueBox
{
public:
    ValueBox() = default;

    /**
     * @brief Construct a box holding a copy (or move) of `value`.
     */
    template <typename T>
    [[nodiscard]] static ValueBox of(T&& value);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    /**
     * @brief Whether the box holds a `T` (after decay).
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Stored type, compared by `Engine::write_value()` against the node's.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Check whether two boxes share the same storage.
     */
    [[nodiscard]] bool same_storage(const ValueBox& other) const noexcept
    {
        return m_pvoid == other.m_pvoid;
    }

    void reset() noexcept
    {
        m_pvoid.reset();
        m_ti = std::type_index{typeid(void)};
    }

    /**
     * @brief Replace the value with a fresh allocation holding `value`.
     */
    template <typename T>
    void set(T&& value);

    /**
     * @brief The stored value as a `T`.
     * @throws ValueEmptyError if the box is empty.
     * @throws ValueTypeError if it holds another type.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @return The stored value, or nullptr when the box is empty or holds another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

private:
    std::shared_ptr<void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
};

} // namespace incrgraph
