/**
 * @file engine.inline.hpp
 * @brief Implementations for the typed node operations of Engine.
 */
#pragma once
#include "incrgraph/common/value_box.inline.hpp"
#include "incrgraph/engine/engine.hpp"

namespace incrgraph
{

namespace detail
{

/**
 * @brief Wrap a typed predicate (or the default one) as an EqualityFn.
 */
template <typename T>
EqualityFn make_equality(std::function<bool(const T&, const T&)> equals)
{
    if (!equals)
    {
        equals = &default_equals<T>;
    }
    return [equals = std::move(equals)](const ValueBox& a, const ValueBox& b) {
        return equals(a.template as<T>(), b.template as<T>());
    };
}

} // namespace detail

template <typename T>
Source<T> Engine::create_source(T initial, NodeOptions<detail::identity_t<T>> options)
{
    NodeId id = create_source_node(
        ValueBox::of(std::move(initial)),
        detail::make_equality<T>(std::move(options.equals)),
        std::move(options.label));
    return Source<T>{id};
}

template <typename F, typename T>
Derived<T> Engine::create_derived(F computation, NodeOptions<T> options)
{
    static_assert(std::is_invocable_v<F&>, "create_derived: computation must take no arguments");
    static_assert(std::is_convertible_v<std::invoke_result_t<F&>, T>,
                  "create_derived: computation result must convert to the node type");

    ComputeFn compute = [computation = std::move(computation)]() mutable {
        return ValueBox::of(static_cast<T>(computation()));
    };
    NodeId id = create_derived_node(
        std::move(compute),
        detail::make_equality<T>(std::move(options.equals)),
        std::move(options.label));
    return Derived<T>{id};
}

template <typename T>
T Engine::read(const Source<T>& node)
{
    return read_value(node.id()).template as<T>();
}

template <typename T>
T Engine::read(const Derived<T>& node)
{
    return read_value(node.id()).template as<T>();
}

template <typename T>
void Engine::write(const Source<T>& node, detail::identity_t<T> value)
{
    write_value(node.id(), ValueBox::of(std::move(value)));
}

template <typename T, typename F>
void Engine::update(const Source<T>& node, F&& transform)
{
    T next = std::forward<F>(transform)(read(node));
    write(node, std::move(next));
}

} // namespace incrgraph
