/**
 * @file value_box.inline.hpp
 * @brief Template bodies of ValueBox.
 */
#pragma once
#include "incrgraph/common/value_box.hpp"

namespace incrgraph
{

namespace detail
{

/// Node values are stored decayed: `const int&` and `int` share one type.
template <typename T>
using storage_type_t = std::decay_t<T>;

template <typename T>
inline constexpr bool is_valid_box_type_v =
    !std::is_void_v<storage_type_t<T>> && !std::is_array_v<storage_type_t<T>>;

} // namespace detail

template <typename T>
ValueBox ValueBox::of(T&& value)
{
    ValueBox box;
    box.set(std::forward<T>(value));
    return box;
}

template <typename T>
bool ValueBox::has_type() const noexcept
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueBox: T cannot be void");
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
void ValueBox::set(T&& value)
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(detail::is_valid_box_type_v<T>, "ValueBox: T cannot be void or an array type");

    auto ptr = std::make_shared<StorageT>(std::forward<T>(value));
    m_pvoid = std::static_pointer_cast<void>(ptr);
    m_ti = std::type_index{typeid(StorageT)};
}

template <typename T>
const T& ValueBox::as() const
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueBox: T cannot be void");

    if (!m_pvoid)
    {
        throw ValueEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw ValueTypeError{
            "ValueBox type mismatch: expected " + std::string{typeid(StorageT).name()} +
            ", got " + std::string{m_ti.name()}
        };
    }
    return *static_cast<const StorageT*>(m_pvoid.get());
}

template <typename T>
const T* ValueBox::try_as() const noexcept
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(!std::is_void_v<StorageT>, "ValueBox: T cannot be void");

    if (!m_pvoid || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_pvoid.get());
}

} // namespace incrgraph
