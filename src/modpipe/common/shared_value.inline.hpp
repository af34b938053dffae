/**
 * @file shared_value.inline.hpp
 * @brief Implementations for type-parameterized members of SharedValue.
 */
#pragma once
#include "modpipe/common/shared_value.hpp"

namespace modpipe
{

namespace detail
{

/**
 * @brief Helper to get the decayed storage type.
 */
template <typename T>
using shared_storage_t = std::decay_t<T>;

template <typename StorageT>
std::string shared_type_mismatch_message(const std::type_index& actual)
{
    return "SharedValue type mismatch: expected " + std::string{typeid(StorageT).name()} +
           ", got " + std::string{actual.name()};
}

} // namespace detail

template <typename T, typename... Args>
SharedValue SharedValue::make(Args&&... args)
{
    using StorageT = detail::shared_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SharedValue: T cannot be void");
    static_assert(!std::is_array_v<StorageT>, "SharedValue: T cannot be an array type");

    SharedValue result;
    std::shared_ptr<const StorageT> ptr = std::make_shared<StorageT>(std::forward<Args>(args)...);
    result.m_ptr = std::move(ptr);
    result.m_ti = std::type_index{typeid(StorageT)};
    return result;
}

template <typename T>
SharedValue SharedValue::of(T&& value)
{
    using StorageT = detail::shared_storage_t<T>;
    return make<StorageT>(std::forward<T>(value));
}

template <typename T>
bool SharedValue::has_type() const noexcept
{
    using StorageT = detail::shared_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SharedValue: T cannot be void");
    return m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& SharedValue::as() const
{
    using StorageT = detail::shared_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SharedValue: T cannot be void");

    if (!m_ptr)
    {
        throw SharedValueEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        throw SharedValueTypeError{detail::shared_type_mismatch_message<StorageT>(m_ti)};
    }
    return *static_cast<const StorageT*>(m_ptr.get());
}

template <typename T>
const T* SharedValue::try_as() const noexcept
{
    using StorageT = detail::shared_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SharedValue: T cannot be void");

    if (!m_ptr || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_ptr.get());
}

template <typename T>
std::shared_ptr<const T> SharedValue::get() const noexcept
{
    using StorageT = detail::shared_storage_t<T>;
    static_assert(!std::is_void_v<StorageT>, "SharedValue: T cannot be void");

    if (!m_ptr || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<const StorageT>(m_ptr);
}

} // namespace modpipe
