/**
 * @file shared_value.hpp
 * @brief Definition of SharedValue, an immutable type-erased value.
 * @see shared_value.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "modpipe/common/common.hpp"

namespace modpipe
{

/**
 * @brief Exception thrown when a SharedValue is read as the wrong type.
 */
class SharedValueTypeError : public std::runtime_error
{
public:
    explicit SharedValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when reading an empty SharedValue.
 */
class SharedValueEmptyError : public std::runtime_error
{
public:
    SharedValueEmptyError()
        : std::runtime_error("SharedValue is empty")
    {}
};

/**
 * @brief An immutable, type-erased value with shared ownership.
 *
 * @details
 * SharedValue stores any copyable or movable type behind a
 * `shared_ptr<const void>` and remembers the stored type. It is the value type
 * of shared state, of the initial context and of cache entries.
 *
 * The stored object is never modified after construction, so one SharedValue
 * may be read from any number of threads at once. Copies share the same
 * object; `same_object()` tells whether two values refer to it, which is how
 * callers of the cache can verify they received one computed result.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_ptr == nullptr`
 *
 * @par Thread Safety
 * - Reading and copying are safe from any thread.
 * - Assigning to one SharedValue instance concurrently with reads of that same
 *   instance requires external synchronization (as with `std::shared_ptr`).
 */
class SharedValue
{
public:
    /**
     * @brief Default constructor creates an empty SharedValue.
     */
    SharedValue() = default;

    /**
     * @brief Build a new T from args and wrap it.
     * @tparam T Stored as std::decay_t<T>.
     */
    template <typename T, typename... Args>
    [[nodiscard]] static SharedValue make(Args&&... args);

    /**
     * @brief Wrap a copy of value, or take it over when passed an rvalue.
     */
    template <typename T>
    [[nodiscard]] static SharedValue of(T&& value);

    /**
     * @brief Check if SharedValue contains a value.
     */
    [[nodiscard]] bool has_value() const noexcept
    {
        return m_ptr != nullptr;
    }

    /**
     * @brief True when the value was stored as exactly T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Stored type, or typeid(void) for an empty value.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Check whether both values share the same stored object.
     * @note Two empty values are not considered the same object.
     */
    [[nodiscard]] bool same_object(const SharedValue& other) const noexcept
    {
        return m_ptr != nullptr && m_ptr == other.m_ptr;
    }

    /**
     * @brief Drop the reference to the stored value.
     * @details Other copies keep the object alive.
     */
    void reset() noexcept
    {
        m_ptr.reset();
        m_ti = std::type_index{typeid(void)};
    }

    /**
     * @brief Read the stored object.
     * @throws SharedValueEmptyError if empty.
     * @throws SharedValueTypeError if type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Read the stored object without throwing.
     * @return nullptr when empty or stored as another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Share ownership of the stored object.
     * @return shared_ptr<const T> if type matches, nullptr otherwise.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get() const noexcept;

private:
    std::shared_ptr<const void> m_ptr{};
    std::type_index m_ti{typeid(void)};
};

} // namespace modpipe
