#pragma once

/**
 * @file equality.h
 * @brief Equality policies used to gate Signal and Computed writes.
 *
 * A write whose new value compares equal to the current one is dropped, so the policy decides what a "structural
 * no-op" is. The policy is a template parameter of Signal and Computed, any type with
 * bool operator()(const T&, const T&) const can be used.
 */

#include <cmath>
#include <concepts>
#include <memory>
#include <type_traits>

namespace sigraph {

namespace detail {

template<typename T>
struct is_shared_ptr : std::false_type {};

template<typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_shared_ptr_v = is_shared_ptr<T>::value;

} // namespace detail

/**
 * @brief Default policy, deep where the type supports it.
 *
 * - The same object is always equal to itself.
 * - Floating point values compare with ==, except that two NaNs are equal.
 * - Shared pointers are equal when they point to the same object, or when the pointees compare equal.
 * - Otherwise operator== is used when the type has one, so standard containers, nlohmann::json and
 *   aggregates with a defaulted operator== compare structurally.
 * - Types without operator== are never equal, every write notifies.
 *
 * @note Containers declare operator== unconditionally, a container of non comparable elements needs its own policy.
 */
template<typename T>
struct ValueEquals {
    [[nodiscard]] bool operator()(const T &lhs, const T &rhs) const {
        if (std::addressof(lhs) == std::addressof(rhs)) { return true; }
        if constexpr (std::is_floating_point_v<T>) {
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else if constexpr (detail::is_shared_ptr_v<T>) {
            if (lhs == rhs) { return true; }
            using element_type = std::remove_cv_t<typename T::element_type>;
            if constexpr (std::equality_comparable<element_type>) {
                return lhs != nullptr && rhs != nullptr && ValueEquals<element_type>{}(*lhs, *rhs);
            } else {
                return false;
            }
        } else if constexpr (std::equality_comparable<T>) {
            return lhs == rhs;
        } else {
            return false;
        }
    }
};

/**
 * @brief Identity only: scalars (pointers included) and shared pointers by value, anything else by address.
 */
template<typename T>
struct ShallowEquals {
    [[nodiscard]] bool operator()(const T &lhs, const T &rhs) const {
        if constexpr (std::is_scalar_v<T> || detail::is_shared_ptr_v<T>) {
            return lhs == rhs;
        } else {
            return std::addressof(lhs) == std::addressof(rhs);
        }
    }
};

} // namespace sigraph
