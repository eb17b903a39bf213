// SPDX-License-Identifier: MIT

// src/policy.hpp
#pragma once

#include <optional>
#include <string_view>
#include <type_traits>

namespace valid_pipe {

/// How a validating operator turns a rejection into a forwarding decision.
enum class Policy {
    NullablePass,      ///< Reject -> emit std::nullopt, stop validating
    ErrorPropagating,  ///< Reject -> emit terminal failure, cancel upstream
    Filtering,         ///< Reject -> emit nothing
};

constexpr std::string_view policy_name(Policy policy) {
    switch (policy) {
        case Policy::NullablePass:
            return "validate";
        case Policy::ErrorPropagating:
            return "try_validate";
        case Policy::Filtering:
            return "compact_validate";
    }
    return "unknown";
}

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

/// Element type an operator with policy P emits for input type T.
template<Policy P, typename T>
struct PolicyOutput {
    using type = T;
};

template<typename T>
struct PolicyOutput<Policy::NullablePass, T> {
    using type = std::optional<T>;
};

template<Policy P, typename T>
using PolicyOutputT = typename PolicyOutput<P, T>::type;

}  // namespace valid_pipe
