// SPDX-License-Identifier: MIT

// src/operators.hpp
#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/publisher.hpp"
#include "lib/stream/sink.hpp"
#include "src/compact_validate.hpp"
#include "src/try_validate.hpp"
#include "src/validate.hpp"

namespace valid_pipe::operators {

// Pipe syntax for the validating operators:
//
//   auto sink = Sequence<std::string>{"foo-bar", "fo", "baz-qux"}
//       | operators::CompactValidate(not_empty_min3)
//       | operators::Sink([](const std::string& s) { ... });
//
// Each helper captures the operator arguments and applies them to the
// publisher on the left-hand side.

namespace detail {

template<typename ApplyT>
struct operator_helper {
    ApplyT m_apply;
};

template<typename OnValueT>
struct sink_helper {
    OnValueT m_on_value;
    std::function<void(const Error&)> m_on_error;
    std::function<void()> m_on_complete;
};

template<typename ApplyT>
operator_helper<ApplyT> make_operator(ApplyT apply) {
    return operator_helper<ApplyT>{ std::move(apply) };
}

}  // namespace detail

template<typename... Args>
inline auto Validate(Args... args) {
    return detail::make_operator([... args = std::move(args)]<Publisher Upstream>(Upstream upstream) {
        return valid_pipe::Validate(std::move(upstream), args...);
    });
}

template<typename... Args>
inline auto TryValidate(Args... args) {
    return detail::make_operator([... args = std::move(args)]<Publisher Upstream>(Upstream upstream) {
        return valid_pipe::TryValidate(std::move(upstream), args...);
    });
}

template<typename... Args>
inline auto CompactValidate(Args... args) {
    return detail::make_operator([... args = std::move(args)]<Publisher Upstream>(Upstream upstream) {
        return valid_pipe::CompactValidate(std::move(upstream), args...);
    });
}

template<typename OnValueT>
inline auto Sink(
    OnValueT on_value,
    std::function<void(const Error&)> on_error = {},
    std::function<void()> on_complete = {}
) {
    return detail::sink_helper<OnValueT>{
        std::move(on_value), std::move(on_error), std::move(on_complete) };
}

namespace detail {

// Found by argument-dependent lookup on the helper types, so pipelines work
// without a using-directive for this namespace.
template<Publisher Upstream, typename ApplyT>
inline auto operator|(Upstream upstream, const operator_helper<ApplyT>& op) {
    return op.m_apply(std::move(upstream));
}

template<Publisher Upstream, typename OnValueT>
inline auto operator|(const Upstream& upstream, sink_helper<OnValueT> sink) {
    return valid_pipe::Sink(
        upstream,
        std::function<void(const typename Upstream::Output&)>(std::move(sink.m_on_value)),
        std::move(sink.m_on_error),
        std::move(sink.m_on_complete));
}

}  // namespace detail

}  // namespace valid_pipe::operators
