// SPDX-License-Identifier: MIT

// lib/stream/publisher.hpp
#pragma once

#include <concepts>
#include <memory>

#include "lib/stream/error.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

// Publisher interface - attaches a subscriber and hands it a Subscription.
// Publishers are value types; each Subscribe() starts an independent
// relationship and leaves the publisher itself unchanged.
template<typename P>
concept Publisher = requires(const P& p, std::shared_ptr<Subscriber<typename P::Output>> s) {
    typename P::Output;
    { p.Subscribe(std::move(s)) } -> std::same_as<void>;
};

// Subject interface - a publisher that values can be pushed into imperatively.
template<typename S>
concept Subject = Publisher<S> && requires(
    S& s,
    const typename S::Output& value,
    const Error& e,
    std::shared_ptr<Subscription> upstream
) {
    { s.Send(value) } -> std::same_as<void>;
    { s.SendComplete() } -> std::same_as<void>;
    { s.SendError(e) } -> std::same_as<void>;
    { s.SendSubscription(std::move(upstream)) } -> std::same_as<void>;
};

}  // namespace valid_pipe
