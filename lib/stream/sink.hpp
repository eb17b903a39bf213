// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/publisher.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

/// Concrete subscriber that dispatches stream signals to user-provided callbacks.
///
/// Requests `initial_demand` as soon as it is subscribed and never grants more
/// from OnNext(). All callbacks are guarded by a validity flag: once Cancel()
/// is called or a terminal signal has been delivered, later signals are
/// silently dropped. The held subscription is released at that point, which
/// breaks the reference cycle with the source.
template<typename T>
class SinkSubscriber final : public Subscriber<T> {
public:
    /// @param on_value     Invoked for each incoming element.
    /// @param on_error     Invoked when the stream fails (may be empty).
    /// @param on_complete  Invoked when the stream ends normally (may be empty).
    /// @param initial_demand  Demand requested on subscription.
    SinkSubscriber(
        std::function<void(const T&)> on_value,
        std::function<void(const Error&)> on_error = {},
        std::function<void()> on_complete = {},
        Demand initial_demand = Demand::Unlimited()
    ) : on_value_(std::move(on_value)),
        on_error_(std::move(on_error)),
        on_complete_(std::move(on_complete)),
        initial_demand_(initial_demand) {}

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (!valid_ || subscription_) {
            subscription->Cancel();
            return;
        }
        subscription_ = subscription;
        // Local copy: a synchronous source may terminate us inside Request()
        subscription->Request(initial_demand_);
    }

    Demand OnNext(const T& value) override {
        if (valid_ && on_value_) on_value_(value);
        return Demand::None();
    }

    void OnError(const Error& e) override {
        if (!valid_) return;
        Invalidate();
        if (on_error_) on_error_(e);
    }

    void OnComplete() override {
        if (!valid_) return;
        Invalidate();
        if (on_complete_) on_complete_();
    }

    /// Ask the source for more elements.
    void Request(Demand demand) {
        if (!valid_ || !subscription_) return;
        auto subscription = subscription_;
        subscription->Request(demand);
    }

    /// Disable all future callbacks and cancel the source. Idempotent.
    void Cancel() {
        if (!valid_) return;
        auto subscription = std::move(subscription_);
        Invalidate();
        if (subscription) subscription->Cancel();
    }

    bool IsActive() const { return valid_; }

private:
    void Invalidate() {
        valid_ = false;
        subscription_.reset();
    }

    std::function<void(const T&)> on_value_;
    std::function<void(const Error&)> on_error_;
    std::function<void()> on_complete_;
    Demand initial_demand_;
    std::shared_ptr<Subscription> subscription_;
    bool valid_ = true;
};

/// Attach a callback subscriber to `publisher` and return it as a cancellable handle.
template<Publisher P>
std::shared_ptr<SinkSubscriber<typename P::Output>> Sink(
    const P& publisher,
    std::function<void(const typename P::Output&)> on_value,
    std::function<void(const Error&)> on_error = {},
    std::function<void()> on_complete = {}
) {
    auto sink = std::make_shared<SinkSubscriber<typename P::Output>>(
        std::move(on_value), std::move(on_error), std::move(on_complete));
    publisher.Subscribe(sink);
    return sink;
}

}  // namespace valid_pipe
