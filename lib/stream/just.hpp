// SPDX-License-Identifier: MIT

// lib/stream/just.hpp
#pragma once

#include <memory>
#include <utility>

#include "lib/stream/demand.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

/// Publisher that emits a single value on the first positive demand,
/// then completes.
template<typename T>
class Just {
public:
    using Output = T;

    explicit Just(T value) : value_(std::move(value)) {}

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) const {
        auto inner = std::make_shared<Inner>(subscriber, value_);
        subscriber->OnSubscribe(std::move(inner));
    }

    const T& Value() const { return value_; }

private:
    class Inner final : public Subscription {
    public:
        Inner(std::shared_ptr<Subscriber<T>> downstream, T value)
            : downstream_(std::move(downstream)), value_(std::move(value)) {}

        void Request(Demand demand) override {
            if (!downstream_ || demand.IsNone()) return;
            // Release before emitting so a re-entrant Request() is a no-op
            auto downstream = std::move(downstream_);
            downstream_.reset();
            downstream->OnNext(value_);
            downstream->OnComplete();
        }

        void Cancel() override { downstream_.reset(); }

    private:
        std::shared_ptr<Subscriber<T>> downstream_;
        T value_;
    };

    T value_;
};

/// Publisher that fails immediately upon subscription.
template<typename T>
class Fail {
public:
    using Output = T;

    explicit Fail(Error error) : error_(std::move(error)) {}

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) const {
        subscriber->OnSubscribe(std::make_shared<EmptySubscription>());
        subscriber->OnError(error_);
    }

private:
    Error error_;
};

}  // namespace valid_pipe
