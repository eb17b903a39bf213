// SPDX-License-Identifier: MIT

// lib/stream/passthrough_subject.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

// PassthroughSubject<T> - Raw push-in point that relays values to subscribers.
//
// Each subscriber has its own demand. A value sent while a subscriber has no
// outstanding demand is dropped for that subscriber; nothing is buffered.
//
// Terminal signals:
// - SendComplete() / SendError() reach every current subscriber once, then
//   detach them. Later Send() calls are ignored.
// - Subscribers attaching after termination receive the terminal signal
//   immediately after OnSubscribe().
//
// Copies share state: a copy of a subject is the same subject.
template<typename T>
class PassthroughSubject {
public:
    using Output = T;

    PassthroughSubject() : state_(std::make_shared<State>()) {}

    void Send(const T& value) {
        if (state_->terminated) return;
        // Snapshot: subscribers may cancel or attach while we deliver
        auto conduits = state_->conduits;
        for (auto& conduit : conduits) {
            conduit->Offer(value);
        }
    }

    void SendComplete() {
        Terminate(std::nullopt);
    }

    void SendError(const Error& e) {
        Terminate(e);
    }

    /// Attach an upstream handle; the subject asks it for unlimited demand.
    void SendSubscription(std::shared_ptr<Subscription> upstream) {
        if (state_->terminated) {
            upstream->Cancel();
            return;
        }
        state_->upstreams.push_back(upstream);
        upstream->Request(Demand::Unlimited());
    }

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) const {
        if (state_->terminated) {
            subscriber->OnSubscribe(std::make_shared<EmptySubscription>());
            if (state_->failure) {
                subscriber->OnError(*state_->failure);
            } else {
                subscriber->OnComplete();
            }
            return;
        }
        auto conduit = std::make_shared<Conduit>(state_, subscriber);
        state_->conduits.push_back(conduit);
        subscriber->OnSubscribe(std::move(conduit));
    }

    std::size_t SubscriberCount() const { return state_->conduits.size(); }

    bool IsTerminated() const { return state_->terminated; }

private:
    class Conduit;

    struct State {
        std::vector<std::shared_ptr<Conduit>> conduits;
        std::vector<std::shared_ptr<Subscription>> upstreams;
        std::optional<Error> failure;
        bool terminated = false;
    };

    class Conduit final : public Subscription {
    public:
        Conduit(std::weak_ptr<State> state, std::shared_ptr<Subscriber<T>> downstream)
            : state_(std::move(state)), downstream_(std::move(downstream)) {}

        void Request(Demand demand) override {
            if (!downstream_) return;
            demand_ += demand;
        }

        void Cancel() override {
            if (!downstream_) return;
            downstream_.reset();
            if (auto state = state_.lock()) {
                std::erase_if(state->conduits, [this](const auto& c) { return c.get() == this; });
            }
        }

        void Offer(const T& value) {
            if (!downstream_ || demand_.IsNone()) return;
            demand_ -= Demand::Max(1);
            auto downstream = downstream_;
            demand_ += downstream->OnNext(value);
        }

        void Finish(const std::optional<Error>& failure) {
            if (!downstream_) return;
            auto downstream = std::move(downstream_);
            downstream_.reset();
            if (failure) {
                downstream->OnError(*failure);
            } else {
                downstream->OnComplete();
            }
        }

    private:
        std::weak_ptr<State> state_;
        std::shared_ptr<Subscriber<T>> downstream_;
        Demand demand_ = Demand::None();
    };

    void Terminate(std::optional<Error> failure) {
        if (state_->terminated) return;
        state_->terminated = true;
        state_->failure = std::move(failure);
        state_->upstreams.clear();
        auto conduits = std::move(state_->conduits);
        state_->conduits.clear();
        for (auto& conduit : conduits) {
            conduit->Finish(state_->failure);
        }
    }

    std::shared_ptr<State> state_;
};

}  // namespace valid_pipe
