// SPDX-License-Identifier: MIT

// src/validation_subscription.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <utility>

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"
#include "src/log.hpp"
#include "src/validation_outcome.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

/// Live downstream plus the outcome of validating one element, captured at
/// the moment of the call.
template<typename In, typename Out>
struct ValidationResult {
    std::shared_ptr<Subscriber<Out>> downstream;
    ValidationOutcome<In> outcome;
};

// ValidationSubscription - Lifecycle shared by every validating operator.
//
// One object plays both roles of an operator stage: it is the Subscriber the
// upstream publisher pushes into, and the Subscription handed to the
// downstream subscriber. It owns three references:
//   validator  - cleared to stop validating
//   downstream - consumer of this stage
//   upstream   - demand-handle of the previous stage
//
// The subscription is complete iff downstream or validator is absent. Cancel(),
// OnComplete() and OnError() clear all three together, which also breaks
// the shared_ptr cycle with the downstream subscriber. Once complete, every
// entry point is a no-op; both ends must treat a complete subscription as
// dead even while they still hold it.
//
// Derived classes implement OnNext() to choose the forwarding policy.
//
// Thread safety: single-threaded; all calls come from the thread driving
// the stream and never overlap.
template<typename In, typename Out>
class ValidationSubscription
    : public Subscription
    , public Subscriber<In>
    , public std::enable_shared_from_this<ValidationSubscription<In, Out>> {
public:
    ValidationSubscription(std::shared_ptr<Subscriber<Out>> downstream, Validator<In> validator)
        : validator_(std::move(validator)), downstream_(std::move(downstream)) {}

    bool IsComplete() const {
        return !downstream_ || !validator_;
    }

    // =========================================================================
    // Subscription interface (called by downstream)
    // =========================================================================

    // Relay demand unchanged; accounting is the upstream source's job.
    void Request(Demand demand) override {
        if (IsComplete()) return;
        Logger().trace("{}: relaying demand {} upstream", validator_->Name(), demand);
        if (auto upstream = upstream_) upstream->Request(demand);
    }

    // Cancel upstream, then drop every reference. Idempotent.
    void Cancel() override {
        if (auto upstream = upstream_) {
            Logger().trace("cancelling upstream subscription");
            upstream->Cancel();
        }
        Release();
    }

    // =========================================================================
    // Subscriber interface (called by upstream)
    // =========================================================================

    void OnSubscribe(std::shared_ptr<Subscription> subscription) override {
        if (upstream_ || IsComplete()) {
            subscription->Cancel();
            return;
        }
        upstream_ = std::move(subscription);
        auto downstream = downstream_;
        downstream->OnSubscribe(this->shared_from_this());
    }

    // Terminal signals are forwarded while a downstream is attached, even if
    // the validator was already released.
    void OnError(const Error& e) override {
        if (!downstream_) return;
        auto downstream = std::move(downstream_);
        Release();
        downstream->OnError(e);
    }

    void OnComplete() override {
        if (!downstream_) return;
        auto downstream = std::move(downstream_);
        Release();
        downstream->OnComplete();
    }

    /// Validate `input` against the live validator.
    /// @return the live downstream and the outcome, or AlreadyTerminated if
    ///         the subscription is complete
    std::expected<ValidationResult<In, Out>, Error> Validate(const In& input) const {
        if (IsComplete()) {
            return std::unexpected(Error{ErrorCode::AlreadyTerminated,
                "validation subscription has completed"});
        }
        return ValidationResult<In, Out>{downstream_, Evaluate(*validator_, input)};
    }

    const std::optional<Validator<In>>& CurrentValidator() const { return validator_; }
    bool HasDownstream() const { return downstream_ != nullptr; }
    bool HasUpstream() const { return upstream_ != nullptr; }

protected:
    const std::shared_ptr<Subscriber<Out>>& Downstream() const { return downstream_; }

    // Stop validating without detaching downstream.
    void ReleaseValidator() { validator_.reset(); }

    void Release() {
        downstream_.reset();
        upstream_.reset();
        validator_.reset();
    }

private:
    std::optional<Validator<In>> validator_;
    std::shared_ptr<Subscriber<Out>> downstream_;
    std::shared_ptr<Subscription> upstream_;
};

}  // namespace valid_pipe
