// SPDX-License-Identifier: MIT

// src/validation_publisher.hpp
#pragma once

#include <memory>
#include <utility>

#include "lib/stream/publisher.hpp"
#include "lib/stream/subscriber.hpp"
#include "src/operator_subscription.hpp"
#include "src/policy.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// ValidationOperator<P, Upstream> - Publisher that validates every element
// of Upstream with forwarding policy P.
//
// Each Subscribe() creates one OperatorSubscription and attaches it to a
// fresh subscription of Upstream; the operator itself holds no stream state.
template<Policy P, Publisher Upstream>
class ValidationOperator {
public:
    using Input = typename Upstream::Output;
    using Output = PolicyOutputT<P, Input>;

    ValidationOperator(Upstream upstream, Validator<Input> validator)
        : upstream_(std::move(upstream)), validator_(std::move(validator)) {}

    void Subscribe(std::shared_ptr<Subscriber<Output>> subscriber) const {
        auto subscription = std::make_shared<OperatorSubscription<P, Input>>(
            std::move(subscriber), validator_);
        upstream_.Subscribe(std::move(subscription));
    }

    const Upstream& GetUpstream() const { return upstream_; }
    const Validator<Input>& GetValidator() const { return validator_; }

private:
    Upstream upstream_;
    Validator<Input> validator_;
};

/// Emits std::optional values: present when valid, std::nullopt on the first
/// invalid element.
template<Publisher Upstream>
using ValidationPublisher = ValidationOperator<Policy::NullablePass, Upstream>;

/// Emits valid values; fails the stream on the first invalid element.
template<Publisher Upstream>
using TryValidationPublisher = ValidationOperator<Policy::ErrorPropagating, Upstream>;

/// Emits valid values; invalid elements are dropped.
template<Publisher Upstream>
using CompactValidatePublisher = ValidationOperator<Policy::Filtering, Upstream>;

}  // namespace valid_pipe
