// SPDX-License-Identifier: MIT

// src/operator_subscription.hpp
#pragma once

#include <memory>
#include <optional>
#include <utility>

#include "lib/stream/demand.hpp"
#include "lib/stream/sink.hpp"
#include "lib/stream/subscriber.hpp"
#include "src/log.hpp"
#include "src/policy.hpp"
#include "src/validated_publisher.hpp"
#include "src/validation_subscription.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// OperatorSubscription<P, T> - Validating stage with forwarding policy P.
//
// NullablePass:
//   accepted -> downstream receives std::optional(value); its demand is returned
//   rejected -> downstream receives std::nullopt; the validator is released, so
//               later elements are swallowed at zero demand. Terminal signals
//               from upstream still reach downstream.
// ErrorPropagating:
//   accepted -> downstream receives value (an empty std::optional input is
//               skipped at zero demand)
//   rejected -> upstream is cancelled, every reference released, then
//               downstream receives OnError with the normalized description
// Filtering:
//   accepted -> downstream receives value
//   rejected -> nothing is emitted and zero demand is returned
//
// Every policy returns zero demand when the subscription is already complete.
template<Policy P, typename T>
class OperatorSubscription final : public ValidationSubscription<T, PolicyOutputT<P, T>> {
public:
    using Output = PolicyOutputT<P, T>;
    using Base = ValidationSubscription<T, Output>;

    using Base::Base;

    Demand OnNext(const T& value) override {
        // Upstream may hold the last reference and drop it if we cancel
        auto self = this->shared_from_this();
        if constexpr (P == Policy::NullablePass) {
            return ReceiveNullable(value);
        } else if constexpr (P == Policy::ErrorPropagating) {
            return ReceiveOrFail(value);
        } else {
            return ReceiveFiltered(value);
        }
    }

private:
    Demand ReceiveNullable(const T& value) {
        auto validated = this->Validate(value);
        if (!validated) {
            LogSwallowed(validated.error());
            return Demand::None();
        }
        if (validated->outcome) {
            return validated->downstream->OnNext(Output(*validated->outcome));
        }
        LogRejected(validated->outcome.error());
        validated->downstream->OnNext(Output(std::nullopt));
        this->ReleaseValidator();
        return Demand::None();
    }

    Demand ReceiveOrFail(const T& value) {
        auto validated = this->Validate(value);
        if (!validated) {
            LogSwallowed(validated.error());
            return Demand::None();
        }
        if (validated->outcome) {
            if constexpr (is_optional_v<T>) {
                if (!validated->outcome->has_value()) return Demand::None();
            }
            return validated->downstream->OnNext(*validated->outcome);
        }
        LogRejected(validated->outcome.error());
        this->Cancel();
        validated->downstream->OnError(validated->outcome.error());
        return Demand::None();
    }

    // Runs the element through a single-shot ValidatedPublisher with the live
    // validator; only a present result crosses to downstream.
    Demand ReceiveFiltered(const T& value) {
        const auto& validator = this->CurrentValidator();
        if (this->IsComplete() || !validator) {
            LogSwallowed(Error{ErrorCode::AlreadyTerminated, "validation subscription has completed"});
            return Demand::None();
        }

        ValidatedPublisher<T> single(value, *validator);
        if (!single.GetOutcome()) LogRejected(single.GetOutcome().error());

        auto downstream = this->Downstream();
        Demand demand = Demand::None();
        auto result_sink = std::make_shared<SinkSubscriber<std::optional<T>>>(
            [&demand, &downstream](const std::optional<T>& result) {
                if (result && downstream) demand = downstream->OnNext(*result);
            });
        single.Subscribe(result_sink);
        result_sink->Cancel();
        return demand;
    }

    void LogRejected(const Error& e) const {
        if (!LogRejections()) return;
        Logger().debug("{}: rejected element: {}", policy_name(P), e.message);
    }

    void LogSwallowed(const Error& e) const {
        Logger().debug("{}: element swallowed: {}", policy_name(P), e.message);
    }
};

}  // namespace valid_pipe
