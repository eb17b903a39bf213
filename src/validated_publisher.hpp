// SPDX-License-Identifier: MIT

// src/validated_publisher.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"
#include "src/log.hpp"
#include "src/validation_outcome.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// SingleShotSubscription - Root of a chain that delivers one stored result.
//
// On the first Request() with positive demand it detaches the downstream,
// then delivers either the value followed by completion, or the failure.
// Later requests find no downstream and do nothing. No upstream exists.
template<typename Out>
class SingleShotSubscription final : public Subscription {
public:
    SingleShotSubscription(std::shared_ptr<Subscriber<Out>> downstream,
                           std::expected<Out, Error> result)
        : downstream_(std::move(downstream)), result_(std::move(result)) {}

    void Request(Demand demand) override {
        if (!downstream_ || demand.IsNone()) return;
        auto downstream = std::move(downstream_);
        downstream_.reset();
        if (result_) {
            downstream->OnNext(*result_);
            downstream->OnComplete();
        } else {
            downstream->OnError(result_.error());
        }
    }

    void Cancel() override { downstream_.reset(); }

    bool IsComplete() const { return !downstream_; }

private:
    std::shared_ptr<Subscriber<Out>> downstream_;
    std::expected<Out, Error> result_;
};

namespace detail {

template<typename T>
ValidationOutcome<T> EvaluateAndLog(const Validator<T>& validator, const T& value) {
    auto outcome = Evaluate(validator, value);
    if (!outcome && LogRejections()) {
        Logger().trace("{}: rejected value: {}", validator.Name(), outcome.error().message);
    }
    return outcome;
}

}  // namespace detail

/// Top-level publisher validating one value once; emits the value, or
/// std::nullopt when it is invalid, then completes. Never fails.
template<typename T>
class ValidatedPublisher {
public:
    using Output = std::optional<T>;

    ValidatedPublisher(T output, Validator<T> validator)
        : output_(std::move(output)),
          validator_(std::move(validator)),
          outcome_(detail::EvaluateAndLog(validator_, output_)) {}

    template<ValidatorFactory<T> F>
    ValidatedPublisher(T output, F&& make_validator)
        : ValidatedPublisher(std::move(output), MakeValidator<T>(std::forward<F>(make_validator))) {}

    explicit ValidatedPublisher(T output) requires Validatable<T>
        : ValidatedPublisher(std::move(output), Validator<T>::Valid()) {}

    template<NullableClosure<T> F>
    ValidatedPublisher(T output, std::string name, F closure)
        : ValidatedPublisher(std::move(output),
                             Validator<T>::FromOptional(std::move(name), std::move(closure))) {}

    void Subscribe(std::shared_ptr<Subscriber<Output>> subscriber) const {
        std::expected<Output, Error> result =
            outcome_ ? Output(*outcome_) : Output(std::nullopt);
        auto subscription = std::make_shared<SingleShotSubscription<Output>>(
            subscriber, std::move(result));
        subscriber->OnSubscribe(std::move(subscription));
    }

    const T& GetOutput() const { return output_; }
    const Validator<T>& GetValidator() const { return validator_; }
    const ValidationOutcome<T>& GetOutcome() const { return outcome_; }

private:
    T output_;
    Validator<T> validator_;
    ValidationOutcome<T> outcome_;
};

/// Top-level publisher validating one value once; emits the value then
/// completes, or fails with the normalized validation error.
template<typename T>
class TryValidatedPublisher {
public:
    using Output = T;

    TryValidatedPublisher(T output, Validator<T> validator)
        : output_(std::move(output)),
          validator_(std::move(validator)),
          outcome_(detail::EvaluateAndLog(validator_, output_)) {}

    template<ValidatorFactory<T> F>
    TryValidatedPublisher(T output, F&& make_validator)
        : TryValidatedPublisher(std::move(output), MakeValidator<T>(std::forward<F>(make_validator))) {}

    explicit TryValidatedPublisher(T output) requires Validatable<T>
        : TryValidatedPublisher(std::move(output), Validator<T>::Valid()) {}

    template<ThrowingClosure<T> F>
    TryValidatedPublisher(T output, std::string name, F closure)
        : TryValidatedPublisher(std::move(output), Validator<T>(std::move(name), std::move(closure))) {}

    void Subscribe(std::shared_ptr<Subscriber<Output>> subscriber) const {
        auto subscription = std::make_shared<SingleShotSubscription<Output>>(subscriber, outcome_);
        subscriber->OnSubscribe(std::move(subscription));
    }

    const T& GetOutput() const { return output_; }
    const Validator<T>& GetValidator() const { return validator_; }
    const ValidationOutcome<T>& GetOutcome() const { return outcome_; }

private:
    T output_;
    Validator<T> validator_;
    ValidationOutcome<T> outcome_;
};

}  // namespace valid_pipe
