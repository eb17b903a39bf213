// SPDX-License-Identifier: MIT

// src/validated_subject.hpp
#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/passthrough_subject.hpp"
#include "lib/stream/publisher.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"
#include "src/log.hpp"
#include "src/validation_outcome.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// ValidatedSubject<T, S> - Push-in point that forwards only valid values to
// the wrapped subject S.
//
// Send() validates and silently drops rejected values: nothing is buffered
// and subscribers see no signal. Completion, failure, subscriber attachment
// and upstream attachment are delegated to S unchanged. A validation failure
// never terminates the subject.
template<typename T, Subject S>
    requires std::same_as<typename S::Output, T>
class ValidatedSubject {
public:
    using Output = T;

    ValidatedSubject(Validator<T> validator, S subject)
        : validator_(std::move(validator)), subject_(std::move(subject)) {}

    void Send(const T& value) {
        auto outcome = Evaluate(validator_, value);
        if (!outcome) {
            if (LogRejections()) {
                Logger().debug("{}: dropped pushed value: {}",
                    validator_.Name(), outcome.error().message);
            }
            return;
        }
        subject_.Send(value);
    }

    void SendComplete() { subject_.SendComplete(); }

    void SendError(const Error& e) { subject_.SendError(e); }

    void SendSubscription(std::shared_ptr<Subscription> upstream) {
        subject_.SendSubscription(std::move(upstream));
    }

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) const {
        subject_.Subscribe(std::move(subscriber));
    }

    const Validator<T>& GetValidator() const { return validator_; }
    const S& GetSubject() const { return subject_; }

private:
    Validator<T> validator_;
    S subject_;
};

/// ValidatedSubject over a fresh PassthroughSubject.
template<typename T>
class PassthroughValidatedSubject : public ValidatedSubject<T, PassthroughSubject<T>> {
public:
    using Base = ValidatedSubject<T, PassthroughSubject<T>>;

    explicit PassthroughValidatedSubject(Validator<T> validator)
        : Base(std::move(validator), PassthroughSubject<T>()) {}

    template<ValidatorFactory<T> F>
    explicit PassthroughValidatedSubject(F&& make_validator)
        : Base(MakeValidator<T>(std::forward<F>(make_validator)), PassthroughSubject<T>()) {}

    PassthroughValidatedSubject() requires Validatable<T>
        : Base(Validator<T>::Valid(), PassthroughSubject<T>()) {}

    template<NullableClosure<T> F>
    PassthroughValidatedSubject(std::string name, F closure)
        : Base(Validator<T>::FromOptional(std::move(name), std::move(closure)),
               PassthroughSubject<T>()) {}
};

}  // namespace valid_pipe
