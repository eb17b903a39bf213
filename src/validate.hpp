// SPDX-License-Identifier: MIT

// src/validate.hpp
#pragma once

#include <string>
#include <utility>

#include "lib/stream/publisher.hpp"
#include "src/validation_publisher.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// Validate - nullable-pass operator.
//
// Downstream receives std::optional<Output>: the value when it passes, and a
// single std::nullopt for the first value that fails. After that the
// operator stops validating and swallows further elements; the stream
// itself never fails because of validation.
//
//   auto sink = Sink(Validate(Just<std::string>("fo"), not_empty_min3),
//                    [](const std::optional<std::string>& v) { /* std::nullopt */ });

template<Publisher Upstream>
ValidationPublisher<Upstream> Validate(Upstream upstream, Validator<typename Upstream::Output> validator) {
    return ValidationPublisher<Upstream>(std::move(upstream), std::move(validator));
}

template<Publisher Upstream, ValidatorFactory<typename Upstream::Output> F>
ValidationPublisher<Upstream> Validate(Upstream upstream, F&& make_validator) {
    return ValidationPublisher<Upstream>(
        std::move(upstream),
        MakeValidator<typename Upstream::Output>(std::forward<F>(make_validator)));
}

template<Publisher Upstream>
    requires Validatable<typename Upstream::Output>
ValidationPublisher<Upstream> Validate(Upstream upstream) {
    return ValidationPublisher<Upstream>(
        std::move(upstream), Validator<typename Upstream::Output>::Valid());
}

/// `closure` returns std::nullopt to reject; the rejection reads "<name> invalid.".
template<Publisher Upstream, NullableClosure<typename Upstream::Output> F>
ValidationPublisher<Upstream> Validate(Upstream upstream, std::string name, F closure) {
    return ValidationPublisher<Upstream>(
        std::move(upstream),
        Validator<typename Upstream::Output>::FromOptional(std::move(name), std::move(closure)));
}

}  // namespace valid_pipe
