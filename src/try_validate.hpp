// SPDX-License-Identifier: MIT

// src/try_validate.hpp
#pragma once

#include <string>
#include <utility>

#include "lib/stream/publisher.hpp"
#include "src/validation_publisher.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// TryValidate - error-propagating operator.
//
// Valid values pass through unchanged. The first invalid value cancels the
// upstream and fails the stream with Error{ValidationFailed, description};
// nothing follows the failure. For std::optional elements an empty value
// that the validator accepts is skipped.

template<Publisher Upstream>
TryValidationPublisher<Upstream> TryValidate(Upstream upstream, Validator<typename Upstream::Output> validator) {
    return TryValidationPublisher<Upstream>(std::move(upstream), std::move(validator));
}

template<Publisher Upstream, ValidatorFactory<typename Upstream::Output> F>
TryValidationPublisher<Upstream> TryValidate(Upstream upstream, F&& make_validator) {
    return TryValidationPublisher<Upstream>(
        std::move(upstream),
        MakeValidator<typename Upstream::Output>(std::forward<F>(make_validator)));
}

template<Publisher Upstream>
    requires Validatable<typename Upstream::Output>
TryValidationPublisher<Upstream> TryValidate(Upstream upstream) {
    return TryValidationPublisher<Upstream>(
        std::move(upstream), Validator<typename Upstream::Output>::Valid());
}

/// `closure` throws to reject; the exception's what() becomes the description.
template<Publisher Upstream, ThrowingClosure<typename Upstream::Output> F>
TryValidationPublisher<Upstream> TryValidate(Upstream upstream, std::string name, F closure) {
    return TryValidationPublisher<Upstream>(
        std::move(upstream),
        Validator<typename Upstream::Output>(std::move(name), std::move(closure)));
}

}  // namespace valid_pipe
