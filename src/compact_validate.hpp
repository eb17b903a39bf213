// SPDX-License-Identifier: MIT

// src/compact_validate.hpp
#pragma once

#include <string>
#include <utility>

#include "lib/stream/publisher.hpp"
#include "src/validation_publisher.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

// CompactValidate - filtering operator.
//
// Only valid values reach downstream. An invalid value is consumed without
// output and without re-requesting upstream; a subscriber wanting a
// continuous filtered stream keeps its demand open (e.g. unlimited).

template<Publisher Upstream>
CompactValidatePublisher<Upstream> CompactValidate(Upstream upstream, Validator<typename Upstream::Output> validator) {
    return CompactValidatePublisher<Upstream>(std::move(upstream), std::move(validator));
}

template<Publisher Upstream, ValidatorFactory<typename Upstream::Output> F>
CompactValidatePublisher<Upstream> CompactValidate(Upstream upstream, F&& make_validator) {
    return CompactValidatePublisher<Upstream>(
        std::move(upstream),
        MakeValidator<typename Upstream::Output>(std::forward<F>(make_validator)));
}

template<Publisher Upstream>
    requires Validatable<typename Upstream::Output>
CompactValidatePublisher<Upstream> CompactValidate(Upstream upstream) {
    return CompactValidatePublisher<Upstream>(
        std::move(upstream), Validator<typename Upstream::Output>::Valid());
}

template<Publisher Upstream, NullableClosure<typename Upstream::Output> F>
CompactValidatePublisher<Upstream> CompactValidate(Upstream upstream, std::string name, F closure) {
    return CompactValidatePublisher<Upstream>(
        std::move(upstream),
        Validator<typename Upstream::Output>::FromOptional(std::move(name), std::move(closure)));
}

}  // namespace valid_pipe
