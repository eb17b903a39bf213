// SPDX-License-Identifier: MIT

// src/validation_outcome.hpp
#pragma once

#include <exception>
#include <expected>
#include <string>

#include <fmt/format.h>

#include "lib/stream/error.hpp"
#include "src/validator.hpp"

namespace valid_pipe {

/// Result of validating one element: the accepted value, or the rejection
/// as an Error with code ValidationFailed.
template<typename T>
using ValidationOutcome = std::expected<T, Error>;

/// Run `validator` against `value`.
///
/// Anything the validator throws is caught and normalized into
/// Error{ValidationFailed, description}; the thrown type does not survive.
/// The description is what() for a std::exception, and "<validator name>
/// invalid." when what() is empty or the thrown object is not a
/// std::exception.
template<typename T>
ValidationOutcome<T> Evaluate(const Validator<T>& validator, const T& value) {
    std::string description;
    bool rejected = false;
    try {
        validator.Validate(value);
    } catch (const std::exception& e) {
        rejected = true;
        description = e.what();
    } catch (...) {
        // Not a std::exception: no reason to carry, use the name-based one
        rejected = true;
    }
    if (!rejected) return value;

    if (description.empty()) {
        description = fmt::format("{} invalid.", validator.Name());
    }
    return std::unexpected(Error{ErrorCode::ValidationFailed, std::move(description)});
}

}  // namespace valid_pipe
