// SPDX-License-Identifier: MIT

// src/validator.hpp
#pragma once

#include <concepts>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace valid_pipe {

/// Exception a validator throws to reject a value. what() is the reason.
class ValidationFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template<typename T>
class Validator;

/// A type that declares its own always-applicable validator.
template<typename T>
concept Validatable = requires {
    { T::DefaultValidator() } -> std::same_as<Validator<T>>;
};

/// Zero-argument callable producing a validator, evaluated once when an
/// operator is built.
template<typename F, typename T>
concept ValidatorFactory = std::invocable<F&>
    && std::same_as<std::remove_cvref_t<std::invoke_result_t<F&>>, Validator<T>>;

/// Closure of the nullable family: an empty result means "invalid".
template<typename F, typename T>
concept NullableClosure = std::invocable<F&, const T&>
    && std::convertible_to<std::invoke_result_t<F&, const T&>, std::optional<T>>;

/// Closure of the error-propagating family: returns on success, throws on failure.
template<typename F, typename T>
concept ThrowingClosure = std::invocable<F&, const T&>
    && std::is_void_v<std::invoke_result_t<F&, const T&>>;

// Validator<T> - Immutable value-acceptance check.
//
// Validate() returns normally when the value is accepted and throws when it
// is rejected, normally a std::exception whose what() is the reason. The rule
// engine producing the check is external; this type only owns the check
// and a name used in diagnostics.
template<typename T>
class Validator {
public:
    using Check = std::function<void(const T&)>;

    Validator(std::string name, Check check)
        : name_(std::move(name)), check_(std::move(check)) {}

    /// Run the check. Throws on rejection.
    void Validate(const T& value) const {
        if (check_) check_(value);
    }

    const std::string& Name() const { return name_; }

    /// The type's self-declared validator.
    static Validator Valid() requires Validatable<T> {
        return T::DefaultValidator();
    }

    /// Build a validator from a closure returning an optional; an empty
    /// result rejects with "<name> invalid.".
    template<NullableClosure<T> F>
    static Validator FromOptional(std::string name, F closure) {
        auto description = fmt::format("{} invalid.", name);
        return Validator(std::move(name),
            [closure = std::move(closure), description = std::move(description)](const T& value) {
                if (!std::optional<T>(closure(value))) {
                    throw ValidationFailure(description);
                }
            });
    }

private:
    std::string name_;
    Check check_;
};

/// Evaluate a validator factory.
template<typename T, ValidatorFactory<T> F>
Validator<T> MakeValidator(F&& make_validator) {
    return make_validator();
}

}  // namespace valid_pipe
