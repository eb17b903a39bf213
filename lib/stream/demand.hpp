// SPDX-License-Identifier: MIT

// lib/stream/demand.hpp
#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string_view>

#include <fmt/format.h>

namespace valid_pipe {

/// Number of elements a subscriber is prepared to receive.
///
/// Either a finite count or unlimited. Arithmetic saturates: adding to
/// unlimited stays unlimited, subtracting never goes below zero, and
/// subtracting from unlimited leaves it unlimited.
class Demand {
public:
    static constexpr Demand None() { return Demand(0, false); }
    static constexpr Demand Unlimited() { return Demand(0, true); }
    static constexpr Demand Max(uint64_t count) { return Demand(count, false); }

    constexpr bool IsUnlimited() const { return unlimited_; }
    constexpr bool IsNone() const { return !unlimited_ && count_ == 0; }

    /// Finite count. Meaningless when IsUnlimited().
    constexpr uint64_t Count() const { return count_; }

    constexpr Demand operator+(Demand other) const {
        if (unlimited_ || other.unlimited_) return Unlimited();
        if (count_ > std::numeric_limits<uint64_t>::max() - other.count_) {
            return Unlimited();
        }
        return Max(count_ + other.count_);
    }

    constexpr Demand operator-(Demand other) const {
        if (unlimited_) return Unlimited();
        if (other.unlimited_ || other.count_ >= count_) return None();
        return Max(count_ - other.count_);
    }

    constexpr Demand& operator+=(Demand other) { return *this = *this + other; }
    constexpr Demand& operator-=(Demand other) { return *this = *this - other; }

    constexpr bool operator==(const Demand& other) const = default;

    constexpr std::strong_ordering operator<=>(const Demand& other) const {
        if (unlimited_ && other.unlimited_) return std::strong_ordering::equal;
        if (unlimited_) return std::strong_ordering::greater;
        if (other.unlimited_) return std::strong_ordering::less;
        return count_ <=> other.count_;
    }

private:
    constexpr Demand(uint64_t count, bool unlimited)
        : count_(count), unlimited_(unlimited) {}

    uint64_t count_;
    bool unlimited_;
};

}  // namespace valid_pipe

template <>
struct fmt::formatter<valid_pipe::Demand> : fmt::formatter<std::string_view> {
    auto format(const valid_pipe::Demand& d, fmt::format_context& ctx) const {
        if (d.IsUnlimited()) return fmt::format_to(ctx.out(), "unlimited");
        return fmt::format_to(ctx.out(), "max({})", d.Count());
    }
};
