// SPDX-License-Identifier: MIT

// lib/stream/subscriber.hpp
#pragma once

#include <memory>

#include "lib/stream/demand.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

/// Consumer side of a stream.
///
/// Signal order: exactly one OnSubscribe(), then zero or more OnNext()
/// bounded by requested demand, then at most one of OnError() / OnComplete().
/// No signal follows the terminal one.
template<typename T>
class Subscriber {
public:
    using Input = T;

    virtual ~Subscriber() = default;

    /// Receive the demand-handle for this relationship.
    virtual void OnSubscribe(std::shared_ptr<Subscription> subscription) = 0;

    /// Receive one element.
    /// @return additional demand granted on top of what was already requested
    virtual Demand OnNext(const T& value) = 0;

    /// Terminal failure.
    virtual void OnError(const Error& e) = 0;

    /// Terminal normal completion.
    virtual void OnComplete() = 0;
};

}  // namespace valid_pipe
