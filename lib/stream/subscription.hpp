// SPDX-License-Identifier: MIT

// lib/stream/subscription.hpp
#pragma once

#include "lib/stream/demand.hpp"

namespace valid_pipe {

/// Back-channel a subscriber uses to regulate its source.
///
/// Demand semantics:
/// - Request() adds to the outstanding demand; the source may push at most
///   that many elements before more is requested.
/// - Demand returned from Subscriber::OnNext() is added the same way.
/// - Request(Demand::None()) is a no-op.
///
/// Thread safety:
/// - Request() and Cancel() must be called from the thread driving the
///   stream. Sources never push re-entrantly from inside Request().
class Subscription {
public:
    virtual ~Subscription() = default;

    /// Grant the source permission to push up to `demand` more elements.
    virtual void Request(Demand demand) = 0;

    /// Terminate the relationship. No further callbacks after Cancel().
    /// Calling it again is a no-op.
    virtual void Cancel() = 0;
};

/// Subscription that has nothing to deliver.
class EmptySubscription final : public Subscription {
public:
    void Request(Demand) override {}
    void Cancel() override {}
};

}  // namespace valid_pipe
