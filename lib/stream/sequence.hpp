// SPDX-License-Identifier: MIT

// lib/stream/sequence.hpp
#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

#include "lib/stream/demand.hpp"
#include "lib/stream/subscriber.hpp"
#include "lib/stream/subscription.hpp"

namespace valid_pipe {

// Sequence<T> - Publisher that emits a fixed list of values under demand.
//
// Each unit of outstanding demand releases one element. Demand returned by
// the subscriber's OnNext() is added to the outstanding count. Completes
// once every element has been delivered (immediately if the list is empty).
//
// Re-entrancy: a Request() issued from inside OnNext() only adds demand; the
// emission loop already on the stack drains it, so OnNext() never nests.
template<typename T>
class Sequence {
public:
    using Output = T;

    explicit Sequence(std::vector<T> values)
        : values_(std::make_shared<const std::vector<T>>(std::move(values))) {}

    Sequence(std::initializer_list<T> values)
        : Sequence(std::vector<T>(values)) {}

    void Subscribe(std::shared_ptr<Subscriber<T>> subscriber) const {
        auto inner = std::make_shared<Inner>(subscriber, values_);
        subscriber->OnSubscribe(inner);
        if (values_->empty()) inner->Finish();
    }

    std::size_t Size() const { return values_->size(); }

private:
    class Inner final : public Subscription, public std::enable_shared_from_this<Inner> {
    public:
        Inner(std::shared_ptr<Subscriber<T>> downstream,
              std::shared_ptr<const std::vector<T>> values)
            : downstream_(std::move(downstream)), values_(std::move(values)) {}

        void Request(Demand demand) override {
            if (!downstream_ || demand.IsNone()) return;
            demand_ += demand;
            if (emitting_) return;

            // Downstream may drop its last reference to us while we emit
            auto self = this->shared_from_this();
            {
                EmissionGuard guard(*this);
                while (downstream_ && !demand_.IsNone() && next_ < values_->size()) {
                    demand_ -= Demand::Max(1);
                    auto downstream = downstream_;
                    demand_ += downstream->OnNext((*values_)[next_++]);
                }
            }

            if (next_ == values_->size()) Finish();
        }

        void Cancel() override { downstream_.reset(); }

        void Finish() {
            if (!downstream_) return;
            auto downstream = std::move(downstream_);
            downstream_.reset();
            downstream->OnComplete();
        }

    private:
        // Scoped re-entrancy flag; cleared on unwind if OnNext() throws, so
        // a later Request() resumes emission.
        class EmissionGuard {
        public:
            explicit EmissionGuard(Inner& inner) : inner_(inner) { inner_.emitting_ = true; }
            ~EmissionGuard() { inner_.emitting_ = false; }
            EmissionGuard(const EmissionGuard&) = delete;
            EmissionGuard& operator=(const EmissionGuard&) = delete;

        private:
            Inner& inner_;
        };

        std::shared_ptr<Subscriber<T>> downstream_;
        std::shared_ptr<const std::vector<T>> values_;
        std::size_t next_ = 0;
        Demand demand_ = Demand::None();
        bool emitting_ = false;
    };

    std::shared_ptr<const std::vector<T>> values_;
};

}  // namespace valid_pipe
