// SPDX-License-Identifier: MIT

// tests/passthrough_subject_test.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

#include "lib/stream/passthrough_subject.hpp"
#include "lib/stream/publisher.hpp"
#include "tests/mock_subscription.hpp"
#include "tests/test_support.hpp"

using namespace valid_pipe;
using valid_pipe::testing::MockSubscription;
using valid_pipe::testing::RecordingSubscriber;

static_assert(Subject<PassthroughSubject<std::string>>);

TEST(PassthroughSubjectTest, RelaysToSubscribersWithDemand) {
    PassthroughSubject<std::string> subject;
    auto a = std::make_shared<RecordingSubscriber<std::string>>();
    auto b = std::make_shared<RecordingSubscriber<std::string>>();
    subject.Subscribe(a);
    subject.Subscribe(b);

    subject.Send("one");
    subject.Send("two");

    EXPECT_EQ(a->values, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(b->values, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(subject.SubscriberCount(), 2u);
}

TEST(PassthroughSubjectTest, DropsValuesWithoutDemand) {
    PassthroughSubject<int> subject;
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::Max(1));
    subject.Subscribe(subscriber);

    subject.Send(1);
    subject.Send(2);  // no demand left, dropped
    subscriber->Request(Demand::Max(1));
    subject.Send(3);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 3}));
}

TEST(PassthroughSubjectTest, CompletionReachesEveryoneOnce) {
    PassthroughSubject<int> subject;
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    subject.Subscribe(subscriber);

    subject.SendComplete();
    subject.SendComplete();
    subject.Send(1);

    EXPECT_EQ(subscriber->completions, 1);
    EXPECT_TRUE(subscriber->values.empty());
    EXPECT_TRUE(subject.IsTerminated());
    EXPECT_EQ(subject.SubscriberCount(), 0u);
}

TEST(PassthroughSubjectTest, LateSubscriberSeesTerminalSignal) {
    PassthroughSubject<int> subject;
    subject.SendError(Error{ErrorCode::UpstreamFailed, "closed"});

    auto late = std::make_shared<RecordingSubscriber<int>>();
    subject.Subscribe(late);

    EXPECT_EQ(late->subscribe_count, 1);
    ASSERT_EQ(late->errors.size(), 1u);
    EXPECT_EQ(late->errors[0].message, "closed");
}

TEST(PassthroughSubjectTest, CancelledSubscriberIsDetached) {
    PassthroughSubject<int> subject;
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    subject.Subscribe(subscriber);

    subscriber->Cancel();
    subject.Send(1);

    EXPECT_TRUE(subscriber->values.empty());
    EXPECT_EQ(subject.SubscriberCount(), 0u);
}

TEST(PassthroughSubjectTest, CopiesShareState) {
    PassthroughSubject<int> subject;
    auto copy = subject;
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    subject.Subscribe(subscriber);

    copy.Send(5);

    EXPECT_EQ(subscriber->values, std::vector<int>{5});
}

TEST(PassthroughSubjectTest, SendSubscriptionRequestsUnlimited) {
    auto upstream = std::make_shared<MockSubscription>();
    EXPECT_CALL(*upstream, Request(Demand::Unlimited())).Times(1);

    PassthroughSubject<int> subject;
    subject.SendSubscription(upstream);
}

TEST(PassthroughSubjectTest, SendSubscriptionAfterTerminationCancels) {
    auto upstream = std::make_shared<MockSubscription>();
    EXPECT_CALL(*upstream, Request(::testing::_)).Times(0);
    EXPECT_CALL(*upstream, Cancel()).Times(1);

    PassthroughSubject<int> subject;
    subject.SendComplete();
    subject.SendSubscription(upstream);
}
