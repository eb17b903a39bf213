// SPDX-License-Identifier: MIT

// tests/just_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "lib/stream/just.hpp"
#include "tests/test_support.hpp"

using namespace valid_pipe;
using valid_pipe::testing::RecordingSubscriber;

TEST(JustTest, EmitsValueThenCompletes) {
    auto subscriber = std::make_shared<RecordingSubscriber<std::string>>();
    Just<std::string>("foo-bar").Subscribe(subscriber);

    ASSERT_EQ(subscriber->values.size(), 1u);
    EXPECT_EQ(subscriber->values[0], "foo-bar");
    EXPECT_EQ(subscriber->completions, 1);
    EXPECT_TRUE(subscriber->errors.empty());
}

TEST(JustTest, WaitsForDemand) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::None());
    Just<int>(7).Subscribe(subscriber);

    EXPECT_TRUE(subscriber->values.empty());
    EXPECT_EQ(subscriber->completions, 0);

    subscriber->Request(Demand::None());
    EXPECT_TRUE(subscriber->values.empty());

    subscriber->Request(Demand::Max(1));
    ASSERT_EQ(subscriber->values.size(), 1u);
    EXPECT_EQ(subscriber->values[0], 7);
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(JustTest, LaterRequestsAreNoOps) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::Max(1));
    Just<int>(7).Subscribe(subscriber);
    subscriber->Request(Demand::Max(5));

    EXPECT_EQ(subscriber->values.size(), 1u);
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(JustTest, CancelBeforeDemandEmitsNothing) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::None());
    Just<int>(7).Subscribe(subscriber);
    subscriber->Cancel();
    subscriber->Request(Demand::Max(1));

    EXPECT_TRUE(subscriber->values.empty());
    EXPECT_EQ(subscriber->completions, 0);
}

TEST(JustTest, EachSubscriptionIsIndependent) {
    Just<int> just(3);
    auto a = std::make_shared<RecordingSubscriber<int>>();
    auto b = std::make_shared<RecordingSubscriber<int>>();
    just.Subscribe(a);
    just.Subscribe(b);

    EXPECT_EQ(a->values, std::vector<int>{3});
    EXPECT_EQ(b->values, std::vector<int>{3});
}

TEST(FailTest, FailsImmediately) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    Fail<int>(Error{ErrorCode::UpstreamFailed, "source down"}).Subscribe(subscriber);

    EXPECT_EQ(subscriber->subscribe_count, 1);
    ASSERT_EQ(subscriber->errors.size(), 1u);
    EXPECT_EQ(subscriber->errors[0].message, "source down");
    EXPECT_TRUE(subscriber->values.empty());
}
