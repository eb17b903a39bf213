// SPDX-License-Identifier: MIT

// tests/sequence_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "lib/stream/sequence.hpp"
#include "tests/test_support.hpp"

using namespace valid_pipe;
using valid_pipe::testing::RecordingSubscriber;

TEST(SequenceTest, UnlimitedDemandDrainsEverything) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    Sequence<int>{1, 2, 3}.Subscribe(subscriber);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(SequenceTest, RespectsBoundedDemand) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::Max(2));
    Sequence<int>{1, 2, 3, 4}.Subscribe(subscriber);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2}));
    EXPECT_EQ(subscriber->completions, 0);

    subscriber->Request(Demand::Max(1));
    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3}));

    subscriber->Request(Demand::Max(10));
    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(SequenceTest, DemandReturnedFromOnNextIsHonored) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::Max(1), Demand::Max(1));
    Sequence<int>{1, 2, 3}.Subscribe(subscriber);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(SequenceTest, ReentrantRequestDoesNotNest) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::Max(1));
    int depth = 0;
    int max_depth = 0;
    subscriber->on_next = [&](const int&) {
        ++depth;
        max_depth = std::max(max_depth, depth);
        subscriber->Request(Demand::Max(1));
        --depth;
    };
    Sequence<int>{1, 2, 3}.Subscribe(subscriber);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(max_depth, 1);
    EXPECT_EQ(subscriber->completions, 1);
    subscriber->on_next = nullptr;
}

TEST(SequenceTest, CancelStopsEmission) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>();
    subscriber->on_next = [&](const int& v) {
        if (v == 2) subscriber->Cancel();
    };
    Sequence<int>{1, 2, 3}.Subscribe(subscriber);

    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2}));
    EXPECT_EQ(subscriber->completions, 0);
    subscriber->on_next = nullptr;
}

TEST(SequenceTest, EmptySequenceCompletesImmediately) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::None());
    Sequence<int>(std::vector<int>{}).Subscribe(subscriber);

    EXPECT_TRUE(subscriber->values.empty());
    EXPECT_EQ(subscriber->completions, 1);
}

TEST(SequenceTest, ThrowingSubscriberDoesNotStallEmission) {
    auto subscriber = std::make_shared<RecordingSubscriber<int>>(Demand::None());
    subscriber->on_next = [](const int& v) {
        if (v == 1) throw std::runtime_error("consumer failed");
    };
    Sequence<int>{1, 2, 3}.Subscribe(subscriber);

    EXPECT_THROW(subscriber->Request(Demand::Max(1)), std::runtime_error);
    EXPECT_EQ(subscriber->values, std::vector<int>{1});

    subscriber->on_next = nullptr;
    subscriber->Request(Demand::Max(5));
    EXPECT_EQ(subscriber->values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(subscriber->completions, 1);
}
