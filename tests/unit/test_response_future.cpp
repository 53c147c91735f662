/**
 * @file test_response_future.cpp
 * @brief Unit tests for the future-returning surface.
 */

#include "lifecycle/response_future.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace async_responder;
using namespace std::chrono_literals;

TEST(ResponseFutureTest, CompleteOnce) {
    TimerService timers;
    auto future = ResponseFuture::create("req-1", timers);

    EXPECT_FALSE(future.is_done());
    EXPECT_TRUE(future.complete("payload"));
    EXPECT_FALSE(future.complete("again"));
    EXPECT_FALSE(future.complete_with_error(Error{"too late"}));

    EXPECT_TRUE(future.is_done());
    auto outcome = future.get();
    ASSERT_TRUE(outcome.is<Success>());
    EXPECT_EQ(outcome.as<Success>().value, "payload");
}

TEST(ResponseFutureTest, CompleteWithError) {
    TimerService timers;
    auto future = ResponseFuture::create("req-2", timers);
    EXPECT_TRUE(future.complete_with_error(Error{ErrorKind::TaskError, "An error occurred"}));

    auto outcome = future.get();
    ASSERT_TRUE(outcome.is<Failure>());
    EXPECT_EQ(to_response(outcome).status, StatusCode::InternalServerError);
}

TEST(ResponseFutureTest, CopiesShareState) {
    TimerService timers;
    auto future = ResponseFuture::create("req-3", timers);
    auto copy = future;

    EXPECT_TRUE(copy.complete("shared"));
    EXPECT_TRUE(future.is_done());
    EXPECT_EQ(future.get().as<Success>().value, "shared");
}

TEST(ResponseFutureTest, ThenRunsOnCompletionAndReplays) {
    TimerService timers;
    auto future = ResponseFuture::create("req-4", timers);
    std::vector<std::string> seen;

    future.then([&seen](const Outcome& o) { seen.push_back("early:" + o.describe()); });
    ASSERT_TRUE(future.complete("v"));
    future.then([&seen](const Outcome& o) { seen.push_back("late:" + o.describe()); });

    EXPECT_EQ(seen, (std::vector<std::string>{"early:ok", "late:ok"}));
}

TEST(ResponseFutureTest, WaitForTimesOutWhilePending) {
    TimerService timers;
    auto future = ResponseFuture::create("req-5", timers);
    EXPECT_FALSE(future.wait_for(20ms).has_value());
}

TEST(ResponseFutureTest, GetBlocksUntilCompletedFromAnotherThread) {
    TimerService timers;
    auto future = ResponseFuture::create("req-6", timers);

    std::jthread producer([future]() mutable {
        std::this_thread::sleep_for(30ms);
        (void)future.complete("from producer");
    });

    auto outcome = future.get();
    EXPECT_EQ(outcome.as<Success>().value, "from producer");
}

// ─── Deadline ────────────────────────────────

TEST(ResponseFutureTest, CompleteAfterTimeoutUsesFallback) {
    TimerService timers;
    auto future = ResponseFuture::create("req-7", timers);
    future.complete_after_timeout("Operation timed out", 20ms);

    auto outcome = future.wait_for(2s);
    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(outcome->is<TimedOut>());
    EXPECT_EQ(to_response(*outcome),
              (Response{StatusCode::ServiceUnavailable, "Operation timed out"}));
    EXPECT_FALSE(future.complete("late"));
}

TEST(ResponseFutureTest, CompletionBeforeDeadlineWins) {
    TimerService timers;
    auto future = ResponseFuture::create("req-8", timers);
    future.complete_after_timeout("Operation timed out", 40ms);
    ASSERT_TRUE(future.complete("fast"));

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(future.get().is<Success>());
}

// ─── Cancellation ────────────────────────────

TEST(ResponseFutureTest, CancelNotifiesProducer) {
    TimerService timers;
    auto future = ResponseFuture::create("req-9", timers);
    std::atomic<int> notified{0};
    future.on_cancelled([&notified] { ++notified; });

    EXPECT_TRUE(future.cancel());
    EXPECT_FALSE(future.cancel());
    EXPECT_TRUE(future.is_cancelled());
    EXPECT_EQ(notified.load(), 1);

    auto outcome = future.get();
    ASSERT_TRUE(outcome.is<Cancelled>());
    EXPECT_EQ(outcome.as<Cancelled>().reason, "Consumer cancelled");
}

TEST(ResponseFutureTest, OnCancelledAfterCancelRunsImmediately) {
    TimerService timers;
    auto future = ResponseFuture::create("req-10", timers);
    ASSERT_TRUE(future.cancel("gone"));

    bool ran = false;
    future.on_cancelled([&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(ResponseFutureTest, OnCancelledDroppedAfterNormalCompletion) {
    TimerService timers;
    auto future = ResponseFuture::create("req-11", timers);
    bool before = false;
    bool after = false;
    future.on_cancelled([&before] { before = true; });

    ASSERT_TRUE(future.complete("v"));
    future.on_cancelled([&after] { after = true; });
    EXPECT_FALSE(future.cancel());

    EXPECT_FALSE(before);
    EXPECT_FALSE(after);
    EXPECT_FALSE(future.is_cancelled());
}
