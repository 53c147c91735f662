/**
 * @file test_pending_request.cpp
 * @brief Unit tests for PendingRequest single resolution, observers,
 *        deadline and disconnect handling.
 */

#include "lifecycle/async_response.hpp"
#include "lifecycle/channel.hpp"
#include "lifecycle/pending_request.hpp"

#include "eventually.hpp"
#include "slow_channel.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace async_responder;
using namespace std::chrono_literals;
using async_responder::test_util::eventually;
using async_responder::test_util::SlowChannel;

// ─── Resolution ──────────────────────────────

TEST(PendingRequestTest, FirstResolveWins) {
    auto channel = std::make_shared<BufferedChannel>();
    auto request = PendingRequest::create("req-1", channel);

    EXPECT_TRUE(request->is_open());
    EXPECT_TRUE(request->resolve(Success{"first"}));
    EXPECT_FALSE(request->resolve(Failure{Error{"second"}}));
    EXPECT_FALSE(request->resolve(TimedOut{"third"}));

    EXPECT_EQ(request->state(), RequestState::Resolved);
    ASSERT_TRUE(request->outcome().has_value());
    EXPECT_EQ(request->outcome()->as<Success>().value, "first");
    ASSERT_EQ(channel->send_count(), 1u);
    EXPECT_EQ(channel->last_response()->status, StatusCode::Ok);
    EXPECT_EQ(channel->last_response()->body, "first");
}

TEST(PendingRequestTest, ConcurrentResolveExactlyOnce) {
    constexpr int kRounds = 200;
    constexpr int kProducers = 8;

    for (int round = 0; round < kRounds; ++round) {
        auto channel = std::make_shared<BufferedChannel>();
        auto request = PendingRequest::create("req-race", channel);
        std::atomic<int> observed{0};
        request->register_observer([&observed](const Outcome&) { ++observed; });

        std::latch go(kProducers);
        std::atomic<int> winners{0};
        std::vector<std::jthread> producers;
        for (int p = 0; p < kProducers; ++p) {
            producers.emplace_back([&, p] {
                go.arrive_and_wait();
                bool won = (p % 2 == 0)
                    ? request->resolve(Success{std::to_string(p)})
                    : request->resolve(TimedOut{"deadline"});
                if (won) ++winners;
            });
        }
        producers.clear();

        EXPECT_EQ(winners.load(), 1);
        EXPECT_EQ(observed.load(), 1);
        EXPECT_EQ(channel->send_count(), 1u);
    }
}

TEST(PendingRequestTest, RequestWithoutChannelOnlyNotifies) {
    auto request = PendingRequest::create("req-2");
    std::optional<OutcomeKind> seen;
    request->register_observer([&seen](const Outcome& o) { seen = o.kind(); });
    EXPECT_TRUE(request->resolve(Cancelled{"bye"}));
    EXPECT_EQ(seen, OutcomeKind::Cancelled);
}

// ─── Observers ───────────────────────────────

TEST(PendingRequestTest, ObserversRunInRegistrationOrderAfterTransmission) {
    auto channel = std::make_shared<BufferedChannel>();
    auto request = PendingRequest::create("req-3", channel);
    std::vector<int> order;
    size_t sent_when_notified = 0;

    request->register_observer([&](const Outcome&) {
        sent_when_notified = channel->send_count();
        order.push_back(1);
    });
    request->register_observer([&](const Outcome&) { order.push_back(2); });
    request->register_observer([&](const Outcome&) { order.push_back(3); });

    ASSERT_TRUE(request->resolve(Success{"v"}));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(sent_when_notified, 1u);
}

TEST(PendingRequestTest, LateObserverIsReplayed) {
    auto request = PendingRequest::create("req-4");
    ASSERT_TRUE(request->resolve(TimedOut{"late"}));

    std::optional<std::string> message;
    request->register_observer([&message](const Outcome& o) { message = o.as<TimedOut>().message; });
    EXPECT_EQ(message, "late");
}

TEST(PendingRequestTest, ThrowingObserverDoesNotStopOthers) {
    auto request = PendingRequest::create("req-5");
    bool second_ran = false;
    request->register_observer([](const Outcome&) { throw std::runtime_error("observer failed"); });
    request->register_observer([&second_ran](const Outcome&) { second_ran = true; });

    EXPECT_TRUE(request->resolve(Success{"v"}));
    EXPECT_TRUE(second_ran);
}

TEST(PendingRequestTest, NonStandardThrowDoesNotStopOthers) {
    auto request = PendingRequest::create("req-16");
    bool second_ran = false;
    request->register_observer([](const Outcome&) { throw 42; });
    request->register_observer([&second_ran](const Outcome&) { second_ran = true; });

    EXPECT_TRUE(request->resolve(Success{"v"}));
    EXPECT_TRUE(second_ran);
}

TEST(PendingRequestTest, ObserverRegisteredDuringDeliveryRunsAfterEarlierOnes) {
    auto channel = std::make_shared<SlowChannel>(200ms);
    auto request = PendingRequest::create("req-17", channel);
    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](std::string name) {
        return [&, name](const Outcome&) {
            std::lock_guard lock(mutex);
            order.push_back(name);
        };
    };

    request->register_observer(record("A"));
    std::jthread resolver([request] { EXPECT_TRUE(request->resolve(Success{"v"})); });
    ASSERT_TRUE(eventually([&] { return channel->entered(); }));

    // The winner is inside send(); this registration must queue behind "A".
    request->register_observer(record("B"));
    resolver.join();

    std::lock_guard lock(mutex);
    EXPECT_EQ(order, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(channel->sent(), 1);
}

// ─── Deadline ────────────────────────────────

TEST(PendingRequestTest, DeadlineResolvesWithDefaultMessage) {
    TimerService timers;
    auto channel = std::make_shared<BufferedChannel>();
    auto request = PendingRequest::create("req-6", channel);
    request->arm_timeout(timers, 20ms);

    ASSERT_TRUE(eventually([&] { return !request->is_open(); }));
    EXPECT_EQ(channel->last_response(),
              (Response{StatusCode::ServiceUnavailable, "Operation timed out"}));
}

TEST(PendingRequestTest, TimeoutHandlerSuppliesMessage) {
    TimerService timers;
    auto channel = std::make_shared<BufferedChannel>();
    AsyncResponse response(PendingRequest::create("req-7", channel), timers);
    response.on_timeout([] { return std::string{"Too slow"}; });
    response.set_timeout(20ms);

    ASSERT_TRUE(eventually([&] { return channel->send_count() == 1; }));
    EXPECT_EQ(channel->last_response()->body, "Too slow");
    EXPECT_FALSE(response.resume(std::string{"late result"}));
    EXPECT_EQ(channel->send_count(), 1u);
}

TEST(PendingRequestTest, ThrowingTimeoutHandlerFallsBackToDefault) {
    TimerService timers;
    auto request = PendingRequest::create("req-8");
    request->set_timeout_handler([]() -> std::string { throw std::runtime_error("handler failed"); });
    request->arm_timeout(timers, 10ms);

    ASSERT_TRUE(eventually([&] { return !request->is_open(); }));
    EXPECT_EQ(request->outcome()->as<TimedOut>().message, "Operation timed out");
}

TEST(PendingRequestTest, ResolutionCancelsDeadline) {
    TimerService timers;
    auto channel = std::make_shared<BufferedChannel>();
    AsyncResponse response(PendingRequest::create("req-9", channel), timers);
    response.set_timeout(40ms);

    EXPECT_TRUE(response.resume(std::string{"done"}));
    std::this_thread::sleep_for(80ms);
    EXPECT_EQ(channel->send_count(), 1u);
    EXPECT_EQ(channel->last_response()->status, StatusCode::Ok);
}

TEST(PendingRequestTest, RearmingReplacesDeadline) {
    TimerService timers;
    auto request = PendingRequest::create("req-10");
    request->arm_timeout(timers, 20ms);
    request->arm_timeout(timers, 300ms);

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(request->is_open());
    EXPECT_TRUE(request->resolve(Success{"v"}));
}

TEST(PendingRequestTest, DeadlineDoesNotKeepRequestAlive) {
    TimerService timers;
    std::weak_ptr<PendingRequest> weak;
    {
        auto request = PendingRequest::create("req-11");
        request->arm_timeout(timers, 20ms);
        weak = request;
    }
    EXPECT_TRUE(weak.expired());
    std::this_thread::sleep_for(50ms);
}

// ─── Disconnect ──────────────────────────────

TEST(PendingRequestTest, DisconnectRunsObserversButDoesNotResolve) {
    TimerService timers;
    auto channel = std::make_shared<BufferedChannel>();
    auto request = PendingRequest::create("req-12", channel);
    int disconnects = 0;
    request->register_disconnect_observer([&disconnects] { ++disconnects; });
    request->arm_timeout(timers, 30ms);

    request->notify_disconnect();
    request->notify_disconnect();
    EXPECT_EQ(disconnects, 1);
    EXPECT_TRUE(request->is_open());
    EXPECT_TRUE(request->peer_gone());

    // Deadline was cancelled by the disconnect.
    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(request->is_open());

    // Late result resolves the request but nothing reaches the client.
    EXPECT_TRUE(request->resolve(Failure{Error{ErrorKind::Interrupted, "Task interrupted"}}));
    EXPECT_EQ(channel->send_count(), 0u);
}

TEST(PendingRequestTest, DisconnectObserverAfterDisconnectRunsImmediately) {
    auto request = PendingRequest::create("req-13");
    request->notify_disconnect();

    bool ran = false;
    request->register_disconnect_observer([&ran] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(PendingRequestTest, DisconnectAfterResolutionIsIgnored) {
    auto request = PendingRequest::create("req-14");
    bool ran = false;
    request->register_disconnect_observer([&ran] { ran = true; });
    ASSERT_TRUE(request->resolve(Success{"v"}));

    request->notify_disconnect();
    EXPECT_FALSE(ran);
    EXPECT_FALSE(request->peer_gone());
}

TEST(PendingRequestTest, ChannelDisconnectReachesRequest) {
    auto channel = std::make_shared<BufferedChannel>();
    auto request = PendingRequest::create("req-15", channel);
    std::weak_ptr<PendingRequest> weak = request;
    ASSERT_TRUE(channel->watch_disconnect([weak] {
        if (auto r = weak.lock()) r->notify_disconnect();
    }));

    channel->disconnect();
    EXPECT_TRUE(request->peer_gone());
    EXPECT_TRUE(channel->disconnected());
}
