/**
 * @file eventually.hpp
 * @brief Polling helper for assertions on state changed by background threads.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <thread>

namespace async_responder::test_util {

template <typename Pred>
bool eventually(Pred pred, Millis limit = Millis{2000}) {
    auto deadline = SteadyClock::now() + limit;
    while (SteadyClock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(Millis{1});
    }
    return pred();
}

}  // namespace async_responder::test_util
