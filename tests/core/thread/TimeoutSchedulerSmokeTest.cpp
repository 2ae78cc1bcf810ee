#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "veloce/core/cache/base/CancellationToken.hpp"
#include "veloce/core/thread/TimeoutScheduler.hpp"

using veloce::core::cache::CancellationToken;
using veloce::core::thread::TimeoutScheduler;
using namespace std::chrono_literals;

void smokeTestTimeoutScheduler() {
    TimeoutScheduler scheduler;
    std::mutex mutex;
    std::vector<int> fired;

    scheduler.schedule(60ms, [&] { std::lock_guard<std::mutex> lock(mutex); fired.push_back(3); });
    scheduler.schedule(20ms, [&] { std::lock_guard<std::mutex> lock(mutex); fired.push_back(1); });
    scheduler.schedule(40ms, [&] { std::lock_guard<std::mutex> lock(mutex); fired.push_back(2); });
    auto cancelled = scheduler.schedule(30ms, [&] { std::lock_guard<std::mutex> lock(mutex); fired.push_back(99); });
    assert(scheduler.cancel(cancelled));
    assert(!scheduler.cancel(cancelled));

    std::this_thread::sleep_for(300ms);
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert((fired == std::vector<int>{1, 2, 3}));
    }
    assert(scheduler.pendingCount() == 0);
    std::cout << "[OK] TimeoutScheduler smoke test\n";
}

void testStopDropsPendingTimers() {
    TimeoutScheduler scheduler;
    std::atomic<int> fired{0};
    scheduler.schedule(200ms, [&fired] { ++fired; });
    assert(scheduler.pendingCount() == 1);

    scheduler.stop();
    std::this_thread::sleep_for(300ms);
    assert(fired.load() == 0);

    bool rejected = false;
    try {
        scheduler.schedule(1ms, [] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] TimeoutScheduler stop\n";
}

void testCallbackErrorsAreContained() {
    TimeoutScheduler scheduler;
    std::atomic<bool> secondFired{false};
    scheduler.schedule(5ms, [] { throw std::runtime_error("boom"); });
    scheduler.schedule(10ms, [&secondFired] { secondFired = true; });
    std::this_thread::sleep_for(200ms);
    assert(secondFired.load());
    std::cout << "[OK] TimeoutScheduler callback errors\n";
}

void testCancellationToken() {
    CancellationToken token;
    CancellationToken copy = token;
    assert(!copy.isCancelled());
    assert(!copy.waitFor(10ms));

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    assert(copy.waitFor(5s));
    assert(std::chrono::steady_clock::now() - start < 2s);
    canceller.join();
    assert(token.isCancelled());
    std::cout << "[OK] CancellationToken\n";
}

int main() {
    smokeTestTimeoutScheduler();
    testStopDropsPendingTimers();
    testCallbackErrorsAreContained();
    testCancellationToken();
    std::cout << "All TimeoutScheduler tests passed!\n";
    return 0;
}
