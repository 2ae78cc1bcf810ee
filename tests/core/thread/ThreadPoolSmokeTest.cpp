#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include "veloce/core/thread/ThreadPool.hpp"

using veloce::core::thread::ThreadPool;
using veloce::core::thread::ThreadPoolConfig;

void smokeTestThreadPool() {
    ThreadPoolConfig config;
    config.threadCount = 2;
    config.queueSize = 16;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&counter] { ++counter; });
    }
    pool.waitForCompletion();
    assert(counter.load() == 10);
    assert(pool.isQueueEmpty());

    auto metrics = pool.getMetrics();
    assert(metrics.totalThreads == 2);
    assert(metrics.completedTasks == 10);
    pool.updateMetrics();
    std::cout << "[OK] ThreadPool smoke test\n";
}

void testQueueLimitAndStop() {
    ThreadPoolConfig config;
    config.threadCount = 1;
    config.queueSize = 1;
    ThreadPool pool(config);

    std::atomic<bool> release{false};
    pool.enqueue([&release] {
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    // Дожидаемся, пока единственный поток заберёт задачу
    while (!pool.isQueueEmpty()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    pool.enqueue([] {});

    bool overflow = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        overflow = true;
    }
    assert(overflow);

    release = true;
    pool.stop();
    assert(pool.isStopped());

    bool rejected = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    bool invalid = false;
    try {
        ThreadPoolConfig bad;
        bad.threadCount = 0;
        ThreadPool broken(bad);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);
    std::cout << "[OK] ThreadPool queue limit and stop\n";
}

void testRetireStuckWorker() {
    ThreadPoolConfig config;
    config.threadCount = 1;
    config.queueSize = 16;
    auto pool = std::make_unique<ThreadPool>(config);

    // Выведенный поток переживает пул, поэтому флаги держит shared_ptr
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::promise<std::thread::id> started;
    auto startedFuture = started.get_future();
    pool->enqueue([release, finished, &started] {
        started.set_value(std::this_thread::get_id());
        while (!*release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        *finished = true;
    });
    const auto stuck = startedFuture.get();

    assert(!pool->retireWorker(std::this_thread::get_id()));
    assert(pool->retireWorker(stuck));
    assert(!pool->retireWorker(stuck));

    // Замена забирает новые задачи, пока старый поток занят
    std::atomic<int> counter{0};
    for (int i = 0; i < 5; ++i) {
        pool->enqueue([&counter] { ++counter; });
    }
    pool->waitForCompletion();
    assert(counter.load() == 5);

    auto metrics = pool->getMetrics();
    assert(metrics.totalThreads == 1);
    assert(metrics.retiredThreads == 1);
    assert(metrics.activeThreads == 0);
    assert(metrics.completedTasks == 5);

    // Остановка не ждёт выведенный поток
    auto stopStart = std::chrono::steady_clock::now();
    pool.reset();
    assert(std::chrono::steady_clock::now() - stopStart < std::chrono::seconds(1));
    assert(!*finished);

    *release = true;
    while (!*finished) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    std::cout << "[OK] ThreadPool retire stuck worker\n";
}

void testRetireIdleWorker() {
    ThreadPoolConfig config;
    config.threadCount = 1;
    config.queueSize = 4;
    ThreadPool pool(config);

    std::promise<std::thread::id> ran;
    auto ranFuture = ran.get_future();
    pool.enqueue([&ran] { ran.set_value(std::this_thread::get_id()); });
    const auto worker = ranFuture.get();
    pool.waitForCompletion();

    // Свободный поток не выводится
    assert(!pool.retireWorker(worker));
    assert(pool.getMetrics().retiredThreads == 0);
    std::cout << "[OK] ThreadPool keeps idle worker\n";
}

void stressTestThreadPool() {
    ThreadPoolConfig config;
    config.threadCount = 4;
    config.queueSize = 20000;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    for (int i = 0; i < 10000; ++i) {
        pool.enqueue([&counter] {
            counter.fetch_add(1);
        });
    }
    pool.waitForCompletion();
    assert(counter.load() == 10000);
    std::cout << "[OK] ThreadPool stress test\n";
}

int main() {
    smokeTestThreadPool();
    testQueueLimitAndStop();
    testRetireStuckWorker();
    testRetireIdleWorker();
    stressTestThreadPool();
    std::cout << "All ThreadPool tests passed!\n";
    return 0;
}
