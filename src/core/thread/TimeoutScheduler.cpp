#include "veloce/core/thread/TimeoutScheduler.hpp"
#include "veloce/core/logging/Logger.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>

namespace veloce {
namespace core {
namespace thread {

// Реализация PIMPL
struct TimeoutScheduler::Impl {
    using Deadline = std::pair<Clock::time_point, TimerId>;

    std::map<Deadline, Callback> timers;                      // Таймеры по сроку
    std::unordered_map<TimerId, Clock::time_point> index;     // Срок по идентификатору
    mutable std::mutex mutex;
    std::condition_variable condition;
    bool stopped = false;
    TimerId nextId = 1;
    std::shared_ptr<spdlog::logger> logger;
    std::thread worker;

    explicit Impl(const std::string& loggerName)
        : logger(logging::getOrCreateLogger(loggerName)) {
        worker = std::thread([this] {
            run();
        });
        logger->debug("Планировщик таймеров запущен");
    }

    ~Impl() {
        shutdown();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped && !worker.joinable()) {
                return;
            }
            stopped = true;
            timers.clear();
            index.clear();
        }
        condition.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopped) {
            if (timers.empty()) {
                condition.wait(lock, [this] {
                    return stopped || !timers.empty();
                });
                continue;
            }

            auto next = timers.begin();
            const auto deadline = next->first.first;
            if (Clock::now() < deadline) {
                // Ранний таймер или остановка разбудят поток раньше срока
                condition.wait_until(lock, deadline);
                continue;
            }

            Callback callback = std::move(next->second);
            index.erase(next->first.second);
            timers.erase(next);

            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                logger->error("Ошибка выполнения таймера: {}", e.what());
            }
            lock.lock();
        }
    }
};

TimeoutScheduler::TimeoutScheduler(const std::string& loggerName)
    : pImpl(std::make_unique<Impl>(loggerName)) {
}

TimeoutScheduler::~TimeoutScheduler() = default;

TimeoutScheduler::TimerId TimeoutScheduler::schedule(std::chrono::milliseconds delay, Callback callback) {
    if (!callback) {
        throw std::invalid_argument("Пустой callback таймера");
    }

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            throw std::runtime_error("Планировщик таймеров остановлен");
        }

        id = pImpl->nextId++;
        const auto deadline = Clock::now() + delay;
        pImpl->timers.emplace(Impl::Deadline{deadline, id}, std::move(callback));
        pImpl->index.emplace(id, deadline);
    }
    pImpl->condition.notify_one();
    return id;
}

bool TimeoutScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->index.find(id);
    if (it == pImpl->index.end()) {
        return false;
    }
    pImpl->timers.erase(Impl::Deadline{it->second, id});
    pImpl->index.erase(it);
    return true;
}

size_t TimeoutScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->timers.size();
}

void TimeoutScheduler::stop() {
    pImpl->shutdown();
    pImpl->logger->debug("Планировщик таймеров остановлен");
}

} // namespace thread
} // namespace core
} // namespace veloce
