#include "veloce/core/thread/ThreadPool.hpp"
#include "veloce/core/logging/Logger.hpp"
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace veloce {
namespace core {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    // Состояние очереди; выведенные из пула потоки держат его после разрушения пула
    struct Shared {
        std::queue<std::function<void()>> tasks;    // Очередь задач
        std::mutex queueMutex;                      // Мьютекс для очереди
        std::condition_variable condition;          // Сигнал о новой задаче
        std::condition_variable idleCondition;      // Сигнал о завершении задачи
        std::atomic<bool> stop{false};              // Флаг остановки
        std::atomic<size_t> activeThreads{0};       // Количество активных потоков
        std::atomic<size_t> completedTasks{0};      // Количество выполненных задач
        std::atomic<size_t> retiredThreads{0};      // Количество выведенных потоков
        std::unordered_set<std::thread::id> busy;   // Потоки, выполняющие задачу
        std::unordered_set<std::thread::id> retired; // Выведенные потоки
        std::shared_ptr<spdlog::logger> logger;     // Логгер пула
    };

    std::shared_ptr<Shared> shared;
    std::unordered_map<std::thread::id, std::thread> workers; // Рабочие потоки
    mutable std::mutex workersMutex;                          // Мьютекс для списка потоков
    ThreadPoolConfig config;                                  // Конфигурация пула потоков

    Impl(const ThreadPoolConfig& cfg)
        : shared(std::make_shared<Shared>()), config(cfg) {
        shared->logger = logging::getOrCreateLogger(cfg.loggerName);

        std::lock_guard<std::mutex> lock(workersMutex);
        for (size_t i = 0; i < config.threadCount; ++i) {
            spawnWorker();
        }

        shared->logger->debug("Пул потоков инициализирован: {} потоков", workers.size());
    }

    ~Impl() {
        shutdown();
    }

    // Вызывается под workersMutex
    void spawnWorker() {
        std::thread worker(&Impl::processTasks, shared);
        const auto id = worker.get_id();
        workers.emplace(id, std::move(worker));
    }

    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(shared->queueMutex);
            shared->stop = true;
        }
        shared->condition.notify_all();

        std::unordered_map<std::thread::id, std::thread> joining;
        {
            std::lock_guard<std::mutex> lock(workersMutex);
            joining.swap(workers);
        }
        for (auto& worker : joining) {
            if (worker.second.joinable()) {
                worker.second.join();
            }
        }
    }

    static void processTasks(std::shared_ptr<Shared> shared) {
        const auto self = std::this_thread::get_id();
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(shared->queueMutex);
                shared->condition.wait(lock, [&shared] {
                    return shared->stop || !shared->tasks.empty();
                });

                if (shared->stop && shared->tasks.empty()) {
                    return;
                }

                task = std::move(shared->tasks.front());
                shared->tasks.pop();
                ++shared->activeThreads;
                shared->busy.insert(self);
            }

            try {
                task();
            } catch (const std::exception& e) {
                shared->logger->error("Ошибка выполнения задачи: {}", e.what());
            } catch (...) {
                shared->logger->error("Неизвестная ошибка выполнения задачи");
            }

            bool retired = false;
            {
                std::unique_lock<std::mutex> lock(shared->queueMutex);
                if (shared->retired.erase(self) > 0) {
                    retired = true;
                } else {
                    shared->busy.erase(self);
                    --shared->activeThreads;
                    ++shared->completedTasks;
                }
            }
            shared->idleCondition.notify_all();

            if (retired) {
                shared->logger->debug("Выведенный поток завершил задачу");
                return;
            }
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула потоков");
    }
    pImpl = std::make_unique<Impl>(config);
}

// Деструктор
ThreadPool::~ThreadPool() = default;

// Добавление задачи в очередь
void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;

    auto& shared = *pImpl->shared;
    {
        std::unique_lock<std::mutex> lock(shared.queueMutex);

        if (shared.stop) {
            throw std::runtime_error("Пул потоков остановлен");
        }

        // Проверка размера очереди
        if (shared.tasks.size() >= pImpl->config.queueSize) {
            shared.logger->warn("Очередь задач переполнена: {}", shared.tasks.size());
            throw std::runtime_error("Очередь задач переполнена");
        }

        shared.tasks.push(std::move(task));
    }
    shared.condition.notify_one();
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->shared->activeThreads.load();
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::unique_lock<std::mutex> lock(pImpl->shared->queueMutex);
    return pImpl->shared->tasks.size();
}

// Проверка пустоты очереди
bool ThreadPool::isQueueEmpty() const {
    std::unique_lock<std::mutex> lock(pImpl->shared->queueMutex);
    return pImpl->shared->tasks.empty();
}

bool ThreadPool::isStopped() const {
    return pImpl->shared->stop.load();
}

// Вывод зависшего потока из пула
bool ThreadPool::retireWorker(std::thread::id workerId) {
    auto& shared = *pImpl->shared;
    std::lock_guard<std::mutex> workersLock(pImpl->workersMutex);

    auto it = pImpl->workers.find(workerId);
    if (it == pImpl->workers.end()) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(shared.queueMutex);
        if (shared.busy.erase(workerId) == 0) {
            return false;
        }
        shared.retired.insert(workerId);
        --shared.activeThreads;
        ++shared.retiredThreads;
    }

    it->second.detach();
    pImpl->workers.erase(it);
    if (!shared.stop) {
        pImpl->spawnWorker();
    }
    shared.idleCondition.notify_all();

    shared.logger->warn("Поток выведен из пула, запущена замена: потоков={}", pImpl->workers.size());
    return true;
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    auto& shared = *pImpl->shared;
    std::unique_lock<std::mutex> lock(shared.queueMutex);
    shared.idleCondition.wait(lock, [&shared] {
        return shared.tasks.empty() && shared.activeThreads.load() == 0;
    });

    shared.logger->debug("Ожидание завершения задач выполнено");
}

// Остановка пула потоков
void ThreadPool::stop() {
    pImpl->shutdown();
    pImpl->shared->logger->debug("Пул потоков остановлен");
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->shared->activeThreads.load();
    metrics.queueSize = getQueueSize();
    {
        std::lock_guard<std::mutex> lock(pImpl->workersMutex);
        metrics.totalThreads = pImpl->workers.size();
    }
    metrics.completedTasks = pImpl->shared->completedTasks.load();
    metrics.retiredThreads = pImpl->shared->retiredThreads.load();
    return metrics;
}

// Обновление метрик
void ThreadPool::updateMetrics() {
    auto metrics = getMetrics();
    pImpl->shared->logger->debug(
        "Метрики пула потоков: активных={}, очередь={}, всего={}, выполнено={}, выведено={}",
        metrics.activeThreads, metrics.queueSize, metrics.totalThreads,
        metrics.completedTasks, metrics.retiredThreads
    );
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace veloce
