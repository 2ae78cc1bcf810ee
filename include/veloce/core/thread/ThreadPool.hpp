#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace veloce {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество потоков, выполняющих задачу
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
    size_t completedTasks;   // Количество выполненных задач
    size_t retiredThreads;   // Потоки, выведенные из пула во время задачи
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 3;          // Количество рабочих потоков
    size_t queueSize = 256;          // Максимальный размер очереди
    std::string loggerName = "threadpool"; // Имя логгера

    bool validate() const {
        if (threadCount == 0) return false;
        if (queueSize == 0) return false;
        if (loggerName.empty()) return false;
        return true;
    }
};

// Пул потоков фиксированного размера с ограниченной очередью
class ThreadPool {
public:
    // Конструктор с конфигурацией, бросает std::invalid_argument
    explicit ThreadPool(const ThreadPoolConfig& config);

    // Деструктор, дожидается завершения рабочих потоков
    ~ThreadPool();

    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавление задачи в очередь.
    // Бросает std::runtime_error, если очередь переполнена или пул остановлен
    void enqueue(std::function<void()> task);

    // Получение количества активных потоков
    size_t getActiveThreadCount() const;

    // Получение размера очереди
    size_t getQueueSize() const;

    // Проверка пустоты очереди
    bool isQueueEmpty() const;

    // Проверка, остановлен ли пул
    bool isStopped() const;

    // Вывод зависшего потока из пула: поток отсоединяется и завершится
    // после текущей задачи, вместо него запускается новый.
    // Возвращает false, если поток не принадлежит пулу или уже свободен
    bool retireWorker(std::thread::id workerId);

    // Ожидание завершения всех задач
    void waitForCompletion();

    // Остановка пула потоков: оставшиеся в очереди задачи выполняются,
    // новые не принимаются. Выведенные потоки не ожидаются
    void stop();

    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

    // Обновление метрик
    void updateMetrics();

    // Получение текущей конфигурации
    ThreadPoolConfig getConfiguration() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace veloce
