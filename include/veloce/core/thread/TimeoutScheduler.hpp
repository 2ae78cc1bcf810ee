#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace veloce {
namespace core {
namespace thread {

/**
 * @brief Планировщик отложенных вызовов
 *
 * Один фоновый поток хранит таймеры, упорядоченные по сроку срабатывания,
 * и вызывает callback по истечении задержки. Используется для ограничения
 * времени загрузки в PreloadCache.
 *
 * @note Потокобезопасен
 * @note Callback выполняется в потоке планировщика и не должен блокироваться
 */
class TimeoutScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    /**
     * @brief Конструктор
     *
     * Запускает поток планировщика.
     *
     * @param loggerName Имя логгера
     */
    explicit TimeoutScheduler(const std::string& loggerName = "timeoutscheduler");

    /**
     * @brief Деструктор
     *
     * Останавливает планировщик; несработавшие таймеры отбрасываются.
     */
    ~TimeoutScheduler();

    TimeoutScheduler(const TimeoutScheduler&) = delete;
    TimeoutScheduler& operator=(const TimeoutScheduler&) = delete;

    /**
     * @brief Запланировать вызов
     *
     * @param delay Задержка до срабатывания
     * @param callback Вызываемая функция
     * @return Идентификатор таймера
     * @throws std::runtime_error если планировщик остановлен
     */
    TimerId schedule(std::chrono::milliseconds delay, Callback callback);

    /**
     * @brief Отменить таймер
     *
     * @param id Идентификатор таймера
     * @return true если таймер ещё не сработал и был удалён
     */
    bool cancel(TimerId id);

    // Количество ожидающих таймеров
    size_t pendingCount() const;

    // Остановка планировщика
    void stop();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace veloce
