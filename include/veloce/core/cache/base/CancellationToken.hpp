#pragma once

#include <chrono>
#include <memory>

namespace veloce {
namespace core {
namespace cache {

/**
 * @brief Кооперативный сигнал отмены загрузки
 *
 * Копии токена разделяют одно состояние. Кэш отменяет токен при истечении
 * таймаута, инвалидации ключа или очистке; сборщик значения сам решает,
 * когда прервать работу.
 */
class CancellationToken {
public:
    CancellationToken();

    // Отмена; повторный вызов ничего не меняет
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Ожидание отмены
     *
     * @param timeout Максимальное время ожидания
     * @return true если токен отменён до истечения timeout
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

} // namespace cache
} // namespace core
} // namespace veloce
