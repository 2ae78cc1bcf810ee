#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace veloce {
namespace core {
namespace cache {

struct PreloadCacheMetrics {
    size_t entryCount = 0;          // Количество готовых записей
    size_t capacity = 0;            // Максимальное количество записей
    size_t inFlight = 0;            // Загрузки в состоянии Loading
    size_t queuedAssemblies = 0;    // Сборки, ожидающие свободного потока
    size_t hitCount = 0;            // getOrCreate вернул готовое значение
    size_t missCount = 0;           // getOrCreate вернул заглушку
    size_t completedLoads = 0;      // Успешные загрузки
    size_t failedLoads = 0;         // Ошибки сборщика
    size_t timeoutCount = 0;        // Загрузки, прерванные по таймауту
    size_t cancelledLoads = 0;      // Загрузки, отменённые инвалидацией или очисткой
    size_t evictionCount = 0;       // Вытесненные записи
    size_t pendingTimers = 0;       // Взведённые таймеры загрузок
    size_t retiredWorkers = 0;      // Потоки сборки, выведенные из пула из-за зависшего сборщика
    std::chrono::steady_clock::time_point lastUpdate; // Время снятия метрик

    double hitRate() const {
        const size_t requests = hitCount + missCount;
        return requests == 0 ? 0.0 : static_cast<double>(hitCount) / requests;
    }

    nlohmann::json toJson() const {
        return {
            {"entryCount", entryCount},
            {"capacity", capacity},
            {"inFlight", inFlight},
            {"queuedAssemblies", queuedAssemblies},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"hitRate", hitRate()},
            {"completedLoads", completedLoads},
            {"failedLoads", failedLoads},
            {"timeoutCount", timeoutCount},
            {"cancelledLoads", cancelledLoads},
            {"evictionCount", evictionCount},
            {"pendingTimers", pendingTimers},
            {"retiredWorkers", retiredWorkers},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace veloce
