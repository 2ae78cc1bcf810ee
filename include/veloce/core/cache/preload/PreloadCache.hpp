#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "veloce/core/cache/base/CancellationToken.hpp"
#include "veloce/core/cache/base/LoadStatus.hpp"
#include "veloce/core/cache/metrics/PreloadCacheConfig.hpp"
#include "veloce/core/cache/metrics/PreloadCacheMetrics.hpp"
#include "veloce/core/logging/Logger.hpp"
#include "veloce/core/thread/ThreadPool.hpp"
#include "veloce/core/thread/TimeoutScheduler.hpp"

namespace veloce {
namespace core {
namespace cache {
namespace preload {

/**
 * @brief Кэш предварительной загрузки состояния экранов
 *
 * Хранит ограниченное количество значений, собранных заранее, чтобы экран
 * деталей открывался без ожидания. Значение для ключа строит сборщик,
 * переданный вызывающим кодом; кэш отвечает за статусы загрузок,
 * дедупликацию, таймаут и вытеснение.
 *
 * Статусы ключа: NotStarted -> Loading -> Completed | Failed(reason).
 * Вытеснение идёт в порядке вставки (самые старые записи первыми),
 * обращения порядок не меняют.
 *
 * @note Потокобезопасен: всё состояние защищено одним мьютексом
 * @note Сборка выполняется в собственном пуле потоков, таймаут отслеживает TimeoutScheduler
 * @note Ошибки загрузки не пробрасываются вызывающему, а записываются в статус ключа
 * @note Поток, на котором сборщик не вернулся к таймауту, отмене или разрушению кэша,
 *       выводится из пула и заменяется новым; его поздний результат отбрасывается
 *
 * @tparam Key Тип ключа, форматируемый через fmt (например, std::string)
 * @tparam Value Тип значения; для getOrCreate должен иметь конструктор по умолчанию
 * @tparam Hash Хеш-функция ключа
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class PreloadCache {
public:
    using KeyType = Key;
    using ValueType = Value;
    using ValuePtr = std::shared_ptr<const Value>;
    /// Сборщик значения. Должен периодически проверять токен и прерываться при отмене;
    /// сборщик, игнорирующий токен, занимает отдельный поток до своего завершения.
    using Assembler = std::function<Value(const Key&, const CancellationToken&)>;

    /**
     * @brief Конструктор
     *
     * @param config Конфигурация кэша
     * @throws std::invalid_argument если конфигурация некорректна
     */
    explicit PreloadCache(const PreloadCacheConfig& config = PreloadCacheConfig{});

    /**
     * @brief Деструктор
     *
     * Отменяет все незавершённые загрузки, выводит из пула потоки с
     * незавершённой сборкой и дожидается остановки пула и планировщика таймаутов.
     */
    ~PreloadCache();

    PreloadCache(const PreloadCache&) = delete;
    PreloadCache& operator=(const PreloadCache&) = delete;

    /**
     * @brief Предварительная загрузка значения
     *
     * Если ключ уже загружается или загружен, возвращается сразу.
     * Иначе переводит ключ в Loading, запускает сборку и ждёт, пока
     * загрузка завершится успехом, ошибкой, таймаутом или отменой.
     *
     * @param key Ключ
     * @param assemble Сборщик значения
     */
    void preload(const Key& key, Assembler assemble);

    /**
     * @brief Неблокирующая предварительная загрузка
     *
     * @return Future, готовый после завершения загрузки. Для ключа в Loading
     *         возвращается future уже идущей загрузки, для Completed готовый future.
     */
    std::shared_future<void> preloadAsync(const Key& key, Assembler assemble);

    /**
     * @brief Пакетная предварительная загрузка
     *
     * Из ключей, которые не находятся в Loading или Completed, запускает
     * не более batchWidth первых (в порядке списка) и ждёт их завершения.
     * Выбранные ключи переводятся в Loading под тем же мьютексом, что и
     * выбор, поэтому пакет дожидается каждого выбранного ключа.
     * Остальные ключи не ставятся в очередь.
     *
     * @param keys Ключи, например видимые строки списка
     * @param assemble Сборщик значения
     */
    void preloadBatch(const std::vector<Key>& keys, const Assembler& assemble);

    /**
     * @brief Получить готовое значение или заглушку
     *
     * Если значение готово, возвращает его. Иначе возвращает новую заглушку,
     * созданную конструктором по умолчанию, и запускает фоновую загрузку.
     * Заглушка не заполняется: после isReady(key) значение нужно запросить
     * повторно через get(key) или getOrCreate(key, ...).
     */
    ValuePtr getOrCreate(const Key& key, Assembler assemble);

    /**
     * @brief Получить готовое значение
     *
     * @return Значение или nullptr, если ключ не в состоянии Completed
     */
    ValuePtr get(const Key& key) const;

    bool isReady(const Key& key) const;

    // Статус ключа; NotStarted для неизвестных ключей
    LoadStatus status(const Key& key) const;

    /**
     * @brief Инвалидация ключа
     *
     * Удаляет значение и статус. Идущая загрузка отменяется через токен,
     * её результат будет отброшен.
     */
    void invalidate(const Key& key);

    // Удаление всех записей, статусов и отмена всех загрузок
    void clear();

    // Количество готовых записей
    size_t size() const;

    // Ключи готовых записей от самой старой к самой новой
    std::vector<Key> keys() const;

    PreloadCacheMetrics getMetrics() const;

    // Запись метрик в лог
    void updateMetrics();

    const PreloadCacheConfig& getConfiguration() const { return config_; }

private:
    using Promise = std::promise<void>;

    // Незавершённая загрузка ключа
    struct InFlightLoad {
        uint64_t loadId;
        CancellationToken token;
        std::shared_ptr<Promise> settled;
        std::shared_future<void> future;
        thread::TimeoutScheduler::TimerId timerId = 0;  // 0, пока таймер не взведён
    };

    // Разделяемое состояние; задачи пула и таймеры держат его после разрушения кэша
    struct State {
        mutable std::mutex mutex;
        std::unordered_map<Key, std::pair<typename std::list<Key>::iterator, ValuePtr>, Hash> entries;
        std::list<Key> insertionOrder;
        std::unordered_map<Key, LoadStatus, Hash> statuses;
        std::unordered_map<Key, InFlightLoad, Hash> inFlight;
        // Потоки, на которых сейчас выполняется сборщик, по loadId
        std::unordered_map<uint64_t, std::thread::id> assembling;
        // Обнуляются деструктором кэша; задачи пула могут пережить кэш
        thread::TimeoutScheduler* timer = nullptr;
        thread::ThreadPool* pool = nullptr;
        uint64_t nextLoadId = 1;
        size_t capacity = 0;
        size_t hitCount = 0;
        size_t missCount = 0;
        size_t completedLoads = 0;
        size_t failedLoads = 0;
        size_t timeoutCount = 0;
        size_t cancelledLoads = 0;
        size_t evictionCount = 0;
        size_t retiredWorkers = 0;
        std::shared_ptr<spdlog::logger> logger;
    };

    struct LoadHandle {
        std::shared_future<void> future;
        bool started = false;
        uint64_t loadId = 0;
        CancellationToken token;
    };

    LoadHandle startLoad(const Key& key, Assembler assemble);
    // Вызывается под мьютексом состояния
    LoadHandle beginLoad(const Key& key);
    void launchLoad(const Key& key, const LoadHandle& load, Assembler assemble);

    static void runAssembly(const std::shared_ptr<State>& state, const Key& key, uint64_t loadId,
                            const CancellationToken& token, const Assembler& assemble);
    static void settle(const std::shared_ptr<State>& state, const Key& key, uint64_t loadId,
                       LoadOutcome outcome, ValuePtr value, const std::string& reason);
    // Вызывается под мьютексом состояния
    static void cleanupOldEntries(State& state);
    static void cancelLoad(State& state, InFlightLoad& load, std::vector<std::shared_ptr<Promise>>& released);
    static void retireAssembler(State& state, uint64_t loadId);
    static std::shared_future<void> readyFuture();

    PreloadCacheConfig config_;
    std::shared_ptr<State> state_;
    std::unique_ptr<thread::TimeoutScheduler> timer_;
    std::unique_ptr<thread::ThreadPool> pool_;
};

// Алиас для кэша со строковыми ключами и значениями
using DefaultPreloadCache = PreloadCache<std::string, std::string>;

template<typename Key, typename Value, typename Hash>
PreloadCache<Key, Value, Hash>::PreloadCache(const PreloadCacheConfig& config)
    : config_(config) {
    if (!config_.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша предварительной загрузки");
    }

    state_ = std::make_shared<State>();
    state_->capacity = config_.capacity;
    state_->logger = logging::getOrCreateLogger(config_.loggerName);

    thread::ThreadPoolConfig poolConfig;
    poolConfig.threadCount = config_.workerThreads;
    poolConfig.queueSize = config_.queueSize;

    timer_ = std::make_unique<thread::TimeoutScheduler>();
    pool_ = std::make_unique<thread::ThreadPool>(poolConfig);
    state_->timer = timer_.get();
    state_->pool = pool_.get();

    state_->logger->info("PreloadCache создан: {}", config_.toJson().dump());
}

template<typename Key, typename Value, typename Hash>
PreloadCache<Key, Value, Hash>::~PreloadCache() {
    std::vector<std::shared_ptr<Promise>> released;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (auto& load : state_->inFlight) {
            cancelLoad(*state_, load.second, released);
        }
        state_->inFlight.clear();
        state_->timer = nullptr;
        state_->pool = nullptr;
    }
    for (auto& settled : released) {
        settled->set_value();
    }

    timer_->stop();
    pool_->stop();
    state_->logger->debug("PreloadCache остановлен, отменено загрузок: {}", released.size());
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::preload(const Key& key, Assembler assemble) {
    LoadHandle load = startLoad(key, std::move(assemble));
    if (load.started) {
        load.future.wait();
    }
}

template<typename Key, typename Value, typename Hash>
std::shared_future<void> PreloadCache<Key, Value, Hash>::preloadAsync(const Key& key, Assembler assemble) {
    return startLoad(key, std::move(assemble)).future;
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::preloadBatch(const std::vector<Key>& keys, const Assembler& assemble) {
    // Ключи выбираются и переводятся в Loading под одним мьютексом:
    // выбранный ключ не может запустить другой поток
    std::vector<std::pair<Key, LoadHandle>> claimed;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        std::unordered_set<Key, Hash> seen;
        for (const auto& key : keys) {
            if (claimed.size() >= config_.batchWidth) {
                break;
            }
            if (!seen.insert(key).second) {
                continue;
            }
            auto it = state_->statuses.find(key);
            if (it != state_->statuses.end() &&
                (it->second.isLoading() || it->second.isCompleted())) {
                continue;
            }
            claimed.emplace_back(key, beginLoad(key));
        }
    }

    state_->logger->debug("Пакетная загрузка: запрошено={}, запущено={}", keys.size(), claimed.size());

    for (const auto& load : claimed) {
        launchLoad(load.first, load.second, assemble);
    }
    for (const auto& load : claimed) {
        load.second.future.wait();
    }
}

template<typename Key, typename Value, typename Hash>
typename PreloadCache<Key, Value, Hash>::ValuePtr
PreloadCache<Key, Value, Hash>::getOrCreate(const Key& key, Assembler assemble) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->entries.find(key);
        if (it != state_->entries.end()) {
            ++state_->hitCount;
            return it->second.second;
        }
        ++state_->missCount;
    }

    startLoad(key, std::move(assemble));
    return std::make_shared<const Value>();
}

template<typename Key, typename Value, typename Hash>
typename PreloadCache<Key, Value, Hash>::ValuePtr
PreloadCache<Key, Value, Hash>::get(const Key& key) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->entries.find(key);
    if (it == state_->entries.end()) {
        return nullptr;
    }
    return it->second.second;
}

template<typename Key, typename Value, typename Hash>
bool PreloadCache<Key, Value, Hash>::isReady(const Key& key) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->statuses.find(key);
    return it != state_->statuses.end() && it->second.isCompleted() &&
           state_->entries.count(key) > 0;
}

template<typename Key, typename Value, typename Hash>
LoadStatus PreloadCache<Key, Value, Hash>::status(const Key& key) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->statuses.find(key);
    if (it == state_->statuses.end()) {
        return LoadStatus::notStarted();
    }
    return it->second;
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::invalidate(const Key& key) {
    std::vector<std::shared_ptr<Promise>> released;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto entry = state_->entries.find(key);
        if (entry != state_->entries.end()) {
            state_->insertionOrder.erase(entry->second.first);
            state_->entries.erase(entry);
        }
        state_->statuses.erase(key);

        auto load = state_->inFlight.find(key);
        if (load != state_->inFlight.end()) {
            cancelLoad(*state_, load->second, released);
            state_->inFlight.erase(load);
        }
    }
    for (auto& settled : released) {
        settled->set_value();
    }

    state_->logger->debug("Ключ инвалидирован: key={}, отменено загрузок={}", key, released.size());
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::clear() {
    std::vector<std::shared_ptr<Promise>> released;
    size_t removedEntries = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        removedEntries = state_->entries.size();
        for (auto& load : state_->inFlight) {
            cancelLoad(*state_, load.second, released);
        }
        state_->inFlight.clear();
        state_->entries.clear();
        state_->insertionOrder.clear();
        state_->statuses.clear();
    }
    for (auto& settled : released) {
        settled->set_value();
    }

    state_->logger->info("Кэш очищен: записей={}, отменено загрузок={}", removedEntries, released.size());
}

template<typename Key, typename Value, typename Hash>
size_t PreloadCache<Key, Value, Hash>::size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

template<typename Key, typename Value, typename Hash>
std::vector<Key> PreloadCache<Key, Value, Hash>::keys() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return std::vector<Key>(state_->insertionOrder.begin(), state_->insertionOrder.end());
}

template<typename Key, typename Value, typename Hash>
PreloadCacheMetrics PreloadCache<Key, Value, Hash>::getMetrics() const {
    PreloadCacheMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        metrics.entryCount = state_->entries.size();
        metrics.capacity = state_->capacity;
        metrics.inFlight = state_->inFlight.size();
        metrics.hitCount = state_->hitCount;
        metrics.missCount = state_->missCount;
        metrics.completedLoads = state_->completedLoads;
        metrics.failedLoads = state_->failedLoads;
        metrics.timeoutCount = state_->timeoutCount;
        metrics.cancelledLoads = state_->cancelledLoads;
        metrics.evictionCount = state_->evictionCount;
        metrics.retiredWorkers = state_->retiredWorkers;
    }
    metrics.queuedAssemblies = pool_->getQueueSize();
    metrics.pendingTimers = timer_->pendingCount();
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::updateMetrics() {
    auto metrics = getMetrics();
    state_->logger->debug("Метрики кэша предварительной загрузки: {}", metrics.toJson().dump());
    pool_->updateMetrics();
}

template<typename Key, typename Value, typename Hash>
typename PreloadCache<Key, Value, Hash>::LoadHandle
PreloadCache<Key, Value, Hash>::startLoad(const Key& key, Assembler assemble) {
    LoadHandle load;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        load = beginLoad(key);
    }
    if (load.started) {
        launchLoad(key, load, std::move(assemble));
    }
    return load;
}

// Проверка статуса и перевод в Loading выполняются под одним мьютексом,
// поэтому на ключ приходится не более одной сборки одновременно
template<typename Key, typename Value, typename Hash>
typename PreloadCache<Key, Value, Hash>::LoadHandle
PreloadCache<Key, Value, Hash>::beginLoad(const Key& key) {
    auto it = state_->statuses.find(key);
    if (it != state_->statuses.end()) {
        if (it->second.isCompleted()) {
            return LoadHandle{readyFuture(), false};
        }
        if (it->second.isLoading()) {
            auto load = state_->inFlight.find(key);
            if (load != state_->inFlight.end()) {
                return LoadHandle{load->second.future, false};
            }
            return LoadHandle{readyFuture(), false};
        }
    }

    LoadHandle load;
    load.started = true;
    load.loadId = state_->nextLoadId++;
    auto settled = std::make_shared<Promise>();
    load.future = settled->get_future().share();
    state_->statuses[key] = LoadStatus::loading();
    state_->inFlight.erase(key);
    state_->inFlight.emplace(key, InFlightLoad{load.loadId, load.token, settled, load.future});
    return load;
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::launchLoad(const Key& key, const LoadHandle& load, Assembler assemble) {
    const uint64_t loadId = load.loadId;
    state_->logger->debug("Загрузка запланирована: key={}, loadId={}", key, loadId);

    std::weak_ptr<State> weakState = state_;
    try {
        const auto timerId = timer_->schedule(config_.loadTimeout, [weakState, key, loadId] {
            if (auto state = weakState.lock()) {
                settle(state, key, loadId, LoadOutcome::Timeout, nullptr, kTimeoutReason);
            }
        });
        bool armed = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            auto it = state_->inFlight.find(key);
            if (it != state_->inFlight.end() && it->second.loadId == loadId) {
                it->second.timerId = timerId;
                armed = true;
            }
        }
        if (!armed) {
            // Загрузку уже сняли таймаут, инвалидация или очистка
            timer_->cancel(timerId);
            return;
        }
        pool_->enqueue([state = state_, key, loadId, token = load.token, assemble = std::move(assemble)] {
            runAssembly(state, key, loadId, token, assemble);
        });
    } catch (const std::exception& e) {
        state_->logger->warn("Загрузка отклонена: key={}, причина={}", key, e.what());
        settle(state_, key, loadId, LoadOutcome::AssemblyError, nullptr, e.what());
    }
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::runAssembly(const std::shared_ptr<State>& state, const Key& key,
                                                 uint64_t loadId, const CancellationToken& token,
                                                 const Assembler& assemble) {
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->inFlight.find(key);
        if (token.isCancelled() || it == state->inFlight.end() || it->second.loadId != loadId) {
            state->logger->debug("Сборка пропущена, загрузка отменена: key={}, loadId={}", key, loadId);
            return;
        }
        state->assembling[loadId] = std::this_thread::get_id();
    }

    ValuePtr value;
    std::string reason;
    try {
        value = std::make_shared<const Value>(assemble(key, token));
    } catch (const std::exception& e) {
        reason = e.what();
    } catch (...) {
        reason = kUnknownAssemblyReason;
    }

    {
        // После этой точки поток уже не выводится из пула
        std::lock_guard<std::mutex> lock(state->mutex);
        state->assembling.erase(loadId);
    }

    if (value) {
        settle(state, key, loadId, LoadOutcome::Completed, std::move(value), {});
    } else {
        settle(state, key, loadId, LoadOutcome::AssemblyError, nullptr, reason);
    }
}

// Первый пришедший результат загрузки (сборка, таймаут) побеждает;
// результаты с устаревшим loadId отбрасываются
template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::settle(const std::shared_ptr<State>& state, const Key& key,
                                            uint64_t loadId, LoadOutcome outcome, ValuePtr value,
                                            const std::string& reason) {
    std::shared_ptr<Promise> settled;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->inFlight.find(key);
        if (it == state->inFlight.end() || it->second.loadId != loadId) {
            state->logger->debug("Результат загрузки отброшен: key={}, loadId={}, итог={}",
                                 key, loadId, toString(outcome));
            return;
        }

        settled = std::move(it->second.settled);
        CancellationToken token = it->second.token;
        const auto timerId = it->second.timerId;
        state->inFlight.erase(it);
        if (outcome != LoadOutcome::Timeout && timerId != 0 && state->timer) {
            state->timer->cancel(timerId);
        }

        switch (outcome) {
            case LoadOutcome::Completed: {
                auto existing = state->entries.find(key);
                if (existing != state->entries.end()) {
                    state->insertionOrder.erase(existing->second.first);
                    state->entries.erase(existing);
                }
                auto position = state->insertionOrder.insert(state->insertionOrder.end(), key);
                state->entries.emplace(key, std::make_pair(position, std::move(value)));
                state->statuses[key] = LoadStatus::completed();
                ++state->completedLoads;
                state->logger->debug("Загрузка завершена: key={}, loadId={}", key, loadId);
                cleanupOldEntries(*state);
                break;
            }
            case LoadOutcome::Timeout:
                token.cancel();
                retireAssembler(*state, loadId);
                state->statuses[key] = LoadStatus::failed(kTimeoutReason);
                ++state->timeoutCount;
                state->logger->warn("Превышено время загрузки: key={}, loadId={}", key, loadId);
                break;
            case LoadOutcome::AssemblyError:
                state->statuses[key] = LoadStatus::failed(reason);
                ++state->failedLoads;
                state->logger->error("Ошибка сборки: key={}, loadId={}, причина={}", key, loadId, reason);
                break;
            case LoadOutcome::Cancelled:
                // Отмена снимает загрузку через cancelLoad, сюда не доходит
                break;
        }
    }
    settled->set_value();
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::cleanupOldEntries(State& state) {
    if (state.entries.size() <= state.capacity) {
        return;
    }

    const size_t excess = state.entries.size() - state.capacity;
    for (size_t i = 0; i < excess && !state.insertionOrder.empty(); ++i) {
        const Key oldest = state.insertionOrder.front();
        state.insertionOrder.pop_front();
        state.entries.erase(oldest);
        state.statuses.erase(oldest);
        ++state.evictionCount;
        state.logger->debug("Запись вытеснена: key={}", oldest);
    }
}

template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::cancelLoad(State& state, InFlightLoad& load,
                                                std::vector<std::shared_ptr<Promise>>& released) {
    load.token.cancel();
    if (load.timerId != 0 && state.timer) {
        state.timer->cancel(load.timerId);
    }
    retireAssembler(state, load.loadId);
    if (load.settled) {
        released.push_back(std::move(load.settled));
    }
    ++state.cancelledLoads;
}

// Вызывается под мьютексом состояния. Пока мьютекс удерживается, поток сборки
// не может выйти из задачи, поэтому пул выводит именно его
template<typename Key, typename Value, typename Hash>
void PreloadCache<Key, Value, Hash>::retireAssembler(State& state, uint64_t loadId) {
    auto it = state.assembling.find(loadId);
    if (it == state.assembling.end()) {
        return;
    }
    const auto worker = it->second;
    state.assembling.erase(it);
    if (state.pool && state.pool->retireWorker(worker)) {
        ++state.retiredWorkers;
        state.logger->warn("Сборщик не завершился, поток выведен из пула: loadId={}", loadId);
    }
}

template<typename Key, typename Value, typename Hash>
std::shared_future<void> PreloadCache<Key, Value, Hash>::readyFuture() {
    Promise ready;
    ready.set_value();
    return ready.get_future().share();
}

} // namespace preload
} // namespace cache
} // namespace core
} // namespace veloce
