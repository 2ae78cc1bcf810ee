#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace veloce {
namespace core {
namespace cache {

// Причина отказа при истечении времени загрузки
constexpr const char* kTimeoutReason = "timeout";
// Причина отказа для исключений, не производных от std::exception
constexpr const char* kUnknownAssemblyReason = "unknown assembly error";

// Состояние загрузки ключа
enum class LoadState {
    NotStarted,
    Loading,
    Completed,
    Failed
};

// Итог одной загрузки
enum class LoadOutcome {
    Completed,      ///< Значение собрано и сохранено
    Timeout,        ///< Превышено время загрузки
    AssemblyError,  ///< Сборщик сообщил об ошибке
    Cancelled       ///< Ключ инвалидирован или кэш очищен во время загрузки
};

const char* toString(LoadState state);
const char* toString(LoadOutcome outcome);

/**
 * @brief Статус загрузки ключа
 *
 * Для Failed поле reason содержит причину отказа
 * ("timeout" или текст ошибки сборщика), для остальных состояний пусто.
 */
struct LoadStatus {
    LoadState state = LoadState::NotStarted;
    std::string reason;

    static LoadStatus notStarted();
    static LoadStatus loading();
    static LoadStatus completed();
    static LoadStatus failed(std::string reason);

    bool isNotStarted() const { return state == LoadState::NotStarted; }
    bool isLoading() const { return state == LoadState::Loading; }
    bool isCompleted() const { return state == LoadState::Completed; }
    bool isFailed() const { return state == LoadState::Failed; }

    bool operator==(const LoadStatus& other) const;
    bool operator!=(const LoadStatus& other) const { return !(*this == other); }

    // "Failed(timeout)", "Completed" и т.д.
    std::string toString() const;

    nlohmann::json toJson() const;
};

/**
 * @brief Ошибка сборки значения
 *
 * Сборщик бросает это исключение, чтобы сообщить о неудаче;
 * what() становится причиной в статусе Failed.
 */
class AssemblyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace cache
} // namespace core
} // namespace veloce
