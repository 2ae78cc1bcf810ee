#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace veloce {
namespace core {
namespace cache {

/**
 * @brief Конфигурация кэша предварительной загрузки
 *
 * Задаётся при создании кэша и не меняется во время работы.
 */
struct PreloadCacheConfig {
    size_t capacity = 10;                                     ///< Максимум хранимых записей
    size_t batchWidth = 3;                                    ///< Максимум загрузок на один пакетный запрос
    std::chrono::milliseconds loadTimeout{8000};              ///< Предельное время одной загрузки
    size_t workerThreads = 3;                                 ///< Потоки пула сборки
    size_t queueSize = 256;                                   ///< Максимум ожидающих сборок
    std::string loggerName = "preloadcache";                  ///< Имя логгера

    /**
     * @brief Валидация конфигурации
     *
     * @return true если конфигурация корректна
     */
    bool validate() const {
        return capacity > 0 && batchWidth > 0 && loadTimeout.count() > 0 &&
               workerThreads > 0 && queueSize > 0 && !loggerName.empty();
    }

    nlohmann::json toJson() const;

    /**
     * @brief Чтение конфигурации из JSON
     *
     * Отсутствующие поля сохраняют значения по умолчанию.
     *
     * @throws std::invalid_argument при неверном типе поля или некорректной конфигурации
     */
    static PreloadCacheConfig fromJson(const nlohmann::json& json);

    /**
     * @brief Чтение конфигурации из файла
     *
     * @throws std::runtime_error если файл не читается или не является JSON
     * @throws std::invalid_argument если конфигурация некорректна
     */
    static PreloadCacheConfig loadFromFile(const std::string& path);
};

} // namespace cache
} // namespace core
} // namespace veloce
