#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <spdlog/spdlog.h>

namespace veloce {
namespace core {
namespace logging {

// Параметры ротации файловых логов компонентов
constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxLogFiles = 3;

/**
 * @brief Получить именованный логгер компонента
 *
 * Возвращает зарегистрированный логгер с указанным именем. Если логгер
 * ещё не создан, создаёт ротируемый файловый логгер logs/<name>.log.
 * При невозможности открыть файл используется цветной консольный логгер
 * с тем же именем.
 *
 * @param name Имя логгера (например, "preloadcache")
 * @return Логгер, никогда не nullptr
 */
std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string& name);

/**
 * @brief Инициализация логгера по умолчанию для исполняемых файлов
 *
 * Создаёт логгер с консольным и ротируемым файловым приёмниками
 * и устанавливает его логгером по умолчанию spdlog.
 *
 * @param name Имя логгера
 * @param logPath Путь к файлу лога
 */
void initializeDefaultLogging(const std::string& name, const std::string& logPath);

} // namespace logging
} // namespace core
} // namespace veloce
