#include "veloce/core/logging/Logger.hpp"
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace veloce {
namespace core {
namespace logging {

namespace {
// Регистрация логгеров выполняется под общим мьютексом,
// иначе два компонента могут одновременно зарегистрировать одно имя
std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registryMutex());

    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    try {
        logger = spdlog::rotating_logger_mt(name, "logs/" + name + ".log",
                                            kMaxLogFileSize, kMaxLogFiles);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
        logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::stdout_color_mt(name);
        }
    }

    logger->set_level(spdlog::level::debug);
    return logger;
}

void initializeDefaultLogging(const std::string& name, const std::string& logPath) {
    try {
        // Консольный приёмник
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(spdlog::level::info);
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        // Файловый приёмник
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath, kMaxLogFileSize * 2, kMaxLogFiles);
        fileSink->set_level(spdlog::level::debug);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>(name,
            spdlog::sinks_init_list{consoleSink, fileSink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

} // namespace logging
} // namespace core
} // namespace veloce
