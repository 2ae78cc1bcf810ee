#include "veloce/core/cache/metrics/PreloadCacheConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace veloce {
namespace core {
namespace cache {

namespace {

size_t readCount(const nlohmann::json& json, const char* field, size_t fallback) {
    auto it = json.find(field);
    if (it == json.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument(std::string("Поле ") + field + " должно быть неотрицательным целым");
    }
    return it->get<size_t>();
}

} // namespace

nlohmann::json PreloadCacheConfig::toJson() const {
    return {
        {"capacity", capacity},
        {"batchWidth", batchWidth},
        {"loadTimeoutMs", loadTimeout.count()},
        {"workerThreads", workerThreads},
        {"queueSize", queueSize},
        {"loggerName", loggerName}
    };
}

PreloadCacheConfig PreloadCacheConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Конфигурация кэша должна быть JSON-объектом");
    }

    PreloadCacheConfig config;
    config.capacity = readCount(json, "capacity", config.capacity);
    config.batchWidth = readCount(json, "batchWidth", config.batchWidth);
    config.loadTimeout = std::chrono::milliseconds(
        readCount(json, "loadTimeoutMs", static_cast<size_t>(config.loadTimeout.count())));
    config.workerThreads = readCount(json, "workerThreads", config.workerThreads);
    config.queueSize = readCount(json, "queueSize", config.queueSize);

    auto logger = json.find("loggerName");
    if (logger != json.end()) {
        if (!logger->is_string()) {
            throw std::invalid_argument("Поле loggerName должно быть строкой");
        }
        config.loggerName = logger->get<std::string>();
    }

    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша предварительной загрузки");
    }
    return config;
}

PreloadCacheConfig PreloadCacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Не удалось открыть файл конфигурации: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Ошибка разбора конфигурации " + path + ": " + e.what());
    }
    return fromJson(json);
}

} // namespace cache
} // namespace core
} // namespace veloce
