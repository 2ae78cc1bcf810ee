#include <cassert>
#include <iostream>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "veloce/core/cache/base/LoadStatus.hpp"
#include "veloce/core/cache/metrics/PreloadCacheConfig.hpp"

using veloce::core::cache::LoadOutcome;
using veloce::core::cache::LoadState;
using veloce::core::cache::LoadStatus;
using veloce::core::cache::PreloadCacheConfig;

void smokeTestDefaults() {
    PreloadCacheConfig config;
    assert(config.validate());
    assert(config.capacity == 10);
    assert(config.batchWidth == 3);
    assert(config.loadTimeout == std::chrono::seconds(8));

    auto json = config.toJson();
    assert(json["loadTimeoutMs"] == 8000);
    auto restored = PreloadCacheConfig::fromJson(json);
    assert(restored.capacity == config.capacity);
    assert(restored.loggerName == "preloadcache");
    std::cout << "[OK] PreloadCacheConfig defaults\n";
}

void testFromJson() {
    auto config = PreloadCacheConfig::fromJson(nlohmann::json::parse(
        R"({"capacity": 2, "batchWidth": 1, "loadTimeoutMs": 250})"));
    assert(config.capacity == 2);
    assert(config.batchWidth == 1);
    assert(config.loadTimeout == std::chrono::milliseconds(250));
    assert(config.workerThreads == 3);

    const char* invalid[] = {
        R"({"capacity": "ten"})",
        R"({"batchWidth": -1})",
        R"({"capacity": 0})",
        R"({"loggerName": 5})",
        R"([1, 2, 3])"
    };
    for (const char* text : invalid) {
        bool thrown = false;
        try {
            PreloadCacheConfig::fromJson(nlohmann::json::parse(text));
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }
    std::cout << "[OK] PreloadCacheConfig fromJson\n";
}

void testLoadFromFile() {
    const std::string path = "preload_cache_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"capacity": 4, "workerThreads": 2})";
    }
    auto config = PreloadCacheConfig::loadFromFile(path);
    assert(config.capacity == 4);
    assert(config.workerThreads == 2);

    {
        std::ofstream file(path);
        file << "{not json";
    }
    bool parseFailed = false;
    try {
        PreloadCacheConfig::loadFromFile(path);
    } catch (const std::runtime_error&) {
        parseFailed = true;
    }
    assert(parseFailed);
    std::remove(path.c_str());

    bool missing = false;
    try {
        PreloadCacheConfig::loadFromFile("does_not_exist.json");
    } catch (const std::runtime_error&) {
        missing = true;
    }
    assert(missing);
    std::cout << "[OK] PreloadCacheConfig loadFromFile\n";
}

void testLoadStatus() {
    assert(LoadStatus{}.isNotStarted());
    assert(LoadStatus::notStarted().toString() == "NotStarted");
    assert(LoadStatus::loading().toString() == "Loading");
    assert(LoadStatus::failed("timeout").toString() == "Failed(timeout)");
    assert(LoadStatus::failed("a") != LoadStatus::failed("b"));
    assert(LoadStatus::completed() == LoadStatus::completed());

    auto json = LoadStatus::failed("offline").toJson();
    assert(json["state"] == "Failed");
    assert(json["reason"] == "offline");
    assert(!LoadStatus::completed().toJson().contains("reason"));
    assert(std::string(veloce::core::cache::toString(LoadOutcome::Timeout)) == "timeout");
    std::cout << "[OK] LoadStatus\n";
}

int main() {
    smokeTestDefaults();
    testFromJson();
    testLoadFromFile();
    testLoadStatus();
    std::cout << "All PreloadCacheConfig tests passed!\n";
    return 0;
}
