#include <iostream>
#include <memory>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

#include "veloce/core/cache/preload/PreloadCache.hpp"
#include "veloce/core/logging/Logger.hpp"

using namespace veloce::core;

namespace {

// Состояние экрана деталей задачи, которое дорого собирать
struct TaskDetailState {
    std::string taskId;
    std::string title;
    std::string aiSummary;
    std::vector<std::string> suggestedSlots;
};

using TaskDetailCache = cache::preload::PreloadCache<std::string, TaskDetailState>;

// Имитация запросов к серверу: задержка с проверкой отмены
TaskDetailState assembleTaskDetail(const std::string& taskId, const cache::CancellationToken& token) {
    if (token.waitFor(std::chrono::milliseconds(40))) {
        throw cache::AssemblyError("assembly cancelled");
    }
    if (taskId == "task-13") {
        throw cache::AssemblyError("AI insights unavailable");
    }

    TaskDetailState state;
    state.taskId = taskId;
    state.title = "Task " + taskId.substr(taskId.find('-') + 1);
    state.aiSummary = "Estimated 25 min, best done before noon";
    state.suggestedSlots = {"09:00", "11:30"};
    return state;
}

cache::PreloadCacheConfig loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        spdlog::info("Loading configuration from {}", argv[1]);
        return cache::PreloadCacheConfig::loadFromFile(argv[1]);
    }
    return cache::PreloadCacheConfig{};
}

void runDemo(const cache::PreloadCacheConfig& config) {
    TaskDetailCache cache(config);

    std::vector<std::string> visibleRows;
    for (int i = 10; i < 18; ++i) {
        visibleRows.push_back("task-" + std::to_string(i));
    }

    // Прокрутка списка: каждый проход подхватывает не больше batchWidth строк
    for (int pass = 0; pass < 3; ++pass) {
        cache.preloadBatch(visibleRows, assembleTaskDetail);
        spdlog::info("Preload pass {}: {} ready", pass + 1, cache.size());
    }

    for (const auto& taskId : {"task-10", "task-13", "task-42"}) {
        auto detail = cache.getOrCreate(taskId, assembleTaskDetail);
        if (cache.isReady(taskId)) {
            spdlog::info("Opened {} instantly: {} ({})", taskId, detail->title, detail->aiSummary);
        } else {
            spdlog::info("Opened {} with placeholder, status {}", taskId, cache.status(taskId).toString());
        }
    }

    // Пользователь отредактировал задачу
    cache.invalidate("task-11");
    spdlog::info("task-11 after edit: {}", cache.status("task-11").toString());

    cache.preloadAsync("task-42", assembleTaskDetail).wait();
    spdlog::info("task-42 after background load: {}", cache.status("task-42").toString());

    cache.updateMetrics();
    std::cout << cache.getMetrics().toJson().dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        logging::initializeDefaultLogging("veloce_preload_demo", "logs/veloce_preload_demo.log");
        spdlog::info("=== Veloce preload cache demo ===");

        runDemo(loadConfiguration(argc, argv));

        spdlog::info("=== Demo finished ===");
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
