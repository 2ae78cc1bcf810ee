#include "veloce/core/cache/base/LoadStatus.hpp"
#include <utility>

namespace veloce {
namespace core {
namespace cache {

const char* toString(LoadState state) {
    switch (state) {
        case LoadState::NotStarted: return "NotStarted";
        case LoadState::Loading:    return "Loading";
        case LoadState::Completed:  return "Completed";
        case LoadState::Failed:     return "Failed";
    }
    return "Unknown";
}

const char* toString(LoadOutcome outcome) {
    switch (outcome) {
        case LoadOutcome::Completed:     return "completed";
        case LoadOutcome::Timeout:       return "timeout";
        case LoadOutcome::AssemblyError: return "assembly_error";
        case LoadOutcome::Cancelled:     return "cancelled";
    }
    return "unknown";
}

LoadStatus LoadStatus::notStarted() {
    return LoadStatus{};
}

LoadStatus LoadStatus::loading() {
    return LoadStatus{LoadState::Loading, {}};
}

LoadStatus LoadStatus::completed() {
    return LoadStatus{LoadState::Completed, {}};
}

LoadStatus LoadStatus::failed(std::string reason) {
    return LoadStatus{LoadState::Failed, std::move(reason)};
}

bool LoadStatus::operator==(const LoadStatus& other) const {
    return state == other.state && reason == other.reason;
}

std::string LoadStatus::toString() const {
    if (state == LoadState::Failed) {
        return std::string("Failed(") + reason + ")";
    }
    return cache::toString(state);
}

nlohmann::json LoadStatus::toJson() const {
    nlohmann::json json = {
        {"state", cache::toString(state)}
    };
    if (state == LoadState::Failed) {
        json["reason"] = reason;
    }
    return json;
}

} // namespace cache
} // namespace core
} // namespace veloce
