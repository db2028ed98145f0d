#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tradebrain {
namespace core {

enum class StateStoreStatus { OK, NOT_FOUND, PARSE_ERROR, IO_ERROR };

const char* toString(StateStoreStatus status);

struct StateSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    nlohmann::json payload = nlohmann::json::object();
};

struct StateLoadResult {
    StateStoreStatus status = StateStoreStatus::NOT_FOUND;
    std::string message;
    std::optional<StateSnapshot> snapshot;

    bool ok() const { return status == StateStoreStatus::OK && snapshot.has_value(); }
};

struct StateSaveResult {
    StateStoreStatus status = StateStoreStatus::OK;
    std::string message;

    bool ok() const { return status == StateStoreStatus::OK; }
};

class IStateStore {
public:
    virtual ~IStateStore() = default;

    virtual StateLoadResult load() = 0;
    virtual StateSaveResult save(const StateSnapshot& snapshot) = 0;
    virtual std::string describe() const = 0;
};

} // namespace core
} // namespace tradebrain
