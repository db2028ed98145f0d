#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tradebrain {

class Config {
public:
    static Config& getInstance();

    // Missing file or keys keep the defaults.
    void load(const std::string& config_path);
    // Same as load(), from an already parsed document.
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::LearningConfig getLearningConfig() const { return engine_config_.learning; }
    engine::AllocationConfig getAllocationConfig() const { return engine_config_.allocation; }
    engine::StateConfig getStateConfig() const { return engine_config_.state; }

    void setStateDir(const std::string& dir) { engine_config_.state.dir = dir; }
    void setRngSeed(std::uint64_t seed) { engine_config_.learning.rng_seed = seed; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    engine::EngineConfig engine_config_;
};

} // namespace tradebrain
