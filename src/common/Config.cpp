#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradebrain {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyCode(std::string code) {
    code = trimCopy(code);
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

std::vector<std::string> readStrategyCodes(const nlohmann::json& section,
                                           const std::vector<std::string>& fallback) {
    if (!section.contains("strategies") || !section["strategies"].is_array()) {
        return fallback;
    }
    std::vector<std::string> codes;
    for (const auto& raw : section["strategies"]) {
        if (!raw.is_string()) {
            continue;
        }
        const std::string code = normalizeStrategyCode(raw.get<std::string>());
        if (!code.empty() && std::find(codes.begin(), codes.end(), code) == codes.end()) {
            codes.push_back(code);
        }
    }
    return codes.empty() ? fallback : codes;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute() || std::filesystem::exists(path)) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "Warning: config file could not be opened." << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                loadFromJson(j);
                std::cout << "Config loaded" << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }

    const std::string env_state_dir = readEnvVar("TRADEBRAIN_STATE_DIR");
    if (!env_state_dir.empty()) {
        engine_config_.state.dir = env_state_dir;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("state")) {
        auto& s = j["state"];
        auto& state = engine_config_.state;
        state.dir = s.value("dir", state.dir);
        state.fallback_dir = s.value("fallback_dir", state.fallback_dir);
        state.async_writes = s.value("async_writes", state.async_writes);
        state.persist = s.value("persist", state.persist);
    }

    if (j.contains("learning")) {
        auto& t = j["learning"];
        auto& learning = engine_config_.learning;
        learning.strategies = readStrategyCodes(t, learning.strategies);
        learning.max_trade_history = std::max(1, t.value("max_trade_history", learning.max_trade_history));
        learning.max_insights = std::max(1, t.value("max_insights", learning.max_insights));
        learning.min_trades_for_adjustment = t.value("min_trades_for_adjustment", learning.min_trades_for_adjustment);
        learning.streak_warning_threshold = t.value("streak_warning_threshold", learning.streak_warning_threshold);
        learning.confidence_lookback = t.value("confidence_lookback", learning.confidence_lookback);
        learning.regime_window = t.value("regime_window", learning.regime_window);
        learning.overall_window = t.value("overall_window", learning.overall_window);
        learning.exploration_rate = std::clamp(t.value("exploration_rate", learning.exploration_rate), 0.0, 1.0);
        learning.exploration_decay_enabled = t.value("exploration_decay_enabled", learning.exploration_decay_enabled);
        learning.exploration_decay_after_trades = t.value("exploration_decay_after_trades", learning.exploration_decay_after_trades);
        learning.exploration_decay_target = t.value("exploration_decay_target", learning.exploration_decay_target);
        learning.exploration_decay_constant = t.value("exploration_decay_constant", learning.exploration_decay_constant);
        learning.rng_seed = t.value("rng_seed", learning.rng_seed);
    }

    if (j.contains("allocation")) {
        auto& a = j["allocation"];
        auto& allocation = engine_config_.allocation;
        allocation.strategies = readStrategyCodes(a, allocation.strategies);
        allocation.enabled = a.value("enabled", allocation.enabled);
        allocation.rebalance_interval = std::max(1, a.value("rebalance_interval", allocation.rebalance_interval));
        allocation.max_change_per_rebalance = a.value("max_change_per_rebalance", allocation.max_change_per_rebalance);
        allocation.min_allocation_pct = a.value("min_allocation_pct", allocation.min_allocation_pct);
        allocation.max_allocation_pct = a.value("max_allocation_pct", allocation.max_allocation_pct);
        allocation.history_size = std::max(1, a.value("history_size", allocation.history_size));

        if (a.contains("weights")) {
            auto& w = a["weights"];
            allocation.weight_level = w.value("level", allocation.weight_level);
            allocation.weight_win_rate = w.value("win_rate", allocation.weight_win_rate);
            allocation.weight_profit_factor = w.value("profit_factor", allocation.weight_profit_factor);
            allocation.weight_rl_expected = w.value("rl_expected", allocation.weight_rl_expected);
            allocation.weight_streak = w.value("streak", allocation.weight_streak);
        }
    }
}

} // namespace tradebrain
