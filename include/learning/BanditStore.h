#pragma once

#include "common/Types.h"

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace tradebrain {
namespace learning {

// (strategy, regime) context. Ordered lexicographically so iteration is deterministic.
struct BanditContextKey {
    std::string strategy;
    std::string regime;

    bool operator<(const BanditContextKey& other) const {
        if (strategy != other.strategy) {
            return strategy < other.strategy;
        }
        return regime < other.regime;
    }
    bool operator==(const BanditContextKey& other) const {
        return strategy == other.strategy && regime == other.regime;
    }

    // "strategy|regime"
    std::string serialize() const { return strategy + "|" + regime; }
    // Splits on the first '|'. nullopt when there is none.
    static std::optional<BanditContextKey> parse(const std::string& raw);
};

struct BetaArm {
    double alpha = 1.0;
    double beta = 1.0;

    double mean() const { return alpha / (alpha + beta); }
    double sample(RandomEngine& rng) const;
};

enum class ParameterPreset { CONSERVATIVE = 0, MODERATE = 1, AGGRESSIVE = 2 };

constexpr std::size_t kPresetCount = 3;

const char* toString(ParameterPreset preset);
std::optional<ParameterPreset> presetFromString(const std::string& name);

// Arms in fixed preset order: conservative, moderate, aggressive.
struct BanditContext {
    std::array<BetaArm, kPresetCount> arms{{BetaArm{1.0, 1.0}, BetaArm{2.0, 1.0}, BetaArm{1.0, 1.0}}};

    BetaArm& arm(ParameterPreset p) { return arms[static_cast<std::size_t>(p)]; }
    const BetaArm& arm(ParameterPreset p) const { return arms[static_cast<std::size_t>(p)]; }
};

// Thompson-sampling bandit over parameter presets, one context per (strategy, regime).
// Contexts are created on selectPreset()/update(); read-only queries answer from the
// seeded prior and never create one. Not thread-safe.
class BanditStore {
public:
    static constexpr double kMaxUpdate = 2.0;

    std::string selectPreset(const std::string& strategy, const std::string& regime, RandomEngine& rng);

    // reward > 0 grows alpha, otherwise beta; each by at most kMaxUpdate.
    // Unknown preset names are ignored.
    void update(const std::string& strategy, const std::string& regime,
                const std::string& preset, double reward);

    // 0.5 for an unknown preset.
    double expectedValue(const std::string& strategy, const std::string& regime,
                         const std::string& preset) const;

    // Highest expected value; ties go to the earlier preset.
    std::pair<std::string, double> bestExpected(const std::string& strategy,
                                                const std::string& regime) const;

    bool hasContext(const std::string& strategy, const std::string& regime) const;
    std::optional<BetaArm> arm(const std::string& strategy, const std::string& regime,
                               const std::string& preset) const;
    std::size_t contextCount() const { return contexts_.size(); }
    const std::map<BanditContextKey, BanditContext>& contexts() const { return contexts_; }

    // "strategy_regime" -> preset -> {alpha, beta, expected}, 3 decimals
    nlohmann::json distributions() const;

    // "strategy|regime" -> preset -> [alpha, beta]
    nlohmann::json toJson() const;
    // Replaces all contexts. Returns the number of contexts restored.
    std::size_t fromJson(const nlohmann::json& data);

    void clear() { contexts_.clear(); }

private:
    BanditContext& contextFor(const std::string& strategy, const std::string& regime);
    const BanditContext* findContext(const std::string& strategy, const std::string& regime) const;

    std::map<BanditContextKey, BanditContext> contexts_;
};

} // namespace learning
} // namespace tradebrain
