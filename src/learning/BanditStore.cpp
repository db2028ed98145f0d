#include "learning/BanditStore.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace tradebrain {
namespace learning {

namespace {
constexpr std::array<ParameterPreset, kPresetCount> kPresetOrder{
    ParameterPreset::CONSERVATIVE, ParameterPreset::MODERATE, ParameterPreset::AGGRESSIVE
};

const BanditContext& seededPrior() {
    static const BanditContext prior;
    return prior;
}

bool validArmParameter(const nlohmann::json& v) {
    return v.is_number() && std::isfinite(v.get<double>()) && v.get<double>() > 0.0;
}
}

std::optional<BanditContextKey> BanditContextKey::parse(const std::string& raw) {
    const auto pos = raw.find('|');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    BanditContextKey key;
    key.strategy = raw.substr(0, pos);
    key.regime = raw.substr(pos + 1);
    return key;
}

double BetaArm::sample(RandomEngine& rng) const {
    std::gamma_distribution<double> gamma_a(alpha, 1.0);
    std::gamma_distribution<double> gamma_b(beta, 1.0);
    const double x = gamma_a(rng);
    const double y = gamma_b(rng);
    const double sum = x + y;
    return (sum > 0.0) ? (x / sum) : 0.5;
}

const char* toString(ParameterPreset preset) {
    switch (preset) {
        case ParameterPreset::CONSERVATIVE: return "conservative";
        case ParameterPreset::MODERATE: return "moderate";
        case ParameterPreset::AGGRESSIVE: return "aggressive";
    }
    return "moderate";
}

std::optional<ParameterPreset> presetFromString(const std::string& name) {
    if (name == "conservative") return ParameterPreset::CONSERVATIVE;
    if (name == "moderate") return ParameterPreset::MODERATE;
    if (name == "aggressive") return ParameterPreset::AGGRESSIVE;
    return std::nullopt;
}

std::string BanditStore::selectPreset(const std::string& strategy, const std::string& regime,
                                      RandomEngine& rng) {
    const auto& ctx = contextFor(strategy, regime);

    ParameterPreset best = kPresetOrder.front();
    double best_sample = -1.0;
    for (const auto preset : kPresetOrder) {
        const double s = ctx.arm(preset).sample(rng);
        if (s > best_sample) {
            best_sample = s;
            best = preset;
        }
    }
    return toString(best);
}

void BanditStore::update(const std::string& strategy, const std::string& regime,
                         const std::string& preset, double reward) {
    const auto parsed = presetFromString(preset);
    if (!parsed) {
        LOG_WARN("Bandit update ignored, unknown preset '{}' for {}|{}", preset, strategy, regime);
        return;
    }

    if (!std::isfinite(reward)) {
        LOG_WARN("Bandit update ignored, non-finite reward for {}|{} ({})", strategy, regime, preset);
        return;
    }

    auto& arm = contextFor(strategy, regime).arm(*parsed);
    if (reward > 0.0) {
        arm.alpha += std::min(reward, kMaxUpdate);
    } else {
        arm.beta += std::min(std::abs(reward), kMaxUpdate);
    }
}

double BanditStore::expectedValue(const std::string& strategy, const std::string& regime,
                                  const std::string& preset) const {
    const auto parsed = presetFromString(preset);
    if (!parsed) {
        return 0.5;
    }
    const auto* ctx = findContext(strategy, regime);
    return (ctx ? *ctx : seededPrior()).arm(*parsed).mean();
}

std::pair<std::string, double> BanditStore::bestExpected(const std::string& strategy,
                                                         const std::string& regime) const {
    const auto* found = findContext(strategy, regime);
    const BanditContext& ctx = found ? *found : seededPrior();

    ParameterPreset best = kPresetOrder.front();
    double best_ev = -1.0;
    for (const auto preset : kPresetOrder) {
        const double ev = ctx.arm(preset).mean();
        if (ev > best_ev) {
            best_ev = ev;
            best = preset;
        }
    }
    return {toString(best), best_ev};
}

bool BanditStore::hasContext(const std::string& strategy, const std::string& regime) const {
    return findContext(strategy, regime) != nullptr;
}

std::optional<BetaArm> BanditStore::arm(const std::string& strategy, const std::string& regime,
                                        const std::string& preset) const {
    const auto parsed = presetFromString(preset);
    const auto* ctx = findContext(strategy, regime);
    if (!parsed || !ctx) {
        return std::nullopt;
    }
    return ctx->arm(*parsed);
}

nlohmann::json BanditStore::distributions() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, ctx] : contexts_) {
        nlohmann::json presets = nlohmann::json::object();
        for (const auto preset : kPresetOrder) {
            const auto& a = ctx.arm(preset);
            presets[toString(preset)] = {
                {"alpha", roundTo(a.alpha, 3)},
                {"beta", roundTo(a.beta, 3)},
                {"expected", roundTo(a.mean(), 3)}
            };
        }
        out[key.strategy + "_" + key.regime] = std::move(presets);
    }
    return out;
}

nlohmann::json BanditStore::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, ctx] : contexts_) {
        nlohmann::json presets = nlohmann::json::object();
        for (const auto preset : kPresetOrder) {
            const auto& a = ctx.arm(preset);
            presets[toString(preset)] = nlohmann::json::array({a.alpha, a.beta});
        }
        out[key.serialize()] = std::move(presets);
    }
    return out;
}

std::size_t BanditStore::fromJson(const nlohmann::json& data) {
    contexts_.clear();
    if (!data.is_object()) {
        LOG_WARN("Bandit snapshot is not an object, starting with empty contexts");
        return 0;
    }

    for (auto it = data.begin(); it != data.end(); ++it) {
        const auto key = BanditContextKey::parse(it.key());
        if (!key || !it.value().is_object()) {
            LOG_WARN("Bandit snapshot: skipping malformed context '{}'", it.key());
            continue;
        }

        BanditContext ctx;
        for (auto p = it.value().begin(); p != it.value().end(); ++p) {
            const auto preset = presetFromString(p.key());
            if (!preset) {
                LOG_WARN("Bandit snapshot: dropping unknown preset '{}' in {}", p.key(), it.key());
                continue;
            }
            const auto& params = p.value();
            if (!params.is_array() || params.size() != 2 ||
                !validArmParameter(params[0]) || !validArmParameter(params[1])) {
                LOG_WARN("Bandit snapshot: rejecting invalid arm {} in {}, keeping prior", p.key(), it.key());
                continue;
            }
            ctx.arm(*preset) = BetaArm{params[0].get<double>(), params[1].get<double>()};
        }
        contexts_[*key] = ctx;
    }
    return contexts_.size();
}

BanditContext& BanditStore::contextFor(const std::string& strategy, const std::string& regime) {
    return contexts_[BanditContextKey{strategy, regime}];
}

const BanditContext* BanditStore::findContext(const std::string& strategy, const std::string& regime) const {
    const auto it = contexts_.find(BanditContextKey{strategy, regime});
    return (it == contexts_.end()) ? nullptr : &it->second;
}

} // namespace learning
} // namespace tradebrain
