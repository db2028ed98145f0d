#include "allocation/FitnessAllocator.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace tradebrain {
namespace allocation {

namespace {
using Bounds = std::map<std::string, std::pair<double, double>>;

constexpr double kEpsilon = 1e-9;

double floorTenth(double v) { return std::floor(v * 10.0 + kEpsilon) / 10.0; }
double ceilTenth(double v) { return std::ceil(v * 10.0 - kEpsilon) / 10.0; }

double total(const AllocationMap& values) {
    double sum = 0.0;
    for (const auto& entry : values) {
        sum += entry.second;
    }
    return sum;
}

double roomToward(double value, const std::pair<double, double>& bound, bool up) {
    return up ? std::max(0.0, bound.second - value) : std::max(0.0, value - bound.first);
}

// Spreads `residual` over the entries in proportion to how far each can still move
// in that direction. Returns what could not be placed.
double distributeResidual(AllocationMap& values, const Bounds& bounds, double residual) {
    const bool up = residual > 0.0;
    double room_total = 0.0;
    for (const auto& [code, v] : values) {
        room_total += roomToward(v, bounds.at(code), up);
    }
    if (room_total <= kEpsilon) {
        return residual;
    }

    const double share = std::min(1.0, std::abs(residual) / room_total);
    double moved = 0.0;
    for (auto& [code, v] : values) {
        const double step = roomToward(v, bounds.at(code), up) * share * (up ? 1.0 : -1.0);
        v += step;
        moved += step;
    }
    return residual - moved;
}

// 0.1 granularity inside each entry's bounds, then the rounding residual goes to the
// largest entry that can absorb it, then the next largest.
void roundWithinBounds(AllocationMap& values, const Bounds& bounds) {
    for (auto& [code, v] : values) {
        const auto& b = bounds.at(code);
        const double lo = ceilTenth(b.first);
        const double hi = floorTenth(b.second);
        v = roundTo(v, 1);
        if (lo <= hi) {
            v = std::clamp(v, lo, hi);
        }
    }

    double residual = roundTo(100.0 - total(values), 1);
    if (std::abs(residual) < 0.05 || values.empty()) {
        return;
    }

    std::vector<std::string> order;
    for (const auto& entry : values) {
        order.push_back(entry.first);
    }
    std::stable_sort(order.begin(), order.end(), [&values](const std::string& a, const std::string& b) {
        return values.at(a) > values.at(b);
    });

    for (const auto& code : order) {
        if (std::abs(residual) < 0.05) {
            break;
        }
        const auto& b = bounds.at(code);
        const double lo = ceilTenth(b.first);
        const double hi = floorTenth(b.second);
        if (lo > hi) {
            continue;
        }
        const double before = values[code];
        const double after = roundTo(std::clamp(before + residual, lo, hi), 1);
        values[code] = after;
        residual = roundTo(residual - (after - before), 1);
    }

    if (std::abs(residual) >= 0.05) {
        LOG_WARN("Allocation bounds cannot absorb {:.1f}, applying it to {}", residual, order.front());
        values[order.front()] = roundTo(values[order.front()] + residual, 1);
    }
}

double bestDistributionEv(const nlohmann::json& distributions, const std::string& code) {
    if (!distributions.is_object()) {
        return -1.0;
    }
    const std::string prefix = code + "_";
    double best = -1.0;
    for (auto ctx = distributions.begin(); ctx != distributions.end(); ++ctx) {
        if (ctx.key().compare(0, prefix.size(), prefix) != 0 || !ctx.value().is_object()) {
            continue;
        }
        for (const auto& preset : ctx.value()) {
            if (preset.is_object()) {
                best = std::max(best, preset.value("expected", 0.0));
            }
        }
    }
    return best;
}

nlohmann::json component(const nlohmann::json& value, double score, double weight) {
    return {{"value", value}, {"score", roundTo(score, 3)}, {"weight", weight}};
}

nlohmann::json changesToJson(const std::map<std::string, AllocationChange>& changes) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [code, c] : changes) {
        out[code] = {{"from", c.from}, {"to", c.to}, {"delta", c.delta}};
    }
    return out;
}

std::map<std::string, AllocationChange> changesFromJson(const nlohmann::json& j) {
    std::map<std::string, AllocationChange> out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        AllocationChange c;
        c.from = it.value().value("from", 0.0);
        c.to = it.value().value("to", 0.0);
        c.delta = it.value().value("delta", 0.0);
        out[it.key()] = c;
    }
    return out;
}

nlohmann::json isoOrNull(long long ms) {
    if (ms <= 0) {
        return nullptr;
    }
    return common::toIso8601(ms);
}
}

nlohmann::json FitnessScore::toJson(const engine::AllocationConfig& weights) const {
    const auto& b = breakdown;
    nlohmann::json out;
    out["score"] = score;
    out["breakdown"] = {
        {"xp_level", component(b.level, b.level_score, weights.weight_level)},
        {"win_rate", component(roundTo(b.win_rate, 3), b.win_rate_score, weights.weight_win_rate)},
        {"profit_factor", component(roundTo(b.profit_factor_score * 3.0, 2), b.profit_factor_score, weights.weight_profit_factor)},
        {"rl_expected", component(roundTo(b.rl_expected, 3), b.rl_score, weights.weight_rl_expected)},
        {"streak", component(std::string(toString(b.streak_type)) + ":" + std::to_string(b.streak_length),
                             b.streak_score, weights.weight_streak)}
    };
    out["total_trades"] = total_trades;
    out["total_profit"] = roundTo(total_profit, 2);
    return out;
}

FitnessScore FitnessScore::fromJson(const nlohmann::json& j) {
    FitnessScore s;
    s.score = j.value("score", 0.0);
    s.total_trades = j.value("total_trades", 0);
    s.total_profit = j.value("total_profit", 0.0);

    const auto b = j.value("breakdown", nlohmann::json::object());
    const auto part = [&b](const char* key) { return b.value(key, nlohmann::json::object()); };
    s.breakdown.level = part("xp_level").value("value", 1);
    s.breakdown.level_score = part("xp_level").value("score", 0.0);
    s.breakdown.win_rate = part("win_rate").value("value", 0.0);
    s.breakdown.win_rate_score = part("win_rate").value("score", 0.0);
    s.breakdown.profit_factor_score = part("profit_factor").value("score", 0.0);
    s.breakdown.rl_expected = part("rl_expected").value("value", 0.5);
    s.breakdown.rl_score = part("rl_expected").value("score", 0.5);
    s.breakdown.streak_score = part("streak").value("score", 0.5);

    const std::string streak = part("streak").value("value", std::string("none:0"));
    const auto colon = streak.find(':');
    if (colon != std::string::npos) {
        s.breakdown.streak_type = streakTypeFromString(streak.substr(0, colon));
        try {
            s.breakdown.streak_length = std::stoi(streak.substr(colon + 1));
        } catch (const std::exception&) {
            s.breakdown.streak_length = 0;
        }
    }
    return s;
}

nlohmann::json RebalanceEvent::toJson() const {
    nlohmann::json out;
    out["timestamp"] = isoOrNull(timestamp_ms);
    out["timestamp_ms"] = timestamp_ms;
    out["rebalance_number"] = rebalance_number;
    out["allocations"] = allocations;
    out["fitness_scores"] = fitness_scores;
    out["changes"] = changesToJson(changes);
    return out;
}

RebalanceEvent RebalanceEvent::fromJson(const nlohmann::json& j) {
    RebalanceEvent e;
    e.timestamp_ms = j.value("timestamp_ms", 0LL);
    e.rebalance_number = j.value("rebalance_number", 0);
    e.allocations = j.value("allocations", AllocationMap{});
    e.fitness_scores = j.value("fitness_scores", std::map<std::string, double>{});
    e.changes = changesFromJson(j.value("changes", nlohmann::json::object()));
    return e;
}

nlohmann::json RebalanceResult::toJson(const engine::AllocationConfig& weights) const {
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [code, s] : fitness_scores) {
        scores[code] = s.toJson(weights);
    }

    nlohmann::json out;
    out["allocations"] = allocations;
    out["fitness_scores"] = std::move(scores);
    out["rebalance_number"] = rebalance_number;
    out["changes"] = changesToJson(changes);
    out["timestamp"] = isoOrNull(timestamp_ms);
    out["timestamp_ms"] = timestamp_ms;
    return out;
}

FitnessAllocator::FitnessAllocator(engine::AllocationConfig config)
    : config_(std::move(config)) {
    enabled_ = config_.enabled;
}

double FitnessAllocator::defaultShare() const {
    return config_.strategies.empty() ? 0.0 : 100.0 / static_cast<double>(config_.strategies.size());
}

FitnessMap FitnessAllocator::calculateFitnessScores(const ExperienceMap& experience,
                                                    const learning::AdjustmentMap& adjustments,
                                                    const learning::RlStats& rl_stats) const {
    FitnessMap scores;
    for (const auto& code : config_.strategies) {
        const auto xp_it = experience.find(code);
        const ExperienceFacts xp = (xp_it != experience.end()) ? xp_it->second : ExperienceFacts{};

        FitnessBreakdown b;
        b.level = xp.level;
        b.level_score = std::clamp(xp.level / 10.0, 0.0, 1.0);

        b.win_rate = xp.win_rate;
        b.win_rate_score = std::clamp(xp.win_rate, 0.0, 1.0);

        if (xp.wins > 0 && xp.losses > 0) {
            const double pf = static_cast<double>(xp.wins) / static_cast<double>(xp.losses);
            b.profit_factor_score = std::min(1.0, pf / 3.0);
        } else if (xp.total_profit > 0.0) {
            b.profit_factor_score = 0.7;
        } else {
            b.profit_factor_score = 0.3;
        }

        const auto adj_it = adjustments.find(code);
        if (adj_it != adjustments.end()) {
            b.rl_expected = adj_it->second.rl_expected;
        } else {
            const double ev = bestDistributionEv(rl_stats.distributions, code);
            b.rl_expected = (ev >= 0.0) ? ev : 0.5;
        }
        b.rl_score = std::clamp(b.rl_expected, 0.0, 1.0);

        b.streak_type = xp.streak_type;
        b.streak_length = xp.current_streak;
        if (xp.streak_type == StreakType::WIN) {
            b.streak_score = std::min(1.0, 0.5 + xp.current_streak * 0.1);
        } else if (xp.streak_type == StreakType::LOSS) {
            b.streak_score = std::max(0.0, 0.5 - xp.current_streak * 0.1);
        } else {
            b.streak_score = 0.5;
        }

        FitnessScore s;
        s.breakdown = b;
        s.score = roundTo(config_.weight_level * b.level_score +
                          config_.weight_win_rate * b.win_rate_score +
                          config_.weight_profit_factor * b.profit_factor_score +
                          config_.weight_rl_expected * b.rl_score +
                          config_.weight_streak * b.streak_score, 4);
        s.total_trades = xp.total_trades;
        s.total_profit = xp.total_profit;
        scores[code] = s;
    }
    return scores;
}

AllocationMap FitnessAllocator::calculateTargetAllocations(const FitnessMap& scores) const {
    AllocationMap target;
    const auto& codes = config_.strategies;
    if (codes.empty()) {
        return target;
    }
    const double n = static_cast<double>(codes.size());

    AllocationMap raw;
    double raw_total = 0.0;
    for (const auto& code : codes) {
        const auto it = scores.find(code);
        raw[code] = (it != scores.end()) ? std::max(0.0, it->second.score) : 0.0;
        raw_total += raw[code];
    }

    double lo = config_.min_allocation_pct;
    double hi = config_.max_allocation_pct;
    if (n * lo > 100.0 + kEpsilon || n * hi < 100.0 - kEpsilon) {
        LOG_WARN("Allocation bounds [{}, {}] infeasible for {} strategies, keeping only the sum",
                 lo, hi, codes.size());
        lo = 0.0;
        hi = 100.0;
    }
    Bounds bounds;
    for (const auto& code : codes) {
        bounds[code] = {lo, hi};
    }

    if (raw_total <= 0.0) {
        for (const auto& code : codes) {
            target[code] = 100.0 / n;
        }
    } else {
        // Scale the free entries to the remaining share; pin whatever crosses a bound and repeat.
        std::map<std::string, double> pinned;
        for (std::size_t pass = 0; pass <= codes.size(); ++pass) {
            double remaining = 100.0;
            double free_total = 0.0;
            std::size_t free_count = 0;
            for (const auto& code : codes) {
                const auto p = pinned.find(code);
                if (p != pinned.end()) {
                    remaining -= p->second;
                } else {
                    free_total += raw[code];
                    free_count++;
                }
            }
            if (free_count == 0) {
                break;
            }

            for (const auto& code : codes) {
                if (pinned.count(code) == 0) {
                    target[code] = (free_total > 0.0) ? raw[code] * remaining / free_total
                                                      : remaining / static_cast<double>(free_count);
                } else {
                    target[code] = pinned[code];
                }
            }

            bool pinned_any = false;
            for (const auto& code : codes) {
                if (pinned.count(code) == 0 && target[code] < lo - kEpsilon) {
                    pinned[code] = lo;
                    pinned_any = true;
                }
            }
            if (!pinned_any) {
                for (const auto& code : codes) {
                    if (pinned.count(code) == 0 && target[code] > hi + kEpsilon) {
                        pinned[code] = hi;
                        pinned_any = true;
                    }
                }
            }
            if (!pinned_any) {
                break;
            }
        }

        const double residual = 100.0 - total(target);
        if (std::abs(residual) > kEpsilon) {
            distributeResidual(target, bounds, residual);
        }
    }

    roundWithinBounds(target, bounds);
    return target;
}

AllocationMap FitnessAllocator::applySmoothing(const AllocationMap& current, const AllocationMap& target) const {
    AllocationMap smoothed;
    Bounds bands;
    const double step = std::max(0.0, config_.max_change_per_rebalance);
    const double floor_pct = config_.min_allocation_pct;
    const double cap_pct = config_.max_allocation_pct;

    for (const auto& code : config_.strategies) {
        const auto cur_it = current.find(code);
        const double cur = (cur_it != current.end()) ? cur_it->second : defaultShare();
        const auto tgt_it = target.find(code);
        const double tgt = (tgt_it != target.end()) ? tgt_it->second : defaultShare();

        double lo = std::max(floor_pct, cur - step);
        double hi = std::min(cap_pct, cur + step);
        if (lo > hi) {
            // Outside [floor, cap] by more than one step: move one step back toward the range.
            lo = hi = (cur > cap_pct) ? cur - step : cur + step;
        }
        bands[code] = {lo, hi};
        smoothed[code] = std::clamp(tgt, lo, hi);
    }

    const double residual = 100.0 - total(smoothed);
    if (std::abs(residual) > kEpsilon) {
        const double left = distributeResidual(smoothed, bands, residual);
        if (std::abs(left) > 0.05) {
            LOG_WARN("Smoothing cannot reach 100% within step limits (short by {:.2f})", left);
        }
    }

    roundWithinBounds(smoothed, bands);
    return smoothed;
}

std::optional<RebalanceResult> FitnessAllocator::onTradeCompleted(const ExperienceMap& experience,
                                                                  const learning::AdjustmentMap& adjustments,
                                                                  const learning::RlStats& rl_stats,
                                                                  const AllocationMap& current) {
    if (!enabled_) {
        return std::nullopt;
    }

    trades_since_rebalance_++;
    if (trades_since_rebalance_ < config_.rebalance_interval) {
        return std::nullopt;
    }

    trades_since_rebalance_ = 0;
    total_rebalances_++;

    const FitnessMap fitness = calculateFitnessScores(experience, adjustments, rl_stats);
    const AllocationMap target = calculateTargetAllocations(fitness);
    const AllocationMap allocations = applySmoothing(current, target);

    RebalanceResult result;
    result.allocations = allocations;
    result.fitness_scores = fitness;
    result.rebalance_number = total_rebalances_;
    result.timestamp_ms = common::nowMs();

    RebalanceEvent event;
    event.timestamp_ms = result.timestamp_ms;
    event.rebalance_number = total_rebalances_;
    event.allocations = allocations;

    for (const auto& code : config_.strategies) {
        const auto cur_it = current.find(code);
        AllocationChange change;
        change.from = (cur_it != current.end()) ? cur_it->second : defaultShare();
        change.to = allocations.at(code);
        change.delta = roundTo(change.to - change.from, 1);
        result.changes[code] = change;
        event.fitness_scores[code] = fitness.at(code).score;

        Logger::getInstance().logRebalance(total_rebalances_, code, change.from, change.to, change.delta);
    }
    event.changes = result.changes;

    last_fitness_ = fitness;
    last_allocations_ = allocations;
    last_rebalance_ms_ = result.timestamp_ms;

    history_.push_back(std::move(event));
    while (history_.size() > static_cast<std::size_t>(std::max(1, config_.history_size))) {
        history_.pop_front();
    }

    LOG_INFO("Auto rebalance #{}: {}", total_rebalances_,
             nlohmann::json(allocations).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return result;
}

nlohmann::json FitnessAllocator::getStatus() const {
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [code, s] : last_fitness_) {
        scores[code] = s.toJson(config_);
    }

    nlohmann::json recent = nlohmann::json::array();
    const std::size_t skip = (history_.size() > 10) ? history_.size() - 10 : 0;
    for (std::size_t i = skip; i < history_.size(); ++i) {
        recent.push_back(history_[i].toJson());
    }

    nlohmann::json out;
    out["enabled"] = enabled_;
    out["trades_since_rebalance"] = trades_since_rebalance_;
    out["rebalance_interval"] = config_.rebalance_interval;
    out["trades_until_next"] = std::max(0, config_.rebalance_interval - trades_since_rebalance_);
    out["total_rebalances"] = total_rebalances_;
    out["last_rebalance_time"] = isoOrNull(last_rebalance_ms_);
    out["last_fitness_scores"] = std::move(scores);
    out["last_allocations"] = last_allocations_;
    out["rebalance_history"] = std::move(recent);
    out["config"] = {
        {"strategies", config_.strategies},
        {"rebalance_interval", config_.rebalance_interval},
        {"max_change_per_rebalance", config_.max_change_per_rebalance},
        {"min_allocation_pct", config_.min_allocation_pct},
        {"max_allocation_pct", config_.max_allocation_pct},
        {"weights", {
            {"xp_level", config_.weight_level},
            {"win_rate", config_.weight_win_rate},
            {"profit_factor", config_.weight_profit_factor},
            {"rl_expected", config_.weight_rl_expected},
            {"streak", config_.weight_streak}
        }}
    };
    return out;
}

void FitnessAllocator::setEnabled(bool enabled) {
    enabled_ = enabled;
    LOG_INFO("Auto allocation {}", enabled ? "enabled" : "disabled");
}

nlohmann::json FitnessAllocator::toJson() const {
    nlohmann::json scores = nlohmann::json::object();
    for (const auto& [code, s] : last_fitness_) {
        scores[code] = s.toJson(config_);
    }
    nlohmann::json events = nlohmann::json::array();
    for (const auto& e : history_) {
        events.push_back(e.toJson());
    }

    nlohmann::json out;
    out["enabled"] = enabled_;
    out["trades_since_rebalance"] = trades_since_rebalance_;
    out["total_rebalances"] = total_rebalances_;
    out["last_rebalance_time"] = isoOrNull(last_rebalance_ms_);
    out["last_rebalance_ms"] = last_rebalance_ms_;
    out["last_fitness_scores"] = std::move(scores);
    out["last_allocations"] = last_allocations_;
    out["rebalance_history"] = std::move(events);
    return out;
}

void FitnessAllocator::restore(const nlohmann::json& payload) {
    reset();
    enabled_ = payload.value("enabled", config_.enabled);
    trades_since_rebalance_ = std::max(0, payload.value("trades_since_rebalance", 0));
    total_rebalances_ = std::max(0, payload.value("total_rebalances", 0));
    last_rebalance_ms_ = payload.value("last_rebalance_ms", 0LL);

    const auto scores = payload.value("last_fitness_scores", nlohmann::json::object());
    for (auto it = scores.begin(); it != scores.end(); ++it) {
        last_fitness_[it.key()] = FitnessScore::fromJson(it.value());
    }
    last_allocations_ = payload.value("last_allocations", AllocationMap{});

    for (const auto& row : payload.value("rebalance_history", nlohmann::json::array())) {
        history_.push_back(RebalanceEvent::fromJson(row));
    }
    while (history_.size() > static_cast<std::size_t>(std::max(1, config_.history_size))) {
        history_.pop_front();
    }

    LOG_INFO("Allocation state restored: rebalances={} enabled={}", total_rebalances_, enabled_);
}

void FitnessAllocator::reset() {
    enabled_ = config_.enabled;
    trades_since_rebalance_ = 0;
    total_rebalances_ = 0;
    last_rebalance_ms_ = 0;
    last_fitness_.clear();
    last_allocations_.clear();
    history_.clear();
}

} // namespace allocation
} // namespace tradebrain
