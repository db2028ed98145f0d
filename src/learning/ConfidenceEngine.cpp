#include "learning/ConfidenceEngine.h"
#include "learning/RewardCalculator.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <set>
#include <unordered_set>

#include <spdlog/fmt/fmt.h>

namespace tradebrain {
namespace learning {

namespace {
constexpr double kStrongWinRate = 0.65;
constexpr double kWeakWinRate = 0.35;
constexpr double kRegimeStrongRate = 0.60;
constexpr double kRegimeBump = 0.2;

RandomEngine seededEngine(std::uint64_t seed) {
    if (seed != 0) {
        return RandomEngine(seed);
    }
    std::random_device rd;
    return RandomEngine((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
}

double clampAdjustment(double value) {
    return roundTo(std::clamp(value, -ConfidenceEngine::kMaxAdjustment, ConfidenceEngine::kMaxAdjustment), 3);
}

nlohmann::json matrixEntry(const OutcomeTally& t) {
    return {
        {"wins", t.wins},
        {"losses", t.losses},
        {"total_trades", t.total()},
        {"total_profit", roundTo(t.total_profit, 2)},
        {"avg_profit", roundTo(t.avgProfit(), 2)},
        {"win_rate", roundTo(t.winRate(), 3)}
    };
}

nlohmann::json slotEntry(const OutcomeTally& t) {
    return {
        {"wins", t.wins},
        {"losses", t.losses},
        {"total", t.total()},
        {"profit", roundTo(t.total_profit, 2)},
        {"win_rate", roundTo(t.winRate(), 3)},
        {"avg_profit", roundTo(t.avgProfit(), 2)}
    };
}

nlohmann::json tableMatrix(const TallyTable& table) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [outer, inner] : table) {
        out[outer] = nlohmann::json::object();
        for (const auto& [bucket, tally] : inner) {
            out[outer][bucket] = matrixEntry(tally);
        }
    }
    return out;
}

nlohmann::json timeMatrix(const TimeTallyTable& table) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [strategy, symbols] : table) {
        out[strategy] = nlohmann::json::object();
        for (const auto& [symbol, slots] : symbols) {
            out[strategy][symbol] = nlohmann::json::object();
            for (const auto& [slot, tally] : slots) {
                out[strategy][symbol][std::to_string(slot)] = slotEntry(tally);
            }
        }
    }
    return out;
}

// Tally of one strategy over the last `window` history entries, optionally in one regime.
OutcomeTally recentTally(const TradeHistory& history, int window,
                         const std::string& strategy, const std::string* regime) {
    const std::size_t n = static_cast<std::size_t>(std::max(0, window));
    const auto begin = (history.size() > n)
        ? std::prev(history.end(), static_cast<std::ptrdiff_t>(n))
        : history.begin();

    OutcomeTally t;
    for (auto it = begin; it != history.end(); ++it) {
        if (it->strategy != strategy) {
            continue;
        }
        if (regime && it->regime != *regime) {
            continue;
        }
        t.add(it->won, it->profit);
    }
    return t;
}

// One strategy's hour or weekday slot, summed over symbols.
OutcomeTally slotTally(const TimeTallyTable& table, const std::string& strategy, int slot) {
    OutcomeTally out;
    const auto by_symbol = table.find(strategy);
    if (by_symbol == table.end()) {
        return out;
    }
    for (const auto& entry : by_symbol->second) {
        const auto it = entry.second.find(slot);
        if (it != entry.second.end()) {
            out.wins += it->second.wins;
            out.losses += it->second.losses;
            out.total_profit += it->second.total_profit;
        }
    }
    return out;
}

// Non-finite numbers are replaced by the field's neutral default. Returns true on replacement.
bool replaceNonFinite(double& value, double fallback) {
    if (std::isfinite(value)) {
        return false;
    }
    value = fallback;
    return true;
}

void dropNonFinite(std::optional<double>& reading) {
    if (reading && !std::isfinite(*reading)) {
        reading.reset();
    }
}

std::string capitalizeFirst(std::string text) {
    if (!text.empty()) {
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    }
    return text;
}
}

nlohmann::json adjustmentsToJson(const AdjustmentMap& adjustments) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [strategy, view] : adjustments) {
        out[strategy] = {
            {"adjustment", view.adjustment},
            {"reason", view.reason},
            {"rl_preset", view.rl_preset},
            {"rl_expected", view.rl_expected}
        };
    }
    return out;
}

nlohmann::json RlStats::toJson() const {
    return {
        {"distributions", distributions},
        {"total_trades_analyzed", total_trades_analyzed},
        {"total_reward", total_reward},
        {"avg_reward", avg_reward},
        {"exploration_rate", exploration_rate},
        {"confidence_adjustments", adjustmentsToJson(confidence_adjustments)}
    };
}

ConfidenceEngine::ConfidenceEngine(engine::LearningConfig config)
    : ConfidenceEngine(config, seededEngine(config.rng_seed)) {}

ConfidenceEngine::ConfidenceEngine(engine::LearningConfig config, RandomEngine rng)
    : ConfidenceEngine(std::move(config), std::move(rng), common::Clock()) {}

ConfidenceEngine::ConfidenceEngine(engine::LearningConfig config, RandomEngine rng, common::Clock clock)
    : config_(std::move(config))
    , rng_(std::move(rng))
    , clock_(std::move(clock))
    , gate_([this]() {
          GateThresholds t;
          t.window = config_.regime_window;
          t.min_trades = config_.min_trades_for_adjustment;
          return t;
      }()) {
    rl_exploration_rate_ = config_.exploration_rate;
    resetLearner();
}

TradeAnalysis ConfidenceEngine::analyzeTrade(const TradeOutcome& raw_outcome,
                                             const std::string& regime,
                                             const std::string& session,
                                             const IndicatorSnapshot& raw_indicators) {
    TradeOutcome outcome = raw_outcome;
    const TradeOutcome defaults;
    bool replaced = false;
    replaced |= replaceNonFinite(outcome.profit, 0.0);
    replaced |= replaceNonFinite(outcome.entry_price, 0.0);
    replaced |= replaceNonFinite(outcome.exit_price, 0.0);
    replaced |= replaceNonFinite(outcome.sl_distance, defaults.sl_distance);
    replaced |= replaceNonFinite(outcome.duration_seconds, defaults.duration_seconds);
    if (replaced) {
        LOG_WARN("Trade {} ({}): non-finite numeric field replaced by its default", outcome.ticket, outcome.strategy);
    }

    IndicatorSnapshot indicators = raw_indicators;
    dropNonFinite(indicators.rsi);
    dropNonFinite(indicators.adx);
    dropNonFinite(indicators.atr);

    TradeRecord record;
    record.strategy = outcome.strategy.empty() ? "?" : outcome.strategy;
    record.symbol = outcome.symbol.empty() ? "UNKNOWN" : outcome.symbol;
    record.regime = regime;
    record.session = session;
    record.indicators = indicators;
    record.direction = outcome.direction;
    record.entry_price = outcome.entry_price;
    record.exit_price = outcome.exit_price;
    record.ticket = outcome.ticket;
    record.profit = outcome.profit;
    record.won = outcome.won;
    record.sl_distance = outcome.sl_distance;
    record.duration_seconds = outcome.duration_seconds;
    record.timestamp_ms = (outcome.timestamp_ms > 0) ? outcome.timestamp_ms : now();

    state_.appendTrade(record, static_cast<std::size_t>(std::max(1, config_.max_trade_history)));
    updateTables(record);

    state_.total_trade_count++;
    applyExplorationDecay();

    const double reward = RewardCalculator::calculate(outcome);
    rl_total_trades_++;
    rl_total_reward_ += reward;

    const std::string preset = bandit_.selectPreset(record.strategy, regime, rng_);
    bandit_.update(record.strategy, regime, preset, reward);

    recalculateAdjustments();

    const auto [text, delta] = buildInsight(record);

    InsightRecord insight;
    insight.timestamp_ms = record.timestamp_ms;
    insight.text = text;
    insight.confidence = std::abs(delta);
    insight.strategy = record.strategy;
    insight.reward = reward;
    state_.appendInsight(std::move(insight), static_cast<std::size_t>(std::max(1, config_.max_insights)));

    LOG_INFO("Trade analyzed: {} {} {} profit={:.2f} won={} reward={:.4f} preset={} delta={:.3f}",
             record.strategy, regime, session, record.profit, record.won, reward, preset, delta);

    TradeAnalysis analysis;
    analysis.insight = text;
    analysis.confidence_delta = delta;
    analysis.strategy = record.strategy;
    analysis.reward = reward;
    analysis.preset = preset;
    return analysis;
}

SignalDecision ConfidenceEngine::shouldOverrideSignal(const std::string& strategy,
                                                      const std::string& regime,
                                                      const IndicatorSnapshot& indicators) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const double draw = uniform(rng_);
    return gate_.evaluate(strategy, regime, indicators, state_, bandit_, effectiveExplorationRate(), draw);
}

void ConfidenceEngine::updateTables(const TradeRecord& record) {
    state_.regime_stats[record.strategy][record.regime].add(record.won, record.profit);
    state_.session_stats[record.strategy][record.session].add(record.won, record.profit);
    state_.rsi_zone_stats[record.strategy][PatternDetector::rsiZone(record.indicators.rsi)].add(record.won, record.profit);

    state_.hour_stats[record.strategy][record.symbol][common::utcHour(record.timestamp_ms)].add(record.won, record.profit);
    state_.dow_stats[record.strategy][record.symbol][common::utcWeekday(record.timestamp_ms)].add(record.won, record.profit);

    if (last_transition_) {
        const long long elapsed = record.timestamp_ms - last_transition_ms_;
        if (elapsed >= 0 && elapsed <= kTransitionWindowMs) {
            const std::string key = last_transition_->first + "->" + last_transition_->second;
            state_.transition_stats[key][record.strategy].add(record.won, record.profit);
            LOG_DEBUG("Transition stat updated: {} {} won={}", key, record.strategy, record.won);
        }
    }
}

void ConfidenceEngine::applyExplorationDecay() {
    if (!config_.exploration_decay_enabled) {
        return;
    }
    const long long after = config_.exploration_decay_after_trades;
    if (state_.total_trade_count < after) {
        return;
    }

    const double since = static_cast<double>(state_.total_trade_count - after);
    const double constant = (config_.exploration_decay_constant > 0.0) ? config_.exploration_decay_constant : 300.0;
    const double target = config_.exploration_decay_target;
    const double rate = target + (config_.exploration_rate - target) * std::exp(-since / constant);
    state_.current_exploration_rate = roundTo(rate, 4);

    LOG_DEBUG("Exploration decay: trades={} rate={:.4f}", state_.total_trade_count, state_.current_exploration_rate);
}

double ConfidenceEngine::effectiveExplorationRate() const {
    if (config_.exploration_decay_enabled &&
        state_.total_trade_count >= config_.exploration_decay_after_trades) {
        return state_.current_exploration_rate;
    }
    return rl_exploration_rate_;
}

std::vector<std::string> ConfidenceEngine::strategies() const {
    std::vector<std::string> out = config_.strategies;
    std::set<std::string> seen(out.begin(), out.end());
    for (const auto& record : state_.history) {
        if (seen.insert(record.strategy).second) {
            out.push_back(record.strategy);
        }
    }
    return out;
}

std::string ConfidenceEngine::currentRegime() const {
    return state_.history.empty() ? std::string() : state_.history.back().regime;
}

void ConfidenceEngine::recalculateAdjustments() {
    std::map<std::string, double> adjustments;
    const auto codes = strategies();
    for (const auto& code : codes) {
        adjustments[code] = 0.0;
    }

    const auto& history = state_.history;
    if (history.empty()) {
        state_.adjustments = std::move(adjustments);
        return;
    }

    const std::size_t lookback = static_cast<std::size_t>(std::max(0, config_.confidence_lookback));
    std::map<std::string, std::pair<int, int>> recent; // strategy -> (wins, total)
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        auto& slot = recent[it->strategy];
        if (static_cast<std::size_t>(slot.second) < lookback) {
            slot.second++;
            if (it->won) {
                slot.first++;
            }
        }
    }

    const auto streaks = PatternDetector::detectStreaks(history);
    const std::string regime = currentRegime();

    for (const auto& code : codes) {
        const auto r = recent.find(code);
        if (r == recent.end() || r->second.second < config_.min_trades_for_adjustment) {
            continue;
        }

        const double win_rate = safeDiv(r->second.first, r->second.second);
        double adj = (win_rate - 0.5) * 0.4;

        const auto s = streaks.find(code);
        if (s != streaks.end() && s->second.current_streak >= config_.streak_warning_threshold) {
            const int steps = std::min(s->second.current_streak - 2, 3);
            if (s->second.type == StreakType::LOSS) {
                adj -= 0.05 * steps;
            } else if (s->second.type == StreakType::WIN) {
                adj += 0.02 * steps;
            }
        }

        adj += (bandit_.bestExpected(code, regime).second - 0.5) * 0.2;
        adjustments[code] = clampAdjustment(adj);
    }

    state_.adjustments = std::move(adjustments);
}

std::pair<std::string, double> ConfidenceEngine::buildInsight(const TradeRecord& record) const {
    const auto& s = record.strategy;
    const auto& regime = record.regime;
    const auto& rsi = record.indicators.rsi;
    const auto& adx = record.indicators.adx;
    const bool trending = (regime == "TRENDING_UP" || regime == "TRENDING_DOWN");

    std::string text = fmt::format("Strategy {} {} in {} during {}", s, record.won ? "won" : "lost", regime, record.session);
    if (rsi) {
        text += fmt::format(" with RSI {:.0f}", *rsi);
    }
    if (adx) {
        text += fmt::format(" (ADX {:.0f})", *adx);
    }
    text += ". ";

    double delta = 0.0;
    if (!record.won) {
        if (s == "B" && trending) {
            text += "Mean reversion underperforms in strong trends.";
            delta = -0.1;
        } else if (s == "A" && regime == "RANGING") {
            text += "Trend following struggles in ranging conditions.";
            delta = -0.1;
        } else if (s == "C" && regime == "QUIET") {
            text += "Breakout strategies fail in low-volatility environments.";
            delta = -0.08;
        } else if (adx && *adx < 20.0) {
            text += fmt::format("Weak trend strength (ADX {:.0f}) didn't support the setup.", *adx);
            delta = -0.05;
        } else if (rsi && *rsi < 25.0) {
            text += "Deeply oversold RSI didn't produce the expected reversal.";
            delta = -0.05;
        } else {
            text += fmt::format("${:.2f} loss recorded. Monitoring for pattern.", std::abs(record.profit));
            delta = -0.03;
        }
    } else {
        if (s == "A" && trending) {
            text += "Trend following shines in directional markets.";
            delta = 0.05;
        } else if (s == "B" && regime == "RANGING") {
            text += "Mean reversion works well in range-bound conditions.";
            delta = 0.05;
        } else if (s == "D" && rsi && (*rsi < 30.0 || *rsi > 70.0)) {
            text += "Volatility harvesting at RSI extremes paid off.";
            delta = 0.05;
        } else {
            text += fmt::format("+${:.2f} profit. Reinforcing confidence.", record.profit);
            delta = 0.03;
        }
    }

    const auto streaks = PatternDetector::detectStreaks(state_.history);
    const auto it = streaks.find(s);
    if (it != streaks.end() && it->second.current_streak >= config_.streak_warning_threshold) {
        if (it->second.type == StreakType::LOSS) {
            text += fmt::format(" WARNING: {} consecutive losses for Strategy {}.", it->second.current_streak, s);
            delta = std::min(delta, -0.1);
        } else if (it->second.type == StreakType::WIN) {
            text += fmt::format(" Hot streak: {} wins in a row for Strategy {}.", it->second.current_streak, s);
            delta = std::max(delta, 0.05);
        }
    }

    return {text, roundTo(delta, 3)};
}

AdjustmentMap ConfidenceEngine::getStrategyConfidenceAdjustments() const {
    const auto& history = state_.history;
    const auto streaks = PatternDetector::detectStreaks(history);
    const std::string regime = history.empty() ? std::string("UNKNOWN") : currentRegime();

    AdjustmentMap result;
    for (const auto& code : strategies()) {
        const auto stored = state_.adjustments.find(code);
        double adj = (stored != state_.adjustments.end()) ? stored->second : 0.0;
        std::vector<std::string> reasons;

        const OutcomeTally in_regime = recentTally(history, config_.regime_window, code, &regime);
        if (in_regime.total() > 0) {
            const double rate = in_regime.winRate();
            const bool enough = in_regime.total() >= config_.min_trades_for_adjustment;
            if (rate > kRegimeStrongRate && enough) {
                reasons.push_back(fmt::format("strong in {} ({}/{} wins)", regime, in_regime.wins, in_regime.total()));
                adj += kRegimeBump;
            } else if (rate < kWeakWinRate && enough) {
                reasons.push_back(fmt::format("weak in {} ({}/{} wins)", regime, in_regime.wins, in_regime.total()));
                adj -= kRegimeBump;
            } else {
                reasons.push_back(fmt::format("moderate in {} ({}/{} wins)", regime, in_regime.wins, in_regime.total()));
            }
        } else {
            reasons.push_back(fmt::format("no trades in {} yet (exploring)", regime));
        }

        const OutcomeTally overall = recentTally(history, config_.overall_window, code, nullptr);
        if (overall.total() > 0) {
            if (overall.winRate() >= kStrongWinRate) {
                reasons.push_back(fmt::format("strong overall ({}/{} wins)", overall.wins, overall.total()));
            } else if (overall.winRate() <= kWeakWinRate) {
                reasons.push_back(fmt::format("poor overall ({}/{} wins)", overall.wins, overall.total()));
            }
        }

        const auto s = streaks.find(code);
        if (s != streaks.end() && s->second.current_streak >= config_.streak_warning_threshold) {
            reasons.push_back(fmt::format("{}-trade {} streak", s->second.current_streak,
                                          s->second.type == StreakType::LOSS ? "losing" : "winning"));
        }

        appendTimePenalties(code, adj, reasons);

        const auto [best_preset, best_ev] = bandit_.bestExpected(code, regime);
        reasons.push_back(fmt::format("RL favors '{}' (EV: {})", best_preset, PatternDetector::formatPercent(best_ev)));

        std::string reason;
        for (std::size_t i = 0; i < reasons.size(); ++i) {
            if (i > 0) {
                reason += "; ";
            }
            reason += reasons[i];
        }

        AdjustmentView view;
        view.adjustment = clampAdjustment(adj);
        view.reason = capitalizeFirst(reason);
        view.rl_preset = best_preset;
        view.rl_expected = roundTo(best_ev, 3);
        result[code] = std::move(view);
    }
    return result;
}

void ConfidenceEngine::appendTimePenalties(const std::string& code, double& adj,
                                           std::vector<std::string>& reasons) const {
    static const char* const kDayNames[] = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };

    const long long now_ms = now();
    const int hour = common::utcHour(now_ms);
    const int weekday = common::utcWeekday(now_ms);

    const OutcomeTally by_hour = slotTally(state_.hour_stats, code, hour);
    if (by_hour.total() >= kTimeSlotMinTrades && by_hour.winRate() < kTimeSlotWeakRate) {
        adj -= kTimeSlotPenalty;
        reasons.push_back(fmt::format("poor at hour {:02d}:00 UTC ({}/{} wins, {})", hour,
                                      by_hour.wins, by_hour.total(), PatternDetector::formatPercent(by_hour.winRate())));
    }

    const OutcomeTally by_day = slotTally(state_.dow_stats, code, weekday);
    if (by_day.total() >= kTimeSlotMinTrades && by_day.winRate() < kTimeSlotWeakRate) {
        adj -= kTimeSlotPenalty;
        reasons.push_back(fmt::format("poor on {} ({}/{} wins, {})", kDayNames[weekday],
                                      by_day.wins, by_day.total(), PatternDetector::formatPercent(by_day.winRate())));
    }

    if (!last_transition_) {
        return;
    }
    const long long elapsed = now_ms - last_transition_ms_;
    if (elapsed < 0 || elapsed > kTransitionWindowMs) {
        return;
    }
    const std::string key = last_transition_->first + "->" + last_transition_->second;
    const auto transition = state_.transition_stats.find(key);
    if (transition == state_.transition_stats.end()) {
        return;
    }
    const auto tally = transition->second.find(code);
    if (tally == transition->second.end()) {
        return;
    }
    const OutcomeTally& t = tally->second;
    if (t.total() >= kTransitionMinTrades && t.winRate() < kTransitionWeakRate) {
        adj -= kTransitionPenalty;
        reasons.push_back(fmt::format("transition penalty: {}/{} wins after {} ({})",
                                      t.wins, t.total(), key, PatternDetector::formatPercent(t.winRate())));
    }
}

RlStats ConfidenceEngine::getRlStats() const {
    RlStats stats;
    stats.distributions = bandit_.distributions();
    stats.total_trades_analyzed = rl_total_trades_;
    stats.total_reward = roundTo(rl_total_reward_, 4);
    stats.avg_reward = roundTo(safeDiv(rl_total_reward_, static_cast<double>(rl_total_trades_)), 4);
    stats.exploration_rate = effectiveExplorationRate();
    stats.confidence_adjustments = getStrategyConfidenceAdjustments();
    return stats;
}

void ConfidenceEngine::notifyRegimeChange(const std::string& from_regime, const std::string& to_regime, long long at_ms) {
    last_transition_ = std::make_pair(from_regime, to_regime);
    last_transition_ms_ = (at_ms > 0) ? at_ms : now();
    LOG_INFO("Regime transition recorded: {} -> {} at {}", from_regime, to_regime, common::toIso8601(last_transition_ms_));
}

nlohmann::json ConfidenceEngine::getRegimePerformance() const {
    return tableMatrix(state_.regime_stats);
}

nlohmann::json ConfidenceEngine::getSessionPerformance() const {
    return tableMatrix(state_.session_stats);
}

nlohmann::json ConfidenceEngine::getRsiZonePerformance() const {
    return tableMatrix(state_.rsi_zone_stats);
}

nlohmann::json ConfidenceEngine::getHourPerformance() const {
    return timeMatrix(state_.hour_stats);
}

nlohmann::json ConfidenceEngine::getDowPerformance() const {
    return timeMatrix(state_.dow_stats);
}

nlohmann::json ConfidenceEngine::getTransitionPerformance() const {
    nlohmann::json stats = nlohmann::json::object();
    for (const auto& [transition, by_strategy] : state_.transition_stats) {
        stats[transition] = nlohmann::json::object();
        for (const auto& [strategy, tally] : by_strategy) {
            stats[transition][strategy] = slotEntry(tally);
        }
    }

    nlohmann::json out;
    out["transition_stats"] = std::move(stats);
    if (last_transition_) {
        const long long elapsed = now() - last_transition_ms_;
        out["last_regime_change_time"] = common::toIso8601(last_transition_ms_);
        out["last_regime_transition"] = {last_transition_->first, last_transition_->second};
        out["within_transition_window"] = (elapsed >= 0 && elapsed <= kTransitionWindowMs);
    } else {
        out["last_regime_change_time"] = nullptr;
        out["last_regime_transition"] = nullptr;
        out["within_transition_window"] = false;
    }
    return out;
}

std::vector<std::string> ConfidenceEngine::getLearnedInsights(std::size_t limit) const {
    const auto& history = state_.history;
    std::vector<std::string> all;

    const auto append = [&all](const std::vector<std::string>& rows) {
        all.insert(all.end(), rows.begin(), rows.end());
    };
    append(PatternDetector::detectRegimeBias(history));
    append(PatternDetector::detectTimePatterns(history));
    append(PatternDetector::detectIndicatorPatterns(history));

    for (const auto& [strategy, streak] : PatternDetector::detectStreaks(history)) {
        if (streak.current_streak < config_.streak_warning_threshold) {
            continue;
        }
        if (streak.type == StreakType::LOSS) {
            all.push_back(fmt::format("Strategy {} is on a {}-trade losing streak. "
                                      "Consider pausing or reducing allocation.", strategy, streak.current_streak));
        } else if (streak.type == StreakType::WIN) {
            all.push_back(fmt::format("Strategy {} is hot with {} consecutive wins. "
                                      "Confidence elevated.", strategy, streak.current_streak));
        }
    }

    for (const auto& entry : bandit_.contexts()) {
        const auto& key = entry.first;
        const auto [preset, ev] = bandit_.bestExpected(key.strategy, key.regime);
        const std::string label = key.strategy + "_" + key.regime;
        if (ev >= 0.65) {
            all.push_back(fmt::format("RL: {} strongly favors '{}' preset (expected value: {})",
                                      label, preset, PatternDetector::formatPercent(ev)));
        } else if (ev <= 0.35) {
            all.push_back(fmt::format("RL: {} shows poor performance across all presets (best EV: {}). "
                                      "Consider regime avoidance.", label, PatternDetector::formatPercent(ev)));
        }
    }

    for (auto it = state_.insights.rbegin(); it != state_.insights.rend(); ++it) {
        all.push_back(it->text);
    }

    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    for (auto& text : all) {
        if (unique.size() >= limit) {
            break;
        }
        if (seen.insert(text).second) {
            unique.push_back(std::move(text));
        }
    }
    return unique;
}

std::string ConfidenceEngine::getMarketMemory(const std::string& current_regime) const {
    return PatternDetector::generateMarketMemory(state_.history, current_regime);
}

nlohmann::json ConfidenceEngine::banditSnapshot() const {
    nlohmann::json out;
    out["parameter_adapter"] = bandit_.toJson();
    out["rl_total_trades"] = rl_total_trades_;
    out["rl_total_reward"] = rl_total_reward_;
    out["rl_exploration_rate"] = rl_exploration_rate_;
    out["_saved_at"] = common::toIso8601(now());
    return out;
}

void ConfidenceEngine::restoreLearner(LearnerState state) {
    state_ = std::move(state);
    recalculateAdjustments();
}

void ConfidenceEngine::restoreBandit(const nlohmann::json& payload) {
    resetBandit();
    const std::size_t contexts = bandit_.fromJson(payload.value("parameter_adapter", nlohmann::json::object()));
    rl_total_trades_ = payload.value("rl_total_trades", 0LL);
    rl_total_reward_ = payload.value("rl_total_reward", 0.0);
    rl_exploration_rate_ = std::clamp(payload.value("rl_exploration_rate", config_.exploration_rate), 0.0, 1.0);
    LOG_INFO("Bandit state restored: contexts={} trades={} total_reward={:.4f}",
             contexts, rl_total_trades_, rl_total_reward_);
}

void ConfidenceEngine::resetLearner() {
    state_ = LearnerState();
    state_.current_exploration_rate = config_.exploration_rate;
    for (const auto& code : config_.strategies) {
        state_.adjustments[code] = 0.0;
    }
}

void ConfidenceEngine::resetBandit() {
    bandit_.clear();
    rl_total_trades_ = 0;
    rl_total_reward_ = 0.0;
    rl_exploration_rate_ = config_.exploration_rate;
}

} // namespace learning
} // namespace tradebrain
