#include "learning/PatternDetector.h"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace tradebrain {
namespace learning {

namespace {
struct Bucket {
    int wins = 0;
    int losses = 0;
    double total_profit = 0.0;

    int total() const { return wins + losses; }
    double winRate() const { return safeDiv(wins, total()); }

    void add(bool won, double profit) {
        if (won) {
            wins++;
        } else {
            losses++;
        }
        total_profit += profit;
    }
};

struct ZoneBand {
    double low;
    double high;
    const char* label;
    Bucket bucket;
};

std::string sessionHours(const std::string& session) {
    if (session == "ASIAN") return "00:00-08:00 UTC";
    if (session == "LONDON") return "08:00-16:00 UTC";
    if (session == "NEWYORK") return "13:00-22:00 UTC";
    return "";
}

void tallyBand(std::vector<ZoneBand>& bands, double value, bool won) {
    for (auto& band : bands) {
        if (value >= band.low && value < band.high) {
            band.bucket.add(won, 0.0);
            return;
        }
    }
}
}

std::string PatternDetector::formatPercent(double rate) {
    return fmt::format("{:.0f}%", rate * 100.0);
}

std::string PatternDetector::rsiZone(const std::optional<double>& rsi) {
    if (!rsi) {
        return "unknown";
    }
    if (*rsi < 30.0) {
        return "oversold";
    }
    if (*rsi > 70.0) {
        return "overbought";
    }
    return "neutral";
}

StreakMap PatternDetector::detectStreaks(const TradeHistory& history) {
    std::map<std::string, std::vector<bool>> outcomes_by_strategy;
    for (const auto& trade : history) {
        outcomes_by_strategy[trade.strategy].push_back(trade.won);
    }

    StreakMap result;
    for (const auto& [strategy, outcomes] : outcomes_by_strategy) {
        StreakInfo info;
        int run_win = 0;
        int run_loss = 0;
        for (const bool won : outcomes) {
            if (won) {
                run_win++;
                run_loss = 0;
                info.max_win_streak = std::max(info.max_win_streak, run_win);
            } else {
                run_loss++;
                run_win = 0;
                info.max_loss_streak = std::max(info.max_loss_streak, run_loss);
            }
        }

        if (!outcomes.empty()) {
            const bool last = outcomes.back();
            info.type = last ? StreakType::WIN : StreakType::LOSS;
            info.current_streak = last ? run_win : run_loss;
        }
        result[strategy] = info;
    }
    return result;
}

std::vector<std::string> PatternDetector::detectRegimeBias(const TradeHistory& history) {
    if (history.empty()) {
        return {"Not enough trade data yet to detect regime bias."};
    }

    std::map<std::string, std::map<std::string, Bucket>> stats;
    for (const auto& trade : history) {
        stats[trade.strategy][trade.regime].add(trade.won, trade.profit);
    }

    std::vector<std::string> insights;
    for (const auto& [strategy, regimes] : stats) {
        for (const auto& [regime, b] : regimes) {
            if (b.total() < kMinTradesForPattern) {
                continue;
            }
            const double rate = b.winRate();
            const double avg_profit = b.total_profit / b.total();
            if (rate >= 0.65) {
                insights.push_back(fmt::format(
                    "Strategy {} excels in {} ({} win rate over {} trades, avg profit ${:+.2f})",
                    strategy, regime, formatPercent(rate), b.total(), avg_profit));
            } else if (rate <= 0.35) {
                insights.push_back(fmt::format(
                    "Strategy {} struggles in {} ({} win rate over {} trades, avg loss ${:+.2f})",
                    strategy, regime, formatPercent(rate), b.total(), avg_profit));
            }
        }
    }

    if (insights.empty()) {
        return {"Regime bias patterns are still forming. Need more trades per regime."};
    }
    return insights;
}

std::vector<std::string> PatternDetector::detectTimePatterns(const TradeHistory& history) {
    if (history.empty()) {
        return {"Not enough trade data yet to detect time patterns."};
    }

    std::map<std::string, Bucket> by_session;
    std::map<std::string, std::map<std::string, Bucket>> by_strategy_session;
    for (const auto& trade : history) {
        by_session[trade.session].add(trade.won, trade.profit);
        by_strategy_session[trade.strategy][trade.session].add(trade.won, trade.profit);
    }

    std::vector<std::string> insights;

    const std::string* best_session = nullptr;
    double best_rate = 0.0;
    for (const auto& [session, b] : by_session) {
        if (b.total() < kMinTradesForPattern) {
            continue;
        }
        if (b.winRate() > best_rate) {
            best_rate = b.winRate();
            best_session = &session;
        }
    }
    if (best_session && best_rate > 0.5) {
        insights.push_back(fmt::format(
            "Most winning trades occur during {} session ({}) with {} win rate over {} trades",
            *best_session, sessionHours(*best_session), formatPercent(best_rate),
            by_session[*best_session].total()));
    }

    for (const auto& [strategy, sessions] : by_strategy_session) {
        for (const auto& [session, b] : sessions) {
            if (b.total() < kMinTradesForPattern) {
                continue;
            }
            const double rate = b.winRate();
            if (rate >= 0.70) {
                insights.push_back(fmt::format(
                    "Strategy {} performs best during {} session ({}) - {} win rate over {} trades",
                    strategy, session, sessionHours(session), formatPercent(rate), b.total()));
            } else if (rate <= 0.30) {
                insights.push_back(fmt::format(
                    "Strategy {} underperforms during {} session ({}) - {} win rate over {} trades",
                    strategy, session, sessionHours(session), formatPercent(rate), b.total()));
            }
        }
    }

    if (insights.empty()) {
        return {"Session-based patterns are still forming. Need more data per session."};
    }
    return insights;
}

std::vector<std::string> PatternDetector::detectIndicatorPatterns(const TradeHistory& history) {
    if (history.empty()) {
        return {"Not enough trade data yet to detect indicator patterns."};
    }

    std::vector<ZoneBand> rsi_bands{
        {0.0, 25.0, "RSI < 25", {}},
        {25.0, 30.0, "RSI 25-30", {}},
        {30.0, 45.0, "RSI 30-45", {}},
        {45.0, 55.0, "RSI 45-55", {}},
        {55.0, 70.0, "RSI 55-70", {}},
        {70.0, 75.0, "RSI 70-75", {}},
        {75.0, 100.0, "RSI > 75", {}},
    };
    std::vector<ZoneBand> adx_bands{
        {0.0, 20.0, "ADX < 20 (weak trend)", {}},
        {20.0, 30.0, "ADX 20-30 (moderate trend)", {}},
        {30.0, 40.0, "ADX 30-40 (strong trend)", {}},
        {40.0, 100.0, "ADX > 40 (very strong trend)", {}},
    };
    std::map<std::string, Bucket> oversold_by_strategy;

    for (const auto& trade : history) {
        const auto& ind = trade.indicators;
        if (ind.rsi) {
            tallyBand(rsi_bands, *ind.rsi, trade.won);
            if (*ind.rsi < 30.0) {
                oversold_by_strategy[trade.strategy].add(trade.won, trade.profit);
            }
        }
        if (ind.adx) {
            tallyBand(adx_bands, *ind.adx, trade.won);
        }
    }

    std::vector<std::string> insights;

    for (const auto& band : rsi_bands) {
        const auto& b = band.bucket;
        if (b.total() < kMinTradesForPattern) {
            continue;
        }
        if (b.winRate() >= 0.65) {
            insights.push_back(fmt::format("Trades entered when {} have {} win rate ({} trades)",
                                           band.label, formatPercent(b.winRate()), b.total()));
        } else if (b.winRate() <= 0.35) {
            insights.push_back(fmt::format("Trades entered when {} have poor results - only {} win rate ({} trades)",
                                           band.label, formatPercent(b.winRate()), b.total()));
        }
    }

    for (const auto& band : adx_bands) {
        const auto& b = band.bucket;
        if (b.total() < kMinTradesForPattern) {
            continue;
        }
        if (b.winRate() >= 0.65) {
            insights.push_back(fmt::format("{} significantly improves trade outcomes - {} win rate ({} trades)",
                                           band.label, formatPercent(b.winRate()), b.total()));
        } else if (b.winRate() <= 0.35) {
            insights.push_back(fmt::format("{} correlates with poor outcomes - only {} win rate ({} trades)",
                                           band.label, formatPercent(b.winRate()), b.total()));
        }
    }

    for (const auto& [strategy, b] : oversold_by_strategy) {
        if (b.total() < kMinTradesForPattern) {
            continue;
        }
        if (b.winRate() >= 0.65) {
            insights.push_back(fmt::format("Strategy {} thrives in oversold conditions (RSI < 30) - {} win rate",
                                           strategy, formatPercent(b.winRate())));
        } else if (b.winRate() <= 0.30) {
            insights.push_back(fmt::format("Strategy {} fails in oversold conditions (RSI < 30) - only {} win rate",
                                           strategy, formatPercent(b.winRate())));
        }
    }

    if (insights.empty()) {
        return {"Indicator-based patterns are still forming. Need more data."};
    }
    return insights;
}

std::string PatternDetector::generateMarketMemory(const TradeHistory& history, const std::string& current_regime) {
    if (history.empty()) {
        return "The brain has no trade history yet. All strategies start with equal "
               "confidence. Observing and learning from each trade as it comes.";
    }

    constexpr int kMinSample = 3;

    int total_wins = 0;
    std::map<std::string, Bucket> in_regime;
    std::map<std::string, Bucket> by_session;
    const TradeRecord* last_in_regime = nullptr;
    for (const auto& trade : history) {
        if (trade.won) {
            total_wins++;
        }
        if (trade.regime == current_regime) {
            in_regime[trade.strategy].add(trade.won, trade.profit);
            last_in_regime = &trade;
        }
        by_session[trade.session].add(trade.won, trade.profit);
    }

    const std::string* best_strategy = nullptr;
    const std::string* worst_strategy = nullptr;
    double best_rate = 0.0;
    double worst_rate = 1.0;
    for (const auto& [strategy, b] : in_regime) {
        if (b.total() < kMinSample) {
            continue;
        }
        if (b.winRate() > best_rate) {
            best_rate = b.winRate();
            best_strategy = &strategy;
        }
        if (b.winRate() < worst_rate) {
            worst_rate = b.winRate();
            worst_strategy = &strategy;
        }
    }

    const std::string* best_session = nullptr;
    double best_session_rate = 0.0;
    for (const auto& [session, b] : by_session) {
        if (b.total() < kMinSample) {
            continue;
        }
        if (b.winRate() > best_session_rate) {
            best_session_rate = b.winRate();
            best_session = &session;
        }
    }

    const int total = static_cast<int>(history.size());
    std::vector<std::string> parts;
    parts.push_back(fmt::format("Over the last {} trades, the brain has observed an overall {} win rate",
                                total, formatPercent(safeDiv(total_wins, total))));

    if (best_strategy) {
        parts.push_back(fmt::format("{} conditions favor Strategy {} ({} win rate)",
                                    current_regime, *best_strategy, formatPercent(best_rate)));
    }
    if (worst_strategy && (!best_strategy || *worst_strategy != *best_strategy)) {
        parts.push_back(fmt::format("while Strategy {} consistently underperforms ({} win rate)",
                                    *worst_strategy, formatPercent(worst_rate)));
    }
    if (best_session && best_session_rate > 0.5) {
        parts.push_back(fmt::format("The most profitable entry window is during {} session ({} win rate)",
                                    *best_session, formatPercent(best_session_rate)));
    }

    if (last_in_regime) {
        std::vector<std::string> readings;
        if (last_in_regime->indicators.rsi) {
            readings.push_back(fmt::format("RSI {:.0f}", *last_in_regime->indicators.rsi));
        }
        if (last_in_regime->indicators.adx) {
            readings.push_back(fmt::format("ADX {:.0f}", *last_in_regime->indicators.adx));
        }
        if (!readings.empty()) {
            std::string joined = readings.front();
            for (std::size_t i = 1; i < readings.size(); ++i) {
                joined += ", " + readings[i];
            }
            parts.push_back(fmt::format("Current market conditions ({}, {}) are being monitored for optimal entry setups",
                                        current_regime, joined));
        }
    }

    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += ". ";
        }
        out += parts[i];
    }
    out += ".";
    return out;
}

} // namespace learning
} // namespace tradebrain
