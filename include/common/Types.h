#pragma once

#include <chrono>
#include <cmath>
#include <deque>
#include <optional>
#include <random>
#include <string>

namespace tradebrain {

using Timestamp = std::chrono::system_clock::time_point;
using RandomEngine = std::mt19937_64;

enum class StreakType { NONE, WIN, LOSS };

// Indicator readings at trade entry. Any field may be missing.
struct IndicatorSnapshot {
    std::optional<double> rsi;
    std::optional<double> adx;
    std::optional<double> atr;
};

// Closed trade as reported by the owning engine.
struct TradeOutcome {
    std::string strategy = "?";
    std::string symbol = "UNKNOWN";
    std::string direction;
    double entry_price = 0.0;
    double exit_price = 0.0;
    long long ticket = 0;
    double profit = 0.0;
    bool won = false;
    double sl_distance = 1.0;
    double duration_seconds = 3600.0;
    long long timestamp_ms = 0; // 0: stamped at ingestion
};

// Enriched history entry. Created once per closed trade, never mutated.
struct TradeRecord {
    std::string strategy;
    std::string symbol;
    std::string regime;
    std::string session;
    IndicatorSnapshot indicators;
    std::string direction;
    double entry_price = 0.0;
    double exit_price = 0.0;
    long long ticket = 0;
    double profit = 0.0;
    bool won = false;
    double sl_distance = 1.0;
    double duration_seconds = 3600.0;
    long long timestamp_ms = 0;
};

// Oldest first.
using TradeHistory = std::deque<TradeRecord>;

inline const char* toString(StreakType type) {
    switch (type) {
        case StreakType::WIN: return "win";
        case StreakType::LOSS: return "loss";
        default: return "none";
    }
}

inline StreakType streakTypeFromString(const std::string& value) {
    if (value == "win") return StreakType::WIN;
    if (value == "loss") return StreakType::LOSS;
    return StreakType::NONE;
}

inline double safeDiv(double numerator, double denominator, double fallback = 0.0) {
    return (denominator == 0.0) ? fallback : (numerator / denominator);
}

inline double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace tradebrain
