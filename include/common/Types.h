#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace confluence {

using Timestamp = std::chrono::system_clock::time_point;

// One OHLCV observation. Sequences are ordered oldest -> newest.
struct Bar {
    std::string symbol;
    std::string timeframe;
    long long open_time;   // epoch ms
    double open;
    double high;
    double low;
    double close;
    double volume;

    Bar() : open_time(0), open(0), high(0), low(0), close(0), volume(0) {}

    Bar(double o, double h, double l, double c, double v, long long t)
        : open_time(t), open(o), high(h), low(l), close(c), volume(v) {}
};

struct SymbolMeta {
    std::string symbol;
    std::string base;
    std::string quote;
    std::string exchange;
    bool is_perp = false;
};

// Per-symbol derivatives snapshot. Every field is absent when the symbol
// has no derivatives market.
struct DerivativesMetrics {
    std::string symbol;
    std::optional<double> funding_rate;     // fraction per funding interval (0.0001 = 0.01%)
    std::optional<double> open_interest;
    std::optional<double> oi_change_pct;
};

enum class MarketRegime {
    UNKNOWN,
    BULL,
    BEAR,
    SIDEWAYS
};

std::string regimeToString(MarketRegime regime);
MarketRegime regimeFromString(const std::string& value);

struct MarketHealth {
    MarketRegime regime = MarketRegime::UNKNOWN;
    std::optional<double> benchmark_trend;   // 0-100 trend score of the benchmark
    std::optional<double> breadth_pct;       // % of universe in uptrend
    std::optional<double> risk_on;           // aggregate risk-on index 0-100
    std::optional<double> benchmark_volatility;
    std::optional<double> avg_positioning;
};

} // namespace confluence
