#include "pattern/PullbackDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace confluence {
namespace pattern {

using analytics::TechnicalIndicators;

namespace {
constexpr size_t kRsiWindow = 30;
}

PullbackDetector::PullbackDetector(const PullbackParams& params)
    : params_(params)
{
}

std::optional<double> PullbackDetector::recentRsi(const std::vector<Bar>& bars) const {
    const size_t count = std::min(bars.size(), kRsiWindow);
    if (params_.rsi_period <= 0 || count < static_cast<size_t>(params_.rsi_period + 2)) {
        return std::nullopt;
    }
    std::vector<double> closes;
    closes.reserve(count);
    for (size_t i = bars.size() - count; i < bars.size(); ++i) {
        closes.push_back(bars[i].close);
    }
    return TechnicalIndicators::calculateRSI(closes, params_.rsi_period);
}

std::optional<PatternSignal> PullbackDetector::detect(const PatternContext& ctx) const {
    if (params_.lookback <= 0) {
        return std::nullopt;
    }
    const size_t lookback = static_cast<size_t>(params_.lookback);
    const auto& bars = ctx.bars;
    if (bars.size() < lookback + 1) {
        return std::nullopt;
    }

    double recent_high = bars[bars.size() - lookback - 1].close;
    for (size_t i = bars.size() - lookback - 1; i + 1 < bars.size(); ++i) {
        recent_high = std::max(recent_high, bars[i].close);
    }
    if (recent_high == 0.0) {
        return std::nullopt;
    }

    const double last_close = bars.back().close;
    const double pullback_pct = -TechnicalIndicators::percentChange(last_close, recent_high);
    if (pullback_pct < params_.min_pullback_pct || pullback_pct > params_.max_pullback_pct) {
        return std::nullopt;
    }

    const double trend = ctx.scores.trend.score;
    const double rs = ctx.scores.rs.score;
    if (trend < params_.min_trend_score || rs < params_.min_rs_score) {
        return std::nullopt;
    }

    const double dist_from_ma = std::abs(ctx.features.trend.distance_from_ma_pct);
    if (dist_from_ma > params_.ma_proximity_pct) {
        return std::nullopt;
    }

    const double rvol = ctx.features.volume.rvol_20_1;
    if (rvol > params_.max_rvol) {
        return std::nullopt;
    }

    const auto rsi = recentRsi(bars);
    if (rsi && *rsi > params_.max_rsi_in_trend) {
        return std::nullopt;
    }

    const double depth_score = TechnicalIndicators::clamp(
        (params_.max_pullback_pct - pullback_pct) / std::max(params_.max_pullback_pct, 1e-6) * 100.0);
    const double proximity_score = TechnicalIndicators::clamp(
        (params_.ma_proximity_pct - dist_from_ma) / std::max(params_.ma_proximity_pct, 1e-6) * 100.0);
    const double strength = TechnicalIndicators::clamp(0.4 * depth_score + 0.4 * trend + 0.2 * rs);

    PatternSignal signal;
    signal.pattern_name = name();
    signal.symbol = ctx.symbol;
    signal.timeframe = ctx.timeframe;
    signal.triggered = true;
    signal.direction = SignalDirection::BULLISH;
    signal.strength = strength;
    signal.confidence = TechnicalIndicators::clamp((strength + proximity_score) / 2.0);
    signal.note = fmt::format(
        "Bullish pullback: off {:.2f}% from recent high, {:.2f}% from MA; RVOL {:.2f}",
        pullback_pct, dist_from_ma, rvol);
    signal.extras = {
        {"pullback_pct", pullback_pct},
        {"dist_from_ma_pct", dist_from_ma},
        {"trend_score", trend},
        {"rs_score", rs}
    };
    if (rsi) {
        signal.extras["rsi"] = *rsi;
    } else {
        signal.extras["rsi"] = nullptr;
    }

    LOG_DEBUG("[Pullback] {} depth {:.2f}% strength {:.1f}", ctx.symbol, pullback_pct, strength);
    return signal;
}

} // namespace pattern
} // namespace confluence
