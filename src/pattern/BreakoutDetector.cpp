#include "pattern/BreakoutDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace confluence {
namespace pattern {

using analytics::TechnicalIndicators;

BreakoutDetector::BreakoutDetector(const BreakoutParams& params)
    : params_(params)
{
}

std::optional<PatternSignal> BreakoutDetector::detect(const PatternContext& ctx) const {
    if (params_.lookback <= 0) {
        return std::nullopt;
    }
    const size_t lookback = static_cast<size_t>(params_.lookback);
    const auto& bars = ctx.bars;
    if (bars.size() < lookback + 1) {
        return std::nullopt;
    }

    // Prior range excludes the current bar
    double pivot_high = bars[bars.size() - lookback - 1].high;
    double pivot_low = bars[bars.size() - lookback - 1].low;
    for (size_t i = bars.size() - lookback - 1; i + 1 < bars.size(); ++i) {
        pivot_high = std::max(pivot_high, bars[i].high);
        pivot_low = std::min(pivot_low, bars[i].low);
    }

    const double last_close = bars.back().close;
    const double rvol = ctx.features.volume.rvol_20_1;
    const double trend = ctx.scores.trend.score;
    const double volume = ctx.scores.volume.score;
    const double rs = ctx.scores.rs.score;
    const double confluence = ctx.confluence_score.value_or(0.0);

    const bool bullish_break = pivot_high > 0 &&
        last_close >= pivot_high * (1.0 + params_.break_buffer_pct / 100.0);
    if (bullish_break &&
        rvol >= params_.min_rvol &&
        trend >= params_.min_trend_score &&
        volume >= params_.min_volume_score &&
        rs >= params_.min_rs_score &&
        confluence >= params_.min_confluence) {
        return buildSignal(ctx, SignalDirection::BULLISH, pivot_high,
                           TechnicalIndicators::percentChange(last_close, pivot_high), rvol);
    }

    if (!params_.allow_bearish) {
        return std::nullopt;
    }

    const bool bearish_break = pivot_low > 0 &&
        last_close <= pivot_low * (1.0 - params_.break_buffer_pct / 100.0);
    if (bearish_break &&
        rvol >= params_.min_rvol &&
        trend <= 100.0 - params_.min_trend_score &&
        volume >= params_.min_volume_score &&
        confluence >= params_.min_confluence) {
        return buildSignal(ctx, SignalDirection::BEARISH, pivot_low,
                           -TechnicalIndicators::percentChange(last_close, pivot_low), rvol);
    }

    return std::nullopt;
}

PatternSignal BreakoutDetector::buildSignal(
    const PatternContext& ctx,
    SignalDirection direction,
    double pivot_price,
    double breakout_pct,
    double rvol
) const {
    const double trend = ctx.scores.trend.score;
    const double volume = ctx.scores.volume.score;
    const double rs = ctx.scores.rs.score;
    const double confluence = ctx.confluence_score.value_or(0.0);

    const double distance_score = TechnicalIndicators::clamp(breakout_pct * 10.0);
    const double support_score = TechnicalIndicators::clamp(
        0.4 * trend + 0.3 * volume + 0.2 * rs + 0.1 * confluence);
    const double strength = TechnicalIndicators::clamp(0.5 * distance_score + 0.5 * support_score);

    PatternSignal signal;
    signal.pattern_name = name();
    signal.symbol = ctx.symbol;
    signal.timeframe = ctx.timeframe;
    signal.triggered = true;
    signal.direction = direction;
    signal.strength = strength;
    signal.confidence = TechnicalIndicators::clamp(strength * 0.6 + rvol * 10.0);
    signal.note = fmt::format(
        "{} breakout {} {:.4f} by {:.2f}% (RVOL {:.2f})",
        direction == SignalDirection::BULLISH ? "Bullish" : "Bearish",
        direction == SignalDirection::BULLISH ? "above" : "below",
        pivot_price, breakout_pct, rvol);
    signal.extras = {
        {"pivot", pivot_price},
        {"breakout_pct", breakout_pct},
        {"rvol", rvol},
        {"trend_score", trend},
        {"volume_score", volume},
        {"rs_score", rs}
    };

    LOG_DEBUG("[Breakout] {} {} strength {:.1f}", ctx.symbol,
              directionToString(direction), strength);
    return signal;
}

} // namespace pattern
} // namespace confluence
