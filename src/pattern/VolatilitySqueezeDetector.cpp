#include "pattern/VolatilitySqueezeDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include <algorithm>

namespace confluence {
namespace pattern {

using analytics::TechnicalIndicators;

VolatilitySqueezeDetector::VolatilitySqueezeDetector(const VolatilitySqueezeParams& params)
    : params_(params)
{
}

std::optional<PatternSignal> VolatilitySqueezeDetector::detect(const PatternContext& ctx) const {
    const double bb_width_pct = ctx.features.volatility.bb_width_pct_20;
    const double contraction = ctx.features.volatility.contraction_ratio_60_20;
    const double vol_score = ctx.scores.volatility.score;
    const double trend = ctx.scores.trend.score;
    const double rs = ctx.scores.rs.score;
    const double rvol = ctx.features.volume.rvol_20_1;

    if (bb_width_pct <= 0.0 || bb_width_pct > params_.max_bb_width_pct) {
        return std::nullopt;
    }
    if (contraction > params_.max_contraction_ratio) {
        return std::nullopt;
    }
    if (vol_score < params_.min_volatility_score) {
        return std::nullopt;
    }
    if (trend < params_.min_trend_score || rs < params_.min_rs_score) {
        return std::nullopt;
    }

    const double compression_score = TechnicalIndicators::clamp(
        (params_.max_bb_width_pct - bb_width_pct) / params_.max_bb_width_pct * 100.0);
    const double contraction_score = TechnicalIndicators::clamp(
        (params_.max_contraction_ratio - contraction) /
        std::max(params_.max_contraction_ratio, 1e-6) * 100.0);
    const double strength = TechnicalIndicators::clamp(
        0.4 * compression_score + 0.3 * contraction_score + 0.3 * vol_score);

    PatternSignal signal;
    signal.pattern_name = name();
    signal.symbol = ctx.symbol;
    signal.timeframe = ctx.timeframe;
    signal.triggered = true;
    signal.direction = SignalDirection::NONE;
    signal.strength = strength;
    signal.confidence = TechnicalIndicators::clamp(
        (strength + trend * 0.3 + rs * 0.2 + rvol * 10.0) / 2.0);
    signal.note = fmt::format("Squeeze: BBW {:.2f}%, ratio {:.2f}, vol_score {:.1f}",
                              bb_width_pct, contraction, vol_score);
    signal.extras = {
        {"bb_width_pct", bb_width_pct},
        {"contraction_ratio", contraction},
        {"volatility_score", vol_score},
        {"trend_score", trend},
        {"rs_score", rs},
        {"rvol", rvol}
    };

    LOG_DEBUG("[Squeeze] {} BBW {:.2f}% strength {:.1f}", ctx.symbol, bb_width_pct, strength);
    return signal;
}

} // namespace pattern
} // namespace confluence
