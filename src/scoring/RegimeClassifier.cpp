#include "scoring/RegimeClassifier.h"

#include <cmath>
#include <optional>

namespace confluence {
namespace scoring {

namespace {
std::optional<double> finiteOrNone(const std::optional<double>& value) {
    if (value && std::isfinite(*value)) return value;
    return std::nullopt;
}
}

RegimeClassifier::RegimeClassifier(const RegimeThresholds& thresholds)
    : thresholds_(thresholds) {}

MarketRegime RegimeClassifier::classify(const MarketHealth& health) const {
    const auto trend_opt = finiteOrNone(health.benchmark_trend);
    const auto breadth_opt = finiteOrNone(health.breadth_pct);
    const auto risk_on_opt = finiteOrNone(health.risk_on);

    if (!trend_opt && !breadth_opt && !risk_on_opt) {
        return MarketRegime::UNKNOWN;
    }

    const double trend = trend_opt.value_or(kNeutralScore);
    const double breadth = breadth_opt.value_or(kNeutralScore);
    // Without a risk-on index, trend and breadth stand in for it
    const double risk_on = risk_on_opt ? *risk_on_opt : (trend + breadth) / 2.0;

    if (risk_on >= thresholds_.bull_min_risk_on &&
        breadth >= thresholds_.bull_min_breadth &&
        trend >= thresholds_.bull_min_trend) {
        return MarketRegime::BULL;
    }

    if (risk_on <= thresholds_.bear_max_risk_on &&
        breadth <= thresholds_.bear_max_breadth &&
        trend <= thresholds_.bear_max_trend) {
        return MarketRegime::BEAR;
    }

    return MarketRegime::SIDEWAYS;
}

} // namespace scoring
} // namespace confluence
