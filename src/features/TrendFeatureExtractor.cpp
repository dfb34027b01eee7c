#include "features/TrendFeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace confluence {
namespace features {

using analytics::TechnicalIndicators;

TrendFeatures TrendFeatureExtractor::extract(const std::vector<Bar>& bars) {
    TrendFeatures out;
    if (bars.size() < kTrendMinBars) {
        return out;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(bars);
    out.ma_alignment = maAlignment(closes, 20, 50);
    out.persistence = persistence(closes, 20);
    out.distance_from_ma_pct = distanceFromMa(closes, 50);
    out.ma_slope_pct = TechnicalIndicators::calculateSMASlopePercent(closes, 50, 5);
    out.has_data = true;
    return out;
}

double TrendFeatureExtractor::maAlignment(const std::vector<double>& closes, int short_period, int long_period) {
    if (closes.size() < static_cast<size_t>(std::max(short_period, long_period))) {
        return 0.0;
    }

    const double short_ma = TechnicalIndicators::calculateSMA(closes, short_period);
    const double long_ma = TechnicalIndicators::calculateSMA(closes, long_period);

    constexpr double eps = 1e-8;
    if (std::abs(short_ma - long_ma) <= eps) {
        return 0.0;
    }
    return short_ma > long_ma ? 1.0 : -1.0;
}

double TrendFeatureExtractor::persistence(const std::vector<double>& closes, int lookback) {
    if (lookback <= 0 || closes.size() < static_cast<size_t>(lookback + 1)) {
        return 0.5;
    }

    int up_closes = 0;
    for (size_t i = closes.size() - lookback; i < closes.size(); ++i) {
        if (closes[i] > closes[i - 1]) {
            ++up_closes;
        }
    }
    return static_cast<double>(up_closes) / lookback;
}

double TrendFeatureExtractor::distanceFromMa(const std::vector<double>& closes, int ma_period) {
    if (closes.size() < static_cast<size_t>(ma_period)) {
        return 0.0;
    }
    const double ma = TechnicalIndicators::calculateSMA(closes, ma_period);
    return TechnicalIndicators::percentChange(closes.back(), ma);
}

} // namespace features
} // namespace confluence
