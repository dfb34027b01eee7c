#include "features/VolumeFeatureExtractor.h"
#include "analytics/TechnicalIndicators.h"

namespace confluence {
namespace features {

using analytics::TechnicalIndicators;

VolumeFeatures VolumeFeatureExtractor::extract(const std::vector<Bar>& bars) {
    VolumeFeatures out;
    if (bars.size() < kVolumeMinBars) {
        return out;
    }

    const auto volumes = TechnicalIndicators::extractVolumes(bars);
    out.rvol_20_1 = relativeVolume(volumes, 20, 1);
    out.trend_slope_pct_20_10 = TechnicalIndicators::calculateSMASlopePercent(volumes, 20, 10);
    out.percentile_60 = volumePercentile(volumes, 60);
    out.has_data = true;
    return out;
}

double VolumeFeatureExtractor::relativeVolume(const std::vector<double>& volumes, int lookback, int recent_window) {
    if (lookback <= 0 || recent_window <= 0) return 1.0;
    const size_t needed = static_cast<size_t>(lookback + recent_window);
    if (volumes.size() < needed) {
        return 1.0;
    }

    const std::vector<double> base(volumes.end() - needed, volumes.end() - recent_window);
    const std::vector<double> recent(volumes.end() - recent_window, volumes.end());

    const double avg_base = TechnicalIndicators::calculateMean(base);
    if (avg_base <= 0.0) {
        return 1.0;
    }
    return TechnicalIndicators::calculateMean(recent) / avg_base;
}

double VolumeFeatureExtractor::volumePercentile(const std::vector<double>& volumes, int lookback) {
    if (lookback <= 0 || volumes.size() < static_cast<size_t>(lookback + 1)) {
        return 0.5;
    }

    const double last = volumes.back();
    int below_or_equal = 0;
    for (size_t i = volumes.size() - 1 - lookback; i < volumes.size() - 1; ++i) {
        if (volumes[i] <= last) {
            ++below_or_equal;
        }
    }
    return static_cast<double>(below_or_equal) / lookback;
}

} // namespace features
} // namespace confluence
