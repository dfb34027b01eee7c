#include "features/PositioningFeatureExtractor.h"

namespace confluence {
namespace features {

PositioningFeatures PositioningFeatureExtractor::extract(const std::optional<DerivativesMetrics>& derivatives) {
    PositioningFeatures out;
    if (!derivatives) {
        return out;
    }
    if (!derivatives->funding_rate && !derivatives->oi_change_pct) {
        return out;
    }

    out.funding_rate = derivatives->funding_rate.value_or(0.0);
    out.oi_change_pct = derivatives->oi_change_pct.value_or(0.0);
    out.has_data = true;
    return out;
}

} // namespace features
} // namespace confluence
