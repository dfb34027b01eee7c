#pragma once

#include <optional>
#include "common/Types.h"
#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

// Funding / open-interest pass-through. Neutral without a snapshot or when
// both consumed fields are null.
class PositioningFeatureExtractor {
public:
    static PositioningFeatures extract(const std::optional<DerivativesMetrics>& derivatives);
};

} // namespace features
} // namespace confluence
