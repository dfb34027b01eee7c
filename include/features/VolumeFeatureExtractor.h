#pragma once

#include <vector>
#include "common/Types.h"
#include "features/FeatureTypes.h"

namespace confluence {
namespace features {

class VolumeFeatureExtractor {
public:
    static VolumeFeatures extract(const std::vector<Bar>& bars);

    // mean of the last `recent_window` volumes / mean of the `lookback` before them
    static double relativeVolume(const std::vector<double>& volumes, int lookback = 20, int recent_window = 1);

    // share (0..1) of the previous `lookback` volumes that are <= the latest one
    static double volumePercentile(const std::vector<double>& volumes, int lookback = 60);
};

} // namespace features
} // namespace confluence
