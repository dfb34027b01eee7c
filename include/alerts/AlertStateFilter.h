#pragma once

#include <vector>
#include "alerts/AlertConfig.h"
#include "alerts/AlertTypes.h"

namespace confluence {
namespace alerts {

struct FilterOutcome {
    std::vector<AlertEvent> kept;
    AlertState state;
};

// Per-symbol dedup. An event passes only when the symbol is out of its
// cooldown AND its confluence beats last_cs + min_cs_delta. Each kept event
// advances the symbol's state to {its score, now}.
class AlertStateFilter {
public:
    static FilterOutcome apply(const std::vector<AlertEvent>& events,
                               const AlertState& state,
                               const AlertsConfig& config,
                               Timestamp now);
};

} // namespace alerts
} // namespace confluence
