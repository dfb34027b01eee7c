#include "alerts/AlertStateFilter.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

#include <chrono>

namespace confluence {
namespace alerts {

FilterOutcome AlertStateFilter::apply(const std::vector<AlertEvent>& events,
                                      const AlertState& state,
                                      const AlertsConfig& config,
                                      Timestamp now) {
    FilterOutcome outcome;
    outcome.state = state;
    const auto cooldown = std::chrono::minutes(config.cooldown_minutes);
    const std::string now_text = utils::TimeUtils::toIso8601(now);

    for (const auto& event : events) {
        auto it = outcome.state.symbols.find(event.symbol);
        if (it != outcome.state.symbols.end()) {
            const SymbolAlertState& prior = it->second;

            std::optional<Timestamp> last_ts;
            if (prior.last_ts) {
                last_ts = utils::TimeUtils::fromIso8601(*prior.last_ts);
            }
            if (last_ts && now - *last_ts < cooldown) {
                LOG_DEBUG("[Alerts] {} {} suppressed: cooldown", event.symbol, event.reason);
                continue;
            }
            if (prior.last_cs && event.confluence_score < *prior.last_cs + config.min_cs_delta) {
                LOG_DEBUG("[Alerts] {} {} suppressed: CS {:.1f} < {:.1f} + {:.1f}",
                          event.symbol, event.reason, event.confluence_score,
                          *prior.last_cs, config.min_cs_delta);
                continue;
            }
        }

        outcome.kept.push_back(event);
        SymbolAlertState updated;
        updated.last_cs = event.confluence_score;
        updated.last_ts = now_text;
        outcome.state.symbols[event.symbol] = updated;
    }
    return outcome;
}

} // namespace alerts
} // namespace confluence
