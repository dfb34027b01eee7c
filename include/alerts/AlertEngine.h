#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "alerts/AlertConfig.h"
#include "alerts/AlertTypes.h"
#include "alerts/IAlertStateStore.h"
#include "data/IMarketDataSource.h"
#include "pipeline/ScoreBundle.h"

namespace confluence {
namespace alerts {

struct AlertScanResult {
    std::vector<AlertEvent> events;     // symbol events that passed the state filter, then regime change
    AlertState state;
    bool state_saved = false;
};

// Turns ranked score bundles into deduplicated alert events.
class AlertEngine {
public:
    // `source` is needed only for RSI divergence alerts; without it they are skipped
    explicit AlertEngine(const AlertsConfig& config,
                         std::shared_ptr<data::IMarketDataSource> source = nullptr);

    // Independent triggers per symbol; one symbol may fire several reasons
    std::vector<AlertEvent> buildSymbolAlerts(const std::vector<pipeline::ScoreBundle>& ranked,
                                              const MarketHealth& health,
                                              Timestamp now) const;

    // First call records the regime silently; later calls emit once per change.
    // Updates state.global_regime.
    std::optional<AlertEvent> checkRegimeChange(const MarketHealth& health,
                                                AlertState& state,
                                                Timestamp now) const;

    // load -> build -> state filter -> regime check -> save
    AlertScanResult run(const std::vector<pipeline::ScoreBundle>& ranked,
                        const MarketHealth& health,
                        IAlertStateStore& store,
                        Timestamp now) const;

    static std::string formatMessage(const pipeline::ScoreBundle& bundle, const MarketHealth& health);

private:
    AlertEvent makeEvent(const pipeline::ScoreBundle& bundle,
                         const MarketHealth& health,
                         const std::string& reason,
                         Timestamp now) const;
    void appendRsiDivergenceAlerts(const pipeline::ScoreBundle& bundle,
                                   const MarketHealth& health,
                                   Timestamp now,
                                   std::vector<AlertEvent>& events) const;

    AlertsConfig config_;
    std::shared_ptr<data::IMarketDataSource> source_;
};

} // namespace alerts
} // namespace confluence
