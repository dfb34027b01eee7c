#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "alerts/AlertConfig.h"
#include "alerts/AlertDispatcher.h"
#include "alerts/IAlertStateStore.h"
#include "data/IMarketDataSource.h"
#include "pattern/PatternConfig.h"
#include "pattern/PatternRegistry.h"
#include "pipeline/ScanConfig.h"
#include "pipeline/ScoreBundle.h"
#include "ranking/RankingConfig.h"
#include "ranking/RankingEngine.h"
#include "scoring/ConfluenceBlender.h"
#include "scoring/ScoringConfig.h"

namespace confluence {
class Config;

namespace pipeline {

struct ScanSettings {
    DataConfig data;
    scoring::RegimeThresholds regimes;
    scoring::ConfluenceConfig confluence;
    pattern::PatternsConfig patterns;
    ranking::RankingConfig ranking;
    alerts::AlertsConfig alerts;

    static ScanSettings fromConfig(const Config& config);
};

struct ScanResult {
    std::vector<std::string> universe;      // symbols that returned bars
    MarketHealth health;
    std::vector<ScoreBundle> bundles;
    ranking::RankingOutput ranking;
    std::vector<alerts::AlertEvent> alerts;
};

// One scan: universe -> bars -> derivatives -> market health -> score
// bundles -> ranking -> alerts -> dispatch. A failing symbol is skipped for
// the failing step only.
class ScanCoordinator {
public:
    ScanCoordinator(
        std::shared_ptr<data::IMarketDataSource> source,
        std::shared_ptr<alerts::IAlertStateStore> state_store,
        std::shared_ptr<alerts::AlertDispatcher> dispatcher,
        const ScanSettings& settings
    );

    ScanResult runScan(Timestamp now);

    const pattern::PatternRegistry& patterns() const { return patterns_; }

private:
    std::vector<std::string> loadUniverse();
    std::map<std::string, std::vector<Bar>> fetchBars(const std::vector<std::string>& symbols);
    std::map<std::string, DerivativesMetrics> fetchDerivatives(const std::vector<std::string>& symbols);

    std::shared_ptr<data::IMarketDataSource> source_;
    std::shared_ptr<alerts::IAlertStateStore> state_store_;
    std::shared_ptr<alerts::AlertDispatcher> dispatcher_;
    ScanSettings settings_;
    scoring::ConfluenceBlender blender_;
    pattern::PatternRegistry patterns_;
};

} // namespace pipeline
} // namespace confluence
