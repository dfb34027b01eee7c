#include "pipeline/ScanCoordinator.h"
#include "alerts/AlertEngine.h"
#include "analytics/MarketHealthAnalyzer.h"
#include "common/Config.h"
#include "common/Logger.h"
#include "pipeline/ScorePipeline.h"

#include <exception>
#include <utility>

namespace confluence {
namespace pipeline {

ScanSettings ScanSettings::fromConfig(const Config& config) {
    ScanSettings settings;
    settings.data = config.getDataConfig();
    settings.regimes = config.getRegimeThresholds();
    settings.confluence = config.getConfluenceConfig();
    settings.patterns = config.getPatternsConfig();
    settings.ranking = config.getRankingConfig();
    settings.alerts = config.getAlertsConfig();
    return settings;
}

ScanCoordinator::ScanCoordinator(
    std::shared_ptr<data::IMarketDataSource> source,
    std::shared_ptr<alerts::IAlertStateStore> state_store,
    std::shared_ptr<alerts::AlertDispatcher> dispatcher,
    const ScanSettings& settings
)
    : source_(std::move(source))
    , state_store_(std::move(state_store))
    , dispatcher_(std::move(dispatcher))
    , settings_(settings)
    , blender_(settings.confluence)
    , patterns_(pattern::PatternRegistry::createDefault(settings.patterns)) {}

std::vector<std::string> ScanCoordinator::loadUniverse() {
    std::vector<std::string> symbols;
    if (!source_) {
        return symbols;
    }

    try {
        for (const auto& meta : source_->discoverUniverse()) {
            symbols.push_back(meta.symbol);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Universe discovery failed: {}", e.what());
        return {};
    }

    const int max_symbols = settings_.data.max_symbols;
    if (max_symbols > 0 && symbols.size() > static_cast<size_t>(max_symbols)) {
        symbols.resize(static_cast<size_t>(max_symbols));
    }
    return symbols;
}

std::map<std::string, std::vector<Bar>> ScanCoordinator::fetchBars(
    const std::vector<std::string>& symbols
) {
    std::map<std::string, std::vector<Bar>> bars_by_symbol;
    for (const auto& symbol : symbols) {
        try {
            auto bars = source_->fetchOhlcv(symbol, settings_.data.timeframe, settings_.data.bar_limit);
            if (bars.empty()) {
                LOG_WARN("No bars for {} {}", symbol, settings_.data.timeframe);
                continue;
            }
            bars_by_symbol[symbol] = std::move(bars);
        } catch (const std::exception& e) {
            LOG_WARN("Failed to fetch bars for {}: {}", symbol, e.what());
        }
    }
    return bars_by_symbol;
}

std::map<std::string, DerivativesMetrics> ScanCoordinator::fetchDerivatives(
    const std::vector<std::string>& symbols
) {
    std::map<std::string, DerivativesMetrics> derivatives;
    for (const auto& symbol : symbols) {
        try {
            derivatives[symbol] = source_->fetchDerivatives(symbol);
        } catch (const std::exception& e) {
            LOG_WARN("Failed to fetch derivatives for {}, positioning neutral: {}", symbol, e.what());
        }
    }
    return derivatives;
}

ScanResult ScanCoordinator::runScan(Timestamp now) {
    ScanResult result;

    const auto symbols = loadUniverse();
    if (symbols.empty()) {
        LOG_WARN("Universe is empty; nothing to scan");
        return result;
    }

    const auto bars_by_symbol = fetchBars(symbols);
    for (const auto& symbol : symbols) {
        if (bars_by_symbol.count(symbol) > 0) {
            result.universe.push_back(symbol);
        }
    }
    if (result.universe.empty()) {
        LOG_WARN("No symbol returned bars; nothing to scan");
        return result;
    }

    const auto derivatives = fetchDerivatives(result.universe);

    const analytics::MarketHealthAnalyzer health_analyzer(settings_.data.benchmark_symbol,
                                                          settings_.regimes);
    result.health = health_analyzer.analyze(result.universe, bars_by_symbol, derivatives);
    LOG_INFO("Market regime: {} (risk-on {:.1f}, breadth {:.1f}%)",
             regimeToString(result.health.regime),
             result.health.risk_on.value_or(0.0),
             result.health.breadth_pct.value_or(0.0));

    std::optional<MarketRegime> regime;
    if (result.health.regime != MarketRegime::UNKNOWN) {
        regime = result.health.regime;
    }

    const ScorePipeline pipeline(blender_, &patterns_);
    result.bundles = pipeline.buildBundles(result.universe, settings_.data.timeframe,
                                           bars_by_symbol, derivatives, regime);

    const ranking::RankingEngine ranking_engine(settings_.ranking, patterns_.enabledNames());
    result.ranking = ranking_engine.rank(result.bundles);

    if (state_store_) {
        const alerts::AlertEngine alert_engine(settings_.alerts, source_);
        auto alert_result = alert_engine.run(result.ranking.board("all_by_confluence"),
                                             result.health, *state_store_, now);
        result.alerts = std::move(alert_result.events);
    }

    if (dispatcher_) {
        dispatcher_->dispatch(result.alerts);
    }

    LOG_INFO("Scan complete: {} symbols scored, {} ranked, {} alerts",
             result.bundles.size(), result.ranking.filtered.size(), result.alerts.size());
    return result;
}

} // namespace pipeline
} // namespace confluence
