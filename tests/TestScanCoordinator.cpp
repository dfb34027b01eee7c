#include "alerts/AlertDispatcher.h"
#include "common/TimeUtils.h"
#include "pipeline/ScanCoordinator.h"
#include "pipeline/ScorePipeline.h"
#include "FakeMarketDataSource.h"
#include "TestBars.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

using namespace confluence;
using namespace confluence::testing;
using confluence::alerts::AlertEvent;
using confluence::alerts::AlertState;
using confluence::pipeline::ScanCoordinator;
using confluence::pipeline::ScanSettings;
using confluence::pipeline::ScorePipeline;
using confluence::utils::TimeUtils;

namespace {

class MemoryStateStore : public alerts::IAlertStateStore {
public:
    AlertState stored;
    int saves = 0;

    AlertState load() override { return stored; }
    bool save(const AlertState& state) override {
        stored = state;
        ++saves;
        return true;
    }
};

class CapturingNotifier : public alerts::INotifier {
public:
    std::vector<AlertEvent> received;
    std::string name() const override { return "capture"; }
    void send(const std::vector<AlertEvent>& events) override {
        received.insert(received.end(), events.begin(), events.end());
    }
};

ScanSettings hourlySettings() {
    ScanSettings settings;
    settings.data.timeframe = "1h";
    settings.data.bar_limit = 120;
    return settings;
}

std::shared_ptr<FakeMarketDataSource> risingMarket() {
    auto source = std::make_shared<FakeMarketDataSource>();
    const std::vector<std::string> healthy = {"BTC/USDT", "ETH/USDT", "SOL/USDT"};
    double start = 100.0;
    for (const auto& symbol : healthy) {
        source->addSymbol(symbol);
        source->bars[{symbol, "1h"}] = barsFromCloses(linearCloses(150, start, 1.0), 0.5, 1000.0, symbol);
        start += 50.0;
    }
    source->addSymbol("FAIL/USDT");
    source->failing.insert("FAIL/USDT");
    source->addSymbol("EMPTY/USDT");
    return source;
}

bool hasReason(const std::vector<AlertEvent>& events, const std::string& reason) {
    return std::any_of(events.begin(), events.end(),
                       [&](const AlertEvent& e) { return e.reason == reason; });
}

void testFullScan() {
    auto source = risingMarket();
    DerivativesMetrics btc;
    btc.symbol = "BTC/USDT";
    btc.funding_rate = 0.0001;
    source->derivatives["BTC/USDT"] = btc;
    source->failing_derivatives.insert("SOL/USDT");
    auto store = std::make_shared<MemoryStateStore>();
    auto notifier = std::make_shared<CapturingNotifier>();
    auto dispatcher = std::make_shared<alerts::AlertDispatcher>();
    dispatcher->addNotifier(notifier);

    ScanCoordinator coordinator(source, store, dispatcher, hourlySettings());
    assert(coordinator.patterns().enabledNames().size() == 4);

    const Timestamp now = TimeUtils::fromEpochMs(kBaseTimeMs + 200 * kHourMs);
    const auto result = coordinator.runScan(now);

    // Failing and bar-less symbols drop out, order of discovery is kept
    assert(result.universe == (std::vector<std::string>{"BTC/USDT", "ETH/USDT", "SOL/USDT"}));
    assert(result.bundles.size() == 3);
    for (const auto& bundle : result.bundles) {
        assert(bundle.timeframe == "1h");
        assert(bundle.confluence_score >= 0.0 && bundle.confluence_score <= 100.0);
        assert(bundle.regime == MarketRegime::BULL);
    }

    // SOL's derivatives failed, so positioning stays neutral
    assert(result.bundles[0].features.positioning.has_data);
    assert(!result.bundles[2].features.positioning.has_data);

    assert(result.health.regime == MarketRegime::BULL);
    assert(near(*result.health.breadth_pct, 100.0));

    assert(result.ranking.filtered.size() == 3);
    assert(result.ranking.board("all_by_confluence").size() == 3);

    // First scan records the regime silently and persists once
    assert(store->saves == 1);
    assert(store->stored.global_regime && *store->stored.global_regime == "bull");
    assert(!hasReason(result.alerts, alerts::kReasonRegimeChange));
    assert(notifier->received.size() == result.alerts.size());

    // The market turns: the next scan raises a regime change
    for (auto& entry : source->bars) {
        const auto symbol = entry.first.first;
        entry.second = barsFromCloses(linearCloses(150, 300.0, -1.0), 0.5, 1000.0, symbol);
    }
    const auto second = coordinator.runScan(now + std::chrono::milliseconds(kHourMs));
    assert(second.health.regime == MarketRegime::BEAR);
    assert(hasReason(second.alerts, alerts::kReasonRegimeChange));
    assert(*store->stored.global_regime == "bear");
    assert(store->saves == 2);
    assert(notifier->received.size() == result.alerts.size() + second.alerts.size());
}

void testMaxSymbols() {
    auto source = risingMarket();
    auto settings = hourlySettings();
    settings.data.max_symbols = 2;

    ScanCoordinator coordinator(source, nullptr, nullptr, settings);
    const auto result = coordinator.runScan(TimeUtils::fromEpochMs(kBaseTimeMs));
    assert(result.universe == (std::vector<std::string>{"BTC/USDT", "ETH/USDT"}));
    assert(result.bundles.size() == 2);
    // No store means no alert evaluation
    assert(result.alerts.empty());
}

void testEmptyUniverse() {
    auto source = std::make_shared<FakeMarketDataSource>();
    auto store = std::make_shared<MemoryStateStore>();
    ScanCoordinator coordinator(source, store, nullptr, hourlySettings());

    const auto result = coordinator.runScan(TimeUtils::fromEpochMs(kBaseTimeMs));
    assert(result.universe.empty());
    assert(result.bundles.empty());
    assert(result.alerts.empty());
    assert(store->saves == 0);

    // Every symbol failing leaves nothing to score
    source->addSymbol("FAIL/USDT");
    source->failing.insert("FAIL/USDT");
    const auto failed = coordinator.runScan(TimeUtils::fromEpochMs(kBaseTimeMs));
    assert(failed.universe.empty());
    assert(store->saves == 0);

    ScanCoordinator detached(nullptr, store, nullptr, hourlySettings());
    assert(detached.runScan(TimeUtils::fromEpochMs(kBaseTimeMs)).universe.empty());
}

void testPipelineSkipsMissingBars() {
    const scoring::ConfluenceBlender blender{scoring::ConfluenceConfig{}};
    const ScorePipeline pipeline(blender);

    std::map<std::string, std::vector<Bar>> bars;
    bars["A/USDT"] = barsFromCloses(linearCloses(100, 50.0, 0.5), 0.5, 1000.0, "A/USDT");
    bars["B/USDT"] = {};

    const auto bundles = pipeline.buildBundles({"A/USDT", "B/USDT", "C/USDT"}, "1h", bars, {});
    assert(bundles.size() == 1);
    assert(bundles[0].symbol == "A/USDT");
    // Without a registry nothing gets labelled
    assert(bundles[0].pattern_labels.empty());
    assert(bundles[0].features.rs.has_data);
}

} // namespace

int main() {
    testFullScan();
    testMaxSymbols();
    testEmptyUniverse();
    testPipelineSkipsMissingBars();

    std::cout << "[TEST] ScanCoordinator PASSED\n";
    return 0;
}
