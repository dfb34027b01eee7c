#include "alerts/AlertDispatcher.h"
#include "alerts/AlertEngine.h"
#include "alerts/AlertStateFilter.h"
#include "alerts/AlertStateStoreJson.h"
#include "common/TimeUtils.h"
#include "FakeMarketDataSource.h"
#include "TestBars.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace confluence;
using namespace confluence::alerts;
using confluence::pipeline::ScoreBundle;
using confluence::utils::TimeUtils;

namespace {

// In-memory store that counts saves
class MemoryStateStore : public IAlertStateStore {
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

class CapturingNotifier : public INotifier {
public:
    std::vector<AlertEvent> received;
    std::string name() const override { return "capture"; }
    void send(const std::vector<AlertEvent>& events) override {
        received.insert(received.end(), events.begin(), events.end());
    }
};

class BrokenNotifier : public INotifier {
public:
    std::string name() const override { return "broken"; }
    void send(const std::vector<AlertEvent>&) override {
        throw std::runtime_error("transport down");
    }
};

Timestamp at(const std::string& iso) {
    auto ts = TimeUtils::fromIso8601(iso);
    assert(ts.has_value());
    return *ts;
}

ScoreBundle strongBundle(const std::string& symbol, double confluence) {
    ScoreBundle b;
    b.symbol = symbol;
    b.timeframe = "1h";
    b.confluence_score = confluence;
    b.scores.trend.score = 70.0;
    b.scores.volume.score = 60.0;
    b.scores.volatility.score = 55.0;
    b.scores.rs.score = 65.0;
    b.scores.positioning.score = 55.0;
    return b;
}

MarketHealth healthWith(MarketRegime regime) {
    MarketHealth health;
    health.regime = regime;
    health.benchmark_trend = 62.5;
    health.breadth_pct = 55.0;
    return health;
}

AlertsConfig quietConfig() {
    AlertsConfig config;
    config.types.rsi_divergence = false;
    return config;
}

void testCooldownAndDelta() {
    AlertsConfig config = quietConfig();
    AlertEngine engine(config);
    MemoryStateStore store;
    const auto health = healthWith(MarketRegime::BULL);

    const Timestamp t0 = at("2024-03-01T10:00:00Z");
    auto first = engine.run({strongBundle("X/USDT", 70.0)}, health, store, t0);
    assert(first.state_saved);
    assert(first.events.size() == 1);
    assert(first.events[0].reason == kReasonHighConfluence);
    assert(store.stored.symbols.at("X/USDT").last_cs == 70.0);
    assert(*store.stored.symbols.at("X/USDT").last_ts == "2024-03-01T10:00:00Z");
    // First run records the regime without an event
    assert(*store.stored.global_regime == "bull");

    // Nine minutes later with 71.0: inside cooldown
    auto second = engine.run({strongBundle("X/USDT", 71.0)}, health, store,
                             t0 + std::chrono::minutes(9));
    assert(second.events.empty());
    assert(store.stored.symbols.at("X/USDT").last_cs == 70.0);

    // Past cooldown but below last_cs + 3
    auto third = engine.run({strongBundle("X/USDT", 72.0)}, health, store,
                            t0 + std::chrono::minutes(61));
    assert(third.events.empty());

    // Past cooldown with a real improvement
    auto fourth = engine.run({strongBundle("X/USDT", 74.5)}, health, store,
                             t0 + std::chrono::minutes(62));
    assert(fourth.events.size() == 1);
    assert(store.stored.symbols.at("X/USDT").last_cs == 74.5);
    assert(*store.stored.symbols.at("X/USDT").last_ts == "2024-03-01T11:02:00Z");
    assert(store.saves == 4);
}

void testStateFilterDirect() {
    AlertsConfig config;
    AlertState state;
    state.symbols["OLD/USDT"].last_cs = 90.0;
    state.symbols["OLD/USDT"].last_ts = "not-a-timestamp";

    AlertEvent hc;
    hc.symbol = "NEW/USDT";
    hc.reason = kReasonHighConfluence;
    hc.confluence_score = 65.0;
    AlertEvent vs = hc;
    vs.reason = kReasonVolumeSpike;
    AlertEvent old = hc;
    old.symbol = "OLD/USDT";
    old.confluence_score = 92.0;

    const Timestamp now = at("2024-03-02T00:00:00Z");
    const auto outcome = AlertStateFilter::apply({hc, vs, old}, state, config, now);
    // Second event of the same symbol lands in the fresh cooldown;
    // an unparsable last_ts counts as none but the score delta still applies
    assert(outcome.kept.size() == 1);
    assert(outcome.kept[0].reason == kReasonHighConfluence);
    assert(outcome.state.symbols.at("OLD/USDT").last_cs == 90.0);
    // Input state is untouched
    assert(!state.symbols.count("NEW/USDT"));
}

void testRegimeChange() {
    AlertEngine engine(quietConfig());
    MemoryStateStore store;
    store.stored.global_regime = "bull";

    const Timestamp now = at("2024-03-03T12:00:00Z");
    auto result = engine.run({strongBundle("Y/USDT", 20.0)}, healthWith(MarketRegime::BEAR),
                             store, now);
    assert(result.events.size() == 1);
    assert(result.events[0].symbol == kGlobalSymbol);
    assert(result.events[0].reason == kReasonRegimeChange);
    assert(result.events[0].message ==
           "Market regime changed from BULL to BEAR (benchmark trend 62.5, breadth 55.0%).");
    assert(*store.stored.global_regime == "bear");

    // Same regime again: nothing
    auto again = engine.run({strongBundle("Y/USDT", 20.0)}, healthWith(MarketRegime::BEAR),
                            store, now + std::chrono::minutes(5));
    assert(again.events.empty());

    AlertsConfig muted = quietConfig();
    muted.types.regime_change = false;
    AlertState state;
    state.global_regime = "bear";
    assert(!AlertEngine(muted).checkRegimeChange(healthWith(MarketRegime::BULL), state, now));
    assert(*state.global_regime == "bear");
}

void testTriggersAndGates() {
    AlertsConfig config = quietConfig();
    AlertEngine engine(config);
    const Timestamp now = at("2024-03-04T00:00:00Z");

    ScoreBundle all = strongBundle("ALL/USDT", 80.0);
    all.scores.volume.score = 90.0;
    all.scores.volatility.score = 30.0;
    all.features.volatility.has_data = true;
    all.features.volatility.bb_width_pct_20 = 4.0;

    ScoreBundle no_vol_data = all;
    no_vol_data.symbol = "NODATA/USDT";
    no_vol_data.features.volatility.has_data = false;

    ScoreBundle weak = strongBundle("WEAK/USDT", 80.0);
    weak.scores.positioning.score = 30.0;

    const auto events = engine.buildSymbolAlerts({all, no_vol_data, weak},
                                                 healthWith(MarketRegime::SIDEWAYS), now);
    std::vector<std::string> seen;
    for (const auto& e : events) seen.push_back(e.symbol + ":" + e.reason);
    assert(seen == (std::vector<std::string>{
        "ALL/USDT:HIGH_CONFLUENCE", "ALL/USDT:VOLUME_SPIKE", "ALL/USDT:SQUEEZE_CANDIDATE",
        "NODATA/USDT:HIGH_CONFLUENCE", "NODATA/USDT:VOLUME_SPIKE"}));
    assert(events[0].message ==
           "CS: 80.0 | Trend: 70.0 | Vol: 30.0 | Volu: 90.0 | RS: 65.0 | Pos: 55.0 | "
           "Regime: SIDEWAYS (benchmark trend 62.5, breadth 55.0%)");
    assert(events[0].regime_label == "sideways");
    assert(*events[0].volume_score == 90.0);

    AlertsConfig gated = config;
    gated.require_uptrend_regime = true;
    assert(AlertEngine(gated).buildSymbolAlerts({all}, healthWith(MarketRegime::BEAR), now).empty());
    assert(!AlertEngine(gated).buildSymbolAlerts({all}, healthWith(MarketRegime::BULL), now).empty());
}

void testRunEdges() {
    const Timestamp now = at("2024-03-05T00:00:00Z");

    // Disabled: state is neither loaded into the result nor written
    AlertsConfig off = quietConfig();
    off.enabled = false;
    MemoryStateStore untouched;
    auto disabled = AlertEngine(off).run({strongBundle("X/USDT", 90.0)},
                                         healthWith(MarketRegime::BULL), untouched, now);
    assert(disabled.events.empty());
    assert(!disabled.state_saved);
    assert(untouched.saves == 0);

    // Empty ranked list: state saved, no regime bookkeeping
    MemoryStateStore store;
    auto empty = AlertEngine(quietConfig()).run({}, healthWith(MarketRegime::BULL), store, now);
    assert(empty.events.empty());
    assert(empty.state_saved);
    assert(!store.stored.global_regime.has_value());

    // scan_top_n caps the candidates
    AlertsConfig capped = quietConfig();
    capped.scan_top_n = 1;
    MemoryStateStore capped_store;
    auto result = AlertEngine(capped).run(
        {strongBundle("A/USDT", 80.0), strongBundle("B/USDT", 79.0)},
        healthWith(MarketRegime::BULL), capped_store, now);
    assert(result.events.size() == 1);
    assert(result.events[0].symbol == "A/USDT");
}

void testRsiDivergenceAlerts() {
    auto source = std::make_shared<confluence::testing::FakeMarketDataSource>();
    source->bars[{"DIV/USDT", "4h"}] = confluence::testing::barsFromCloses(
        confluence::testing::bullishDivergenceCloses());
    source->failing.insert("FAIL/USDT");

    AlertsConfig config;
    config.types.high_confluence = false;
    config.types.volume_spike = false;
    config.types.squeeze_candidate = false;
    config.rsi_divergence_timeframes = {"4h", "1d"};
    config.rsi_divergence_min_strength = 1.0;
    config.rsi_divergence_max_bars_from_last = 5;

    AlertEngine engine(config, source);
    const auto events = engine.buildSymbolAlerts(
        {strongBundle("DIV/USDT", 50.0), strongBundle("FAIL/USDT", 50.0)},
        healthWith(MarketRegime::BULL), at("2024-03-06T00:00:00Z"));
    assert(events.size() == 1);
    assert(events[0].symbol == "DIV/USDT");
    assert(events[0].reason == "RSI_BULLISH_DIVERGENCE_4h");
    // Two timeframes per symbol
    assert(source->ohlcv_calls == 4);

    // Stock alert settings need a pivot that is at most one bar old
    AlertsConfig stock;
    stock.types.high_confluence = false;
    stock.types.volume_spike = false;
    stock.types.squeeze_candidate = false;
    assert(AlertEngine(stock, source).buildSymbolAlerts(
        {strongBundle("DIV/USDT", 50.0)}, healthWith(MarketRegime::BULL),
        at("2024-03-06T00:00:00Z")).empty());

    // No source: divergence alerts are skipped
    assert(AlertEngine(config).buildSymbolAlerts(
        {strongBundle("DIV/USDT", 50.0)}, healthWith(MarketRegime::BULL),
        at("2024-03-06T00:00:00Z")).empty());
}

void testJsonStore() {
    const auto dir = std::filesystem::temp_directory_path() / "confluence_alert_state_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "nested" / "alerts_state.json";

    AlertStateStoreJson store(path);
    assert(store.load().symbols.empty());

    AlertState state;
    state.symbols["BTC/USDT"].last_cs = 71.25;
    state.symbols["BTC/USDT"].last_ts = "2024-03-01T10:00:00Z";
    state.global_regime = "sideways";
    assert(store.save(state));
    assert(std::filesystem::exists(path));
    assert(!std::filesystem::exists(path.string() + ".tmp"));

    const auto loaded = store.load();
    assert(loaded.symbols.size() == 1);
    assert(*loaded.symbols.at("BTC/USDT").last_cs == 71.25);
    assert(*loaded.symbols.at("BTC/USDT").last_ts == "2024-03-01T10:00:00Z");
    assert(*loaded.global_regime == "sideways");

    {
        std::ofstream corrupt(path, std::ios::trunc);
        corrupt << "{\"symbols\": {\"BTC/USDT\": ";
    }
    const auto fresh = store.load();
    assert(fresh.symbols.empty());
    assert(!fresh.global_regime.has_value());

    // Wrong shapes are dropped entry by entry
    const auto partial = AlertState::fromJson(nlohmann::json::parse(
        R"({"symbols": {"A": {"last_cs": "high"}, "B": 3}, "global_regime": 7})"));
    assert(partial.symbols.size() == 1);
    assert(!partial.symbols.at("A").last_cs.has_value());
    assert(!partial.global_regime.has_value());

    std::filesystem::remove_all(dir, ec);
}

void testStateTimestamps() {
    const auto start = TimeUtils::fromEpochMs(testing::kBaseTimeMs);
    assert(TimeUtils::toIso8601(start) == "2024-01-01T00:00:00Z");
    assert(TimeUtils::formatEpochMs(testing::kBaseTimeMs + 25 * testing::kHourMs) == "2024-01-02T01:00:00Z");

    const auto parsed = TimeUtils::fromIso8601("2024-03-01T10:00:00Z");
    assert(parsed && TimeUtils::toIso8601(*parsed) == "2024-03-01T10:00:00Z");
    assert(!TimeUtils::fromIso8601("yesterday"));
    assert(!TimeUtils::fromIso8601("2024-03-01T10:00:00Z trailing"));
}

void testDispatcher() {
    AlertDispatcher dispatcher;
    auto capture = std::make_shared<CapturingNotifier>();
    dispatcher.addNotifier(std::make_shared<BrokenNotifier>());
    dispatcher.addNotifier(capture);
    dispatcher.addNotifier(nullptr);
    assert(dispatcher.notifierCount() == 2);

    AlertEvent event;
    event.symbol = "ETH/USDT";
    event.reason = kReasonVolumeSpike;
    event.confluence_score = 66.66;
    event.message = "CS: 66.7";
    dispatcher.dispatch({event});
    assert(capture->received.size() == 1);
    assert(ConsoleNotifier::formatLine(event) == "[ALERT] ETH/USDT | VOLUME_SPIKE | CS: 66.7 | CS: 66.7");
}

} // namespace

int main() {
    testCooldownAndDelta();
    testStateFilterDirect();
    testRegimeChange();
    testTriggersAndGates();
    testRunEdges();
    testRsiDivergenceAlerts();
    testJsonStore();
    testStateTimestamps();
    testDispatcher();

    std::cout << "[TEST] AlertEngine PASSED\n";
    return 0;
}
