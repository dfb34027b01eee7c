#include "common/Config.h"
#include "common/Logger.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

using namespace confluence;
using nlohmann::json;

namespace {

void testDefaults() {
    const auto data = parseDataConfig(json::object());
    assert(data.timeframe == "1d");
    assert(data.bar_limit == 300);
    assert(data.benchmark_symbol == "BTC/USDT");

    const auto alerts = parseAlertsConfig(json::object());
    assert(alerts.enabled);
    assert(alerts.cooldown_minutes == 60);
    assert(alerts.min_cs_delta == 3.0);
    assert(alerts.rsi_divergence_timeframes == std::vector<std::string>{"4h"});

    const auto ranking = parseRankingConfig(json::object());
    assert(!ranking.top_n && !ranking.reports_top_n);
    assert(!ranking.filters.max_atr_pct);

    const auto confluence = parseConfluenceConfig(json::object());
    assert(confluence.default_regime == MarketRegime::SIDEWAYS);
    assert(confluence.regime_weights.empty());
}

void testCoercion() {
    // Numeric strings are accepted, junk falls back to the default
    const auto alerts = parseAlertsConfig(json::parse(R"({
        "cooldown_minutes": "30",
        "min_cs_delta": "lots",
        "enabled": "no",
        "types": {"volume_spike": 0},
        "rsi_divergence_timeframe": "1h",
        "state_file": "  state/alerts.json "
    })"));
    assert(alerts.cooldown_minutes == 30);
    assert(alerts.min_cs_delta == 3.0);
    assert(!alerts.enabled);
    assert(!alerts.types.volume_spike);
    assert(alerts.types.high_confluence);
    assert(alerts.rsi_divergence_timeframes == std::vector<std::string>{"1h"});
    assert(alerts.state_file == "state/alerts.json");

    const auto data = parseDataConfig(json::parse(R"({"bar_limit": -5, "max_symbols": 12.4})"));
    assert(data.bar_limit == 1);
    assert(data.max_symbols == 12);

    // Out-of-range integers saturate
    const auto huge = parseAlertsConfig(json::parse(R"({"cooldown_minutes": 1e12, "scan_top_n": "-1e15"})"));
    assert(huge.cooldown_minutes == std::numeric_limits<int>::max());
    assert(huge.scan_top_n == 0);

    const auto big_ranking = parseRankingConfig(json::parse(R"({"ranking": {"top_n": 1e20}})"));
    assert(*big_ranking.top_n == std::numeric_limits<int>::max());
}

void testWeightsAndRegimes() {
    const auto confluence = parseConfluenceConfig(json::parse(R"({
        "default_regime": "bull",
        "regime_weights": {
            "bull": {"trend_score": 0.4, "volume": "0.2", "rs": 0.2, "momentum": 0.5, "positioning": "x"},
            "bear": {"trend": 0.1},
            "crab": {"trend": 1.0},
            "sideways": {}
        }
    })"));
    assert(confluence.default_regime == MarketRegime::BULL);
    assert(confluence.regime_weights.size() == 2);
    const auto& bull = confluence.regime_weights.at(MarketRegime::BULL);
    assert(bull.size() == 3);
    assert(bull.at(scoring::ScoreComponent::TREND) == 0.4);
    assert(bull.at(scoring::ScoreComponent::VOLUME) == 0.2);
    assert(!bull.count(scoring::ScoreComponent::POSITIONING));
    assert(!confluence.regime_weights.count(MarketRegime::SIDEWAYS));

    // Negative weights are malformed and dropped
    const auto negative = parseConfluenceConfig(json::parse(R"({
        "regime_weights": {"bull": {"trend": 1, "volume": -0.5, "rs": "-1", "volatility": 1}}
    })"));
    const auto& negative_bull = negative.regime_weights.at(MarketRegime::BULL);
    assert(negative_bull.size() == 2);
    assert(!negative_bull.count(scoring::ScoreComponent::VOLUME));
    assert(!negative_bull.count(scoring::ScoreComponent::RS));

    const auto bad_default = parseConfluenceConfig(json::parse(R"({"default_regime": "moon"})"));
    assert(bad_default.default_regime == MarketRegime::SIDEWAYS);

    const auto regimes = parseRegimeThresholds(json::parse(R"({"bull_min_trend": 70, "bear_max_breadth": "25"})"));
    assert(regimes.bull_min_trend == 70.0);
    assert(regimes.bear_max_breadth == 25.0);
    assert(regimes.bull_min_breadth == 60.0);
}

void testRankingAndPatterns() {
    const auto ranking = parseRankingConfig(json::parse(R"({
        "ranking": {"top_n": 15, "filters": {"min_trend_score": 55, "max_atr_pct": 8, "max_bb_width_pct": 0}},
        "reports": {"top_n": 25}
    })"));
    assert(*ranking.top_n == 15);
    assert(*ranking.reports_top_n == 25);
    assert(ranking.filters.min_trend_score == 55.0);
    assert(*ranking.filters.max_atr_pct == 8.0);
    assert(!ranking.filters.max_bb_width_pct);

    const auto patterns = parsePatternsConfig(json::parse(R"({
        "enabled": ["breakout", "rsi_divergence"],
        "breakout": {"lookback": 30, "allow_bearish": true},
        "rsi_divergence": {"pivot_lookback": 2, "min_strength": "2.5"}
    })"));
    assert(patterns.enabled.size() == 2);
    assert(patterns.breakout.lookback == 30);
    assert(patterns.breakout.allow_bearish);
    assert(patterns.breakout.min_rvol == 1.5);
    assert(patterns.rsi_divergence.pivot_lookback == 2);
    assert(patterns.rsi_divergence.min_strength == 2.5);
    assert(patterns.pullback.lookback == 15);
}

void testSingletonLoad() {
    Config& config = Config::getInstance();

    const auto dir = std::filesystem::temp_directory_path() / "confluence_config_test";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({
            "data": {"data_dir": "/srv/bars", "timeframe": "4h"},
            "logging": {"level": "DEBUG"},
            "alerts": {"scan_top_n": 10}
        })";
    }
    assert(config.load(path.string()));
    assert(config.getDataConfig().data_dir == "/srv/bars");
    assert(config.getDataConfig().timeframe == "4h");
    assert(config.getLoggingConfig().level == "debug");
    assert(config.getAlertsConfig().scan_top_n == 10);

    config.setTimeframe("1h");
    assert(config.getDataConfig().timeframe == "1h");

    // Missing and malformed files keep what is loaded
    assert(!config.load((dir / "absent.json").string()));
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    assert(!config.load(path.string()));
    assert(config.getDataConfig().data_dir == "/srv/bars");

    config.loadFromJson(json::object());
    assert(config.getDataConfig().data_dir == "data");

    std::filesystem::remove_all(dir, ec);
}

} // namespace

int main() {
    testDefaults();
    testCoercion();
    testWeightsAndRegimes();
    testRankingAndPatterns();
    testSingletonLoad();

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
