#include "ranking/RankingEngine.h"
#include "ranking/RankingFilters.h"

#include <cassert>
#include <iostream>
#include <limits>

using namespace confluence;
using confluence::pipeline::ScoreBundle;
using namespace confluence::ranking;

namespace {

ScoreBundle makeBundle(const std::string& symbol, double confluence,
                       double trend = 60.0, double rs = 50.0,
                       double volume = 50.0, double volatility = 50.0) {
    ScoreBundle b;
    b.symbol = symbol;
    b.timeframe = "1h";
    b.confluence_score = confluence;
    b.scores.trend.score = trend;
    b.scores.rs.score = rs;
    b.scores.volume.score = volume;
    b.scores.volatility.score = volatility;
    b.features.volatility.atr_pct_14 = 3.0;
    b.features.volatility.bb_width_pct_20 = 5.0;
    return b;
}

std::vector<std::string> symbolsOf(const std::vector<ScoreBundle>& bundles) {
    std::vector<std::string> out;
    for (const auto& b : bundles) out.push_back(b.symbol);
    return out;
}

void testFilters() {
    FilterConfig config;
    config.min_trend_score = 55.0;
    config.max_atr_pct = 8.0;
    RankingFilters filters(config);

    auto weak = makeBundle("WEAK/USDT", 60.0, 40.0);
    weak.features.volatility.atr_pct_14 = 12.0;
    const auto verdict = filters.evaluate(weak);
    assert(!verdict.passed);
    assert(verdict.reasons.size() == 2);
    assert(verdict.reasons[0] == "trend<55.0");
    assert(verdict.reasons[1] == "atr_pct>8.0");

    auto broken = makeBundle("NAN/USDT", 60.0);
    broken.features.volatility.atr_pct_14 = std::numeric_limits<double>::quiet_NaN();
    const auto unusable = filters.evaluate(broken);
    assert(!unusable.passed);
    assert(unusable.reasons.size() == 1 && unusable.reasons[0] == "atr_pct_unusable");

    // Default config lets everything through, NaN ATR included
    assert(RankingFilters().evaluate(broken).passed);

    FilterConfig bb;
    bb.max_bb_width_pct = 4.0;
    const auto wide = RankingFilters(bb).evaluate(makeBundle("WIDE/USDT", 50.0));
    assert(!wide.passed && wide.reasons[0] == "bb_width_pct>4.0");

    const auto kept = filters.apply({makeBundle("A/USDT", 70.0), weak, makeBundle("B/USDT", 65.0)});
    assert(symbolsOf(kept) == (std::vector<std::string>{"A/USDT", "B/USDT"}));
}

void testTopN() {
    RankingConfig config;
    RankingEngine plain(config);
    assert(plain.resolveTopN(std::nullopt, 7) == 7);
    assert(plain.resolveTopN(3, 7) == 3);
    assert(plain.resolveTopN(0, 7) == 7);

    config.reports_top_n = 4;
    assert(RankingEngine(config).resolveTopN(std::nullopt, 7) == 4);
    config.top_n = 2;
    assert(RankingEngine(config).resolveTopN(std::nullopt, 7) == 2);
    assert(RankingEngine(config).resolveTopN(5, 7) == 5);
    config.top_n = -1;
    assert(RankingEngine(config).resolveTopN(std::nullopt, 7) == 4);
}

void testBoards() {
    RankingConfig config;
    config.filters.min_trend_score = 50.0;
    RankingEngine engine(config, {"breakout", "rsi_divergence"});

    std::vector<ScoreBundle> bundles = {
        makeBundle("A/USDT", 72.0, 60.0, 90.0, 40.0, 75.0),
        makeBundle("B/USDT", 85.0, 70.0, 30.0, 95.0, 20.0),
        makeBundle("C/USDT", 72.0, 65.0, 60.0, 80.0, 90.0),
        makeBundle("D/USDT", 40.0, 55.0, 70.0, 60.0, 60.0),
        makeBundle("E/USDT", 99.0, 20.0, 99.0, 99.0, 99.0)
    };
    bundles[1].pattern_labels = {"Breakout"};
    bundles[2].pattern_labels = {"rsi_divergence", "breakout"};
    bundles[3].pattern_labels = {"volatility_squeeze"};
    bundles[4].pattern_labels = {"breakout"};

    const auto out = engine.rank(bundles, 2);
    assert(out.filtered.size() == 4);

    // Ties keep input order
    assert(symbolsOf(out.board("all_by_confluence")) ==
           (std::vector<std::string>{"B/USDT", "A/USDT", "C/USDT", "D/USDT"}));
    assert(symbolsOf(out.board("top_confluence")) ==
           (std::vector<std::string>{"B/USDT", "A/USDT"}));
    assert(symbolsOf(out.board("top_relative_strength")) ==
           (std::vector<std::string>{"A/USDT", "D/USDT"}));
    assert(symbolsOf(out.board("volume_surge")) ==
           (std::vector<std::string>{"B/USDT", "C/USDT"}));
    assert(symbolsOf(out.board("volatility_squeeze")) ==
           (std::vector<std::string>{"C/USDT", "A/USDT"}));

    // Watchlist ignores top_n
    assert(symbolsOf(out.board("watchlist")) ==
           (std::vector<std::string>{"B/USDT", "A/USDT", "C/USDT"}));

    // Pattern boards match labels case-insensitively; filtered symbols never appear
    assert(symbolsOf(out.board("pattern_breakout")) ==
           (std::vector<std::string>{"B/USDT", "C/USDT"}));
    assert(symbolsOf(out.board("pattern_rsi_divergence")) ==
           (std::vector<std::string>{"C/USDT"}));
    assert(out.leaderboards.count("pattern_volatility_squeeze") == 0);
    assert(out.board("no_such_board").empty());

    const auto empty = engine.rank({});
    assert(empty.filtered.empty());
    assert(empty.board("top_confluence").empty());
    assert(empty.leaderboards.count("pattern_breakout") == 1);
}

} // namespace

int main() {
    testFilters();
    testTopN();
    testBoards();

    std::cout << "[TEST] Ranking PASSED\n";
    return 0;
}
