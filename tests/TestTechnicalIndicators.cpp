#include "analytics/TechnicalIndicators.h"
#include "TestBars.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using confluence::analytics::TechnicalIndicators;
using confluence::testing::near;

int main() {
    // RSI
    {
        const auto rising = confluence::testing::linearCloses(30, 100.0, 1.0);
        assert(TechnicalIndicators::calculateRSI(rising, 14) == 100.0);
        assert(TechnicalIndicators::calculateRSI({1.0, 2.0}, 14) == 50.0);

        const auto falling = confluence::testing::linearCloses(30, 100.0, -1.0);
        assert(TechnicalIndicators::calculateRSI(falling, 14) < 1e-9);

        const auto series = TechnicalIndicators::calculateRSISeries(rising, 14);
        assert(series.size() == rising.size());
        assert(std::isnan(series[13]));
        assert(series[14] == 100.0);
        assert(series.back() == TechnicalIndicators::calculateRSI(rising, 14));

        const auto too_short = TechnicalIndicators::calculateRSISeries({1.0, 2.0, 3.0}, 14);
        assert(too_short.size() == 3);
        assert(std::isnan(too_short[0]) && std::isnan(too_short[2]));
    }

    // SMA, slope, Bollinger width
    {
        const std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 5.0};
        assert(near(TechnicalIndicators::calculateSMA(values, 5), 3.0));
        assert(near(TechnicalIndicators::calculateSMA(values, 2), 4.5));
        assert(TechnicalIndicators::calculateSMA(values, 6) == 0.0);

        // SMA2 from 2.5 (first two of the last four) to 4.5
        assert(near(TechnicalIndicators::calculateSMASlopePercent(values, 2, 2), 80.0));
        assert(TechnicalIndicators::calculateSMASlopePercent(values, 5, 1) == 0.0);

        const std::vector<double> flat(20, 100.0);
        const auto bands = TechnicalIndicators::calculateBollingerBands(flat, 20, 2.0);
        assert(near(bands.middle, 100.0));
        assert(near(bands.width_pct, 0.0));
    }

    // ATR on a constant 2-point range
    {
        const auto bars = confluence::testing::barsFromCloses(std::vector<double>(30, 100.0), 1.0);
        assert(near(TechnicalIndicators::calculateATR(bars, 14), 2.0));
        assert(near(TechnicalIndicators::calculateATRPercent(bars, 14), 2.0));
        assert(TechnicalIndicators::calculateATR(bars, 40) == 0.0);
    }

    // percentileRank
    {
        const std::vector<double> population = {1.0, 2.0, 3.0, 4.0, 5.0};
        assert(near(TechnicalIndicators::percentileRank(5.0, population), 100.0));
        assert(near(TechnicalIndicators::percentileRank(1.0, population), 0.0));
        assert(near(TechnicalIndicators::percentileRank(3.0, population), 50.0));
        assert(TechnicalIndicators::percentileRank(7.0, {2.0, 2.0, 2.0}) == 50.0);
        assert(TechnicalIndicators::percentileRank(7.0, {2.0}) == 100.0);
        assert(TechnicalIndicators::percentileRank(7.0, {}) == 0.0);

        const double nan = std::numeric_limits<double>::quiet_NaN();
        assert(near(TechnicalIndicators::percentileRank(5.0, {1.0, nan, 5.0}), 100.0));
    }

    // Pivots
    {
        const std::vector<double> valley = {5.0, 3.0, 1.0, 3.0, 5.0, 4.0, 6.0};
        const auto lows = TechnicalIndicators::findPivotLows(valley, 1);
        assert(lows.size() == 2);
        assert(lows[0] == 2 && lows[1] == 5);

        const auto highs = TechnicalIndicators::findPivotHighs(valley, 1);
        assert(highs.size() == 1 && highs[0] == 4);

        // Edges never qualify and NaN neighbours disqualify
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const std::vector<double> gappy = {nan, 1.0, 3.0, 2.0, 4.0};
        assert(TechnicalIndicators::findPivotLows(gappy, 1).size() == 1);
        assert(TechnicalIndicators::findPivotLows(gappy, 1)[0] == 3);
        assert(TechnicalIndicators::findPivotLows(valley, 4).empty());
    }

    // clamp / percentChange
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        assert(TechnicalIndicators::clamp(150.0) == 100.0);
        assert(TechnicalIndicators::clamp(-3.0) == 0.0);
        assert(TechnicalIndicators::clamp(nan) == 0.0);
        assert(near(TechnicalIndicators::percentChange(110.0, 100.0), 10.0));
        assert(TechnicalIndicators::percentChange(110.0, 0.0) == 0.0);
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
