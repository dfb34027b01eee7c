#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace confluence {
namespace analytics {

// Technical indicators shared by feature extractors and pattern detectors
class TechnicalIndicators {
public:
    // RSI (Wilder smoothing) of the whole series. 50 when history is too short.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // RSI value per index. NaN before index `period`, all NaN when
    // prices.size() < period + 2.
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double width;       // upper - lower
        double width_pct;   // width / middle * 100

        BollingerBands() : upper(0), middle(0), lower(0), width(0), width_pct(0) {}
    };
    // Population standard deviation over the last `period` prices
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // ATR (Wilder). 0 when bars.size() <= period.
    static double calculateATR(const std::vector<Bar>& bars, int period = 14);

    // ATR as % of the last close
    static double calculateATRPercent(const std::vector<Bar>& bars, int period = 14);

    static double trueRange(double prev_close, double high, double low);

    // SMA of the last `period` values. 0 when history is too short.
    static double calculateSMA(const std::vector<double>& prices, int period);

    // % change of an SMA between the first and the last `ma_period` values
    // of the trailing ma_period + lookback window
    static double calculateSMASlopePercent(const std::vector<double>& values,
                                           int ma_period, int lookback);

    // Cross-sectional percentile: best value gets 100, worst 0
    static double percentileRank(double value, const std::vector<double>& population);

    // Indices whose value is the extreme of the symmetric 2*lookback+1 window.
    // Windows touching a NaN are skipped.
    static std::vector<size_t> findPivotLows(const std::vector<double>& values, int lookback);
    static std::vector<size_t> findPivotHighs(const std::vector<double>& values, int lookback);

    static std::vector<double> extractClosePrices(const std::vector<Bar>& bars);
    static std::vector<double> extractHighs(const std::vector<Bar>& bars);
    static std::vector<double> extractLows(const std::vector<Bar>& bars);
    static std::vector<double> extractVolumes(const std::vector<Bar>& bars);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double percentChange(double current, double base);
    static double clamp(double value, double lo = 0.0, double hi = 100.0);

private:
    static bool isPivot(const std::vector<double>& values, size_t index, int lookback, bool low);
};

} // namespace analytics
} // namespace confluence
