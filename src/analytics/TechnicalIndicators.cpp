#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <limits>
#include <numeric>

namespace confluence {
namespace analytics {

// RSI (Wilder smoothing)
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. Seed with the simple average of the first period changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;

    // 2. Wilder smoothing to the end
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
    }

    if (avg_loss == 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::vector<double> TechnicalIndicators::calculateRSISeries(
    const std::vector<double>& prices,
    int period
) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> rsi(prices.size(), nan);
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 2)) {
        return rsi;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;

    auto rsiOf = [](double gain, double loss) {
        if (loss == 0.0) return 100.0;
        return 100.0 - (100.0 / (1.0 + gain / loss));
    };

    rsi[period] = rsiOf(avg_gain, avg_loss);
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        rsi[i] = rsiOf(avg_gain, avg_loss);
    }

    return rsi;
}

// Bollinger Bands
TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateMean(recent_prices);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.middle != 0.0) {
        result.width_pct = result.width / result.middle * 100.0;
    }

    return result;
}

double TechnicalIndicators::trueRange(double prev_close, double high, double low) {
    double tr1 = high - low;
    double tr2 = std::abs(high - prev_close);
    double tr3 = std::abs(low - prev_close);
    return std::max({tr1, tr2, tr3});
}

// ATR (Average True Range)
double TechnicalIndicators::calculateATR(const std::vector<Bar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(bars.size());

    // First TR comes from bars 0 and 1
    for (size_t i = 1; i < bars.size(); ++i) {
        tr_values.push_back(trueRange(bars[i-1].close, bars[i].high, bars[i].low));
    }

    if (tr_values.size() < static_cast<size_t>(period)) return 0.0;

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

double TechnicalIndicators::calculateATRPercent(const std::vector<Bar>& bars, int period) {
    if (period <= 0 || bars.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }
    double last_close = bars.back().close;
    if (last_close == 0.0) return 0.0;
    return calculateATR(bars, period) / last_close * 100.0;
}

// SMA (Simple Moving Average)
double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateSMASlopePercent(
    const std::vector<double>& values,
    int ma_period,
    int lookback
) {
    if (ma_period <= 0 || lookback < 0) return 0.0;
    const size_t needed = static_cast<size_t>(ma_period + lookback);
    if (values.size() < needed) return 0.0;

    auto begin = values.end() - needed;
    double ma_start = std::accumulate(begin, begin + ma_period, 0.0) / ma_period;
    double ma_end = std::accumulate(values.end() - ma_period, values.end(), 0.0) / ma_period;

    if (ma_start <= 0.0) return 0.0;
    return (ma_end - ma_start) / ma_start * 100.0;
}

double TechnicalIndicators::percentileRank(double value, const std::vector<double>& population) {
    std::vector<double> clean;
    clean.reserve(population.size());
    for (double v : population) {
        if (std::isfinite(v)) clean.push_back(v);
    }

    if (clean.empty()) return 0.0;
    const size_t n = clean.size();
    if (n == 1) return 100.0;

    auto [lo_it, hi_it] = std::minmax_element(clean.begin(), clean.end());
    if (*lo_it == *hi_it) return 50.0;

    size_t better = 0;
    for (double v : clean) {
        if (v > value) ++better;
    }
    double pct = static_cast<double>(n - better - 1) / static_cast<double>(n - 1) * 100.0;
    return clamp(pct);
}

std::vector<size_t> TechnicalIndicators::findPivotLows(const std::vector<double>& values, int lookback) {
    std::vector<size_t> pivots;
    if (lookback < 0) return pivots;
    const size_t lb = static_cast<size_t>(lookback);
    for (size_t i = lb; i + lb < values.size(); ++i) {
        if (isPivot(values, i, lookback, true)) pivots.push_back(i);
    }
    return pivots;
}

std::vector<size_t> TechnicalIndicators::findPivotHighs(const std::vector<double>& values, int lookback) {
    std::vector<size_t> pivots;
    if (lookback < 0) return pivots;
    const size_t lb = static_cast<size_t>(lookback);
    for (size_t i = lb; i + lb < values.size(); ++i) {
        if (isPivot(values, i, lookback, false)) pivots.push_back(i);
    }
    return pivots;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Bar>& bars) {
    std::vector<double> prices;
    prices.reserve(bars.size());
    for (const auto& bar : bars) {
        prices.push_back(bar.close);
    }
    return prices;
}

std::vector<double> TechnicalIndicators::extractHighs(const std::vector<Bar>& bars) {
    std::vector<double> highs;
    highs.reserve(bars.size());
    for (const auto& bar : bars) {
        highs.push_back(bar.high);
    }
    return highs;
}

std::vector<double> TechnicalIndicators::extractLows(const std::vector<Bar>& bars) {
    std::vector<double> lows;
    lows.reserve(bars.size());
    for (const auto& bar : bars) {
        lows.push_back(bar.low);
    }
    return lows;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Bar>& bars) {
    std::vector<double> volumes;
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        volumes.push_back(bar.volume);
    }
    return volumes;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::percentChange(double current, double base) {
    if (base == 0.0) return 0.0;
    return (current - base) / base * 100.0;
}

double TechnicalIndicators::clamp(double value, double lo, double hi) {
    if (std::isnan(value)) return lo;
    return std::max(lo, std::min(hi, value));
}

// ========== Private helpers ==========

bool TechnicalIndicators::isPivot(
    const std::vector<double>& values,
    size_t index,
    int lookback,
    bool low
) {
    const double center = values[index];
    if (std::isnan(center)) return false;

    for (size_t j = index - lookback; j <= index + lookback; ++j) {
        const double v = values[j];
        if (std::isnan(v)) return false;
        if (low && v < center) return false;
        if (!low && v > center) return false;
    }
    return true;
}

} // namespace analytics
} // namespace confluence
