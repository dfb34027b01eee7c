#include "pattern/RsiDivergenceDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"
#include <algorithm>
#include <cmath>

namespace confluence {
namespace pattern {

using analytics::TechnicalIndicators;

RsiDivergenceDetector::RsiDivergenceDetector(const RsiDivergenceParams& params)
    : params_(params)
{
}

std::optional<PatternSignal> RsiDivergenceDetector::detect(const PatternContext& ctx) const {
    if (params_.lookback <= 0 || params_.period <= 0 || params_.pivot_lookback < 0) {
        return std::nullopt;
    }
    const size_t lookback = static_cast<size_t>(params_.lookback);
    const size_t min_len = std::max(lookback, static_cast<size_t>(params_.period + 2));
    if (ctx.bars.size() < min_len) {
        return std::nullopt;
    }

    const std::vector<Bar> window(ctx.bars.end() - static_cast<std::ptrdiff_t>(lookback), ctx.bars.end());
    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const auto highs = TechnicalIndicators::extractHighs(window);
    const auto lows = TechnicalIndicators::extractLows(window);

    const auto rsi = TechnicalIndicators::calculateRSISeries(closes, params_.period);
    const bool any_rsi = std::any_of(rsi.begin(), rsi.end(),
                                     [](double v) { return !std::isnan(v); });
    if (!any_rsi) {
        return std::nullopt;
    }

    const size_t latest_idx = window.size() - 1;
    const size_t max_age = static_cast<size_t>(std::max(params_.max_bars_from_last, 0));

    std::optional<PatternSignal> bull;
    const auto price_lows = TechnicalIndicators::findPivotLows(lows, params_.pivot_lookback);
    const auto rsi_lows = TechnicalIndicators::findPivotLows(rsi, params_.pivot_lookback);
    if (price_lows.size() >= 2 && rsi_lows.size() >= 2) {
        const size_t p1 = price_lows[price_lows.size() - 2];
        const size_t p2 = price_lows.back();
        const size_t r1 = rsi_lows[rsi_lows.size() - 2];
        const size_t r2 = rsi_lows.back();
        if (latest_idx - p2 <= max_age &&
            lows[p2] < lows[p1] &&
            rsi[r2] > rsi[r1] + params_.min_strength) {
            bull = buildSignal(ctx, window, SignalDirection::BULLISH, p1, p2, r1, r2, lows, rsi);
        }
    }

    std::optional<PatternSignal> bear;
    const auto price_highs = TechnicalIndicators::findPivotHighs(highs, params_.pivot_lookback);
    const auto rsi_highs = TechnicalIndicators::findPivotHighs(rsi, params_.pivot_lookback);
    if (price_highs.size() >= 2 && rsi_highs.size() >= 2) {
        const size_t h1 = price_highs[price_highs.size() - 2];
        const size_t h2 = price_highs.back();
        const size_t r1 = rsi_highs[rsi_highs.size() - 2];
        const size_t r2 = rsi_highs.back();
        if (latest_idx - h2 <= max_age &&
            highs[h2] > highs[h1] &&
            rsi[r2] < rsi[r1] - params_.min_strength) {
            bear = buildSignal(ctx, window, SignalDirection::BEARISH, h1, h2, r1, r2, highs, rsi);
        }
    }

    if (bull && bear) {
        return bull->strength >= bear->strength ? bull : bear;
    }
    return bull ? bull : bear;
}

std::optional<PatternSignal> RsiDivergenceDetector::detectFromBars(
    const std::string& symbol,
    const std::string& timeframe,
    const std::vector<Bar>& bars
) const {
    const features::FeatureBundle no_features;
    const scoring::ComponentScores no_scores;
    PatternContext ctx(symbol, timeframe, bars, no_features, no_scores);
    return detect(ctx);
}

PatternSignal RsiDivergenceDetector::buildSignal(
    const PatternContext& ctx,
    const std::vector<Bar>& window,
    SignalDirection direction,
    size_t p1, size_t p2,
    size_t r1, size_t r2,
    const std::vector<double>& prices,
    const std::vector<double>& rsi
) const {
    const size_t bars_since = (prices.size() - 1) - p2;
    const double rsi_delta = rsi[r2] - rsi[r1];
    const double strength = TechnicalIndicators::clamp(std::abs(rsi_delta) * 5.0);
    const double recency = TechnicalIndicators::clamp(100.0 - static_cast<double>(bars_since) * 10.0);

    PatternSignal signal;
    signal.pattern_name = name();
    signal.symbol = ctx.symbol;
    signal.timeframe = ctx.timeframe;
    signal.triggered = true;
    signal.direction = direction;
    signal.strength = strength;
    signal.confidence = TechnicalIndicators::clamp(0.6 * strength + 0.4 * recency);
    signal.note = fmt::format(
        "{} divergence: price {:.4f}->{:.4f}, RSI {:.1f}->{:.1f}",
        direction == SignalDirection::BULLISH ? "Bullish" : "Bearish",
        prices[p1], prices[p2], rsi[r1], rsi[r2]);
    signal.extras = {
        {"price_pivots", nlohmann::json::array({p1, p2})},
        {"rsi_pivots", nlohmann::json::array({r1, r2})},
        {"rsi_delta", rsi_delta},
        {"bars_since", bars_since},
        {"pivot_times", nlohmann::json::array({
            utils::TimeUtils::formatEpochMs(window[p1].open_time),
            utils::TimeUtils::formatEpochMs(window[p2].open_time)})}
    };

    LOG_DEBUG("[RsiDivergence] {} {} {} strength {:.1f} confidence {:.1f}",
              ctx.symbol, ctx.timeframe, directionToString(direction),
              signal.strength, signal.confidence);
    return signal;
}

} // namespace pattern
} // namespace confluence
