#include "alerts/AlertEngine.h"
#include "alerts/AlertStateFilter.h"
#include "common/Logger.h"
#include "pattern/RsiDivergenceDetector.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace confluence {
namespace alerts {

namespace {
std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string healthSummary(const MarketHealth& health) {
    return fmt::format("(benchmark trend {:.1f}, breadth {:.1f}%)",
                       health.benchmark_trend.value_or(0.0),
                       health.breadth_pct.value_or(0.0));
}
}

AlertEngine::AlertEngine(const AlertsConfig& config,
                         std::shared_ptr<data::IMarketDataSource> source)
    : config_(config)
    , source_(std::move(source))
{
}

std::string AlertEngine::formatMessage(const pipeline::ScoreBundle& bundle, const MarketHealth& health) {
    const auto& s = bundle.scores;
    return fmt::format(
        "CS: {:.1f} | Trend: {:.1f} | Vol: {:.1f} | Volu: {:.1f} | RS: {:.1f} | Pos: {:.1f} | Regime: {} {}",
        bundle.confluence_score, s.trend.score, s.volatility.score, s.volume.score,
        s.rs.score, s.positioning.score, upper(regimeToString(health.regime)),
        healthSummary(health));
}

AlertEvent AlertEngine::makeEvent(const pipeline::ScoreBundle& bundle,
                                  const MarketHealth& health,
                                  const std::string& reason,
                                  Timestamp now) const {
    AlertEvent event;
    event.symbol = bundle.symbol;
    event.created_at = now;
    event.reason = reason;
    event.message = formatMessage(bundle, health);
    event.confluence_score = bundle.confluence_score;
    event.trend_score = bundle.scores.trend.score;
    event.volatility_score = bundle.scores.volatility.score;
    event.volume_score = bundle.scores.volume.score;
    event.rs_score = bundle.scores.rs.score;
    event.positioning_score = bundle.scores.positioning.score;
    event.regime_label = regimeToString(health.regime);
    return event;
}

void AlertEngine::appendRsiDivergenceAlerts(const pipeline::ScoreBundle& bundle,
                                            const MarketHealth& health,
                                            Timestamp now,
                                            std::vector<AlertEvent>& events) const {
    if (!source_) {
        return;
    }

    pattern::RsiDivergenceParams params;
    params.lookback = config_.rsi_divergence_lookback;
    params.pivot_lookback = config_.rsi_divergence_pivot_lookback;
    params.min_strength = config_.rsi_divergence_min_strength;
    params.max_bars_from_last = config_.rsi_divergence_max_bars_from_last;
    const pattern::RsiDivergenceDetector detector(params);

    for (const auto& tf : config_.rsi_divergence_timeframes) {
        std::vector<Bar> bars;
        try {
            bars = source_->fetchOhlcv(bundle.symbol, tf, config_.rsi_divergence_lookback);
        } catch (const std::exception& e) {
            LOG_WARN("[Alerts] {} {} bars unavailable: {}", bundle.symbol, tf, e.what());
            continue;
        }
        if (bars.empty()) {
            continue;
        }

        const auto signal = detector.detectFromBars(bundle.symbol, tf, bars);
        if (!signal) {
            continue;
        }
        if (signal->direction == pattern::SignalDirection::BULLISH) {
            events.push_back(makeEvent(bundle, health, rsiDivergenceReason(true, tf), now));
        } else if (signal->direction == pattern::SignalDirection::BEARISH) {
            events.push_back(makeEvent(bundle, health, rsiDivergenceReason(false, tf), now));
        }
    }
}

std::vector<AlertEvent> AlertEngine::buildSymbolAlerts(
    const std::vector<pipeline::ScoreBundle>& ranked,
    const MarketHealth& health,
    Timestamp now
) const {
    std::vector<AlertEvent> events;

    if (config_.require_uptrend_regime &&
        health.regime != MarketRegime::BULL &&
        health.regime != MarketRegime::SIDEWAYS) {
        LOG_INFO("[Alerts] regime is {}; symbol alerts disabled by require_uptrend_regime",
                 regimeToString(health.regime));
        return events;
    }

    const auto& types = config_.types;
    for (const auto& bundle : ranked) {
        const auto& s = bundle.scores;

        if (types.high_confluence &&
            bundle.confluence_score >= config_.min_confluence_score &&
            s.trend.score >= config_.min_trend_score &&
            s.volume.score >= config_.min_volume_score &&
            s.positioning.score >= config_.min_positioning_score) {
            events.push_back(makeEvent(bundle, health, kReasonHighConfluence, now));
        }

        if (types.volume_spike && s.volume.score >= config_.volume_spike_min_volume_score) {
            events.push_back(makeEvent(bundle, health, kReasonVolumeSpike, now));
        }

        if (types.squeeze_candidate &&
            bundle.features.volatility.has_data &&
            s.volatility.score <= config_.squeeze_max_vol_score &&
            bundle.features.volatility.bb_width_pct_20 <= config_.squeeze_max_bbw_pct) {
            events.push_back(makeEvent(bundle, health, kReasonSqueezeCandidate, now));
        }

        if (types.rsi_divergence) {
            appendRsiDivergenceAlerts(bundle, health, now, events);
        }
    }
    return events;
}

std::optional<AlertEvent> AlertEngine::checkRegimeChange(const MarketHealth& health,
                                                         AlertState& state,
                                                         Timestamp now) const {
    if (!config_.types.regime_change) {
        return std::nullopt;
    }

    const std::string current = regimeToString(health.regime);
    if (!state.global_regime) {
        state.global_regime = current;
        return std::nullopt;
    }

    const std::string previous = *state.global_regime;
    if (previous == current) {
        return std::nullopt;
    }
    state.global_regime = current;

    AlertEvent event;
    event.symbol = kGlobalSymbol;
    event.created_at = now;
    event.reason = kReasonRegimeChange;
    event.message = fmt::format("Market regime changed from {} to {} {}.",
                                upper(previous), upper(current), healthSummary(health));
    event.confluence_score = 0.0;
    event.regime_label = current;

    LOG_INFO("[Alerts] regime change {} -> {}", previous, current);
    return event;
}

AlertScanResult AlertEngine::run(const std::vector<pipeline::ScoreBundle>& ranked,
                                 const MarketHealth& health,
                                 IAlertStateStore& store,
                                 Timestamp now) const {
    AlertScanResult result;
    if (!config_.enabled) {
        LOG_INFO("[Alerts] disabled in config");
        return result;
    }

    result.state = store.load();

    if (ranked.empty()) {
        LOG_INFO("[Alerts] no ranked symbols; no alerts generated");
        result.state_saved = store.save(result.state);
        return result;
    }

    std::vector<pipeline::ScoreBundle> candidates = ranked;
    if (config_.scan_top_n > 0 && candidates.size() > static_cast<size_t>(config_.scan_top_n)) {
        candidates.resize(static_cast<size_t>(config_.scan_top_n));
    }

    const auto symbol_events = buildSymbolAlerts(candidates, health, now);
    auto filtered = AlertStateFilter::apply(symbol_events, result.state, config_, now);
    result.events = std::move(filtered.kept);
    result.state = std::move(filtered.state);

    if (auto regime_event = checkRegimeChange(health, result.state, now)) {
        result.events.push_back(*regime_event);
    }

    if (result.events.empty()) {
        LOG_INFO("[Alerts] no alerts after state filter and regime check");
    } else {
        LOG_INFO("[Alerts] {} alert(s) from {} candidate event(s)",
                 result.events.size(), symbol_events.size());
    }

    result.state_saved = store.save(result.state);
    if (!result.state_saved) {
        LOG_ERROR("[Alerts] failed to persist alert state");
    }
    return result;
}

} // namespace alerts
} // namespace confluence
