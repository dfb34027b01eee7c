#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>

namespace confluence {

namespace {
using nlohmann::json;

const json& emptyObject() {
    static const json empty = json::object();
    return empty;
}

const json& section(const json& root, const char* key) {
    if (!root.is_object()) return emptyObject();
    auto it = root.find(key);
    if (it == root.end() || !it->is_object()) return emptyObject();
    return *it;
}

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Numbers, or strings that parse fully as a number
std::optional<double> toDouble(const json& value) {
    if (value.is_number()) {
        double v = value.get<double>();
        if (std::isfinite(v)) return v;
        return std::nullopt;
    }
    if (value.is_string()) {
        const std::string text = trimCopy(value.get<std::string>());
        if (text.empty()) return std::nullopt;
        try {
            size_t pos = 0;
            double v = std::stod(text, &pos);
            if (pos == text.size() && std::isfinite(v)) return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double readDouble(const json& j, const char* key, double def) {
    if (!j.is_object()) return def;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (auto v = toDouble(*it)) return *v;
    LOG_WARN("Config: invalid number for '{}', using default {}", key, def);
    return def;
}

std::optional<double> readOptionalDouble(const json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (auto v = toDouble(*it)) return v;
    LOG_WARN("Config: invalid number for '{}', ignoring", key);
    return std::nullopt;
}

// Out-of-range values saturate instead of wrapping
int clampToInt(double v) {
    const double lo = static_cast<double>(std::numeric_limits<int>::min());
    const double hi = static_cast<double>(std::numeric_limits<int>::max());
    return static_cast<int>(std::lround(std::max(lo, std::min(hi, v))));
}

int readInt(const json& j, const char* key, int def) {
    if (!j.is_object()) return def;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (auto v = toDouble(*it)) return clampToInt(*v);
    LOG_WARN("Config: invalid integer for '{}', using default {}", key, def);
    return def;
}

bool readBool(const json& j, const char* key, bool def) {
    if (!j.is_object()) return def;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) {
        const std::string text = lowerCopy(trimCopy(it->get<std::string>()));
        if (text == "true" || text == "yes" || text == "1") return true;
        if (text == "false" || text == "no" || text == "0") return false;
    }
    LOG_WARN("Config: invalid boolean for '{}', using default {}", key, def);
    return def;
}

std::string readString(const json& j, const char* key, const std::string& def) {
    if (!j.is_object()) return def;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return def;
    if (it->is_string()) return trimCopy(it->get<std::string>());
    LOG_WARN("Config: invalid string for '{}', using default '{}'", key, def);
    return def;
}

// Accepts a single string or an array of strings
std::optional<std::vector<std::string>> readStringList(const json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) {
        return std::vector<std::string>{trimCopy(it->get<std::string>())};
    }
    if (it->is_array()) {
        std::vector<std::string> out;
        for (const auto& item : *it) {
            if (item.is_string()) {
                out.push_back(trimCopy(item.get<std::string>()));
            } else if (item.is_number()) {
                out.push_back(item.dump());
            } else {
                LOG_WARN("Config: skipping non-string entry in '{}'", key);
            }
        }
        return out;
    }
    LOG_WARN("Config: invalid list for '{}', ignoring", key);
    return std::nullopt;
}
}

pipeline::DataConfig parseDataConfig(const json& s) {
    pipeline::DataConfig cfg;
    cfg.data_dir = readString(s, "data_dir", cfg.data_dir);
    cfg.timeframe = readString(s, "timeframe", cfg.timeframe);
    cfg.bar_limit = std::max(1, readInt(s, "bar_limit", cfg.bar_limit));
    cfg.max_symbols = std::max(0, readInt(s, "max_symbols", cfg.max_symbols));
    cfg.benchmark_symbol = readString(s, "benchmark_symbol", cfg.benchmark_symbol);
    return cfg;
}

pipeline::LoggingConfig parseLoggingConfig(const json& s) {
    pipeline::LoggingConfig cfg;
    cfg.log_dir = readString(s, "log_dir", cfg.log_dir);
    cfg.level = lowerCopy(readString(s, "level", cfg.level));
    return cfg;
}

scoring::RegimeThresholds parseRegimeThresholds(const json& s) {
    scoring::RegimeThresholds t;
    t.bull_min_risk_on = readDouble(s, "bull_min_risk_on", t.bull_min_risk_on);
    t.bull_min_breadth = readDouble(s, "bull_min_breadth", t.bull_min_breadth);
    t.bull_min_trend = readDouble(s, "bull_min_trend", t.bull_min_trend);
    t.bear_max_risk_on = readDouble(s, "bear_max_risk_on", t.bear_max_risk_on);
    t.bear_max_breadth = readDouble(s, "bear_max_breadth", t.bear_max_breadth);
    t.bear_max_trend = readDouble(s, "bear_max_trend", t.bear_max_trend);
    return t;
}

scoring::WeightTable parseWeightTable(const json& table) {
    scoring::WeightTable weights;
    if (!table.is_object()) return weights;

    for (auto it = table.begin(); it != table.end(); ++it) {
        auto component = scoring::componentFromAlias(it.key());
        if (!component) {
            LOG_WARN("Config: unknown weight key '{}'", it.key());
            continue;
        }
        auto w = toDouble(it.value());
        if (!w) {
            LOG_WARN("Config: invalid weight for '{}', skipping", it.key());
            continue;
        }
        if (*w < 0.0) {
            LOG_WARN("Config: negative weight {} for '{}', skipping", *w, it.key());
            continue;
        }
        weights[*component] = *w;
    }
    return weights;
}

scoring::ConfluenceConfig parseConfluenceConfig(const json& s) {
    scoring::ConfluenceConfig cfg;

    const std::string default_regime = readString(s, "default_regime", "sideways");
    cfg.default_regime = regimeFromString(default_regime);
    if (cfg.default_regime == MarketRegime::UNKNOWN && lowerCopy(default_regime) != "unknown") {
        LOG_WARN("Config: unknown default_regime '{}', using sideways", default_regime);
        cfg.default_regime = MarketRegime::SIDEWAYS;
    }

    const json& weights_root = section(s, "regime_weights");
    for (auto it = weights_root.begin(); it != weights_root.end(); ++it) {
        const MarketRegime regime = regimeFromString(it.key());
        if (regime == MarketRegime::UNKNOWN && lowerCopy(it.key()) != "unknown") {
            LOG_WARN("Config: unknown regime '{}' in regime_weights", it.key());
            continue;
        }
        auto weights = parseWeightTable(it.value());
        if (!weights.empty()) {
            cfg.regime_weights[regime] = std::move(weights);
        }
    }
    return cfg;
}

pattern::PatternsConfig parsePatternsConfig(const json& s) {
    pattern::PatternsConfig cfg;
    if (auto enabled = readStringList(s, "enabled")) {
        cfg.enabled = *enabled;
    }

    const json& b = section(s, "breakout");
    cfg.breakout.lookback = readInt(b, "lookback", cfg.breakout.lookback);
    cfg.breakout.break_buffer_pct = readDouble(b, "break_buffer_pct", cfg.breakout.break_buffer_pct);
    cfg.breakout.min_rvol = readDouble(b, "min_rvol", cfg.breakout.min_rvol);
    cfg.breakout.min_trend_score = readDouble(b, "min_trend_score", cfg.breakout.min_trend_score);
    cfg.breakout.min_volume_score = readDouble(b, "min_volume_score", cfg.breakout.min_volume_score);
    cfg.breakout.min_rs_score = readDouble(b, "min_rs_score", cfg.breakout.min_rs_score);
    cfg.breakout.min_confluence = readDouble(b, "min_confluence", cfg.breakout.min_confluence);
    cfg.breakout.allow_bearish = readBool(b, "allow_bearish", cfg.breakout.allow_bearish);

    const json& p = section(s, "pullback");
    cfg.pullback.lookback = readInt(p, "lookback", cfg.pullback.lookback);
    cfg.pullback.min_trend_score = readDouble(p, "min_trend_score", cfg.pullback.min_trend_score);
    cfg.pullback.min_rs_score = readDouble(p, "min_rs_score", cfg.pullback.min_rs_score);
    cfg.pullback.min_pullback_pct = readDouble(p, "min_pullback_pct", cfg.pullback.min_pullback_pct);
    cfg.pullback.max_pullback_pct = readDouble(p, "max_pullback_pct", cfg.pullback.max_pullback_pct);
    cfg.pullback.ma_proximity_pct = readDouble(p, "ma_proximity_pct", cfg.pullback.ma_proximity_pct);
    cfg.pullback.max_rvol = readDouble(p, "max_rvol", cfg.pullback.max_rvol);
    cfg.pullback.max_rsi_in_trend = readDouble(p, "max_rsi_in_trend", cfg.pullback.max_rsi_in_trend);
    cfg.pullback.rsi_period = readInt(p, "rsi_period", cfg.pullback.rsi_period);

    const json& q = section(s, "volatility_squeeze");
    cfg.volatility_squeeze.max_bb_width_pct = readDouble(q, "max_bb_width_pct", cfg.volatility_squeeze.max_bb_width_pct);
    cfg.volatility_squeeze.max_contraction_ratio = readDouble(q, "max_contraction_ratio", cfg.volatility_squeeze.max_contraction_ratio);
    cfg.volatility_squeeze.min_volatility_score = readDouble(q, "min_volatility_score", cfg.volatility_squeeze.min_volatility_score);
    cfg.volatility_squeeze.min_trend_score = readDouble(q, "min_trend_score", cfg.volatility_squeeze.min_trend_score);
    cfg.volatility_squeeze.min_rs_score = readDouble(q, "min_rs_score", cfg.volatility_squeeze.min_rs_score);

    const json& r = section(s, "rsi_divergence");
    cfg.rsi_divergence.lookback = readInt(r, "lookback", cfg.rsi_divergence.lookback);
    cfg.rsi_divergence.period = readInt(r, "period", cfg.rsi_divergence.period);
    cfg.rsi_divergence.pivot_lookback = readInt(r, "pivot_lookback", cfg.rsi_divergence.pivot_lookback);
    cfg.rsi_divergence.min_strength = readDouble(r, "min_strength", cfg.rsi_divergence.min_strength);
    cfg.rsi_divergence.max_bars_from_last = readInt(r, "max_bars_from_last", cfg.rsi_divergence.max_bars_from_last);

    return cfg;
}

ranking::RankingConfig parseRankingConfig(const json& root) {
    ranking::RankingConfig cfg;
    const json& s = section(root, "ranking");
    const json& reports = section(root, "reports");

    if (auto top_n = readOptionalDouble(s, "top_n")) {
        cfg.top_n = std::max(0, clampToInt(*top_n));
    }
    if (auto top_n = readOptionalDouble(reports, "top_n")) {
        cfg.reports_top_n = std::max(0, clampToInt(*top_n));
    }

    const json& f = section(s, "filters");
    cfg.filters.min_trend_score = readDouble(f, "min_trend_score", 0.0);
    cfg.filters.min_rs_score = readDouble(f, "min_rs_score", 0.0);
    cfg.filters.min_volume_score = readDouble(f, "min_volume_score", 0.0);
    cfg.filters.min_volatility_score = readDouble(f, "min_volatility_score", 0.0);

    // 0 or negative ceilings mean "disabled"
    auto ceiling = [&f](const char* key) -> std::optional<double> {
        auto v = readOptionalDouble(f, key);
        if (v && *v > 0.0) return v;
        return std::nullopt;
    };
    cfg.filters.max_atr_pct = ceiling("max_atr_pct");
    cfg.filters.max_bb_width_pct = ceiling("max_bb_width_pct");

    cfg.volume_surge_min_score = readDouble(s, "volume_surge_min_score", cfg.volume_surge_min_score);
    cfg.volatility_squeeze_min_score = readDouble(s, "volatility_squeeze_min_score", cfg.volatility_squeeze_min_score);
    cfg.watchlist_min_confluence = readDouble(s, "watchlist_min_confluence", cfg.watchlist_min_confluence);
    return cfg;
}

alerts::AlertsConfig parseAlertsConfig(const json& s) {
    alerts::AlertsConfig cfg;
    cfg.enabled = readBool(s, "enabled", cfg.enabled);

    const json& types = section(s, "types");
    cfg.types.high_confluence = readBool(types, "high_confluence", cfg.types.high_confluence);
    cfg.types.volume_spike = readBool(types, "volume_spike", cfg.types.volume_spike);
    cfg.types.squeeze_candidate = readBool(types, "squeeze_candidate", cfg.types.squeeze_candidate);
    cfg.types.rsi_divergence = readBool(types, "rsi_divergence", cfg.types.rsi_divergence);
    cfg.types.regime_change = readBool(types, "regime_change", cfg.types.regime_change);

    cfg.min_confluence_score = readDouble(s, "min_confluence_score", cfg.min_confluence_score);
    cfg.min_trend_score = readDouble(s, "min_trend_score", cfg.min_trend_score);
    cfg.min_volume_score = readDouble(s, "min_volume_score", cfg.min_volume_score);
    cfg.min_positioning_score = readDouble(s, "min_positioning_score", cfg.min_positioning_score);
    cfg.volume_spike_min_volume_score = readDouble(s, "volume_spike_min_volume_score", cfg.volume_spike_min_volume_score);
    cfg.squeeze_max_vol_score = readDouble(s, "squeeze_max_vol_score", cfg.squeeze_max_vol_score);
    cfg.squeeze_max_bbw_pct = readDouble(s, "squeeze_max_bbw_pct", cfg.squeeze_max_bbw_pct);

    if (auto tfs = readStringList(s, "rsi_divergence_timeframes")) {
        cfg.rsi_divergence_timeframes = *tfs;
    } else if (auto single = readStringList(s, "rsi_divergence_timeframe")) {
        cfg.rsi_divergence_timeframes = *single;
    }
    cfg.rsi_divergence_lookback = readInt(s, "rsi_divergence_lookback", cfg.rsi_divergence_lookback);
    cfg.rsi_divergence_pivot_lookback = readInt(s, "rsi_divergence_pivot_lookback", cfg.rsi_divergence_pivot_lookback);
    cfg.rsi_divergence_min_strength = readDouble(s, "rsi_divergence_min_strength", cfg.rsi_divergence_min_strength);
    cfg.rsi_divergence_max_bars_from_last = readInt(s, "rsi_divergence_max_bars_from_last", cfg.rsi_divergence_max_bars_from_last);

    cfg.require_uptrend_regime = readBool(s, "require_uptrend_regime", cfg.require_uptrend_regime);
    cfg.cooldown_minutes = std::max(0, readInt(s, "cooldown_minutes", cfg.cooldown_minutes));
    cfg.min_cs_delta = readDouble(s, "min_cs_delta", cfg.min_cs_delta);
    cfg.state_file = readString(s, "state_file", cfg.state_file);
    cfg.scan_top_n = std::max(0, readInt(s, "scan_top_n", cfg.scan_top_n));
    return cfg;
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    LOG_INFO("Config path: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path.string());
        return false;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {}", config_path.string());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        loadFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config parse error: {}", e.what());
        return false;
    }

    LOG_INFO("Config loaded: timeframe={}, data_dir={}, state_file={}",
             data_config_.timeframe, data_config_.data_dir, alerts_config_.state_file);
    return true;
}

void Config::loadFromJson(const nlohmann::json& root) {
    data_config_ = parseDataConfig(section(root, "data"));
    logging_config_ = parseLoggingConfig(section(root, "logging"));
    regime_thresholds_ = parseRegimeThresholds(section(root, "regimes"));
    confluence_config_ = parseConfluenceConfig(section(root, "confluence"));
    patterns_config_ = parsePatternsConfig(section(root, "patterns"));
    ranking_config_ = parseRankingConfig(root);
    alerts_config_ = parseAlertsConfig(section(root, "alerts"));
}

} // namespace confluence
