#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "scoring/ScoringConfig.h"
#include "pattern/PatternConfig.h"
#include "ranking/RankingConfig.h"
#include "alerts/AlertConfig.h"
#include "pipeline/ScanConfig.h"

namespace confluence {

// Section parsers. Missing keys keep defaults; values of the wrong type fall
// back to the default with a warning.
pipeline::DataConfig parseDataConfig(const nlohmann::json& section);
pipeline::LoggingConfig parseLoggingConfig(const nlohmann::json& section);
scoring::RegimeThresholds parseRegimeThresholds(const nlohmann::json& section);
scoring::ConfluenceConfig parseConfluenceConfig(const nlohmann::json& section);
scoring::WeightTable parseWeightTable(const nlohmann::json& table);
pattern::PatternsConfig parsePatternsConfig(const nlohmann::json& section);
// Takes the whole document: reads ranking.* and reports.top_n
ranking::RankingConfig parseRankingConfig(const nlohmann::json& root);
alerts::AlertsConfig parseAlertsConfig(const nlohmann::json& section);

class Config {
public:
    static Config& getInstance();

    // Relative paths resolve against the executable directory. Returns false
    // when the file is missing or unreadable; defaults stay in place.
    bool load(const std::string& config_path);

    // Replace every section from an in-memory document
    void loadFromJson(const nlohmann::json& root);

    const pipeline::DataConfig& getDataConfig() const { return data_config_; }
    const pipeline::LoggingConfig& getLoggingConfig() const { return logging_config_; }
    const scoring::RegimeThresholds& getRegimeThresholds() const { return regime_thresholds_; }
    const scoring::ConfluenceConfig& getConfluenceConfig() const { return confluence_config_; }
    const pattern::PatternsConfig& getPatternsConfig() const { return patterns_config_; }
    const ranking::RankingConfig& getRankingConfig() const { return ranking_config_; }
    const alerts::AlertsConfig& getAlertsConfig() const { return alerts_config_; }

    void setDataDir(const std::string& dir) { data_config_.data_dir = dir; }
    void setTimeframe(const std::string& tf) { data_config_.timeframe = tf; }

private:
    Config() = default;

    pipeline::DataConfig data_config_;
    pipeline::LoggingConfig logging_config_;
    scoring::RegimeThresholds regime_thresholds_;
    scoring::ConfluenceConfig confluence_config_;
    pattern::PatternsConfig patterns_config_;
    ranking::RankingConfig ranking_config_;
    alerts::AlertsConfig alerts_config_;
};

} // namespace confluence
