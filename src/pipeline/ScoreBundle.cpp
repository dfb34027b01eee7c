#include "pipeline/ScoreBundle.h"
#include <algorithm>
#include <cctype>

namespace confluence {
namespace pipeline {

namespace {
std::string toLowerCopy(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
}

bool ScoreBundle::hasPattern(const std::string& name) const {
    const std::string needle = toLowerCopy(name);
    for (const auto& label : pattern_labels) {
        if (toLowerCopy(label).find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::map<std::string, double> ScoreBundle::debugFeatures() const {
    std::map<std::string, double> out;
    for (auto component : scoring::allComponents()) {
        const std::string prefix = scoring::componentKey(component);
        for (const auto& kv : scores.get(component).features) {
            out[prefix + "." + kv.first] = kv.second;
        }
    }
    return out;
}

nlohmann::json ScoreBundle::toJson() const {
    nlohmann::json j;
    j["symbol"] = symbol;
    j["timeframe"] = timeframe;
    j["features"] = features.toMap();
    j["scores"] = scores.toMap();
    j["debug_features"] = debugFeatures();
    j["confluence_score"] = confluence_score;
    j["confidence"] = confidence;
    j["regime"] = regimeToString(regime);

    nlohmann::json weights_json = nlohmann::json::object();
    for (const auto& kv : weights) {
        weights_json[scoring::componentKey(kv.first)] = kv.second;
    }
    j["weights"] = weights_json;

    j["patterns"] = pattern_labels;
    nlohmann::json signals = nlohmann::json::array();
    for (const auto& signal : pattern_signals) {
        signals.push_back(signal.toJson());
    }
    j["pattern_signals"] = signals;
    return j;
}

} // namespace pipeline
} // namespace confluence
