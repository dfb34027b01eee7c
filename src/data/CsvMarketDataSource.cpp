#include "data/CsvMarketDataSource.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace confluence {
namespace data {

namespace fs = std::filesystem;

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // UTF-8 BOM on the first cell
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

SymbolMeta makeMeta(const std::string& symbol) {
    SymbolMeta meta;
    meta.symbol = symbol;
    const auto slash = symbol.find('/');
    if (slash != std::string::npos) {
        meta.base = symbol.substr(0, slash);
        meta.quote = symbol.substr(slash + 1);
        const auto colon = meta.quote.find(':');
        if (colon != std::string::npos) {
            meta.quote = meta.quote.substr(0, colon);
            meta.is_perp = true;
        }
    } else {
        meta.base = symbol;
    }
    meta.exchange = "csv";
    return meta;
}

std::optional<double> optionalNumber(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}
}

CsvMarketDataSource::CsvMarketDataSource(fs::path data_dir)
    : data_dir_(std::move(data_dir))
{
}

std::string CsvMarketDataSource::symbolToFileStem(const std::string& symbol) {
    std::string stem = symbol;
    std::replace(stem.begin(), stem.end(), '/', '_');
    std::replace(stem.begin(), stem.end(), ':', '_');
    return stem;
}

fs::path CsvMarketDataSource::barsPath(const std::string& symbol, const std::string& timeframe) const {
    return data_dir_ / (symbolToFileStem(symbol) + "_" + timeframe + ".csv");
}

std::vector<Bar> CsvMarketDataSource::loadCSV(const fs::path& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path.string());
        return bars;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6) continue;
        if (row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0])) && row[0][0] != '-') {
            // Header or malformed row
            continue;
        }

        try {
            Bar bar;
            bar.open_time = std::stoll(row[0]);
            bar.open = std::stod(row[1]);
            bar.high = std::stod(row[2]);
            bar.low = std::stod(row[3]);
            bar.close = std::stod(row[4]);
            bar.volume = std::stod(row[5]);
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.open_time < b.open_time;
    });
    // Open times must be strictly increasing
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.open_time == b.open_time;
    }), bars.end());

    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path.string());
    return bars;
}

std::vector<Bar> CsvMarketDataSource::fetchOhlcv(const std::string& symbol,
                                                 const std::string& timeframe,
                                                 int limit) {
    const auto path = barsPath(symbol, timeframe);
    if (!fs::exists(path)) {
        LOG_WARN("No bar file for {} {}: {}", symbol, timeframe, path.string());
        return {};
    }

    auto bars = loadCSV(path);
    if (limit > 0 && bars.size() > static_cast<size_t>(limit)) {
        bars.erase(bars.begin(), bars.end() - limit);
    }
    for (auto& bar : bars) {
        bar.symbol = symbol;
        bar.timeframe = timeframe;
    }
    return bars;
}

std::vector<SymbolMeta> CsvMarketDataSource::discoverUniverse() {
    const auto universe_path = data_dir_ / "universe.json";
    if (fs::exists(universe_path)) {
        auto universe = universeFromFile(universe_path);
        if (!universe.empty()) {
            return universe;
        }
    }
    return universeFromCsvNames();
}

std::vector<SymbolMeta> CsvMarketDataSource::universeFromFile(const fs::path& path) const {
    std::vector<SymbolMeta> universe;
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR("Failed to open universe file: {}", path.string());
        return universe;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        const auto& entries = raw.is_object() && raw.contains("symbols") ? raw["symbols"] : raw;
        if (!entries.is_array()) {
            LOG_WARN("Universe file {} is not a list", path.string());
            return universe;
        }

        for (const auto& entry : entries) {
            if (entry.is_string()) {
                universe.push_back(makeMeta(entry.get<std::string>()));
            } else if (entry.is_object() && entry.contains("symbol") && entry["symbol"].is_string()) {
                SymbolMeta meta = makeMeta(entry["symbol"].get<std::string>());
                meta.base = entry.value("base", meta.base);
                meta.quote = entry.value("quote", meta.quote);
                meta.exchange = entry.value("exchange", meta.exchange);
                meta.is_perp = entry.value("is_perp", meta.is_perp);
                universe.push_back(meta);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing universe file: {} - {}", path.string(), e.what());
        universe.clear();
    }

    LOG_INFO("Universe loaded from {}: {} symbols", path.string(), universe.size());
    return universe;
}

std::vector<SymbolMeta> CsvMarketDataSource::universeFromCsvNames() const {
    std::set<std::string> symbols;
    std::error_code ec;
    for (fs::directory_iterator it(data_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || it->path().extension() != ".csv") {
            continue;
        }
        // BTC_USDT_1d -> BTC_USDT -> BTC/USDT
        std::string stem = it->path().stem().string();
        const auto tf_sep = stem.rfind('_');
        if (tf_sep == std::string::npos || tf_sep == 0) {
            continue;
        }
        stem = stem.substr(0, tf_sep);
        const auto pair_sep = stem.find('_');
        if (pair_sep != std::string::npos) {
            stem[pair_sep] = '/';
        }
        symbols.insert(stem);
    }
    if (ec) {
        LOG_WARN("Cannot list data directory {}: {}", data_dir_.string(), ec.message());
    }

    std::vector<SymbolMeta> universe;
    for (const auto& symbol : symbols) {
        universe.push_back(makeMeta(symbol));
    }
    LOG_INFO("Universe discovered from CSV files: {} symbols", universe.size());
    return universe;
}

void CsvMarketDataSource::loadDerivatives() {
    derivatives_.emplace();
    const auto path = data_dir_ / "derivatives.json";
    if (!fs::exists(path)) {
        return;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR("Failed to open derivatives file: {}", path.string());
        return;
    }

    try {
        nlohmann::json raw;
        in >> raw;
        if (!raw.is_object()) {
            LOG_WARN("Derivatives file {} is not an object", path.string());
            return;
        }
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            if (!it.value().is_object()) {
                continue;
            }
            DerivativesMetrics metrics;
            metrics.symbol = it.key();
            metrics.funding_rate = optionalNumber(it.value(), "funding_rate");
            metrics.open_interest = optionalNumber(it.value(), "open_interest");
            metrics.oi_change_pct = optionalNumber(it.value(), "oi_change_pct");
            (*derivatives_)[it.key()] = metrics;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing derivatives file: {} - {}", path.string(), e.what());
        derivatives_->clear();
    }
}

DerivativesMetrics CsvMarketDataSource::fetchDerivatives(const std::string& symbol) {
    if (!derivatives_) {
        loadDerivatives();
    }
    auto it = derivatives_->find(symbol);
    if (it != derivatives_->end()) {
        return it->second;
    }
    DerivativesMetrics empty;
    empty.symbol = symbol;
    return empty;
}

} // namespace data
} // namespace confluence
