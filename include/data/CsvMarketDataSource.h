#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "data/IMarketDataSource.h"

namespace confluence {
namespace data {

// File-backed market data:
//   <data_dir>/<BASE>_<QUOTE>_<timeframe>.csv   timestamp,open,high,low,close,volume
//   <data_dir>/universe.json                    ["BTC/USDT", ...] or SymbolMeta objects
//   <data_dir>/derivatives.json                 {"BTC/USDT": {"funding_rate": .., ...}}
class CsvMarketDataSource : public IMarketDataSource {
public:
    explicit CsvMarketDataSource(std::filesystem::path data_dir);

    std::vector<SymbolMeta> discoverUniverse() override;
    std::vector<Bar> fetchOhlcv(const std::string& symbol,
                                const std::string& timeframe,
                                int limit) override;
    DerivativesMetrics fetchDerivatives(const std::string& symbol) override;

    // "BTC/USDT" -> "BTC_USDT"
    static std::string symbolToFileStem(const std::string& symbol);

    // Parse one CSV file. Header and malformed rows are skipped.
    static std::vector<Bar> loadCSV(const std::filesystem::path& file_path);

    std::filesystem::path barsPath(const std::string& symbol, const std::string& timeframe) const;

private:
    std::vector<SymbolMeta> universeFromFile(const std::filesystem::path& path) const;
    std::vector<SymbolMeta> universeFromCsvNames() const;
    void loadDerivatives();

    std::filesystem::path data_dir_;
    std::optional<std::map<std::string, DerivativesMetrics>> derivatives_;
};

} // namespace data
} // namespace confluence
