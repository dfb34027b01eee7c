#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "data/IMarketDataSource.h"

namespace confluence {
namespace testing {

// In-memory source keyed by symbol and timeframe. Symbols listed in
// `failing` throw from fetchOhlcv/fetchDerivatives.
class FakeMarketDataSource : public data::IMarketDataSource {
public:
    std::vector<SymbolMeta> universe;
    std::map<std::pair<std::string, std::string>, std::vector<Bar>> bars;
    std::map<std::string, DerivativesMetrics> derivatives;
    std::set<std::string> failing;
    std::set<std::string> failing_derivatives;
    int ohlcv_calls = 0;

    void addSymbol(const std::string& symbol) {
        SymbolMeta meta;
        meta.symbol = symbol;
        meta.exchange = "fake";
        universe.push_back(meta);
    }

    std::vector<SymbolMeta> discoverUniverse() override {
        return universe;
    }

    std::vector<Bar> fetchOhlcv(const std::string& symbol,
                                const std::string& timeframe,
                                int limit) override {
        ++ohlcv_calls;
        if (failing.count(symbol)) {
            throw std::runtime_error("fetch failed for " + symbol);
        }
        auto it = bars.find({symbol, timeframe});
        if (it == bars.end()) {
            return {};
        }
        const auto& all = it->second;
        if (limit > 0 && all.size() > static_cast<size_t>(limit)) {
            return std::vector<Bar>(all.end() - limit, all.end());
        }
        return all;
    }

    DerivativesMetrics fetchDerivatives(const std::string& symbol) override {
        if (failing_derivatives.count(symbol)) {
            throw std::runtime_error("derivatives unavailable for " + symbol);
        }
        auto it = derivatives.find(symbol);
        if (it != derivatives.end()) {
            return it->second;
        }
        DerivativesMetrics empty;
        empty.symbol = symbol;
        return empty;
    }
};

} // namespace testing
} // namespace confluence
