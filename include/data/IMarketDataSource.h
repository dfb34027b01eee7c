#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace confluence {
namespace data {

// Market data collaborator. Implementations may throw or return an empty
// result on failure; callers catch per symbol.
class IMarketDataSource {
public:
    virtual ~IMarketDataSource() = default;

    virtual std::vector<SymbolMeta> discoverUniverse() = 0;

    // Oldest -> newest, at most `limit` bars (0 = everything available)
    virtual std::vector<Bar> fetchOhlcv(const std::string& symbol,
                                        const std::string& timeframe,
                                        int limit) = 0;

    // Always returns a record; fields are empty when unknown
    virtual DerivativesMetrics fetchDerivatives(const std::string& symbol) = 0;
};

} // namespace data
} // namespace confluence
