#include "data/CsvMarketDataSource.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace confluence;
using confluence::data::CsvMarketDataSource;

namespace {

void writeFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

} // namespace

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "confluence_csv_source_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);

    // BOM, header, quoted cells, a malformed row, out-of-order and duplicate times
    writeFile(dir / "BTC_USDT_1h.csv",
              "\xEF\xBB\xBFtimestamp,open,high,low,close,volume\n"
              "3000,102,104,101,103,12\n"
              "1000,100,101,99,100.5,10\n"
              "\"2000\",\"100.5\",\"103\",\"100\",\"102\",\"11\"\n"
              "2000,1,1,1,1,1\n"
              "4000,abc,1,1,1,1\n"
              "5000,103\n"
              "  6000 , 103 , 105 , 102 , 104 , 15 \n");
    writeFile(dir / "ETH_USDT_1h.csv", "timestamp,open,high,low,close,volume\n1000,10,11,9,10,5\n");
    writeFile(dir / "notes.txt", "not a bar file");

    CsvMarketDataSource source(dir);

    assert(CsvMarketDataSource::symbolToFileStem("BTC/USDT:USDT") == "BTC_USDT_USDT");
    assert(source.barsPath("BTC/USDT", "1h") == dir / "BTC_USDT_1h.csv");

    {
        const auto bars = source.fetchOhlcv("BTC/USDT", "1h", 0);
        assert(bars.size() == 4);
        assert(bars[0].open_time == 1000);
        assert(bars[1].open_time == 2000);
        assert(bars[1].close == 102.0);
        assert(bars[2].open_time == 3000);
        assert(bars[3].open_time == 6000);
        assert(bars[3].volume == 15.0);
        assert(bars[0].symbol == "BTC/USDT");
        assert(bars[0].timeframe == "1h");
    }

    {
        const auto last_two = source.fetchOhlcv("BTC/USDT", "1h", 2);
        assert(last_two.size() == 2);
        assert(last_two[0].open_time == 3000);
        assert(last_two[1].open_time == 6000);
    }

    // Missing files come back empty
    assert(source.fetchOhlcv("BTC/USDT", "4h", 10).empty());

    // Universe from file names when universe.json is absent
    {
        const auto universe = source.discoverUniverse();
        assert(universe.size() == 2);
        assert(universe[0].symbol == "BTC/USDT");
        assert(universe[0].base == "BTC");
        assert(universe[0].quote == "USDT");
        assert(universe[1].symbol == "ETH/USDT");
    }

    writeFile(dir / "universe.json", R"({"symbols": [
        "SOL/USDT:USDT",
        {"symbol": "ETH/USDT", "exchange": "binance"},
        42
    ]})");
    {
        const auto universe = source.discoverUniverse();
        assert(universe.size() == 2);
        assert(universe[0].symbol == "SOL/USDT:USDT");
        assert(universe[0].quote == "USDT");
        assert(universe[0].is_perp);
        assert(universe[1].exchange == "binance");
        assert(!universe[1].is_perp);
    }

    // A broken universe file falls back to file names
    writeFile(dir / "universe.json", "[\"BTC/USDT\",");
    assert(source.discoverUniverse().size() == 2);

    writeFile(dir / "derivatives.json", R"({
        "BTC/USDT": {"funding_rate": 0.0001, "open_interest": 1500000, "oi_change_pct": "n/a"},
        "ETH/USDT": 5
    })");
    {
        CsvMarketDataSource with_derivs(dir);
        const auto btc = with_derivs.fetchDerivatives("BTC/USDT");
        assert(btc.symbol == "BTC/USDT");
        assert(*btc.funding_rate == 0.0001);
        assert(*btc.open_interest == 1500000.0);
        assert(!btc.oi_change_pct.has_value());

        const auto eth = with_derivs.fetchDerivatives("ETH/USDT");
        assert(eth.symbol == "ETH/USDT");
        assert(!eth.funding_rate && !eth.open_interest && !eth.oi_change_pct);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] CsvMarketDataSource PASSED\n";
    return 0;
}
