#pragma once

#include <string>

namespace confluence {
namespace pipeline {

// data.* section
struct DataConfig {
    std::string data_dir = "data";
    std::string timeframe = "1d";
    int bar_limit = 300;
    int max_symbols = 0;                      // 0 = whole universe
    std::string benchmark_symbol = "BTC/USDT";
};

// logging.* section
struct LoggingConfig {
    std::string log_dir = "logs";
    std::string level = "info";
};

} // namespace pipeline
} // namespace confluence
