#include "common/Logger.h"
#include "common/Config.h"
#include "common/TimeUtils.h"
#include "alerts/AlertDispatcher.h"
#include "alerts/AlertStateStoreJson.h"
#include "data/CsvMarketDataSource.h"
#include "pipeline/ScanCoordinator.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace confluence;

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config.json] [options]\n"
              << "  --data-dir <dir>     override data.data_dir\n"
              << "  --timeframe <tf>     override data.timeframe\n"
              << "  --top <n>            rows printed per leaderboard (default 10)\n"
              << "  --json               print score bundles as JSON instead of tables\n"
              << "  --help               show this message\n";
}

static std::string joinLabels(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& label : labels) {
        if (!out.empty()) out += ",";
        out += label;
    }
    return out.empty() ? "-" : out;
}

static void printBoard(const std::string& name,
                       const std::vector<pipeline::ScoreBundle>& board,
                       size_t rows) {
    std::cout << "\n=== " << name << " (" << board.size() << ") ===\n";
    if (board.empty()) {
        std::cout << "  (empty)\n";
        return;
    }

    std::cout << std::left << std::setw(4) << "#"
              << std::setw(16) << "Symbol"
              << std::right << std::setw(7) << "CS"
              << std::setw(7) << "Conf"
              << std::setw(7) << "Trend"
              << std::setw(7) << "Vol"
              << std::setw(7) << "Volu"
              << std::setw(7) << "RS"
              << std::setw(7) << "Pos"
              << "  Patterns\n";

    std::cout << std::fixed << std::setprecision(1);
    for (size_t i = 0; i < board.size() && i < rows; ++i) {
        const auto& b = board[i];
        std::cout << std::left << std::setw(4) << (i + 1)
                  << std::setw(16) << b.symbol
                  << std::right << std::setw(7) << b.confluence_score
                  << std::setw(7) << b.confidence
                  << std::setw(7) << b.scores.trend.score
                  << std::setw(7) << b.scores.volatility.score
                  << std::setw(7) << b.scores.volume.score
                  << std::setw(7) << b.scores.rs.score
                  << std::setw(7) << b.scores.positioning.score
                  << "  " << joinLabels(b.pattern_labels) << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::string data_dir_override;
    std::string timeframe_override;
    size_t rows = 10;
    bool json_mode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--json") {
            json_mode = true;
            continue;
        }
        if (arg == "--data-dir" && i + 1 < argc) {
            data_dir_override = argv[++i];
            continue;
        }
        if (arg == "--timeframe" && i + 1 < argc) {
            timeframe_override = argv[++i];
            continue;
        }
        if (arg == "--top" && i + 1 < argc) {
            try {
                const int value = std::stoi(argv[++i]);
                if (value > 0) rows = static_cast<size_t>(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid --top value. Ignored.\n";
            }
            continue;
        }
        if (!arg.empty() && arg[0] != '-') {
            config_path = arg;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        if (!data_dir_override.empty()) config.setDataDir(data_dir_override);
        if (!timeframe_override.empty()) config.setTimeframe(timeframe_override);

        const auto& logging = config.getLoggingConfig();
        Logger::getInstance().initialize(logging.log_dir, logging.level);

        if (!json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       Confluence Scanner\n";
            std::cout << "=============================================\n";
        }

        const auto settings = pipeline::ScanSettings::fromConfig(config);
        auto source = std::make_shared<data::CsvMarketDataSource>(settings.data.data_dir);
        auto state_store = std::make_shared<alerts::AlertStateStoreJson>(settings.alerts.state_file);
        auto dispatcher = std::make_shared<alerts::AlertDispatcher>();
        dispatcher->addNotifier(std::make_shared<alerts::ConsoleNotifier>());

        pipeline::ScanCoordinator coordinator(source, state_store, dispatcher, settings);
        const auto now = std::chrono::system_clock::now();
        const auto result = coordinator.runScan(now);

        if (json_mode) {
            nlohmann::json out;
            out["scanned_at"] = utils::TimeUtils::toIso8601(now);
            out["regime"] = regimeToString(result.health.regime);
            nlohmann::json bundles = nlohmann::json::array();
            for (const auto& bundle : result.ranking.board("all_by_confluence")) {
                bundles.push_back(bundle.toJson());
            }
            out["bundles"] = bundles;
            out["alerts"] = result.alerts.size();
            std::cout << out.dump(2) << std::endl;
            return 0;
        }

        std::cout << "\nTimeframe: " << settings.data.timeframe
                  << " | Symbols: " << result.universe.size()
                  << " | Regime: " << regimeToString(result.health.regime) << "\n";

        const std::vector<std::string> boards = {
            "top_confluence", "top_relative_strength", "volume_surge",
            "volatility_squeeze", "watchlist"
        };
        for (const auto& name : boards) {
            printBoard(name, result.ranking.board(name), rows);
        }
        for (const auto& name : coordinator.patterns().enabledNames()) {
            const auto key = ranking::patternBoardName(name);
            printBoard(key, result.ranking.board(key), rows);
        }

        std::cout << "\nAlerts dispatched: " << result.alerts.size() << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
