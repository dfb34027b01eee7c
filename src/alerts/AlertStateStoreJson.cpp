#include "alerts/AlertStateStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>
#include <utility>

namespace confluence {
namespace alerts {

AlertStateStoreJson::AlertStateStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

AlertState AlertStateStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return AlertState();
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Alert state {} unreadable, starting fresh", file_path_.string());
        return AlertState();
    }

    try {
        nlohmann::json raw;
        in >> raw;
        return AlertState::fromJson(raw);
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Alert state {} corrupt, starting fresh: {}", file_path_.string(), e.what());
        return AlertState();
    }
}

bool AlertStateStoreJson::save(const AlertState& state) {
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create state directory {}: {}",
                      file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write alert state {}", tmp_path.string());
            return false;
        }
        out << state.toJson().dump(2);
        if (!out.good()) {
            LOG_ERROR("Failed writing alert state {}", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (ec) {
        LOG_ERROR("Cannot replace alert state {}: {}", file_path_.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

} // namespace alerts
} // namespace confluence
