#pragma once

#include <filesystem>

#include "alerts/IAlertStateStore.h"

namespace confluence {
namespace alerts {

// Writes <path>.tmp then renames it over <path>
class AlertStateStoreJson : public IAlertStateStore {
public:
    explicit AlertStateStoreJson(std::filesystem::path file_path);

    AlertState load() override;
    bool save(const AlertState& state) override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
};

} // namespace alerts
} // namespace confluence
