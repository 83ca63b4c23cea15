#include "settings.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include <afterhours/src/plugins/files.h>

#include <afterhours/src/logging.h>

namespace {

constexpr size_t kMaxRecentScenarios = 10;

bool is_valid_log_level(const std::string& name) {
    return logging::parse_level(name).has_value();
}

bool is_valid_platform(const std::string& name) {
    return platform::parse_host_platform(name).has_value();
}

}  // namespace

struct Settings::Data {
    std::string logLevel = "info";
    std::string hostPlatform = "auto";
    uint32_t softWrapColumn = 0;
    std::vector<std::string> recentScenarios;
};

Settings::Settings() { data_ = new Data(); }
Settings::~Settings() { delete data_; }

std::string Settings::get_settings_path() const {
    auto configDir = afterhours::files::get_config_path();
    if (configDir.empty()) {
        // files plugin not yet initialized; fall back to cwd
        return (std::filesystem::current_path() / "settings.json").string();
    }
    std::filesystem::create_directories(configDir);
    return (configDir / "settings.json").string();
}

bool Settings::load_save_file() {
    std::string path = get_settings_path();
    if (!std::filesystem::exists(path)) {
        log_info("No settings file found at {}, using defaults", path);
        return false;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j = nlohmann::json::parse(f);

        Data loaded;
        std::string level = j.value("log_level", std::string{"info"});
        loaded.logLevel = is_valid_log_level(level) ? level : "info";

        std::string host = j.value("host_platform", std::string{"auto"});
        loaded.hostPlatform = is_valid_platform(host) ? host : "auto";

        int wrap = j.value("soft_wrap_column", 0);
        loaded.softWrapColumn = wrap > 0 ? static_cast<uint32_t>(wrap) : 0;

        loaded.recentScenarios =
            j.value("recent_scenarios", std::vector<std::string>{});
        if (loaded.recentScenarios.size() > kMaxRecentScenarios) {
            loaded.recentScenarios.resize(kMaxRecentScenarios);
        }

        *data_ = std::move(loaded);
        log_info("Settings loaded from {}", path);
        return true;
    } catch (const std::exception& e) {
        log_warn("Failed to parse settings file {}: {} (using defaults)",
                 path, e.what());
        return false;
    }
}

void Settings::write_save_file() {
    nlohmann::json j;
    j["log_level"] = data_->logLevel;
    j["host_platform"] = data_->hostPlatform;
    j["soft_wrap_column"] = data_->softWrapColumn;
    j["recent_scenarios"] = data_->recentScenarios;

    std::string path = get_settings_path();
    std::ofstream f(path);
    if (!f.good()) {
        log_error("Failed to open settings file for writing: {}", path);
        return;
    }
    f << j.dump(2);
    log_info("Settings saved to {}", path);
}

void Settings::save_if_auto() {
    if (auto_save_enabled) {
        write_save_file();
    }
}

// Logging
std::string Settings::get_log_level_name() const { return data_->logLevel; }

logging::Level Settings::get_log_level() const {
    return logging::parse_level(data_->logLevel).value_or(logging::Level::Info);
}

void Settings::set_log_level(const std::string& level) {
    data_->logLevel = is_valid_log_level(level) ? level : "info";
    save_if_auto();
}

// Host platform
std::string Settings::get_host_platform_name() const {
    return data_->hostPlatform;
}

platform::HostPlatform Settings::get_host_platform() const {
    return platform::parse_host_platform(data_->hostPlatform)
        .value_or(platform::current_host_platform());
}

void Settings::set_host_platform(const std::string& name) {
    data_->hostPlatform = is_valid_platform(name) ? name : "auto";
    save_if_auto();
}

// Soft wrap
uint32_t Settings::get_soft_wrap_column() const { return data_->softWrapColumn; }

void Settings::set_soft_wrap_column(int column) {
    data_->softWrapColumn = column > 0 ? static_cast<uint32_t>(column) : 0;
    save_if_auto();
}

// Recent scenarios
std::vector<std::string> Settings::get_recent_scenarios() const {
    return data_->recentScenarios;
}

void Settings::add_recent_scenario(const std::string& path) {
    if (path.empty()) return;
    // Move to front, remove duplicates
    auto& recent = data_->recentScenarios;
    recent.erase(std::remove(recent.begin(), recent.end(), path), recent.end());
    recent.insert(recent.begin(), path);
    if (recent.size() > kMaxRecentScenarios) {
        recent.resize(kMaxRecentScenarios);
    }
    save_if_auto();
}
