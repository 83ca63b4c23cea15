#pragma once

#include <afterhours/src/singleton.h>

#include <cstdint>
#include <string>
#include <vector>

#include "logging.h"
#include "platform/host_platform.h"

SINGLETON_FWD(Settings)
struct Settings {
    SINGLETON(Settings)

    Settings();
    ~Settings();

    Settings(const Settings&) = delete;
    void operator=(const Settings&) = delete;

    bool load_save_file();
    void write_save_file();

    // Logging
    // Returns "debug", "info", "warning" or "error"
    std::string get_log_level_name() const;
    logging::Level get_log_level() const;
    void set_log_level(const std::string& level);

    // Host platform used for platform-specific menu entries.
    // Returns "auto", "macos", "linux" or "windows"
    std::string get_host_platform_name() const;
    platform::HostPlatform get_host_platform() const;
    void set_host_platform(const std::string& name);

    // Editor soft wrap column (0 = no wrap)
    uint32_t get_soft_wrap_column() const;
    void set_soft_wrap_column(int column);

    // Recently run scenario files, most recent first
    std::vector<std::string> get_recent_scenarios() const;
    void add_recent_scenario(const std::string& path);

    std::string get_settings_path() const;

    // Auto-save support
    bool auto_save_enabled = true;
    void save_if_auto();

private:
    struct Data;
    Data* data_;
};
