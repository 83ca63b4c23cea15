#pragma once

#include <optional>
#include <string>

namespace platform {

enum class HostPlatform { MacOS, Linux, Windows };

// Resolved at compile time from the target OS.
constexpr HostPlatform current_host_platform() {
#if defined(__APPLE__)
    return HostPlatform::MacOS;
#elif defined(_WIN32)
    return HostPlatform::Windows;
#else
    return HostPlatform::Linux;
#endif
}

// "macos", "linux", "windows". "auto" maps to current_host_platform().
std::optional<HostPlatform> parse_host_platform(const std::string& name);

const char* host_platform_name(HostPlatform platform);

}  // namespace platform
