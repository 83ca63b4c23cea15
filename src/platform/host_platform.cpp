#include "host_platform.h"

namespace platform {

std::optional<HostPlatform> parse_host_platform(const std::string& name) {
    if (name == "auto") return current_host_platform();
    if (name == "macos") return HostPlatform::MacOS;
    if (name == "linux") return HostPlatform::Linux;
    if (name == "windows") return HostPlatform::Windows;
    return std::nullopt;
}

const char* host_platform_name(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::MacOS: return "macos";
        case HostPlatform::Linux: return "linux";
        case HostPlatform::Windows: return "windows";
    }
    return "linux";
}

}  // namespace platform
