/**
 * Build Fetch - Platform Implementation (Linux)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

namespace buildfetch {

namespace {
    constexpr const char* APP_DIR = "build-fetch";

std::filesystem::path xdgPath(const char* variable, const std::filesystem::path& homeFallback) {
    const char* xdg = std::getenv(variable);
    if (xdg && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / APP_DIR;
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / homeFallback / APP_DIR;
    }

    return homeFallback / APP_DIR;
}

} // anonymous namespace

std::filesystem::path Platform::getConfigPath() {
    // Use XDG_CONFIG_HOME if set, otherwise ~/.config
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getDataPath() {
    // Use XDG_DATA_HOME if set, otherwise ~/.local/share
    return xdgPath("XDG_DATA_HOME", std::filesystem::path(".local") / "share");
}

} // namespace buildfetch

#endif // PLATFORM_LINUX
