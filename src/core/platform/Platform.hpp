/**
 * Build Fetch - Platform Abstraction
 *
 * Per-user directories for configuration, data and logs.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace buildfetch {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     *
     * Linux: $XDG_CONFIG_HOME/build-fetch or ~/.config/build-fetch/
     */
    static std::filesystem::path getConfigPath();

    /**
     * Get the data directory path (default download location lives here)
     *
     * Linux: $XDG_DATA_HOME/build-fetch or ~/.local/share/build-fetch/
     */
    static std::filesystem::path getDataPath();

    /**
     * Get the log directory path
     */
    static std::filesystem::path getLogPath() { return getConfigPath() / "logs"; }
};

} // namespace buildfetch
