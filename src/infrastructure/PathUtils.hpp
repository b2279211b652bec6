/**
 * @file PathUtils.hpp
 * @brief Locations of per-user configuration.
 */

#pragma once
#include <filesystem>

namespace habitpoints::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /** @brief Directory holding HabitPoints' settings.json. */
    static std::filesystem::path GetAppConfigDir();
};

} // namespace habitpoints::infrastructure
