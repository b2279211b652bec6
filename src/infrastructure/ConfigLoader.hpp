/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving application configuration (settings.json).
 * 
 * Keeps JSON parsing of engine tunables (streak policy, snapshot defaults)
 * out of the scoring code.
 */

#pragma once

#include <string>
#include "domain/scoring/StreakResolver.hpp"
#include "infrastructure/SnapshotJson.hpp"

namespace habitpoints::infrastructure {

/**
 * @struct Settings
 * @brief Values read from settings.json. Every field has a usable default.
 */
struct Settings {
    domain::scoring::StreakPolicy streak;
    SnapshotDefaults defaults;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the given directory.
     * @param configDir Directory holding settings.json.
     * @return Settings with defaults for any missing key. A missing or malformed file yields all defaults.
     */
    static Settings Load(const std::string& configDir);

    /**
     * @brief Loads from PathUtils::GetAppConfigDir().
     */
    static Settings LoadDefault();

    /**
     * @brief Writes settings.json, preserving keys this version does not know about.
     * @return False if the file could not be written.
     */
    static bool Save(const std::string& configDir, const Settings& settings);
};

} // namespace habitpoints::infrastructure
