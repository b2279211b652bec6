/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <optional>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace habitpoints::infrastructure {

namespace {

std::optional<nlohmann::json> ReadSettingsFile(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] settings.json is not a JSON object, using defaults." << std::endl;
            return std::nullopt;
        }
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return std::nullopt;
}

void ReadKey(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return;
    if (j[key].is_number()) {
        out = j[key].get<double>();
    } else {
        std::cerr << "[ConfigLoader] Ignoring non-numeric '" << key << "'." << std::endl;
    }
}

void ReadKey(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    if (auto value = SnapshotJson::ToInt(j[key])) {
        out = *value;
    } else {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a whole number." << std::endl;
    }
}

} // namespace

Settings ConfigLoader::Load(const std::string& configDir) {
    Settings settings;
    auto j = ReadSettingsFile(std::filesystem::path(configDir) / "settings.json");
    if (!j) {
        return settings;
    }

    ReadKey(*j, "default_target_points", settings.defaults.targetPoints);
    ReadKey(*j, "default_task_points", settings.defaults.taskPoints);
    ReadKey(*j, "default_task_target", settings.defaults.taskTarget);
    ReadKey(*j, "default_task_max", settings.defaults.taskMax);
    ReadKey(*j, "streak_step", settings.streak.stepPerDay);
    ReadKey(*j, "streak_max_bonus", settings.streak.maxBonus);
    ReadKey(*j, "target_met_bonus", settings.streak.targetMetBonus);
    ReadKey(*j, "over_achievement_bonus", settings.streak.overAchievementBonus);

    if (settings.defaults.taskTarget < 1) {
        std::cerr << "[ConfigLoader] default_task_target must be >= 1, using 1." << std::endl;
        settings.defaults.taskTarget = 1;
    }
    if (settings.defaults.taskMax < settings.defaults.taskTarget) {
        settings.defaults.taskMax = settings.defaults.taskTarget;
    }
    return settings;
}

Settings ConfigLoader::LoadDefault() {
    return Load(PathUtils::GetAppConfigDir().string());
}

bool ConfigLoader::Save(const std::string& configDir, const Settings& settings) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";

    // Start from the existing file so unknown keys survive
    nlohmann::json j = ReadSettingsFile(configPath).value_or(nlohmann::json::object());

    j["default_target_points"] = settings.defaults.targetPoints;
    j["default_task_points"] = settings.defaults.taskPoints;
    j["default_task_target"] = settings.defaults.taskTarget;
    j["default_task_max"] = settings.defaults.taskMax;
    j["streak_step"] = settings.streak.stepPerDay;
    j["streak_max_bonus"] = settings.streak.maxBonus;
    j["target_met_bonus"] = settings.streak.targetMetBonus;
    j["over_achievement_bonus"] = settings.streak.overAchievementBonus;

    return AtomicFileWriter::Write(configPath.string(), j.dump(4));
}

} // namespace habitpoints::infrastructure
