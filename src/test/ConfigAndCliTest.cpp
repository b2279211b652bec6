#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "app/HabitPointsApp.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace habitpoints;
using namespace habitpoints::infrastructure;
using json = nlohmann::json;

static bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream f(path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

int main() {
    std::cout << "[Test] Starting Config & CLI Test..." << std::endl;

    std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    // No settings file: defaults
    Settings defaults = ConfigLoader::Load(testRoot);
    assert(defaults.defaults.targetPoints == 5.0);
    assert(defaults.defaults.taskPoints == 1.0);
    assert(defaults.defaults.taskTarget == 3);
    assert(defaults.defaults.taskMax == 8);
    assert(Near(defaults.streak.stepPerDay, 0.1));
    assert(defaults.streak.maxBonus == 1.0);

    // Partial file, unknown key, bad values
    {
        std::ofstream f(std::filesystem::path(testRoot) / "settings.json");
        f << R"({"streak_step": 0.2, "default_task_target": 0, "default_task_max": "lots", "theme": "dark"})";
    }
    Settings partial = ConfigLoader::Load(testRoot);
    assert(Near(partial.streak.stepPerDay, 0.2));
    assert(partial.defaults.taskTarget == 1);
    assert(partial.defaults.taskMax == 8);
    assert(partial.streak.targetMetBonus == 0.0);
    assert(partial.streak.overAchievementBonus == 0.0);

    // Save keeps unknown keys
    partial.streak.maxBonus = 0.5;
    partial.streak.targetMetBonus = 0.2;
    assert(ConfigLoader::Save(testRoot, partial));
    json saved = json::parse(ReadFile(std::filesystem::path(testRoot) / "settings.json"));
    assert(saved["theme"] == "dark");
    assert(saved["streak_max_bonus"].get<double>() == 0.5);
    Settings reloaded = ConfigLoader::Load(testRoot);
    assert(reloaded.streak.maxBonus == 0.5);
    assert(reloaded.streak.targetMetBonus == 0.2);

    // Integer settings must be whole numbers within int range
    {
        std::ofstream f(std::filesystem::path(testRoot) / "settings.json");
        f << R"({"default_task_target": 2.5, "default_task_max": 4294967297, "over_achievement_bonus": 0.1})";
    }
    Settings strict = ConfigLoader::Load(testRoot);
    assert(strict.defaults.taskTarget == 3);
    assert(strict.defaults.taskMax == 8);
    assert(strict.streak.overAchievementBonus == 0.1);

    // Corrupt file falls back to defaults
    {
        std::ofstream f(std::filesystem::path(testRoot) / "settings.json");
        f << "{ broken";
    }
    assert(ConfigLoader::Load(testRoot).defaults.taskMax == 8);

    // XDG lookup
    {
        std::filesystem::path xdgRoot = std::filesystem::absolute(testRoot) / "xdg";
        setenv("XDG_CONFIG_HOME", xdgRoot.string().c_str(), 1);
        assert(PathUtils::GetAppConfigDir() == xdgRoot / "HabitPoints");

        std::filesystem::create_directories(xdgRoot / "HabitPoints");
        std::ofstream f(xdgRoot / "HabitPoints" / "settings.json");
        f << R"({"default_task_points": 2.5})";
        f.close();
        assert(ConfigLoader::LoadDefault().defaults.taskPoints == 2.5);
    }

    // Atomic writes create parent directories and leave no temp files behind
    std::filesystem::path nested = std::filesystem::path(testRoot) / "out" / "deep" / "file.txt";
    assert(AtomicFileWriter::Write(nested.string(), "first"));
    assert(AtomicFileWriter::Write(nested.string(), "second"));
    assert(ReadFile(nested) == "second");
    int entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(nested.parent_path())) {
        (void)entry;
        entries++;
    }
    assert(entries == 1);

    // CLI: score a day into a report file
    std::filesystem::path settingsDir = std::filesystem::path(testRoot) / "cli";
    std::filesystem::create_directories(settingsDir);
    {
        std::ofstream f(settingsDir / "settings.json");
        f << R"({"streak_step": 0.1, "streak_max_bonus": 1.0})";
    }
    std::filesystem::path dayPath = settingsDir / "day.json";
    {
        std::ofstream f(dayPath);
        f << R"({
            "targetPoints": 10,
            "history": [{"points": 10, "targetPoints": 10}, {"points": 11, "targetPoints": 10},
                        {"points": 12, "targetPoints": 10}, {"points": 10, "targetPoints": 10}],
            "tasks": [
                {"title": "Meditate", "basePoints": 5, "target": 1, "max": 1, "completed": 1, "routine": true},
                {"title": "Walk", "basePoints": 5, "target": 1, "max": 3, "completed": 1, "routine": true}
            ]
        })";
    }
    std::filesystem::path reportPath = settingsDir / "report.json";

    app::HabitPointsApp cli;
    std::ostringstream captured;
    std::streambuf* previous = std::cerr.rdbuf(captured.rdbuf());
    int rc = cli.Run({"score", dayPath.string(), "--settings", settingsDir.string(), "--out", reportPath.string()});
    std::cerr.rdbuf(previous);
    assert(rc == app::HabitPointsApp::kExitOk);
    // The history-derived streak is reported on stderr
    assert(captured.str().find("Streak of 4 day(s) derived from 4 history entries") != std::string::npos);

    json report = json::parse(ReadFile(reportPath));
    assert(report["priorConsecutiveDays"] == 4);
    assert(Near(report["bonus"].get<double>(), 0.3));
    assert(Near(report["totalPoints"].get<double>(), 13.0));
    assert(report["progressRatio"].get<double>() == 1.0);
    assert(report["targetMet"].get<bool>());

    // CLI: errors
    assert(cli.Run({}) == app::HabitPointsApp::kExitUsage);
    assert(cli.Run({"bogus", "--settings", settingsDir.string()}) == app::HabitPointsApp::kExitUsage);
    assert(cli.Run({"score", "--settings"}) == app::HabitPointsApp::kExitUsage);
    assert(cli.Run({"score", (settingsDir / "missing.json").string(), "--settings", settingsDir.string()})
           == app::HabitPointsApp::kExitBadInput);
    assert(cli.Run({"streak", "six", "--settings", settingsDir.string()}) == app::HabitPointsApp::kExitBadInput);
    assert(cli.Run({"streak", "6", "--settings", settingsDir.string()}) == app::HabitPointsApp::kExitOk);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Config & CLI Test." << std::endl;
    return 0;
}
