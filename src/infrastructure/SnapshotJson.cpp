/**
 * @file SnapshotJson.cpp
 * @brief Implementation of SnapshotJson.
 */

#include "infrastructure/SnapshotJson.hpp"
#include "domain/scoring/StreakResolver.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace habitpoints::infrastructure {

using json = nlohmann::json;
using namespace habitpoints::domain;

namespace {

int ReadCount(const json& j, const char* key, int fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    auto value = SnapshotJson::ToInt(j[key]);
    if (!value) {
        throw std::invalid_argument(std::string("'") + key + "' must be a whole number within int range, got " +
                                    j[key].dump());
    }
    return *value;
}

} // namespace

std::optional<int> SnapshotJson::ToInt(const json& value) {
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(v);
    }
    return std::nullopt;
}

TaskSnapshot SnapshotJson::ParseTask(const json& j, const SnapshotDefaults& defaults) {
    TaskSnapshot task;
    task.title = j.value("title", std::string());
    task.basePoints = j.value("basePoints", defaults.taskPoints);
    task.target = ReadCount(j, "target", defaults.taskTarget);
    task.completed = ReadCount(j, "completed", 0);
    task.max = ReadCount(j, "max", std::max(defaults.taskMax, task.target));
    task.isRoutine = j.value("routine", false);
    task.isOptional = j.value("optional", false);
    task.reward = j.value("reward", 0.0);
    task.scalar = j.value("scalar", 1.0);
    return task;
}

std::optional<DayDocument> SnapshotJson::ParseDay(const json& j, const SnapshotDefaults& defaults) {
    if (!j.is_object()) {
        std::cerr << "[SnapshotJson] Day document must be a JSON object." << std::endl;
        return std::nullopt;
    }

    try {
        DayDocument doc;
        doc.day.targetPoints = j.value("targetPoints", defaults.targetPoints);

        if (j.contains("tasks")) {
            if (!j["tasks"].is_array()) {
                std::cerr << "[SnapshotJson] 'tasks' must be an array." << std::endl;
                return std::nullopt;
            }
            for (const auto& item : j["tasks"]) {
                if (!item.is_object()) {
                    std::cerr << "[SnapshotJson] Each task must be a JSON object." << std::endl;
                    return std::nullopt;
                }
                doc.day.tasks.push_back(ParseTask(item, defaults));
            }
        }

        if (j.contains("history")) {
            if (!j["history"].is_array()) {
                std::cerr << "[SnapshotJson] 'history' must be an array." << std::endl;
                return std::nullopt;
            }
            for (const auto& item : j["history"]) {
                DayRecord record;
                record.points = item.at("points").get<double>();
                record.targetPoints = item.value("targetPoints", defaults.targetPoints);
                doc.history.push_back(record);
            }
        }

        if (j.contains("priorConsecutiveDays")) {
            doc.day.priorConsecutiveDays = ReadCount(j, "priorConsecutiveDays", 0);
        } else if (!doc.history.empty()) {
            doc.day.priorConsecutiveDays = scoring::StreakResolver::countConsecutiveDays(doc.history);
            doc.streakFromHistory = true;
        }

        return doc;
    } catch (const json::exception& e) {
        std::cerr << "[SnapshotJson] Malformed day document: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[SnapshotJson] Malformed day document: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<DayDocument> SnapshotJson::LoadDayFile(const std::string& path, const SnapshotDefaults& defaults) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[SnapshotJson] File not found: " << path << std::endl;
        return std::nullopt;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[SnapshotJson] Error reading " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    return ParseDay(j, defaults);
}

json SnapshotJson::ReportToJson(const DaySnapshot& day, const application::DayReport& report) {
    json tasks = json::array();
    for (std::size_t i = 0; i < report.taskScores.size(); ++i) {
        const auto& score = report.taskScores[i];
        json t;
        t["title"] = i < day.tasks.size() ? day.tasks[i].title : std::string();
        if (score.ok()) {
            t["earnedPoints"] = score.points->earnedPoints;
        } else {
            t["error"] = scoring::ScoringErrorToString(score.error);
            t["message"] = score.message;
        }
        tasks.push_back(t);
    }

    return {
        {"bonus", report.bonus},
        {"priorConsecutiveDays", report.priorConsecutiveDays},
        {"totalPoints", report.progress.totalPoints},
        {"progressRatio", report.progress.progressRatio},
        {"targetMet", report.targetMet},
        {"tasks", tasks},
        {"warnings", report.warnings}
    };
}

} // namespace habitpoints::infrastructure
