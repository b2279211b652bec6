/**
 * @file SnapshotJson.hpp
 * @brief JSON mapping for day snapshots (input) and day reports (output).
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/ScoringService.hpp"
#include "domain/DaySnapshot.hpp"

namespace habitpoints::infrastructure {

/**
 * @struct SnapshotDefaults
 * @brief Fallbacks for fields a day document leaves out.
 */
struct SnapshotDefaults {
    double targetPoints = 5.0;
    double taskPoints = 1.0;
    int taskTarget = 3;
    int taskMax = 8;
};

/**
 * @struct DayDocument
 * @brief A parsed day document.
 */
struct DayDocument {
    domain::DaySnapshot day;
    std::vector<domain::DayRecord> history;
    bool streakFromHistory = false; ///< priorConsecutiveDays was absent and history supplied.
};

class SnapshotJson {
public:
    /**
     * @brief Maps one task object.
     *
     * Throws nlohmann::json::exception on wrongly typed fields and std::invalid_argument
     * when a count is fractional or outside the int range. A per-task bonus is not read:
     * bonuses are always resolved from the day's streak.
     */
    static domain::TaskSnapshot ParseTask(const nlohmann::json& j, const SnapshotDefaults& defaults);

    /**
     * @brief Maps a whole day document.
     * @return std::nullopt if the document is malformed (logged).
     */
    static std::optional<DayDocument> ParseDay(const nlohmann::json& j, const SnapshotDefaults& defaults);

    /**
     * @brief Reads and maps a day document from disk.
     * @return std::nullopt if the file is missing, unreadable or malformed (logged).
     */
    static std::optional<DayDocument> LoadDayFile(const std::string& path, const SnapshotDefaults& defaults);

    /**
     * @brief Converts a JSON integer that fits in int.
     * @return std::nullopt for floats (even whole ones), non-numbers and out-of-range values.
     */
    static std::optional<int> ToInt(const nlohmann::json& value);

    /**
     * @brief Serializes a report. Task titles are taken from the scored day.
     */
    static nlohmann::json ReportToJson(const domain::DaySnapshot& day, const application::DayReport& report);
};

} // namespace habitpoints::infrastructure
