/**
 * @file DaySnapshot.hpp
 * @brief Value objects describing one calendar day and its history.
 */

#pragma once
#include <vector>
#include "TaskSnapshot.hpp"

namespace habitpoints::domain {

/**
 * @struct DaySnapshot
 * @brief The tasks attached to a date together with the date's goal and streak length.
 */
struct DaySnapshot {
    double targetPoints = 0.0; ///< Aggregate point goal for the day.
    std::vector<TaskSnapshot> tasks; ///< Tasks in display order.
    int priorConsecutiveDays = 0; ///< Run of qualifying days ending at this one.
};

/**
 * @struct DayRecord
 * @brief Stored outcome of a past day, used to derive streak length.
 */
struct DayRecord {
    double points = 0.0;
    double targetPoints = 0.0;
};

} // namespace habitpoints::domain
