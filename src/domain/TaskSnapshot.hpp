/**
 * @file TaskSnapshot.hpp
 * @brief Value object carrying the scoring attributes of a single task.
 */

#pragma once
#include <string>
#include <utility>

namespace habitpoints::domain {

/**
 * @struct TaskSnapshot
 * @brief Read-only view of a routine or one-off task, built by the caller from its storage.
 */
struct TaskSnapshot {
    std::string title; ///< Display only; never used in computation.
    double basePoints = 0.0; ///< Points for one full completion of the target.
    int target = 1; ///< Completions required for the task to count as done.
    int completed = 0; ///< Current completion count (may exceed max).
    int max = 1; ///< Completions beyond which no further credit accrues.
    bool isRoutine = false; ///< Recurring task: partial credit and streak bonus.
    bool isOptional = false; ///< Informational; does not affect points.
    double reward = 0.0; ///< Fixed amount added on top of ratio-based credit.
    double scalar = 1.0; ///< Multiplicative point-value adjustment.
    double bonus = 0.0; ///< Streak bonus fraction, honored for routines only.

    TaskSnapshot() = default;

    /**
     * @brief Convenience constructor for the attributes that drive the formula.
     * @param taskTitle Display title.
     * @param points Base points.
     * @param targetCount Completions required.
     * @param maxCount Completion ceiling.
     * @param completedCount Current completions.
     * @param routine True for recurring tasks.
     */
    TaskSnapshot(std::string taskTitle, double points, int targetCount, int maxCount,
                 int completedCount, bool routine)
        : title(std::move(taskTitle)),
          basePoints(points),
          target(targetCount),
          completed(completedCount),
          max(maxCount),
          isRoutine(routine) {}
};

} // namespace habitpoints::domain
