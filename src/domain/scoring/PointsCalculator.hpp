/**
 * @file PointsCalculator.hpp
 * @brief Domain service computing the points a single task has earned.
 */

#pragma once

#include "domain/TaskSnapshot.hpp"
#include "domain/scoring/ScoringTypes.hpp"

namespace habitpoints::domain::scoring {

/**
 * @class PointsCalculator
 * @brief Applies the routine (partial credit) or one-off (all-or-nothing) formula to a task.
 *
 * earned = basePoints * scalar * (1 + bonus for routines) * ratio + reward.
 * The reward is added whatever the ratio, including zero completions.
 */
class PointsCalculator {
public:
    /**
     * @brief Scores a task.
     * @param task Snapshot supplied by the caller. Out-of-range attributes are clamped.
     * @return Earned points, ScoringError::InvalidTarget when target <= 0,
     *         or ScoringError::NonFinitePoints when the result would overflow.
     *         A zero ratio always yields exactly the reward.
     */
    static TaskScoreResult computePoints(const TaskSnapshot& task);

    /** @brief basePoints * scalar * (1 + bonus), the bonus counting for routines only. */
    static double effectiveBase(const TaskSnapshot& task);

    /**
     * @brief Credit fraction for the task's completions. Requires target >= 1.
     *
     * Routines earn completed/target, capped at max/target. One-off tasks earn 0 or 1.
     */
    static double completionRatio(const TaskSnapshot& task);
};

} // namespace habitpoints::domain::scoring
