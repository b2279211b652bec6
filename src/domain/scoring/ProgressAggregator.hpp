/**
 * @file ProgressAggregator.hpp
 * @brief Domain service summing a day's task scores into progress toward its goal.
 */

#pragma once

#include "domain/DaySnapshot.hpp"
#include "domain/scoring/ScoringTypes.hpp"

namespace habitpoints::domain::scoring {

class ProgressAggregator {
public:
    /**
     * @brief Scores every task of the day and aggregates the result.
     *
     * Task bonuses are taken as given; use StreakResolver::withResolvedBonus first.
     * Unscoreable tasks contribute nothing and are listed in the result.
     */
    static ComputedDayProgress aggregate(const DaySnapshot& day);

    /** @brief Runs PointsCalculator over the day's tasks, in task order. */
    static std::vector<TaskScoreResult> scoreTasks(const DaySnapshot& day);

    /**
     * @brief Aggregates scores already computed for a day's tasks.
     * @param scores One result per task, in task order.
     * @param targetPoints The day's goal.
     */
    static ComputedDayProgress aggregateScores(const std::vector<TaskScoreResult>& scores, double targetPoints);

    /**
     * @brief Sums already computed task scores. Independent of input order.
     */
    static double sumPoints(const std::vector<TaskScoreResult>& scores);

    /**
     * @brief min(1, total / target), or 0 when the day has no positive target.
     */
    static double progressRatio(double totalPoints, double targetPoints);
};

} // namespace habitpoints::domain::scoring
