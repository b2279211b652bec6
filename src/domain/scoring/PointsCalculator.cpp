/**
 * @file PointsCalculator.cpp
 * @brief Implementation of PointsCalculator.
 */

#include "domain/scoring/PointsCalculator.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace habitpoints::domain::scoring {

namespace {

constexpr double kDefaultScalar = 1.0;

double NonNegative(double value) {
    return value > 0.0 ? value : 0.0;
}

} // namespace

double PointsCalculator::effectiveBase(const TaskSnapshot& task) {
    const double scalar = task.scalar > 0.0 ? task.scalar : kDefaultScalar;
    const double bonus = task.isRoutine ? NonNegative(task.bonus) : 0.0;
    return NonNegative(task.basePoints) * scalar * (1.0 + bonus);
}

double PointsCalculator::completionRatio(const TaskSnapshot& task) {
    const int target = task.target;
    const int completed = std::max(0, task.completed);
    const int max = std::max(task.max, target);

    if (!task.isRoutine) {
        return completed >= target ? 1.0 : 0.0;
    }

    if (completed < target) {
        return static_cast<double>(completed) / static_cast<double>(target);
    }

    const int capped = std::min(completed, max);
    return std::min(static_cast<double>(capped) / static_cast<double>(target),
                    static_cast<double>(max) / static_cast<double>(target));
}

TaskScoreResult PointsCalculator::computePoints(const TaskSnapshot& task) {
    if (task.target <= 0) {
        return TaskScoreResult::Failure(
            ScoringError::InvalidTarget,
            "Task '" + task.title + "' has target " + std::to_string(task.target) + "; expected at least 1.");
    }

    const double reward = NonNegative(task.reward);
    if (!std::isfinite(reward)) {
        return TaskScoreResult::Failure(
            ScoringError::NonFinitePoints, "Task '" + task.title + "' has a non-finite reward.");
    }

    const double ratio = completionRatio(task);
    if (ratio == 0.0) {
        return TaskScoreResult::Success(reward);
    }

    const double earned = effectiveBase(task) * ratio + reward;
    if (!std::isfinite(earned)) {
        return TaskScoreResult::Failure(
            ScoringError::NonFinitePoints,
            "Task '" + task.title + "' overflows: basePoints x scalar is not representable.");
    }
    return TaskScoreResult::Success(earned);
}

} // namespace habitpoints::domain::scoring
