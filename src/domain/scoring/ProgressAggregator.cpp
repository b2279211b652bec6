/**
 * @file ProgressAggregator.cpp
 * @brief Implementation of ProgressAggregator.
 */

#include "domain/scoring/ProgressAggregator.hpp"
#include "domain/scoring/PointsCalculator.hpp"
#include <algorithm>
#include <cmath>

namespace habitpoints::domain::scoring {

double ProgressAggregator::sumPoints(const std::vector<TaskScoreResult>& scores) {
    std::vector<double> values;
    values.reserve(scores.size());
    for (const auto& score : scores) {
        // PointsCalculator only returns finite values; anything else is dropped before sorting
        const double earned = score.earnedOrZero();
        values.push_back(std::isfinite(earned) ? earned : 0.0);
    }

    // Canonical order keeps floating-point rounding identical for any permutation.
    std::sort(values.begin(), values.end());

    double total = 0.0;
    for (double v : values) {
        total += v;
    }
    return total;
}

double ProgressAggregator::progressRatio(double totalPoints, double targetPoints) {
    if (!(targetPoints > 0.0)) {
        return 0.0;
    }
    const double ratio = totalPoints / targetPoints;
    if (std::isnan(ratio)) {
        return 0.0;
    }
    return std::clamp(ratio, 0.0, 1.0);
}

std::vector<TaskScoreResult> ProgressAggregator::scoreTasks(const DaySnapshot& day) {
    std::vector<TaskScoreResult> scores;
    scores.reserve(day.tasks.size());
    for (const auto& task : day.tasks) {
        scores.push_back(PointsCalculator::computePoints(task));
    }
    return scores;
}

ComputedDayProgress ProgressAggregator::aggregateScores(const std::vector<TaskScoreResult>& scores,
                                                        double targetPoints) {
    ComputedDayProgress progress;
    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (!scores[i].ok()) {
            progress.unscoreableTasks.push_back(i);
        }
    }
    progress.totalPoints = sumPoints(scores);
    progress.progressRatio = progressRatio(progress.totalPoints, targetPoints);
    return progress;
}

ComputedDayProgress ProgressAggregator::aggregate(const DaySnapshot& day) {
    return aggregateScores(scoreTasks(day), day.targetPoints);
}

} // namespace habitpoints::domain::scoring
