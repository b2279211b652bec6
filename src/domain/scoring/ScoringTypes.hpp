/**
 * @file ScoringTypes.hpp
 * @brief Result types produced by the points engine.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace habitpoints::domain::scoring {

/**
 * @enum ScoringError
 * @brief Reasons a single task cannot be scored.
 */
enum class ScoringError {
    None,
    InvalidTarget, ///< target <= 0; the task is a data-integrity defect upstream.
    NonFinitePoints ///< Attributes so large the earned value overflows.
};

inline std::string ScoringErrorToString(ScoringError error) {
    switch (error) {
        case ScoringError::None: return "none";
        case ScoringError::InvalidTarget: return "invalid_target";
        case ScoringError::NonFinitePoints: return "non_finite_points";
        default: return "unknown";
    }
}

struct ComputedTaskPoints {
    double earnedPoints = 0.0;
};

/**
 * @struct TaskScoreResult
 * @brief Either the points a task earned or the reason it could not be scored.
 */
struct TaskScoreResult {
    std::optional<ComputedTaskPoints> points;
    ScoringError error = ScoringError::None;
    std::string message;

    bool ok() const { return points.has_value(); }

    /** @brief Earned points, or 0 for an unscoreable task. */
    double earnedOrZero() const { return points ? points->earnedPoints : 0.0; }

    static TaskScoreResult Success(double earned) {
        TaskScoreResult result;
        result.points = ComputedTaskPoints{earned};
        return result;
    }

    static TaskScoreResult Failure(ScoringError err, std::string msg) {
        TaskScoreResult result;
        result.error = err;
        result.message = std::move(msg);
        return result;
    }
};

/**
 * @struct ComputedDayProgress
 * @brief Aggregate of a day's task scores against its point goal.
 */
struct ComputedDayProgress {
    double totalPoints = 0.0;
    double progressRatio = 0.0; ///< Always within [0, 1].
    std::vector<std::size_t> unscoreableTasks; ///< Indices into DaySnapshot::tasks.
};

} // namespace habitpoints::domain::scoring
