/**
 * @file ScoringService.hpp
 * @brief Application service scoring a full day: streak bonus, task points, progress.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/DaySnapshot.hpp"
#include "domain/scoring/ScoringTypes.hpp"
#include "domain/scoring/StreakResolver.hpp"

namespace habitpoints::application {

/**
 * @struct DayReport
 * @brief Everything a caller needs to refresh a day's display and stored totals.
 */
struct DayReport {
    double bonus = 0.0; ///< Streak bonus applied to routine tasks.
    int priorConsecutiveDays = 0; ///< Streak length the bonus was resolved from.
    std::vector<domain::scoring::TaskScoreResult> taskScores; ///< Same order as the day's tasks.
    domain::scoring::ComputedDayProgress progress;
    bool targetMet = false; ///< totalPoints reached a positive targetPoints.
    std::vector<std::string> warnings; ///< Data-integrity issues found while scoring.
};

/**
 * @class ScoringService
 * @brief Composes StreakResolver, PointsCalculator and ProgressAggregator.
 *
 * Stateless apart from the configured streak policy; safe to share across threads.
 */
class ScoringService {
public:
    explicit ScoringService(domain::scoring::StreakPolicy policy = {});

    /**
     * @brief Scores a day using its own priorConsecutiveDays.
     */
    DayReport scoreDay(const domain::DaySnapshot& day) const;

    /**
     * @brief Scores a day, deriving the streak from stored history first.
     * @param history Past days, oldest first, ending at the day being scored.
     */
    DayReport scoreDay(const domain::DaySnapshot& day, const std::vector<domain::DayRecord>& history) const;

    /** @brief Bonus for a streak under the configured policy. */
    double resolveBonus(int priorConsecutiveDays) const;

    const domain::scoring::StreakPolicy& getPolicy() const { return m_policy; }

private:
    domain::scoring::StreakPolicy m_policy;
};

} // namespace habitpoints::application
