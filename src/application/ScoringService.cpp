/**
 * @file ScoringService.cpp
 * @brief Implementation of ScoringService.
 */

#include "application/ScoringService.hpp"
#include "domain/scoring/ProgressAggregator.hpp"
#include <algorithm>
#include <iostream>

namespace habitpoints::application {

using namespace habitpoints::domain;
using namespace habitpoints::domain::scoring;

ScoringService::ScoringService(StreakPolicy policy) : m_policy(policy) {}

double ScoringService::resolveBonus(int priorConsecutiveDays) const {
    return StreakResolver::resolveBonus(priorConsecutiveDays, m_policy);
}

DayReport ScoringService::scoreDay(const DaySnapshot& day) const {
    DayReport report;
    report.priorConsecutiveDays = std::max(0, day.priorConsecutiveDays);
    report.bonus = resolveBonus(day.priorConsecutiveDays);

    const DaySnapshot resolved = StreakResolver::withResolvedBonus(day, m_policy);
    report.taskScores = ProgressAggregator::scoreTasks(resolved);
    report.progress = ProgressAggregator::aggregateScores(report.taskScores, day.targetPoints);

    for (std::size_t index : report.progress.unscoreableTasks) {
        const TaskScoreResult& score = report.taskScores[index];
        std::string warning = "Task #" + std::to_string(index) + " not scored (" +
                              ScoringErrorToString(score.error) + "): " + score.message;
        std::cerr << "[ScoringService] " << warning << std::endl;
        report.warnings.push_back(warning);
    }

    report.targetMet = day.targetPoints > 0.0 && report.progress.totalPoints >= day.targetPoints;

    if (!(day.targetPoints > 0.0)) {
        report.warnings.push_back("Day has no positive target; progress reported as 0.");
    }

    return report;
}

DayReport ScoringService::scoreDay(const DaySnapshot& day, const std::vector<DayRecord>& history) const {
    DaySnapshot withStreak = day;
    withStreak.priorConsecutiveDays = StreakResolver::countConsecutiveDays(history);
    return scoreDay(withStreak);
}

} // namespace habitpoints::application
