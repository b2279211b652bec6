/**
 * @file StreakResolver.cpp
 * @brief Implementation of StreakResolver.
 */

#include "domain/scoring/StreakResolver.hpp"
#include <algorithm>

namespace habitpoints::domain::scoring {

double StreakResolver::resolveBonus(int priorConsecutiveDays) {
    return resolveBonus(priorConsecutiveDays, StreakPolicy{});
}

double StreakResolver::resolveBonus(int priorConsecutiveDays, const StreakPolicy& policy) {
    if (priorConsecutiveDays <= 1) {
        return 0.0;
    }

    const double step = std::max(0.0, policy.stepPerDay);
    const double ceiling = std::clamp(policy.maxBonus, 0.0, 1.0);
    const double raw = static_cast<double>(priorConsecutiveDays - 1) * step;
    return std::min(ceiling, std::max(0.0, raw));
}

int StreakResolver::countConsecutiveDays(const std::vector<DayRecord>& history) {
    int run = 0;
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->targetPoints <= 0.0 || it->points < it->targetPoints) {
            break;
        }
        run++;
    }
    return run;
}

double StreakResolver::resolveTaskBonus(const TaskSnapshot& task, int priorConsecutiveDays,
                                        const StreakPolicy& policy) {
    if (!task.isRoutine) {
        return 0.0;
    }

    double bonus = resolveBonus(priorConsecutiveDays, policy);
    if (task.target <= 0 || task.completed < task.target) {
        return bonus;
    }

    bonus += std::max(0.0, policy.targetMetBonus);

    // Extra credit grows linearly from target to max and stops there
    if (task.max > task.target && task.completed > task.target) {
        const int extra = std::min(task.completed, task.max) - task.target;
        const double extraRatio = static_cast<double>(extra) / static_cast<double>(task.max - task.target);
        bonus += extraRatio * std::max(0.0, policy.overAchievementBonus);
    }
    return bonus;
}

DaySnapshot StreakResolver::withResolvedBonus(const DaySnapshot& day, const StreakPolicy& policy) {
    DaySnapshot resolved = day;
    for (auto& task : resolved.tasks) {
        if (task.isRoutine) {
            task.bonus = resolveTaskBonus(task, day.priorConsecutiveDays, policy);
        }
    }
    return resolved;
}

} // namespace habitpoints::domain::scoring
