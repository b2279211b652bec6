/**
 * @file StreakResolver.hpp
 * @brief Domain service turning a run of qualifying days into a routine bonus.
 */

#pragma once

#include <vector>
#include "domain/DaySnapshot.hpp"

namespace habitpoints::domain::scoring {

/**
 * @struct StreakPolicy
 * @brief Bonus growth per consecutive day and its ceiling, plus optional per-task extras.
 *
 * The extras are off by default. When enabled they stack on top of the streak bonus
 * for routine tasks only, so a routine's total bonus can then exceed 1.
 */
struct StreakPolicy {
    double stepPerDay = 0.1; ///< Added for every qualifying day after the first.
    double maxBonus = 1.0; ///< Ceiling; clamped into [0, 1] when applied.
    double targetMetBonus = 0.0; ///< Added once a routine reaches its target (0.2 in the classic rules).
    double overAchievementBonus = 0.0; ///< Scaled by (completed - target) / (max - target) beyond target.
};

class StreakResolver {
public:
    /**
     * @brief Bonus fraction for a streak, using the default 10%-per-day policy.
     * @param priorConsecutiveDays Qualifying days ending at the scored day. Negative values count as 0.
     * @return Value in [0, 1]. A single qualifying day grants nothing.
     */
    static double resolveBonus(int priorConsecutiveDays);

    /** @brief Same as above with an explicit policy. */
    static double resolveBonus(int priorConsecutiveDays, const StreakPolicy& policy);

    /**
     * @brief Length of the trailing run of days that met their own target.
     * @param history Days ordered oldest first, ending at the day being scored.
     *
     * A day with a non-positive target cannot qualify and breaks the run.
     */
    static int countConsecutiveDays(const std::vector<DayRecord>& history);

    /**
     * @brief Bonus for one routine task: the streak bonus plus any enabled extras.
     * @return 0 for non-routine tasks. Never negative.
     */
    static double resolveTaskBonus(const TaskSnapshot& task, int priorConsecutiveDays,
                                   const StreakPolicy& policy = StreakPolicy{});

    /**
     * @brief Copy of the day with resolveTaskBonus written into every routine task.
     */
    static DaySnapshot withResolvedBonus(const DaySnapshot& day,
                                         const StreakPolicy& policy = StreakPolicy{});
};

} // namespace habitpoints::domain::scoring
