/**
 * @file TaskCompletion.hpp
 * @brief Pure transforms for stepping task completion counts.
 */

#pragma once

#include "DaySnapshot.hpp"

namespace habitpoints::domain {

/**
 * @brief Returns a copy with one more completion, unless the task is already at max.
 */
inline TaskSnapshot IncrementCompletion(const TaskSnapshot& task) {
    TaskSnapshot next = task;
    if (next.completed < next.max) {
        next.completed++;
    }
    return next;
}

/**
 * @brief Returns a copy with one fewer completion, never going below zero.
 */
inline TaskSnapshot DecrementCompletion(const TaskSnapshot& task) {
    TaskSnapshot next = task;
    if (next.completed > 0) {
        next.completed--;
    }
    return next;
}

/**
 * @brief Returns a copy of the day with every task's completions cleared.
 */
inline DaySnapshot ResetCompletions(const DaySnapshot& day) {
    DaySnapshot next = day;
    for (auto& task : next.tasks) {
        task.completed = 0;
    }
    return next;
}

} // namespace habitpoints::domain
