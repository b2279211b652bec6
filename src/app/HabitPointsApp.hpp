/**
 * @file HabitPointsApp.hpp
 * @brief Command-line front end for the points engine.
 */

#pragma once

#include <string>
#include <vector>
#include "infrastructure/ConfigLoader.hpp"

namespace habitpoints::app {

/**
 * @class HabitPointsApp
 * @brief Parses arguments, loads settings and dispatches the requested command.
 *
 * Commands:
 *   score <day.json> [--settings <dir>] [--out <file>]
 *   streak <days> [--settings <dir>]
 */
class HabitPointsApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitBadInput = 2;

    /**
     * @brief Runs one command.
     * @param args Arguments without the program name.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

private:
    int RunScore(const std::vector<std::string>& positional);
    int RunStreak(const std::vector<std::string>& positional);
    void PrintUsage() const;

    infrastructure::Settings m_settings; ///< Loaded before dispatch.
    std::string m_outPath; ///< --out; empty means stdout.
};

} // namespace habitpoints::app
