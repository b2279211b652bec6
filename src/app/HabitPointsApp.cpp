/**
 * @file HabitPointsApp.cpp
 * @brief Implementation of the HabitPointsApp class.
 */
#include "app/HabitPointsApp.hpp"

#include "application/ScoringService.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/SnapshotJson.hpp"

#include <iostream>
#include <stdexcept>

namespace habitpoints::app {

int HabitPointsApp::Run(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    std::string settingsDir;
    m_outPath.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--settings" || arg == "--out") {
            if (i + 1 >= args.size()) {
                std::cerr << "[HabitPoints] Missing value for " << arg << std::endl;
                PrintUsage();
                return kExitUsage;
            }
            if (arg == "--settings") {
                settingsDir = args[++i];
            } else {
                m_outPath = args[++i];
            }
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return kExitOk;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    m_settings = settingsDir.empty() ? infrastructure::ConfigLoader::LoadDefault()
                                     : infrastructure::ConfigLoader::Load(settingsDir);

    const std::string command = positional.front();
    positional.erase(positional.begin());

    if (command == "score") return RunScore(positional);
    if (command == "streak") return RunStreak(positional);

    std::cerr << "[HabitPoints] Unknown command: " << command << std::endl;
    PrintUsage();
    return kExitUsage;
}

int HabitPointsApp::RunScore(const std::vector<std::string>& positional) {
    if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }

    auto doc = infrastructure::SnapshotJson::LoadDayFile(positional[0], m_settings.defaults);
    if (!doc) {
        return kExitBadInput;
    }

    if (doc->streakFromHistory) {
        std::cerr << "[HabitPoints] Streak of " << doc->day.priorConsecutiveDays << " day(s) derived from "
                  << doc->history.size() << " history entries." << std::endl;
    }

    application::ScoringService service(m_settings.streak);
    application::DayReport report = service.scoreDay(doc->day);
    const std::string output = infrastructure::SnapshotJson::ReportToJson(doc->day, report).dump(4);

    if (m_outPath.empty()) {
        std::cout << output << std::endl;
        return kExitOk;
    }

    if (!infrastructure::AtomicFileWriter::Write(m_outPath, output + "\n")) {
        return kExitBadInput;
    }
    std::cout << "[HabitPoints] Report written to " << m_outPath << std::endl;
    return kExitOk;
}

int HabitPointsApp::RunStreak(const std::vector<std::string>& positional) {
    if (positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }

    int days = 0;
    try {
        size_t consumed = 0;
        days = std::stoi(positional[0], &consumed);
        if (consumed != positional[0].size()) {
            throw std::invalid_argument(positional[0]);
        }
    } catch (const std::exception&) {
        std::cerr << "[HabitPoints] Not a day count: " << positional[0] << std::endl;
        return kExitBadInput;
    }

    application::ScoringService service(m_settings.streak);
    std::cout << service.resolveBonus(days) << std::endl;
    return kExitOk;
}

void HabitPointsApp::PrintUsage() const {
    std::cerr << "Usage:\n"
              << "  habitpoints score <day.json> [--settings <dir>] [--out <file>]\n"
              << "  habitpoints streak <days> [--settings <dir>]\n";
}

} // namespace habitpoints::app
