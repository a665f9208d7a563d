#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "analytics/ACEReflector.h"
#include "experience/EarlyExperienceRunner.h"
#include "experience/ExperienceWriter.h"

namespace edgebook {
namespace engine {

struct SimulatorSettings {
    std::string race_id_col = "race_id";
    std::string win_result_col = "win_result";
};

struct ExperienceSettings {
    experience::ExperienceWriterConfig writer;
    std::vector<std::string> context_fields = experience::kDefaultContextFields;
    int worker_threads = 1;
};

struct PlaybookSettings {
    std::filesystem::path path = "artifacts/playbook/playbook.json";
    size_t max_history = 10;
};

struct LoggingSettings {
    std::string dir = "logs";
    std::string level = "info";
};

// Effective settings for one ACE loop run.
struct EngineConfig {
    SimulatorSettings simulator;
    ExperienceSettings experience;
    analytics::ReflectorSettings reflector;
    PlaybookSettings playbook;
    LoggingSettings logging;

    // Inclusive YYYY-MM-DD event_date window; empty bounds are open.
    std::string start_date;
    std::string end_date;

    // 0 keeps every race.
    int max_races = 0;
};

} // namespace engine
} // namespace edgebook
