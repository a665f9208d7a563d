#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "backtest/RunnerTableLoader.h"
#include "engine/AceLoop.h"
#include "strategy/StrategyGrid.h"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <iostream>
#include <string>
#include <vector>

using namespace edgebook;

namespace {

struct CliOptions {
    std::string runners_path;
    std::string strategies_path;
    std::string config_path = "config/edgebook.json";
    std::string label;
    std::string playbook_path;
    std::string output_experiences;
    std::string start_date;
    std::string end_date;
    int min_bets = -1;
    int max_races = 0;
    bool json_mode = false;
};

void printUsage() {
    std::cout
        << "Usage: edgebook --runners <csv|json> [options]\n"
        << "  --strategies <json>          strategy grid definition (default grid when omitted)\n"
        << "  --config <json>              settings file (default config/edgebook.json)\n"
        << "  --label <name>               experience file name prefix\n"
        << "  --min-bets <n>               minimum bets for track/context insights\n"
        << "  --playbook <path>            playbook history file\n"
        << "  --output-experiences <dir>  experience output directory\n"
        << "  --start-date <YYYY-MM-DD>    inclusive first event date\n"
        << "  --end-date <YYYY-MM-DD>      inclusive last event date\n"
        << "  --max-races <n>              evaluate only the first n races\n"
        << "  --json                       print the playbook snapshot as JSON\n";
}

int parseIntArg(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + flag + ": " + value);
    }
    if (used != value.size() || parsed < 0) {
        throw ConfigurationError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            opts.json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw ConfigurationError("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--runners") {
            opts.runners_path = value;
        } else if (arg == "--strategies") {
            opts.strategies_path = value;
        } else if (arg == "--config") {
            opts.config_path = value;
        } else if (arg == "--label") {
            opts.label = value;
        } else if (arg == "--min-bets") {
            opts.min_bets = parseIntArg(arg, value);
        } else if (arg == "--playbook") {
            opts.playbook_path = value;
        } else if (arg == "--output-experiences") {
            opts.output_experiences = value;
        } else if (arg == "--start-date") {
            opts.start_date = value;
        } else if (arg == "--end-date") {
            opts.end_date = value;
        } else if (arg == "--max-races") {
            opts.max_races = parseIntArg(arg, value);
        } else {
            throw ConfigurationError("Unknown option: " + arg);
        }
    }
    if (opts.runners_path.empty()) {
        throw ConfigurationError("--runners is required");
    }
    return opts;
}

void printSummary(const engine::AceLoopOutput& output) {
    const auto& playbook = output.playbook;
    const auto& g = playbook.global_stats;

    std::cout << "---------------------------------------------\n";
    std::cout << "Strategies evaluated : " << playbook.metadata.strategies_evaluated << "\n";
    std::cout << "Experience rows      : " << playbook.metadata.experience_rows << "\n";
    std::cout << "Total bets           : " << g.total_bets << "\n";
    std::cout << "Total profit         : " << fmt::format("{:.2f}", g.total_profit) << "\n";
    std::cout << "POT                  : " << fmt::format("{:.2f}%", g.pot_pct) << "\n";
    std::cout << "---------------------------------------------\n";

    for (const auto& s : playbook.strategy_stats) {
        const std::string roi = s.roi_pct ? fmt::format("{:.2f}%", *s.roi_pct) : std::string("n/a");
        std::cout << fmt::format("{:<48} bets={:<5} roi={:<9} p={:.4f}{}\n",
                                 s.metrics.strategy_id, s.metrics.bets, roi, s.p_value,
                                 s.significant ? " *" : "");
    }
    std::cout << "---------------------------------------------\n";
    if (output.experience_path) {
        std::cout << "Experiences : " << output.experience_path->string() << "\n";
    }
    std::cout << "Playbook    : " << output.playbook_path.string() << "\n";
}

}

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    try {
        const CliOptions opts = parseArgs(argc, argv);

        auto& config = Config::getInstance();
        config.load(opts.config_path);
        if (opts.min_bets >= 0) {
            config.setMinBets(opts.min_bets);
        }
        if (!opts.playbook_path.empty()) {
            config.setPlaybookPath(opts.playbook_path);
        }
        if (!opts.output_experiences.empty()) {
            config.setExperienceOutputDir(opts.output_experiences);
        }
        config.setMaxRaces(opts.max_races);
        config.setStartDate(opts.start_date);
        config.setEndDate(opts.end_date);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        engine::RunContext context;
        context.config = config.getEngineConfig();
        context.label = opts.label;
        context.runners = backtest::RunnerTableLoader::load(opts.runners_path);
        context.strategies = opts.strategies_path.empty()
            ? strategy::StrategyGrid::defaultGrid()
            : strategy::StrategyGrid::loadDefinitionFile(opts.strategies_path);

        engine::AceLoop loop;
        const auto output = loop.run(context);

        if (opts.json_mode) {
            std::cout << output.playbook.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
        } else {
            printSummary(output);
        }
        return 0;
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        printUsage();
        return 2;
    } catch (const PersistenceError& e) {
        LOG_ERROR("Persistence error: {}", e.what());
        std::cerr << "Persistence error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
