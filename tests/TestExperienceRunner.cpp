#include "common/Errors.h"
#include "experience/EarlyExperienceRunner.h"
#include "strategy/StrategyGrid.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <set>

using namespace edgebook;

namespace {
// Records writes without touching the disk.
class MemoryWriter : public core::IExperienceWriter {
public:
    std::filesystem::path write(const std::vector<experience::ExperienceRecord>& records,
                                const std::string& label) override {
        ++calls;
        rows = records.size();
        last_label = label;
        return "memory/" + label;
    }

    int calls = 0;
    size_t rows = 0;
    std::string last_label;
};

RunnerTable makeTable() {
    RunnerTable table;
    table.columns = {columns::RACE_ID, columns::SELECTION_ID, columns::EVENT_DATE, columns::MODEL_PROB,
                     columns::WIN_ODDS, columns::WIN_RESULT, columns::TRACK, columns::DISTANCE};
    for (int race = 0; race < 5; ++race) {
        for (int horse = 0; horse < 3; ++horse) {
            RunnerRow row;
            row.race_id = "R" + std::to_string(race);
            row.selection_id = std::to_string(100 + horse);
            row.event_date = "2024-05-0" + std::to_string(1 + race % 2);
            row.model_prob = 0.1 + 0.1 * horse;
            row.win_odds = 6.0 + horse;
            row.win_result = horse == 2 ? "WINNER" : "LOSER";
            row.track = race % 2 ? "Caulfield" : "Randwick";
            row.distance = 1000.0 + 200.0 * race;
            table.rows.push_back(row);
        }
    }
    return table;
}
}

int main() {
    const auto simulator = std::make_shared<const backtest::Simulator>();
    const auto table = makeTable();

    // Fingerprints are pure functions of their inputs.
    {
        const auto a = experience::Fingerprint::experienceId("s1", "R1", "R1_100", "bet");
        const auto b = experience::Fingerprint::experienceId("s1", "R1", "R1_100", "bet");
        if (a != b || a.size() != experience::Fingerprint::EXPERIENCE_ID_LENGTH) {
            std::cerr << "[TEST] experience_id should be deterministic with 20 hex chars\n";
            return 1;
        }
        if (a == experience::Fingerprint::experienceId("s2", "R1", "R1_100", "bet")) {
            std::cerr << "[TEST] experience_id should depend on strategy_id\n";
            return 1;
        }

        std::map<std::string, std::string> forward;
        forward["track"] = "Randwick";
        forward["distance"] = "1200";
        std::map<std::string, std::string> backward;
        backward["distance"] = "1200";
        backward["track"] = "Randwick";
        const auto h1 = experience::Fingerprint::contextHash(forward);
        const auto h2 = experience::Fingerprint::contextHash(backward);
        if (h1 != h2 || h1.size() != experience::Fingerprint::CONTEXT_HASH_LENGTH) {
            std::cerr << "[TEST] context_hash should ignore insertion order\n";
            return 1;
        }
    }

    // An empty strategy list is a configuration error.
    {
        bool threw = false;
        try {
            experience::EarlyExperienceRunner runner(simulator, {}, nullptr);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] empty strategy list should throw\n";
            return 1;
        }
    }

    // Re-running identical inputs yields identical ids; thread count does not matter.
    {
        const auto strategies = strategy::StrategyGrid::defaultGrid();
        auto writer = std::make_shared<MemoryWriter>();
        experience::EarlyExperienceRunner single(simulator, strategies, writer);
        experience::EarlyExperienceRunner pooled(simulator, strategies, nullptr,
                                                 experience::kDefaultContextFields, 4);

        const auto first = single.run(table, "unit");
        const auto second = pooled.run(table, "unit");

        if (first.strategy_metrics.size() != strategies.size()) {
            std::cerr << "[TEST] every strategy should report metrics\n";
            return 1;
        }
        if (first.experiences.empty() || first.experiences.size() != second.experiences.size()) {
            std::cerr << "[TEST] both runs should produce the same number of experiences\n";
            return 1;
        }
        for (size_t i = 0; i < first.experiences.size(); ++i) {
            if (first.experiences[i].experience_id != second.experiences[i].experience_id) {
                std::cerr << "[TEST] experience_id differs at row " << i << "\n";
                return 1;
            }
        }
        for (size_t i = 1; i < first.strategy_metrics.size(); ++i) {
            if (first.strategy_metrics[i - 1].strategy_id > first.strategy_metrics[i].strategy_id) {
                std::cerr << "[TEST] metrics should be ordered by strategy_id\n";
                return 1;
            }
        }

        if (writer->calls != 1 || writer->rows != first.experiences.size() || !first.experience_path) {
            std::cerr << "[TEST] writer should be called once with every record\n";
            return 1;
        }
        if (second.experience_path) {
            std::cerr << "[TEST] no path expected without a writer\n";
            return 1;
        }

        // Context: present fields only, runner_id synthesised from race + selection.
        const auto& record = first.experiences.front();
        if (record.context.count("track") != 1 || record.context.count("distance") != 1 ||
            record.context.count("state_code") != 0) {
            std::cerr << "[TEST] context should hold only table columns\n";
            return 1;
        }
        if (record.runner_id != record.race_id + "_" + record.selection_id) {
            std::cerr << "[TEST] unexpected synthesized runner_id " << record.runner_id << "\n";
            return 1;
        }
        if (record.context_hash != experience::Fingerprint::contextHash(record.context)) {
            std::cerr << "[TEST] record context_hash mismatch\n";
            return 1;
        }

        std::set<std::string> ids;
        for (const auto& r : first.experiences) {
            ids.insert(r.experience_id);
        }
        if (ids.size() != first.experiences.size()) {
            std::cerr << "[TEST] experience ids should be unique per bet\n";
            return 1;
        }
    }

    // A worker failure reaches the caller after every worker has been joined.
    {
        auto broken = table;
        broken.columns.erase(columns::WIN_RESULT);
        experience::EarlyExperienceRunner pooled(simulator, strategy::StrategyGrid::defaultGrid(), nullptr,
                                                 experience::kDefaultContextFields, 4);
        bool threw = false;
        try {
            pooled.run(broken, "broken");
        } catch (const ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] missing win_result column should fail the pooled run\n";
            return 1;
        }
    }

    // Strategies that never bet still report zero metrics; nothing is written.
    {
        auto strict = strategy::StrategyGrid::build({1.05}, {1}, {1.0}, {0.99}).front();
        auto writer = std::make_shared<MemoryWriter>();
        experience::EarlyExperienceRunner runner(simulator, {strict}, writer);
        const auto output = runner.run(table, "none");
        if (output.strategy_metrics.size() != 1 || output.strategy_metrics[0].bets != 0) {
            std::cerr << "[TEST] zero-bet strategy should still report metrics\n";
            return 1;
        }
        if (writer->calls != 0 || output.experience_path || !output.experiences.empty()) {
            std::cerr << "[TEST] nothing should be written without bets\n";
            return 1;
        }
    }

    std::cout << "[TEST] ExperienceRunner PASSED\n";
    return 0;
}
