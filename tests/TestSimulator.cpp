#include "backtest/Simulator.h"
#include "common/Errors.h"
#include "strategy/StrategyGrid.h"

#include <cmath>
#include <iostream>
#include <map>

using namespace edgebook;

namespace {
RunnerRow makeRunner(const std::string& race, const std::string& runner, double prob, double odds,
                     const std::string& result, const std::string& track = "Flemington") {
    RunnerRow row;
    row.race_id = race;
    row.runner_id = runner;
    row.selection_id = runner;
    row.event_date = "2024-03-02";
    row.model_prob = prob;
    row.win_odds = odds;
    row.win_result = result;
    row.track = track;
    row.state_code = "VIC";
    return row;
}

RunnerTable makeTable(std::vector<RunnerRow> rows) {
    RunnerTable table;
    table.columns = {columns::RACE_ID, columns::RUNNER_ID, columns::SELECTION_ID, columns::EVENT_DATE,
                     columns::MODEL_PROB, columns::WIN_ODDS, columns::WIN_RESULT, columns::TRACK,
                     columns::STATE_CODE};
    table.rows = std::move(rows);
    return table;
}

strategy::StrategyConfig makeStrategy(double margin, int top_n, double stake = 1.0) {
    return strategy::StrategyGrid::build({margin}, {top_n}, {stake}).front();
}
}

int main() {
    const backtest::Simulator simulator;

    // Three runners in one race, margin 1.05, top_n 1: one bet on the biggest edge.
    {
        const auto table = makeTable({
            makeRunner("R1", "A", 0.25, 5.0, "WINNER"),
            makeRunner("R1", "B", 0.50, 2.5, "LOSER"),
            makeRunner("R1", "C", 0.10, 12.0, "LOSER"),
        });
        const auto result = simulator.evaluate(table, makeStrategy(1.05, 1));
        if (result.bets.size() != 1 || result.metrics.bets != 1) {
            std::cerr << "[TEST] expected exactly one bet, got " << result.bets.size() << "\n";
            return 1;
        }
        const auto& bet = result.bets.front();
        if (bet.runner.runner_id != "C") {
            std::cerr << "[TEST] expected the highest-edge runner C, got " << bet.runner.runner_id << "\n";
            return 1;
        }
        const double expected_edge = 12.0 - (1.0 / 0.10) / 1.05;
        if (std::abs(bet.edge - expected_edge) > 1e-9) {
            std::cerr << "[TEST] unexpected edge " << bet.edge << "\n";
            return 1;
        }
        if (bet.won_flag != 0 || std::abs(bet.profit + 1.0) > 1e-12) {
            std::cerr << "[TEST] losing bet should cost the stake, profit=" << bet.profit << "\n";
            return 1;
        }
        if (result.metrics.pot_pct != -100.0 || result.metrics.hit_rate != 0.0) {
            std::cerr << "[TEST] unexpected metrics pot=" << result.metrics.pot_pct << "\n";
            return 1;
        }
        if (!result.by_track || result.by_track->size() != 1) {
            std::cerr << "[TEST] expected one track breakdown row\n";
            return 1;
        }
    }

    // A winner pays stake x (odds - 1).
    {
        const auto table = makeTable({makeRunner("R1", "A", 0.40, 4.0, "winner")});
        const auto result = simulator.evaluate(table, makeStrategy(1.0, 1, 2.0));
        if (result.bets.size() != 1 || result.bets[0].won_flag != 1 ||
            std::abs(result.bets[0].profit - 6.0) > 1e-12) {
            std::cerr << "[TEST] winning bet should pay 6.0\n";
            return 1;
        }
        const double expected_implied = 1.0 / (4.0 + 1e-9);
        if (std::abs(result.bets[0].implied_prob - expected_implied) > 1e-12) {
            std::cerr << "[TEST] implied_prob should be derived from odds\n";
            return 1;
        }
    }

    // Empty table: zero metrics, no exception.
    {
        const auto result = simulator.evaluate(RunnerTable{}, makeStrategy(1.05, 1));
        if (!result.bets.empty() || result.metrics.bets != 0 || result.metrics.total_staked != 0.0) {
            std::cerr << "[TEST] empty table should produce no bets\n";
            return 1;
        }
    }

    // Missing required columns are configuration errors.
    {
        auto table = makeTable({makeRunner("R1", "A", 0.25, 5.0, "WINNER")});
        table.columns.erase(columns::WIN_ODDS);
        bool threw = false;
        try {
            simulator.evaluate(table, makeStrategy(1.05, 1));
        } catch (const ConfigurationError& e) {
            threw = std::string(e.what()).find("win_odds") != std::string::npos;
        }
        if (!threw) {
            std::cerr << "[TEST] missing win_odds column should throw\n";
            return 1;
        }
    }

    // All-null odds escalate; partially null rows are dropped.
    {
        auto all_null = makeTable({makeRunner("R1", "A", 0.25, 5.0, "WINNER"), makeRunner("R1", "B", 0.25, 5.0, "LOSER")});
        for (auto& row : all_null.rows) {
            row.win_odds.reset();
        }
        bool threw = false;
        try {
            simulator.evaluate(all_null, makeStrategy(1.05, 1));
        } catch (const ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] all-null win_odds should throw\n";
            return 1;
        }

        auto partial = makeTable({makeRunner("R1", "A", 0.25, 5.0, "WINNER"), makeRunner("R1", "B", 0.25, 5.0, "LOSER")});
        partial.rows[0].model_prob.reset();
        const auto result = simulator.evaluate(partial, makeStrategy(1.05, 1));
        if (result.bets.size() != 1 || result.bets[0].runner.runner_id != "B") {
            std::cerr << "[TEST] null-prob row should be dropped, not bet\n";
            return 1;
        }
        if (backtest::Simulator::countIncompleteRows(partial) != 1) {
            std::cerr << "[TEST] countIncompleteRows should report 1\n";
            return 1;
        }
    }

    // No race identifier column at all.
    {
        auto table = makeTable({makeRunner("R1", "A", 0.25, 5.0, "WINNER")});
        table.columns.erase(columns::RACE_ID);
        bool threw = false;
        try {
            simulator.evaluate(table, makeStrategy(1.05, 1));
        } catch (const ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] missing race identifier should throw\n";
            return 1;
        }

        for (auto& row : table.rows) {
            row.win_market_id = "1.2345";
        }
        table.columns.insert(columns::WIN_MARKET_ID);
        const auto result = simulator.evaluate(table, makeStrategy(1.05, 1));
        if (result.bets.size() != 1 || result.bets[0].race_key != "1.2345") {
            std::cerr << "[TEST] win_market_id should stand in for race_id\n";
            return 1;
        }
    }

    // Strict edge filter and top_n cap over several races.
    {
        std::vector<RunnerRow> rows;
        for (int race = 0; race < 4; ++race) {
            const std::string race_id = "R" + std::to_string(race);
            rows.push_back(makeRunner(race_id, race_id + "a", 0.30, 6.0, "LOSER"));
            rows.push_back(makeRunner(race_id, race_id + "b", 0.20, 7.0, "LOSER"));
            rows.push_back(makeRunner(race_id, race_id + "c", 0.15, 9.0, "LOSER"));
            // fair odds 2.0 exactly; zero edge at margin 1.0
            rows.push_back(makeRunner(race_id, race_id + "d", 0.50, 2.0, "WINNER"));
        }
        const auto table = makeTable(rows);
        const auto result = simulator.evaluate(table, makeStrategy(1.0, 2, 0.5));

        std::map<std::string, int> per_race;
        for (const auto& bet : result.bets) {
            if (!(bet.edge > 0.0)) {
                std::cerr << "[TEST] non-positive edge bet found: " << bet.edge << "\n";
                return 1;
            }
            per_race[bet.race_key]++;
        }
        for (const auto& [race, count] : per_race) {
            if (count > 2) {
                std::cerr << "[TEST] race " << race << " has " << count << " bets\n";
                return 1;
            }
        }
        if (result.metrics.bets != 8 || result.metrics.wins != 0) {
            std::cerr << "[TEST] expected 8 losing bets, got " << result.metrics.bets << "\n";
            return 1;
        }
        if (std::abs(result.metrics.total_profit - (-0.5 * result.metrics.bets)) > 1e-9) {
            std::cerr << "[TEST] zero-win profit should equal -stake x bets\n";
            return 1;
        }
    }

    // Filters: min prob, max odds and column predicates; unknown columns are skipped.
    {
        auto table = makeTable({
            makeRunner("R1", "A", 0.25, 5.0, "WINNER", "Randwick"),
            makeRunner("R2", "B", 0.10, 12.0, "LOSER", "Flemington"),
        });
        table.rows[0].state_code = "NSW";

        auto cfg = makeStrategy(1.05, 1);
        cfg.min_model_prob = 0.2;
        if (simulator.evaluate(table, cfg).bets.size() != 1) {
            std::cerr << "[TEST] min_model_prob should keep only runner A\n";
            return 1;
        }

        cfg = makeStrategy(1.05, 1);
        cfg.max_win_odds = 10.0;
        const auto capped = simulator.evaluate(table, cfg);
        if (capped.bets.size() != 1 || capped.bets[0].runner.runner_id != "A") {
            std::cerr << "[TEST] max_win_odds should drop runner B\n";
            return 1;
        }

        cfg = makeStrategy(1.05, 1);
        cfg.filters.push_back(strategy::FilterPredicate::equals(columns::STATE_CODE, std::string("VIC")));
        const auto vic = simulator.evaluate(table, cfg);
        if (vic.bets.size() != 1 || vic.bets[0].runner.runner_id != "B") {
            std::cerr << "[TEST] state_code filter should keep only VIC\n";
            return 1;
        }

        cfg = makeStrategy(1.05, 1);
        cfg.filters.push_back(strategy::FilterPredicate::oneOf(
            columns::TRACK, {std::string("Randwick"), std::string("Caulfield")}));
        cfg.filters.push_back(strategy::FilterPredicate::equals("going", std::string("Good")));
        const auto tracks = simulator.evaluate(table, cfg);
        if (tracks.bets.size() != 1 || tracks.bets[0].runner.track != "Randwick") {
            std::cerr << "[TEST] track filter should apply and unknown column be skipped\n";
            return 1;
        }
    }

    std::cout << "[TEST] Simulator PASSED\n";
    return 0;
}
