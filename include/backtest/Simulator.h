#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace edgebook {
namespace backtest {

// A runner row the strategy bet on, with its settlement.
struct BetRow {
    RunnerRow runner;
    std::string race_key;       // value of the resolved race identifier column
    double implied_prob = 0.0;
    double edge = 0.0;
    double stake = 0.0;
    double profit = 0.0;
    int won_flag = 0;
};

struct StrategyMetrics {
    std::string strategy_id;
    int bets = 0;
    int wins = 0;
    double hit_rate = 0.0;
    double mean_edge = 0.0;
    double total_staked = 0.0;
    double total_profit = 0.0;
    double pot_pct = 0.0;
    nlohmann::json params;

    nlohmann::json toJson() const;
};

struct TrackBreakdown {
    std::string track;
    int bets = 0;
    double profit = 0.0;
    double pot_pct = 0.0;
};

struct SimulationResult {
    std::shared_ptr<const strategy::StrategyConfig> strategy;
    std::vector<BetRow> bets;
    StrategyMetrics metrics;
    std::optional<std::vector<TrackBreakdown>> by_track;
};

// Applies one strategy's betting rule to a runner table and settles the bets.
// Stateless; one instance may evaluate many strategies concurrently.
class Simulator {
public:
    explicit Simulator(std::string win_result_col = columns::WIN_RESULT,
                       std::string race_id_col = columns::RACE_ID);

    // Throws ConfigurationError when required columns are missing, when every
    // model_prob or win_odds is null, or when no race identifier resolves.
    SimulationResult evaluate(const RunnerTable& runners,
                              std::shared_ptr<const strategy::StrategyConfig> strategy) const;
    SimulationResult evaluate(const RunnerTable& runners, const strategy::StrategyConfig& strategy) const;

    // Rows lacking model_prob or win_odds; they never produce bets.
    static size_t countIncompleteRows(const RunnerTable& runners);

    static double computeEdge(double model_prob, double win_odds, double margin);

    const std::string& winResultColumn() const { return win_result_col_; }
    const std::string& raceIdColumn() const { return race_id_col_; }

private:
    std::string resolveRaceIdColumn(const RunnerTable& runners) const;
    static StrategyMetrics emptyMetrics(const strategy::StrategyConfig& strategy);

    std::string win_result_col_;
    std::string race_id_col_;
};

} // namespace backtest
} // namespace edgebook
