#include "backtest/Simulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace edgebook {
namespace backtest {

namespace {
constexpr double IMPLIED_PROB_EPSILON = 1e-9;

bool isWinner(const std::optional<CellValue>& result) {
    if (!result) {
        return false;
    }
    std::string value = cellToString(*result);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value == "WINNER";
}

struct Candidate {
    const RunnerRow* row = nullptr;
    double implied_prob = 0.0;
    double edge = 0.0;
};
}

nlohmann::json StrategyMetrics::toJson() const {
    nlohmann::json j;
    j["strategy_id"] = strategy_id;
    j["bets"] = bets;
    j["wins"] = wins;
    j["hit_rate"] = hit_rate;
    j["mean_edge"] = mean_edge;
    j["total_staked"] = total_staked;
    j["total_profit"] = total_profit;
    j["pot_pct"] = pot_pct;
    j["params"] = params;
    return j;
}

Simulator::Simulator(std::string win_result_col, std::string race_id_col)
    : win_result_col_(std::move(win_result_col)), race_id_col_(std::move(race_id_col)) {}

double Simulator::computeEdge(double model_prob, double win_odds, double margin) {
    // Positive when the market price beats the fair price shrunk by the margin.
    const double fair_odds = 1.0 / model_prob;
    const double adjusted_fair_odds = fair_odds / margin;
    return win_odds - adjusted_fair_odds;
}

size_t Simulator::countIncompleteRows(const RunnerTable& runners) {
    return static_cast<size_t>(std::count_if(runners.rows.begin(), runners.rows.end(),
        [](const RunnerRow& row) { return !row.model_prob || !row.win_odds; }));
}

SimulationResult Simulator::evaluate(const RunnerTable& runners,
                                     const strategy::StrategyConfig& strategy) const {
    return evaluate(runners, std::make_shared<const strategy::StrategyConfig>(strategy));
}

SimulationResult Simulator::evaluate(const RunnerTable& runners,
                                     std::shared_ptr<const strategy::StrategyConfig> strategy) const {
    if (!strategy) {
        throw ConfigurationError("Simulator::evaluate called without a strategy");
    }

    SimulationResult result;
    result.strategy = strategy;
    result.metrics = emptyMetrics(*strategy);

    if (runners.empty()) {
        return result;
    }

    std::vector<std::string> missing;
    for (const auto& required : {columns::MODEL_PROB, columns::WIN_ODDS, win_result_col_}) {
        if (!runners.hasColumn(required)) {
            missing.push_back(required);
        }
    }
    if (!missing.empty()) {
        std::sort(missing.begin(), missing.end());
        throw ConfigurationError(fmt::format("Missing required columns in runners dataset: [{}]",
                                             fmt::join(missing, ", ")));
    }

    const bool any_odds = std::any_of(runners.rows.begin(), runners.rows.end(),
                                      [](const RunnerRow& row) { return row.win_odds.has_value(); });
    if (!any_odds) {
        throw ConfigurationError("All win_odds values are null - cannot compute edge");
    }
    const bool any_prob = std::any_of(runners.rows.begin(), runners.rows.end(),
                                      [](const RunnerRow& row) { return row.model_prob.has_value(); });
    if (!any_prob) {
        throw ConfigurationError("All model_prob values are null - cannot evaluate strategy");
    }

    // Active predicates; columns the table does not carry are skipped.
    std::vector<const strategy::FilterPredicate*> predicates;
    for (const auto& filter : strategy->filters) {
        if (!runners.hasColumn(filter.column)) {
            LOG_WARN("Strategy {}: filter column '{}' not in runner table, filter skipped",
                     strategy->strategy_id, filter.column);
            continue;
        }
        predicates.push_back(&filter);
    }

    std::vector<Candidate> candidates;
    size_t dropped = 0;
    for (const auto& row : runners.rows) {
        if (!row.model_prob || !row.win_odds || *row.model_prob <= 0.0) {
            ++dropped;
            continue;
        }
        const double prob = *row.model_prob;
        const double odds = *row.win_odds;

        if (strategy->min_model_prob && prob < *strategy->min_model_prob) continue;
        if (strategy->max_win_odds && odds > *strategy->max_win_odds) continue;

        bool accepted = true;
        for (const auto* predicate : predicates) {
            const auto value = row.cell(predicate->column);
            if (!value || !predicate->matches(*value)) {
                accepted = false;
                break;
            }
        }
        if (!accepted) continue;

        Candidate c;
        c.row = &row;
        c.implied_prob = row.implied_prob ? *row.implied_prob : 1.0 / (odds + IMPLIED_PROB_EPSILON);
        c.edge = computeEdge(prob, odds, strategy->margin);
        candidates.push_back(c);
    }

    if (dropped > 0) {
        LOG_DEBUG("Strategy {}: {} rows without usable model_prob/win_odds dropped",
                  strategy->strategy_id, dropped);
    }
    if (candidates.empty()) {
        return result;
    }

    const std::string race_col = resolveRaceIdColumn(runners);

    std::vector<std::pair<std::string, Candidate>> positive;
    for (const auto& c : candidates) {
        if (c.edge > 0.0) {
            const auto race = c.row->cell(race_col);
            positive.emplace_back(race ? cellToString(*race) : std::string(), c);
        }
    }
    std::stable_sort(positive.begin(), positive.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second.edge > b.second.edge;
    });

    std::map<std::string, int> taken_per_race;
    const double stake = strategy->stake;
    for (const auto& [race_key, c] : positive) {
        int& taken = taken_per_race[race_key];
        if (taken >= strategy->top_n) {
            continue;
        }
        ++taken;

        BetRow bet;
        bet.runner = *c.row;
        bet.race_key = race_key;
        bet.implied_prob = c.implied_prob;
        bet.edge = c.edge;
        bet.stake = stake;
        bet.won_flag = isWinner(c.row->cell(win_result_col_)) ? 1 : 0;
        bet.profit = bet.won_flag ? stake * (*c.row->win_odds - 1.0) : -stake;
        result.bets.push_back(std::move(bet));
    }

    if (result.bets.empty()) {
        return result;
    }

    auto& m = result.metrics;
    double edge_sum = 0.0;
    for (const auto& bet : result.bets) {
        m.bets++;
        m.wins += bet.won_flag;
        m.total_profit += bet.profit;
        edge_sum += bet.edge;
    }
    const double n = static_cast<double>(m.bets);
    m.hit_rate = static_cast<double>(m.wins) / n;
    m.mean_edge = edge_sum / n;
    m.total_staked = stake * n;
    m.pot_pct = (m.total_profit / n) * 100.0;

    if (runners.hasColumn(columns::TRACK)) {
        std::map<std::string, TrackBreakdown> by_track;
        for (const auto& bet : result.bets) {
            if (bet.runner.track.empty()) continue;
            auto& t = by_track[bet.runner.track];
            t.track = bet.runner.track;
            t.bets++;
            t.profit += bet.profit;
        }
        std::vector<TrackBreakdown> rows;
        for (auto& [name, t] : by_track) {
            t.pot_pct = (t.profit / static_cast<double>(t.bets)) * 100.0;
            rows.push_back(t);
        }
        std::stable_sort(rows.begin(), rows.end(), [](const TrackBreakdown& a, const TrackBreakdown& b) {
            return a.pot_pct > b.pot_pct;
        });
        result.by_track = std::move(rows);
    }

    return result;
}

std::string Simulator::resolveRaceIdColumn(const RunnerTable& runners) const {
    if (runners.hasColumn(race_id_col_)) {
        return race_id_col_;
    }
    if (runners.hasColumn(columns::WIN_MARKET_ID)) {
        return columns::WIN_MARKET_ID;
    }
    throw ConfigurationError(fmt::format(
        "No race identifier column found (expected '{}' or '{}').", race_id_col_, columns::WIN_MARKET_ID));
}

StrategyMetrics Simulator::emptyMetrics(const strategy::StrategyConfig& strategy) {
    StrategyMetrics m;
    m.strategy_id = strategy.strategy_id;
    m.params = strategy.toParams();
    return m;
}

} // namespace backtest
} // namespace edgebook
