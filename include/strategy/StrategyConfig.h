#pragma once

#include "common/Types.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace edgebook {
namespace strategy {

// Revision tag of the edge/settlement logic. Bump both together with a
// CHANGELOG entry whenever Simulator::evaluate changes what it selects or pays.
// 2.0.0: edge = win_odds - (1 / model_prob) / margin
inline const std::string kEvaluationLogicVersion = "2.0.0";
inline const std::string kEvaluationLogicTag = "edge_fair_odds_v2";

using FilterScalar = CellValue;

struct Equals {
    FilterScalar value;
};

struct OneOf {
    std::vector<FilterScalar> values;
};

// column == value, or column in {values}
struct FilterPredicate {
    std::string column;
    std::variant<Equals, OneOf> predicate;

    static FilterPredicate equals(std::string column, FilterScalar value);
    static FilterPredicate oneOf(std::string column, std::vector<FilterScalar> values);

    bool matches(const CellValue& cell) const;
    nlohmann::json valueJson() const;
};

bool filterValueEquals(const FilterScalar& expected, const CellValue& cell);

struct StrategyConfig {
    std::string strategy_id;
    double margin = 1.05;   // required edge multiplier, >= 1.0
    int top_n = 1;          // max bets per race
    double stake = 1.0;     // flat stake per bet
    std::optional<double> min_model_prob;
    std::optional<double> max_win_odds;
    std::vector<FilterPredicate> filters;
    std::string version = kEvaluationLogicVersion;
    std::string code_hash = kEvaluationLogicTag;

    // Throws ConfigurationError for out-of-range parameters.
    void validate() const;

    nlohmann::json toParams() const;

    // Sorted-key compact encoding of toParams(); stable across runs.
    std::string paramsJson() const;
};

} // namespace strategy
} // namespace edgebook
