#pragma once

#include "strategy/StrategyConfig.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace edgebook {
namespace strategy {

class StrategyGrid {
public:
    // Cartesian product of the axes. Ids are derived from the numeric parameters,
    // so identical parameterizations always get identical ids.
    static std::vector<StrategyConfig> build(
        const std::vector<double>& margins,
        const std::vector<int>& top_ns,
        const std::vector<double>& stakes = {1.0},
        const std::vector<std::optional<double>>& min_model_probs = {std::nullopt},
        const std::vector<std::optional<double>>& max_win_odds = {std::nullopt},
        const std::vector<FilterPredicate>& base_filters = {}
    );

    // One definition object:
    // {"margins": [...], "top_ns": [...], "stakes": [...], "min_model_probs": [...],
    //  "max_win_odds": [...], "filters": {"state_code": ["VIC", "NSW"]}}
    // List-valued filters expand into one config per combination, with an id suffix.
    static std::vector<StrategyConfig> fromJson(const nlohmann::json& definition);

    // Object or array of objects (union of all expansions).
    static std::vector<StrategyConfig> fromDefinition(const nlohmann::json& definition);

    static std::vector<StrategyConfig> loadDefinitionFile(const std::string& path);

    static std::vector<StrategyConfig> defaultGrid();

    static std::string makeStrategyId(double margin, int top_n, double stake,
                                      const std::optional<double>& min_model_prob,
                                      const std::optional<double>& max_win_odds);
};

} // namespace strategy
} // namespace edgebook
