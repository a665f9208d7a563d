#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <fmt/format.h>

namespace edgebook {
namespace strategy {

namespace {
nlohmann::json scalarJson(const FilterScalar& value) {
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::get<std::string>(value);
}
}

bool filterValueEquals(const FilterScalar& expected, const CellValue& cell) {
    if (expected.index() == cell.index()) {
        return expected == cell;
    }
    return cellToString(expected) == cellToString(cell);
}

FilterPredicate FilterPredicate::equals(std::string column, FilterScalar value) {
    return FilterPredicate{std::move(column), Equals{std::move(value)}};
}

FilterPredicate FilterPredicate::oneOf(std::string column, std::vector<FilterScalar> values) {
    return FilterPredicate{std::move(column), OneOf{std::move(values)}};
}

bool FilterPredicate::matches(const CellValue& cell) const {
    if (const auto* eq = std::get_if<Equals>(&predicate)) {
        return filterValueEquals(eq->value, cell);
    }
    for (const auto& accepted : std::get<OneOf>(predicate).values) {
        if (filterValueEquals(accepted, cell)) {
            return true;
        }
    }
    return false;
}

nlohmann::json FilterPredicate::valueJson() const {
    if (const auto* eq = std::get_if<Equals>(&predicate)) {
        return scalarJson(eq->value);
    }
    nlohmann::json values = nlohmann::json::array();
    for (const auto& accepted : std::get<OneOf>(predicate).values) {
        values.push_back(scalarJson(accepted));
    }
    return values;
}

void StrategyConfig::validate() const {
    if (strategy_id.empty()) {
        throw ConfigurationError("Strategy id must not be empty");
    }
    if (!(margin >= 1.0)) {
        throw ConfigurationError(fmt::format("Strategy {}: margin must be >= 1.0 (got {})", strategy_id, margin));
    }
    if (top_n < 1) {
        throw ConfigurationError(fmt::format("Strategy {}: top_n must be positive (got {})", strategy_id, top_n));
    }
    if (!(stake > 0.0)) {
        throw ConfigurationError(fmt::format("Strategy {}: stake must be > 0 (got {})", strategy_id, stake));
    }
}

nlohmann::json StrategyConfig::toParams() const {
    nlohmann::json params;
    params["strategy_id"] = strategy_id;
    params["margin"] = margin;
    params["top_n"] = top_n;
    params["stake"] = stake;
    params["min_model_prob"] = min_model_prob ? nlohmann::json(*min_model_prob) : nlohmann::json(nullptr);
    params["max_win_odds"] = max_win_odds ? nlohmann::json(*max_win_odds) : nlohmann::json(nullptr);

    nlohmann::json filter_json = nlohmann::json::object();
    for (const auto& filter : filters) {
        filter_json[filter.column] = filter.valueJson();
    }
    params["filters"] = filter_json;
    params["version"] = version;
    params["code_hash"] = code_hash;
    return params;
}

std::string StrategyConfig::paramsJson() const {
    // nlohmann::json objects keep keys sorted, so dump() is canonical.
    return toParams().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace strategy
} // namespace edgebook
