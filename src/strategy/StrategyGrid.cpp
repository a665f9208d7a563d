#include "strategy/StrategyGrid.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <fmt/format.h>
#include <fstream>
#include <utility>

namespace edgebook {
namespace strategy {

namespace {
template<typename T>
std::vector<T> readAxis(const nlohmann::json& definition, const char* key, std::vector<T> fallback) {
    if (!definition.contains(key)) {
        return fallback;
    }
    const auto& raw = definition.at(key);
    if (!raw.is_array()) {
        throw ConfigurationError(fmt::format("Strategy definition: '{}' must be a list", key));
    }
    try {
        return raw.get<std::vector<T>>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(fmt::format("Strategy definition: invalid '{}' values ({})", key, e.what()));
    }
}

std::vector<std::optional<double>> readOptionalAxis(const nlohmann::json& definition, const char* key) {
    if (!definition.contains(key)) {
        return {std::nullopt};
    }
    const auto& raw = definition.at(key);
    if (!raw.is_array()) {
        throw ConfigurationError(fmt::format("Strategy definition: '{}' must be a list", key));
    }
    std::vector<std::optional<double>> out;
    for (const auto& item : raw) {
        if (item.is_null()) {
            out.emplace_back(std::nullopt);
        } else if (item.is_number()) {
            out.emplace_back(item.get<double>());
        } else {
            throw ConfigurationError(fmt::format("Strategy definition: '{}' entries must be numbers or null", key));
        }
    }
    return out;
}

FilterScalar readFilterScalar(const std::string& column, const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return std::string(value.get<bool>() ? "true" : "false");
    }
    throw ConfigurationError(fmt::format("Strategy definition: unsupported value for filter '{}'", column));
}

// Each filter as its list of accepted values; scalars become one-element lists.
std::vector<std::pair<std::string, std::vector<FilterScalar>>> readFilterAxes(const nlohmann::json& definition) {
    std::vector<std::pair<std::string, std::vector<FilterScalar>>> axes;
    if (!definition.contains("filters")) {
        return axes;
    }
    const auto& filters = definition.at("filters");
    if (!filters.is_object()) {
        LOG_WARN("Strategy definition: 'filters' is not a mapping, ignored");
        return axes;
    }
    for (auto it = filters.begin(); it != filters.end(); ++it) {
        std::vector<FilterScalar> values;
        if (it.value().is_array()) {
            for (const auto& item : it.value()) {
                values.push_back(readFilterScalar(it.key(), item));
            }
        } else {
            values.push_back(readFilterScalar(it.key(), it.value()));
        }
        if (values.empty()) {
            throw ConfigurationError(fmt::format("Strategy definition: filter '{}' has no values", it.key()));
        }
        axes.emplace_back(it.key(), std::move(values));
    }
    return axes;
}
}

std::string StrategyGrid::makeStrategyId(double margin, int top_n, double stake,
                                         const std::optional<double>& min_model_prob,
                                         const std::optional<double>& max_win_odds) {
    std::string id = fmt::format("margin_{:.2f}_top{}_stake{:.2f}", margin, top_n, stake);
    if (min_model_prob) {
        id += fmt::format("_minprob{:.2f}", *min_model_prob);
    }
    if (max_win_odds) {
        id += fmt::format("_maxodds{:.2f}", *max_win_odds);
    }
    return id;
}

std::vector<StrategyConfig> StrategyGrid::build(
    const std::vector<double>& margins,
    const std::vector<int>& top_ns,
    const std::vector<double>& stakes,
    const std::vector<std::optional<double>>& min_model_probs,
    const std::vector<std::optional<double>>& max_win_odds,
    const std::vector<FilterPredicate>& base_filters
) {
    std::vector<StrategyConfig> configs;
    for (const double margin : margins) {
        for (const int top_n : top_ns) {
            for (const double stake : stakes) {
                for (const auto& min_prob : min_model_probs) {
                    for (const auto& max_odds : max_win_odds) {
                        StrategyConfig cfg;
                        cfg.strategy_id = makeStrategyId(margin, top_n, stake, min_prob, max_odds);
                        cfg.margin = margin;
                        cfg.top_n = top_n;
                        cfg.stake = stake;
                        cfg.min_model_prob = min_prob;
                        cfg.max_win_odds = max_odds;
                        cfg.filters = base_filters;
                        cfg.validate();
                        configs.push_back(std::move(cfg));
                    }
                }
            }
        }
    }
    return configs;
}

std::vector<StrategyConfig> StrategyGrid::fromJson(const nlohmann::json& definition) {
    if (!definition.is_object()) {
        throw ConfigurationError("Strategy definition must be a JSON object");
    }

    const auto configs = build(
        readAxis<double>(definition, "margins", {1.05}),
        readAxis<int>(definition, "top_ns", {1}),
        readAxis<double>(definition, "stakes", {1.0}),
        readOptionalAxis(definition, "min_model_probs"),
        readOptionalAxis(definition, "max_win_odds")
    );

    const auto filter_axes = readFilterAxes(definition);
    if (filter_axes.empty()) {
        return configs;
    }

    // Mixed-radix walk over the filter value lists, first key outermost.
    size_t total = 1;
    for (const auto& axis : filter_axes) {
        total *= axis.second.size();
    }

    std::vector<std::vector<FilterPredicate>> combos;
    combos.reserve(total);
    for (size_t index = 0; index < total; ++index) {
        std::vector<FilterPredicate> combo(filter_axes.size());
        size_t rest = index;
        for (size_t i = filter_axes.size(); i-- > 0;) {
            const auto& values = filter_axes[i].second;
            combo[i] = FilterPredicate::equals(filter_axes[i].first, values[rest % values.size()]);
            rest /= values.size();
        }
        combos.push_back(std::move(combo));
    }

    std::vector<StrategyConfig> expanded;
    expanded.reserve(configs.size() * combos.size());
    for (const auto& cfg : configs) {
        for (const auto& combo : combos) {
            StrategyConfig variant = cfg;
            for (const auto& filter : combo) {
                variant.strategy_id += fmt::format("_{}{}", filter.column,
                                                   cellToString(std::get<Equals>(filter.predicate).value));
            }
            variant.filters = combo;
            expanded.push_back(std::move(variant));
        }
    }
    return expanded;
}

std::vector<StrategyConfig> StrategyGrid::fromDefinition(const nlohmann::json& definition) {
    if (definition.is_array()) {
        std::vector<StrategyConfig> configs;
        for (const auto& item : definition) {
            auto part = fromJson(item);
            configs.insert(configs.end(), part.begin(), part.end());
        }
        return configs;
    }
    if (definition.is_object()) {
        return fromJson(definition);
    }
    throw ConfigurationError("Unsupported strategy definition: expected an object or a list of objects");
}

std::vector<StrategyConfig> StrategyGrid::loadDefinitionFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open strategy definition file: " + path);
    }

    nlohmann::json definition;
    try {
        file >> definition;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(fmt::format("Invalid strategy definition file {}: {}", path, e.what()));
    }

    auto configs = fromDefinition(definition);
    LOG_INFO("Loaded {} strategies from {}", configs.size(), path);
    return configs;
}

std::vector<StrategyConfig> StrategyGrid::defaultGrid() {
    return build({1.02, 1.05, 1.08}, {1, 2}, {1.0});
}

} // namespace strategy
} // namespace edgebook
