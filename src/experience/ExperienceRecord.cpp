#include "experience/ExperienceRecord.h"
#include "common/Errors.h"
#include "common/Hashing.h"
#include <nlohmann/json.hpp>

namespace edgebook {
namespace experience {

namespace {
// Runner ids fall back to race + selection when the table carries no runner_id.
std::string resolveRunnerId(const backtest::BetRow& bet) {
    if (!bet.runner.runner_id.empty()) {
        return bet.runner.runner_id;
    }
    if (!bet.runner.selection_id.empty()) {
        return bet.race_key + "_" + bet.runner.selection_id;
    }
    return std::string();
}
}

std::optional<std::string> ExperienceRecord::contextValue(const std::string& field) const {
    const auto it = context.find(field);
    if (it == context.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> ExperienceRecord::distance() const {
    const auto value = contextValue(columns::DISTANCE);
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string Fingerprint::contextHash(const std::map<std::string, std::string>& context) {
    nlohmann::json payload = nlohmann::json::object();
    for (const auto& [field, value] : context) {
        payload[field] = value;
    }
    // Invalid UTF-8 bytes are replaced so odd track names still hash.
    const std::string encoded = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return utils::Hashing::sha1Prefix(encoded, CONTEXT_HASH_LENGTH);
}

std::string Fingerprint::experienceId(const std::string& strategy_id, const std::string& race_id,
                                      const std::string& runner_id, const std::string& action) {
    const std::string key = strategy_id + "|" + race_id + "|" + runner_id + "|" + action;
    return utils::Hashing::sha1Prefix(key, EXPERIENCE_ID_LENGTH);
}

ExperienceRecordBuilder::ExperienceRecordBuilder(const strategy::StrategyConfig& strategy,
                                                 const std::vector<std::string>& context_fields,
                                                 const std::set<std::string>& table_columns)
    : strategy_id_(strategy.strategy_id), params_json_(strategy.paramsJson()) {
    for (const auto& field : context_fields) {
        if (table_columns.count(field) > 0) {
            present_context_fields_.push_back(field);
        }
    }
}

ExperienceRecord ExperienceRecordBuilder::build(const backtest::BetRow& bet) const {
    ExperienceRecord record;
    record.event_date = bet.runner.event_date;
    record.race_id = bet.race_key;
    record.runner_id = resolveRunnerId(bet);
    record.selection_id = bet.runner.selection_id;
    record.strategy_id = strategy_id_;
    record.params = params_json_;
    record.action = kBetAction;
    record.stake = bet.stake;
    record.profit = bet.profit;
    record.model_prob = bet.runner.model_prob.value_or(0.0);
    record.implied_prob = bet.implied_prob;
    record.edge = bet.edge;
    record.win_odds = bet.runner.win_odds.value_or(0.0);
    record.won_flag = bet.won_flag;

    for (const auto& field : present_context_fields_) {
        const auto value = bet.runner.cell(field);
        record.context[field] = value ? cellToString(*value) : std::string();
    }

    if (record.strategy_id.empty() || record.race_id.empty() || record.runner_id.empty()) {
        throw ConfigurationError("Experience record for strategy '" + strategy_id_ +
                                 "' is missing race or runner identity");
    }

    record.context_hash = Fingerprint::contextHash(record.context);
    record.experience_id = Fingerprint::experienceId(record.strategy_id, record.race_id,
                                                     record.runner_id, record.action);
    return record;
}

} // namespace experience
} // namespace edgebook
