#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "backtest/Simulator.h"
#include "strategy/StrategyConfig.h"

namespace edgebook {
namespace experience {

inline const std::string kBetAction = "bet";

// One accepted bet of one strategy. Immutable once built.
struct ExperienceRecord {
    std::string event_date;
    std::string race_id;
    std::string runner_id;
    std::string selection_id;
    std::string strategy_id;
    std::string params;         // StrategyConfig::paramsJson()
    std::string action = kBetAction;
    double stake = 0.0;
    double profit = 0.0;
    double model_prob = 0.0;
    double implied_prob = 0.0;
    double edge = 0.0;
    double win_odds = 0.0;
    int won_flag = 0;

    // Configured context fields present in the runner table, as strings.
    std::map<std::string, std::string> context;

    std::string context_hash;
    std::string experience_id;

    std::optional<std::string> contextValue(const std::string& field) const;
    std::optional<double> distance() const;
};

class Fingerprint {
public:
    static constexpr size_t CONTEXT_HASH_LENGTH = 16;
    static constexpr size_t EXPERIENCE_ID_LENGTH = 20;

    // Digest of the canonical (sorted-key, compact) JSON encoding of the map.
    static std::string contextHash(const std::map<std::string, std::string>& context);

    // Digest of "strategy_id|race_id|runner_id|action".
    static std::string experienceId(const std::string& strategy_id, const std::string& race_id,
                                    const std::string& runner_id, const std::string& action);
};

// Builds one complete record per settled bet; throws ConfigurationError when a
// record would miss an identity field.
class ExperienceRecordBuilder {
public:
    ExperienceRecordBuilder(const strategy::StrategyConfig& strategy,
                            const std::vector<std::string>& context_fields,
                            const std::set<std::string>& table_columns);

    ExperienceRecord build(const backtest::BetRow& bet) const;

private:
    std::string strategy_id_;
    std::string params_json_;
    std::vector<std::string> present_context_fields_;
};

} // namespace experience
} // namespace edgebook
