#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtest/Simulator.h"
#include "core/contracts/IExperienceWriter.h"
#include "experience/ExperienceRecord.h"
#include "strategy/StrategyConfig.h"

namespace edgebook {
namespace experience {

inline const std::vector<std::string> kDefaultContextFields = {
    columns::TRACK, columns::STATE_CODE, columns::DISTANCE, columns::RACING_TYPE, columns::RACE_TYPE
};

struct EarlyExperienceOutput {
    std::optional<std::filesystem::path> experience_path;   // unset when no bets were placed
    std::vector<ExperienceRecord> experiences;
    std::vector<backtest::StrategyMetrics> strategy_metrics;  // one per strategy, by strategy_id
};

// Runs every strategy through the simulator and records the union of their bets.
class EarlyExperienceRunner {
public:
    // Throws ConfigurationError when `strategies` is empty.
    EarlyExperienceRunner(std::shared_ptr<const backtest::Simulator> simulator,
                          std::vector<strategy::StrategyConfig> strategies,
                          std::shared_ptr<core::IExperienceWriter> writer,
                          std::vector<std::string> context_fields = kDefaultContextFields,
                          int worker_threads = 1);

    EarlyExperienceOutput run(const RunnerTable& runners, const std::string& label = "");

    // Evaluates all strategies; results are ordered by strategy_id whatever the thread count.
    std::vector<backtest::SimulationResult> evaluateAll(const RunnerTable& runners) const;

    std::vector<ExperienceRecord> buildExperiences(const backtest::SimulationResult& result,
                                                   const RunnerTable& runners) const;

    size_t strategyCount() const { return strategies_.size(); }

private:
    std::shared_ptr<const backtest::Simulator> simulator_;
    std::vector<std::shared_ptr<const strategy::StrategyConfig>> strategies_;
    std::shared_ptr<core::IExperienceWriter> writer_;
    std::vector<std::string> context_fields_;
    int worker_threads_ = 1;
};

} // namespace experience
} // namespace edgebook
