#include "experience/EarlyExperienceRunner.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <exception>
#include <set>
#include <thread>

namespace edgebook {
namespace experience {

namespace {
// Joins whatever was started, also when spawning a later worker throws.
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() { joinAll(); }

    void joinAll() {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

private:
    std::vector<std::thread>& threads_;
};
}

EarlyExperienceRunner::EarlyExperienceRunner(std::shared_ptr<const backtest::Simulator> simulator,
                                             std::vector<strategy::StrategyConfig> strategies,
                                             std::shared_ptr<core::IExperienceWriter> writer,
                                             std::vector<std::string> context_fields,
                                             int worker_threads)
    : simulator_(std::move(simulator)),
      writer_(std::move(writer)),
      context_fields_(std::move(context_fields)),
      worker_threads_(std::max(1, worker_threads)) {
    if (!simulator_) {
        throw ConfigurationError("EarlyExperienceRunner requires a simulator");
    }
    if (strategies.empty()) {
        throw ConfigurationError("No strategies provided to EarlyExperienceRunner");
    }

    std::set<std::string> seen;
    for (auto& strategy : strategies) {
        strategy.validate();
        if (!seen.insert(strategy.strategy_id).second) {
            throw ConfigurationError("Duplicate strategy id: " + strategy.strategy_id);
        }
        strategies_.push_back(std::make_shared<const strategy::StrategyConfig>(std::move(strategy)));
    }
}

std::vector<backtest::SimulationResult> EarlyExperienceRunner::evaluateAll(const RunnerTable& runners) const {
    std::vector<backtest::SimulationResult> results(strategies_.size());

    const size_t workers = std::min(static_cast<size_t>(worker_threads_), strategies_.size());
    if (workers <= 1) {
        for (size_t i = 0; i < strategies_.size(); ++i) {
            results[i] = simulator_->evaluate(runners, strategies_[i]);
        }
    } else {
        // Each worker owns a strided slice of result slots; the first error wins.
        std::vector<std::exception_ptr> errors(workers);
        std::vector<std::thread> threads;
        threads.reserve(workers);
        ThreadJoiner joiner(threads);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&, w]() {
                try {
                    for (size_t i = w; i < strategies_.size(); i += workers) {
                        results[i] = simulator_->evaluate(runners, strategies_[i]);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
        joiner.joinAll();
        for (const auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    std::sort(results.begin(), results.end(),
              [](const backtest::SimulationResult& a, const backtest::SimulationResult& b) {
                  return a.strategy->strategy_id < b.strategy->strategy_id;
              });
    return results;
}

std::vector<ExperienceRecord> EarlyExperienceRunner::buildExperiences(const backtest::SimulationResult& result,
                                                                      const RunnerTable& runners) const {
    const ExperienceRecordBuilder builder(*result.strategy, context_fields_, runners.columns);
    std::vector<ExperienceRecord> records;
    records.reserve(result.bets.size());
    for (const auto& bet : result.bets) {
        records.push_back(builder.build(bet));
    }
    return records;
}

EarlyExperienceOutput EarlyExperienceRunner::run(const RunnerTable& runners, const std::string& label) {
    const size_t incomplete = backtest::Simulator::countIncompleteRows(runners);
    if (incomplete > 0) {
        LOG_WARN("{} of {} runner rows lack model_prob or win_odds and will not be bet",
                 incomplete, runners.size());
    }

    EarlyExperienceOutput output;
    const auto results = evaluateAll(runners);

    for (const auto& result : results) {
        const auto& m = result.metrics;
        output.strategy_metrics.push_back(m);
        Logger::getInstance().logStrategySummary(m.strategy_id, m.bets, m.wins, m.total_staked, m.total_profit);
        LOG_INFO("Strategy {}: bets={} wins={} pot={:.2f}%", m.strategy_id, m.bets, m.wins, m.pot_pct);

        if (result.bets.empty()) {
            continue;
        }
        auto records = buildExperiences(result, runners);
        output.experiences.insert(output.experiences.end(),
                                  std::make_move_iterator(records.begin()),
                                  std::make_move_iterator(records.end()));
    }

    if (output.experiences.empty()) {
        LOG_INFO("No strategy placed a bet; no experience file written");
        return output;
    }

    if (writer_) {
        output.experience_path = writer_->write(output.experiences, label);
    }
    return output;
}

} // namespace experience
} // namespace edgebook
