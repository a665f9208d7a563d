#include "engine/AceLoop.h"
#include "backtest/RunnerTableLoader.h"
#include "backtest/Simulator.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "core/state/PlaybookCurator.h"
#include "experience/EarlyExperienceRunner.h"
#include "experience/ExperienceWriter.h"

namespace edgebook {
namespace engine {

AceLoop::AceLoop(std::shared_ptr<core::IExperienceWriter> writer,
                 std::shared_ptr<core::IPlaybookStore> store)
    : writer_(std::move(writer)),
      store_(std::move(store)) {}

AceLoopOutput AceLoop::run(RunContext& context) {
    const auto& cfg = context.config;
    if (context.strategies.empty()) {
        throw ConfigurationError("No strategies provided to the ACE loop");
    }

    if (!cfg.start_date.empty() || !cfg.end_date.empty()) {
        context.runners = backtest::RunnerTableLoader::filterDateRange(
            context.runners, cfg.start_date, cfg.end_date, cfg.simulator.race_id_col);
        LOG_INFO("Date window [{}, {}] keeps {} runner rows",
                 cfg.start_date.empty() ? "-" : cfg.start_date,
                 cfg.end_date.empty() ? "-" : cfg.end_date, context.runners.size());
    }
    if (cfg.max_races > 0) {
        context.runners = backtest::RunnerTableLoader::limitRaces(
            context.runners, static_cast<size_t>(cfg.max_races), cfg.simulator.race_id_col);
    }
    LOG_INFO("ACE loop: {} runner rows, {} strategies", context.runners.size(), context.strategies.size());

    auto writer = writer_;
    if (!writer) {
        writer = std::make_shared<experience::ExperienceWriter>(cfg.experience.writer);
    }
    auto store = store_;
    if (!store) {
        store = std::make_shared<core::PlaybookCurator>(cfg.playbook.path, cfg.playbook.max_history);
    }

    auto simulator = std::make_shared<const backtest::Simulator>(cfg.simulator.win_result_col,
                                                                 cfg.simulator.race_id_col);
    experience::EarlyExperienceRunner runner(simulator, context.strategies, writer,
                                             cfg.experience.context_fields,
                                             cfg.experience.worker_threads);
    const auto early = runner.run(context.runners, context.label);
    if (early.experience_path) {
        LOG_INFO("Experiences written to {}", early.experience_path->string());
    }

    analytics::ACEReflector reflector(cfg.reflector);
    AceLoopOutput output;
    output.experience_path = early.experience_path;
    output.playbook = reflector.buildPlaybook(early.experiences, early.strategy_metrics);
    output.playbook_path = store->save(output.playbook);

    const auto& g = output.playbook.global_stats;
    LOG_INFO("Playbook: {} bets, profit {:.2f}, pot {:.2f}%, {} track / {} context insights",
             g.total_bets, g.total_profit, g.pot_pct,
             output.playbook.track_insights.size(), output.playbook.context_insights.size());
    return output;
}

} // namespace engine
} // namespace edgebook
