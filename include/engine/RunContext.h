#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/StrategyConfig.h"

namespace edgebook {
namespace engine {

// Everything one run works on. Built at run start, dropped at run end.
struct RunContext {
    RunnerTable runners;
    std::vector<strategy::StrategyConfig> strategies;
    EngineConfig config;
    std::string label;
};

} // namespace engine
} // namespace edgebook
