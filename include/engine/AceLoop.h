#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "analytics/ACEReflector.h"
#include "core/contracts/IExperienceWriter.h"
#include "core/contracts/IPlaybookStore.h"
#include "engine/RunContext.h"

namespace edgebook {
namespace engine {

struct AceLoopOutput {
    std::optional<std::filesystem::path> experience_path;
    std::filesystem::path playbook_path;
    analytics::Playbook playbook;
};

// Early experience -> reflection -> curation for one runner table.
class AceLoop {
public:
    // Null collaborators are built from the run's EngineConfig.
    explicit AceLoop(std::shared_ptr<core::IExperienceWriter> writer = nullptr,
                     std::shared_ptr<core::IPlaybookStore> store = nullptr);

    AceLoopOutput run(RunContext& context);

private:
    std::shared_ptr<core::IExperienceWriter> writer_;
    std::shared_ptr<core::IPlaybookStore> store_;
};

} // namespace engine
} // namespace edgebook
