#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "core/contracts/IPlaybookStore.h"

namespace edgebook {
namespace core {

// Rolling playbook history persisted as {"history": [...], "latest": {...}}.
class PlaybookCurator : public IPlaybookStore {
public:
    explicit PlaybookCurator(std::filesystem::path file_path, size_t max_history = 10);

    std::vector<nlohmann::json> loadHistory() override;
    std::filesystem::path save(const analytics::Playbook& playbook) override;

    const std::filesystem::path& path() const { return file_path_; }
    size_t maxHistory() const { return max_history_; }

private:
    std::filesystem::path makeTempPath() const;

    std::filesystem::path file_path_;
    size_t max_history_;
};

} // namespace core
} // namespace edgebook
