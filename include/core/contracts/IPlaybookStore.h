#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/ACEReflector.h"

namespace edgebook {
namespace core {

class IPlaybookStore {
public:
    virtual ~IPlaybookStore() = default;

    // Previous snapshots, oldest first. Empty when nothing usable is stored.
    virtual std::vector<nlohmann::json> loadHistory() = 0;
    virtual std::filesystem::path save(const analytics::Playbook& playbook) = 0;
};

} // namespace core
} // namespace edgebook
