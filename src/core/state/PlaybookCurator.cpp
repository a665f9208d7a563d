#include "core/state/PlaybookCurator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace edgebook {
namespace core {

namespace {
std::atomic<unsigned long> g_temp_counter{0};
}

PlaybookCurator::PlaybookCurator(std::filesystem::path file_path, size_t max_history)
    : file_path_(std::move(file_path)),
      max_history_(max_history) {
    if (max_history_ == 0) {
        throw ConfigurationError("Playbook max_history must be at least 1");
    }
}

std::vector<nlohmann::json> PlaybookCurator::loadHistory() {
    std::vector<nlohmann::json> history;
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return history;
    }
    if (!std::filesystem::is_regular_file(file_path_, ec)) {
        LOG_WARN("Playbook {} is not a regular file; starting a fresh history", file_path_.string());
        return history;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Cannot open playbook {}; starting a fresh history", file_path_.string());
        return history;
    }

    nlohmann::json raw;
    try {
        in >> raw;
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Playbook {} is unreadable ({}); starting a fresh history", file_path_.string(), e.what());
        return history;
    } catch (const std::ios_base::failure& e) {
        LOG_WARN("Playbook {} could not be read ({}); starting a fresh history", file_path_.string(), e.what());
        return history;
    }

    if (!raw.is_object() || !raw.contains("history") || !raw["history"].is_array()) {
        LOG_WARN("Playbook {} has no history array; starting a fresh history", file_path_.string());
        return history;
    }

    for (const auto& snapshot : raw["history"]) {
        if (snapshot.is_object()) {
            history.push_back(snapshot);
        }
    }
    return history;
}

std::filesystem::path PlaybookCurator::makeTempPath() const {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::string name = ".playbook_" + file_path_.stem().string() + "_" +
                             std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
                             std::to_string(g_temp_counter.fetch_add(1)) + ".tmp";
    return file_path_.parent_path() / name;
}

std::filesystem::path PlaybookCurator::save(const analytics::Playbook& playbook) {
    auto history = loadHistory();
    nlohmann::json snapshot = playbook.toJson();
    history.push_back(snapshot);
    if (history.size() > max_history_) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(max_history_));
    }

    nlohmann::json raw;
    raw["history"] = history;
    raw["latest"] = std::move(snapshot);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            throw PersistenceError("Cannot create playbook directory " +
                                   file_path_.parent_path().string() + ": " + ec.message());
        }
    }

    const auto tmp_path = makeTempPath();
    try {
        {
            std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw PersistenceError("Cannot open temporary playbook file " + tmp_path.string());
            }
            out << raw.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            out.flush();
            if (!out) {
                throw PersistenceError("Failed writing temporary playbook file " + tmp_path.string());
            }
        }

        std::filesystem::rename(tmp_path, file_path_, ec);
        if (ec) {
            throw PersistenceError("Cannot replace playbook " + file_path_.string() + ": " + ec.message());
        }
    } catch (const PersistenceError&) {
        std::error_code remove_ec;
        std::filesystem::remove(tmp_path, remove_ec);
        throw;
    } catch (const std::exception& e) {
        std::error_code remove_ec;
        std::filesystem::remove(tmp_path, remove_ec);
        throw PersistenceError("Failed to save playbook " + file_path_.string() + ": " + e.what());
    }

    LOG_INFO("Playbook saved to {} ({} snapshots)", file_path_.string(), history.size());
    return file_path_;
}

} // namespace core
} // namespace edgebook
