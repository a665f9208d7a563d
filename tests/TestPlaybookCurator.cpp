#include "common/Errors.h"
#include "core/state/PlaybookCurator.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace edgebook;

namespace {
analytics::Playbook makePlaybook(int rows) {
    analytics::Playbook playbook;
    playbook.metadata.generated_at = "2024-06-01T00:00:00Z";
    playbook.metadata.experience_rows = rows;
    playbook.metadata.evaluation_version = "2.0.0";
    playbook.global_stats.total_bets = rows;
    return playbook;
}

bool hasTempFiles(const std::filesystem::path& dir) {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (name.rfind(".playbook_", 0) == 0) {
            return true;
        }
    }
    return false;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "edgebook_test_playbook";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "playbook.json";

    core::PlaybookCurator curator(path, 3);

    // Missing file is an empty history.
    if (!curator.loadHistory().empty()) {
        std::cerr << "[TEST] missing playbook should load as empty history\n";
        return 1;
    }

    // History never exceeds the cap; oldest snapshots go first.
    for (int run = 1; run <= 5; ++run) {
        const auto saved = curator.save(makePlaybook(run));
        if (saved != path) {
            std::cerr << "[TEST] save should return the destination path\n";
            return 1;
        }
        const auto history = curator.loadHistory();
        const size_t expected = std::min<size_t>(static_cast<size_t>(run), 3);
        if (history.size() != expected) {
            std::cerr << "[TEST] after " << run << " saves history has " << history.size() << " entries\n";
            return 1;
        }
        if (history.back()["metadata"]["experience_rows"] != run) {
            std::cerr << "[TEST] newest snapshot should be last\n";
            return 1;
        }
    }
    {
        const auto history = curator.loadHistory();
        if (history.front()["metadata"]["experience_rows"] != 3) {
            std::cerr << "[TEST] oldest surviving snapshot should be run 3\n";
            return 1;
        }
        std::ifstream in(path);
        nlohmann::json raw;
        in >> raw;
        if (raw["latest"]["metadata"]["experience_rows"] != 5) {
            std::cerr << "[TEST] latest should be the last saved snapshot\n";
            return 1;
        }
    }
    if (hasTempFiles(dir)) {
        std::cerr << "[TEST] temporary files left after successful saves\n";
        return 1;
    }

    // Corrupt or malformed files never raise on load; save starts over.
    {
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << "{\"history\": [\xFF\xFE";
        }
        if (!curator.loadHistory().empty()) {
            std::cerr << "[TEST] corrupt playbook should load as empty history\n";
            return 1;
        }
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            out << "{\"history\": 42}";
        }
        if (!curator.loadHistory().empty()) {
            std::cerr << "[TEST] non-list history should load as empty history\n";
            return 1;
        }
        curator.save(makePlaybook(9));
        if (curator.loadHistory().size() != 1) {
            std::cerr << "[TEST] save over a corrupt file should start a fresh history\n";
            return 1;
        }
    }

    // A failed save leaves the destination untouched and cleans up.
    {
        std::ifstream before_in(path);
        const std::string before((std::istreambuf_iterator<char>(before_in)), std::istreambuf_iterator<char>());

        // Destination occupied by a non-empty directory: rename must fail.
        const auto blocked = dir / "blocked.json";
        std::filesystem::create_directories(blocked / "inner");
        core::PlaybookCurator blocked_curator(blocked, 3);

        // An unreadable destination still loads as an empty history.
        if (!blocked_curator.loadHistory().empty()) {
            std::cerr << "[TEST] directory in place of the playbook should load as empty history\n";
            return 1;
        }

        bool threw = false;
        try {
            blocked_curator.save(makePlaybook(1));
        } catch (const PersistenceError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] save onto a directory should raise PersistenceError\n";
            return 1;
        }
        if (!std::filesystem::is_directory(blocked) || hasTempFiles(dir)) {
            std::cerr << "[TEST] failed save should leave no temp file and keep the destination\n";
            return 1;
        }

        std::ifstream after_in(path);
        const std::string after((std::istreambuf_iterator<char>(after_in)), std::istreambuf_iterator<char>());
        if (before != after) {
            std::cerr << "[TEST] unrelated playbook should be unchanged\n";
            return 1;
        }
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] PlaybookCurator PASSED\n";
    return 0;
}
