#include "common/Errors.h"
#include "experience/ExperienceWriter.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace edgebook;

namespace {
std::vector<experience::ExperienceRecord> makeRecords(const std::string& track) {
    std::vector<experience::ExperienceRecord> records;
    for (int i = 0; i < 12; ++i) {
        experience::ExperienceRecord r;
        r.event_date = i < 6 ? "2024-06-01" : "2024-06-08";
        r.race_id = "R" + std::to_string(i / 3);
        r.runner_id = r.race_id + "_" + std::to_string(i);
        r.selection_id = std::to_string(i);
        r.strategy_id = "margin_1.05_top1_stake1.00";
        r.params = R"({"margin":1.05,"stake":1.0,"top_n":1})";
        r.stake = 1.0;
        r.won_flag = i % 4 == 0 ? 1 : 0;
        r.win_odds = 4.5;
        r.profit = r.won_flag ? 3.5 : -1.0;
        r.model_prob = 0.3;
        r.implied_prob = 1.0 / 4.5;
        r.edge = 0.75;
        r.context["track"] = track;
        r.context["distance"] = "1400";
        r.context["race_type"] = i % 2 ? "Maiden, Set Weights" : "";
        r.context_hash = experience::Fingerprint::contextHash(r.context);
        r.experience_id = experience::Fingerprint::experienceId(r.strategy_id, r.race_id, r.runner_id, r.action);
        records.push_back(r);
    }
    return records;
}

bool sameRecords(const std::vector<experience::ExperienceRecord>& expected,
                 const std::vector<experience::ExperienceRecord>& actual) {
    if (expected.size() != actual.size()) {
        std::cerr << "[TEST] row count " << actual.size() << " != " << expected.size() << "\n";
        return false;
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (expected[i].experience_id != actual[i].experience_id ||
            expected[i].context_hash != actual[i].context_hash ||
            expected[i].context != actual[i].context ||
            expected[i].won_flag != actual[i].won_flag ||
            expected[i].profit != actual[i].profit ||
            expected[i].params != actual[i].params) {
            std::cerr << "[TEST] row " << i << " differs after round trip\n";
            return false;
        }
    }
    return true;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "edgebook_test_experience_writer";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    experience::ExperienceWriterConfig config;
    config.output_dir = dir;
    experience::ExperienceWriter writer(config);

    // Primary columnar format.
    {
        const auto records = makeRecords("Randwick");
        const auto path = writer.write(records, "");
        const std::string name = path.filename().string();
        if (!endsWith(name, ".columnar.json")) {
            std::cerr << "[TEST] expected columnar output, got " << name << "\n";
            return 1;
        }
        if (name.rfind("experiences_20240601_20240608_", 0) != 0) {
            std::cerr << "[TEST] unexpected file name " << name << "\n";
            return 1;
        }
        if (!sameRecords(records, experience::ExperienceReader::read(path))) {
            return 1;
        }
    }

    // Invalid UTF-8 defeats the columnar encoder; the gzip CSV fallback takes over.
    {
        const auto records = makeRecords("Sandown \xE9");
        const auto path = writer.write(records, "fallback");
        const std::string name = path.filename().string();
        if (!endsWith(name, ".csv.gz") || name.rfind("fallback_", 0) != 0) {
            std::cerr << "[TEST] expected gzip CSV fallback, got " << name << "\n";
            return 1;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            const auto other = entry.path().filename().string();
            if (other.rfind("fallback_", 0) == 0 && endsWith(other, ".columnar.json")) {
                std::cerr << "[TEST] partial columnar file left behind: " << other << "\n";
                return 1;
            }
        }
        if (!sameRecords(records, experience::ExperienceReader::read(path))) {
            return 1;
        }
    }

    // Quoted cells spanning line breaks survive the gzip CSV round trip.
    {
        const auto records = makeRecords("Sandown \xE9\n\"Hillside\"\r\nCourse");
        const auto path = writer.write(records, "multiline");
        if (!endsWith(path.filename().string(), ".csv.gz")) {
            std::cerr << "[TEST] expected gzip CSV fallback for multi-line track\n";
            return 1;
        }
        if (!sameRecords(records, experience::ExperienceReader::read(path))) {
            return 1;
        }
    }

    // Output directory that cannot be created is a persistence error.
    {
        const auto occupied = dir / "occupied";
        {
            std::ofstream out(occupied, std::ios::binary);
            out << "file, not a directory";
        }
        experience::ExperienceWriterConfig blocked_config;
        blocked_config.output_dir = occupied / "experiences";
        experience::ExperienceWriter blocked_writer(blocked_config);
        bool threw = false;
        try {
            blocked_writer.write(makeRecords("Flemington"), "");
        } catch (const PersistenceError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] uncreatable output directory should raise PersistenceError\n";
            return 1;
        }
    }

    // Same label and dates twice in one second still gets distinct files.
    {
        const auto records = makeRecords("Ascot");
        const auto a = writer.write(records, "repeat");
        const auto b = writer.write(records, "repeat");
        if (a == b || !std::filesystem::exists(a) || !std::filesystem::exists(b)) {
            std::cerr << "[TEST] repeated writes should not overwrite each other\n";
            return 1;
        }
    }

    // Unreadable files surface as persistence errors.
    {
        const auto bogus = dir / "bogus.csv.gz";
        {
            std::ofstream out(bogus, std::ios::binary);
            out << "not gzip at all";
        }
        bool threw = false;
        try {
            experience::ExperienceReader::read(bogus);
        } catch (const PersistenceError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "[TEST] corrupt gzip should raise PersistenceError\n";
            return 1;
        }
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] ExperienceWriter PASSED\n";
    return 0;
}
