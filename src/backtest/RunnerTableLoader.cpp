#include "backtest/RunnerTableLoader.h"
#include "common/CsvUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

namespace edgebook {
namespace backtest {

namespace {
const std::set<std::string> kTextColumns = {
    columns::RACE_ID, columns::WIN_MARKET_ID, columns::RUNNER_ID, columns::SELECTION_ID,
    columns::EVENT_DATE, columns::WIN_RESULT, columns::TRACK, columns::STATE_CODE,
    columns::RACING_TYPE, columns::RACE_TYPE
};

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

std::string normalizeCell(std::string s) {
    s = utils::CsvUtils::trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }
    return utils::CsvUtils::trim(std::move(s));
}

std::optional<CellValue> textCell(const std::string& column, const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (kTextColumns.count(column) > 0) {
        return CellValue(text);
    }
    if (const auto number = parseNumber(text)) {
        return CellValue(*number);
    }
    return CellValue(text);
}

std::optional<CellValue> jsonCell(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_number()) {
        return CellValue(value.get<double>());
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return CellValue(text);
    }
    if (value.is_boolean()) {
        return CellValue(std::string(value.get<bool>() ? "true" : "false"));
    }
    return CellValue(value.dump());
}
}

RunnerTable RunnerTableLoader::loadCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open runner CSV file: " + file_path);
    }

    RunnerTable table;
    std::vector<std::string> header;
    std::string line;
    size_t line_no = 0;

    while (utils::CsvUtils::readRecord(file, line)) {
        ++line_no;
        if (utils::CsvUtils::trim(line).empty()) continue;

        auto cells = utils::CsvUtils::splitLine(line);
        for (auto& cell : cells) {
            cell = normalizeCell(std::move(cell));
        }

        if (header.empty()) {
            header = cells;
            table.columns.insert(header.begin(), header.end());
            continue;
        }

        if (cells.size() != header.size()) {
            LOG_WARN("Skipping runner row {} in {}: expected {} cells, got {}",
                     line_no, file_path, header.size(), cells.size());
            continue;
        }

        RunnerRow row;
        for (size_t i = 0; i < header.size(); ++i) {
            row.setCell(header[i], textCell(header[i], cells[i]));
        }
        table.rows.push_back(std::move(row));
    }

    LOG_INFO("Loaded {} runners from {}", table.rows.size(), file_path);
    return table;
}

RunnerTable RunnerTableLoader::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open runner JSON file: " + file_path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Error parsing runner JSON file: " + file_path + " - " + e.what());
    }
    if (!j.is_array()) {
        throw ConfigurationError("Runner JSON file must hold an array of records: " + file_path);
    }

    RunnerTable table;
    for (const auto& item : j) {
        if (!item.is_object()) {
            LOG_WARN("Skipping non-object runner record in {}", file_path);
            continue;
        }
        RunnerRow row;
        for (auto it = item.begin(); it != item.end(); ++it) {
            table.columns.insert(it.key());
            row.setCell(it.key(), jsonCell(it.value()));
        }
        table.rows.push_back(std::move(row));
    }

    LOG_INFO("Loaded {} runners from {}", table.rows.size(), file_path);
    return table;
}

RunnerTable RunnerTableLoader::load(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

RunnerTable RunnerTableLoader::limitRaces(const RunnerTable& table, size_t max_races,
                                          const std::string& race_id_col) {
    RunnerTable out;
    out.columns = table.columns;

    std::set<std::string> kept;
    for (const auto& row : table.rows) {
        const auto race = row.cell(race_id_col);
        const std::string key = race ? cellToString(*race) : std::string();
        if (kept.count(key) == 0) {
            if (kept.size() >= max_races) {
                continue;
            }
            kept.insert(key);
        }
        out.rows.push_back(row);
    }
    return out;
}

bool RunnerTableLoader::isIsoDate(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    const int month = std::stoi(text.substr(5, 2));
    const int day = std::stoi(text.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

RunnerTable RunnerTableLoader::filterDateRange(const RunnerTable& table,
                                               const std::string& start_date,
                                               const std::string& end_date,
                                               const std::string& race_id_col) {
    if (!start_date.empty() && !isIsoDate(start_date)) {
        throw ConfigurationError("Invalid start date (expected YYYY-MM-DD): " + start_date);
    }
    if (!end_date.empty() && !isIsoDate(end_date)) {
        throw ConfigurationError("Invalid end date (expected YYYY-MM-DD): " + end_date);
    }
    if (!start_date.empty() && !end_date.empty() && start_date > end_date) {
        throw ConfigurationError("Start date " + start_date + " is after end date " + end_date);
    }

    RunnerTable out;
    out.columns = table.columns;
    size_t undated = 0;
    for (const auto& row : table.rows) {
        // Timestamps such as 2024-06-01T12:30:00 compare on their date part.
        const std::string date = row.event_date.substr(0, 10);
        if (!isIsoDate(date)) {
            ++undated;
            continue;
        }
        if (!start_date.empty() && date < start_date) continue;
        if (!end_date.empty() && date > end_date) continue;
        out.rows.push_back(row);
    }
    if (undated > 0) {
        LOG_WARN("Dropped {} runner rows without a usable event_date", undated);
    }

    std::stable_sort(out.rows.begin(), out.rows.end(), [&](const RunnerRow& a, const RunnerRow& b) {
        const std::string da = a.event_date.substr(0, 10);
        const std::string db = b.event_date.substr(0, 10);
        if (da != db) {
            return da < db;
        }
        const auto ra = a.cell(race_id_col);
        const auto rb = b.cell(race_id_col);
        return (ra ? cellToString(*ra) : std::string()) < (rb ? cellToString(*rb) : std::string());
    });
    return out;
}

} // namespace backtest
} // namespace edgebook
