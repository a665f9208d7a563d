#include "experience/ExperienceWriter.h"
#include "common/CsvUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

namespace edgebook {
namespace experience {

namespace {
const std::string kColumnarFormat = "edgebook.columnar";
const std::string kColumnarSuffix = ".columnar.json";
const std::string kCsvGzSuffix = ".csv.gz";

const std::vector<std::string> kLeadingColumns = {
    "event_date", "race_id", "runner_id", "selection_id", "strategy_id", "params", "action",
    "stake", "profit", "model_prob", "implied_prob", "edge", "win_odds", "won_flag"
};
const std::vector<std::string> kTrailingColumns = {"context_hash", "experience_id"};

const std::map<std::string, std::string ExperienceRecord::*> kTextFields = {
    {"event_date", &ExperienceRecord::event_date},
    {"race_id", &ExperienceRecord::race_id},
    {"runner_id", &ExperienceRecord::runner_id},
    {"selection_id", &ExperienceRecord::selection_id},
    {"strategy_id", &ExperienceRecord::strategy_id},
    {"params", &ExperienceRecord::params},
    {"action", &ExperienceRecord::action},
    {"context_hash", &ExperienceRecord::context_hash},
    {"experience_id", &ExperienceRecord::experience_id},
};

const std::map<std::string, double ExperienceRecord::*> kNumberFields = {
    {"stake", &ExperienceRecord::stake},
    {"profit", &ExperienceRecord::profit},
    {"model_prob", &ExperienceRecord::model_prob},
    {"implied_prob", &ExperienceRecord::implied_prob},
    {"edge", &ExperienceRecord::edge},
    {"win_odds", &ExperienceRecord::win_odds},
};

const std::string kWonFlag = "won_flag";

nlohmann::json fieldJson(const ExperienceRecord& record, const std::string& column) {
    if (const auto it = kTextFields.find(column); it != kTextFields.end()) {
        return record.*(it->second);
    }
    if (const auto it = kNumberFields.find(column); it != kNumberFields.end()) {
        return record.*(it->second);
    }
    if (column == kWonFlag) {
        return record.won_flag;
    }
    const auto ctx = record.context.find(column);
    if (ctx == record.context.end()) {
        return nullptr;
    }
    return ctx->second;
}

std::string fieldText(const ExperienceRecord& record, const std::string& column) {
    if (const auto it = kTextFields.find(column); it != kTextFields.end()) {
        return record.*(it->second);
    }
    if (const auto it = kNumberFields.find(column); it != kNumberFields.end()) {
        return fmt::format("{}", record.*(it->second));
    }
    if (column == kWonFlag) {
        return std::to_string(record.won_flag);
    }
    const auto ctx = record.context.find(column);
    return ctx == record.context.end() ? std::string() : ctx->second;
}

void assignText(ExperienceRecord& record, const std::string& column, const std::string& text) {
    if (const auto it = kTextFields.find(column); it != kTextFields.end()) {
        record.*(it->second) = text;
        return;
    }
    try {
        if (const auto it = kNumberFields.find(column); it != kNumberFields.end()) {
            record.*(it->second) = text.empty() ? 0.0 : std::stod(text);
            return;
        }
        if (column == kWonFlag) {
            record.won_flag = text.empty() ? 0 : std::stoi(text);
            return;
        }
    } catch (const std::exception&) {
        throw PersistenceError(fmt::format("Invalid numeric value '{}' in column {}", text, column));
    }
    record.context[column] = text;
}

void assignJson(ExperienceRecord& record, const std::string& column, const nlohmann::json& value) {
    if (value.is_null()) {
        return;
    }
    if (value.is_number()) {
        if (const auto it = kNumberFields.find(column); it != kNumberFields.end()) {
            record.*(it->second) = value.get<double>();
            return;
        }
        if (column == kWonFlag) {
            record.won_flag = value.get<int>();
            return;
        }
        assignText(record, column, fmt::format("{}", value.get<double>()));
        return;
    }
    if (value.is_string()) {
        assignText(record, column, value.get<std::string>());
        return;
    }
    throw PersistenceError("Unsupported value in experience column " + column);
}

std::string utcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

std::string compactDate(std::string date) {
    date.erase(std::remove(date.begin(), date.end(), '-'), date.end());
    return date;
}

std::filesystem::path uniquePath(const std::filesystem::path& dir, const std::string& base,
                                 const std::string& suffix) {
    auto candidate = dir / (base + suffix);
    for (int n = 1; std::filesystem::exists(candidate); ++n) {
        candidate = dir / (base + "_" + std::to_string(n) + suffix);
    }
    return candidate;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

std::vector<std::string> experienceColumns(const std::vector<ExperienceRecord>& records) {
    std::set<std::string> context_columns;
    for (const auto& record : records) {
        for (const auto& [field, value] : record.context) {
            context_columns.insert(field);
        }
    }

    std::vector<std::string> columns = kLeadingColumns;
    columns.insert(columns.end(), context_columns.begin(), context_columns.end());
    columns.insert(columns.end(), kTrailingColumns.begin(), kTrailingColumns.end());
    return columns;
}

ExperienceWriter::ExperienceWriter(ExperienceWriterConfig config)
    : config_(std::move(config)) {}

std::string ExperienceWriter::baseName(const std::vector<ExperienceRecord>& records,
                                       const std::string& label) const {
    const std::string timestamp = utcTimestamp();
    const std::string prefix = label.empty() ? config_.filename_prefix : label;

    std::set<std::string> dates;
    if (config_.partition_by_date) {
        for (const auto& record : records) {
            if (!record.event_date.empty()) {
                dates.insert(record.event_date);
            }
        }
    }

    std::string suffix;
    if (dates.empty()) {
        suffix = timestamp;
    } else if (dates.size() == 1) {
        suffix = compactDate(*dates.begin());
    } else {
        suffix = compactDate(*dates.begin()) + "_" + compactDate(*dates.rbegin());
    }
    return prefix + "_" + suffix + "_" + timestamp;
}

std::filesystem::path ExperienceWriter::write(const std::vector<ExperienceRecord>& records,
                                              const std::string& label) {
    std::error_code dir_ec;
    std::filesystem::create_directories(config_.output_dir, dir_ec);
    if (dir_ec) {
        throw PersistenceError(fmt::format("Cannot create experience directory {}: {}",
                                           config_.output_dir.string(), dir_ec.message()));
    }
    const std::string base = baseName(records, label);

    const auto primary = uniquePath(config_.output_dir, base, kColumnarSuffix);
    try {
        writeColumnar(records, primary);
        LOG_INFO("Wrote {} experiences to {}", records.size(), primary.string());
        return primary;
    } catch (const std::exception& e) {
        LOG_WARN("Columnar experience write failed ({}), falling back to {}", e.what(), kCsvGzSuffix);
        std::error_code ec;
        std::filesystem::remove(primary, ec);
    }

    const auto fallback = uniquePath(config_.output_dir, base, kCsvGzSuffix);
    try {
        writeCsvGz(records, fallback);
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(fallback, ec);
        throw PersistenceError(fmt::format("Failed to write experiences to {}: {}", fallback.string(), e.what()));
    }
    LOG_INFO("Wrote {} experiences to {}", records.size(), fallback.string());
    return fallback;
}

void ExperienceWriter::writeColumnar(const std::vector<ExperienceRecord>& records,
                                     const std::filesystem::path& path) {
    const auto columns = experienceColumns(records);

    nlohmann::json doc;
    doc["format"] = kColumnarFormat;
    doc["version"] = 1;
    doc["row_count"] = records.size();
    doc["column_order"] = columns;

    nlohmann::json data = nlohmann::json::object();
    for (const auto& column : columns) {
        nlohmann::json values = nlohmann::json::array();
        for (const auto& record : records) {
            values.push_back(fieldJson(record, column));
        }
        data[column] = std::move(values);
    }
    doc["columns"] = std::move(data);

    // Strict encoding: throws on bytes that are not valid UTF-8.
    const std::string payload = doc.dump();

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistenceError("Cannot open " + path.string());
    }
    out << payload;
    out.flush();
    if (!out) {
        throw PersistenceError("Write failed for " + path.string());
    }
}

void ExperienceWriter::writeCsvGz(const std::vector<ExperienceRecord>& records,
                                  const std::filesystem::path& path) {
    const auto columns = experienceColumns(records);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + path.string());
    }

    {
        boost::iostreams::filtering_ostream out;
        out.push(boost::iostreams::gzip_compressor());
        out.push(file);

        out << utils::CsvUtils::joinLine(columns) << '\n';
        std::vector<std::string> cells(columns.size());
        for (const auto& record : records) {
            for (size_t i = 0; i < columns.size(); ++i) {
                cells[i] = fieldText(record, columns[i]);
            }
            out << utils::CsvUtils::joinLine(cells) << '\n';
        }
        out.reset();
    }

    file.flush();
    if (!file) {
        throw PersistenceError("Write failed for " + path.string());
    }
}

std::vector<ExperienceRecord> ExperienceReader::read(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    if (endsWith(name, kCsvGzSuffix)) {
        return readCsvGz(path);
    }
    if (endsWith(name, ".json")) {
        return readColumnar(path);
    }
    throw PersistenceError("Unsupported experience file format: " + path.string());
}

std::vector<ExperienceRecord> ExperienceReader::readColumnar(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw PersistenceError("Cannot open " + path.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("Corrupt experience file " + path.string() + ": " + e.what());
    }
    if (!doc.is_object() || doc.value("format", std::string()) != kColumnarFormat) {
        throw PersistenceError("Not a columnar experience file: " + path.string());
    }

    if (!doc.contains("columns") || !doc["columns"].is_object()) {
        throw PersistenceError("Columnar experience file has no columns: " + path.string());
    }

    const size_t row_count = doc.value("row_count", static_cast<size_t>(0));
    std::vector<ExperienceRecord> records(row_count);
    const auto& data = doc["columns"];
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!it.value().is_array() || it.value().size() != row_count) {
            throw PersistenceError("Column " + it.key() + " length mismatch in " + path.string());
        }
        for (size_t row = 0; row < row_count; ++row) {
            assignJson(records[row], it.key(), it.value()[row]);
        }
    }
    return records;
}

std::vector<ExperienceRecord> ExperienceReader::readCsvGz(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + path.string());
    }

    std::vector<ExperienceRecord> records;
    try {
        boost::iostreams::filtering_istream in;
        in.push(boost::iostreams::gzip_decompressor());
        in.push(file);

        std::string line;
        std::vector<std::string> header;
        while (utils::CsvUtils::readRecord(in, line)) {
            if (line.empty()) continue;
            const auto cells = utils::CsvUtils::splitLine(line);
            if (header.empty()) {
                header = cells;
                continue;
            }
            if (cells.size() != header.size()) {
                throw PersistenceError("Malformed experience row in " + path.string());
            }
            ExperienceRecord record;
            for (size_t i = 0; i < header.size(); ++i) {
                assignText(record, header[i], cells[i]);
            }
            records.push_back(std::move(record));
        }
        // istream swallows decompressor errors into badbit
        if (in.bad()) {
            throw PersistenceError("Corrupt gzip experience file " + path.string());
        }
    } catch (const boost::iostreams::gzip_error& e) {
        throw PersistenceError("Corrupt gzip experience file " + path.string() + ": " + e.what());
    } catch (const std::ios_base::failure& e) {
        throw PersistenceError("Cannot read experience file " + path.string() + ": " + e.what());
    }
    return records;
}

} // namespace experience
} // namespace edgebook
