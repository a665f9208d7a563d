#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace edgebook {

// A single runner-table cell. Numeric columns hold double, everything else string.
using CellValue = std::variant<double, std::string>;

std::string cellToString(const CellValue& value);

// Column names of the runner-table data contract.
namespace columns {
inline const std::string RACE_ID = "race_id";
inline const std::string WIN_MARKET_ID = "win_market_id";
inline const std::string RUNNER_ID = "runner_id";
inline const std::string SELECTION_ID = "selection_id";
inline const std::string EVENT_DATE = "event_date";
inline const std::string MODEL_PROB = "model_prob";
inline const std::string WIN_ODDS = "win_odds";
inline const std::string IMPLIED_PROB = "implied_prob";
inline const std::string WIN_RESULT = "win_result";
inline const std::string TRACK = "track";
inline const std::string STATE_CODE = "state_code";
inline const std::string DISTANCE = "distance";
inline const std::string RACING_TYPE = "racing_type";
inline const std::string RACE_TYPE = "race_type";
} // namespace columns

// One horse in one race.
struct RunnerRow {
    std::string race_id;
    std::string win_market_id;
    std::string runner_id;
    std::string selection_id;
    std::string event_date;  // YYYY-MM-DD

    std::optional<double> model_prob;
    std::optional<double> win_odds;
    std::optional<double> implied_prob;
    std::string win_result;

    std::string track;
    std::string state_code;
    std::optional<double> distance;
    std::string racing_type;
    std::string race_type;

    // Columns outside the fixed contract, kept for filtering.
    std::map<std::string, CellValue> extra;

    std::optional<CellValue> cell(const std::string& column) const;
    void setCell(const std::string& column, const std::optional<CellValue>& value);
};

struct RunnerTable {
    std::set<std::string> columns;
    std::vector<RunnerRow> rows;

    bool hasColumn(const std::string& name) const { return columns.count(name) > 0; }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

} // namespace edgebook
