#pragma once

#include <string>
#include "common/Types.h"

namespace edgebook {
namespace backtest {

class RunnerTableLoader {
public:
    // Header row names the columns; empty cells are nulls.
    static RunnerTable loadCSV(const std::string& file_path);

    // Array of flat records: [{"race_id": "...", "model_prob": 0.2, ...}, ...]
    static RunnerTable loadJSON(const std::string& file_path);

    // Dispatches on the file extension (.json, otherwise CSV).
    static RunnerTable load(const std::string& file_path);

    // Keeps rows of the first `max_races` distinct race ids, in table order.
    static RunnerTable limitRaces(const RunnerTable& table, size_t max_races,
                                  const std::string& race_id_col = columns::RACE_ID);

    // Inclusive YYYY-MM-DD window on event_date; an empty bound is open.
    // Rows without a parseable date are dropped. Result is ordered by date, then race.
    static RunnerTable filterDateRange(const RunnerTable& table,
                                       const std::string& start_date,
                                       const std::string& end_date,
                                       const std::string& race_id_col = columns::RACE_ID);

    static bool isIsoDate(const std::string& text);
};

} // namespace backtest
} // namespace edgebook
