#include "common/Types.h"

#include <fmt/format.h>

namespace edgebook {

namespace {
std::optional<CellValue> fromText(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return CellValue(value);
}

std::optional<CellValue> fromNumber(const std::optional<double>& value) {
    if (!value) {
        return std::nullopt;
    }
    return CellValue(*value);
}

std::optional<double> toNumber(const std::optional<CellValue>& value) {
    if (!value) {
        return std::nullopt;
    }
    if (const double* d = std::get_if<double>(&*value)) {
        return *d;
    }
    const auto& text = std::get<std::string>(*value);
    try {
        size_t used = 0;
        const double parsed = std::stod(text, &used);
        if (used == text.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    return std::nullopt;
}
}

std::string cellToString(const CellValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        return fmt::format("{}", *d);
    }
    return std::get<std::string>(value);
}

std::optional<CellValue> RunnerRow::cell(const std::string& column) const {
    if (column == columns::RACE_ID) return fromText(race_id);
    if (column == columns::WIN_MARKET_ID) return fromText(win_market_id);
    if (column == columns::RUNNER_ID) return fromText(runner_id);
    if (column == columns::SELECTION_ID) return fromText(selection_id);
    if (column == columns::EVENT_DATE) return fromText(event_date);
    if (column == columns::MODEL_PROB) return fromNumber(model_prob);
    if (column == columns::WIN_ODDS) return fromNumber(win_odds);
    if (column == columns::IMPLIED_PROB) return fromNumber(implied_prob);
    if (column == columns::WIN_RESULT) return fromText(win_result);
    if (column == columns::TRACK) return fromText(track);
    if (column == columns::STATE_CODE) return fromText(state_code);
    if (column == columns::DISTANCE) return fromNumber(distance);
    if (column == columns::RACING_TYPE) return fromText(racing_type);
    if (column == columns::RACE_TYPE) return fromText(race_type);

    const auto it = extra.find(column);
    if (it == extra.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RunnerRow::setCell(const std::string& column, const std::optional<CellValue>& value) {
    const std::string text = value ? cellToString(*value) : std::string();

    if (column == columns::RACE_ID) race_id = text;
    else if (column == columns::WIN_MARKET_ID) win_market_id = text;
    else if (column == columns::RUNNER_ID) runner_id = text;
    else if (column == columns::SELECTION_ID) selection_id = text;
    else if (column == columns::EVENT_DATE) event_date = text;
    else if (column == columns::MODEL_PROB) model_prob = toNumber(value);
    else if (column == columns::WIN_ODDS) win_odds = toNumber(value);
    else if (column == columns::IMPLIED_PROB) implied_prob = toNumber(value);
    else if (column == columns::WIN_RESULT) win_result = text;
    else if (column == columns::TRACK) track = text;
    else if (column == columns::STATE_CODE) state_code = text;
    else if (column == columns::DISTANCE) distance = toNumber(value);
    else if (column == columns::RACING_TYPE) racing_type = text;
    else if (column == columns::RACE_TYPE) race_type = text;
    else if (value) extra[column] = *value;
    else extra.erase(column);
}

} // namespace edgebook
