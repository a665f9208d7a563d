#include "common/CsvUtils.h"
#include <cctype>

namespace edgebook {
namespace utils {

std::vector<std::string> CsvUtils::splitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            cells.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    cells.push_back(current);
    return cells;
}

bool CsvUtils::readRecord(std::istream& in, std::string& record) {
    record.clear();
    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }
    record = line;
    size_t quotes = 0;
    for (const char c : line) {
        quotes += (c == '"');
    }
    // Doubled quotes keep the count even; an odd count means the cell spans lines.
    while (quotes % 2 == 1 && std::getline(in, line)) {
        record.push_back('\n');
        record += line;
        for (const char c : line) {
            quotes += (c == '"');
        }
    }
    return true;
}

std::string CsvUtils::escapeCell(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string out = "\"";
    for (const char c : cell) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string CsvUtils::joinLine(const std::vector<std::string>& cells) {
    std::string line;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            line.push_back(',');
        }
        line += escapeCell(cells[i]);
    }
    return line;
}

std::string CsvUtils::trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

} // namespace utils
} // namespace edgebook
