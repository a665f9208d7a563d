#pragma once

#include <istream>
#include <string>
#include <vector>

namespace edgebook {
namespace utils {

class CsvUtils {
public:
    // Splits one CSV record. Quoted cells may contain commas and doubled quotes.
    static std::vector<std::string> splitLine(const std::string& line);

    // Reads one record, joining physical lines while a quoted cell is still open.
    static bool readRecord(std::istream& in, std::string& record);

    // Quotes a cell when it contains a delimiter, quote or line break.
    static std::string escapeCell(const std::string& cell);

    static std::string joinLine(const std::vector<std::string>& cells);

    static std::string trim(std::string s);
};

} // namespace utils
} // namespace edgebook
