#pragma once

#include <cstddef>
#include <string>

namespace edgebook {
namespace utils {

class Hashing {
public:
    // Lower-case hex SHA-1 of the input bytes.
    static std::string sha1Hex(const std::string& data);

    // First `length` hex characters of sha1Hex(data).
    static std::string sha1Prefix(const std::string& data, std::size_t length);
};

} // namespace utils
} // namespace edgebook
