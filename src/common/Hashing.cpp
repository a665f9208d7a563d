#include "common/Hashing.h"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace edgebook {
namespace utils {

std::string Hashing::sha1Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("SHA-1 digest failed");
    }

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex_stream.str();
}

std::string Hashing::sha1Prefix(const std::string& data, std::size_t length) {
    return sha1Hex(data).substr(0, length);
}

} // namespace utils
} // namespace edgebook
