#include "CryptoUtils.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>
#include <openssl/sha.h>

namespace prism {

std::vector<uint8_t> CryptoUtils::random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::string CryptoUtils::random_hex(size_t bytes) {
    return bytes_to_hex(random_bytes(bytes));
}

std::string CryptoUtils::sha256_hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.c_str()),
           input.length(), hash);

    return bytes_to_hex(std::vector<uint8_t>(hash, hash + SHA256_DIGEST_LENGTH));
}

std::string CryptoUtils::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        ss << std::setw(2) << static_cast<int>(byte);
    }

    return ss.str();
}

} // namespace prism
