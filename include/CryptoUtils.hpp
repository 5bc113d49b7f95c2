#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace prism {

class CryptoUtils {
public:
    /**
     * @brief Cryptographically secure random bytes (OpenSSL RAND_bytes)
     * @throws std::runtime_error if the RNG fails
     */
    static std::vector<uint8_t> random_bytes(size_t count);

    /**
     * @brief Random identifier, 2 * bytes hex characters
     */
    static std::string random_hex(size_t bytes = 16);

    /**
     * @brief SHA-256 hash
     * @param input Data to hash
     * @return Hash as hex string
     */
    static std::string sha256_hex(const std::string& input);

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
};

} // namespace prism
