#ifndef LANSHARE_HASHER_HPP
#define LANSHARE_HASHER_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

// SHA-256 produces a 32-byte hash, used for chunk and file identity.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;

// SHA-1 produces a 20-byte digest, the width of the DHT key space.
constexpr size_t DIGEST160_SIZE = 20;
using digest160_t = std::array<uint8_t, DIGEST160_SIZE>;

namespace Hasher {

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 */
hash_t sha256(const std::vector<uint8_t>& data);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

    hash_t sha256(const uint8_t* data, size_t size);

    // SHA-1, only used to map content hashes and seeds into the DHT key space
    digest160_t sha1(const uint8_t* data, size_t size);
    digest160_t sha1(const std::string& data);

    // Bytes from the OpenSSL CSPRNG; throws std::runtime_error on failure
    std::vector<uint8_t> random_bytes(size_t count);

    // Helpers
    std::string to_hex(const uint8_t* data, size_t size);
    std::string hash_to_hex(const hash_t& hash);

    // True when `hex` has exactly `bytes * 2` hexadecimal characters
    bool is_hex(const std::string& hex, size_t bytes);

    /**
     * @brief Parses 64 hex characters into a hash.
     * @throws std::invalid_argument on wrong length or non-hex characters.
     */
    hash_t hex_to_hash(const std::string& hex);

    // Parses `out.size() * 2` hex characters; throws std::invalid_argument.
    void hex_to_bytes(const std::string& hex, uint8_t* out, size_t size);

} // namespace Hasher

#endif // LANSHARE_HASHER_HPP
