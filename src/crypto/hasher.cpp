#include "crypto/hasher.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>

namespace Hasher {

namespace {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

void digest(const EVP_MD* md, const uint8_t* data, size_t size, uint8_t* out, unsigned int expected_len) {
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());

    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    if (!EVP_DigestInit_ex(ctx.get(), md, NULL)) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), out, &len) || len != expected_len) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

hash_t sha256(const uint8_t* data, size_t size) {
    hash_t hash;
    digest(EVP_sha256(), data, size, hash.data(), HASH_SIZE);
    return hash;
}

hash_t sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

digest160_t sha1(const uint8_t* data, size_t size) {
    digest160_t out;
    digest(EVP_sha1(), data, size, out.data(), DIGEST160_SIZE);
    return out;
}

digest160_t sha1(const std::string& data) {
    return sha1(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string to_hex(const uint8_t* data, size_t size) {
    std::stringstream ss;
    for (size_t i = 0; i < size; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string hash_to_hex(const hash_t& hash) {
    return to_hex(hash.data(), hash.size());
}

bool is_hex(const std::string& hex, size_t bytes) {
    if (hex.size() != bytes * 2) {
        return false;
    }
    for (char c : hex) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

void hex_to_bytes(const std::string& hex, uint8_t* out, size_t size) {
    if (!is_hex(hex, size)) {
        throw std::invalid_argument("Expected " + std::to_string(size * 2) +
                                    " hex characters, got '" + hex + "'");
    }
    for (size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>((hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]));
    }
}

hash_t hex_to_hash(const std::string& hex_str) {
    hash_t hash;
    hex_to_bytes(hex_str, hash.data(), hash.size());
    return hash;
}

} // namespace Hasher
