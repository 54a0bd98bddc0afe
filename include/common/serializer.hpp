#ifndef LANSHARE_SERIALIZER_HPP
#define LANSHARE_SERIALIZER_HPP

#include "../network/protocol.hpp" // For DhtMessage
#include "errors.hpp"
#include <vector>
#include <optional>

namespace Serializer {

// Appends big-endian fields to a byte buffer.
class ByteWriter {
public:
    void put_u8(uint8_t v) { buffer_.push_back(v); }
    void put_u16(uint16_t v);
    void put_u32(uint32_t v);
    void put_u64(uint64_t v);
    void put_bytes(const uint8_t* data, size_t size);

    template<size_t N>
    void put_array(const std::array<uint8_t, N>& a) { put_bytes(a.data(), N); }

    std::vector<uint8_t> take() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

// Reads big-endian fields; every read throws SerializationError on truncation.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    uint8_t get_u8();
    uint16_t get_u16();
    uint32_t get_u32();
    uint64_t get_u64();
    void get_bytes(uint8_t* out, size_t size);
    std::vector<uint8_t> get_vector(size_t size);

    template<size_t N>
    std::array<uint8_t, N> get_array() {
        std::array<uint8_t, N> a;
        get_bytes(a.data(), N);
        return a;
    }

    size_t remaining() const { return size_ - offset_; }

private:
    void require(size_t size) const;

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

/**
 * @brief Encodes a DHT message into a datagram.
 * @throws SerializationError if the value or contact list does not fit.
 */
std::vector<uint8_t> serialize_dht_message(const DhtMessage& message);

/**
 * @brief Decodes a datagram into a DHT message.
 * @throws SerializationError on truncated, oversized or unknown input.
 */
DhtMessage deserialize_dht_message(const uint8_t* data, size_t size);

/**
 * @brief Serializes a hash as the payload of REQUEST_MANIFEST / REQUEST_CHUNK.
 */
std::vector<uint8_t> serialize_hash_payload(const hash_t& hash);

/**
 * @brief Deserializes a REQUEST_MANIFEST / REQUEST_CHUNK payload.
 * @return The hash, or nullopt if the payload is not exactly one hash.
 */
std::optional<hash_t> deserialize_hash_payload(const std::vector<uint8_t>& buffer);

} // namespace Serializer

#endif // LANSHARE_SERIALIZER_HPP
