#include "common/serializer.hpp"

#include <cstring>

namespace Serializer {

// --- ByteWriter ---

void ByteWriter::put_u16(uint16_t v) {
    buffer_.push_back(static_cast<uint8_t>(v >> 8));
    buffer_.push_back(static_cast<uint8_t>(v));
}

void ByteWriter::put_u32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void ByteWriter::put_u64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>(v >> shift));
    }
}

void ByteWriter::put_bytes(const uint8_t* data, size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

// --- ByteReader ---

void ByteReader::require(size_t size) const {
    if (size > size_ - offset_) {
        throw SerializationError("Truncated message: need " + std::to_string(size) +
                                 " bytes, have " + std::to_string(size_ - offset_));
    }
}

uint8_t ByteReader::get_u8() {
    require(1);
    return data_[offset_++];
}

uint16_t ByteReader::get_u16() {
    require(2);
    uint16_t v = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
    offset_ += 2;
    return v;
}

uint32_t ByteReader::get_u32() {
    require(4);
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

uint64_t ByteReader::get_u64() {
    require(8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | data_[offset_++];
    }
    return v;
}

void ByteReader::get_bytes(uint8_t* out, size_t size) {
    require(size);
    if (size > 0) {
        std::memcpy(out, data_ + offset_, size);
    }
    offset_ += size;
}

std::vector<uint8_t> ByteReader::get_vector(size_t size) {
    require(size);
    std::vector<uint8_t> out(data_ + offset_, data_ + offset_ + size);
    offset_ += size;
    return out;
}

// --- DHT messages ---

namespace {

void write_contacts(ByteWriter& w, const std::vector<dht::Contact>& contacts) {
    if (contacts.size() > 255) {
        throw SerializationError("Too many contacts in one message");
    }
    w.put_u8(static_cast<uint8_t>(contacts.size()));
    for (const auto& c : contacts) {
        w.put_array(c.id);
        w.put_array(c.address.to_bytes());
        w.put_u16(c.dht_port);
        w.put_u16(c.transfer_port);
    }
}

std::vector<dht::Contact> read_contacts(ByteReader& r) {
    size_t count = r.get_u8();
    std::vector<dht::Contact> contacts;
    contacts.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        dht::Contact c;
        c.id = r.get_array<dht::NODE_ID_SIZE>();
        c.address = asio::ip::address_v4(r.get_array<4>());
        c.dht_port = r.get_u16();
        c.transfer_port = r.get_u16();
        contacts.push_back(c);
    }
    return contacts;
}

void write_providers(ByteWriter& w, const std::vector<dht::Provider>& providers) {
    if (providers.size() > 255) {
        throw SerializationError("Too many providers in one message");
    }
    w.put_u8(static_cast<uint8_t>(providers.size()));
    for (const auto& p : providers) {
        w.put_array(p.address.to_bytes());
        w.put_u16(p.transfer_port);
    }
}

std::vector<dht::Provider> read_providers(ByteReader& r) {
    size_t count = r.get_u8();
    std::vector<dht::Provider> providers;
    providers.reserve(count);
    auto now = dht::Clock::now();
    for (size_t i = 0; i < count; ++i) {
        dht::Provider p;
        p.address = asio::ip::address_v4(r.get_array<4>());
        p.transfer_port = r.get_u16();
        p.announced_at = now;
        providers.push_back(p);
    }
    return providers;
}

void write_value(ByteWriter& w, const std::vector<uint8_t>& value) {
    if (value.size() > MAX_DHT_VALUE_SIZE) {
        throw SerializationError("DHT value exceeds " + std::to_string(MAX_DHT_VALUE_SIZE) + " bytes");
    }
    w.put_u16(static_cast<uint16_t>(value.size()));
    w.put_bytes(value.data(), value.size());
}

std::vector<uint8_t> read_value(ByteReader& r) {
    size_t size = r.get_u16();
    if (size > MAX_DHT_VALUE_SIZE) {
        throw SerializationError("DHT value exceeds " + std::to_string(MAX_DHT_VALUE_SIZE) + " bytes");
    }
    return r.get_vector(size);
}

} // namespace

std::vector<uint8_t> serialize_dht_message(const DhtMessage& message) {
    const auto& h = message.header;
    if (!is_dht_message(h.type)) {
        throw SerializationError(std::string("Not a DHT message type: ") + to_string(h.type));
    }

    ByteWriter w;
    w.put_u8(static_cast<uint8_t>(h.type));
    w.put_u64(h.transaction_id);
    w.put_array(h.sender_id);
    w.put_u16(h.dht_port);
    w.put_u16(h.transfer_port);

    switch (h.type) {
        case MessageType::DHT_PING:
        case MessageType::DHT_PONG:
            break;
        case MessageType::DHT_FIND_NODE:
        case MessageType::DHT_FIND_VALUE:
        case MessageType::DHT_ANNOUNCE_PEER:
            w.put_array(message.target);
            break;
        case MessageType::DHT_STORE:
            w.put_array(message.target);
            write_value(w, message.value);
            break;
        case MessageType::DHT_FIND_NODE_RESPONSE:
            write_contacts(w, message.contacts);
            break;
        case MessageType::DHT_FIND_VALUE_RESPONSE:
            w.put_u8(message.has_value ? 1 : 0);
            if (message.has_value) {
                write_value(w, message.value);
            }
            write_providers(w, message.providers);
            write_contacts(w, message.contacts);
            break;
        case MessageType::DHT_STORE_RESPONSE:
        case MessageType::DHT_ANNOUNCE_RESPONSE:
            w.put_u8(message.ok ? 1 : 0);
            break;
        default:
            break;
    }

    if (w.size() > MAX_DHT_DATAGRAM) {
        throw SerializationError("DHT message too large for one datagram");
    }
    return w.take();
}

DhtMessage deserialize_dht_message(const uint8_t* data, size_t size) {
    if (size > MAX_DHT_DATAGRAM) {
        throw SerializationError("DHT datagram too large");
    }

    ByteReader r(data, size);
    DhtMessage message;
    auto& h = message.header;

    h.type = static_cast<MessageType>(r.get_u8());
    if (!is_dht_message(h.type)) {
        throw SerializationError("Unknown DHT message type " + std::to_string(static_cast<int>(h.type)));
    }
    h.transaction_id = r.get_u64();
    h.sender_id = r.get_array<dht::NODE_ID_SIZE>();
    h.dht_port = r.get_u16();
    h.transfer_port = r.get_u16();

    switch (h.type) {
        case MessageType::DHT_PING:
        case MessageType::DHT_PONG:
            break;
        case MessageType::DHT_FIND_NODE:
        case MessageType::DHT_FIND_VALUE:
        case MessageType::DHT_ANNOUNCE_PEER:
            message.target = r.get_array<dht::NODE_ID_SIZE>();
            break;
        case MessageType::DHT_STORE:
            message.target = r.get_array<dht::NODE_ID_SIZE>();
            message.value = read_value(r);
            break;
        case MessageType::DHT_FIND_NODE_RESPONSE:
            message.contacts = read_contacts(r);
            break;
        case MessageType::DHT_FIND_VALUE_RESPONSE: {
            uint8_t flags = r.get_u8();
            if (flags > 1) {
                throw SerializationError("Invalid FIND_VALUE_RESPONSE flags");
            }
            message.has_value = flags == 1;
            if (message.has_value) {
                message.value = read_value(r);
            }
            message.providers = read_providers(r);
            message.contacts = read_contacts(r);
            break;
        }
        case MessageType::DHT_STORE_RESPONSE:
        case MessageType::DHT_ANNOUNCE_RESPONSE:
            message.ok = r.get_u8() != 0;
            break;
        default:
            break;
    }

    if (r.remaining() != 0) {
        throw SerializationError("Trailing bytes after DHT message");
    }
    return message;
}

std::vector<uint8_t> serialize_hash_payload(const hash_t& hash) {
    return std::vector<uint8_t>(hash.begin(), hash.end());
}

std::optional<hash_t> deserialize_hash_payload(const std::vector<uint8_t>& buffer) {
    if (buffer.size() != HASH_SIZE) {
        return std::nullopt;
    }
    hash_t hash;
    std::memcpy(hash.data(), buffer.data(), HASH_SIZE);
    return hash;
}

} // namespace Serializer
