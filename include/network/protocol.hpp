#ifndef LANSHARE_PROTOCOL_HPP
#define LANSHARE_PROTOCOL_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include "crypto/hasher.hpp"
#include "dht/kademlia.hpp" // Include for dht::NodeID, dht::Contact
#include "dht/value_store.hpp" // Include for dht::Provider

// Protocol version
constexpr uint16_t PROTOCOL_VERSION = 1;

// Message framing: [len (uint32)][msg_type (uint8)][payload...]
constexpr size_t HEADER_SIZE = sizeof(uint32_t) + sizeof(uint8_t);

// Largest TCP payload accepted; a full chunk plus headroom.
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

// DHT datagram header: [type u8][txn u64][sender_id 20][dht_port u16][transfer_port u16]
constexpr size_t DHT_HEADER_SIZE = 1 + 8 + dht::NODE_ID_SIZE + 2 + 2;

// Encoded contact: [id 20][ipv4 4][dht_port u16][transfer_port u16]
constexpr size_t CONTACT_WIRE_SIZE = dht::NODE_ID_SIZE + 4 + 2 + 2;

// Encoded provider: [ipv4 4][transfer_port u16]
constexpr size_t PROVIDER_WIRE_SIZE = 4 + 2;

// Opaque DHT values are capped to keep responses inside one datagram.
constexpr size_t MAX_DHT_VALUE_SIZE = 8192;
constexpr size_t MAX_DHT_DATAGRAM = 65507;

enum class MessageType : uint8_t {
    // TCP transfer messages
    REQUEST_MANIFEST = 1,
    MANIFEST_DATA = 2,
    REQUEST_CHUNK = 3,
    CHUNK_DATA = 4,
    NOT_FOUND = 5,

    // DHT (UDP) messages
    DHT_PING = 10,
    DHT_PONG = 11,
    DHT_FIND_NODE = 12,
    DHT_FIND_NODE_RESPONSE = 13,
    DHT_STORE = 14,
    DHT_STORE_RESPONSE = 15,
    DHT_FIND_VALUE = 16,
    DHT_FIND_VALUE_RESPONSE = 17,
    DHT_ANNOUNCE_PEER = 18,
    DHT_ANNOUNCE_RESPONSE = 19,

    ERROR_UNSPECIFIED = 255
};

const char* to_string(MessageType type);

bool is_dht_message(MessageType type);
bool is_dht_response(MessageType type);

// The response type a DHT request expects.
MessageType expected_response(MessageType request);

struct DhtHeader {
    MessageType type = MessageType::DHT_PING;
    uint64_t transaction_id = 0;
    dht::NodeID sender_id{};
    uint16_t dht_port = 0;
    uint16_t transfer_port = 0;
};

/**
 * @brief A decoded DHT datagram. Which body fields are meaningful depends on
 * header.type:
 *  - FIND_NODE, FIND_VALUE, STORE, ANNOUNCE_PEER: target is the lookup key
 *  - STORE, FIND_VALUE_RESPONSE: value (has_value for the response)
 *  - FIND_NODE_RESPONSE, FIND_VALUE_RESPONSE: contacts
 *  - FIND_VALUE_RESPONSE: providers
 *  - STORE_RESPONSE, ANNOUNCE_RESPONSE: ok
 * An ANNOUNCE_PEER advertises header.transfer_port.
 */
struct DhtMessage {
    DhtHeader header;
    dht::NodeID target{};
    bool has_value = false;
    std::vector<uint8_t> value;
    std::vector<dht::Contact> contacts;
    std::vector<dht::Provider> providers;
    bool ok = false;
};

// Transfer peer address, as handed from the DHT to the swarm.
struct PeerAddress {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const PeerAddress& other) const { return host == other.host && port == other.port; }
    bool operator!=(const PeerAddress& other) const { return !(*this == other); }
    bool operator<(const PeerAddress& other) const {
        return host < other.host || (host == other.host && port < other.port);
    }
};

#endif // LANSHARE_PROTOCOL_HPP
