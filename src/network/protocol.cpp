#include "network/protocol.hpp"

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::REQUEST_MANIFEST: return "REQUEST_MANIFEST";
        case MessageType::MANIFEST_DATA: return "MANIFEST_DATA";
        case MessageType::REQUEST_CHUNK: return "REQUEST_CHUNK";
        case MessageType::CHUNK_DATA: return "CHUNK_DATA";
        case MessageType::NOT_FOUND: return "NOT_FOUND";
        case MessageType::DHT_PING: return "PING";
        case MessageType::DHT_PONG: return "PONG";
        case MessageType::DHT_FIND_NODE: return "FIND_NODE";
        case MessageType::DHT_FIND_NODE_RESPONSE: return "FIND_NODE_RESPONSE";
        case MessageType::DHT_STORE: return "STORE";
        case MessageType::DHT_STORE_RESPONSE: return "STORE_RESPONSE";
        case MessageType::DHT_FIND_VALUE: return "FIND_VALUE";
        case MessageType::DHT_FIND_VALUE_RESPONSE: return "FIND_VALUE_RESPONSE";
        case MessageType::DHT_ANNOUNCE_PEER: return "ANNOUNCE_PEER";
        case MessageType::DHT_ANNOUNCE_RESPONSE: return "ANNOUNCE_RESPONSE";
        case MessageType::ERROR_UNSPECIFIED: return "ERROR";
    }
    return "UNKNOWN";
}

bool is_dht_message(MessageType type) {
    auto v = static_cast<uint8_t>(type);
    return v >= static_cast<uint8_t>(MessageType::DHT_PING) &&
           v <= static_cast<uint8_t>(MessageType::DHT_ANNOUNCE_RESPONSE);
}

bool is_dht_response(MessageType type) {
    switch (type) {
        case MessageType::DHT_PONG:
        case MessageType::DHT_FIND_NODE_RESPONSE:
        case MessageType::DHT_STORE_RESPONSE:
        case MessageType::DHT_FIND_VALUE_RESPONSE:
        case MessageType::DHT_ANNOUNCE_RESPONSE:
            return true;
        default:
            return false;
    }
}

MessageType expected_response(MessageType request) {
    switch (request) {
        case MessageType::DHT_PING: return MessageType::DHT_PONG;
        case MessageType::DHT_FIND_NODE: return MessageType::DHT_FIND_NODE_RESPONSE;
        case MessageType::DHT_STORE: return MessageType::DHT_STORE_RESPONSE;
        case MessageType::DHT_FIND_VALUE: return MessageType::DHT_FIND_VALUE_RESPONSE;
        case MessageType::DHT_ANNOUNCE_PEER: return MessageType::DHT_ANNOUNCE_RESPONSE;
        default: return MessageType::ERROR_UNSPECIFIED;
    }
}
