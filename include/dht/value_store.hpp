#ifndef LANSHARE_VALUE_STORE_HPP
#define LANSHARE_VALUE_STORE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "kademlia.hpp"

namespace dht {

using Clock = std::chrono::system_clock;

// A peer that serves the content behind a key over the transfer port.
struct Provider {
    asio::ip::address_v4 address;
    uint16_t transfer_port = 0;
    Clock::time_point announced_at{};

    bool same_peer(const Provider& other) const {
        return address == other.address && transfer_port == other.transfer_port;
    }
};

// A provider record that came back from `responder` but names no address
// another host can reach (unspecified, or loopback from a remote responder)
// is rewritten to the responder's address.
Provider resolve_provider_address(Provider provider, const asio::ip::address_v4& responder);

/**
 * @brief Local key/value state of a DHT node: STOREd blobs and
 * ANNOUNCE_PEER provider records, each with its own TTL.
 */
class ValueStore {
public:
    ValueStore(std::chrono::seconds value_ttl, std::chrono::seconds provider_ttl);

    // `originator` marks values this node published itself.
    void put_value(const NodeID& key, std::vector<uint8_t> data, bool originator = false,
                   Clock::time_point now = Clock::now());
    std::optional<std::vector<uint8_t>> get_value(const NodeID& key, Clock::time_point now = Clock::now()) const;

    // Adds or refreshes a provider; one record per address and port.
    void add_provider(const NodeID& key, const Provider& provider);
    std::vector<Provider> get_providers(const NodeID& key, Clock::time_point now = Clock::now()) const;

    // Drops expired blobs and providers. Returns how many records were removed.
    size_t purge_expired(Clock::time_point now = Clock::now());

    /**
     * @brief Values this node originated whose last publication is older
     * than `interval`. Their publication time is reset.
     */
    std::vector<std::pair<NodeID, std::vector<uint8_t>>> take_due_for_republish(
        std::chrono::seconds interval, Clock::time_point now = Clock::now());

    size_t value_count() const;
    size_t provider_key_count() const;

private:
    struct StoredValue {
        std::vector<uint8_t> data;
        Clock::time_point stored_at;
        bool originator = false;
    };

    std::chrono::seconds value_ttl_;
    std::chrono::seconds provider_ttl_;
    mutable std::mutex mutex_;
    std::map<NodeID, StoredValue> values_;
    std::map<NodeID, std::vector<Provider>> providers_;
};

} // namespace dht

#endif // LANSHARE_VALUE_STORE_HPP
