#ifndef LANSHARE_DHT_NODE_HPP
#define LANSHARE_DHT_NODE_HPP

#include <asio.hpp>
#include "kademlia.hpp"
#include "value_store.hpp"
#include "rpc_manager.hpp"
#include <atomic>
#include <map>
#include <set>
#include <functional>
#include <optional>

#include "network/protocol.hpp"

namespace dht {

struct DhtOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 0;
    uint16_t transfer_port = 0;
    asio::ip::address_v4 advertise_address = asio::ip::address_v4::any();
    size_t k = K;
    size_t alpha = ALPHA;
    std::chrono::milliseconds rpc_timeout{2000};
    unsigned rpc_retries = 1;
    size_t lookup_max_rounds = 8;
    std::chrono::seconds value_ttl{3600};
    std::chrono::seconds provider_ttl{1800};
    std::chrono::seconds republish_interval{3600};
    std::chrono::seconds announce_interval{900};
    std::chrono::seconds refresh_interval{60};
};

struct FindValueResult {
    std::optional<std::vector<uint8_t>> value;
    std::vector<Provider> providers;
    std::vector<Contact> closest;
};

/**
 * @brief Kademlia node over UDP.
 *
 * Every handler runs on one strand, so the io_context may be run by several
 * threads. Public operations may be called from any thread; their callbacks
 * run on the node's strand.
 */
class DhtNode {
public:
    using ContactsCallback = std::function<void(std::vector<Contact>)>;
    using FindValueCallback = std::function<void(FindValueResult)>;
    using CountCallback = std::function<void(size_t)>;

    DhtNode(asio::io_context& io_context, const NodeID& self_id, DhtOptions options);
    ~DhtNode();

    void start();
    void stop();

    const NodeID& get_self_id() const { return self_id_; }
    uint16_t local_port() const { return local_port_; }

    /**
     * @brief Joins the network through known endpoints.
     *
     * Pings every seed; if any answered, looks up the local ID and refreshes
     * empty buckets. The callback receives the number of seeds that answered.
     */
    void bootstrap(std::vector<asio::ip::udp::endpoint> seeds, CountCallback on_complete);

    // Pings an endpoint whose ID is unknown; the callback gets the responder.
    void ping(const asio::ip::udp::endpoint& endpoint, std::function<void(std::optional<Contact>)> callback);

    // Iterative FIND_NODE: up to k live contacts sorted by distance to target.
    void find_node(const NodeID& target, ContactsCallback callback);

    // Iterative FIND_VALUE, ending early at the first holder of the key.
    void find_value(const NodeID& key, FindValueCallback callback);

    // Stores locally and on the k closest nodes; callback gets the ack count.
    void store(const NodeID& key, std::vector<uint8_t> value, CountCallback callback);

    // Registers this node as provider of `key` on the k closest nodes.
    void announce(const NodeID& key, CountCallback callback);

    // find_value reduced to the provider list.
    void find_providers(const NodeID& key, std::function<void(std::vector<Provider>)> callback);

    // Periodic work: expiry purge, bucket refresh, republish. Normally timer driven.
    void run_maintenance();

    // Called for each contact newly added to the routing table.
    void set_contact_observer(std::function<void(const Contact&)> observer) {
        contact_observer_ = std::move(observer);
    }

    const RoutingTable& routing_table() const { return routing_table_; }
    const ValueStore& value_store() const { return value_store_; }
    asio::io_context& get_io_context() { return io_context_; }

private:
    struct LookupState;

    void read_message();
    void handle_message(const uint8_t* data, size_t size, const asio::ip::udp::endpoint& sender);
    void learn_contact(const Contact& contact);

    // Request handlers
    void handle_ping(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);
    void handle_find_node(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);
    void handle_store(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);
    void handle_find_value(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);
    void handle_announce_peer(const DhtMessage& msg, const asio::ip::udp::endpoint& sender);

    DhtMessage make_message(MessageType type, uint64_t transaction_id = 0) const;
    void send_datagram(const asio::ip::udp::endpoint& to, std::shared_ptr<std::vector<uint8_t>> datagram);
    void send_response(const asio::ip::udp::endpoint& to, const DhtMessage& response);
    void send_rpc(const Contact& to, DhtMessage request, RpcManager::ResponseHandler handler);

    // Kademlia lookup
    void start_lookup(const NodeID& target, bool find_value, std::function<void(LookupState&)> on_done);
    void start_round(const std::shared_ptr<LookupState>& lookup);
    void on_lookup_response(const std::shared_ptr<LookupState>& lookup, const Contact& queried,
                            const std::optional<DhtMessage>& response);
    void finish_lookup(const std::shared_ptr<LookupState>& lookup);

    void send_to_closest(const NodeID& key, DhtMessage request, CountCallback callback);

    void schedule_maintenance();

    asio::io_context& io_context_;
    RpcManager::Strand strand_;
    asio::ip::udp::socket socket_;
    NodeID self_id_;
    DhtOptions options_;
    uint16_t local_port_ = 0;
    RoutingTable routing_table_;
    ValueStore value_store_;
    RpcManager rpc_;
    std::vector<uint8_t> read_buffer_;
    asio::ip::udp::endpoint remote_endpoint_;
    asio::steady_timer maintenance_timer_;
    std::atomic<bool> running_{false};

    std::set<NodeID> pinging_;                  // oldest contacts under eviction check
    std::map<NodeID, Clock::time_point> announced_keys_;
    std::function<void(const Contact&)> contact_observer_;
};

} // namespace dht

#endif // LANSHARE_DHT_NODE_HPP
