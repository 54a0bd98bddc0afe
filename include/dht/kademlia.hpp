#ifndef LANSHARE_KADEMLIA_HPP
#define LANSHARE_KADEMLIA_HPP

#include <array>
#include <vector>
#include <deque>
#include <string>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <asio/ip/udp.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ip/address_v4.hpp>

#include "../crypto/hasher.hpp" // For hash_t, digest160_t

namespace dht {

constexpr size_t NODE_ID_SIZE = DIGEST160_SIZE; // 160 bits
constexpr size_t ID_BITS = NODE_ID_SIZE * 8;
using NodeID = digest160_t;

// Kademlia constants
constexpr size_t K = 20; // K-bucket size
constexpr size_t ALPHA = 3; // Kademlia concurrency parameter
constexpr int MAX_FAILED_REQUESTS = 2; // Unanswered RPCs before a contact may be replaced

struct Contact {
    NodeID id{};
    asio::ip::address_v4 address;
    uint16_t dht_port = 0;
    uint16_t transfer_port = 0;
    std::chrono::steady_clock::time_point last_seen{};
    int failed_requests = 0;

    asio::ip::udp::endpoint udp_endpoint() const { return {address, dht_port}; }
    asio::ip::tcp::endpoint tcp_endpoint() const { return {address, transfer_port}; }
};

// Helper to calculate XOR distance
NodeID xor_distance(const NodeID& id1, const NodeID& id2);

// Helper to compare distances
bool is_closer(const NodeID& dist1, const NodeID& dist2);

// Number of leading bits shared by two IDs; ID_BITS when equal.
size_t shared_prefix_length(const NodeID& a, const NodeID& b);

// Random ID from the OpenSSL CSPRNG
NodeID generate_random_id();

// SHA-1 of the seed; same seed, same ID
NodeID node_id_from_seed(const std::string& seed);

// DHT key under which providers of a file are announced: SHA-1 of the info hash bytes.
NodeID key_for_info_hash(const hash_t& info_hash);

std::string node_id_to_hex(const NodeID& id);
NodeID hex_to_node_id(const std::string& hex);

/**
 * @brief Returns a random ID whose shared prefix with `self` is exactly
 * `prefix_length` bits, i.e. an ID that falls into that bucket.
 */
NodeID random_id_in_bucket(const NodeID& self, size_t prefix_length);

// Sorts contacts by ascending XOR distance to the target.
void sort_by_distance(std::vector<Contact>& contacts, const NodeID& target);

enum class AddResult {
    Added,      // new contact stored in its bucket
    Updated,    // known contact moved to the most-recently-seen end
    BucketFull, // newcomer cached; the oldest contact should be pinged
    Self        // local ID, ignored
};

struct AddOutcome {
    AddResult result;
    std::optional<Contact> oldest; // set for BucketFull
};

/**
 * @brief One k-bucket. Contacts are ordered least recently seen first.
 * A full bucket keeps newcomers in a bounded replacement cache until a
 * stale contact is removed.
 */
class KBucket {
public:
    explicit KBucket(size_t k = K) : k_(k) {}

    AddOutcome add(const Contact& contact);
    bool remove(const NodeID& id);
    Contact* find(const NodeID& id);
    const Contact* find(const NodeID& id) const;

    bool full() const { return contacts_.size() >= k_; }
    size_t size() const { return contacts_.size(); }
    bool empty() const { return contacts_.empty(); }
    size_t replacement_count() const { return replacements_.size(); }

    const std::list<Contact>& contacts() const { return contacts_; }

private:
    size_t k_;
    std::list<Contact> contacts_;
    std::deque<Contact> replacements_;
};

class RoutingTable {
public:
    explicit RoutingTable(NodeID self_id, size_t k = K);

    const NodeID& self_id() const { return self_id_; }
    size_t k() const { return k_; }

    // Insert or refresh a contact. Resets its failure count.
    AddOutcome add_contact(const Contact& contact);

    /**
     * @brief Records an unanswered RPC. A contact reaching
     * MAX_FAILED_REQUESTS is replaced by the newest cached newcomer; with
     * no replacement cached it stays, excluded from find_closest until it
     * answers again.
     * @return true if the contact was removed.
     */
    bool mark_failed(const NodeID& id);

    // Removes a contact outright and promotes a cached replacement.
    bool remove_contact(const NodeID& id);

    // Find the `count` closest non-failed contacts to a given target ID
    std::vector<Contact> find_closest(const NodeID& target_id, size_t count) const;

    std::optional<Contact> get_contact(const NodeID& id) const;

    // Get all contacts from all k-buckets
    std::vector<Contact> get_all_contacts() const;

    size_t size() const;
    size_t non_empty_buckets() const;

    // Random lookup targets for up to `max_targets` empty buckets.
    std::vector<NodeID> get_refresh_targets(size_t max_targets) const;

    // Bucket index is the shared prefix length: 0 is the farthest bucket.
    size_t bucket_index(const NodeID& other_id) const;

private:
    NodeID self_id_;
    size_t k_;
    mutable std::mutex mutex_;
    std::vector<KBucket> buckets_;
};

} // namespace dht

#endif // LANSHARE_KADEMLIA_HPP
