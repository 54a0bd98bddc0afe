#include "dht/kademlia.hpp"
#include <algorithm>
#include <vector>
#include <iterator>

namespace dht {

// Helper to calculate XOR distance
NodeID xor_distance(const NodeID& id1, const NodeID& id2) {
    NodeID distance;
    for (size_t i = 0; i < NODE_ID_SIZE; ++i) {
        distance[i] = id1[i] ^ id2[i];
    }
    return distance;
}

// Helper to compare distances
bool is_closer(const NodeID& dist1, const NodeID& dist2) {
    return std::lexicographical_compare(dist1.begin(), dist1.end(), dist2.begin(), dist2.end());
}

size_t shared_prefix_length(const NodeID& a, const NodeID& b) {
    for (size_t byte = 0; byte < NODE_ID_SIZE; ++byte) {
        uint8_t diff = a[byte] ^ b[byte];
        if (diff != 0) {
            size_t bit = 0;
            while ((diff & 0x80) == 0) {
                diff <<= 1;
                ++bit;
            }
            return byte * 8 + bit;
        }
    }
    return ID_BITS;
}

NodeID generate_random_id() {
    NodeID id;
    auto bytes = Hasher::random_bytes(NODE_ID_SIZE);
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return id;
}

NodeID node_id_from_seed(const std::string& seed) {
    return Hasher::sha1(seed);
}

NodeID key_for_info_hash(const hash_t& info_hash) {
    return Hasher::sha1(info_hash.data(), info_hash.size());
}

std::string node_id_to_hex(const NodeID& id) {
    return Hasher::to_hex(id.data(), id.size());
}

NodeID hex_to_node_id(const std::string& hex) {
    NodeID id;
    Hasher::hex_to_bytes(hex, id.data(), id.size());
    return id;
}

NodeID random_id_in_bucket(const NodeID& self, size_t prefix_length) {
    NodeID id = generate_random_id();
    if (prefix_length >= ID_BITS) {
        return self;
    }
    // Copy the shared prefix, flip the next bit, keep the random tail.
    for (size_t bit = 0; bit <= prefix_length; ++bit) {
        size_t byte_index = bit / 8;
        uint8_t mask = static_cast<uint8_t>(0x80 >> (bit % 8));
        bool self_bit = (self[byte_index] & mask) != 0;
        bool want = (bit == prefix_length) ? !self_bit : self_bit;
        if (want) {
            id[byte_index] |= mask;
        } else {
            id[byte_index] &= static_cast<uint8_t>(~mask);
        }
    }
    return id;
}

void sort_by_distance(std::vector<Contact>& contacts, const NodeID& target) {
    std::sort(contacts.begin(), contacts.end(),
        [&target](const Contact& a, const Contact& b) {
            return is_closer(xor_distance(a.id, target), xor_distance(b.id, target));
        });
}

// --- KBucket ---

AddOutcome KBucket::add(const Contact& contact) {
    for (auto it = contacts_.begin(); it != contacts_.end(); ++it) {
        if (it->id == contact.id) {
            // Move to the most recently seen end, keeping the newest details.
            *it = contact;
            it->failed_requests = 0;
            contacts_.splice(contacts_.end(), contacts_, it);
            return {AddResult::Updated, std::nullopt};
        }
    }

    if (!full()) {
        contacts_.push_back(contact);
        contacts_.back().failed_requests = 0;
        return {AddResult::Added, std::nullopt};
    }

    auto cached = std::find_if(replacements_.begin(), replacements_.end(),
                               [&contact](const Contact& c) { return c.id == contact.id; });
    if (cached != replacements_.end()) {
        replacements_.erase(cached);
    }
    replacements_.push_back(contact);
    while (replacements_.size() > k_) {
        replacements_.pop_front();
    }

    return {AddResult::BucketFull, contacts_.front()};
}

bool KBucket::remove(const NodeID& id) {
    auto it = std::find_if(contacts_.begin(), contacts_.end(),
                           [&id](const Contact& c) { return c.id == id; });
    if (it == contacts_.end()) {
        return false;
    }
    contacts_.erase(it);

    if (!replacements_.empty()) {
        contacts_.push_back(replacements_.back());
        contacts_.back().failed_requests = 0;
        replacements_.pop_back();
    }
    return true;
}

Contact* KBucket::find(const NodeID& id) {
    for (auto& c : contacts_) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const Contact* KBucket::find(const NodeID& id) const {
    for (const auto& c : contacts_) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

// --- RoutingTable ---

RoutingTable::RoutingTable(NodeID self_id, size_t k)
    : self_id_(self_id), k_(k), buckets_(ID_BITS, KBucket(k)) {}

size_t RoutingTable::bucket_index(const NodeID& other_id) const {
    return shared_prefix_length(self_id_, other_id);
}

AddOutcome RoutingTable::add_contact(const Contact& contact) {
    if (contact.id == self_id_) {
        return {AddResult::Self, std::nullopt};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_[bucket_index(contact.id)].add(contact);
}

bool RoutingTable::mark_failed(const NodeID& id) {
    if (id == self_id_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[bucket_index(id)];
    Contact* contact = bucket.find(id);
    if (!contact) {
        return false;
    }
    // Without a cached newcomer to take the slot, a stale contact stays.
    if (++contact->failed_requests >= MAX_FAILED_REQUESTS && bucket.replacement_count() > 0) {
        return bucket.remove(id);
    }
    return false;
}

bool RoutingTable::remove_contact(const NodeID& id) {
    if (id == self_id_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_[bucket_index(id)].remove(id);
}

std::vector<Contact> RoutingTable::find_closest(const NodeID& target_id, size_t count) const {
    std::vector<Contact> all_contacts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& bucket : buckets_) {
            for (const auto& c : bucket.contacts()) {
                if (c.failed_requests == 0) {
                    all_contacts.push_back(c);
                }
            }
        }
    }

    sort_by_distance(all_contacts, target_id);

    if (all_contacts.size() > count) {
        all_contacts.resize(count);
    }
    return all_contacts;
}

std::optional<Contact> RoutingTable::get_contact(const NodeID& id) const {
    if (id == self_id_) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    const Contact* c = buckets_[bucket_index(id)].find(id);
    if (!c) return std::nullopt;
    return *c;
}

std::vector<Contact> RoutingTable::get_all_contacts() const {
    std::vector<Contact> all_contacts;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& bucket : buckets_) {
        all_contacts.insert(all_contacts.end(), bucket.contacts().begin(), bucket.contacts().end());
    }
    return all_contacts;
}

size_t RoutingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& bucket : buckets_) {
        total += bucket.size();
    }
    return total;
}

size_t RoutingTable::non_empty_buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(buckets_.begin(), buckets_.end(),
                                             [](const KBucket& b) { return !b.empty(); }));
}

std::vector<NodeID> RoutingTable::get_refresh_targets(size_t max_targets) const {
    std::vector<size_t> empty_indices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Refresh stops one bucket past the deepest populated one.
        size_t deepest = 0;
        for (size_t i = 0; i < buckets_.size(); ++i) {
            if (!buckets_[i].empty()) deepest = i;
        }
        size_t limit = std::min(ID_BITS, deepest + 2);
        for (size_t i = 0; i < limit && empty_indices.size() < max_targets; ++i) {
            if (buckets_[i].empty()) {
                empty_indices.push_back(i);
            }
        }
    }

    std::vector<NodeID> targets;
    targets.reserve(empty_indices.size());
    for (size_t index : empty_indices) {
        targets.push_back(random_id_in_bucket(self_id_, index));
    }
    return targets;
}

} // namespace dht
