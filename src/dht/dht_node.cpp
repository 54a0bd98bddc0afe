#include "dht/dht_node.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"
#include <algorithm>
#include <stdexcept>

namespace dht {

struct DhtNode::LookupState {
    NodeID target{};
    bool find_value = false;
    std::map<NodeID, Contact> shortlist; // keyed by XOR distance to target
    std::set<NodeID> queried;
    std::set<NodeID> failed;
    std::vector<Contact> responded_without_value;
    size_t in_flight = 0;
    size_t rounds = 0;
    bool final_sweep = false;
    bool finished = false;
    std::optional<NodeID> best_before_round;

    std::optional<std::vector<uint8_t>> value;
    std::vector<Provider> providers;
    std::function<void(LookupState&)> on_done;

    void merge(const Contact& contact, const NodeID& self) {
        if (contact.id == self) return;
        // Newest details for a known ID replace the old entry.
        shortlist[xor_distance(contact.id, target)] = contact;
    }

    std::optional<NodeID> best_distance() const {
        for (const auto& [distance, contact] : shortlist) {
            if (!failed.count(contact.id)) return distance;
        }
        return std::nullopt;
    }

    std::vector<Contact> closest(size_t count) const {
        std::vector<Contact> result;
        for (const auto& [distance, contact] : shortlist) {
            if (result.size() >= count) break;
            if (!failed.count(contact.id)) result.push_back(contact);
        }
        return result;
    }
};

DhtNode::DhtNode(asio::io_context& io_context, const NodeID& self_id, DhtOptions options)
    : io_context_(io_context),
      strand_(asio::make_strand(io_context)),
      socket_(strand_, asio::ip::udp::endpoint(asio::ip::make_address(options.host), options.port)),
      self_id_(self_id),
      options_(std::move(options)),
      routing_table_(self_id_, options_.k),
      value_store_(options_.value_ttl, options_.provider_ttl),
      rpc_(strand_,
           [this](const asio::ip::udp::endpoint& to, std::shared_ptr<std::vector<uint8_t>> datagram) {
               send_datagram(to, std::move(datagram));
           },
           options_.rpc_timeout, options_.rpc_retries),
      read_buffer_(MAX_DHT_DATAGRAM),
      maintenance_timer_(strand_) {
    local_port_ = socket_.local_endpoint().port();
    LOG_INFO("DHT node ", node_id_to_hex(self_id_), " bound to UDP port ", local_port_);
}

DhtNode::~DhtNode() {
    asio::error_code ec;
    socket_.close(ec);
}

void DhtNode::start() {
    running_ = true;
    asio::post(strand_, [this]() {
        read_message();
        schedule_maintenance();
    });
}

void DhtNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::post(strand_, [this]() {
        maintenance_timer_.cancel();
        rpc_.cancel_all();
        asio::error_code ec;
        socket_.close(ec);
        LOG_INFO("DHT node stopped");
    });
}

void DhtNode::schedule_maintenance() {
    maintenance_timer_.expires_after(options_.refresh_interval);
    maintenance_timer_.async_wait([this](const asio::error_code& error) {
        if (error || !running_) {
            return;
        }
        run_maintenance();
        schedule_maintenance();
    });
}

void DhtNode::run_maintenance() {
    asio::post(strand_, [this]() {
        size_t purged = value_store_.purge_expired();
        if (purged > 0) {
            LOG_DEBUG("Purged ", purged, " expired DHT records");
        }

        for (const auto& target : routing_table_.get_refresh_targets(5)) {
            find_node(target, [](std::vector<Contact>) {});
        }

        for (auto& [key, value] : value_store_.take_due_for_republish(options_.republish_interval)) {
            DhtMessage request = make_message(MessageType::DHT_STORE);
            request.target = key;
            request.value = std::move(value);
            send_to_closest(key, std::move(request), [](size_t) {});
        }

        auto now = Clock::now();
        for (auto& [key, announced_at] : announced_keys_) {
            if (now - announced_at < options_.announce_interval) {
                continue;
            }
            announced_at = now;
            value_store_.add_provider(key, Provider{options_.advertise_address, options_.transfer_port, now});
            DhtMessage request = make_message(MessageType::DHT_ANNOUNCE_PEER);
            request.target = key;
            send_to_closest(key, std::move(request), [](size_t) {});
        }
    });
}

// --- Receive path ---

void DhtNode::read_message() {
    socket_.async_receive_from(
        asio::buffer(read_buffer_), remote_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            if (error) {
                if (error == asio::error::operation_aborted || !running_) {
                    return;
                }
                // ICMP unreachable from an earlier send surfaces here; keep listening.
                LOG_DEBUG("DHT read error: ", error.message());
                read_message();
                return;
            }
            handle_message(read_buffer_.data(), bytes_transferred, remote_endpoint_);
            read_message(); // Listen for next message
        });
}

void DhtNode::handle_message(const uint8_t* data, size_t size, const asio::ip::udp::endpoint& sender) {
    DhtMessage msg;
    try {
        msg = Serializer::deserialize_dht_message(data, size);
    } catch (const SerializationError& e) {
        LOG_WARN("Dropping malformed datagram from ", sender, ": ", e.what());
        return;
    }

    if (msg.header.sender_id == self_id_ || !sender.address().is_v4()) {
        return;
    }

    LOG_DEBUG("Received ", to_string(msg.header.type), " from ", sender);

    Contact contact;
    contact.id = msg.header.sender_id;
    contact.address = sender.address().to_v4();
    contact.dht_port = sender.port();
    contact.transfer_port = msg.header.transfer_port;
    contact.last_seen = std::chrono::steady_clock::now();
    learn_contact(contact);

    if (is_dht_response(msg.header.type)) {
        if (!rpc_.handle_response(msg, sender)) {
            LOG_DEBUG("Unsolicited ", to_string(msg.header.type), " from ", sender);
        }
        return;
    }

    switch (msg.header.type) {
        case MessageType::DHT_PING:
            handle_ping(msg, sender);
            break;
        case MessageType::DHT_FIND_NODE:
            handle_find_node(msg, sender);
            break;
        case MessageType::DHT_STORE:
            handle_store(msg, sender);
            break;
        case MessageType::DHT_FIND_VALUE:
            handle_find_value(msg, sender);
            break;
        case MessageType::DHT_ANNOUNCE_PEER:
            handle_announce_peer(msg, sender);
            break;
        default:
            LOG_WARN("Unhandled DHT message type ", static_cast<int>(msg.header.type), " from ", sender);
            break;
    }
}

void DhtNode::learn_contact(const Contact& contact) {
    AddOutcome outcome = routing_table_.add_contact(contact);

    if (outcome.result == AddResult::Added) {
        LOG_DEBUG("Added contact ", node_id_to_hex(contact.id), " at ", contact.udp_endpoint());
        if (contact_observer_) {
            contact_observer_(contact);
        }
        return;
    }

    if (outcome.result != AddResult::BucketFull || !outcome.oldest) {
        return;
    }

    // Full bucket: the newcomer waits in the replacement cache while the
    // least recently seen contact is checked. Only a silent one is evicted.
    Contact oldest = *outcome.oldest;
    if (!pinging_.insert(oldest.id).second) {
        return;
    }
    rpc_.send_request(oldest.udp_endpoint(), make_message(MessageType::DHT_PING),
        [this, oldest](std::optional<DhtMessage> response) {
            pinging_.erase(oldest.id);
            if (!response) {
                LOG_DEBUG("Evicting unresponsive contact ", node_id_to_hex(oldest.id));
                routing_table_.remove_contact(oldest.id);
            }
        });
}

// --- Request handlers ---

void DhtNode::handle_ping(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    send_response(sender, make_message(MessageType::DHT_PONG, msg.header.transaction_id));
}

void DhtNode::handle_find_node(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    DhtMessage response = make_message(MessageType::DHT_FIND_NODE_RESPONSE, msg.header.transaction_id);
    for (const auto& c : routing_table_.find_closest(msg.target, options_.k + 1)) {
        if (c.id != msg.header.sender_id && response.contacts.size() < options_.k) {
            response.contacts.push_back(c);
        }
    }
    send_response(sender, response);
}

void DhtNode::handle_store(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    value_store_.put_value(msg.target, msg.value);
    DhtMessage response = make_message(MessageType::DHT_STORE_RESPONSE, msg.header.transaction_id);
    response.ok = true;
    send_response(sender, response);
}

void DhtNode::handle_find_value(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    DhtMessage response = make_message(MessageType::DHT_FIND_VALUE_RESPONSE, msg.header.transaction_id);

    auto value = value_store_.get_value(msg.target);
    if (value) {
        response.has_value = true;
        response.value = std::move(*value);
    }
    response.providers = value_store_.get_providers(msg.target);
    if (response.providers.size() > 255) {
        response.providers.resize(255);
    }

    if (!response.has_value && response.providers.empty()) {
        for (const auto& c : routing_table_.find_closest(msg.target, options_.k + 1)) {
            if (c.id != msg.header.sender_id && response.contacts.size() < options_.k) {
                response.contacts.push_back(c);
            }
        }
    }
    send_response(sender, response);
}

void DhtNode::handle_announce_peer(const DhtMessage& msg, const asio::ip::udp::endpoint& sender) {
    DhtMessage response = make_message(MessageType::DHT_ANNOUNCE_RESPONSE, msg.header.transaction_id);
    if (msg.header.transfer_port != 0) {
        value_store_.add_provider(msg.target, Provider{sender.address().to_v4(), msg.header.transfer_port, Clock::now()});
        response.ok = true;
    }
    send_response(sender, response);
}

// --- Send path ---

DhtMessage DhtNode::make_message(MessageType type, uint64_t transaction_id) const {
    DhtMessage msg;
    msg.header.type = type;
    msg.header.transaction_id = transaction_id;
    msg.header.sender_id = self_id_;
    msg.header.dht_port = local_port_;
    msg.header.transfer_port = options_.transfer_port;
    return msg;
}

void DhtNode::send_datagram(const asio::ip::udp::endpoint& to, std::shared_ptr<std::vector<uint8_t>> datagram) {
    if (!running_) {
        return;
    }
    socket_.async_send_to(asio::buffer(*datagram), to,
        [datagram, to](const asio::error_code& error, size_t) {
            if (error && error != asio::error::operation_aborted) {
                LOG_DEBUG("DHT send to ", to, " failed: ", error.message());
            }
        });
}

void DhtNode::send_response(const asio::ip::udp::endpoint& to, const DhtMessage& response) {
    try {
        send_datagram(to, std::make_shared<std::vector<uint8_t>>(Serializer::serialize_dht_message(response)));
    } catch (const SerializationError& e) {
        LOG_ERR("Failed to encode ", to_string(response.header.type), " for ", to, ": ", e.what());
    }
}

void DhtNode::send_rpc(const Contact& to, DhtMessage request, RpcManager::ResponseHandler handler) {
    if (!running_) {
        asio::post(strand_, [handler = std::move(handler)]() { handler(std::nullopt); });
        return;
    }
    NodeID id = to.id;
    rpc_.send_request(to.udp_endpoint(), std::move(request),
        [this, id, handler = std::move(handler)](std::optional<DhtMessage> response) {
            if (!response) {
                routing_table_.mark_failed(id);
            }
            handler(std::move(response));
        });
}

// --- Public operations ---

void DhtNode::ping(const asio::ip::udp::endpoint& endpoint, std::function<void(std::optional<Contact>)> callback) {
    asio::post(strand_, [this, endpoint, callback = std::move(callback)]() {
        if (!running_ || !endpoint.address().is_v4()) {
            callback(std::nullopt);
            return;
        }
        rpc_.send_request(endpoint, make_message(MessageType::DHT_PING),
            [endpoint, callback](std::optional<DhtMessage> response) {
                if (!response) {
                    callback(std::nullopt);
                    return;
                }
                Contact contact;
                contact.id = response->header.sender_id;
                contact.address = endpoint.address().to_v4();
                contact.dht_port = endpoint.port();
                contact.transfer_port = response->header.transfer_port;
                contact.last_seen = std::chrono::steady_clock::now();
                callback(contact);
            });
    });
}

void DhtNode::bootstrap(std::vector<asio::ip::udp::endpoint> seeds, CountCallback on_complete) {
    asio::post(strand_, [this, seeds = std::move(seeds), on_complete = std::move(on_complete)]() {
        if (seeds.empty()) {
            LOG_WARN("Bootstrap called without seed nodes");
            if (on_complete) on_complete(0);
            return;
        }

        struct BootstrapState {
            size_t remaining = 0;
            size_t answered = 0;
        };
        auto state = std::make_shared<BootstrapState>();
        state->remaining = seeds.size();

        for (const auto& seed : seeds) {
            LOG_INFO("Bootstrapping from ", seed);
            ping(seed, [this, state, seed, on_complete](std::optional<Contact> contact) {
                if (contact) {
                    ++state->answered;
                } else {
                    LOG_WARN("Bootstrap seed ", seed, " did not answer");
                }
                if (--state->remaining > 0) {
                    return;
                }
                if (state->answered == 0) {
                    LOG_WARN("Bootstrap failed: no seed answered");
                    if (on_complete) on_complete(0);
                    return;
                }
                find_node(self_id_, [this, state, on_complete](std::vector<Contact> closest) {
                    LOG_INFO("Bootstrap complete: ", state->answered, " seed(s), ",
                             closest.size(), " close contacts, routing table has ",
                             routing_table_.size(), " entries");
                    for (const auto& target : routing_table_.get_refresh_targets(5)) {
                        find_node(target, [](std::vector<Contact>) {});
                    }
                    if (on_complete) on_complete(state->answered);
                });
            });
        }
    });
}

void DhtNode::find_node(const NodeID& target, ContactsCallback callback) {
    asio::post(strand_, [this, target, callback = std::move(callback)]() {
        start_lookup(target, false, [this, callback](LookupState& lookup) {
            callback(lookup.closest(options_.k));
        });
    });
}

void DhtNode::find_value(const NodeID& key, FindValueCallback callback) {
    asio::post(strand_, [this, key, callback = std::move(callback)]() {
        FindValueResult local;
        local.value = value_store_.get_value(key);
        for (const auto& provider : value_store_.get_providers(key)) {
            local.providers.push_back(resolve_provider_address(provider, asio::ip::address_v4::loopback()));
        }
        if (local.value || !local.providers.empty()) {
            callback(std::move(local));
            return;
        }

        start_lookup(key, true, [this, key, callback](LookupState& lookup) {
            FindValueResult result;
            result.value = lookup.value;
            result.providers = lookup.providers;
            result.closest = lookup.closest(options_.k);

            // Cache the blob on the closest node that did not have it.
            if (lookup.value && !lookup.responded_without_value.empty()) {
                auto& misses = lookup.responded_without_value;
                sort_by_distance(misses, key);
                DhtMessage request = make_message(MessageType::DHT_STORE);
                request.target = key;
                request.value = *lookup.value;
                send_rpc(misses.front(), std::move(request), [](std::optional<DhtMessage>) {});
            }
            callback(std::move(result));
        });
    });
}

void DhtNode::find_providers(const NodeID& key, std::function<void(std::vector<Provider>)> callback) {
    find_value(key, [callback = std::move(callback)](FindValueResult result) {
        callback(std::move(result.providers));
    });
}

void DhtNode::store(const NodeID& key, std::vector<uint8_t> value, CountCallback callback) {
    if (value.size() > MAX_DHT_VALUE_SIZE) {
        throw std::invalid_argument("DHT value exceeds " + std::to_string(MAX_DHT_VALUE_SIZE) + " bytes");
    }
    asio::post(strand_, [this, key, value = std::move(value), callback = std::move(callback)]() mutable {
        value_store_.put_value(key, value, true);
        DhtMessage request = make_message(MessageType::DHT_STORE);
        request.target = key;
        request.value = std::move(value);
        send_to_closest(key, std::move(request), std::move(callback));
    });
}

void DhtNode::announce(const NodeID& key, CountCallback callback) {
    asio::post(strand_, [this, key, callback = std::move(callback)]() mutable {
        auto now = Clock::now();
        value_store_.add_provider(key, Provider{options_.advertise_address, options_.transfer_port, now});
        announced_keys_[key] = now;
        DhtMessage request = make_message(MessageType::DHT_ANNOUNCE_PEER);
        request.target = key;
        send_to_closest(key, std::move(request), std::move(callback));
    });
}

void DhtNode::send_to_closest(const NodeID& key, DhtMessage request, CountCallback callback) {
    find_node(key, [this, request = std::move(request), callback = std::move(callback)](std::vector<Contact> closest) {
        if (closest.empty()) {
            LOG_DEBUG("No contacts to send ", to_string(request.header.type), " to");
            if (callback) callback(0);
            return;
        }

        struct Acks {
            size_t remaining = 0;
            size_t count = 0;
        };
        auto acks = std::make_shared<Acks>();
        acks->remaining = closest.size();

        for (const auto& contact : closest) {
            send_rpc(contact, request, [acks, callback](std::optional<DhtMessage> response) {
                if (response && response->ok) {
                    ++acks->count;
                }
                if (--acks->remaining == 0 && callback) {
                    callback(acks->count);
                }
            });
        }
    });
}

// --- Iterative lookup ---

void DhtNode::start_lookup(const NodeID& target, bool find_value, std::function<void(LookupState&)> on_done) {
    auto lookup = std::make_shared<LookupState>();
    lookup->target = target;
    lookup->find_value = find_value;
    lookup->on_done = std::move(on_done);

    for (const auto& contact : routing_table_.find_closest(target, options_.k)) {
        lookup->merge(contact, self_id_);
    }
    start_round(lookup);
}

void DhtNode::start_round(const std::shared_ptr<LookupState>& lookup) {
    if (lookup->finished) return;
    if (lookup->rounds >= options_.lookup_max_rounds) {
        finish_lookup(lookup);
        return;
    }

    // Candidates are the unqueried entries among the k closest live contacts.
    // A final sweep queries all of them instead of alpha.
    size_t width = lookup->final_sweep ? options_.k : options_.alpha;
    std::vector<Contact> batch;
    for (const auto& contact : lookup->closest(options_.k)) {
        if (batch.size() >= width) break;
        if (!lookup->queried.count(contact.id)) {
            batch.push_back(contact);
        }
    }

    if (batch.empty()) {
        finish_lookup(lookup);
        return;
    }

    lookup->best_before_round = lookup->best_distance();
    MessageType type = lookup->find_value ? MessageType::DHT_FIND_VALUE : MessageType::DHT_FIND_NODE;

    for (const auto& contact : batch) {
        lookup->queried.insert(contact.id);
        ++lookup->in_flight;
        DhtMessage request = make_message(type);
        request.target = lookup->target;
        send_rpc(contact, std::move(request), [this, lookup, contact](std::optional<DhtMessage> response) {
            on_lookup_response(lookup, contact, response);
        });
    }
}

void DhtNode::on_lookup_response(const std::shared_ptr<LookupState>& lookup, const Contact& queried,
                                 const std::optional<DhtMessage>& response) {
    if (lookup->in_flight > 0) {
        --lookup->in_flight;
    }
    if (lookup->finished) {
        return;
    }

    if (!response) {
        lookup->failed.insert(queried.id);
    } else {
        if (lookup->find_value && (response->has_value || !response->providers.empty())) {
            if (response->has_value) {
                lookup->value = response->value;
            }
            lookup->providers.clear();
            for (const auto& provider : response->providers) {
                lookup->providers.push_back(resolve_provider_address(provider, queried.address));
            }
            finish_lookup(lookup);
            return;
        }
        if (lookup->find_value) {
            lookup->responded_without_value.push_back(queried);
        }
        for (const auto& contact : response->contacts) {
            lookup->merge(contact, self_id_);
        }
    }

    // Join: the next round starts once every request of this one is settled.
    if (lookup->in_flight > 0) {
        return;
    }
    ++lookup->rounds;

    if (lookup->final_sweep) {
        finish_lookup(lookup);
        return;
    }

    auto best = lookup->best_distance();
    bool improved = best && (!lookup->best_before_round || is_closer(*best, *lookup->best_before_round));
    if (!improved) {
        lookup->final_sweep = true;
    }
    start_round(lookup);
}

void DhtNode::finish_lookup(const std::shared_ptr<LookupState>& lookup) {
    if (lookup->finished) return;
    lookup->finished = true;
    LOG_DEBUG("Lookup for ", node_id_to_hex(lookup->target), " finished after ", lookup->rounds,
              " round(s), ", lookup->queried.size(), " queried");
    if (lookup->on_done) {
        lookup->on_done(*lookup);
    }
}

} // namespace dht
