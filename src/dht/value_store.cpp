#include "dht/value_store.hpp"

#include <algorithm>

namespace dht {

Provider resolve_provider_address(Provider provider, const asio::ip::address_v4& responder) {
    if (provider.address.is_unspecified() || (provider.address.is_loopback() && !responder.is_loopback())) {
        provider.address = responder;
    }
    return provider;
}

ValueStore::ValueStore(std::chrono::seconds value_ttl, std::chrono::seconds provider_ttl)
    : value_ttl_(value_ttl), provider_ttl_(provider_ttl) {}

void ValueStore::put_value(const NodeID& key, std::vector<uint8_t> data, bool originator, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = values_[key];
    entry.data = std::move(data);
    entry.stored_at = now;
    // A replica never downgrades our own publication.
    entry.originator = entry.originator || originator;
}

std::optional<std::vector<uint8_t>> ValueStore::get_value(const NodeID& key, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    if (!it->second.originator && now - it->second.stored_at > value_ttl_) {
        return std::nullopt;
    }
    return it->second.data;
}

void ValueStore::add_provider(const NodeID& key, const Provider& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = providers_[key];
    auto it = std::find_if(list.begin(), list.end(),
                           [&provider](const Provider& p) { return p.same_peer(provider); });
    if (it != list.end()) {
        it->announced_at = provider.announced_at;
    } else {
        list.push_back(provider);
    }
}

std::vector<Provider> ValueStore::get_providers(const NodeID& key, Clock::time_point now) const {
    std::vector<Provider> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(key);
    if (it == providers_.end()) {
        return result;
    }
    for (const auto& p : it->second) {
        if (now - p.announced_at <= provider_ttl_) {
            result.push_back(p);
        }
    }
    return result;
}

size_t ValueStore::purge_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    for (auto it = values_.begin(); it != values_.end();) {
        if (!it->second.originator && now - it->second.stored_at > value_ttl_) {
            it = values_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = providers_.begin(); it != providers_.end();) {
        auto& list = it->second;
        auto before = list.size();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const Provider& p) { return now - p.announced_at > provider_ttl_; }),
                   list.end());
        removed += before - list.size();
        if (list.empty()) {
            it = providers_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::pair<NodeID, std::vector<uint8_t>>> ValueStore::take_due_for_republish(
    std::chrono::seconds interval, Clock::time_point now) {
    std::vector<std::pair<NodeID, std::vector<uint8_t>>> due;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, value] : values_) {
        if (value.originator && now - value.stored_at >= interval) {
            due.emplace_back(key, value.data);
            value.stored_at = now;
        }
    }
    return due;
}

size_t ValueStore::value_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

size_t ValueStore::provider_key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

} // namespace dht
