#include "dht/rpc_manager.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"

namespace dht {

RpcManager::RpcManager(Strand& strand, SendFunction send, std::chrono::milliseconds timeout, unsigned retries)
    : strand_(strand), send_(std::move(send)), timeout_(timeout), retries_(retries) {
    std::random_device rd;
    next_transaction_id_ = (static_cast<uint64_t>(rd()) << 32) | rd();
}

void RpcManager::send_request(const asio::ip::udp::endpoint& to, DhtMessage request, ResponseHandler handler) {
    uint64_t txn = next_transaction_id_++;
    request.header.transaction_id = txn;

    std::shared_ptr<std::vector<uint8_t>> datagram;
    try {
        datagram = std::make_shared<std::vector<uint8_t>>(Serializer::serialize_dht_message(request));
    } catch (const SerializationError& e) {
        LOG_ERR("Failed to encode ", to_string(request.header.type), " for ", to, ": ", e.what());
        asio::post(strand_, [handler = std::move(handler)]() { handler(std::nullopt); });
        return;
    }

    PendingRpc rpc;
    rpc.endpoint = to;
    rpc.datagram = datagram;
    rpc.expected = expected_response(request.header.type);
    rpc.attempts_left = retries_;
    rpc.timer = std::make_unique<asio::steady_timer>(strand_);
    rpc.handler = std::move(handler);
    pending_.emplace(txn, std::move(rpc));

    send_(to, datagram);
    arm_timer(txn);
}

void RpcManager::arm_timer(uint64_t transaction_id) {
    auto it = pending_.find(transaction_id);
    if (it == pending_.end()) return;

    it->second.timer->expires_after(timeout_);
    it->second.timer->async_wait([this, transaction_id](const asio::error_code& error) {
        if (error == asio::error::operation_aborted) {
            return;
        }
        on_timeout(transaction_id);
    });
}

void RpcManager::on_timeout(uint64_t transaction_id) {
    auto it = pending_.find(transaction_id);
    if (it == pending_.end()) return;

    PendingRpc& rpc = it->second;
    if (rpc.attempts_left > 0) {
        --rpc.attempts_left;
        LOG_DEBUG("RPC ", transaction_id, " to ", rpc.endpoint, " timed out, retrying");
        send_(rpc.endpoint, rpc.datagram);
        arm_timer(transaction_id);
        return;
    }

    LOG_DEBUG("RPC ", transaction_id, " to ", rpc.endpoint, " failed after retries");
    ResponseHandler handler = std::move(rpc.handler);
    pending_.erase(it);
    handler(std::nullopt);
}

bool RpcManager::handle_response(const DhtMessage& response, const asio::ip::udp::endpoint& from) {
    auto it = pending_.find(response.header.transaction_id);
    if (it == pending_.end()) {
        return false;
    }

    PendingRpc& rpc = it->second;
    if (rpc.expected != response.header.type || rpc.endpoint.address() != from.address()) {
        LOG_WARN("Dropping mismatched ", to_string(response.header.type), " for transaction ",
                 response.header.transaction_id, " from ", from);
        return false;
    }

    rpc.timer->cancel();
    ResponseHandler handler = std::move(rpc.handler);
    pending_.erase(it);
    handler(response);
    return true;
}

void RpcManager::cancel_all() {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [txn, rpc] : pending) {
        rpc.timer->cancel();
        if (rpc.handler) {
            rpc.handler(std::nullopt);
        }
    }
}

} // namespace dht
