#ifndef LANSHARE_RPC_MANAGER_HPP
#define LANSHARE_RPC_MANAGER_HPP

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>

#include "network/protocol.hpp"

namespace dht {

/**
 * @brief Correlates DHT requests with responses by transaction id.
 *
 * Each outstanding request owns a deadline timer. On expiry the request is
 * re-sent until its retries are spent, then the handler receives nullopt.
 * All members must be used from the owning strand.
 */
class RpcManager {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;
    using ResponseHandler = std::function<void(std::optional<DhtMessage>)>;
    using SendFunction = std::function<void(const asio::ip::udp::endpoint&, std::shared_ptr<std::vector<uint8_t>>)>;

    RpcManager(Strand& strand, SendFunction send, std::chrono::milliseconds timeout, unsigned retries);

    // Assigns the transaction id, encodes and sends `request`.
    void send_request(const asio::ip::udp::endpoint& to, DhtMessage request, ResponseHandler handler);

    // Returns true when the response matched an outstanding request.
    bool handle_response(const DhtMessage& response, const asio::ip::udp::endpoint& from);

    // Fails every outstanding request with nullopt.
    void cancel_all();

    size_t pending_count() const { return pending_.size(); }

private:
    struct PendingRpc {
        asio::ip::udp::endpoint endpoint;
        std::shared_ptr<std::vector<uint8_t>> datagram;
        MessageType expected;
        unsigned attempts_left;
        std::unique_ptr<asio::steady_timer> timer;
        ResponseHandler handler;
    };

    void arm_timer(uint64_t transaction_id);
    void on_timeout(uint64_t transaction_id);

    Strand& strand_;
    SendFunction send_;
    std::chrono::milliseconds timeout_;
    unsigned retries_;
    uint64_t next_transaction_id_;
    std::map<uint64_t, PendingRpc> pending_;
};

} // namespace dht

#endif // LANSHARE_RPC_MANAGER_HPP
