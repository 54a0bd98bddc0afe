#include "network/transfer_client.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"

#include <deque>
#include <map>
#include <mutex>

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Ok: return "ok";
        case TransferStatus::Timeout: return "timeout";
        case TransferStatus::NotFound: return "not_found";
        case TransferStatus::ConnectionFailed: return "connection_failed";
        case TransferStatus::ProtocolError: return "protocol_error";
    }
    return "unknown";
}

struct LinkRegistry {
    std::mutex mutex;
    std::map<PeerAddress, std::shared_ptr<PeerLink>> links;

    void forget(const PeerAddress& peer, const PeerLink* link) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = links.find(peer);
        if (it != links.end() && it->second.get() == link) {
            links.erase(it);
        }
    }
};

// One pipelined connection to a peer. Everything runs on the connection's strand.
class PeerLink : public std::enable_shared_from_this<PeerLink> {
public:
    PeerLink(asio::io_context& io_context, PeerAddress peer, std::chrono::milliseconds timeout,
             std::weak_ptr<LinkRegistry> registry)
        : peer_(std::move(peer)),
          timeout_(timeout),
          registry_(std::move(registry)),
          connection_(std::make_shared<Connection>(io_context)),
          timer_(connection_->strand()) {}

    void submit(Message request, MessageType expected, ChunkSource::BytesCallback callback) {
        asio::post(connection_->strand(),
            [self = shared_from_this(), request = std::move(request), expected,
             callback = std::move(callback)]() mutable {
                self->enqueue(std::move(request), expected, std::move(callback));
            });
    }

    void close() {
        asio::post(connection_->strand(), [self = shared_from_this()]() {
            self->fail_all(TransferStatus::ConnectionFailed);
        });
    }

private:
    enum class State { Idle, Connecting, Connected, Dead };

    struct Pending {
        Message request;
        MessageType expected;
        ChunkSource::BytesCallback callback;
        std::chrono::steady_clock::time_point deadline;
    };

    void enqueue(Message request, MessageType expected, ChunkSource::BytesCallback callback) {
        if (state_ == State::Dead) {
            callback(TransferStatus::ConnectionFailed, {});
            return;
        }

        pending_.push_back(Pending{std::move(request), expected, std::move(callback),
                                   std::chrono::steady_clock::now() + timeout_});
        if (state_ == State::Idle) {
            connect();
        } else if (state_ == State::Connected) {
            connection_->send_message(pending_.back().request);
        }
        if (pending_.size() == 1) {
            arm_timer();
        }
    }

    void connect() {
        state_ = State::Connecting;
        asio::error_code ec;
        auto address = asio::ip::make_address(peer_.host, ec);
        if (ec) {
            LOG_WARN("Invalid peer address ", peer_.to_string(), ": ", ec.message());
            fail_all(TransferStatus::ConnectionFailed);
            return;
        }

        LOG_DEBUG("Connecting to ", peer_.to_string());
        connection_->socket().async_connect(asio::ip::tcp::endpoint(address, peer_.port),
            [self = shared_from_this()](const asio::error_code& error) {
                self->on_connected(error);
            });
    }

    void on_connected(const asio::error_code& error) {
        if (state_ == State::Dead) {
            return;
        }
        if (error) {
            LOG_WARN("Failed to connect to ", peer_.to_string(), ": ", error.message());
            fail_all(TransferStatus::ConnectionFailed);
            return;
        }

        state_ = State::Connected;
        std::weak_ptr<PeerLink> weak = shared_from_this();
        connection_->set_message_handler([weak](Message msg) {
            if (auto self = weak.lock()) {
                self->on_message(std::move(msg));
            }
        });
        connection_->set_close_handler([weak](const asio::error_code& close_error) {
            if (auto self = weak.lock()) {
                LOG_DEBUG("Connection to ", self->peer_.to_string(), " closed: ", close_error.message());
                self->fail_all(TransferStatus::ConnectionFailed);
            }
        });
        connection_->start();

        for (const auto& p : pending_) {
            connection_->send_message(p.request);
        }
    }

    void on_message(Message msg) {
        if (state_ == State::Dead) {
            return;
        }
        if (pending_.empty()) {
            LOG_WARN("Unsolicited ", to_string(msg.type), " from ", peer_.to_string());
            fail_all(TransferStatus::ProtocolError);
            return;
        }

        Pending p = std::move(pending_.front());
        pending_.pop_front();

        if (msg.type == MessageType::NOT_FOUND) {
            p.callback(TransferStatus::NotFound, {});
        } else if (msg.type == p.expected) {
            p.callback(TransferStatus::Ok, std::move(msg.payload));
        } else {
            LOG_WARN("Expected ", to_string(p.expected), " from ", peer_.to_string(), ", got ", to_string(msg.type));
            p.callback(TransferStatus::ProtocolError, {});
            fail_all(TransferStatus::ProtocolError);
            return;
        }
        arm_timer();
    }

    void arm_timer() {
        if (pending_.empty()) {
            timer_.cancel();
            return;
        }
        timer_.expires_at(pending_.front().deadline);
        std::weak_ptr<PeerLink> weak = shared_from_this();
        timer_.async_wait([weak](const asio::error_code& error) {
            if (error == asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->on_timer();
            }
        });
    }

    void on_timer() {
        if (state_ == State::Dead || pending_.empty()) {
            return;
        }
        if (std::chrono::steady_clock::now() < pending_.front().deadline) {
            arm_timer();
            return;
        }
        LOG_WARN("Request to ", peer_.to_string(), " timed out, dropping ", pending_.size(), " pending request(s)");
        fail_all(TransferStatus::Timeout);
    }

    void fail_all(TransferStatus status) {
        if (state_ == State::Dead) {
            return;
        }
        state_ = State::Dead;
        timer_.cancel();
        if (auto registry = registry_.lock()) {
            registry->forget(peer_, this);
        }
        connection_->close();

        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& p : pending) {
            p.callback(status, {});
        }
    }

    PeerAddress peer_;
    std::chrono::milliseconds timeout_;
    std::weak_ptr<LinkRegistry> registry_;
    std::shared_ptr<Connection> connection_;
    asio::steady_timer timer_;
    State state_ = State::Idle;
    std::deque<Pending> pending_;
};

// --- TransferClient ---

TransferClient::TransferClient(asio::io_context& io_context, std::chrono::milliseconds timeout)
    : io_context_(io_context), timeout_(timeout), registry_(std::make_shared<LinkRegistry>()) {}

TransferClient::~TransferClient() {
    close_all();
}

void TransferClient::request_manifest(const PeerAddress& peer, const hash_t& info_hash, BytesCallback callback) {
    submit(peer, MessageType::REQUEST_MANIFEST, info_hash, MessageType::MANIFEST_DATA, std::move(callback));
}

void TransferClient::request_chunk(const PeerAddress& peer, const hash_t& chunk_hash, BytesCallback callback) {
    submit(peer, MessageType::REQUEST_CHUNK, chunk_hash, MessageType::CHUNK_DATA, std::move(callback));
}

void TransferClient::submit(const PeerAddress& peer, MessageType type, const hash_t& hash, MessageType expected,
                            BytesCallback callback) {
    std::shared_ptr<PeerLink> link;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto& slot = registry_->links[peer];
        if (!slot) {
            slot = std::make_shared<PeerLink>(io_context_, peer, timeout_, registry_);
        }
        link = slot;
    }
    link->submit(Message{type, Serializer::serialize_hash_payload(hash)}, expected, std::move(callback));
}

void TransferClient::close_all() {
    std::map<PeerAddress, std::shared_ptr<PeerLink>> links;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        links.swap(registry_->links);
    }
    for (auto& [peer, link] : links) {
        link->close();
    }
}

size_t TransferClient::connection_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->links.size();
}
