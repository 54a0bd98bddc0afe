#include "network/server.hpp"
#include "common/serializer.hpp"
#include "common/logger.hpp"

Server::Server(asio::io_context& io_context, uint16_t port, ChunkStore& store, const std::string& host)
    : io_context_(io_context),
      acceptor_(io_context, asio::ip::tcp::endpoint(asio::ip::make_address(host), port)),
      store_(store) {
    LOG_INFO("Transfer server listening on TCP port ", local_port());
}

Server::~Server() {
    stop();
}

void Server::start() {
    start_accept();
}

void Server::stop() {
    std::set<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        connections.swap(connections_);
    }
    asio::post(acceptor_.get_executor(), [this]() {
        asio::error_code ignored;
        acceptor_.close(ignored);
    });
    for (auto& connection : connections) {
        connection->close();
    }
}

uint16_t Server::local_port() const {
    asio::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

size_t Server::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void Server::start_accept() {
    auto new_connection = std::make_shared<Connection>(io_context_);

    acceptor_.async_accept(new_connection->socket(),
        [this, new_connection](const asio::error_code& error) {
            if (error == asio::error::operation_aborted) {
                return;
            }
            if (error) {
                LOG_ERR("Error accepting connection: ", error.message());
                start_accept();
                return;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopped_) {
                    new_connection->close();
                    return;
                }
                connections_.insert(new_connection);
            }
            LOG_DEBUG("New connection accepted from ", new_connection->remote_address());

            std::weak_ptr<Connection> conn_weak = new_connection;
            new_connection->set_message_handler([this, conn_weak](Message msg) {
                if (auto conn_shared = conn_weak.lock()) {
                    handle_message(msg, conn_shared);
                }
            });
            new_connection->set_close_handler([this, conn_weak](const asio::error_code&) {
                if (auto conn_shared = conn_weak.lock()) {
                    remove_connection(conn_shared);
                }
            });
            new_connection->start();
            start_accept();
        });
}

void Server::remove_connection(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(connection);
}

void Server::handle_message(const Message& msg, const std::shared_ptr<Connection>& connection) {
    switch (msg.type) {
        case MessageType::REQUEST_MANIFEST:
            handle_request_manifest(msg, connection);
            break;
        case MessageType::REQUEST_CHUNK:
            handle_request_chunk(msg, connection);
            break;
        default:
            LOG_WARN("Unexpected ", to_string(msg.type), " from ", connection->remote_address(), ", closing");
            connection->close();
            break;
    }
}

void Server::handle_request_manifest(const Message& msg, const std::shared_ptr<Connection>& connection) {
    auto info_hash = Serializer::deserialize_hash_payload(msg.payload);
    if (!info_hash) {
        LOG_WARN("Malformed REQUEST_MANIFEST from ", connection->remote_address(), ", closing");
        connection->close();
        return;
    }

    auto manifest = store_.get_manifest(*info_hash);
    if (!manifest) {
        LOG_DEBUG("Manifest ", Hasher::hash_to_hex(*info_hash), " not found");
        connection->send_message(Message{MessageType::NOT_FOUND, {}});
        return;
    }

    std::string body = nlohmann::json(*manifest).dump();
    connection->send_message(Message{MessageType::MANIFEST_DATA, std::vector<uint8_t>(body.begin(), body.end())});
}

void Server::handle_request_chunk(const Message& msg, const std::shared_ptr<Connection>& connection) {
    auto chunk_hash = Serializer::deserialize_hash_payload(msg.payload);
    if (!chunk_hash) {
        LOG_WARN("Malformed REQUEST_CHUNK from ", connection->remote_address(), ", closing");
        connection->close();
        return;
    }

    auto data = store_.get_chunk(*chunk_hash);
    if (!data) {
        connection->send_message(Message{MessageType::NOT_FOUND, {}});
        return;
    }

    chunks_served_++;
    bytes_served_ += data->size();
    connection->send_message(Message{MessageType::CHUNK_DATA, std::move(*data)});
}
