#ifndef LANSHARE_SERVER_HPP
#define LANSHARE_SERVER_HPP

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>

#include "connection.hpp"
#include "protocol.hpp"
#include "../files/chunk_store.hpp"

/**
 * @brief Serves manifests and chunks from the local ChunkStore over TCP.
 *
 * Requests on one connection are answered in the order they arrive, which
 * is what lets clients pipeline them.
 */
class Server {
public:
    Server(asio::io_context& io_context, uint16_t port, ChunkStore& store, const std::string& host = "0.0.0.0");
    ~Server();

    void start();
    void stop();

    uint16_t local_port() const;

    uint64_t chunks_served() const { return chunks_served_.load(); }
    uint64_t bytes_served() const { return bytes_served_.load(); }
    size_t connection_count() const;

private:
    void start_accept();
    void handle_message(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_request_manifest(const Message& msg, const std::shared_ptr<Connection>& connection);
    void handle_request_chunk(const Message& msg, const std::shared_ptr<Connection>& connection);
    void remove_connection(const std::shared_ptr<Connection>& connection);

    asio::io_context& io_context_;
    asio::ip::tcp::acceptor acceptor_;
    ChunkStore& store_;

    mutable std::mutex mutex_;
    std::set<std::shared_ptr<Connection>> connections_; // To keep connections alive
    bool stopped_ = false;

    std::atomic<uint64_t> chunks_served_{0};
    std::atomic<uint64_t> bytes_served_{0};
};

#endif //LANSHARE_SERVER_HPP
