#ifndef LANSHARE_TRANSFER_CLIENT_HPP
#define LANSHARE_TRANSFER_CLIENT_HPP

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>

#include "connection.hpp"
#include "protocol.hpp"

enum class TransferStatus {
    Ok,
    Timeout,
    NotFound,
    ConnectionFailed,
    ProtocolError
};

const char* to_string(TransferStatus status);

/**
 * @brief Where a download session gets manifests and chunks from.
 * Callbacks may run on any thread.
 */
class ChunkSource {
public:
    using BytesCallback = std::function<void(TransferStatus, std::vector<uint8_t>)>;

    virtual ~ChunkSource() = default;

    // On Ok the bytes are the manifest JSON.
    virtual void request_manifest(const PeerAddress& peer, const hash_t& info_hash, BytesCallback callback) = 0;

    // On Ok the bytes are the chunk, not yet verified.
    virtual void request_chunk(const PeerAddress& peer, const hash_t& chunk_hash, BytesCallback callback) = 0;
};

class PeerLink;
struct LinkRegistry;

/**
 * @brief TCP implementation of ChunkSource.
 *
 * Keeps one connection per peer and pipelines requests on it. The peer
 * answers in request order, so replies are matched first in, first out.
 * When the oldest outstanding request passes its deadline, the connection
 * is dropped and every request pending on it fails with Timeout.
 */
class TransferClient : public ChunkSource {
public:
    TransferClient(asio::io_context& io_context, std::chrono::milliseconds timeout);
    ~TransferClient() override;

    void request_manifest(const PeerAddress& peer, const hash_t& info_hash, BytesCallback callback) override;
    void request_chunk(const PeerAddress& peer, const hash_t& chunk_hash, BytesCallback callback) override;

    // Closes every connection; pending requests fail with ConnectionFailed.
    void close_all();

    size_t connection_count() const;

private:
    void submit(const PeerAddress& peer, MessageType type, const hash_t& hash, MessageType expected,
                BytesCallback callback);

    asio::io_context& io_context_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<LinkRegistry> registry_; // shared with links, which outlive close_all()
};

#endif //LANSHARE_TRANSFER_CLIENT_HPP
