#ifndef LANSHARE_NODE_CONTROLLER_HPP
#define LANSHARE_NODE_CONTROLLER_HPP

#include <asio.hpp>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../common/config.hpp"
#include "../dht/dht_node.hpp"
#include "../files/chunk_store.hpp"
#include "../files/download_manager.hpp"
#include "../network/server.hpp"
#include "../network/transfer_client.hpp"
#include "../storage/storage_manager.hpp"

struct NodeStats {
    std::string node_id;
    uint16_t dht_port = 0;
    uint16_t transfer_port = 0;
    size_t routing_table_size = 0;
    size_t non_empty_buckets = 0;
    size_t stored_values = 0;
    size_t provider_keys = 0;
    size_t shared_files = 0;
    size_t chunks_stored = 0;
    size_t active_downloads = 0;
    uint64_t chunks_served = 0;
    uint64_t bytes_served = 0;
    size_t inbound_connections = 0;
    size_t outbound_connections = 0;
};

void to_json(nlohmann::json& j, const NodeStats& s);

/**
 * @brief Owns every component of one node and exposes the control surface.
 *
 * Nothing is global, so several controllers can share one io_context in a
 * single process. Threads running the io_context must be joined before the
 * controller is destroyed.
 */
class NodeController {
public:
    using CountCallback = std::function<void(size_t)>;

    NodeController(asio::io_context& io_context, NodeConfig config);
    ~NodeController();

    NodeController(const NodeController&) = delete;
    NodeController& operator=(const NodeController&) = delete;

    // Starts serving and bootstraps from the configured and previously seen peers.
    void start();
    void stop();

    // "host:port" DHT endpoints. Unparseable entries are logged and skipped.
    void bootstrap(const std::vector<std::string>& endpoints, CountCallback on_complete = nullptr);

    /**
     * @brief Chunks a file into the local store and announces it on the DHT.
     * @return The info hash as 64 hex characters.
     * @throws std::invalid_argument if `path` is not a regular file.
     */
    std::string share(const fs::path& path, CountCallback on_announced = nullptr);

    void announce(const hash_t& info_hash, CountCallback on_announced = nullptr);

    /**
     * @brief Starts (or returns the running) download session for a file.
     * Only the newest finished_sessions_kept finished sessions stay listed.
     * @throws std::invalid_argument unless the input is 64 hex characters.
     */
    std::shared_ptr<DownloadManager> download(const std::string& info_hash_hex);

    std::shared_ptr<DownloadManager> get_session(const std::string& info_hash_hex) const;
    std::vector<std::shared_ptr<DownloadManager>> sessions() const;

    // Manifests whose chunks are all stored locally.
    std::vector<Manifest> list_shared() const;

    NodeStats stats() const;

    const dht::NodeID& node_id() const { return node_id_; }
    std::string node_id_hex() const { return dht::node_id_to_hex(node_id_); }
    const NodeConfig& config() const { return config_; }

    dht::DhtNode& dht() { return *dht_; }
    ChunkStore& chunk_store() { return *chunk_store_; }
    Server& server() { return *server_; }
    StorageManager& storage() { return *storage_; }

    /**
     * @brief The node's persistent identity.
     *
     * Derived from node_id_seed when set; otherwise read from
     * `<data_dir>/node_id`, created with a random ID on first start.
     */
    static dht::NodeID load_or_create_node_id(const NodeConfig& config);

private:
    class DhtProviderLocator;

    std::optional<asio::ip::udp::endpoint> resolve(const std::string& endpoint);

    // Drops the oldest finished sessions beyond finished_sessions_kept.
    void prune_sessions_locked();

    asio::io_context& io_context_;
    NodeConfig config_;
    dht::NodeID node_id_;
    // Serializes peer writes off the DHT strand.
    asio::strand<asio::io_context::executor_type> storage_strand_;

    std::unique_ptr<ChunkStore> chunk_store_;
    std::unique_ptr<StorageManager> storage_;
    std::unique_ptr<Server> server_;
    std::unique_ptr<dht::DhtNode> dht_;
    std::unique_ptr<TransferClient> transfer_client_;
    std::unique_ptr<DhtProviderLocator> locator_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<DownloadManager>> sessions_;
    std::deque<std::string> session_order_; // keys, oldest session first
    bool stopped_ = false;
};

#endif //LANSHARE_NODE_CONTROLLER_HPP
