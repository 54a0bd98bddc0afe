#include "node/node_controller.hpp"
#include "files/chunker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <stdexcept>

void to_json(nlohmann::json& j, const NodeStats& s) {
    j = nlohmann::json{
        {"node_id", s.node_id},
        {"dht_port", s.dht_port},
        {"transfer_port", s.transfer_port},
        {"routing_table_size", s.routing_table_size},
        {"non_empty_buckets", s.non_empty_buckets},
        {"stored_values", s.stored_values},
        {"provider_keys", s.provider_keys},
        {"shared_files", s.shared_files},
        {"chunks_stored", s.chunks_stored},
        {"active_downloads", s.active_downloads},
        {"chunks_served", s.chunks_served},
        {"bytes_served", s.bytes_served},
        {"inbound_connections", s.inbound_connections},
        {"outbound_connections", s.outbound_connections}
    };
}

// Maps DHT provider records to transfer endpoints.
class NodeController::DhtProviderLocator : public ProviderLocator {
public:
    explicit DhtProviderLocator(dht::DhtNode& dht) : dht_(dht) {}

    void find_providers(const hash_t& info_hash, ProvidersCallback callback) override {
        dht_.find_providers(dht::key_for_info_hash(info_hash),
            [callback = std::move(callback)](std::vector<dht::Provider> providers) {
                std::vector<PeerAddress> peers;
                std::set<PeerAddress> seen;
                for (const auto& provider : providers) {
                    PeerAddress peer{provider.address.to_string(), provider.transfer_port};
                    if (seen.insert(peer).second) {
                        peers.push_back(std::move(peer));
                    }
                }
                callback(std::move(peers));
            });
    }

private:
    dht::DhtNode& dht_;
};

dht::NodeID NodeController::load_or_create_node_id(const NodeConfig& config) {
    if (!config.node_id_seed.empty()) {
        return dht::node_id_from_seed(config.node_id_seed);
    }

    fs::path file = config.data_dir / "node_id";
    std::ifstream in(file);
    if (in.is_open()) {
        std::string hex;
        in >> hex;
        if (Hasher::is_hex(hex, dht::NODE_ID_SIZE)) {
            return dht::hex_to_node_id(hex);
        }
        LOG_WARN("Ignoring malformed node ID in ", file.string());
    }

    dht::NodeID id = dht::generate_random_id();
    std::error_code ec;
    fs::create_directories(config.data_dir, ec);
    std::ofstream out(file, std::ios::trunc);
    out << dht::node_id_to_hex(id) << "\n";
    if (!out) {
        throw P2PError(ErrorKind::StorageIO, "Failed to write node ID to " + file.string());
    }
    LOG_INFO("Generated new node ID ", dht::node_id_to_hex(id));
    return id;
}

NodeController::NodeController(asio::io_context& io_context, NodeConfig config)
    : io_context_(io_context),
      config_(std::move(config)),
      node_id_(load_or_create_node_id(config_)),
      storage_strand_(asio::make_strand(io_context)) {
    chunk_store_ = std::make_unique<ChunkStore>(config_.data_dir);
    storage_ = std::make_unique<StorageManager>(config_.database_path().string());
    server_ = std::make_unique<Server>(io_context_, config_.transfer_port, *chunk_store_, config_.host);

    dht::DhtOptions options;
    options.host = config_.host;
    options.port = config_.dht_port;
    options.transfer_port = server_->local_port();
    options.advertise_address = asio::ip::make_address_v4(config_.advertise_address);
    options.k = config_.k;
    options.alpha = config_.alpha;
    options.rpc_timeout = std::chrono::milliseconds(config_.rpc_timeout_ms);
    options.rpc_retries = config_.rpc_retries;
    options.lookup_max_rounds = config_.lookup_max_rounds;
    options.value_ttl = std::chrono::seconds(config_.value_ttl_s);
    options.provider_ttl = std::chrono::seconds(config_.provider_ttl_s);
    options.republish_interval = std::chrono::seconds(config_.republish_interval_s);
    options.announce_interval = std::chrono::seconds(config_.announce_interval_s);
    options.refresh_interval = std::chrono::seconds(config_.refresh_interval_s);
    dht_ = std::make_unique<dht::DhtNode>(io_context_, node_id_, options);

    transfer_client_ = std::make_unique<TransferClient>(io_context_,
                                                        std::chrono::milliseconds(config_.transfer_timeout_ms));
    locator_ = std::make_unique<DhtProviderLocator>(*dht_);

    dht_->set_contact_observer([this](const dht::Contact& contact) {
        asio::post(storage_strand_, [this, contact]() {
            storage_->record_peer(contact);
        });
    });

    LOG_INFO("Node ", node_id_hex(), " ready (DHT port ", dht_->local_port(),
             ", transfer port ", server_->local_port(), ")");
}

NodeController::~NodeController() {
    stop();
}

void NodeController::start() {
    server_->start();
    dht_->start();

    std::vector<std::string> seeds = config_.bootstrap_nodes;
    for (const auto& peer : storage_->get_peers(config_.k)) {
        seeds.push_back(peer.ip + ":" + std::to_string(peer.dht_port));
    }
    if (seeds.empty()) {
        LOG_INFO("No bootstrap nodes configured, waiting for peers");
        return;
    }
    bootstrap(seeds, [](size_t answered) {
        LOG_INFO("Bootstrap finished, ", answered, " seed(s) answered");
    });
}

void NodeController::stop() {
    std::vector<std::shared_ptr<DownloadManager>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (const auto& [key, session] : sessions_) {
            if (!is_terminal(session->phase())) {
                running.push_back(session);
            }
        }
    }
    for (auto& session : running) {
        session->cancel();
    }
    transfer_client_->close_all();
    server_->stop();
    dht_->stop();
    LOG_INFO("Node ", node_id_hex(), " stopped");
}

std::optional<asio::ip::udp::endpoint> NodeController::resolve(const std::string& endpoint) {
    try {
        auto [host, port] = parse_host_port(endpoint);
        asio::error_code ec;
        auto address = asio::ip::make_address(host, ec);
        if (!ec) {
            return asio::ip::udp::endpoint(address, port);
        }
        asio::ip::udp::resolver resolver(io_context_);
        auto results = resolver.resolve(asio::ip::udp::v4(), host, std::to_string(port));
        if (results.empty()) {
            LOG_WARN("Could not resolve bootstrap node ", endpoint);
            return std::nullopt;
        }
        return results.begin()->endpoint();
    } catch (const std::exception& e) {
        LOG_WARN("Skipping bootstrap node ", endpoint, ": ", e.what());
        return std::nullopt;
    }
}

void NodeController::bootstrap(const std::vector<std::string>& endpoints, CountCallback on_complete) {
    std::vector<asio::ip::udp::endpoint> seeds;
    std::set<asio::ip::udp::endpoint> seen;
    for (const auto& endpoint : endpoints) {
        auto resolved = resolve(endpoint);
        if (resolved && seen.insert(*resolved).second) {
            seeds.push_back(*resolved);
        }
    }

    if (seeds.empty()) {
        if (on_complete) {
            on_complete(0);
        }
        return;
    }

    LOG_INFO("Bootstrapping from ", seeds.size(), " seed(s)");
    dht_->bootstrap(std::move(seeds), [on_complete = std::move(on_complete)](size_t answered) {
        if (on_complete) {
            on_complete(answered);
        }
    });
}

std::string NodeController::share(const fs::path& path, CountCallback on_announced) {
    if (!fs::is_regular_file(path)) {
        throw std::invalid_argument("Not a regular file: " + path.string());
    }

    Manifest manifest = Chunker::chunk_file(path, *chunk_store_, node_id_hex());
    chunk_store_->put_manifest(manifest);
    storage_->record_shared_file(manifest, fs::absolute(path));

    std::string hex = Hasher::hash_to_hex(manifest.info_hash);
    LOG_INFO("Sharing ", manifest.file_name, " (", manifest.file_size, " bytes, ", manifest.chunk_count(),
             " chunks) as ", hex);
    announce(manifest.info_hash, std::move(on_announced));
    return hex;
}

void NodeController::announce(const hash_t& info_hash, CountCallback on_announced) {
    std::string hex = Hasher::hash_to_hex(info_hash);
    dht_->announce(dht::key_for_info_hash(info_hash), [hex, on_announced = std::move(on_announced)](size_t acks) {
        LOG_INFO("Announced ", hex, " to ", acks, " node(s)");
        if (on_announced) {
            on_announced(acks);
        }
    });
}

std::shared_ptr<DownloadManager> NodeController::download(const std::string& info_hash_hex) {
    if (!Hasher::is_hex(info_hash_hex, HASH_SIZE)) {
        throw std::invalid_argument("Info hash must be " + std::to_string(HASH_SIZE * 2) +
                                    " hex characters, got '" + info_hash_hex + "'");
    }
    std::string key = info_hash_hex;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    hash_t info_hash = Hasher::hex_to_hash(key);

    std::shared_ptr<DownloadManager> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(key);
        if (it != sessions_.end() && !is_terminal(it->second->phase())) {
            return it->second;
        }

        DownloadOptions options;
        options.per_peer_inflight = config_.per_peer_inflight;
        options.max_inflight = config_.max_inflight;
        options.max_peer_failures = config_.max_peer_failures;
        options.download_dir = config_.download_dir;

        session = std::make_shared<DownloadManager>(io_context_, info_hash, *chunk_store_, *locator_,
                                                    *transfer_client_, options, storage_.get());
        sessions_[key] = session;
        session_order_.erase(std::remove(session_order_.begin(), session_order_.end(), key), session_order_.end());
        session_order_.push_back(key);
        prune_sessions_locked();
    }

    // A finished download is served like any other shared file.
    session->set_completion_handler([this, info_hash](const DownloadSnapshot& snapshot) {
        if (snapshot.phase == DownloadPhase::Complete) {
            announce(info_hash);
        }
    });
    session->start();
    return session;
}

void NodeController::prune_sessions_locked() {
    size_t finished = 0;
    for (const auto& [key, session] : sessions_) {
        if (is_terminal(session->phase())) {
            finished++;
        }
    }
    for (auto it = session_order_.begin(); it != session_order_.end() && finished > config_.finished_sessions_kept;) {
        auto session = sessions_.find(*it);
        if (session != sessions_.end() && is_terminal(session->second->phase())) {
            LOG_DEBUG("Dropping finished download session ", *it);
            sessions_.erase(session);
            it = session_order_.erase(it);
            finished--;
        } else {
            ++it;
        }
    }
}

std::shared_ptr<DownloadManager> NodeController::get_session(const std::string& info_hash_hex) const {
    std::string key = info_hash_hex;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(key);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<DownloadManager>> NodeController::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DownloadManager>> result;
    for (const auto& [key, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::vector<Manifest> NodeController::list_shared() const {
    std::vector<Manifest> shared;
    for (auto& manifest : chunk_store_->list_manifests()) {
        if (chunk_store_->missing_chunks(manifest).empty()) {
            shared.push_back(std::move(manifest));
        }
    }
    return shared;
}

NodeStats NodeController::stats() const {
    NodeStats s;
    s.node_id = node_id_hex();
    s.dht_port = dht_->local_port();
    s.transfer_port = server_->local_port();
    s.routing_table_size = dht_->routing_table().size();
    s.non_empty_buckets = dht_->routing_table().non_empty_buckets();
    s.stored_values = dht_->value_store().value_count();
    s.provider_keys = dht_->value_store().provider_key_count();
    s.shared_files = list_shared().size();
    s.chunks_stored = chunk_store_->chunk_count();
    s.chunks_served = server_->chunks_served();
    s.bytes_served = server_->bytes_served();
    s.inbound_connections = server_->connection_count();
    s.outbound_connections = transfer_client_->connection_count();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, session] : sessions_) {
            if (!is_terminal(session->phase())) {
                s.active_downloads++;
            }
        }
    }
    return s;
}
