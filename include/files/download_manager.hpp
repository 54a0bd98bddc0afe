#ifndef LANSHARE_DOWNLOAD_MANAGER_HPP
#define LANSHARE_DOWNLOAD_MANAGER_HPP

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "manifest.hpp"
#include "chunk_store.hpp"
#include "download_progress.hpp"
#include "../network/transfer_client.hpp"
#include "../storage/metadata_sink.hpp"

namespace fs = std::filesystem;

// Finds peers that announced a file. The callback may run on any thread.
class ProviderLocator {
public:
    using ProvidersCallback = std::function<void(std::vector<PeerAddress>)>;

    virtual ~ProviderLocator() = default;
    virtual void find_providers(const hash_t& info_hash, ProvidersCallback callback) = 0;
};

struct DownloadOptions {
    size_t per_peer_inflight = 4;
    size_t max_inflight = 16;
    size_t max_peer_failures = 3;
    fs::path download_dir = "data/files";
};

/**
 * @brief One swarm download session for a single info hash.
 *
 * Phases run initializing, finding_peers, downloading, merging and end in
 * complete, failed or error. All session state is mutated on the session's
 * strand; other threads read it through snapshot() or the event channel.
 */
class DownloadManager : public std::enable_shared_from_this<DownloadManager> {
public:
    using CompletionHandler = std::function<void(const DownloadSnapshot&)>;

    DownloadManager(asio::io_context& io_context,
                    const hash_t& info_hash,
                    ChunkStore& store,
                    ProviderLocator& locator,
                    ChunkSource& source,
                    DownloadOptions options,
                    MetadataSink* sink = nullptr);

    void start();

    // Stops issuing requests and ends the session in failed("cancelled").
    void cancel();

    DownloadPhase phase() const { return phase_.load(); }
    DownloadSnapshot snapshot() const;

    ProgressChannel& events() { return events_; }

    const hash_t& info_hash() const { return info_hash_; }
    std::string info_hash_hex() const;

    // Called once, on the session strand, when a terminal phase is reached.
    void set_completion_handler(CompletionHandler handler);

private:
    struct ChunkState {
        ChunkStatus status = ChunkStatus::Pending;
        std::string peer;
        std::set<std::string> failed_peers;
    };

    struct PeerState {
        PeerAddress address;
        PeerStats stats;
    };

    void begin();
    void on_providers(std::vector<PeerAddress> providers);
    void request_manifest(size_t provider_index);
    void on_manifest(size_t provider_index, TransferStatus status, const std::vector<uint8_t>& data);
    void begin_download(Manifest manifest);

    void schedule();
    void on_chunk(size_t index, const std::string& peer_key, TransferStatus status, std::vector<uint8_t> data);
    void merge();
    void finish(DownloadPhase phase, const std::string& message);

    // Callers hold mutex_.
    PeerState& add_peer_locked(const PeerAddress& address);
    PeerState* pick_peer_locked(size_t chunk_index);
    void penalize_locked(PeerState& peer, const std::string& reason);
    void set_phase_locked(DownloadPhase phase, const std::string& message = "");
    void publish_chunk_locked(size_t index);
    void publish_peer_locked(const PeerState& peer);
    ProgressTotals totals_locked() const;
    DownloadSnapshot snapshot_locked() const;

    void record(const std::string& status);

    asio::strand<asio::io_context::executor_type> strand_;
    hash_t info_hash_;
    ChunkStore& store_;
    ProviderLocator& locator_;
    ChunkSource& source_;
    DownloadOptions options_;
    MetadataSink* sink_;

    mutable std::mutex mutex_;
    std::atomic<DownloadPhase> phase_{DownloadPhase::Initializing};
    std::optional<Manifest> manifest_;
    std::vector<ChunkState> chunks_;
    std::map<std::string, PeerState> peers_;
    std::vector<PeerAddress> providers_;
    size_t in_flight_ = 0;
    size_t chunks_done_ = 0;
    uint64_t bytes_done_ = 0;
    uint64_t bytes_fetched_ = 0;
    std::chrono::steady_clock::time_point started_at_;
    std::string message_;
    std::string output_path_;
    bool started_ = false;

    ProgressChannel events_;
    CompletionHandler completion_handler_;
};

#endif //LANSHARE_DOWNLOAD_MANAGER_HPP
