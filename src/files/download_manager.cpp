#include "files/download_manager.hpp"
#include "files/chunker.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <algorithm>

DownloadManager::DownloadManager(asio::io_context& io_context,
                                 const hash_t& info_hash,
                                 ChunkStore& store,
                                 ProviderLocator& locator,
                                 ChunkSource& source,
                                 DownloadOptions options,
                                 MetadataSink* sink)
    : strand_(asio::make_strand(io_context)),
      info_hash_(info_hash),
      store_(store),
      locator_(locator),
      source_(source),
      options_(std::move(options)),
      sink_(sink),
      started_at_(std::chrono::steady_clock::now()) {
    LOG_DEBUG("DownloadManager created for hash: ", info_hash_hex());
}

std::string DownloadManager::info_hash_hex() const {
    return Hasher::hash_to_hex(info_hash_);
}

void DownloadManager::set_completion_handler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_handler_ = std::move(handler);
}

void DownloadManager::start() {
    asio::post(strand_, [self = shared_from_this()]() {
        self->begin();
    });
}

void DownloadManager::cancel() {
    asio::post(strand_, [self = shared_from_this()]() {
        if (is_terminal(self->phase())) {
            return;
        }
        LOG_INFO("Download of ", self->info_hash_hex(), " cancelled");
        self->finish(DownloadPhase::Failed, "cancelled");
    });
}

DownloadSnapshot DownloadManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

// --- Phases ---

void DownloadManager::begin() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || is_terminal(phase_.load())) {
            return;
        }
        started_ = true;
        started_at_ = std::chrono::steady_clock::now();
        set_phase_locked(DownloadPhase::Initializing, "session created");
    }
    LOG_INFO("Starting download of ", info_hash_hex());
    record(to_string(DownloadPhase::Initializing));

    auto local = store_.get_manifest(info_hash_);
    if (local && store_.missing_chunks(*local).empty()) {
        LOG_INFO("All chunks of ", local->file_name, " are already stored locally");
        begin_download(std::move(*local));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (local) {
            manifest_ = std::move(local);
        }
        set_phase_locked(DownloadPhase::FindingPeers);
    }

    locator_.find_providers(info_hash_, [self = shared_from_this()](std::vector<PeerAddress> providers) {
        asio::post(self->strand_, [self, providers = std::move(providers)]() mutable {
            self->on_providers(std::move(providers));
        });
    });
}

void DownloadManager::on_providers(std::vector<PeerAddress> providers) {
    if (is_terminal(phase())) {
        return;
    }

    std::vector<PeerAddress> unique;
    std::set<PeerAddress> seen;
    for (auto& provider : providers) {
        if (seen.insert(provider).second) {
            unique.push_back(std::move(provider));
        }
    }

    if (unique.empty()) {
        LOG_WARN("No providers found for ", info_hash_hex());
        finish(DownloadPhase::Failed, "no providers");
        return;
    }

    LOG_INFO("Found ", unique.size(), " provider(s) for ", info_hash_hex());
    bool have_manifest;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers_ = unique;
        for (const auto& provider : providers_) {
            publish_peer_locked(add_peer_locked(provider));
        }
        have_manifest = manifest_.has_value();
    }

    if (have_manifest) {
        begin_download(*manifest_);
    } else {
        request_manifest(0);
    }
}

void DownloadManager::request_manifest(size_t provider_index) {
    if (provider_index >= providers_.size()) {
        LOG_WARN("No provider returned a valid manifest for ", info_hash_hex());
        finish(DownloadPhase::Failed, "manifest not found");
        return;
    }

    const PeerAddress& peer = providers_[provider_index];
    LOG_DEBUG("Requesting manifest ", info_hash_hex(), " from ", peer.to_string());
    source_.request_manifest(peer, info_hash_,
        [self = shared_from_this(), provider_index](TransferStatus status, std::vector<uint8_t> data) {
            asio::post(self->strand_, [self, provider_index, status, data = std::move(data)]() {
                self->on_manifest(provider_index, status, data);
            });
        });
}

void DownloadManager::on_manifest(size_t provider_index, TransferStatus status, const std::vector<uint8_t>& data) {
    if (is_terminal(phase())) {
        return;
    }

    const PeerAddress& peer = providers_[provider_index];
    std::string failure;

    if (status == TransferStatus::Ok) {
        std::optional<Manifest> manifest;
        try {
            manifest = nlohmann::json::parse(data.begin(), data.end()).get<Manifest>();
        } catch (const std::exception& e) {
            failure = std::string("malformed manifest: ") + e.what();
        }

        if (manifest && (manifest->info_hash != info_hash_ || !manifest->is_consistent())) {
            failure = "manifest does not match the requested info hash";
            manifest.reset();
        }

        if (manifest) {
            try {
                store_.put_manifest(*manifest);
            } catch (const P2PError& e) {
                LOG_ERR("Failed to store manifest: ", e.what());
                finish(DownloadPhase::Error, e.what());
                return;
            }
            LOG_INFO("Received manifest for ", manifest->file_name, " (", manifest->chunk_count(),
                     " chunks) from ", peer.to_string());
            begin_download(std::move(*manifest));
            return;
        }
    } else if (status != TransferStatus::NotFound) {
        failure = to_string(status);
    }

    if (!failure.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peers_.find(peer.to_string());
        if (it != peers_.end()) {
            penalize_locked(it->second, failure);
            publish_peer_locked(it->second);
        }
    }
    request_manifest(provider_index + 1);
}

void DownloadManager::begin_download(Manifest manifest) {
    std::vector<size_t> missing = store_.missing_chunks(manifest);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.assign(manifest.chunk_count(), ChunkState{});
        chunks_done_ = 0;
        bytes_done_ = 0;

        std::vector<bool> is_missing(manifest.chunk_count(), false);
        for (size_t index : missing) {
            is_missing[index] = true;
        }
        for (size_t i = 0; i < chunks_.size(); ++i) {
            if (!is_missing[i]) {
                chunks_[i].status = ChunkStatus::Complete;
                chunks_done_++;
                bytes_done_ += manifest.chunk_length(i);
            }
        }
        manifest_ = std::move(manifest);

        std::string message;
        if (chunks_done_ > 0) {
            message = std::to_string(chunks_done_) + " of " + std::to_string(chunks_.size()) + " chunks already present";
        }
        set_phase_locked(DownloadPhase::Downloading, message);
    }
    record(to_string(DownloadPhase::Downloading));
    schedule();
}

// --- Scheduling ---

void DownloadManager::schedule() {
    struct Assignment {
        size_t index;
        std::string peer_key;
        PeerAddress address;
        hash_t chunk_hash;
    };

    std::vector<Assignment> assignments;
    bool done = false;
    bool stalled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_.load() != DownloadPhase::Downloading) {
            return;
        }

        for (size_t i = 0; i < chunks_.size() && in_flight_ < options_.max_inflight; ++i) {
            if (chunks_[i].status != ChunkStatus::Pending) {
                continue;
            }
            PeerState* peer = pick_peer_locked(i);
            if (!peer) {
                continue;
            }

            chunks_[i].status = ChunkStatus::Downloading;
            chunks_[i].peer = peer->stats.peer;
            peer->stats.assigned++;
            peer->stats.in_flight++;
            in_flight_++;
            publish_chunk_locked(i);
            publish_peer_locked(*peer);
            assignments.push_back({i, peer->stats.peer, peer->address, manifest_->chunk_hashes[i]});
        }

        if (chunks_done_ == chunks_.size()) {
            done = true;
        } else if (in_flight_ == 0) {
            stalled = true;
        }
    }

    if (done) {
        merge();
        return;
    }
    if (stalled) {
        LOG_WARN("Download of ", info_hash_hex(), " stalled: no peer can serve the remaining chunks");
        finish(DownloadPhase::Failed, "insufficient chunks");
        return;
    }

    for (auto& a : assignments) {
        source_.request_chunk(a.address, a.chunk_hash,
            [self = shared_from_this(), index = a.index, key = a.peer_key](TransferStatus status,
                                                                          std::vector<uint8_t> data) mutable {
                asio::post(self->strand_, [self, index, key = std::move(key), status, data = std::move(data)]() mutable {
                    self->on_chunk(index, key, status, std::move(data));
                });
            });
    }
}

DownloadManager::PeerState* DownloadManager::pick_peer_locked(size_t chunk_index) {
    const auto& excluded = chunks_[chunk_index].failed_peers;
    PeerState* best = nullptr;
    for (auto& [key, peer] : peers_) {
        if (!peer.stats.active || peer.stats.in_flight >= options_.per_peer_inflight || excluded.count(key)) {
            continue;
        }
        if (!best || peer.stats.in_flight < best->stats.in_flight ||
            (peer.stats.in_flight == best->stats.in_flight && peer.stats.assigned < best->stats.assigned)) {
            best = &peer;
        }
    }
    return best;
}

void DownloadManager::on_chunk(size_t index, const std::string& peer_key, TransferStatus status,
                               std::vector<uint8_t> data) {
    if (is_terminal(phase())) {
        return;
    }

    bool stored = false;
    std::string failure;
    if (status == TransferStatus::Ok) {
        try {
            stored = store_.put_chunk(manifest_->chunk_hashes[index], data);
        } catch (const P2PError& e) {
            LOG_ERR("Failed to store chunk ", index, ": ", e.what());
            finish(DownloadPhase::Error, e.what());
            return;
        }
        if (!stored) {
            LOG_WARN("Chunk ", index, " from ", peer_key, " failed hash verification");
            failure = "hash mismatch";
        }
    } else if (status != TransferStatus::NotFound) {
        LOG_DEBUG("Chunk ", index, " from ", peer_key, " failed: ", to_string(status));
        failure = to_string(status);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
        PeerState& peer = peers_.at(peer_key);
        peer.stats.in_flight--;

        ChunkState& chunk = chunks_[index];
        if (stored) {
            chunk.status = ChunkStatus::Complete;
            chunks_done_++;
            bytes_done_ += data.size();
            bytes_fetched_ += data.size();
            peer.stats.completed++;
            peer.stats.bytes += data.size();
        } else {
            chunk.status = ChunkStatus::Pending;
            chunk.peer.clear();
            chunk.failed_peers.insert(peer_key);
            if (!failure.empty()) {
                penalize_locked(peer, failure);
            }
        }
        publish_chunk_locked(index);
        publish_peer_locked(peer);
    }

    schedule();
}

void DownloadManager::penalize_locked(PeerState& peer, const std::string& reason) {
    peer.stats.failed++;
    LOG_WARN("Peer ", peer.stats.peer, " failed (", reason, "), ", peer.stats.failed, "/",
             options_.max_peer_failures);
    if (peer.stats.active && peer.stats.failed >= options_.max_peer_failures) {
        peer.stats.active = false;
        LOG_WARN("Peer ", peer.stats.peer, " marked inactive");
    }
}

void DownloadManager::merge() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_phase_locked(DownloadPhase::Merging);
    }

    fs::path name = fs::path(manifest_->file_name).filename();
    if (name.empty() || name == "." || name == "..") {
        name = info_hash_hex();
    }
    fs::path output = options_.download_dir / name;

    try {
        fs::create_directories(options_.download_dir);
        Chunker::reassemble_to_file(*manifest_, store_, output);
    } catch (const std::exception& e) {
        LOG_ERR("Failed to assemble ", output.string(), ": ", e.what());
        finish(DownloadPhase::Error, e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        output_path_ = output.string();
    }
    LOG_INFO("Download complete: ", output.string());
    finish(DownloadPhase::Complete, "saved to " + output.string());
}

void DownloadManager::finish(DownloadPhase phase, const std::string& message) {
    DownloadSnapshot snap;
    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(phase_.load())) {
            return;
        }
        if (phase != DownloadPhase::Complete) {
            for (size_t i = 0; i < chunks_.size(); ++i) {
                if (chunks_[i].status != ChunkStatus::Complete) {
                    chunks_[i].status = ChunkStatus::Failed;
                    publish_chunk_locked(i);
                }
            }
        }
        message_ = message;
        set_phase_locked(phase, message);
        snap = snapshot_locked();
        handler = std::move(completion_handler_);
        completion_handler_ = nullptr;
    }
    events_.close();

    if (phase != DownloadPhase::Complete) {
        LOG_WARN("Download of ", info_hash_hex(), " ended ", to_string(phase), ": ", message);
    }
    record(to_string(phase));

    if (handler) {
        handler(snap);
    }
}

// --- Bookkeeping ---

DownloadManager::PeerState& DownloadManager::add_peer_locked(const PeerAddress& address) {
    std::string key = address.to_string();
    auto it = peers_.find(key);
    if (it == peers_.end()) {
        PeerState state;
        state.address = address;
        state.stats.peer = key;
        it = peers_.emplace(key, std::move(state)).first;
    }
    return it->second;
}

void DownloadManager::set_phase_locked(DownloadPhase phase, const std::string& message) {
    phase_.store(phase);
    DownloadEvent event;
    event.type = EventType::PhaseChanged;
    event.phase = phase;
    event.totals = totals_locked();
    event.message = message;
    events_.publish(std::move(event));
}

void DownloadManager::publish_chunk_locked(size_t index) {
    DownloadEvent event;
    event.type = EventType::ChunkUpdated;
    event.phase = phase_.load();
    event.chunk = ChunkUpdate{index, chunks_[index].status, chunks_[index].peer};
    event.totals = totals_locked();
    events_.publish(std::move(event));
}

void DownloadManager::publish_peer_locked(const PeerState& peer) {
    DownloadEvent event;
    event.type = EventType::PeerUpdated;
    event.phase = phase_.load();
    event.peer = peer.stats;
    event.totals = totals_locked();
    events_.publish(std::move(event));
}

ProgressTotals DownloadManager::totals_locked() const {
    ProgressTotals totals;
    totals.chunks_total = chunks_.size();
    totals.chunks_done = chunks_done_;
    totals.bytes_total = manifest_ ? manifest_->file_size : 0;
    totals.bytes_done = bytes_done_;
    if (totals.bytes_total > 0) {
        totals.percent = 100.0 * static_cast<double>(totals.bytes_done) / static_cast<double>(totals.bytes_total);
    } else if (manifest_ && chunks_done_ == chunks_.size() && phase_.load() >= DownloadPhase::Downloading) {
        totals.percent = 100.0;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
    totals.elapsed_s = elapsed;
    totals.throughput_bps = elapsed > 0.0 ? static_cast<double>(bytes_fetched_) / elapsed : 0.0;
    return totals;
}

DownloadSnapshot DownloadManager::snapshot_locked() const {
    DownloadSnapshot snap;
    snap.info_hash = info_hash_hex();
    snap.file_name = manifest_ ? manifest_->file_name : "";
    snap.phase = phase_.load();
    snap.chunks.reserve(chunks_.size());
    for (size_t i = 0; i < chunks_.size(); ++i) {
        snap.chunks.push_back(ChunkUpdate{i, chunks_[i].status, chunks_[i].peer});
    }
    for (const auto& [key, peer] : peers_) {
        snap.peers.push_back(peer.stats);
    }
    snap.totals = totals_locked();
    snap.message = message_;
    snap.output_path = output_path_;
    return snap;
}

void DownloadManager::record(const std::string& status) {
    if (!sink_) {
        return;
    }
    std::string file_name;
    std::string output_path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_name = manifest_ ? manifest_->file_name : "";
        output_path = output_path_;
    }
    sink_->record_download(info_hash_hex(), file_name, status, output_path);
}
