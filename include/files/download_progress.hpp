#ifndef LANSHARE_DOWNLOAD_PROGRESS_HPP
#define LANSHARE_DOWNLOAD_PROGRESS_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class DownloadPhase {
    Initializing,
    FindingPeers,
    Downloading,
    Merging,
    Complete,
    Failed,
    Error
};

enum class ChunkStatus {
    Pending,
    Downloading,
    Complete,
    Failed
};

enum class EventType {
    PhaseChanged,
    ChunkUpdated,
    PeerUpdated
};

const char* to_string(DownloadPhase phase);
const char* to_string(ChunkStatus status);
const char* to_string(EventType type);

bool is_terminal(DownloadPhase phase);

struct ChunkUpdate {
    size_t index = 0;
    ChunkStatus status = ChunkStatus::Pending;
    std::string peer; // assigned peer, empty when unassigned
};

struct PeerStats {
    std::string peer;
    size_t assigned = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t in_flight = 0;
    uint64_t bytes = 0;
    bool active = true;
};

struct ProgressTotals {
    size_t chunks_total = 0;
    size_t chunks_done = 0;
    uint64_t bytes_total = 0;
    uint64_t bytes_done = 0;
    double percent = 0.0;
    double throughput_bps = 0.0;
    double elapsed_s = 0.0;
};

struct DownloadEvent {
    uint64_t seq = 0;
    EventType type = EventType::PhaseChanged;
    DownloadPhase phase = DownloadPhase::Initializing;
    std::optional<ChunkUpdate> chunk;
    std::optional<PeerStats> peer;
    ProgressTotals totals;
    std::string message;
};

// Immutable copy of a session's state at one instant.
struct DownloadSnapshot {
    std::string info_hash;
    std::string file_name;
    DownloadPhase phase = DownloadPhase::Initializing;
    std::vector<ChunkUpdate> chunks;
    std::vector<PeerStats> peers;
    ProgressTotals totals;
    std::string message;
    std::string output_path;
};

void to_json(nlohmann::json& j, const ChunkUpdate& c);
void to_json(nlohmann::json& j, const PeerStats& p);
void to_json(nlohmann::json& j, const ProgressTotals& t);
void to_json(nlohmann::json& j, const DownloadEvent& e);
void to_json(nlohmann::json& j, const DownloadSnapshot& s);

// One server-sent-events frame: "id: <seq>\ndata: <json>\n\n".
std::string to_sse(const DownloadEvent& event);

/**
 * @brief Append-only, replayable log of one session's events.
 *
 * The session publishes without knowing who listens. Each subscriber keeps
 * its own cursor (the next sequence number it wants) and can start from 0 to
 * replay everything. Closed once the session reaches a terminal phase.
 */
class ProgressChannel {
public:
    // Assigns the next sequence number (starting at 1) and appends.
    uint64_t publish(DownloadEvent event);

    // Events with seq >= from_seq.
    std::vector<DownloadEvent> read_from(uint64_t from_seq) const;

    /**
     * @brief Blocks until events with seq >= from_seq exist, the channel is
     * closed, or the timeout elapses. Returns whatever is available.
     */
    std::vector<DownloadEvent> wait_for(uint64_t from_seq, std::chrono::milliseconds timeout) const;

    void close();
    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<DownloadEvent> events_;
    bool closed_ = false;
};

#endif // LANSHARE_DOWNLOAD_PROGRESS_HPP
