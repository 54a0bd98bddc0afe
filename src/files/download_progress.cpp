#include "files/download_progress.hpp"

using json = nlohmann::json;

const char* to_string(DownloadPhase phase) {
    switch (phase) {
        case DownloadPhase::Initializing: return "initializing";
        case DownloadPhase::FindingPeers: return "finding_peers";
        case DownloadPhase::Downloading: return "downloading";
        case DownloadPhase::Merging: return "merging";
        case DownloadPhase::Complete: return "complete";
        case DownloadPhase::Failed: return "failed";
        case DownloadPhase::Error: return "error";
    }
    return "unknown";
}

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Downloading: return "downloading";
        case ChunkStatus::Complete: return "complete";
        case ChunkStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(EventType type) {
    switch (type) {
        case EventType::PhaseChanged: return "phase";
        case EventType::ChunkUpdated: return "chunk";
        case EventType::PeerUpdated: return "peer";
    }
    return "unknown";
}

bool is_terminal(DownloadPhase phase) {
    return phase == DownloadPhase::Complete || phase == DownloadPhase::Failed || phase == DownloadPhase::Error;
}

void to_json(json& j, const ChunkUpdate& c) {
    j = json{{"index", c.index}, {"status", to_string(c.status)}, {"peer", c.peer}};
}

void to_json(json& j, const PeerStats& p) {
    j = json{
        {"peer", p.peer},
        {"assigned", p.assigned},
        {"completed", p.completed},
        {"failed", p.failed},
        {"in_flight", p.in_flight},
        {"bytes", p.bytes},
        {"active", p.active}
    };
}

void to_json(json& j, const ProgressTotals& t) {
    j = json{
        {"chunks_total", t.chunks_total},
        {"chunks_done", t.chunks_done},
        {"bytes_total", t.bytes_total},
        {"bytes_done", t.bytes_done},
        {"percent", t.percent},
        {"throughput_bps", t.throughput_bps},
        {"elapsed_s", t.elapsed_s}
    };
}

void to_json(json& j, const DownloadEvent& e) {
    j = json{
        {"seq", e.seq},
        {"type", to_string(e.type)},
        {"phase", to_string(e.phase)},
        {"totals", e.totals}
    };
    if (e.chunk) j["chunk"] = *e.chunk;
    if (e.peer) j["peer"] = *e.peer;
    if (!e.message.empty()) j["message"] = e.message;
}

void to_json(json& j, const DownloadSnapshot& s) {
    j = json{
        {"info_hash", s.info_hash},
        {"file_name", s.file_name},
        {"phase", to_string(s.phase)},
        {"chunks", s.chunks},
        {"peers", s.peers},
        {"totals", s.totals},
        {"message", s.message},
        {"output_path", s.output_path}
    };
}

std::string to_sse(const DownloadEvent& event) {
    return "id: " + std::to_string(event.seq) + "\ndata: " + json(event).dump() + "\n\n";
}

// --- ProgressChannel ---

uint64_t ProgressChannel::publish(DownloadEvent event) {
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        seq = events_.size() + 1;
        event.seq = seq;
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
    return seq;
}

std::vector<DownloadEvent> ProgressChannel::read_from(uint64_t from_seq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start = from_seq > 0 ? static_cast<size_t>(from_seq - 1) : 0;
    if (start >= events_.size()) {
        return {};
    }
    return std::vector<DownloadEvent>(events_.begin() + static_cast<std::ptrdiff_t>(start), events_.end());
}

std::vector<DownloadEvent> ProgressChannel::wait_for(uint64_t from_seq, std::chrono::milliseconds timeout) const {
    size_t start = from_seq > 0 ? static_cast<size_t>(from_seq - 1) : 0;
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]() { return closed_ || events_.size() > start; });
    if (start >= events_.size()) {
        return {};
    }
    return std::vector<DownloadEvent>(events_.begin() + static_cast<std::ptrdiff_t>(start), events_.end());
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
