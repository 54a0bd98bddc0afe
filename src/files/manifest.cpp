#include "files/manifest.hpp"

#include <algorithm>
#include <cctype>
#include <map>

using json = nlohmann::json;

hash_t compute_info_hash(const std::vector<hash_t>& chunk_hashes) {
    std::vector<uint8_t> concatenated;
    concatenated.reserve(chunk_hashes.size() * HASH_SIZE);
    for (const auto& h : chunk_hashes) {
        concatenated.insert(concatenated.end(), h.begin(), h.end());
    }
    return Hasher::sha256(concatenated);
}

uint64_t Manifest::chunk_length(size_t index) const {
    uint64_t offset = static_cast<uint64_t>(index) * chunk_size;
    if (offset >= file_size) {
        return 0;
    }
    return std::min<uint64_t>(chunk_size, file_size - offset);
}

size_t Manifest::expected_chunk_count() const {
    if (chunk_size == 0) {
        return 0;
    }
    return static_cast<size_t>((file_size + chunk_size - 1) / chunk_size);
}

hash_t Manifest::compute_info_hash() const {
    return ::compute_info_hash(chunk_hashes);
}

bool Manifest::is_consistent() const {
    return chunk_size > 0 &&
           chunk_hashes.size() == expected_chunk_count() &&
           compute_info_hash() == info_hash;
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

// JSON serialization for Manifest
void to_json(json& j, const Manifest& m) {
    j = json{
        {"name", m.file_name},
        {"size", m.file_size},
        {"mime_type", m.mime_type},
        {"chunk_size", m.chunk_size},
        {"info_hash", Hasher::hash_to_hex(m.info_hash)},
        {"created_at", m.created_at},
        {"created_by", m.created_by}
    };
    j["chunks"] = json::array();
    for (const auto& chunk_hash : m.chunk_hashes) {
        j["chunks"].push_back(Hasher::hash_to_hex(chunk_hash));
    }
}

void from_json(const json& j, Manifest& m) {
    j.at("name").get_to(m.file_name);
    j.at("size").get_to(m.file_size);
    j.at("chunk_size").get_to(m.chunk_size);
    m.info_hash = Hasher::hex_to_hash(j.at("info_hash").get<std::string>());
    m.mime_type = j.value("mime_type", std::string("application/octet-stream"));
    m.created_at = j.value("created_at", int64_t{0});
    m.created_by = j.value("created_by", std::string());
    m.chunk_hashes.clear();
    for (const auto& hex_hash : j.at("chunks")) {
        m.chunk_hashes.push_back(Hasher::hex_to_hash(hex_hash.get<std::string>()));
    }
}
