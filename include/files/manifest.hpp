#ifndef LANSHARE_MANIFEST_HPP
#define LANSHARE_MANIFEST_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <array>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "../crypto/hasher.hpp" // For hash_t

// Files are split into fixed 256 KiB chunks; the last chunk may be shorter.
constexpr uint32_t CHUNK_SIZE = 256 * 1024;

struct Manifest {
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type = "application/octet-stream";
    uint32_t chunk_size = CHUNK_SIZE;
    std::vector<hash_t> chunk_hashes;
    hash_t info_hash{}; // SHA-256 of the concatenated chunk hashes
    int64_t created_at = 0; // unix seconds
    std::string created_by; // node ID hex of the publisher

    size_t chunk_count() const { return chunk_hashes.size(); }

    // Byte length of chunk `index`.
    uint64_t chunk_length(size_t index) const;

    // Chunk count implied by file_size and chunk_size.
    size_t expected_chunk_count() const;

    hash_t compute_info_hash() const;

    // info_hash matches the chunk hashes and the chunk count matches the size.
    bool is_consistent() const;
};

hash_t compute_info_hash(const std::vector<hash_t>& chunk_hashes);

// Guesses a MIME type from the file extension.
std::string guess_mime_type(const std::filesystem::path& path);

// JSON serialization for Manifest
void to_json(nlohmann::json& j, const Manifest& m);
void from_json(const nlohmann::json& j, Manifest& m);

#endif //LANSHARE_MANIFEST_HPP
