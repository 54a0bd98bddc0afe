#ifndef LANSHARE_CHUNK_STORE_HPP
#define LANSHARE_CHUNK_STORE_HPP

#include "manifest.hpp"
#include <atomic>
#include <filesystem>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Content-addressed chunk storage on disk.
 *
 * Layout under the root directory:
 *   chunks/<first two hex chars>/<sha256 hex>
 *   manifests/<info hash hex>.json
 *   temp/  (in-progress writes)
 *
 * Chunks are written to temp/ and renamed into place, so a chunk file is
 * either absent or complete. Writing the same hash twice is harmless.
 * Safe for concurrent use.
 */
class ChunkStore {
public:
    // Creates the directory layout; throws P2PError(StorageIO) on failure.
    explicit ChunkStore(fs::path root);

    const fs::path& root() const { return root_; }

    bool has_chunk(const hash_t& chunk_hash) const;

    /**
     * @brief Verifies and stores a chunk.
     * @return false if `data` does not hash to `chunk_hash`; nothing is written then.
     * @throws P2PError(StorageIO) if the write fails.
     */
    bool put_chunk(const hash_t& chunk_hash, const std::vector<uint8_t>& data);

    /**
     * @brief Reads a chunk and re-verifies its hash.
     * A corrupted file is deleted and reported as absent.
     */
    std::optional<std::vector<uint8_t>> get_chunk(const hash_t& chunk_hash);

    bool delete_chunk(const hash_t& chunk_hash);

    // Indices of manifest chunks not present locally.
    std::vector<size_t> missing_chunks(const Manifest& manifest) const;

    void put_manifest(const Manifest& manifest);
    std::optional<Manifest> get_manifest(const hash_t& info_hash) const;
    std::vector<Manifest> list_manifests() const;

    size_t chunk_count() const;

    fs::path chunk_path(const hash_t& chunk_hash) const;

private:
    fs::path manifest_path(const hash_t& info_hash) const;
    fs::path temp_path(const std::string& stem);
    void write_atomically(const fs::path& target, const uint8_t* data, size_t size);

    fs::path root_;
    fs::path chunks_dir_;
    fs::path manifests_dir_;
    fs::path temp_dir_;
    std::atomic<uint64_t> temp_counter_{0};
};

#endif //LANSHARE_CHUNK_STORE_HPP
