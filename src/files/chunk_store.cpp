#include "files/chunk_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <fstream>
#include <functional>
#include <thread>

using json = nlohmann::json;

ChunkStore::ChunkStore(fs::path root)
    : root_(std::move(root)),
      chunks_dir_(root_ / "chunks"),
      manifests_dir_(root_ / "manifests"),
      temp_dir_(root_ / "temp") {
    std::error_code ec;
    for (const auto& dir : {chunks_dir_, manifests_dir_, temp_dir_}) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw P2PError(ErrorKind::StorageIO, "Failed to create " + dir.string() + ": " + ec.message());
        }
    }
}

fs::path ChunkStore::chunk_path(const hash_t& chunk_hash) const {
    std::string hex = Hasher::hash_to_hex(chunk_hash);
    return chunks_dir_ / hex.substr(0, 2) / hex;
}

fs::path ChunkStore::manifest_path(const hash_t& info_hash) const {
    return manifests_dir_ / (Hasher::hash_to_hex(info_hash) + ".json");
}

fs::path ChunkStore::temp_path(const std::string& stem) {
    size_t thread_tag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return temp_dir_ / (stem + "." + std::to_string(thread_tag) + "." +
                        std::to_string(temp_counter_.fetch_add(1)) + ".tmp");
}

void ChunkStore::write_atomically(const fs::path& target, const uint8_t* data, size_t size) {
    fs::path temp = temp_path(target.filename().string());
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw P2PError(ErrorKind::StorageIO, "Failed to open " + temp.string() + " for writing");
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw P2PError(ErrorKind::StorageIO, "Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw P2PError(ErrorKind::StorageIO, "Failed to move chunk into " + target.string() + ": " + ec.message());
    }
}

bool ChunkStore::has_chunk(const hash_t& chunk_hash) const {
    std::error_code ec;
    return fs::is_regular_file(chunk_path(chunk_hash), ec);
}

bool ChunkStore::put_chunk(const hash_t& chunk_hash, const std::vector<uint8_t>& data) {
    if (Hasher::sha256(data) != chunk_hash) {
        LOG_WARN("Refusing to store chunk ", Hasher::hash_to_hex(chunk_hash), ": hash mismatch");
        return false;
    }
    if (has_chunk(chunk_hash)) {
        return true;
    }
    write_atomically(chunk_path(chunk_hash), data.data(), data.size());
    return true;
}

std::optional<std::vector<uint8_t>> ChunkStore::get_chunk(const hash_t& chunk_hash) {
    fs::path path = chunk_path(chunk_hash);
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();

    if (Hasher::sha256(data) != chunk_hash) {
        LOG_ERR("Chunk ", Hasher::hash_to_hex(chunk_hash), " is corrupted on disk, deleting it");
        std::error_code ec;
        fs::remove(path, ec);
        return std::nullopt;
    }
    return data;
}

bool ChunkStore::delete_chunk(const hash_t& chunk_hash) {
    std::error_code ec;
    return fs::remove(chunk_path(chunk_hash), ec);
}

std::vector<size_t> ChunkStore::missing_chunks(const Manifest& manifest) const {
    std::vector<size_t> missing;
    for (size_t i = 0; i < manifest.chunk_hashes.size(); ++i) {
        if (!has_chunk(manifest.chunk_hashes[i])) {
            missing.push_back(i);
        }
    }
    return missing;
}

void ChunkStore::put_manifest(const Manifest& manifest) {
    std::string text = json(manifest).dump(2);
    write_atomically(manifest_path(manifest.info_hash),
                     reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::optional<Manifest> ChunkStore::get_manifest(const hash_t& info_hash) const {
    std::ifstream in(manifest_path(info_hash));
    if (!in.is_open()) {
        return std::nullopt;
    }
    try {
        Manifest manifest = json::parse(in).get<Manifest>();
        if (manifest.info_hash != info_hash || !manifest.is_consistent()) {
            LOG_WARN("Stored manifest ", Hasher::hash_to_hex(info_hash), " is inconsistent, ignoring it");
            return std::nullopt;
        }
        return manifest;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to read manifest ", Hasher::hash_to_hex(info_hash), ": ", e.what());
        return std::nullopt;
    }
}

std::vector<Manifest> ChunkStore::list_manifests() const {
    std::vector<Manifest> manifests;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(manifests_dir_, ec)) {
        if (entry.path().extension() != ".json") {
            continue;
        }
        std::string stem = entry.path().stem().string();
        if (!Hasher::is_hex(stem, HASH_SIZE)) {
            continue;
        }
        if (auto manifest = get_manifest(Hasher::hex_to_hash(stem))) {
            manifests.push_back(std::move(*manifest));
        }
    }
    return manifests;
}

size_t ChunkStore::chunk_count() const {
    size_t count = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(chunks_dir_, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec)) {
            ++count;
        }
    }
    return count;
}
