#include "files/chunker.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace {

std::vector<uint8_t> load_chunk(const Manifest& manifest, ChunkStore& store, size_t index) {
    auto data = store.get_chunk(manifest.chunk_hashes[index]);
    if (!data) {
        throw P2PError(ErrorKind::NotFound, "Missing chunk " + std::to_string(index) + " (" +
                       Hasher::hash_to_hex(manifest.chunk_hashes[index]) + ")");
    }
    return std::move(*data);
}

} // namespace

Manifest Chunker::chunk_file(const fs::path& file_path, ChunkStore& store, const std::string& created_by) {
    if (!fs::exists(file_path) || !fs::is_regular_file(file_path)) {
        throw std::runtime_error("File does not exist or is not a regular file: " + file_path.string());
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    Manifest manifest;
    manifest.file_name = file_path.filename().string();
    manifest.file_size = fs::file_size(file_path);
    manifest.mime_type = guess_mime_type(file_path);
    manifest.chunk_size = CHUNK_SIZE;
    manifest.created_by = created_by;
    manifest.created_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    size_t chunk_count = manifest.expected_chunk_count();
    manifest.chunk_hashes.reserve(chunk_count);

    std::vector<uint8_t> buffer(CHUNK_SIZE);
    for (size_t i = 0; i < chunk_count; ++i) {
        buffer.resize(CHUNK_SIZE);
        file.read(reinterpret_cast<char*>(buffer.data()), CHUNK_SIZE);
        std::streamsize bytes_read = file.gcount();
        if (static_cast<uint64_t>(bytes_read) != manifest.chunk_length(i)) {
            throw std::runtime_error("Short read on " + file_path.string() + " at chunk " + std::to_string(i));
        }
        buffer.resize(static_cast<size_t>(bytes_read));

        hash_t chunk_hash = Hasher::sha256(buffer);
        store.put_chunk(chunk_hash, buffer);
        manifest.chunk_hashes.push_back(chunk_hash);
    }

    manifest.info_hash = manifest.compute_info_hash();

    LOG_INFO("Chunked ", manifest.file_name, ": ", manifest.file_size, " bytes in ",
             manifest.chunk_count(), " chunks, info hash ", Hasher::hash_to_hex(manifest.info_hash));
    return manifest;
}

std::vector<uint8_t> Chunker::reassemble(const Manifest& manifest, ChunkStore& store) {
    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(manifest.file_size));
    for (size_t i = 0; i < manifest.chunk_count(); ++i) {
        auto data = load_chunk(manifest, store, i);
        out.insert(out.end(), data.begin(), data.end());
    }
    return out;
}

void Chunker::reassemble_to_file(const Manifest& manifest, ChunkStore& store, const fs::path& output) {
    std::error_code ec;
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            throw P2PError(ErrorKind::StorageIO, "Failed to create " + output.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = output;
    temp += ".part";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw P2PError(ErrorKind::StorageIO, "Failed to open " + temp.string() + " for writing");
        }
        for (size_t i = 0; i < manifest.chunk_count(); ++i) {
            std::vector<uint8_t> data;
            try {
                data = load_chunk(manifest, store, i);
            } catch (const P2PError&) {
                out.close();
                fs::remove(temp, ec);
                throw;
            }
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out) {
                out.close();
                fs::remove(temp, ec);
                throw P2PError(ErrorKind::StorageIO, "Failed to write " + temp.string());
            }
        }
    }

    fs::rename(temp, output, ec);
    if (ec) {
        // Fall back to copy and delete when rename is not possible.
        LOG_WARN("Failed to rename ", temp, ": ", ec.message(), ". Attempting copy and delete.");
        std::error_code copy_ec;
        fs::copy_file(temp, output, fs::copy_options::overwrite_existing, copy_ec);
        fs::remove(temp, ec);
        if (copy_ec) {
            throw P2PError(ErrorKind::StorageIO, "Failed to move " + temp.string() + " to " +
                           output.string() + ": " + copy_ec.message());
        }
    }
}
