#ifndef LANSHARE_CHUNKER_HPP
#define LANSHARE_CHUNKER_HPP

#include "manifest.hpp"
#include "chunk_store.hpp"
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

class Chunker {
public:
    /**
     * @brief Splits a file into chunks and builds its manifest.
     *
     * Reads the file sequentially in CHUNK_SIZE windows, hashes each window,
     * stores it in the chunk store and records the hash in order. The info
     * hash is the SHA-256 of the concatenated chunk hashes.
     *
     * @param file_path The path to the file to share.
     * @param store Destination for the chunk bytes.
     * @param created_by Publisher node ID, recorded in the manifest.
     * @return A Manifest object for the file.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    static Manifest chunk_file(const fs::path& file_path, ChunkStore& store, const std::string& created_by = "");

    /**
     * @brief Concatenates a manifest's chunks in order.
     * @throws P2PError(NotFound) naming the first chunk absent from the store.
     */
    static std::vector<uint8_t> reassemble(const Manifest& manifest, ChunkStore& store);

    // Streams the reassembled file to `output` through a temporary file.
    static void reassemble_to_file(const Manifest& manifest, ChunkStore& store, const fs::path& output);
};

#endif //LANSHARE_CHUNKER_HPP
