#ifndef LANSHARE_STORAGE_MANAGER_HPP
#define LANSHARE_STORAGE_MANAGER_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "metadata_sink.hpp"

// Forward declarations for SQLite types
struct sqlite3;

struct PeerRecord {
    std::string node_id; // hex
    std::string ip;
    uint16_t dht_port = 0;
    uint16_t transfer_port = 0;
    int64_t last_seen = 0;
};

struct SharedFileRecord {
    std::string info_hash;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t chunk_count = 0;
    std::string source_path;
    int64_t shared_at = 0;
};

struct DownloadRecord {
    std::string info_hash;
    std::string file_name;
    std::string status;
    std::string output_path;
    int64_t updated_at = 0;
};

/**
 * @brief SQLite-backed MetadataSink.
 *
 * Keeps peers seen on the DHT, files this node shares and download outcomes.
 * Writes report failure through their return value and are logged; reads
 * return empty results on error.
 */
class StorageManager : public MetadataSink {
public:
    // Opens or creates the database; throws P2PError(StorageIO) on failure.
    explicit StorageManager(const std::string& db_path);
    ~StorageManager() override;

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    void record_peer(const dht::Contact& contact) override;
    void record_shared_file(const Manifest& manifest, const std::filesystem::path& source_path) override;
    void record_download(const std::string& info_hash_hex, const std::string& file_name,
                         const std::string& status, const std::string& output_path) override;

    bool save_peer(const PeerRecord& peer);
    std::vector<PeerRecord> get_peers(size_t limit = 0);
    bool delete_peer(const std::string& node_id);

    bool save_shared_file(const SharedFileRecord& file);
    std::vector<SharedFileRecord> get_shared_files();

    bool save_download(const DownloadRecord& download);
    std::optional<DownloadRecord> get_download(const std::string& info_hash);
    std::vector<DownloadRecord> get_downloads();

private:
    bool open();
    void close();
    bool create_tables();

    // Helper for executing SQL statements
    bool execute_sql(const std::string& sql);

    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

#endif // LANSHARE_STORAGE_MANAGER_HPP
