#include "storage/storage_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"

#include <sqlite3.h>
#include <ctime>

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

StorageManager::StorageManager(const std::string& db_path)
    : db_path_(db_path) {
    if (!open()) {
        throw P2PError(ErrorKind::StorageIO, "Failed to open database: " + db_path);
    }
    if (!create_tables()) {
        close();
        throw P2PError(ErrorKind::StorageIO, "Failed to create tables in database: " + db_path);
    }
}

StorageManager::~StorageManager() {
    close();
}

bool StorageManager::open() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERR("Can't open database ", db_path_, ": ", sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    // Several sessions may write at once.
    sqlite3_busy_timeout(db_, 2000);
    LOG_INFO("Opened database ", db_path_);
    return true;
}

void StorageManager::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database ", db_path_);
    }
}

bool StorageManager::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERR("SQL error: ", err_msg ? err_msg : sqlite3_errmsg(db_));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool StorageManager::create_tables() {
    std::string create_peers_sql = R"(
        CREATE TABLE IF NOT EXISTS peers (
            node_id TEXT PRIMARY KEY NOT NULL,
            ip TEXT NOT NULL,
            dht_port INTEGER NOT NULL,
            transfer_port INTEGER NOT NULL,
            last_seen INTEGER NOT NULL
        );
    )";

    std::string create_shared_files_sql = R"(
        CREATE TABLE IF NOT EXISTS shared_files (
            info_hash TEXT PRIMARY KEY NOT NULL,
            file_name TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            chunk_count INTEGER NOT NULL,
            source_path TEXT NOT NULL,
            shared_at INTEGER NOT NULL
        );
    )";

    std::string create_downloads_sql = R"(
        CREATE TABLE IF NOT EXISTS downloads (
            info_hash TEXT PRIMARY KEY NOT NULL,
            file_name TEXT NOT NULL,
            status TEXT NOT NULL,
            output_path TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )";

    bool success = execute_sql(create_peers_sql);
    success &= execute_sql(create_shared_files_sql);
    success &= execute_sql(create_downloads_sql);
    return success;
}

// --- MetadataSink ---

void StorageManager::record_peer(const dht::Contact& contact) {
    PeerRecord peer;
    peer.node_id = dht::node_id_to_hex(contact.id);
    peer.ip = contact.address.to_string();
    peer.dht_port = contact.dht_port;
    peer.transfer_port = contact.transfer_port;
    peer.last_seen = static_cast<int64_t>(std::time(nullptr));
    save_peer(peer);
}

void StorageManager::record_shared_file(const Manifest& manifest, const std::filesystem::path& source_path) {
    SharedFileRecord file;
    file.info_hash = Hasher::hash_to_hex(manifest.info_hash);
    file.file_name = manifest.file_name;
    file.file_size = manifest.file_size;
    file.chunk_count = manifest.chunk_count();
    file.source_path = source_path.string();
    file.shared_at = static_cast<int64_t>(std::time(nullptr));
    save_shared_file(file);
}

void StorageManager::record_download(const std::string& info_hash_hex, const std::string& file_name,
                                     const std::string& status, const std::string& output_path) {
    DownloadRecord download;
    download.info_hash = info_hash_hex;
    download.file_name = file_name;
    download.status = status;
    download.output_path = output_path;
    download.updated_at = static_cast<int64_t>(std::time(nullptr));
    save_download(download);
}

// --- Peers ---

bool StorageManager::save_peer(const PeerRecord& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "INSERT OR REPLACE INTO peers (node_id, ip, dht_port, transfer_port, last_seen) VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, peer.node_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, peer.ip.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, peer.dht_port);
    sqlite3_bind_int(stmt, 4, peer.transfer_port);
    sqlite3_bind_int64(stmt, 5, peer.last_seen);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to save peer ", peer.node_id, ": ", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<PeerRecord> StorageManager::get_peers(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PeerRecord> peers;
    std::string sql = "SELECT node_id, ip, dht_port, transfer_port, last_seen FROM peers ORDER BY last_seen DESC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }
    sql += ";";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return peers;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        PeerRecord peer;
        peer.node_id = column_text(stmt, 0);
        peer.ip = column_text(stmt, 1);
        peer.dht_port = static_cast<uint16_t>(sqlite3_column_int(stmt, 2));
        peer.transfer_port = static_cast<uint16_t>(sqlite3_column_int(stmt, 3));
        peer.last_seen = sqlite3_column_int64(stmt, 4);
        peers.push_back(std::move(peer));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to read peers: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return peers;
}

bool StorageManager::delete_peer(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "DELETE FROM peers WHERE node_id = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, node_id.c_str(), -1, SQLITE_STATIC);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to delete peer ", node_id, ": ", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// --- Shared files ---

bool StorageManager::save_shared_file(const SharedFileRecord& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "INSERT OR REPLACE INTO shared_files (info_hash, file_name, file_size, chunk_count, source_path, shared_at) VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, file.info_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, file.file_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(file.file_size));
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(file.chunk_count));
    sqlite3_bind_text(stmt, 5, file.source_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 6, file.shared_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to save shared file ", file.info_hash, ": ", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<SharedFileRecord> StorageManager::get_shared_files() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SharedFileRecord> files;
    std::string sql = "SELECT info_hash, file_name, file_size, chunk_count, source_path, shared_at FROM shared_files ORDER BY shared_at;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return files;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SharedFileRecord file;
        file.info_hash = column_text(stmt, 0);
        file.file_name = column_text(stmt, 1);
        file.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        file.chunk_count = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
        file.source_path = column_text(stmt, 4);
        file.shared_at = sqlite3_column_int64(stmt, 5);
        files.push_back(std::move(file));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to read shared files: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return files;
}

// --- Downloads ---

bool StorageManager::save_download(const DownloadRecord& download) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "INSERT OR REPLACE INTO downloads (info_hash, file_name, status, output_path, updated_at) VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, download.info_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, download.file_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, download.status.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 4, download.output_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, download.updated_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to save download ", download.info_hash, ": ", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<DownloadRecord> StorageManager::get_download(const std::string& info_hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT info_hash, file_name, status, output_path, updated_at FROM downloads WHERE info_hash = ?;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, info_hash.c_str(), -1, SQLITE_STATIC);

    std::optional<DownloadRecord> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        DownloadRecord download;
        download.info_hash = column_text(stmt, 0);
        download.file_name = column_text(stmt, 1);
        download.status = column_text(stmt, 2);
        download.output_path = column_text(stmt, 3);
        download.updated_at = sqlite3_column_int64(stmt, 4);
        result = std::move(download);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<DownloadRecord> StorageManager::get_downloads() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadRecord> downloads;
    std::string sql = "SELECT info_hash, file_name, status, output_path, updated_at FROM downloads ORDER BY updated_at DESC;";
    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        return downloads;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DownloadRecord download;
        download.info_hash = column_text(stmt, 0);
        download.file_name = column_text(stmt, 1);
        download.status = column_text(stmt, 2);
        download.output_path = column_text(stmt, 3);
        download.updated_at = sqlite3_column_int64(stmt, 4);
        downloads.push_back(std::move(download));
    }

    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to read downloads: ", sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return downloads;
}
