#ifndef LANSHARE_CONFIG_HPP
#define LANSHARE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct NodeConfig {
    // Network
    std::string host = "0.0.0.0";
    // 0.0.0.0: peers use the address they reached this node at.
    std::string advertise_address = "0.0.0.0";
    uint16_t dht_port = 8468;
    uint16_t transfer_port = 8469;
    std::vector<std::string> bootstrap_nodes; // "host:port"

    // Storage
    fs::path data_dir = "data";
    fs::path download_dir = "data/files";
    std::string database_file = "lanshare.db";

    // DHT tuning
    size_t k = 20;
    size_t alpha = 3;
    uint32_t rpc_timeout_ms = 2000;
    uint32_t rpc_retries = 1;
    size_t lookup_max_rounds = 8;
    uint32_t value_ttl_s = 3600;
    uint32_t provider_ttl_s = 1800;
    uint32_t republish_interval_s = 3600;
    uint32_t announce_interval_s = 900;
    uint32_t refresh_interval_s = 60;

    // Transfer tuning
    uint32_t transfer_timeout_ms = 30000;
    size_t per_peer_inflight = 4;
    size_t max_inflight = 16;
    size_t max_peer_failures = 3;
    size_t finished_sessions_kept = 32; // finished downloads still listed

    // Logging
    std::string log_level = "info";
    std::string log_file = "lanshare.log";

    // Deterministic node identity when non-empty
    std::string node_id_seed;

    /**
     * @brief Loads a configuration file and applies environment overrides.
     * @param path JSON file to read. A missing file yields the defaults.
     * @return The merged configuration.
     * @throws std::runtime_error if the file exists but cannot be parsed.
     */
    static NodeConfig load(const fs::path& path);

    // Overrides fields from LANSHARE_* environment variables.
    void apply_environment();

    // Throws std::invalid_argument when a value is out of range.
    void validate() const;

    fs::path database_path() const { return data_dir / database_file; }
};

void to_json(nlohmann::json& j, const NodeConfig& c);
void from_json(const nlohmann::json& j, NodeConfig& c);

// Splits "host:port"; throws std::invalid_argument on malformed input.
std::pair<std::string, uint16_t> parse_host_port(const std::string& value);

#endif // LANSHARE_CONFIG_HPP
