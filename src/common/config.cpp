#include "common/config.hpp"
#include "common/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template<typename T>
void env_number(const char* name, T& field) {
    if (const char* value = env(name)) {
        try {
            field = static_cast<T>(std::stoul(value));
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
        }
    }
}

template<typename T>
void get_optional(const json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(field);
    }
}

} // namespace

void to_json(json& j, const NodeConfig& c) {
    j = json{
        {"host", c.host},
        {"advertise_address", c.advertise_address},
        {"dht_port", c.dht_port},
        {"transfer_port", c.transfer_port},
        {"bootstrap_nodes", c.bootstrap_nodes},
        {"data_dir", c.data_dir.string()},
        {"download_dir", c.download_dir.string()},
        {"database_file", c.database_file},
        {"k", c.k},
        {"alpha", c.alpha},
        {"rpc_timeout_ms", c.rpc_timeout_ms},
        {"rpc_retries", c.rpc_retries},
        {"lookup_max_rounds", c.lookup_max_rounds},
        {"value_ttl_s", c.value_ttl_s},
        {"provider_ttl_s", c.provider_ttl_s},
        {"republish_interval_s", c.republish_interval_s},
        {"announce_interval_s", c.announce_interval_s},
        {"refresh_interval_s", c.refresh_interval_s},
        {"transfer_timeout_ms", c.transfer_timeout_ms},
        {"per_peer_inflight", c.per_peer_inflight},
        {"max_inflight", c.max_inflight},
        {"max_peer_failures", c.max_peer_failures},
        {"finished_sessions_kept", c.finished_sessions_kept},
        {"log_level", c.log_level},
        {"log_file", c.log_file},
        {"node_id_seed", c.node_id_seed}
    };
}

void from_json(const json& j, NodeConfig& c) {
    get_optional(j, "host", c.host);
    get_optional(j, "advertise_address", c.advertise_address);
    get_optional(j, "dht_port", c.dht_port);
    get_optional(j, "transfer_port", c.transfer_port);
    get_optional(j, "bootstrap_nodes", c.bootstrap_nodes);
    if (j.contains("data_dir")) {
        c.data_dir = j.at("data_dir").get<std::string>();
        c.download_dir = c.data_dir / "files";
    }
    if (j.contains("download_dir")) {
        c.download_dir = j.at("download_dir").get<std::string>();
    }
    get_optional(j, "database_file", c.database_file);
    get_optional(j, "k", c.k);
    get_optional(j, "alpha", c.alpha);
    get_optional(j, "rpc_timeout_ms", c.rpc_timeout_ms);
    get_optional(j, "rpc_retries", c.rpc_retries);
    get_optional(j, "lookup_max_rounds", c.lookup_max_rounds);
    get_optional(j, "value_ttl_s", c.value_ttl_s);
    get_optional(j, "provider_ttl_s", c.provider_ttl_s);
    get_optional(j, "republish_interval_s", c.republish_interval_s);
    get_optional(j, "announce_interval_s", c.announce_interval_s);
    get_optional(j, "refresh_interval_s", c.refresh_interval_s);
    get_optional(j, "transfer_timeout_ms", c.transfer_timeout_ms);
    get_optional(j, "per_peer_inflight", c.per_peer_inflight);
    get_optional(j, "max_inflight", c.max_inflight);
    get_optional(j, "max_peer_failures", c.max_peer_failures);
    get_optional(j, "finished_sessions_kept", c.finished_sessions_kept);
    get_optional(j, "log_level", c.log_level);
    get_optional(j, "log_file", c.log_file);
    get_optional(j, "node_id_seed", c.node_id_seed);
}

NodeConfig NodeConfig::load(const fs::path& path) {
    NodeConfig config;

    if (!path.empty() && fs::exists(path)) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        try {
            json j = json::parse(file);
            config = j.get<NodeConfig>();
        } catch (const json::exception& e) {
            throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
        }
    }

    config.apply_environment();
    config.validate();
    return config;
}

void NodeConfig::apply_environment() {
    if (const char* value = env("LANSHARE_HOST")) host = value;
    if (const char* value = env("LANSHARE_ADVERTISE_ADDRESS")) advertise_address = value;
    env_number("LANSHARE_DHT_PORT", dht_port);
    env_number("LANSHARE_TRANSFER_PORT", transfer_port);

    if (const char* value = env("LANSHARE_DATA_DIR")) {
        data_dir = value;
        download_dir = data_dir / "files";
    }
    if (const char* value = env("LANSHARE_DOWNLOAD_DIR")) download_dir = value;

    // Bootstrap nodes from the environment are added to the configured ones.
    if (const char* value = env("LANSHARE_BOOTSTRAP_NODES")) {
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) {
                bootstrap_nodes.push_back(item);
            }
        }
    }

    env_number("LANSHARE_K", k);
    env_number("LANSHARE_ALPHA", alpha);
    env_number("LANSHARE_RPC_TIMEOUT_MS", rpc_timeout_ms);
    env_number("LANSHARE_TRANSFER_TIMEOUT_MS", transfer_timeout_ms);
    env_number("LANSHARE_MAX_INFLIGHT", max_inflight);

    if (const char* value = env("LANSHARE_LOG_LEVEL")) log_level = value;
    if (const char* value = env("LANSHARE_LOG_FILE")) log_file = value;
    if (const char* value = env("LANSHARE_NODE_ID_SEED")) node_id_seed = value;
}

void NodeConfig::validate() const {
    if (k == 0) throw std::invalid_argument("k must be positive");
    if (alpha == 0) throw std::invalid_argument("alpha must be positive");
    if (rpc_timeout_ms == 0) throw std::invalid_argument("rpc_timeout_ms must be positive");
    if (lookup_max_rounds == 0) throw std::invalid_argument("lookup_max_rounds must be positive");
    if (per_peer_inflight == 0 || max_inflight == 0) {
        throw std::invalid_argument("in-flight limits must be positive");
    }
    if (max_peer_failures == 0) throw std::invalid_argument("max_peer_failures must be positive");
    log_level_from_string(log_level);
    for (const auto& node : bootstrap_nodes) {
        parse_host_port(node);
    }
}

std::pair<std::string, uint16_t> parse_host_port(const std::string& value) {
    auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= value.size()) {
        throw std::invalid_argument("Expected host:port, got '" + value + "'");
    }
    std::string host = value.substr(0, colon);
    unsigned long port = 0;
    try {
        size_t consumed = 0;
        port = std::stoul(value.substr(colon + 1), &consumed);
        if (consumed != value.size() - colon - 1) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port in '" + value + "'");
    }
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("Port out of range in '" + value + "'");
    }
    return {host, static_cast<uint16_t>(port)};
}
