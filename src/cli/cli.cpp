#include "cli/cli.hpp"
#include "crypto/hasher.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>

namespace {

// DHT keys on the command line: 40 hex characters, or any text hashed with SHA-1.
dht::NodeID parse_key(const std::string& arg) {
    if (Hasher::is_hex(arg, dht::NODE_ID_SIZE)) {
        return dht::hex_to_node_id(arg);
    }
    return Hasher::sha1(arg);
}

std::string format_bytes(uint64_t bytes) {
    std::ostringstream ss;
    if (bytes >= 1024 * 1024) {
        ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MiB";
    } else if (bytes >= 1024) {
        ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KiB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

void print_snapshot(const DownloadSnapshot& s) {
    std::cout << " - " << s.info_hash << " " << (s.file_name.empty() ? "?" : s.file_name)
              << " [" << to_string(s.phase) << "] "
              << s.totals.chunks_done << "/" << s.totals.chunks_total << " chunks, "
              << std::fixed << std::setprecision(1) << s.totals.percent << "%, "
              << format_bytes(static_cast<uint64_t>(s.totals.throughput_bps)) << "/s";
    if (!s.message.empty()) {
        std::cout << " (" << s.message << ")";
    }
    std::cout << std::endl;
}

} // namespace

CLI::CLI(NodeController& node)
    : node_(node) {}

void CLI::run() {
    print_help();

    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && !handle_command(line)) {
            break;
        }
        std::cout << "> " << std::flush;
    }
}

void CLI::print_help() {
    std::cout << "Available commands:\n"
              << "  share <file_path>          - Share a file\n"
              << "  download <info_hash>       - Download a file by info hash\n"
              << "  status [info_hash]         - Show downloads\n"
              << "  watch <info_hash>          - Stream a download's progress events\n"
              << "  cancel <info_hash>         - Cancel a download\n"
              << "  shared                     - List shared files\n"
              << "  peers                      - List DHT routing table contacts\n"
              << "  stats                      - Show node statistics\n"
              << "  bootstrap <host:port> ...  - Join the DHT through known nodes\n"
              << "  dht_put <key> <value>      - Store value in DHT\n"
              << "  dht_get <key>              - Find value in DHT\n"
              << "  help                       - Show this help\n"
              << "  quit / exit                - Exit\n"
              << std::endl;
}

bool CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    try {
        if (cmd == "share") cmd_share(args);
        else if (cmd == "download") cmd_download(args);
        else if (cmd == "status") cmd_status(args);
        else if (cmd == "watch") cmd_watch(args);
        else if (cmd == "cancel") cmd_cancel(args);
        else if (cmd == "shared") cmd_shared(args);
        else if (cmd == "peers") cmd_peers(args);
        else if (cmd == "stats") cmd_stats(args);
        else if (cmd == "bootstrap") cmd_bootstrap(args);
        else if (cmd == "dht_put") cmd_dht_put(args);
        else if (cmd == "dht_get") cmd_dht_get(args);
        else if (cmd == "help") print_help();
        else if (cmd == "quit" || cmd == "exit") return false;
        else std::cout << "Unknown command: " << cmd << std::endl;
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << std::endl;
    }
    return true;
}

void CLI::cmd_share(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: share <file_path>" << std::endl;
        return;
    }

    std::string hex = node_.share(args[0], [](size_t acks) {
        std::cout << "\nDHT announce complete (" << acks << " node(s))." << std::endl;
    });
    std::cout << "File shared successfully!\n"
              << "Info hash: " << hex << std::endl;
}

void CLI::cmd_download(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: download <info_hash>" << std::endl;
        return;
    }
    auto session = node_.download(args[0]);
    std::cout << "Download started for " << session->info_hash_hex()
              << ". Use 'status' or 'watch' to follow it." << std::endl;
}

void CLI::cmd_status(const std::vector<std::string>& args) {
    if (!args.empty()) {
        auto session = node_.get_session(args[0]);
        if (!session) {
            std::cout << "No download for " << args[0] << std::endl;
            return;
        }
        std::cout << nlohmann::json(session->snapshot()).dump(2) << std::endl;
        return;
    }

    auto sessions = node_.sessions();
    std::cout << "Downloads: " << sessions.size() << std::endl;
    for (const auto& session : sessions) {
        print_snapshot(session->snapshot());
    }
}

void CLI::cmd_watch(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: watch <info_hash>" << std::endl;
        return;
    }
    auto session = node_.get_session(args[0]);
    if (!session) {
        std::cout << "No download for " << args[0] << std::endl;
        return;
    }

    ProgressChannel& channel = session->events();
    uint64_t next = 1;
    while (true) {
        auto events = channel.wait_for(next, std::chrono::milliseconds(500));
        for (const auto& event : events) {
            if (event.type == EventType::PhaseChanged) {
                std::cout << "[" << to_string(event.phase) << "] "
                          << std::fixed << std::setprecision(1) << event.totals.percent << "%";
                if (!event.message.empty()) {
                    std::cout << " " << event.message;
                }
                std::cout << std::endl;
            } else if (event.chunk && event.chunk->status == ChunkStatus::Complete) {
                std::cout << "  chunk " << event.chunk->index << " from " << event.chunk->peer << " ("
                          << event.totals.chunks_done << "/" << event.totals.chunks_total << ")" << std::endl;
            }
            next = event.seq + 1;
        }
        if (events.empty() && channel.closed()) {
            break;
        }
    }
}

void CLI::cmd_cancel(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: cancel <info_hash>" << std::endl;
        return;
    }
    auto session = node_.get_session(args[0]);
    if (!session) {
        std::cout << "No download for " << args[0] << std::endl;
        return;
    }
    session->cancel();
    std::cout << "Cancelling " << session->info_hash_hex() << std::endl;
}

void CLI::cmd_shared(const std::vector<std::string>& /*args*/) {
    auto manifests = node_.list_shared();
    std::cout << "Shared Files: " << manifests.size() << std::endl;
    for (const auto& m : manifests) {
        std::cout << " - " << m.file_name << " (" << format_bytes(m.file_size) << ", "
                  << m.chunk_count() << " chunks) " << Hasher::hash_to_hex(m.info_hash) << std::endl;
    }
}

void CLI::cmd_peers(const std::vector<std::string>& /*args*/) {
    auto contacts = node_.dht().routing_table().get_all_contacts();
    std::cout << "Known DHT Peers: " << contacts.size() << std::endl;
    for (const auto& c : contacts) {
        std::cout << " - ID: " << dht::node_id_to_hex(c.id) << " " << c.address.to_string()
                  << " dht:" << c.dht_port << " transfer:" << c.transfer_port;
        if (c.failed_requests > 0) {
            std::cout << " (failed " << c.failed_requests << ")";
        }
        std::cout << std::endl;
    }
}

void CLI::cmd_stats(const std::vector<std::string>& /*args*/) {
    std::cout << nlohmann::json(node_.stats()).dump(2) << std::endl;
}

void CLI::cmd_bootstrap(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: bootstrap <host:port> [host:port ...]" << std::endl;
        return;
    }
    node_.bootstrap(args, [](size_t answered) {
        std::cout << "\nBootstrap complete: " << answered << " seed(s) answered." << std::endl;
    });
    std::cout << "Bootstrapping..." << std::endl;
}

void CLI::cmd_dht_put(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cout << "Usage: dht_put <key> <value>" << std::endl;
        return;
    }
    dht::NodeID key = parse_key(args[0]);
    std::vector<uint8_t> value(args[1].begin(), args[1].end());

    std::cout << "Storing under " << dht::node_id_to_hex(key) << "..." << std::endl;
    node_.dht().store(key, std::move(value), [](size_t acks) {
        std::cout << "\nDHT PUT stored on " << acks << " node(s)." << std::endl;
    });
}

void CLI::cmd_dht_get(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << "Usage: dht_get <key>" << std::endl;
        return;
    }
    dht::NodeID key = parse_key(args[0]);
    node_.dht().find_value(key, [](dht::FindValueResult result) {
        if (result.value) {
            std::string s(result.value->begin(), result.value->end());
            std::cout << "\nDHT GET Result: FOUND: " << s << std::endl;
        } else if (!result.providers.empty()) {
            std::cout << "\nDHT GET Result: " << result.providers.size() << " provider(s)" << std::endl;
        } else {
            std::cout << "\nDHT GET Result: NOT FOUND. Closest nodes: " << result.closest.size() << std::endl;
        }
    });
}
