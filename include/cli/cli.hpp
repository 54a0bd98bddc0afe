#ifndef LANSHARE_CLI_HPP
#define LANSHARE_CLI_HPP

#include <string>
#include <vector>

#include "../node/node_controller.hpp"

class CLI {
public:
    explicit CLI(NodeController& node);

    // Reads commands from stdin until quit or end of input.
    void run();

    // Executes one command line; returns false when the user asked to quit.
    bool handle_command(const std::string& line);

private:
    void print_help();

    void cmd_share(const std::vector<std::string>& args);
    void cmd_download(const std::vector<std::string>& args);
    void cmd_status(const std::vector<std::string>& args);
    void cmd_watch(const std::vector<std::string>& args);
    void cmd_cancel(const std::vector<std::string>& args);
    void cmd_shared(const std::vector<std::string>& args);
    void cmd_peers(const std::vector<std::string>& args);
    void cmd_stats(const std::vector<std::string>& args);

    // DHT Commands
    void cmd_bootstrap(const std::vector<std::string>& args);
    void cmd_dht_put(const std::vector<std::string>& args);
    void cmd_dht_get(const std::vector<std::string>& args);

    NodeController& node_;
};

#endif // LANSHARE_CLI_HPP
