#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <asio.hpp>

#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "node/node_controller.hpp"

void print_usage() {
    std::cout << "Usage: lanshare <mode> [config.json]\n"
              << "Modes:\n"
              << "  interactive   - Run a node with the command line (default)\n"
              << "  server        - Run a headless node until SIGINT/SIGTERM\n"
              << "Settings are read from the JSON file (default lanshare.json) and\n"
              << "LANSHARE_* environment variables.\n";
}

int main(int argc, char* argv[]) {
    std::string mode = "interactive";
    if (argc > 1) {
        mode = argv[1];
    }
    if (mode != "interactive" && mode != "server") {
        print_usage();
        return 1;
    }
    std::string config_path = argc > 2 ? argv[2] : "lanshare.json";

    try {
        NodeConfig config = NodeConfig::load(config_path);
        config.validate();

        Logger::instance().init(config.log_file, log_level_from_string(config.log_level));
        // The prompt owns the terminal in interactive mode; logs go to the file.
        Logger::instance().set_console(mode == "server");
        LOG_INFO("Starting LANShare node (", mode, " mode)");

        asio::io_context io_context;
        auto work_guard = asio::make_work_guard(io_context);

        NodeController node(io_context, config);
        node.start();

        unsigned thread_count = std::max(2u, std::thread::hardware_concurrency());
        std::vector<std::thread> io_threads;
        for (unsigned i = 0; i < thread_count; ++i) {
            io_threads.emplace_back([&io_context]() {
                try {
                    io_context.run();
                } catch (const std::exception& e) {
                    LOG_ERR("IO Thread Error: ", e.what());
                }
            });
        }

        std::cout << "Node " << node.node_id_hex() << " started (DHT port " << node.dht().local_port()
                  << ", transfer port " << node.server().local_port() << ")" << std::endl;

        if (mode == "interactive") {
            CLI cli(node);
            cli.run();
        } else {
            asio::io_context signal_context;
            asio::signal_set signals(signal_context, SIGINT, SIGTERM);
            signals.async_wait([](const asio::error_code& /*error*/, int signal_number) {
                LOG_INFO("Received signal ", signal_number, ", shutting down");
            });
            signal_context.run();
        }

        node.stop();
        work_guard.reset();
        io_context.stop();
        for (auto& t : io_threads) {
            if (t.joinable()) t.join();
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
