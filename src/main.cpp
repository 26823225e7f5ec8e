#include "config/config.h"
#include "server/server.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <thread>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int) {
    g_shutdown_requested = 1;
}

}  // namespace

int main() {
    try {
        auto& config = testsieve::get_config();
        testsieve::configure_logging(config);
        spdlog::info("Starting testsieve server");

        testsieve::Server server(config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.start();
        spdlog::info("testsieve server listening on {}:{}, data in {}", config.bind_address, server.port(),
                     config.server_data_dir);

        while (server.is_running() && !g_shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down");
        server.stop();
        spdlog::info("testsieve server stopped");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
