#include <memory>
#include <signal.h>
#include <spdlog/spdlog.h>

#include "config/Settings.hpp"
#include "domain/Errors.hpp"
#include "sandbox/SandboxServer.hpp"
#include "utils/Logging.hpp"

using namespace code_validation;

std::unique_ptr<SandboxServer> global_server_ptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

// Usage: code_validation_sandbox [config.json]
int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    Settings settings;
    try {
        settings = Settings::load(argc > 1 ? argv[1] : "");
        settings.ensure_directories();
        setup_logging(settings, "sandbox");
    } catch (const ConfigurationError& e) {
        spdlog::critical("🔥 {}", e.what());
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        global_server_ptr = std::make_unique<SandboxServer>(settings.sandbox);
    } catch (const std::exception& e) {
        spdlog::critical("🔥 Sandbox initialisation failed: {}", e.what());
        return 1;
    }

    bool clean = global_server_ptr->run(); // blocks
    global_server_ptr.reset();
    spdlog::info("👋 Sandbox stopped");
    return clean ? 0 : 1;
}
