#include "smtp_server.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "auth/user_directory.hpp"
#include "storage/mailbox_store.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};
}

void signal_handler(int /* signal */) {
    g_running = false;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>    Configuration file path\n"
              << "  -b, --bind <address>   Listen address (overrides config)\n"
              << "  -p, --port <port>      Listen port (overrides config)\n"
              << "  -r, --root <dir>       Storage root (overrides config)\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n";
}

int main(int argc, char* argv[]) {
    std::string config_file = "/etc/minimail/minimail.conf";
    std::string bind_address;
    std::string port;
    std::string root;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "minimail SMTP server v1.0.0\n";
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-b" || arg == "--bind") && i + 1 < argc) {
            bind_address = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
        } else if ((arg == "-r" || arg == "--root") && i + 1 < argc) {
            root = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    minimail::Config config;
    bool config_loaded = config.load(config_file);

    if (!bind_address.empty()) config.set("smtp.bind_address", bind_address);
    if (!port.empty()) config.set("smtp.port", port);
    if (!root.empty()) config.set("storage.root", root);

    const auto& log = config.log();
    minimail::Logger::instance().init(
        log.level,
        log.log_to_console,
        log.log_to_file ? log.file : std::filesystem::path(),
        log.max_file_size,
        log.max_files
    );

    LOG_INFO("SMTP server starting...");
    if (!config_loaded) {
        LOG_WARNING_FMT("Could not load config file: {}, using defaults", config_file);
    }

    // Load the user registry
    auto users = std::make_shared<minimail::UserDirectory>(config.storage().registry_path());
    if (!users->load()) {
        LOG_FATAL_FMT("Failed to load user registry: {}", users->last_error());
        return 1;
    }

    auto store = std::make_shared<minimail::MailboxStore>(config.storage().mailbox_root(), users);
    store->set_lock_wait(config.storage().lock_wait);
    store->set_sync_writes(config.storage().sync_writes);

    minimail::smtp::SMTPServer server(config.smtp(), users, store);

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Start server
    try {
        server.start();
        LOG_INFO_FMT("SMTP server started on port {}", server.local_port());

        // Wait for shutdown signal
        while (g_running && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    } catch (const std::exception& e) {
        LOG_FATAL_FMT("Server error: {}", e.what());
        return 1;
    }

    LOG_INFO("Shutting down...");
    server.stop();
    LOG_INFO("SMTP server shutdown complete");
    return 0;
}
