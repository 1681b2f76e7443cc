#include "mcprelay/relay/HTTPServer.hpp"
#include "mcprelay/relay/RelayConfig.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/version.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace mcprelay;
using namespace mcprelay::sdk;
using namespace mcprelay::relay;

// Global variables for signal handling
std::atomic<bool> running(true);
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

const std::string BUILD_DATE = __DATE__ " " __TIME__;

struct CommandLineOptions {
    std::string config_file;
    std::string bind_address;
    int port = -1;
    long threads = -1;
    long timeout_seconds = -1;
    std::string log_level;
    std::string log_path;
    bool version = false;
    bool help = false;
    bool invalid = false;
};

// Signal handler
void signal_handler(int) {
    running = false;
    shutdown_cv.notify_all();
}

bool parse_number(const char* text, long min, long max, long& out) {
    try {
        std::size_t consumed = 0;
        const long value = std::stol(text, &consumed);
        if (consumed != std::string(text).size() || value < min || value > max) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Parse command line arguments
CommandLineOptions parse_args(int argc, char* argv[]) {
    CommandLineOptions options;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"bind", required_argument, 0, 'b'},
        {"port", required_argument, 0, 'p'},
        {"threads", required_argument, 0, 't'},
        {"timeout", required_argument, 0, 'T'},
        {"log-level", required_argument, 0, 'l'},
        {"log-path", required_argument, 0, 'L'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    long number = 0;

    while ((opt = getopt_long(argc, argv, "c:b:p:t:T:l:L:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 'b':
                options.bind_address = optarg;
                break;
            case 'p':
                if (!parse_number(optarg, 0, 65535, number)) {
                    std::cerr << "Invalid port: " << optarg << std::endl;
                    options.invalid = true;
                }
                options.port = static_cast<int>(number);
                break;
            case 't':
                if (!parse_number(optarg, 1, 256, number)) {
                    std::cerr << "Invalid thread count: " << optarg << std::endl;
                    options.invalid = true;
                }
                options.threads = number;
                break;
            case 'T':
                if (!parse_number(optarg, 1, 3600, number)) {
                    std::cerr << "Invalid timeout: " << optarg << std::endl;
                    options.invalid = true;
                }
                options.timeout_seconds = number;
                break;
            case 'l':
                options.log_level = optarg;
                break;
            case 'L':
                options.log_path = optarg;
                break;
            case 'v':
                options.version = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    return options;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << Version::name << " " << Version::str << " (" << BUILD_DATE << ")" << std::endl;
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config=FILE       Configuration file path" << std::endl;
    std::cout << "  -b, --bind=ADDR         Bind address (default: " << constants::DEFAULT_BIND_ADDRESS << ")" << std::endl;
    std::cout << "  -p, --port=PORT         Listen port (default: " << constants::DEFAULT_RELAY_PORT << ")" << std::endl;
    std::cout << "  -t, --threads=N         I/O threads (default: " << constants::DEFAULT_IO_THREADS << ")" << std::endl;
    std::cout << "  -T, --timeout=SECONDS   Forward deadline (default: "
              << constants::DEFAULT_FORWARD_TIMEOUT.count() << ")" << std::endl;
    std::cout << "  -l, --log-level=LEVEL   Log level (trace, debug, info, warning, error, critical)" << std::endl;
    std::cout << "  -L, --log-path=DIR      Log directory (default: " << constants::RELAY_LOG_PATH << ")" << std::endl;
    std::cout << "  -v, --version           Print version information and exit" << std::endl;
    std::cout << "  -h, --help              Print this help message and exit" << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  " << constants::SALT_ENV << " (or " << constants::LEGACY_SALT_ENV
              << ")   Hash salt, required" << std::endl;
}

// Print version information
void print_version() {
    std::cout << Version::name << " " << Version::full << " (" << BUILD_DATE << ")" << std::endl;
}

// Defaults, then the config file, then the environment, then flags
Result<RelayConfig> build_config(const CommandLineOptions& options) {
    RelayConfig config;

    std::string path = options.config_file;
    if (path.empty()) {
        path = RelayConfig::find_default_file();
    }
    if (!path.empty()) {
        auto loaded = config.load_file(path);
        if (loaded.is_err()) {
            return {loaded.error(), loaded.error_detail()};
        }
    }

    config.apply_environment();

    if (!options.bind_address.empty()) {
        config.bind_address = options.bind_address;
    }
    if (options.port >= 0) {
        config.port = static_cast<std::uint16_t>(options.port);
    }
    if (options.threads > 0) {
        config.io_threads = static_cast<std::size_t>(options.threads);
    }
    if (options.timeout_seconds > 0) {
        config.forward_timeout = std::chrono::seconds(options.timeout_seconds);
    }
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    if (!options.log_path.empty()) {
        config.log_path = options.log_path;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return {valid.error(), valid.error_detail()};
    }
    return config;
}

// Initialize SecureLogger
void init_logger(const RelayConfig& config) {
    SecureLogger::instance().initialize(config.log_path, "relay", SecureLogger::parse_level(config.log_level));
    SecureLogger::instance().set_console_output(true);
}

// Main entry point
int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options = parse_args(argc, argv);

        if (options.invalid) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        if (options.version) {
            print_version();
            return EXIT_SUCCESS;
        }

        if (options.help) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }

        auto config = build_config(options);
        if (config.is_err()) {
            std::cerr << "Configuration error: " << config.error_detail() << std::endl;
            return EXIT_FAILURE;
        }
        RelayConfig relay_config = config.value();

        init_logger(relay_config);
        SecureLogger::instance().info(std::string(Version::name) + " " + Version::str + " starting...");

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        signal(SIGPIPE, SIG_IGN);

        auto hasher = std::make_shared<HashService>(relay_config.hash_salt);
        HashService::wipe(relay_config.hash_salt);

        HTTPServer server(relay_config, hasher);
        server.start();

        // Wait for shutdown signal
        {
            std::unique_lock<std::mutex> lock(shutdown_mutex);
            SecureLogger::instance().info("Relay listening on " + relay_config.bind_address + ":" +
                                          std::to_string(server.bound_port()) + ", forward deadline " +
                                          std::to_string(relay_config.forward_timeout.count()) + "s");

            // Polled as well: a signal may land between the check and the wait
            while (!shutdown_cv.wait_for(lock, std::chrono::seconds(1), [] { return !running.load(); })) {
            }
        }

        SecureLogger::instance().info("Shutdown signal received");
        server.stop();

        SecureLogger::instance().info(std::string(Version::name) + " shutdown complete");
        SecureLogger::instance().flush();
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        if (SecureLogger::is_initialized()) {
            SecureLogger::instance().critical("Fatal exception: " + std::string(e.what()));
        } else {
            std::cerr << "Fatal exception: " << e.what() << std::endl;
        }

        return EXIT_FAILURE;
    }
}
