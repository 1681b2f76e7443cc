#include "mcprelay/bridge/BridgeClient.hpp"
#include "mcprelay/bridge/BridgeConfig.hpp"
#include "mcprelay/bridge/MachineIdentity.hpp"
#include "mcprelay/bridge/ProtocolAdapter.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/version.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

using namespace mcprelay;
using namespace mcprelay::sdk;
using namespace mcprelay::bridge;

// Global variables for signal handling
std::atomic<bool> running(true);
std::atomic<bool> reload_requested(false);
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

struct CommandLineOptions {
    std::string command;
    std::string cloud_url;
    std::string pieces_endpoint = constants::DEFAULT_DOWNSTREAM_ENDPOINT;
    std::string url;
    std::string key;
    std::string log_level = "info";
    bool version = false;
    bool help = false;
    bool invalid = false;
};

void signal_handler(int sig) {
    if (sig == SIGHUP) {
        reload_requested = true;
    } else {
        running = false;
    }
    shutdown_cv.notify_all();
}

std::string trim_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Options after the subcommand, e.g. "init --cloud URL"
CommandLineOptions parse_args(int argc, char* argv[]) {
    CommandLineOptions options;

    if (argc < 2) {
        options.help = true;
        return options;
    }

    options.command = argv[1];
    if (options.command == "--version" || options.command == "-v") {
        options.version = true;
        return options;
    }
    if (options.command == "--help" || options.command == "-h" || options.command == "help") {
        options.help = true;
        return options;
    }

    static struct option long_options[] = {
        {"cloud", required_argument, 0, 'c'},
        {"pieces", required_argument, 0, 'p'},
        {"url", required_argument, 0, 'u'},
        {"key", required_argument, 0, 'k'},
        {"log-level", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc - 1, argv + 1, "c:p:u:k:l:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.cloud_url = trim_slashes(optarg);
                break;
            case 'p':
                options.pieces_endpoint = optarg;
                break;
            case 'u':
                options.url = trim_slashes(optarg);
                break;
            case 'k':
                options.key = optarg;
                break;
            case 'l':
                options.log_level = optarg;
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

void print_usage(const char* program_name) {
    std::cout << "MCP Bridge " << Version::str << std::endl;
    std::cout << "Usage: " << program_name << " <command> [options]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  init --cloud=URL [--pieces=URL]   Generate an API key and save the configuration" << std::endl;
    std::cout << "  start [--log-level=LEVEL]         Connect to the relay and serve requests" << std::endl;
    std::cout << "  rotate-key                        Generate a new API key (SIGHUP a running bridge)" << std::endl;
    std::cout << "  client --url=URL --key=KEY        Call tools on a remote bridge" << std::endl;
    std::cout << "Configuration: " << BridgeConfig::default_path() << " (override with "
              << constants::BRIDGE_CONFIG_ENV << ")" << std::endl;
}

Result<BridgeConfig> load_config() {
    const std::string path = BridgeConfig::default_path();
    auto config = BridgeConfig::load(path);
    if (config.is_err()) {
        return config;
    }

    auto valid = config.value().validate();
    if (valid.is_err()) {
        return {valid.error(), path + ": " + valid.error_detail()};
    }
    return config;
}

// Hash a fresh key through the relay; the key itself never leaves this process unhashed
Result<std::string> hash_new_key(const RemoteHasher& hasher, std::string& key) {
    key = MachineIdentity::generate_api_key();
    return hasher.hash(key);
}

int run_init(const CommandLineOptions& options) {
    if (options.cloud_url.empty()) {
        std::cerr << "init requires --cloud URL" << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "Initializing MCP Bridge..." << std::endl;

    RemoteHasher hasher(options.cloud_url);

    std::string key;
    auto key_hash = hash_new_key(hasher, key);
    if (key_hash.is_err()) {
        std::cerr << "Cloud hash failed: " << key_hash.error_detail() << std::endl;
        return EXIT_FAILURE;
    }

    auto node_id = MachineIdentity::node_id(hasher);
    if (node_id.is_err()) {
        std::cerr << "Cannot derive node id: " << node_id.error_detail() << std::endl;
        HashService::wipe(key);
        return EXIT_FAILURE;
    }

    BridgeConfig config;
    config.cloud_url = options.cloud_url;
    config.node_id = node_id.value();
    config.key_hash = key_hash.value();
    config.pieces_endpoint = options.pieces_endpoint;

    const std::string path = BridgeConfig::default_path();
    auto saved = config.save(path);
    if (saved.is_err()) {
        std::cerr << saved.error_detail() << std::endl;
        HashService::wipe(key);
        return EXIT_FAILURE;
    }

    const std::string bridge_url = config.cloud_url + constants::MCP_PATH_PREFIX + config.node_id;

    std::cout << "Configuration saved to " << path << std::endl;
    std::cout << "----------------------------------------" << std::endl;
    std::cout << "Bridge URL: " << bridge_url << std::endl;
    std::cout << "API Key:    " << key << std::endl;
    std::cout << "----------------------------------------" << std::endl;
    std::cout << "Keep the API key safe, it will not be shown again." << std::endl;
    std::cout << std::endl;
    std::cout << "Next steps:" << std::endl;
    std::cout << "  mcp-bridge start" << std::endl;
    std::cout << "  mcp-bridge client --url " << bridge_url << " --key <API key>" << std::endl;

    HashService::wipe(key);
    return EXIT_SUCCESS;
}

int run_rotate_key() {
    auto loaded = load_config();
    if (loaded.is_err()) {
        std::cerr << loaded.error_detail() << std::endl;
        std::cerr << "Run `mcp-bridge init` first." << std::endl;
        return EXIT_FAILURE;
    }
    BridgeConfig config = loaded.value();

    RemoteHasher hasher(config.cloud_url);

    std::string key;
    auto key_hash = hash_new_key(hasher, key);
    if (key_hash.is_err()) {
        std::cerr << "Cloud hash failed: " << key_hash.error_detail() << std::endl;
        return EXIT_FAILURE;
    }

    config.key_hash = key_hash.value();
    auto saved = config.save(BridgeConfig::default_path());
    if (saved.is_err()) {
        std::cerr << saved.error_detail() << std::endl;
        HashService::wipe(key);
        return EXIT_FAILURE;
    }

    std::cout << "New API Key: " << key << std::endl;
    std::cout << "Keep the API key safe, it will not be shown again." << std::endl;
    std::cout << "Configuration updated. Send SIGHUP to a running bridge to rotate its live connection." << std::endl;

    HashService::wipe(key);
    return EXIT_SUCCESS;
}

// Pick up a changed key fingerprint from disk and move the live registration
void reload(BridgeClient& client) {
    auto loaded = load_config();
    if (loaded.is_err()) {
        SecureLogger::instance().error("Reload failed: " + loaded.error_detail());
        return;
    }

    const KeyHash stored = loaded.value().key_hash;
    if (stored == client.key_hash()) {
        SecureLogger::instance().info("Reload: key unchanged");
        return;
    }

    auto rotated = client.rotate_key(stored);
    if (rotated.is_err()) {
        SecureLogger::instance().error("Key rotation failed: " + rotated.error_message());
        return;
    }
    SecureLogger::instance().info("Key rotation sent to relay");
}

int run_start(const CommandLineOptions& options) {
    auto loaded = load_config();
    if (loaded.is_err()) {
        std::cerr << loaded.error_detail() << std::endl;
        std::cerr << "No configuration found. Run `mcp-bridge init` first." << std::endl;
        return EXIT_FAILURE;
    }
    const BridgeConfig config = loaded.value();

    const std::string log_dir =
        (std::filesystem::path(BridgeConfig::default_path()).parent_path() / "logs").string();
    SecureLogger::instance().initialize(log_dir, "bridge", SecureLogger::parse_level(options.log_level));
    SecureLogger::instance().set_console_output(true);

    SecureLogger::instance().info("Starting MCP Bridge " + std::string(Version::str));
    SecureLogger::instance().info("Cloud:  " + config.cloud_url);
    SecureLogger::instance().info("Pieces: " + config.pieces_endpoint);
    SecureLogger::instance().info("Bridge URL: " + config.cloud_url + constants::MCP_PATH_PREFIX + config.node_id);

    auto transport = std::make_shared<HttpRpcTransport>(config.pieces_endpoint);
    auto adapter = std::make_shared<ProtocolAdapter>(transport);

    BridgeClient client(config, adapter);
    client.set_key_change_listener([](const KeyHash& key_hash) {
        auto current = BridgeConfig::load(BridgeConfig::default_path());
        if (current.is_err()) {
            SecureLogger::instance().error("Cannot persist rotated key: " + current.error_detail());
            return;
        }
        BridgeConfig updated = current.value();
        if (updated.key_hash == key_hash) {
            return;
        }
        updated.key_hash = key_hash;
        auto saved = updated.save(BridgeConfig::default_path());
        if (saved.is_err()) {
            SecureLogger::instance().error("Cannot persist rotated key: " + saved.error_detail());
        }
    });

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    auto started = client.start();
    if (started.is_err()) {
        SecureLogger::instance().critical("Cannot start bridge: " + started.error_message());
        return EXIT_FAILURE;
    }

    {
        std::unique_lock<std::mutex> lock(shutdown_mutex);
        while (running) {
            shutdown_cv.wait_for(lock, std::chrono::seconds(1),
                                 [] { return !running.load() || reload_requested.load(); });

            if (reload_requested.exchange(false)) {
                lock.unlock();
                reload(client);
                lock.lock();
            }
        }
    }

    SecureLogger::instance().info("Shutdown signal received");
    client.stop();
    SecureLogger::instance().flush();
    return EXIT_SUCCESS;
}

// Fails unless the reply is 2xx and JSON
Result<Json> parse_reply(const Result<HttpResponse>& reply, const std::string& what) {
    if (reply.is_err()) {
        return {reply.error(), what + ": " + reply.error_detail()};
    }
    if (!reply.value().ok()) {
        return {ErrorCode::DOWNSTREAM_FAILED,
                what + " failed (" + std::to_string(reply.value().status) + "): " + reply.value().body};
    }

    Json body = Json::parse(reply.value().body, nullptr, false);
    if (body.is_discarded()) {
        return {ErrorCode::MALFORMED_MESSAGE, what + ": reply is not JSON"};
    }
    return body;
}

int run_client(const CommandLineOptions& options) {
    if (options.url.empty() || options.key.empty()) {
        std::cerr << "client requires --url URL and --key KEY" << std::endl;
        return EXIT_FAILURE;
    }

    HttpClient http(constants::DOWNSTREAM_TIMEOUT + std::chrono::seconds(10));
    const std::map<std::string, std::string> headers = {
        {"Authorization", "Bearer " + options.key},
        {"Content-Type", "application/json"},
    };

    std::cout << "Connecting to " << options.url << "..." << std::endl;

    auto status = parse_reply(http.get(options.url + "/status", headers), "Status check");
    if (status.is_err()) {
        std::cerr << status.error_detail() << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << status.value().dump(2) << std::endl;
    if (!status.value().value("online", false)) {
        std::cerr << "Bridge is offline" << std::endl;
        return EXIT_FAILURE;
    }

    auto listed = parse_reply(http.get(options.url + "/tools", headers), "List tools");
    if (listed.is_err()) {
        std::cerr << listed.error_detail() << std::endl;
        return EXIT_FAILURE;
    }

    const Json tools = listed.value().contains("result") && listed.value()["result"].is_object()
                           ? listed.value()["result"].value("tools", Json::array())
                           : Json::array();
    if (tools.empty()) {
        std::cout << "No tools found." << std::endl;
        return EXIT_SUCCESS;
    }

    std::cout << std::endl << "Tools:" << std::endl;
    for (const auto& tool : tools) {
        std::string description = tool.value("description", "");
        if (description.size() > 50) {
            description = description.substr(0, 50) + "...";
        }
        std::cout << "  " << tool.value("name", "?") << "  " << description << std::endl;
    }

    std::cout << std::endl << "Enter `tool-name [json-args]` to call a tool, or `exit` to quit." << std::endl;

    std::string line;
    while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
        std::istringstream input(line);
        std::string name;
        input >> name;
        if (name.empty()) {
            continue;
        }
        if (name == "exit") {
            break;
        }

        std::string args_text;
        std::getline(input, args_text);
        Json arguments = Json::object();
        if (args_text.find_first_not_of(" \t") != std::string::npos) {
            arguments = Json::parse(args_text, nullptr, false);
            if (arguments.is_discarded()) {
                std::cout << "Invalid JSON arguments" << std::endl;
                continue;
            }
        }

        const Json body = {
            {"method", "tools/call"},
            {"params", {{"name", name}, {"arguments", arguments}}},
        };

        const auto started = std::chrono::steady_clock::now();
        auto result = parse_reply(http.post(options.url + "/call", body.dump(), headers), "Call");
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (result.is_err()) {
            std::cout << result.error_detail() << std::endl;
            continue;
        }
        std::cout << "Success (" << elapsed.count() << "ms)" << std::endl;
        std::cout << result.value().dump(2) << std::endl;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options = parse_args(argc, argv);

        if (options.version) {
            std::cout << "MCP Bridge " << Version::full << std::endl;
            return EXIT_SUCCESS;
        }
        if (options.help || options.invalid) {
            print_usage(argv[0]);
            return options.invalid ? EXIT_FAILURE : EXIT_SUCCESS;
        }

        if (options.command == "init") {
            return run_init(options);
        }
        if (options.command == "start") {
            return run_start(options);
        }
        if (options.command == "rotate-key") {
            return run_rotate_key();
        }
        if (options.command == "client") {
            return run_client(options);
        }

        std::cerr << "Unknown command: " << options.command << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;

    } catch (const std::exception& e) {
        if (SecureLogger::is_initialized()) {
            SecureLogger::instance().critical("Fatal exception: " + std::string(e.what()));
        } else {
            std::cerr << "Fatal exception: " << e.what() << std::endl;
        }
        return EXIT_FAILURE;
    }
}
