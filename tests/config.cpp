#include "mcprelay/bridge/BridgeConfig.hpp"
#include "mcprelay/bridge/MachineIdentity.hpp"
#include "mcprelay/relay/RelayConfig.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace mcprelay;
using sdk::ErrorCode;

namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
    const fs::path dir = fs::temp_directory_path() / ("mcprelay-config-test-" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

void test_relay_ini(const fs::path& dir) {
    const fs::path path = dir / "relay.conf";
    write_file(path,
               "# relay settings\n"
               "bind_address = 127.0.0.1\n"
               "port = 9100\n"
               "io_threads = 2\n"
               "forward_timeout_seconds = 15\n"
               "log_level = debug\n"
               "hash_salt = from-file\n");

    relay::RelayConfig config;
    assert(config.load_file(path.string()).is_ok());
    assert(config.bind_address == "127.0.0.1");
    assert(config.port == 9100);
    assert(config.io_threads == 2);
    assert(config.forward_timeout == std::chrono::seconds(15));
    assert(config.log_level == "debug");
    assert(config.hash_salt == "from-file");
    assert(config.log_path == sdk::constants::RELAY_LOG_PATH);

    // The environment wins over the file; the dedicated variable over the legacy one
    ::setenv("HASH_SALT", "legacy-salt", 1);
    ::unsetenv("MCP_RELAY_HASH_SALT");
    config.apply_environment();
    assert(config.hash_salt == "legacy-salt");

    ::setenv("MCP_RELAY_HASH_SALT", "primary-salt", 1);
    config.apply_environment();
    assert(config.hash_salt == "primary-salt");
    assert(config.validate().is_ok());

    ::unsetenv("MCP_RELAY_HASH_SALT");
    ::unsetenv("HASH_SALT");

    // Section form
    const fs::path sectioned = dir / "sectioned.conf";
    write_file(sectioned, "[relay]\nport = 9200\n");
    relay::RelayConfig from_section;
    assert(from_section.load_file(sectioned.string()).is_ok());
    assert(from_section.port == 9200);

    // Defaults and failures
    relay::RelayConfig defaults;
    assert(defaults.port == 8787);
    assert(defaults.forward_timeout == std::chrono::seconds(60));
    assert(defaults.validate().error() == ErrorCode::CONFIG_ERROR);

    for (const std::string bad : {"port = 70000\n", "port = http\n", "io_threads = 0\n",
                                  "forward_timeout_seconds = -5\n"}) {
        const fs::path invalid = dir / "invalid.conf";
        write_file(invalid, bad);
        relay::RelayConfig rejected;
        assert(rejected.load_file(invalid.string()).error() == ErrorCode::CONFIG_ERROR);
    }

    relay::RelayConfig missing;
    assert(missing.load_file((dir / "absent.conf").string()).error() == ErrorCode::CONFIG_ERROR);
}

void test_bridge_config(const fs::path& dir) {
    bridge::BridgeConfig config;
    config.cloud_url = "http://relay.example.com:8787";
    config.node_id = std::string(64, 'a');
    config.key_hash = std::string(64, 'b');
    assert(config.validate().is_ok());
    assert(config.pieces_endpoint == sdk::constants::DEFAULT_DOWNSTREAM_ENDPOINT);

    auto url = config.bridge_url();
    assert(url.is_ok());
    assert(url.value() == "ws://relay.example.com:8787/ws/bridge?nodeId=" + config.node_id +
                          "&keyHash=" + config.key_hash);

    bridge::BridgeConfig secure = config;
    secure.cloud_url = "https://relay.example.com";
    assert(secure.bridge_url().value().compare(0, 30, "wss://relay.example.com/ws/bri") == 0);

    const fs::path path = dir / "nested" / "config.json";
    assert(config.save(path.string()).is_ok());

    struct stat info {};
    assert(::stat(path.c_str(), &info) == 0);
    assert((info.st_mode & 0777) == 0600);

    auto loaded = bridge::BridgeConfig::load(path.string());
    assert(loaded.is_ok());
    assert(loaded.value() == config);

    // Stored keys use the camelCase names
    std::ifstream file(path);
    const std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    assert(text.find("\"cloudUrl\"") != std::string::npos);
    assert(text.find("\"piecesEndpoint\"") != std::string::npos);

    const fs::path trailing = dir / "trailing.json";
    write_file(trailing, R"({"cloudUrl":"http://relay.local/","nodeId":"n","keyHash":"k"})");
    auto trimmed = bridge::BridgeConfig::load(trailing.string());
    assert(trimmed.is_ok());
    assert(trimmed.value().cloud_url == "http://relay.local");
    assert(trimmed.value().pieces_endpoint == sdk::constants::DEFAULT_DOWNSTREAM_ENDPOINT);

    const fs::path broken = dir / "broken.json";
    write_file(broken, "{ not json");
    assert(bridge::BridgeConfig::load(broken.string()).error() == ErrorCode::CONFIG_ERROR);
    assert(bridge::BridgeConfig::load((dir / "none.json").string()).error() == ErrorCode::FILE_IO_ERROR);

    bridge::BridgeConfig incomplete;
    incomplete.cloud_url = "http://relay.local";
    assert(incomplete.validate().error() == ErrorCode::CONFIG_ERROR);

    ::setenv("MCP_BRIDGE_CONFIG", "/tmp/custom-bridge.json", 1);
    assert(bridge::BridgeConfig::default_path() == "/tmp/custom-bridge.json");
    ::unsetenv("MCP_BRIDGE_CONFIG");
    ::setenv("HOME", "/home/bridge-user", 1);
    assert(bridge::BridgeConfig::default_path() == "/home/bridge-user/.mcp-bridge/config.json");
}

void test_machine_identity(const fs::path& dir) {
    const fs::path empty = dir / "empty-id";
    const fs::path machine = dir / "machine-id";
    write_file(empty, "\n");
    write_file(machine, "  4c4c4544004d3010804bb4c04f393532 \n");

    auto raw = bridge::MachineIdentity::raw_id({(dir / "missing").string(), empty.string(), machine.string()});
    assert(raw.is_ok());
    assert(raw.value() == "4c4c4544004d3010804bb4c04f393532");

    // Host name fallback
    auto fallback = bridge::MachineIdentity::raw_id({(dir / "missing").string()});
    assert(fallback.is_ok());
    assert(!fallback.value().empty());

    const auto key = bridge::MachineIdentity::generate_api_key();
    assert(key.size() == 36);
    assert(key[8] == '-' && key[13] == '-' && key[18] == '-' && key[23] == '-');
    assert(key != bridge::MachineIdentity::generate_api_key());
}

} // namespace

int main() {
    const fs::path dir = scratch_dir();

    test_relay_ini(dir);
    test_bridge_config(dir);
    test_machine_identity(dir);

    std::error_code ec;
    fs::remove_all(dir, ec);
    return 0;
}
