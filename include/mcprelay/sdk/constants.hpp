#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace mcprelay {
namespace sdk {

/**
 * @brief Constants shared by the relay and the bridge
 */
namespace constants {
    // Timing constants
    constexpr auto DEFAULT_FORWARD_TIMEOUT = std::chrono::seconds(60);
    constexpr auto RECONNECT_DELAY = std::chrono::seconds(5);
    constexpr auto PING_INTERVAL = std::chrono::seconds(30);
    constexpr auto CONNECTION_TIMEOUT = std::chrono::seconds(30);
    constexpr auto HTTP_READ_TIMEOUT = std::chrono::seconds(30);
    constexpr auto DOWNSTREAM_TIMEOUT = std::chrono::seconds(55);

    // Size constants
    constexpr std::size_t MAX_MESSAGE_SIZE = 1024 * 1024 * 10; // 10 MB
    constexpr std::size_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024; // 10 MB
    constexpr std::size_t DEFAULT_IO_THREADS = 4;
    constexpr std::size_t DEFAULT_WORKER_THREADS = 4;
    constexpr std::size_t SHA256_HEX_LENGTH = 64;
    constexpr std::size_t REDACTED_PREFIX_LENGTH = 12;

    // Network defaults
    constexpr std::uint16_t DEFAULT_RELAY_PORT = 8787;
    const std::string DEFAULT_BIND_ADDRESS = "0.0.0.0";
    const std::string BRIDGE_WS_PATH = "/ws/bridge";
    const std::string HASH_PATH = "/api/hash";
    const std::string MCP_PATH_PREFIX = "/mcp/";
    const std::string SERVER_NAME = "MCP Cloud Relay";
    const std::string DEFAULT_DOWNSTREAM_ENDPOINT =
        "http://localhost:39300/model_context_protocol/2025-03-26/mcp";

    // Downstream protocol
    const std::string MCP_PROTOCOL_VERSION = "2025-03-26";
    const std::string MCP_SESSION_HEADER = "mcp-session-id";
    const std::string BRIDGE_CLIENT_NAME = "mcp-bridge";

    // Close reasons
    const std::string CLOSE_REASON_REPLACED = "replaced";
    const std::string CLOSE_REASON_STOPPED = "bridge stopped";

    // Environment variables
    const std::string SALT_ENV = "MCP_RELAY_HASH_SALT";
    const std::string LEGACY_SALT_ENV = "HASH_SALT";
    const std::string BRIDGE_CONFIG_ENV = "MCP_BRIDGE_CONFIG";

    // Path constants
    const std::string RELAY_LOG_PATH = "/var/log/mcprelay/";
    const std::string BRIDGE_CONFIG_DIR = ".mcp-bridge";
    const std::string BRIDGE_CONFIG_FILE = "config.json";
    const std::string MACHINE_ID_PATH = "/etc/machine-id";
    const std::string DBUS_MACHINE_ID_PATH = "/var/lib/dbus/machine-id";
}

} // namespace sdk
} // namespace mcprelay
