#pragma once

#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <string>

namespace mcprelay {
namespace bridge {

/**
 * @brief Persisted bridge settings (~/.mcp-bridge/config.json)
 */
struct BridgeConfig {
    std::string cloud_url;       // relay base URL, e.g. https://relay.example.com
    sdk::NodeId node_id;         // hashed machine id
    sdk::KeyHash key_hash;       // hashed API key
    std::string pieces_endpoint = sdk::constants::DEFAULT_DOWNSTREAM_ENDPOINT;

    /**
     * @brief Check that every field needed to connect is present
     */
    sdk::Result<void> validate() const;

    /**
     * @brief Bridge WebSocket URL: ws(s)://<relay>/ws/bridge?nodeId=..&keyHash=..
     */
    sdk::Result<std::string> bridge_url() const;

    /**
     * @brief Read a config file (JSON)
     * @return FILE_IO_ERROR if missing or unreadable, CONFIG_ERROR if malformed
     */
    static sdk::Result<BridgeConfig> load(const std::string& path);

    /**
     * @brief Write a config file (JSON), creating its directory; mode 0600
     */
    sdk::Result<void> save(const std::string& path) const;

    /**
     * @brief $MCP_BRIDGE_CONFIG, else $HOME/.mcp-bridge/config.json
     */
    static std::string default_path();
};

bool operator==(const BridgeConfig& lhs, const BridgeConfig& rhs);

} // namespace bridge
} // namespace mcprelay
