#pragma once

#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mcprelay {
namespace relay {

/**
 * @brief Relay process configuration
 *
 * Layered as: built-in defaults, then an INI file, then the environment, then
 * command line flags. Only the salt is mandatory.
 */
struct RelayConfig {
    std::string bind_address = sdk::constants::DEFAULT_BIND_ADDRESS;
    std::uint16_t port = sdk::constants::DEFAULT_RELAY_PORT;
    std::size_t io_threads = sdk::constants::DEFAULT_IO_THREADS;
    std::chrono::seconds forward_timeout = sdk::constants::DEFAULT_FORWARD_TIMEOUT;
    std::string log_level = "info";
    std::string log_path = sdk::constants::RELAY_LOG_PATH;
    std::string hash_salt;

    /**
     * @brief Overlay the keys present in an INI file onto this configuration
     *
     * Recognized keys: bind_address, port, io_threads,
     * forward_timeout_seconds, log_level, log_path, hash_salt. Keys may also
     * live in a [relay] section.
     * @return CONFIG_ERROR if the file cannot be read or a value is invalid
     */
    sdk::Result<void> load_file(const std::string& path);

    /**
     * @brief Take the salt from MCP_RELAY_HASH_SALT, falling back to HASH_SALT
     */
    void apply_environment();

    /**
     * @brief Check that the configuration can start a relay
     */
    sdk::Result<void> validate() const;

    /**
     * @brief First existing file among the default config locations
     * @return Empty string if none exists
     */
    static std::string find_default_file();

    static const std::vector<std::string>& default_file_locations();
};

} // namespace relay
} // namespace mcprelay
