#pragma once

#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace mcprelay {
namespace bridge {

/**
 * @brief Client for the relay's public /api/hash endpoint
 *
 * The salt only exists on the relay, so every fingerprint the bridge stores
 * (node id, key hash) is computed there.
 */
class RemoteHasher {
public:
    explicit RemoteHasher(std::string cloud_url,
                          std::chrono::seconds timeout = sdk::constants::HTTP_READ_TIMEOUT);

    /**
     * @return The relay's 64 character hex digest of value
     */
    sdk::Result<std::string> hash(const std::string& value) const;

private:
    std::string cloud_url_;
    sdk::HttpClient client_;
};

/**
 * @brief Stable identity of the bridge host
 */
class MachineIdentity {
public:
    /**
     * @brief Raw machine id: first readable, non-empty file among paths,
     *        otherwise the host name
     */
    static sdk::Result<std::string> raw_id(const std::vector<std::string>& paths = {
        sdk::constants::MACHINE_ID_PATH,
        sdk::constants::DBUS_MACHINE_ID_PATH,
    });

    /**
     * @brief Node identity: the relay's hash of the raw machine id
     */
    static sdk::Result<sdk::NodeId> node_id(const RemoteHasher& hasher);

    /**
     * @brief Fresh random API key (UUID text)
     */
    static std::string generate_api_key();
};

} // namespace bridge
} // namespace mcprelay
