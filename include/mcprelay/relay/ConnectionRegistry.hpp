#pragma once

#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/sdk/types.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcprelay {
namespace relay {

/**
 * @brief Fingerprint -> connection table for one node identity
 *
 * Holds at most one connection per fingerprint and keeps a reverse table for
 * cleanup. Not thread safe: the owning RelayActor only touches it from its
 * strand. The registry never closes connections itself; it hands displaced
 * connections back to the caller.
 */
class ConnectionRegistry {
public:
    using ConnectionPtr = std::shared_ptr<BridgeConnection>;

    /**
     * @brief Install a connection under a fingerprint
     * @return The connection previously occupying the slot (already removed),
     *         or null
     */
    ConnectionPtr install(const sdk::KeyHash& key_hash, const ConnectionPtr& connection);

    ConnectionPtr find(const sdk::KeyHash& key_hash) const;

    std::optional<sdk::KeyHash> fingerprint_of(const ConnectionPtr& connection) const;

    /**
     * @brief Move a registered connection to another fingerprint slot
     * @return The different connection displaced from the target slot (or
     *         null); INVALID_STATE if the connection is not registered
     */
    sdk::Result<ConnectionPtr> move(const ConnectionPtr& connection, const sdk::KeyHash& new_key_hash);

    /**
     * @brief Remove a connection if it still owns its slot
     * @return true if an entry was removed
     */
    bool remove(const ConnectionPtr& connection);

    /**
     * @brief Re-adopt open connections by their fingerprint tag
     *
     * Connections whose slot is already taken, that are closing, or that carry
     * no tag are skipped.
     * @return Number of connections adopted
     */
    std::size_t adopt(const std::vector<ConnectionPtr>& live);

    std::vector<sdk::KeyHash> fingerprints() const;

    std::size_t size() const { return by_fingerprint_.size(); }
    bool empty() const { return by_fingerprint_.empty(); }
    void clear();

private:
    std::unordered_map<sdk::KeyHash, ConnectionPtr> by_fingerprint_;
    std::unordered_map<const BridgeConnection*, sdk::KeyHash> by_connection_;
};

} // namespace relay
} // namespace mcprelay
