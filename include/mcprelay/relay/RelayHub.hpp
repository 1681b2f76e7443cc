#pragma once

#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/relay/RelayActor.hpp"
#include "mcprelay/sdk/types.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mcprelay {
namespace relay {

/**
 * @brief Directory of relay actors and live bridge transports
 *
 * Maps node identities to their RelayActor (created on first bridge
 * connection, released once it holds neither connections nor pending
 * requests) and keeps every accepted transport, tagged with its node, so an
 * actor can re-adopt connections after losing its tables. Thread safe.
 */
class RelayHub {
public:
    explicit RelayHub(net::io_context& ioc);

    RelayHub(const RelayHub&) = delete;
    RelayHub& operator=(const RelayHub&) = delete;

    /**
     * @brief Actor for a node, created if it does not exist yet
     */
    std::shared_ptr<RelayActor> actor_for(const sdk::NodeId& node_id);

    /**
     * @brief Actor for a node, or null; never allocates
     */
    std::shared_ptr<RelayActor> find_actor(const sdk::NodeId& node_id) const;

    /**
     * @brief Record an accepted transport and register it with its node's actor
     * @return The actor the connection belongs to
     */
    std::shared_ptr<RelayActor> attach(const std::shared_ptr<BridgeConnection>& connection);

    /**
     * @brief Forget a closed transport and notify its actor
     */
    void detach(const std::shared_ptr<BridgeConnection>& connection);

    /**
     * @brief Open transports accepted for a node
     */
    std::vector<std::shared_ptr<BridgeConnection>> live_connections(const sdk::NodeId& node_id) const;

    std::size_t actor_count() const;
    std::size_t connection_count() const;

private:
    std::shared_ptr<RelayActor> actor_for_locked(const sdk::NodeId& node_id);

    // Drop an idle actor unless a transport for its node was attached meanwhile
    void release(const RelayActor& actor);

    net::io_context& ioc_;
    mutable std::mutex mutex_;
    std::unordered_map<sdk::NodeId, std::shared_ptr<RelayActor>> actors_;
    std::unordered_map<sdk::NodeId, std::vector<std::weak_ptr<BridgeConnection>>> directory_;
};

} // namespace relay
} // namespace mcprelay
