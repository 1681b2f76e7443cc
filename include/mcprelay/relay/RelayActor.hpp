#pragma once

#include "mcprelay/relay/BridgeConnection.hpp"
#include "mcprelay/relay/ConnectionRegistry.hpp"
#include "mcprelay/relay/RequestMultiplexer.hpp"
#include "mcprelay/sdk/types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace mcprelay {
namespace relay {

/**
 * @brief Serialized relay state for one node identity
 *
 * Owns the node's ConnectionRegistry and RequestMultiplexer. Every public
 * member posts onto the actor's strand, so registration, forwarding, response
 * delivery and key rotation for one node never interleave while distinct
 * nodes proceed in parallel. Completion handlers run on the strand.
 */
class RelayActor : public std::enable_shared_from_this<RelayActor> {
public:
    using ConnectionPtr = std::shared_ptr<BridgeConnection>;
    using ConnectionLookup = std::function<std::vector<ConnectionPtr>()>;
    using StatusHandler = std::function<void(bool online)>;
    using ForwardHandler = RequestMultiplexer::Completion;
    // Runs on the strand when the actor holds no connections and no pending requests
    using IdleHandler = std::function<void(const RelayActor&)>;

    /**
     * @param ioc I/O context the actor's strand and deadline timers run on
     * @param node_id Node identity this actor serves
     * @param lookup Source of live transports for this node, consulted when
     *        the registry has lost its entries
     * @param on_idle Notified after a close or a completed request leaves the
     *        actor empty
     */
    RelayActor(net::io_context& ioc, sdk::NodeId node_id, ConnectionLookup lookup = {},
               IdleHandler on_idle = {});

    RelayActor(const RelayActor&) = delete;
    RelayActor& operator=(const RelayActor&) = delete;

    const sdk::NodeId& node_id() const { return node_id_; }

    /**
     * @brief Register a freshly accepted bridge connection
     *
     * A different connection already holding the fingerprint is closed with
     * reason "replaced". The new connection receives a registered message.
     */
    void connect(const sdk::KeyHash& key_hash, ConnectionPtr connection);

    /**
     * @brief Report whether a bridge is online
     * @param key_hash Specific fingerprint to check, or nullopt for any
     */
    void status(std::optional<sdk::KeyHash> key_hash, StatusHandler handler);

    /**
     * @brief Forward a request to the bridge registered under key_hash
     *
     * Completes with NOT_CONNECTED if no such bridge is registered.
     */
    void forward(const sdk::KeyHash& key_hash,
                 const std::string& method,
                 sdk::Json params,
                 std::chrono::milliseconds timeout,
                 ForwardHandler handler);

    /**
     * @brief Check a presented fingerprint and forward in one serialized step
     *
     * Completes with NOT_CONNECTED when no bridge is connected for the node,
     * UNAUTHORIZED when none is registered under the presented fingerprint,
     * otherwise with the bridge's result or REQUEST_TIMEOUT.
     */
    void authorized_forward(const sdk::KeyHash& presented_key_hash,
                            const std::string& method,
                            sdk::Json params,
                            std::chrono::milliseconds timeout,
                            ForwardHandler handler);

    /**
     * @brief Deliver a text frame received from a bridge connection
     */
    void on_message(ConnectionPtr connection, std::string frame);

    /**
     * @brief Drop a connection that has closed
     */
    void on_closed(ConnectionPtr connection);

    /**
     * @brief Discard in-memory tables, as after the actor was evicted
     *
     * Pending requests are left to their deadlines. The next lookup re-adopts
     * live connections through the ConnectionLookup.
     */
    void suspend();

    // Snapshots for diagnostics; updated on the strand
    std::size_t connection_count() const { return connection_count_.load(); }
    std::size_t pending_count() const { return pending_count_.load(); }

private:
    void do_connect(const sdk::KeyHash& key_hash, const ConnectionPtr& connection);
    void do_rotate(const ConnectionPtr& connection, const sdk::KeyHash& new_key_hash);

    // Registry lookups that fall back to recovery on a miss
    ConnectionPtr find_connection(const sdk::KeyHash& key_hash);
    ConnectionPtr match_connection(const sdk::KeyHash& presented_key_hash);
    bool has_connection();
    void recover();

    void send_request(const ConnectionPtr& connection,
                      const std::string& method,
                      const sdk::Json& params,
                      std::chrono::milliseconds timeout,
                      ForwardHandler handler);
    void update_counters();
    void notify_if_idle();

    net::strand<net::io_context::executor_type> strand_;
    const sdk::NodeId node_id_;
    ConnectionLookup lookup_;
    IdleHandler on_idle_;
    ConnectionRegistry registry_;
    std::shared_ptr<RequestMultiplexer> multiplexer_;

    std::atomic<std::size_t> connection_count_{0};
    std::atomic<std::size_t> pending_count_{0};
};

} // namespace relay
} // namespace mcprelay
