#pragma once

#include "mcprelay/relay/RelayHub.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/types.hpp"
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace mcprelay {
namespace relay {

namespace http = boost::beast::http;

/**
 * @brief Query parameters of a bridge connection request
 */
struct BridgeTarget {
    sdk::NodeId node_id;
    sdk::KeyHash key_hash;
};

/**
 * @brief HTTP front door of the relay
 *
 * Routes the plain HTTP API (hashing, status, tool listing and invocation,
 * health) and performs the ingress authorization gate in front of the relay
 * actors. WebSocket upgrades on the bridge path are taken over by the
 * transport before they reach handle(); only rejected bridge requests end up
 * here.
 */
class ApiRouter {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using Responder = std::function<void(Response)>;

    ApiRouter(RelayHub& hub, const sdk::HashService& hasher, std::chrono::milliseconds forward_timeout);

    /**
     * @brief Answer a request
     *
     * respond is called exactly once, either before handle() returns or later
     * from an actor strand once the bridge has answered.
     */
    void handle(const Request& req, Responder respond) const;

    /**
     * @brief Extract nodeId and keyHash from a bridge connection target
     * @return nullopt if the path is not the bridge path or a parameter is missing
     */
    static std::optional<BridgeTarget> bridge_target(const std::string& target);

    /**
     * @brief Path component of a request target, without the query string
     */
    static std::string path_of(const std::string& target);

    /**
     * @brief HTTP status a relay error is reported with
     */
    static http::status status_for(sdk::ErrorCode error);

private:
    void handle_hash(const Request& req, const Responder& respond) const;
    void handle_bridge_rejection(const Request& req, const Responder& respond) const;
    void handle_status(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const;
    void handle_tools(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const;
    void handle_call(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const;

    // Authenticate the bearer and forward through the node's actor
    void forward_authorized(const Request& req,
                            const sdk::NodeId& node_id,
                            const std::string& method,
                            sdk::Json params,
                            const Responder& respond) const;

    RelayHub& hub_;
    const sdk::HashService& hasher_;
    std::chrono::milliseconds forward_timeout_;
};

} // namespace relay
} // namespace mcprelay
