#pragma once

#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcprelay {
namespace bridge {

/**
 * @brief One reply from the downstream RPC endpoint
 */
struct RpcResponse {
    unsigned status = 0;
    std::string body;
    std::string content_type;
    std::optional<std::string> session_id;  // mcp-session-id header, if present

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Carries one JSON-RPC message to the downstream service
 */
class RpcTransport {
public:
    virtual ~RpcTransport() = default;

    /**
     * @brief POST a serialized JSON-RPC message
     * @param body Message text
     * @param session_id Session token to attach, if any
     * @return The reply whatever its status, NETWORK_ERROR if none arrived
     */
    virtual sdk::Result<RpcResponse> post(const std::string& body,
                                          const std::optional<std::string>& session_id) = 0;
};

/**
 * @brief MCP Streamable HTTP transport
 */
class HttpRpcTransport : public RpcTransport {
public:
    explicit HttpRpcTransport(std::string endpoint,
                              std::chrono::seconds timeout = sdk::constants::DOWNSTREAM_TIMEOUT);

    sdk::Result<RpcResponse> post(const std::string& body,
                                  const std::optional<std::string>& session_id) override;

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    sdk::HttpClient client_;
};

/**
 * @brief Session-aware JSON-RPC client for the local MCP service
 *
 * The session handshake runs lazily before the first request when no session
 * token is held. Any reply carrying a session token replaces the stored one
 * (last writer wins). Safe to call from several threads at once.
 */
class ProtocolAdapter {
public:
    explicit ProtocolAdapter(std::shared_ptr<RpcTransport> transport);

    /**
     * @brief Run the initialize handshake
     * @return SESSION_INIT_FAILED if the service refused or could not be reached
     */
    sdk::Result<void> initialize();

    /**
     * @brief Send one JSON-RPC request and return the parsed reply message
     * @param method JSON-RPC method
     * @param params Parameters, null to omit
     * @return The JSON-RPC reply; DOWNSTREAM_FAILED for non-2xx replies or
     *         bodies that are not JSON
     */
    sdk::Result<sdk::Json> send_request(const std::string& method, const sdk::Json& params = sdk::Json());

    sdk::Result<sdk::Json> list_tools();

    sdk::Result<sdk::Json> call_tool(const std::string& name, const sdk::Json& arguments);

    /**
     * @brief Route a relayed request by method name
     *
     * tools/list and tools/call get their dedicated calls; everything else is
     * passed through. tools/call without a string "name" is INVALID_PARAMETER.
     */
    sdk::Result<sdk::Json> invoke(const std::string& method, const sdk::Json& params);

    std::optional<std::string> session_id() const;

    /**
     * @brief Extract a JSON-RPC message from a text/event-stream body
     *
     * Picks the message whose "id" equals request_id, otherwise the last
     * message in the stream.
     */
    static sdk::Result<sdk::Json> parse_event_stream(const std::string& body, std::int64_t request_id);

private:
    // Serialize, post and decode one message; session token bookkeeping included
    sdk::Result<sdk::Json> exchange(const sdk::Json& message, std::int64_t id);

    void remember_session(const RpcResponse& response);

    std::shared_ptr<RpcTransport> transport_;
    std::atomic<std::int64_t> next_id_{1};
    mutable std::mutex session_mutex_;
    std::optional<std::string> session_id_;
};

} // namespace bridge
} // namespace mcprelay
