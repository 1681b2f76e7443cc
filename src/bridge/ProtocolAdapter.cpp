#include "mcprelay/bridge/ProtocolAdapter.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/version.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>

namespace mcprelay {
namespace bridge {

using sdk::ErrorCode;
using sdk::Json;
using sdk::Result;
using sdk::SecureLogger;

namespace {

constexpr std::int64_t INITIALIZE_ID = 0;

bool is_event_stream(const RpcResponse& response) {
    return response.content_type.find("text/event-stream") != std::string::npos;
}

Result<Json> decode_reply(const RpcResponse& response, std::int64_t id) {
    if (is_event_stream(response)) {
        return ProtocolAdapter::parse_event_stream(response.body, id);
    }

    Json parsed = Json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        return {ErrorCode::DOWNSTREAM_FAILED, "MCP reply is not JSON"};
    }
    return parsed;
}

} // namespace

HttpRpcTransport::HttpRpcTransport(std::string endpoint, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)), client_(timeout) {
}

Result<RpcResponse> HttpRpcTransport::post(const std::string& body,
                                           const std::optional<std::string>& session_id) {
    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "application/json, text/event-stream"},
    };
    if (session_id) {
        headers[sdk::constants::MCP_SESSION_HEADER] = *session_id;
    }

    auto result = client_.post(endpoint_, body, headers);
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }

    const auto& http_response = result.value();

    RpcResponse response;
    response.status = http_response.status;
    response.body = http_response.body;
    response.content_type = http_response.content_type;

    const std::string sid = http_response.header(sdk::constants::MCP_SESSION_HEADER);
    if (!sid.empty()) {
        response.session_id = sid;
    }
    return response;
}

ProtocolAdapter::ProtocolAdapter(std::shared_ptr<RpcTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("ProtocolAdapter requires a transport");
    }
}

Result<void> ProtocolAdapter::initialize() {
    const Json message = {
        {"jsonrpc", "2.0"},
        {"id", INITIALIZE_ID},
        {"method", "initialize"},
        {"params", {
            {"protocolVersion", sdk::constants::MCP_PROTOCOL_VERSION},
            {"capabilities", Json::object()},
            {"clientInfo", {
                {"name", sdk::constants::BRIDGE_CLIENT_NAME},
                {"version", Version::str},
            }},
        }},
    };

    auto reply = transport_->post(message.dump(), std::nullopt);
    if (reply.is_err()) {
        return {ErrorCode::SESSION_INIT_FAILED, reply.error_detail()};
    }

    const auto& response = reply.value();
    remember_session(response);

    if (!response.ok()) {
        return {ErrorCode::SESSION_INIT_FAILED,
                "MCP initialize failed (" + std::to_string(response.status) + "): " + response.body};
    }

    auto decoded = decode_reply(response, INITIALIZE_ID);
    if (decoded.is_err()) {
        return {ErrorCode::SESSION_INIT_FAILED, decoded.error_detail()};
    }

    const auto sid = session_id();
    SecureLogger::instance().info("MCP session initialized" +
                                  (sid ? " (session " + SecureLogger::redact(*sid) + ")" : std::string()));
    SecureLogger::instance().debug("MCP initialize reply: " + decoded.value().dump());
    return {};
}

Result<Json> ProtocolAdapter::send_request(const std::string& method, const Json& params) {
    if (!session_id()) {
        auto init = initialize();
        if (init.is_err()) {
            return {init.error(), init.error_detail()};
        }
    }

    const std::int64_t id = next_id_++;

    Json message = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
    };
    if (!params.is_null()) {
        message["params"] = params;
    }

    return exchange(message, id);
}

Result<Json> ProtocolAdapter::list_tools() {
    return send_request("tools/list");
}

Result<Json> ProtocolAdapter::call_tool(const std::string& name, const Json& arguments) {
    return send_request("tools/call", {
        {"name", name},
        {"arguments", arguments.is_null() ? Json::object() : arguments},
    });
}

Result<Json> ProtocolAdapter::invoke(const std::string& method, const Json& params) {
    if (method == "tools/list") {
        return list_tools();
    }

    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return {ErrorCode::INVALID_PARAMETER, "tools/call requires a string \"name\""};
        }
        const Json arguments = params.contains("arguments") ? params["arguments"] : Json::object();
        return call_tool(params["name"].get<std::string>(), arguments);
    }

    return send_request(method, params);
}

std::optional<std::string> ProtocolAdapter::session_id() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

Result<Json> ProtocolAdapter::exchange(const Json& message, std::int64_t id) {
    auto reply = transport_->post(message.dump(), session_id());
    if (reply.is_err()) {
        return {reply.error(), reply.error_detail()};
    }

    const auto& response = reply.value();
    remember_session(response);

    if (!response.ok()) {
        return {ErrorCode::DOWNSTREAM_FAILED,
                "MCP request failed (" + std::to_string(response.status) + "): " + response.body};
    }

    return decode_reply(response, id);
}

void ProtocolAdapter::remember_session(const RpcResponse& response) {
    if (!response.session_id || response.session_id->empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ != response.session_id) {
        session_id_ = response.session_id;
    }
}

Result<Json> ProtocolAdapter::parse_event_stream(const std::string& body, std::int64_t request_id) {
    std::vector<Json> messages;
    std::string data;

    auto flush_event = [&messages, &data]() {
        if (!data.empty()) {
            Json parsed = Json::parse(data, nullptr, false);
            if (!parsed.is_discarded()) {
                messages.push_back(std::move(parsed));
            }
        }
        data.clear();
    };

    std::istringstream stream(body);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            flush_event();
        } else if (line.compare(0, 5, "data:") == 0) {
            std::string chunk = line.substr(5);
            if (!chunk.empty() && chunk[0] == ' ') {
                chunk.erase(0, 1);
            }
            if (!data.empty()) {
                data.push_back('\n');
            }
            data += chunk;
        }
        // id:, event:, retry: and comments carry nothing we need
    }
    flush_event();

    if (messages.empty()) {
        return {ErrorCode::DOWNSTREAM_FAILED, "MCP event stream carried no message"};
    }

    for (const auto& message : messages) {
        if (message.is_object() && message.contains("id") && message["id"].is_number_integer() &&
            message["id"].get<std::int64_t>() == request_id) {
            return message;
        }
    }
    return messages.back();
}

} // namespace bridge
} // namespace mcprelay
