#include "mcprelay/relay/ApiRouter.hpp"
#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/version.hpp"
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcprelay {
namespace relay {

namespace websocket = boost::beast::websocket;
using sdk::ErrorCode;
using sdk::Json;
using sdk::SecureLogger;

namespace {

std::string to_std_string(boost::beast::string_view view) {
    return std::string(view.data(), view.size());
}

// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.000Z
std::string iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

ApiRouter::Response make_response(unsigned version, bool keep_alive, http::status status, const Json& body) {
    ApiRouter::Response res{status, version};
    res.keep_alive(keep_alive);

    res.set(http::field::server, sdk::constants::SERVER_NAME + "/" + Version::str);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");

    res.body() = body.dump(-1, ' ', false, Json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

ApiRouter::Response make_response(const ApiRouter::Request& req, http::status status, const Json& body) {
    return make_response(req.version(), req.keep_alive(), status, body);
}

ApiRouter::Response make_error(unsigned version, bool keep_alive, ErrorCode error,
                               const std::string& detail, const sdk::NodeId& node_id = {}) {
    Json body = {{"error", detail}};
    if (error == ErrorCode::NOT_CONNECTED && !node_id.empty()) {
        body["nodeId"] = node_id;
    }
    return make_response(version, keep_alive, ApiRouter::status_for(error), body);
}

ApiRouter::Response make_error(const ApiRouter::Request& req, ErrorCode error,
                               const std::string& detail, const sdk::NodeId& node_id = {}) {
    return make_error(req.version(), req.keep_alive(), error, detail, node_id);
}

// Secret from "Authorization: Bearer <secret>", empty if absent or malformed
std::string bearer_secret(const ApiRouter::Request& req) {
    static const std::string prefix = "Bearer ";

    auto it = req.find(http::field::authorization);
    if (it == req.end()) {
        return {};
    }

    const std::string header = to_std_string(it->value());
    if (header.compare(0, prefix.size(), prefix) != 0) {
        return {};
    }
    return header.substr(prefix.size());
}

} // namespace

ApiRouter::ApiRouter(RelayHub& hub, const sdk::HashService& hasher, std::chrono::milliseconds forward_timeout)
    : hub_(hub), hasher_(hasher), forward_timeout_(forward_timeout) {
}

void ApiRouter::handle(const Request& req, Responder respond) const {
    const std::string path = path_of(to_std_string(req.target()));

    // CORS preflight
    if (req.method() == http::verb::options) {
        Response res = make_response(req, http::status::no_content, Json::object());
        res.body().clear();
        res.prepare_payload();
        respond(std::move(res));
        return;
    }

    try {
        if (path == "/" && req.method() == http::verb::get) {
            respond(make_response(req, http::status::ok, {
                {"name", sdk::constants::SERVER_NAME},
                {"version", Version::str},
                {"endpoints", {
                    {"hash", "POST /api/hash"},
                    {"bridge", "GET /ws/bridge?nodeId=&keyHash= (WebSocket)"},
                    {"mcpCall", "POST /mcp/:nodeId/call (Bearer auth)"},
                    {"mcpTools", "GET /mcp/:nodeId/tools (Bearer auth)"},
                    {"mcpStatus", "GET /mcp/:nodeId/status"},
                    {"health", "GET /health"},
                }},
            }));
        } else if (path == "/health" && req.method() == http::verb::get) {
            respond(make_response(req, http::status::ok, {{"status", "ok"}, {"timestamp", iso_timestamp()}}));
        } else if (path == sdk::constants::HASH_PATH && req.method() == http::verb::post) {
            handle_hash(req, respond);
        } else if (path == sdk::constants::BRIDGE_WS_PATH && req.method() == http::verb::get) {
            handle_bridge_rejection(req, respond);
        } else if (path.compare(0, sdk::constants::MCP_PATH_PREFIX.size(), sdk::constants::MCP_PATH_PREFIX) == 0) {
            const std::string rest = path.substr(sdk::constants::MCP_PATH_PREFIX.size());
            const auto slash = rest.find('/');
            const sdk::NodeId node_id = slash == std::string::npos ? std::string() : sdk::url_decode(rest.substr(0, slash));
            const std::string action = slash == std::string::npos ? std::string() : rest.substr(slash + 1);

            if (!node_id.empty() && action == "status" && req.method() == http::verb::get) {
                handle_status(req, node_id, respond);
            } else if (!node_id.empty() && action == "tools" && req.method() == http::verb::get) {
                handle_tools(req, node_id, respond);
            } else if (!node_id.empty() && action == "call" && req.method() == http::verb::post) {
                handle_call(req, node_id, respond);
            } else {
                respond(make_response(req, http::status::not_found, {{"error", "Not found"}}));
            }
        } else {
            respond(make_response(req, http::status::not_found, {{"error", "Not found"}}));
        }
    } catch (const std::exception& e) {
        SecureLogger::instance().error("Exception handling " + to_std_string(req.method_string()) + " " +
                                       path + ": " + e.what());
        respond(make_response(req, http::status::internal_server_error, {{"error", "Internal server error"}}));
    }
}

void ApiRouter::handle_hash(const Request& req, const Responder& respond) const {
    Json body = Json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        respond(make_error(req, ErrorCode::INVALID_PARAMETER, "Invalid JSON body"));
        return;
    }

    auto value = body.find("value");
    if (value == body.end() || !value->is_string() || value->get_ref<const std::string&>().empty()) {
        respond(make_error(req, ErrorCode::INVALID_PARAMETER, "Missing or invalid \"value\" field"));
        return;
    }

    auto digest = hasher_.hash(value->get<std::string>());
    if (digest.is_err()) {
        respond(make_error(req, digest.error(), digest.error_detail()));
        return;
    }

    respond(make_response(req, http::status::ok, {{"hash", digest.value()}}));
}

void ApiRouter::handle_bridge_rejection(const Request& req, const Responder& respond) const {
    if (!websocket::is_upgrade(req)) {
        respond(make_response(req, http::status::upgrade_required, {{"error", "Expected WebSocket upgrade"}}));
        return;
    }
    respond(make_error(req, ErrorCode::INVALID_PARAMETER, "Missing nodeId or keyHash query params"));
}

void ApiRouter::handle_status(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const {
    auto actor = hub_.find_actor(node_id);
    if (!actor) {
        respond(make_response(req, http::status::ok, {{"nodeId", node_id}, {"online", false}}));
        return;
    }

    // A bearer, when given, narrows the check to that key's slot
    std::optional<sdk::KeyHash> key_hash;
    std::string secret = bearer_secret(req);
    if (!secret.empty()) {
        auto digest = hasher_.hash(secret);
        sdk::HashService::wipe(secret);
        if (digest.is_ok()) {
            key_hash = digest.value();
        }
    }

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    actor->status(key_hash, [respond, version, keep_alive, node_id](bool online) {
        respond(make_response(version, keep_alive, http::status::ok, {{"nodeId", node_id}, {"online", online}}));
    });
}

void ApiRouter::handle_tools(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const {
    forward_authorized(req, node_id, "tools/list", Json(), respond);
}

void ApiRouter::handle_call(const Request& req, const sdk::NodeId& node_id, const Responder& respond) const {
    if (bearer_secret(req).empty()) {
        respond(make_error(req, ErrorCode::UNAUTHENTICATED, sdk::ErrorCodeToString(ErrorCode::UNAUTHENTICATED)));
        return;
    }

    Json body = Json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        respond(make_error(req, ErrorCode::INVALID_PARAMETER, "Invalid JSON body"));
        return;
    }

    auto method = body.find("method");
    if (method == body.end() || !method->is_string() || method->get_ref<const std::string&>().empty()) {
        respond(make_error(req, ErrorCode::INVALID_PARAMETER, "Missing \"method\" field in request body"));
        return;
    }

    Json params;
    auto supplied = body.find("params");
    if (supplied != body.end() && !supplied->is_null()) {
        if (!supplied->is_object() && !supplied->is_array()) {
            respond(make_error(req, ErrorCode::INVALID_PARAMETER, "\"params\" must be an object or an array"));
            return;
        }
        params = *supplied;
    }

    forward_authorized(req, node_id, method->get<std::string>(), std::move(params), respond);
}

void ApiRouter::forward_authorized(const Request& req,
                                   const sdk::NodeId& node_id,
                                   const std::string& method,
                                   Json params,
                                   const Responder& respond) const {
    std::string secret = bearer_secret(req);
    if (secret.empty()) {
        respond(make_error(req, ErrorCode::UNAUTHENTICATED, sdk::ErrorCodeToString(ErrorCode::UNAUTHENTICATED)));
        return;
    }

    auto presented = hasher_.hash(secret);
    sdk::HashService::wipe(secret);
    if (presented.is_err()) {
        respond(make_error(req, presented.error(), presented.error_detail()));
        return;
    }

    // Unknown identities never get an actor
    auto actor = hub_.find_actor(node_id);
    if (!actor) {
        respond(make_error(req, ErrorCode::NOT_CONNECTED, sdk::ErrorCodeToString(ErrorCode::NOT_CONNECTED), node_id));
        return;
    }

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();
    actor->authorized_forward(presented.value(), method, std::move(params), forward_timeout_,
        [respond, version, keep_alive, node_id](sdk::Result<Json> result) {
            if (result.is_ok()) {
                respond(make_response(version, keep_alive, http::status::ok, result.value()));
                return;
            }
            if (result.error() != ErrorCode::NOT_CONNECTED && result.error() != ErrorCode::UNAUTHORIZED) {
                SecureLogger::instance().warning("Forward to node " + SecureLogger::redact(node_id) +
                                                 " failed: " + result.error_message());
            }
            respond(make_error(version, keep_alive, result.error(), result.error_detail(), node_id));
        });
}

std::optional<BridgeTarget> ApiRouter::bridge_target(const std::string& target) {
    const auto query_start = target.find('?');
    if (target.substr(0, query_start) != sdk::constants::BRIDGE_WS_PATH || query_start == std::string::npos) {
        return std::nullopt;
    }

    BridgeTarget parsed;
    std::istringstream query(target.substr(query_start + 1));
    std::string pair;
    while (std::getline(query, pair, '&')) {
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const std::string key = pair.substr(0, eq);
        const std::string value = sdk::url_decode(pair.substr(eq + 1));
        if (key == "nodeId") {
            parsed.node_id = value;
        } else if (key == "keyHash") {
            parsed.key_hash = value;
        }
    }

    if (parsed.node_id.empty() || parsed.key_hash.empty()) {
        return std::nullopt;
    }
    return parsed;
}

std::string ApiRouter::path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

http::status ApiRouter::status_for(ErrorCode error) {
    switch (error) {
        case ErrorCode::INVALID_PARAMETER:
        case ErrorCode::MALFORMED_MESSAGE:
            return http::status::bad_request;
        case ErrorCode::UNAUTHENTICATED:
            return http::status::unauthorized;
        case ErrorCode::UNAUTHORIZED:
            return http::status::forbidden;
        case ErrorCode::NOT_CONNECTED:
            return http::status::not_found;
        case ErrorCode::REQUEST_TIMEOUT:
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::DOWNSTREAM_FAILED:
        case ErrorCode::SESSION_INIT_FAILED:
            return http::status::bad_gateway;
        default:
            return http::status::internal_server_error;
    }
}

} // namespace relay
} // namespace mcprelay
