#include "mcprelay/bridge/BridgeClient.hpp"
#include "mcprelay/bridge/ProtocolAdapter.hpp"
#include "mcprelay/relay/HTTPServer.hpp"
#include "mcprelay/relay/RelayConfig.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/HttpClient.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace mcprelay;
using bridge::BridgeClient;
using sdk::ErrorCode;
using sdk::Json;

namespace {

using namespace std::chrono_literals;

const std::string NODE = "5a0b8c2d4e6f";
const std::string SECRET = "7e1c9b2a-3d4e-4f50-8a6b-7c8d9e0f1a2b";
const std::string NEW_SECRET = "0f1e2d3c-4b5a-4968-8776-655443322110";
const std::string FAILING_NODE = "9d8c7b6a5f4e";
const std::string FAILING_SECRET = "3c4d5e6f-7a8b-4c9d-8e0f-1a2b3c4d5e6f";

// Downstream that echoes tool arguments back as the result
class EchoTransport : public bridge::RpcTransport {
public:
    sdk::Result<bridge::RpcResponse> post(const std::string& body,
                                          const std::optional<std::string>&) override {
        const Json message = Json::parse(body);
        ++posts;

        Json result = Json::object();
        if (message["method"] == "tools/list") {
            result = {{"tools", Json::array({{{"name", "echo"}, {"description", "Echo arguments"}}})}};
        } else if (message["method"] == "tools/call") {
            result = message["params"]["arguments"];
        }

        bridge::RpcResponse response;
        response.status = 200;
        response.content_type = "application/json";
        response.session_id = "echo-session";
        response.body = Json{{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", result}}.dump();
        return response;
    }

    std::atomic<int> posts{0};
};

// Downstream whose tool calls fail with a non-UTF-8 error body
class FailingTransport : public bridge::RpcTransport {
public:
    sdk::Result<bridge::RpcResponse> post(const std::string& body,
                                          const std::optional<std::string>&) override {
        const Json message = Json::parse(body);

        bridge::RpcResponse response;
        response.content_type = "application/json";
        response.session_id = "failing-session";
        if (message["method"] == "initialize") {
            response.status = 200;
            response.body = Json{{"jsonrpc", "2.0"}, {"id", message["id"]}, {"result", Json::object()}}.dump();
        } else {
            response.status = 500;
            response.content_type = "text/plain";
            response.body = "upstream exploded: caf\xe9";
        }
        return response;
    }
};

bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return condition();
}

std::map<std::string, std::string> bearer(const std::string& secret) {
    return {{"Authorization", "Bearer " + secret}, {"Content-Type", "application/json"}};
}

} // namespace

int main() {
    auto hasher = std::make_shared<sdk::HashService>("integration-salt");

    relay::RelayConfig relay_config;
    relay_config.bind_address = "127.0.0.1";
    relay_config.port = 0;
    relay_config.io_threads = 2;
    relay_config.forward_timeout = std::chrono::seconds(5);
    relay_config.hash_salt = "integration-salt";

    relay::HTTPServer server(relay_config, hasher);
    server.start();
    assert(server.bound_port() != 0);

    const std::string base = "http://127.0.0.1:" + std::to_string(server.bound_port());
    const std::string node_url = base + "/mcp/" + NODE;
    sdk::HttpClient http(10s);

    auto online = [&](const std::string& secret) {
        auto reply = http.get(node_url + "/status", secret.empty() ? std::map<std::string, std::string>()
                                                                   : bearer(secret));
        return reply.is_ok() && Json::parse(reply.value().body)["online"] == true;
    };

    bridge::BridgeConfig config;
    config.cloud_url = base;
    config.node_id = NODE;
    config.key_hash = hasher->hash(SECRET).value();

    // An https relay URL is dialed over TLS; the plain relay cannot complete that handshake
    {
        bridge::BridgeConfig secure = config;
        secure.cloud_url = "https://127.0.0.1:" + std::to_string(server.bound_port());

        BridgeClient::Options quick;
        quick.reconnect_delay = 100ms;
        BridgeClient tls_client(secure, std::make_shared<bridge::ProtocolAdapter>(std::make_shared<EchoTransport>()),
                                quick);
        assert(tls_client.start().is_ok());

        std::this_thread::sleep_for(1s);
        assert(!tls_client.is_registered());
        assert(tls_client.state() != BridgeClient::State::CONNECTED);
        assert(server.hub().live_connections(NODE).empty());

        tls_client.stop();
        assert(tls_client.state() == BridgeClient::State::STOPPED);
    }

    // Unparsable relay URLs are refused up front
    {
        bridge::BridgeConfig broken = config;
        broken.cloud_url = "ftp:/nowhere";
        BridgeClient refused(broken, std::make_shared<bridge::ProtocolAdapter>(std::make_shared<EchoTransport>()));
        assert(refused.start().error() == ErrorCode::CONFIG_ERROR);
    }

    auto transport = std::make_shared<EchoTransport>();
    BridgeClient::Options options;
    options.reconnect_delay = 200ms;
    options.ping_interval = 1s;
    options.worker_threads = 2;

    BridgeClient client(config, std::make_shared<bridge::ProtocolAdapter>(transport), options);

    std::mutex listener_mutex;
    std::string announced;
    client.set_key_change_listener([&](const sdk::KeyHash& key_hash) {
        std::lock_guard<std::mutex> lock(listener_mutex);
        announced = key_hash;
    });

    // Rotation needs a live connection
    assert(client.rotate_key(hasher->hash(NEW_SECRET).value()).error() == ErrorCode::INVALID_STATE);
    assert(!online(""));

    // Registers with the relay; the downstream handshake ran during start
    assert(client.start().is_ok());
    assert(client.start().error() == ErrorCode::INVALID_STATE);
    assert(eventually([&] { return client.is_registered(); }));
    assert(client.state() == BridgeClient::State::CONNECTED);
    assert(transport->posts >= 1);
    assert(eventually([&] { return online(""); }));
    assert(online(SECRET));

    // Serves relayed requests
    {
        auto tools = http.get(node_url + "/tools", bearer(SECRET));
        assert(tools.is_ok());
        assert(tools.value().status == 200);
        assert(Json::parse(tools.value().body)["result"]["tools"][0]["name"] == "echo");

        const Json call = {{"method", "tools/call"}, {"params", {{"name", "echo"}, {"arguments", {{"x", 1}}}}}};
        auto echoed = http.post(node_url + "/call", call.dump(), bearer(SECRET));
        assert(echoed.is_ok());
        assert(echoed.value().status == 200);
        const Json body = Json::parse(echoed.value().body);
        assert(body["result"] == Json({{"x", 1}}));
        assert(body["result"]["x"].is_number_integer());

        auto forbidden = http.get(node_url + "/tools", bearer(NEW_SECRET));
        assert(forbidden.is_ok() && forbidden.value().status == 403);
    }

    // Reconnects after the relay drops the connection
    {
        auto live = server.hub().live_connections(NODE);
        assert(live.size() == 1);
        auto dropped = live.front();
        dropped->close(1001, "going away");

        assert(eventually([&] {
            auto current = server.hub().live_connections(NODE);
            return current.size() == 1 && current.front() != dropped && client.is_registered();
        }));
        assert(eventually([&] { return online(SECRET); }));

        auto tools = http.get(node_url + "/tools", bearer(SECRET));
        assert(tools.is_ok() && tools.value().status == 200);
    }

    // Key rotation moves the live registration
    {
        const auto new_key_hash = hasher->hash(NEW_SECRET).value();
        assert(client.rotate_key(new_key_hash).is_ok());
        assert(client.key_hash() == new_key_hash);
        {
            std::lock_guard<std::mutex> lock(listener_mutex);
            assert(announced == new_key_hash);
        }

        assert(eventually([&] { return online(NEW_SECRET); }));
        assert(!online(SECRET));

        auto old_key = http.get(node_url + "/tools", bearer(SECRET));
        assert(old_key.is_ok() && old_key.value().status == 403);
        auto new_key = http.get(node_url + "/tools", bearer(NEW_SECRET));
        assert(new_key.is_ok() && new_key.value().status == 200);
    }

    // Stop is terminal
    client.stop();
    assert(client.state() == BridgeClient::State::STOPPED);
    assert(!client.is_registered());
    assert(client.start().error() == ErrorCode::INVALID_STATE);
    assert(client.rotate_key(config.key_hash).error() == ErrorCode::INVALID_STATE);
    client.stop();

    assert(eventually([&] { return !online(""); }));
    auto gone = http.get(node_url + "/tools", bearer(NEW_SECRET));
    assert(gone.is_ok() && gone.value().status == 404);

    // Downstream failures come back as a structured error, not a relay timeout
    {
        bridge::BridgeConfig failing_config = config;
        failing_config.node_id = FAILING_NODE;
        failing_config.key_hash = hasher->hash(FAILING_SECRET).value();

        BridgeClient failing(failing_config,
                             std::make_shared<bridge::ProtocolAdapter>(std::make_shared<FailingTransport>()),
                             options);
        assert(failing.start().is_ok());
        assert(eventually([&] { return failing.is_registered(); }));

        const std::string failing_url = base + "/mcp/" + FAILING_NODE;
        const Json call = {{"method", "tools/call"}, {"params", {{"name", "echo"}, {"arguments", Json::object()}}}};

        const auto started = std::chrono::steady_clock::now();
        auto reply = http.post(failing_url + "/call", call.dump(), bearer(FAILING_SECRET));
        const auto elapsed = std::chrono::steady_clock::now() - started;

        assert(reply.is_ok());
        assert(reply.value().status == 200);
        assert(elapsed < relay_config.forward_timeout);

        const Json body = Json::parse(reply.value().body);
        assert(body["error"].is_string());
        const auto error = body["error"].get<std::string>();
        assert(error.find("(500)") != std::string::npos);
        assert(error.find("upstream exploded") != std::string::npos);

        auto tools = http.get(failing_url + "/tools", bearer(FAILING_SECRET));
        assert(tools.is_ok() && tools.value().status == 200);
        assert(Json::parse(tools.value().body)["error"].is_string());

        failing.stop();
    }

    server.stop();
    return 0;
}
