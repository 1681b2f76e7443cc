#include "fake_connection.hpp"

#include "mcprelay/relay/ConnectionRegistry.hpp"
#include "mcprelay/relay/RelayActor.hpp"
#include "mcprelay/relay/RelayHub.hpp"
#include "mcprelay/relay/RequestMultiplexer.hpp"
#include "mcprelay/sdk/ChannelMessage.hpp"

#include <boost/asio.hpp>

#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace mcprelay;
using namespace mcprelay::relay;
using mcprelay::testing::FakeConnection;
using sdk::ChannelMessage;
using sdk::ErrorCode;
using sdk::Json;

namespace {

using namespace std::chrono_literals;

const std::string NODE = "node-7f3a";
const std::string KEY_A = std::string(64, 'a');
const std::string KEY_B = std::string(64, 'b');
const std::string KEY_C = std::string(64, 'c');

std::shared_ptr<FakeConnection> make_connection(const std::string& key, const std::string& name) {
    return std::make_shared<FakeConnection>(NODE, key, name);
}

// Runs an io_context on a background thread for the lifetime of the object
class Reactor {
public:
    Reactor() : work_(boost::asio::make_work_guard(ioc_)), thread_([this] { ioc_.run(); }) {}

    ~Reactor() {
        work_.reset();
        ioc_.stop();
        thread_.join();
    }

    boost::asio::io_context& ioc() { return ioc_; }

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

bool eventually(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return condition();
}

template<typename T>
T await(std::future<T>& future, std::chrono::milliseconds timeout = 5s) {
    assert(future.wait_for(timeout) == std::future_status::ready);
    return future.get();
}

bool online(RelayActor& actor, std::optional<sdk::KeyHash> key_hash = std::nullopt) {
    std::promise<bool> promise;
    auto future = promise.get_future();
    actor.status(key_hash, [&promise](bool result) { promise.set_value(result); });
    return await(future);
}

std::future<sdk::Result<Json>> forward(RelayActor& actor, const std::string& presented,
                                       std::chrono::milliseconds timeout = 5s) {
    auto promise = std::make_shared<std::promise<sdk::Result<Json>>>();
    auto future = promise->get_future();
    actor.authorized_forward(presented, "tools/call", Json{{"name", "echo"}, {"arguments", {{"x", 1}}}},
                             timeout, [promise](sdk::Result<Json> result) { promise->set_value(result); });
    return future;
}

void test_registry() {
    ConnectionRegistry registry;
    auto first = make_connection(KEY_A, "first");
    auto second = make_connection(KEY_A, "second");

    assert(!registry.install(KEY_A, first));
    assert(registry.find(KEY_A) == first);
    assert(registry.fingerprint_of(first) == KEY_A);

    // Same slot: the previous holder is handed back and forgotten
    assert(registry.install(KEY_A, second) == first);
    assert(registry.size() == 1);
    assert(!registry.fingerprint_of(first));
    assert(!registry.remove(first));

    // Moving frees the old slot and retags the connection
    auto moved = registry.move(second, KEY_B);
    assert(moved.is_ok() && !moved.value());
    assert(!registry.find(KEY_A));
    assert(registry.find(KEY_B) == second);
    assert(second->key_tag() == KEY_B);

    auto stray = registry.move(first, KEY_C);
    assert(stray.is_err());
    assert(stray.error() == ErrorCode::INVALID_STATE);

    // A connection only removes the slot it still owns
    auto third = make_connection(KEY_C, "third");
    registry.install(KEY_C, third);
    auto displaced = registry.move(third, KEY_B);
    assert(displaced.is_ok() && displaced.value() == second);
    assert(registry.size() == 1);
    assert(!registry.remove(second));
    assert(registry.remove(third));
    assert(registry.empty());

    // Adoption by tag skips closed, untagged and already taken slots
    auto closed = make_connection(KEY_A, "closed");
    closed->close(1000, "gone");
    auto untagged = make_connection("", "untagged");
    auto tagged_a = make_connection(KEY_A, "tagged-a");
    auto duplicate_a = make_connection(KEY_A, "duplicate-a");
    auto tagged_b = make_connection(KEY_B, "tagged-b");

    assert(registry.adopt({closed, untagged, tagged_a, duplicate_a, tagged_b}) == 2);
    assert(registry.find(KEY_A) == tagged_a);
    assert(registry.find(KEY_B) == tagged_b);
    assert(registry.adopt({tagged_a, tagged_b}) == 0);
}

void test_timeout_message() {
    assert(RequestMultiplexer::timeout_message(60s) == "Request timeout (60s)");
    assert(RequestMultiplexer::timeout_message(1500ms) == "Request timeout (1500ms)");
}

void test_replacement_and_forwarding() {
    Reactor reactor;
    auto actor = std::make_shared<RelayActor>(reactor.ioc(), NODE);

    auto first = make_connection(KEY_A, "first");
    actor->connect(KEY_A, first);
    assert(first->wait_frame(0).type == ChannelMessage::Type::REGISTERED);
    assert(first->wait_frame(0).message == "Bridge registered successfully");

    // Second connection under the same fingerprint replaces the first
    auto second = make_connection(KEY_A, "second");
    actor->connect(KEY_A, second);
    assert(second->wait_frame(0).type == ChannelMessage::Type::REGISTERED);
    assert(first->wait_closed());
    assert(first->close_reason() == "replaced");
    assert(first->close_code() == 1000);
    assert(online(*actor, KEY_A));
    assert(actor->connection_count() == 1);

    // Round trip through the bridge keeps the payload intact
    auto pending = forward(*actor, KEY_A);
    const auto request = second->wait_frame(1);
    assert(request.type == ChannelMessage::Type::REQUEST);
    assert(request.method == "tools/call");
    assert(request.params["arguments"]["x"] == 1);

    // Unknown correlation ids change nothing
    actor->on_message(second, ChannelMessage::response("no-such-request", Json{{"bogus", true}}).encode());
    assert(pending.wait_for(100ms) == std::future_status::timeout);
    assert(actor->pending_count() == 1);

    actor->on_message(second, ChannelMessage::response(request.request_id, Json{{"x", 1}}).encode());
    auto result = await(pending);
    assert(result.is_ok());
    assert(result.value() == Json({{"x", 1}}));
    assert(result.value()["x"].is_number_integer());

    // A late duplicate is ignored
    actor->on_message(second, ChannelMessage::response(request.request_id, Json{{"x", 2}}).encode());
    assert(online(*actor));
    assert(actor->pending_count() == 0);

    // Wrong key and missing bridge
    auto rejected = forward(*actor, KEY_B);
    assert(await(rejected).error() == ErrorCode::UNAUTHORIZED);

    actor->on_closed(second);
    assert(!online(*actor));
    auto offline = forward(*actor, KEY_A);
    assert(await(offline).error() == ErrorCode::NOT_CONNECTED);

    // Unconditional forward to an unregistered fingerprint
    std::promise<sdk::Result<Json>> direct;
    auto direct_future = direct.get_future();
    actor->forward(KEY_C, "tools/list", Json(), 1s,
                   [&direct](sdk::Result<Json> r) { direct.set_value(r); });
    assert(await(direct_future).error() == ErrorCode::NOT_CONNECTED);
}

void test_deadline() {
    Reactor reactor;
    auto actor = std::make_shared<RelayActor>(reactor.ioc(), NODE);
    auto connection = make_connection(KEY_A, "silent");
    actor->connect(KEY_A, connection);
    connection->wait_frame(0);

    const auto deadline = 300ms;
    const auto started = std::chrono::steady_clock::now();
    auto pending = forward(*actor, KEY_A, deadline);
    auto result = await(pending);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(result.error() == ErrorCode::REQUEST_TIMEOUT);
    assert(result.error_detail() == "Request timeout (300ms)");
    assert(elapsed >= deadline);
    assert(elapsed < deadline + 1s);

    // The reply arriving after the deadline has nobody to complete
    const auto request = connection->wait_frame(1);
    actor->on_message(connection, ChannelMessage::response(request.request_id, Json::object()).encode());
    assert(online(*actor));
    assert(actor->pending_count() == 0);
}

void test_rotation() {
    Reactor reactor;
    auto actor = std::make_shared<RelayActor>(reactor.ioc(), NODE);
    auto connection = make_connection(KEY_A, "rotating");
    actor->connect(KEY_A, connection);
    connection->wait_frame(0);

    actor->on_message(connection, ChannelMessage::rotate_key(KEY_B).encode());
    const auto ack = connection->wait_frame(1);
    assert(ack.type == ChannelMessage::Type::REGISTERED);
    assert(ack.message == "Key rotated successfully");
    assert(connection->key_tag() == KEY_B);

    auto old_key = forward(*actor, KEY_A);
    assert(await(old_key).error() == ErrorCode::UNAUTHORIZED);
    assert(!online(*actor, KEY_A));
    assert(online(*actor, KEY_B));

    auto new_key = forward(*actor, KEY_B);
    const auto request = connection->wait_frame(2);
    assert(request.type == ChannelMessage::Type::REQUEST);
    actor->on_message(connection, ChannelMessage::response(request.request_id, Json{{"ok", true}}).encode());
    assert(await(new_key).is_ok());

    // The rotate-key spelling and an empty key
    actor->on_message(connection, R"({"type":"rotate-key","newKeyHash":")" + KEY_C + R"("})");
    assert(connection->wait_frame(3).message == "Key rotated successfully");
    assert(online(*actor, KEY_C));

    actor->on_message(connection, R"({"type":"rotate_key"})");
    const auto refused = connection->wait_frame(4);
    assert(refused.type == ChannelMessage::Type::ERROR);
    assert(refused.message == "Missing newKeyHash");
    assert(online(*actor, KEY_C));

    // Rotation from a connection the actor does not know
    auto stranger = make_connection(KEY_A, "stranger");
    actor->on_message(stranger, ChannelMessage::rotate_key(KEY_B).encode());
    assert(stranger->wait_frame(0).message == "Failed to rotate key");

    // Pings are answered
    actor->on_message(connection, ChannelMessage::ping().encode());
    assert(connection->wait_frame(5).type == ChannelMessage::Type::PONG);
}

void test_recovery() {
    Reactor reactor;
    RelayHub hub(reactor.ioc());

    assert(!hub.find_actor(NODE));

    auto connection = make_connection(KEY_A, "recoverable");
    auto actor = hub.attach(connection);
    assert(actor);
    assert(hub.find_actor(NODE) == actor);
    assert(hub.actor_count() == 1);
    assert(hub.connection_count() == 1);
    connection->wait_frame(0);

    actor->suspend();
    assert(online(*actor));
    assert(actor->connection_count() == 1);

    actor->suspend();
    auto pending = forward(*actor, KEY_A);
    const auto request = connection->wait_frame(1);
    assert(request.type == ChannelMessage::Type::REQUEST);
    actor->on_message(connection, ChannelMessage::response(request.request_id, Json{{"x", 1}}).encode());
    assert(await(pending).value() == Json({{"x", 1}}));

    // Recovery finds the rotated tag, not the one the transport was accepted with
    actor->on_message(connection, ChannelMessage::rotate_key(KEY_B).encode());
    connection->wait_frame(2);
    actor->suspend();
    assert(online(*actor, KEY_B));
    assert(!online(*actor, KEY_A));

    // Closed transports are not recovered
    connection->close(1000, "bye");
    hub.detach(connection);
    actor->suspend();
    assert(!online(*actor));
    assert(hub.connection_count() == 0);
    assert(hub.live_connections(NODE).empty());

    // Unknown identities never get an actor
    assert(!hub.find_actor("someone-else"));
    assert(eventually([&] { return hub.actor_count() == 0; }));
}

void test_idle_actors_released() {
    Reactor reactor;
    RelayHub hub(reactor.ioc());

    // Cycling through many node identities leaves nothing behind
    for (int i = 0; i < 50; ++i) {
        auto connection = std::make_shared<FakeConnection>("cycled-" + std::to_string(i), KEY_A, "cycled");
        hub.attach(connection);
        connection->wait_frame(0);
        connection->close(1000, "bye");
        hub.detach(connection);
    }
    assert(eventually([&] { return hub.actor_count() == 0; }));
    assert(hub.connection_count() == 0);

    // An actor with a request in flight stays until the request completes
    auto connection = make_connection(KEY_A, "busy");
    auto actor = hub.attach(connection);
    connection->wait_frame(0);
    auto pending = forward(*actor, KEY_A, 1s);
    assert(connection->wait_frame(1).type == ChannelMessage::Type::REQUEST);

    connection->close(1000, "bye");
    hub.detach(connection);
    assert(eventually([&] { return actor->connection_count() == 0; }));
    assert(hub.find_actor(NODE) == actor);

    const auto timed_out = await(pending);
    assert(timed_out.error() == ErrorCode::REQUEST_TIMEOUT);
    assert(eventually([&] { return hub.actor_count() == 0; }));
    assert(!hub.find_actor(NODE));

    // Reconnecting after a release builds a fresh actor
    auto again = make_connection(KEY_B, "again");
    auto fresh = hub.attach(again);
    assert(fresh != actor);
    assert(again->wait_frame(0).type == ChannelMessage::Type::REGISTERED);
    assert(online(*fresh, KEY_B));
    assert(hub.actor_count() == 1);
}

} // namespace

int main() {
    test_registry();
    test_timeout_message();
    test_replacement_and_forwarding();
    test_deadline();
    test_rotation();
    test_recovery();
    test_idle_actors_released();
    return 0;
}
