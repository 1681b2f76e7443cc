#include "mcprelay/sdk/ChannelMessage.hpp"

#include <cassert>
#include <string>

using namespace mcprelay::sdk;

int main() {
    // Requests carry params only when present
    {
        const auto frame = ChannelMessage::request("req-1", "tools/call",
                                                   Json{{"name", "echo"}, {"arguments", {{"x", 1}}}}).encode();
        const Json wire = Json::parse(frame);
        assert(wire["type"] == "request");
        assert(wire["requestId"] == "req-1");
        assert(wire["method"] == "tools/call");
        assert(wire["params"]["arguments"]["x"].is_number_integer());

        const auto bare = Json::parse(ChannelMessage::request("req-2", "tools/list", Json()).encode());
        assert(!bare.contains("params"));
    }

    // Responses keep numeric types of the result
    {
        auto decoded = ChannelMessage::decode(R"({"type":"response","requestId":"req-1","result":{"x":1,"y":2.5}})");
        assert(decoded.is_ok());
        const auto& message = decoded.value();
        assert(message.type == ChannelMessage::Type::RESPONSE);
        assert(message.request_id == "req-1");
        assert(message.result["x"].is_number_integer());
        assert(message.result["x"].get<int>() == 1);
        assert(message.result["y"].is_number_float());
    }

    // A response without a result decodes with a null result
    {
        auto decoded = ChannelMessage::decode(R"({"type":"response","requestId":"req-9"})");
        assert(decoded.is_ok());
        assert(decoded.value().result.is_null());
    }

    // Both spellings of rotate_key are accepted; output uses the underscore
    {
        auto underscore = ChannelMessage::decode(R"({"type":"rotate_key","newKeyHash":"abc"})");
        auto dash = ChannelMessage::decode(R"({"type":"rotate-key","newKeyHash":"abc"})");
        assert(underscore.is_ok() && dash.is_ok());
        assert(underscore.value().type == ChannelMessage::Type::ROTATE_KEY);
        assert(dash.value().type == ChannelMessage::Type::ROTATE_KEY);
        assert(dash.value().new_key_hash == "abc");

        const Json wire = Json::parse(ChannelMessage::rotate_key("def").encode());
        assert(wire["type"] == "rotate_key");
        assert(wire["newKeyHash"] == "def");

        auto missing = ChannelMessage::decode(R"({"type":"rotate_key"})");
        assert(missing.is_ok());
        assert(missing.value().new_key_hash.empty());
    }

    // Registered and error frames carry a message
    {
        const Json wire = Json::parse(ChannelMessage::registered("Bridge registered successfully").encode());
        assert(wire["type"] == "registered");
        assert(wire["message"] == "Bridge registered successfully");

        auto decoded = ChannelMessage::decode(ChannelMessage::error("Missing newKeyHash").encode());
        assert(decoded.is_ok());
        assert(decoded.value().type == ChannelMessage::Type::ERROR);
        assert(decoded.value().message == "Missing newKeyHash");
    }

    // Invalid UTF-8 from a downstream body still produces a decodable frame
    {
        const std::string detail = "MCP request failed (500): caf\xe9";
        const std::string frame = ChannelMessage::response("req-9", Json{{"error", detail}}).encode();

        auto decoded = ChannelMessage::decode(frame);
        assert(decoded.is_ok());
        assert(decoded.value().request_id == "req-9");
        const auto error = decoded.value().result["error"].get<std::string>();
        assert(error.rfind("MCP request failed (500): caf", 0) == 0);
        assert(error != detail);
    }

    // Ping and pong are bare
    {
        assert(Json::parse(ChannelMessage::ping().encode()) == Json({{"type", "ping"}}));
        assert(ChannelMessage::decode(R"({"type":"pong"})").value().type == ChannelMessage::Type::PONG);
    }

    // Unknown types are not errors
    {
        auto decoded = ChannelMessage::decode(R"({"type":"telemetry","load":0.5})");
        assert(decoded.is_ok());
        assert(decoded.value().type == ChannelMessage::Type::UNKNOWN);
        assert(decoded.value().type_name == "telemetry");
    }

    // Malformed frames
    {
        assert(ChannelMessage::decode("not json").error() == ErrorCode::MALFORMED_MESSAGE);
        assert(ChannelMessage::decode("[1,2]").error() == ErrorCode::MALFORMED_MESSAGE);
        assert(ChannelMessage::decode(R"({"requestId":"x"})").error() == ErrorCode::MALFORMED_MESSAGE);
        assert(ChannelMessage::decode(R"({"type":7})").error() == ErrorCode::MALFORMED_MESSAGE);
        assert(ChannelMessage::decode(R"({"type":"request","method":"tools/list"})").is_err());
        assert(ChannelMessage::decode(R"({"type":"response","result":{}})").is_err());
    }

    return 0;
}
