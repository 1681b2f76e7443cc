#include "mcprelay/bridge/MachineIdentity.hpp"
#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace mcprelay {
namespace bridge {

using sdk::ErrorCode;
using sdk::Json;
using sdk::SecureLogger;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

RemoteHasher::RemoteHasher(std::string cloud_url, std::chrono::seconds timeout)
    : cloud_url_(std::move(cloud_url)), client_(timeout) {
    while (!cloud_url_.empty() && cloud_url_.back() == '/') {
        cloud_url_.pop_back();
    }
}

sdk::Result<std::string> RemoteHasher::hash(const std::string& value) const {
    auto reply = client_.post_json(cloud_url_ + sdk::constants::HASH_PATH, {{"value", value}});
    if (reply.is_err()) {
        return {reply.error(), "Hash request failed: " + reply.error_detail()};
    }

    const Json& body = reply.value();
    if (!body.is_object() || !body.contains("hash") || !body["hash"].is_string()) {
        return {ErrorCode::DOWNSTREAM_FAILED, "Hash reply has no \"hash\" field"};
    }

    std::string digest = body["hash"].get<std::string>();
    if (digest.size() != sdk::constants::SHA256_HEX_LENGTH) {
        return {ErrorCode::DOWNSTREAM_FAILED, "Hash reply has unexpected length"};
    }
    return digest;
}

sdk::Result<std::string> MachineIdentity::raw_id(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::ifstream file(path);
        if (!file) {
            continue;
        }

        std::string line;
        std::getline(file, line);
        line = trim(line);
        if (!line.empty()) {
            return line;
        }
    }

    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return {ErrorCode::FILE_IO_ERROR, std::string("No machine id and no host name: ") + std::strerror(errno)};
    }

    const std::string fallback = trim(hostname);
    if (fallback.empty()) {
        return {ErrorCode::FILE_IO_ERROR, "No machine id and no host name"};
    }

    SecureLogger::instance().warning("No machine id file found, using the host name as identity");
    return fallback;
}

sdk::Result<sdk::NodeId> MachineIdentity::node_id(const RemoteHasher& hasher) {
    auto raw = raw_id();
    if (raw.is_err()) {
        return {raw.error(), raw.error_detail()};
    }

    std::string secret = raw.value();
    auto hashed = hasher.hash(secret);
    sdk::HashService::wipe(secret);
    return hashed;
}

std::string MachineIdentity::generate_api_key() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace bridge
} // namespace mcprelay
