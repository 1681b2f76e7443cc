#include "mcprelay/bridge/BridgeConfig.hpp"
#include "mcprelay/sdk/HttpClient.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace mcprelay {
namespace bridge {

namespace pt = boost::property_tree;
namespace fs = std::filesystem;
using sdk::ErrorCode;

sdk::Result<void> BridgeConfig::validate() const {
    if (cloud_url.empty()) {
        return {ErrorCode::CONFIG_ERROR, "cloudUrl is not set"};
    }
    if (node_id.empty()) {
        return {ErrorCode::CONFIG_ERROR, "nodeId is not set"};
    }
    if (key_hash.empty()) {
        return {ErrorCode::CONFIG_ERROR, "keyHash is not set"};
    }
    if (pieces_endpoint.empty()) {
        return {ErrorCode::CONFIG_ERROR, "piecesEndpoint is not set"};
    }
    return {};
}

sdk::Result<std::string> BridgeConfig::bridge_url() const {
    auto parsed = sdk::Url::parse(cloud_url);
    if (parsed.is_err()) {
        return {ErrorCode::CONFIG_ERROR, parsed.error_detail()};
    }

    const auto& url = parsed.value();
    const std::string scheme = url.is_secure() ? "wss" : "ws";
    return std::string(scheme + "://" + url.host_header() + sdk::constants::BRIDGE_WS_PATH +
                       "?nodeId=" + sdk::url_encode(node_id) +
                       "&keyHash=" + sdk::url_encode(key_hash));
}

sdk::Result<BridgeConfig> BridgeConfig::load(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return {ErrorCode::FILE_IO_ERROR, "No config file at " + path};
    }

    pt::ptree tree;
    try {
        pt::read_json(path, tree);
    } catch (const pt::json_parser_error& e) {
        return {ErrorCode::CONFIG_ERROR, "Cannot parse " + path + ": " + e.what()};
    }

    BridgeConfig config;
    config.cloud_url = tree.get<std::string>("cloudUrl", "");
    config.node_id = tree.get<std::string>("nodeId", "");
    config.key_hash = tree.get<std::string>("keyHash", "");
    config.pieces_endpoint = tree.get<std::string>("piecesEndpoint", sdk::constants::DEFAULT_DOWNSTREAM_ENDPOINT);

    // Trailing slashes would double up when paths are appended
    while (!config.cloud_url.empty() && config.cloud_url.back() == '/') {
        config.cloud_url.pop_back();
    }
    return config;
}

sdk::Result<void> BridgeConfig::save(const std::string& path) const {
    pt::ptree tree;
    tree.put("cloudUrl", cloud_url);
    tree.put("nodeId", node_id);
    tree.put("keyHash", key_hash);
    tree.put("piecesEndpoint", pieces_endpoint);

    std::error_code ec;
    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return {ErrorCode::FILE_IO_ERROR, "Cannot create " + parent.string() + ": " + ec.message()};
        }
    }

    // The file names the key fingerprint; keep it private to the user
    const fs::path temp = path + ".tmp";
    try {
        pt::write_json(temp.string(), tree);
    } catch (const pt::json_parser_error& e) {
        return {ErrorCode::FILE_IO_ERROR, "Cannot write " + path + ": " + e.what()};
    }
    if (::chmod(temp.c_str(), S_IRUSR | S_IWUSR) != 0) {
        return {ErrorCode::FILE_IO_ERROR, "Cannot restrict permissions on " + temp.string() + ": " +
                                          std::strerror(errno)};
    }

    fs::rename(temp, path, ec);
    if (ec) {
        return {ErrorCode::FILE_IO_ERROR, "Cannot replace " + path + ": " + ec.message()};
    }
    return {};
}

std::string BridgeConfig::default_path() {
    if (const char* overridden = std::getenv(sdk::constants::BRIDGE_CONFIG_ENV.c_str())) {
        if (*overridden != '\0') {
            return overridden;
        }
    }

    const char* home = std::getenv("HOME");
    const fs::path base = (home && *home) ? fs::path(home) : fs::current_path();
    return (base / sdk::constants::BRIDGE_CONFIG_DIR / sdk::constants::BRIDGE_CONFIG_FILE).string();
}

bool operator==(const BridgeConfig& lhs, const BridgeConfig& rhs) {
    return lhs.cloud_url == rhs.cloud_url &&
           lhs.node_id == rhs.node_id &&
           lhs.key_hash == rhs.key_hash &&
           lhs.pieces_endpoint == rhs.pieces_endpoint;
}

} // namespace bridge
} // namespace mcprelay
