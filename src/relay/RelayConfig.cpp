#include "mcprelay/relay/RelayConfig.hpp"
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdlib>
#include <filesystem>

namespace mcprelay {
namespace relay {

namespace pt = boost::property_tree;

namespace {

// Keys are accepted at the top level or inside a [relay] section
boost::optional<std::string> lookup(const pt::ptree& tree, const std::string& key) {
    if (auto value = tree.get_optional<std::string>(key)) {
        return value;
    }
    return tree.get_optional<std::string>("relay." + key);
}

bool parse_number(const std::string& text, unsigned long max, unsigned long& out) {
    if (text.empty() || text.size() > 10 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = std::stoul(text);
    return out <= max;
}

} // namespace

sdk::Result<void> RelayConfig::load_file(const std::string& path) {
    pt::ptree tree;
    try {
        pt::read_ini(path, tree);
    } catch (const pt::ini_parser_error& e) {
        return {sdk::ErrorCode::CONFIG_ERROR, "Cannot read " + path + ": " + e.what()};
    }

    unsigned long number = 0;

    if (auto value = lookup(tree, "bind_address")) {
        bind_address = *value;
    }
    if (auto value = lookup(tree, "port")) {
        if (!parse_number(*value, 65535, number) || number == 0) {
            return {sdk::ErrorCode::CONFIG_ERROR, "Invalid port: " + *value};
        }
        port = static_cast<std::uint16_t>(number);
    }
    if (auto value = lookup(tree, "io_threads")) {
        if (!parse_number(*value, 256, number) || number == 0) {
            return {sdk::ErrorCode::CONFIG_ERROR, "Invalid io_threads: " + *value};
        }
        io_threads = number;
    }
    if (auto value = lookup(tree, "forward_timeout_seconds")) {
        if (!parse_number(*value, 3600, number) || number == 0) {
            return {sdk::ErrorCode::CONFIG_ERROR, "Invalid forward_timeout_seconds: " + *value};
        }
        forward_timeout = std::chrono::seconds(number);
    }
    if (auto value = lookup(tree, "log_level")) {
        log_level = *value;
    }
    if (auto value = lookup(tree, "log_path")) {
        log_path = *value;
    }
    if (auto value = lookup(tree, "hash_salt")) {
        hash_salt = *value;
    }

    return {};
}

void RelayConfig::apply_environment() {
    if (const char* salt = std::getenv(sdk::constants::SALT_ENV.c_str())) {
        if (*salt != '\0') {
            hash_salt = salt;
            return;
        }
    }
    if (const char* salt = std::getenv(sdk::constants::LEGACY_SALT_ENV.c_str())) {
        if (*salt != '\0') {
            hash_salt = salt;
        }
    }
}

sdk::Result<void> RelayConfig::validate() const {
    if (hash_salt.empty()) {
        return {sdk::ErrorCode::CONFIG_ERROR,
                "No hash salt configured (set " + sdk::constants::SALT_ENV + " or hash_salt)"};
    }
    if (port == 0) {
        return {sdk::ErrorCode::CONFIG_ERROR, "Port must be non-zero"};
    }
    if (io_threads == 0) {
        return {sdk::ErrorCode::CONFIG_ERROR, "io_threads must be at least 1"};
    }
    if (forward_timeout.count() <= 0) {
        return {sdk::ErrorCode::CONFIG_ERROR, "forward_timeout_seconds must be positive"};
    }
    return {};
}

const std::vector<std::string>& RelayConfig::default_file_locations() {
    static const std::vector<std::string> locations = {
        "/etc/mcprelay/relay.conf",
        "./relay.conf",
    };
    return locations;
}

std::string RelayConfig::find_default_file() {
    for (const auto& path : default_file_locations()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return path;
        }
    }
    return {};
}

} // namespace relay
} // namespace mcprelay
