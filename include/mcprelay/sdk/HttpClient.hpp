#pragma once

#include "mcprelay/sdk/constants.hpp"
#include "mcprelay/sdk/types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace mcprelay {
namespace sdk {

/**
 * @brief Parsed http(s)/ws(s) URL
 */
struct Url {
    std::string scheme;   // lowercase: http, https, ws, wss
    std::string host;
    std::uint16_t port = 0;
    std::string target;   // path and query, always starts with '/'

    bool is_secure() const { return scheme == "https" || scheme == "wss"; }

    // host, or host:port when the port is not the scheme default
    std::string host_header() const;

    static Result<Url> parse(const std::string& url);
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers;  // lowercase names

    bool ok() const { return status >= 200 && status < 300; }

    // Empty string if the header is absent
    std::string header(const std::string& name) const;
};

/**
 * @brief Blocking HTTP/1.1 client (plain or TLS) built on Boost.Beast
 *
 * Each call opens its own connection; instances carry no connection state
 * and may be shared between threads.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = constants::DOWNSTREAM_TIMEOUT);

    Result<HttpResponse> get(const std::string& url,
                             const std::map<std::string, std::string>& headers = {}) const;

    Result<HttpResponse> post(const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers = {}) const;

    /**
     * @brief POST a JSON document and parse a JSON reply
     * @return DOWNSTREAM_FAILED for non-2xx replies or a body that is not JSON
     */
    Result<Json> post_json(const std::string& url, const Json& body) const;

private:
    Result<HttpResponse> perform(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::map<std::string, std::string>& headers) const;

    std::chrono::seconds timeout_;
};

/**
 * @brief Percent-decode a URL component ('+' becomes a space)
 */
std::string url_decode(const std::string& value);

/**
 * @brief Percent-encode a URL query component
 */
std::string url_encode(const std::string& value);

} // namespace sdk
} // namespace mcprelay
