#include "mcprelay/sdk/HttpClient.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include "mcprelay/sdk/version.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace mcprelay {
namespace sdk {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::uint16_t default_port(const std::string& scheme) {
    return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

// Drives one asynchronous operation to completion on a private io_context so
// the per-operation expiry of tcp_stream applies to blocking calls too.
void run_until_idle(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

template<class Stream>
Result<HttpResponse> exchange(net::io_context& ioc,
                              Stream& stream,
                              http::request<http::string_body>& req,
                              std::chrono::seconds timeout) {
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_until_idle(ioc);
    if (ec) {
        return {ErrorCode::NETWORK_ERROR, "HTTP write failed: " + ec.message()};
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(constants::MAX_MESSAGE_SIZE);

    beast::get_lowest_layer(stream).expires_after(timeout);
    http::async_read(stream, buffer, parser, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run_until_idle(ioc);
    if (ec) {
        return {ErrorCode::NETWORK_ERROR, "HTTP read failed: " + ec.message()};
    }

    const auto& res = parser.get();

    HttpResponse response;
    response.status = res.result_int();
    response.body = res.body();
    for (const auto& field : res) {
        const auto name = field.name_string();
        const auto value = field.value();
        response.headers[to_lower(std::string(name.data(), name.size()))] =
            std::string(value.data(), value.size());
    }
    response.content_type = response.header("content-type");

    return response;
}

} // namespace

std::string Url::host_header() const {
    if (port == default_port(scheme)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

Result<Url> Url::parse(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return {ErrorCode::INVALID_PARAMETER, "URL has no scheme: " + url};
    }

    Url parsed;
    parsed.scheme = to_lower(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https" &&
        parsed.scheme != "ws" && parsed.scheme != "wss") {
        return {ErrorCode::INVALID_PARAMETER, "Unsupported URL scheme: " + parsed.scheme};
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = url.find_first_of("/?", authority_start);
    const std::string authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);

    parsed.target = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (parsed.target[0] == '?') {
        parsed.target = "/" + parsed.target;
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        // Bracketed IPv6 literal
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return {ErrorCode::INVALID_PARAMETER, "Malformed IPv6 host in URL: " + url};
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parsed.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            parsed.host = authority;
        }
    }

    if (parsed.host.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "URL has no host: " + url};
    }

    if (port_text.empty()) {
        parsed.port = default_port(parsed.scheme);
    } else {
        if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
            return {ErrorCode::INVALID_PARAMETER, "Invalid port in URL: " + url};
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return {ErrorCode::INVALID_PARAMETER, "Invalid port in URL: " + url};
        }
        parsed.port = static_cast<std::uint16_t>(port);
    }

    return parsed;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient(std::chrono::seconds timeout) : timeout_(timeout) {
}

Result<HttpResponse> HttpClient::get(const std::string& url,
                                     const std::map<std::string, std::string>& headers) const {
    return perform("GET", url, "", headers);
}

Result<HttpResponse> HttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::map<std::string, std::string>& headers) const {
    return perform("POST", url, body, headers);
}

Result<Json> HttpClient::post_json(const std::string& url, const Json& body) const {
    auto result = post(url, body.dump(), {{"Content-Type", "application/json"}});
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }

    const auto& response = result.value();
    if (!response.ok()) {
        return {ErrorCode::DOWNSTREAM_FAILED,
                "HTTP " + std::to_string(response.status) + ": " + response.body};
    }

    Json parsed = Json::parse(response.body, nullptr, false);
    if (parsed.is_discarded()) {
        return {ErrorCode::DOWNSTREAM_FAILED, "Response body is not JSON"};
    }
    return parsed;
}

Result<HttpResponse> HttpClient::perform(const std::string& method,
                                         const std::string& url,
                                         const std::string& body,
                                         const std::map<std::string, std::string>& headers) const {
    auto parsed = Url::parse(url);
    if (parsed.is_err()) {
        return {parsed.error(), parsed.error_detail()};
    }
    const Url& target = parsed.value();

    http::request<http::string_body> req;
    req.method_string(method);
    req.target(target.target);
    req.version(11);
    req.set(http::field::host, target.host_header());
    req.set(http::field::user_agent, std::string(constants::BRIDGE_CLIENT_NAME) + "/" + Version::str);
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    if (method != "GET") {
        req.body() = body;
        req.prepare_payload();
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);

        beast::error_code ec;
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(target.host, std::to_string(target.port),
            [&](beast::error_code e, tcp::resolver::results_type results) {
                ec = e;
                endpoints = std::move(results);
            });
        run_until_idle(ioc);
        if (ec) {
            return {ErrorCode::NETWORK_ERROR, "Cannot resolve " + target.host + ": " + ec.message()};
        }

        if (!target.is_secure()) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout_);
            stream.async_connect(endpoints,
                [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
            run_until_idle(ioc);
            if (ec) {
                return {ErrorCode::NETWORK_ERROR, "Cannot connect to " + target.host_header() + ": " + ec.message()};
            }

            auto response = exchange(ioc, stream, req, timeout_);
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                SecureLogger::instance().debug("HTTP socket shutdown: " + ec.message());
            }
            return response;
        }

        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
            return {ErrorCode::NETWORK_ERROR, "Cannot set TLS server name for " + target.host};
        }
        stream.set_verify_callback(ssl::host_name_verification(target.host));

        beast::get_lowest_layer(stream).expires_after(timeout_);
        beast::get_lowest_layer(stream).async_connect(endpoints,
            [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        run_until_idle(ioc);
        if (ec) {
            return {ErrorCode::NETWORK_ERROR, "Cannot connect to " + target.host_header() + ": " + ec.message()};
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        stream.async_handshake(ssl::stream_base::client, [&ec](beast::error_code e) { ec = e; });
        run_until_idle(ioc);
        if (ec) {
            return {ErrorCode::NETWORK_ERROR, "TLS handshake with " + target.host + " failed: " + ec.message()};
        }

        auto response = exchange(ioc, stream, req, timeout_);
        beast::get_lowest_layer(stream).close();
        return response;
    } catch (const std::exception& e) {
        SecureLogger::instance().error("HTTP " + method + " " + target.host_header() + " failed: " + e.what());
        return {ErrorCode::NETWORK_ERROR, e.what()};
    }
}

std::string url_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            decoded.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }

    return decoded;
}

std::string url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
            encoded += buffer;
        }
    }

    return encoded;
}

} // namespace sdk
} // namespace mcprelay
