#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

std::runtime_error makeError(const HttpsUrl& url, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << url.host;
    if (url.port != "443") {
        oss << ':' << url.port;
    }
    // Targets carry the API key in the query string; keep it out of error text.
    const auto query = url.target.find('?');
    oss << url.target.substr(0, query) << " failed: " << message;
    return std::runtime_error(oss.str());
}

bhttp::response<bhttp::string_body> performRequest(const HttpsUrl& url, int timeoutSec) {
    if (timeoutSec <= 0) {
        throw makeError(url, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::host_name_verification(url.host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << url.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(url, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        throw makeError(url, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(url, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(url, "TLS handshake error: " + ec.message());
    }

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, url.target, 11};
    req.set(bhttp::field::host, url.host);
    req.set(bhttp::field::user_agent, "gapfill/0.1 " BOOST_BEAST_VERSION_STRING);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");

    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(url, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    // Minute aggregates for a long gap easily exceed the default 8 MiB body limit.
    parser.body_limit(64U * 1024U * 1024U);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    bhttp::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(url, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof) {
        ec = {};
    }
    if (ec == ssl::error::stream_truncated) {
        // Allow truncated TLS shutdown which may occur with some servers.
        ec = {};
    }
    if (ec) {
        throw makeError(url, "TLS shutdown error: " + ec.message());
    }

    return parser.release();
}

}  // namespace

HttpsUrl parse_https_url(const std::string& url) {
    static const std::string kScheme = "https://";
    if (url.rfind(kScheme, 0) != 0) {
        throw std::runtime_error("Only https:// URLs are supported: " + url);
    }

    const std::string rest = url.substr(kScheme.size());
    const auto pathPos = rest.find_first_of("/?");
    std::string authority = pathPos == std::string::npos ? rest : rest.substr(0, pathPos);
    if (authority.empty()) {
        throw std::runtime_error("URL missing host: " + url);
    }

    HttpsUrl result{};
    const auto colonPos = authority.find(':');
    if (colonPos != std::string::npos) {
        result.port = authority.substr(colonPos + 1);
        authority = authority.substr(0, colonPos);
        if (result.port.empty() || authority.empty()) {
            throw std::runtime_error("URL has an invalid authority: " + url);
        }
    }
    result.host = authority;

    if (pathPos == std::string::npos) {
        result.target = "/";
    } else if (rest[pathPos] == '?') {
        result.target = "/" + rest.substr(pathPos);
    } else {
        result.target = rest.substr(pathPos);
    }
    return result;
}

HttpResponse https_get(const HttpsUrl& url, int timeout_sec) {
    if (url.host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    HttpsUrl current = url;
    if (current.target.empty() || current.target.front() != '/') {
        current.target.insert(current.target.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(current, timeout_sec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            const std::string location{response.base()[bhttp::field::location]};
            if (location.empty()) {
                throw makeError(current, "Redirect response missing Location header");
            }
            if (location.rfind("http://", 0) == 0) {
                throw makeError(current, "Insecure redirect to HTTP is not supported");
            }
            if (location.rfind("https://", 0) == 0) {
                current = parse_https_url(location);
            } else {
                current.target = location.front() == '/' ? location : "/" + location;
            }
            continue;
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = current.host;
        result.final_target = current.target;
        if (auto it = response.base().find(bhttp::field::retry_after); it != response.base().end()) {
            result.retry_after_header = std::string{it->value()};
        }
        return result;
    }

    throw makeError(current, "Too many redirects");
}

}  // namespace infra::http
