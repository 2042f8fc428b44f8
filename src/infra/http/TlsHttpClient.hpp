#pragma once

#include <string>

namespace infra::http {

struct HttpsUrl {
    std::string host;
    std::string port = "443";
    // Path plus query, always starting with '/'.
    std::string target = "/";
};

// Splits "https://host[:port][/path][?query]". Throws std::runtime_error for other schemes.
HttpsUrl parse_https_url(const std::string& url);

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after_header;
    std::string final_host;
    std::string final_target;
};

// HTTPS GET with redirect following. Throws std::runtime_error on network or TLS errors;
// HTTP error statuses are returned to the caller.
HttpResponse https_get(const HttpsUrl& url, int timeout_sec = 20);

}  // namespace infra::http
