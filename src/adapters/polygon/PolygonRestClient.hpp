#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::polygon {

struct AggregatesPage {
    std::vector<domain::Bar> bars;
    // Absolute URL of the next page, empty on the last one.
    std::string nextUrl;
};

// Decodes one /v2/aggs response body. Throws gapfill::FetchError for error statuses and
// malformed payloads.
AggregatesPage parse_aggregates_response(const std::string& body, const domain::Symbol& symbol);

class PolygonRestClient : public domain::contracts::IHistoricalBars {
public:
    struct Options {
        std::string baseUrl{"https://api.polygon.io"};
        std::string apiKey;
        int timeoutSec{20};
        std::size_t maxPages{1000};
    };

    explicit PolygonRestClient(Options options);
    ~PolygonRestClient() override = default;

    std::vector<domain::Bar> fetch_minute_bars(const domain::Symbol& symbol,
                                               domain::TimestampSec from,
                                               domain::TimestampSec to) override;

    // Appends the api key query parameter to `url`.
    std::string with_api_key(const std::string& url) const;

private:
    std::string get_with_retries_(const infra::http::HttpsUrl& url) const;

    Options options_;
    infra::http::HttpsUrl base_;
};

}  // namespace adapters::polygon
