#include "adapters/polygon/PolygonRestClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "adapters/polygon/JsonFields.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace adapters::polygon {

namespace {
constexpr int kMaxRetries = 5;

std::string without_query(const std::string& target) {
    return target.substr(0, target.find('?'));
}
}  // namespace

AggregatesPage parse_aggregates_response(const std::string& body, const domain::Symbol& symbol) {
    boost::json::value root;
    try {
        root = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw gapfill::FetchError(std::string{"Failed to parse Polygon aggregates response: "} + ex.what());
    }
    if (!root.is_object()) {
        throw gapfill::FetchError("Unexpected Polygon aggregates response type (expected object)");
    }

    const auto& obj = root.as_object();
    const std::string status = json::string_or_empty(obj, "status");
    if (status == "ERROR" || status == "NOT_AUTHORIZED") {
        std::string message = json::string_or_empty(obj, "error");
        if (message.empty()) {
            message = json::string_or_empty(obj, "message");
        }
        throw gapfill::FetchError("Polygon aggregates request for " + symbol + " returned status " + status +
                                  (message.empty() ? std::string{} : ": " + message));
    }

    AggregatesPage page;
    page.nextUrl = json::string_or_empty(obj, "next_url");

    const auto* results = obj.if_contains("results");
    if (results == nullptr || results->is_null()) {
        return page;
    }
    if (!results->is_array()) {
        throw gapfill::FetchError("Unexpected Polygon aggregates 'results' type (expected array)");
    }

    page.bars.reserve(results->as_array().size());
    for (const auto& item : results->as_array()) {
        if (!item.is_object()) {
            throw gapfill::FetchError("Unexpected Polygon aggregate row type");
        }
        const auto& row = item.as_object();
        try {
            domain::Bar bar{};
            bar.symbol = symbol;
            bar.epoch = json::to_int64(json::require(row, "t")) / 1000;
            bar.open = json::to_double(json::require(row, "o"));
            bar.high = json::to_double(json::require(row, "h"));
            bar.low = json::to_double(json::require(row, "l"));
            bar.close = json::to_double(json::require(row, "c"));
            bar.volume = json::to_double(json::require(row, "v"));
            bar.tickCount = json::optional_int64(row, "n");
            page.bars.push_back(std::move(bar));
        } catch (const std::runtime_error& ex) {
            throw gapfill::FetchError("Malformed Polygon aggregate for " + symbol + ": " + ex.what());
        }
    }
    return page;
}

PolygonRestClient::PolygonRestClient(Options options) : options_(std::move(options)) {
    try {
        base_ = infra::http::parse_https_url(options_.baseUrl);
    } catch (const std::exception& ex) {
        throw gapfill::ConfigurationError(ex.what());
    }
    if (!base_.target.empty() && base_.target.back() == '/') {
        base_.target.pop_back();
    }
}

std::string PolygonRestClient::with_api_key(const std::string& url) const {
    if (options_.apiKey.empty()) {
        return url;
    }
    const char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + "apiKey=" + options_.apiKey;
}

std::string PolygonRestClient::get_with_retries_(const infra::http::HttpsUrl& url) const {
    const std::string logged = without_query(url.target);
    for (int attempt = 1; attempt <= kMaxRetries; ++attempt) {
        infra::http::HttpResponse response;
        try {
            response = infra::http::https_get(url, options_.timeoutSec);
        } catch (const std::exception& ex) {
            throw gapfill::FetchError(ex.what());
        }

        const unsigned status = response.status;
        if (status == 200U) {
            return std::move(response.body);
        }

        if (status == 429U || (status >= 500U && status < 600U)) {
            if (attempt == kMaxRetries) {
                std::ostringstream oss;
                oss << "Polygon REST request " << logged << " failed after " << kMaxRetries
                    << " attempts with HTTP " << status;
                throw gapfill::FetchError(oss.str());
            }
            auto backoff = std::chrono::milliseconds(1000LL << (attempt - 1));
            if (!response.retry_after_header.empty()) {
                try {
                    backoff = std::chrono::seconds(std::stoll(response.retry_after_header));
                } catch (const std::exception&) {
                    // Date-form Retry-After; keep the exponential delay.
                }
            }
            LOG_WARN("PolygonRestClient: backoff attempt " << attempt << " due to HTTP " << status
                                                           << ", sleeping " << backoff.count() << " ms");
            std::this_thread::sleep_for(backoff);
            continue;
        }

        std::ostringstream oss;
        oss << "Polygon REST request " << logged << " returned unexpected HTTP " << status;
        throw gapfill::FetchError(oss.str());
    }
    throw gapfill::FetchError("Polygon REST request failed without success response");
}

std::vector<domain::Bar> PolygonRestClient::fetch_minute_bars(const domain::Symbol& symbol,
                                                             domain::TimestampSec from,
                                                             domain::TimestampSec to) {
    std::vector<domain::Bar> bars;
    if (symbol.empty() || from >= to) {
        return bars;
    }

    std::ostringstream target;
    target << base_.target << "/v2/aggs/ticker/" << symbol << "/range/1/minute/" << from * 1000 << '/'
           << to * 1000 - 1 << "?adjusted=true&sort=asc&limit=50000";

    infra::http::HttpsUrl url = base_;
    url.target = with_api_key(target.str());

    for (std::size_t pageNo = 0; pageNo < options_.maxPages; ++pageNo) {
        LOG_DEBUG("PolygonRestClient: GET " << without_query(url.target) << " page=" << pageNo);
        auto page = parse_aggregates_response(get_with_retries_(url), symbol);
        for (auto& bar : page.bars) {
            if (bar.epoch < from || bar.epoch >= to) {
                continue;
            }
            if (!bars.empty() && bar.epoch <= bars.back().epoch) {
                continue;
            }
            bars.push_back(std::move(bar));
        }

        if (page.nextUrl.empty()) {
            return bars;
        }
        try {
            url = infra::http::parse_https_url(with_api_key(page.nextUrl));
        } catch (const std::exception& ex) {
            throw gapfill::FetchError(std::string{"Invalid Polygon next_url: "} + ex.what());
        }
    }

    LOG_WARN("PolygonRestClient: page limit " << options_.maxPages << " reached for " << symbol
                                              << ", returning " << bars.size() << " bars");
    return bars;
}

}  // namespace adapters::polygon
