#include "adapters/polygon/PolygonWsClient.hpp"

#include <algorithm>
#include <cstdint>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "adapters/polygon/JsonFields.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace adapters::polygon {
namespace {
constexpr const char* kClusterPath = "/stocks";
constexpr std::chrono::milliseconds kBackoffBase{1000};
constexpr std::chrono::milliseconds kBackoffCap{30000};
constexpr std::chrono::milliseconds kStopPoll{200};
constexpr int kMaxStatusFrames = 5;

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("PolygonWsClient: " + message);
}

std::string symbol_of(const boost::json::object& obj) {
    std::string symbol = json::string_or_empty(obj, "sym");
    if (symbol.empty()) {
        throw std::runtime_error("missing field 'sym'");
    }
    return symbol;
}

domain::Bar decode_aggregate(const boost::json::object& obj) {
    domain::Bar bar{};
    bar.symbol = symbol_of(obj);
    bar.epoch = json::to_int64(json::require(obj, "s")) / 1000;
    bar.open = json::to_double(json::require(obj, "o"));
    bar.high = json::to_double(json::require(obj, "h"));
    bar.low = json::to_double(json::require(obj, "l"));
    bar.close = json::to_double(json::require(obj, "c"));
    bar.volume = json::to_double(json::require(obj, "v"));
    bar.tickCount = json::optional_int64(obj, "n");
    if (!bar.tickCount) {
        bar.tickCount = json::optional_int64(obj, "z");
    }
    return bar;
}

void split_millis(std::int64_t millis, domain::TimestampSec& epoch, std::int32_t& nanos) {
    epoch = millis / 1000;
    nanos = static_cast<std::int32_t>((millis % 1000) * 1000000);
}

domain::Quote decode_quote(const boost::json::object& obj) {
    domain::Quote quote{};
    quote.symbol = symbol_of(obj);
    split_millis(json::to_int64(json::require(obj, "t")), quote.epoch, quote.nanos);
    quote.bidPrice = json::to_double(json::require(obj, "bp"));
    quote.askPrice = json::to_double(json::require(obj, "ap"));
    quote.bidSize = json::optional_int64(obj, "bs").value_or(0);
    quote.askSize = json::optional_int64(obj, "as").value_or(0);
    quote.bidExchange = static_cast<std::int32_t>(json::optional_int64(obj, "bx").value_or(0));
    quote.askExchange = static_cast<std::int32_t>(json::optional_int64(obj, "ax").value_or(0));
    return quote;
}

domain::Trade decode_trade(const boost::json::object& obj) {
    domain::Trade trade{};
    trade.symbol = symbol_of(obj);
    split_millis(json::to_int64(json::require(obj, "t")), trade.epoch, trade.nanos);
    trade.price = json::to_double(json::require(obj, "p"));
    trade.size = json::optional_int64(obj, "s").value_or(0);
    trade.exchange = static_cast<std::int32_t>(json::optional_int64(obj, "x").value_or(0));
    if (const auto* conditions = obj.if_contains("c"); conditions != nullptr && conditions->is_array()) {
        for (const auto& code : conditions->as_array()) {
            trade.conditions.push_back(static_cast<std::int32_t>(json::to_int64(code)));
        }
    }
    return trade;
}

}  // namespace

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

PolygonWsClient::PolygonWsClient(Options options) : options_(std::move(options)) {
    std::string url = options_.wsServers;
    if (url.rfind("wss://", 0) != 0) {
        throw gapfill::ConfigurationError("ws_servers must use wss://, got: " + url);
    }
    try {
        endpoint_ = infra::http::parse_https_url("https://" + url.substr(6));
    } catch (const std::exception& ex) {
        throw gapfill::ConfigurationError(ex.what());
    }
    if (!endpoint_.target.empty() && endpoint_.target.back() == '/') {
        endpoint_.target.pop_back();
    }
    endpoint_.target += kClusterPath;
    if (options_.dataTypes.empty()) {
        throw gapfill::ConfigurationError("at least one valid data_type is required");
    }
}

PolygonWsClient::~PolygonWsClient() {
    stop();
}

std::string PolygonWsClient::subscription_params() const {
    std::vector<std::string> channels;
    for (const auto type : options_.dataTypes) {
        const char* prefix = type == domain::DataType::Bars     ? "AM."
                             : type == domain::DataType::Quotes ? "Q."
                                                                : "T.";
        if (options_.symbols.empty()) {
            channels.push_back(std::string{prefix} + "*");
            continue;
        }
        for (const auto& symbol : options_.symbols) {
            channels.push_back(prefix + symbol);
        }
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < channels.size(); ++i) {
        if (i != 0) {
            oss << ',';
        }
        oss << channels[i];
    }
    return oss.str();
}

void PolygonWsClient::start(domain::contracts::StreamHandlers handlers) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw make_error("already started");
    }
    handlers_ = std::move(handlers);
    LOG_INFO("PolygonWsClient: starting host=" << endpoint_.host << " path=" << endpoint_.target
                                               << " channels=" << subscription_params());
    worker_ = std::thread(&PolygonWsClient::run_, this);
}

void PolygonWsClient::stop() {
    running_.store(false, std::memory_order_release);

    std::shared_ptr<WsStream> ws;
    std::shared_ptr<net::io_context> ioc;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws = active_ws_;
        ioc = active_ioc_;
    }
    if (ws && ioc) {
        // The pending async_read completes once the close handshake finishes or times out.
        net::post(*ioc, [ws]() {
            if (ws->is_open()) {
                ws->async_close(websocket::close_code::normal, [ws](const beast::error_code& ec) {
                    if (ec) {
                        beast::error_code closeEc;
                        beast::get_lowest_layer(*ws).socket().close(closeEc);
                    }
                });
            }
        });
    }

    if (worker_.joinable()) {
        worker_.join();
    }
}

std::vector<std::string> PolygonWsClient::read_statuses_(WsStream& ws) {
    beast::flat_buffer buffer;
    beast::error_code ec;
    ws.read(buffer, ec);
    if (ec) {
        throw make_error("read failed: " + ec.message());
    }
    const auto stats = decode_messages(beast::buffers_to_string(buffer.cdata()), handlers_);
    return stats.statuses;
}

void PolygonWsClient::connect_and_subscribe_(WsStream& ws, net::io_context& ioc) {
    ws.next_layer().set_verify_mode(ssl::verify_peer);
    ws.next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
    if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << endpoint_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    // Keep-alive pings detect dead peers while the market is quiet.
    websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = std::chrono::seconds(30);
    timeouts.idle_timeout = std::chrono::seconds(60);
    timeouts.keep_alive_pings = true;
    ws.set_option(timeouts);
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "gapfill-PolygonWsClient");
    }));

    beast::error_code ec;
    net::ip::tcp::resolver resolver(ioc);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed: " + ec.message());
    }
    beast::get_lowest_layer(ws).connect(results, ec);
    if (ec) {
        throw make_error("connect failed: " + ec.message());
    }
    ws.next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw make_error("TLS handshake failed: " + ec.message());
    }
    ws.handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target, ec);
    if (ec) {
        throw make_error("WebSocket handshake failed: " + ec.message());
    }

    const auto wait_for_status = [this, &ws](const std::string& wanted, const std::string& failure) {
        for (int frame = 0; frame < kMaxStatusFrames; ++frame) {
            for (const auto& status : read_statuses_(ws)) {
                if (status == wanted) {
                    return;
                }
                if (status == failure) {
                    throw make_error("server reported " + failure);
                }
            }
        }
        throw make_error("no '" + wanted + "' status received");
    };

    wait_for_status("connected", "error");

    boost::json::object auth;
    auth["action"] = "auth";
    auth["params"] = options_.apiKey;
    ws.write(net::buffer(boost::json::serialize(auth)), ec);
    if (ec) {
        throw make_error("auth write failed: " + ec.message());
    }
    wait_for_status("auth_success", "auth_failed");

    boost::json::object subscribe;
    subscribe["action"] = "subscribe";
    subscribe["params"] = subscription_params();
    ws.write(net::buffer(boost::json::serialize(subscribe)), ec);
    if (ec) {
        throw make_error("subscribe write failed: " + ec.message());
    }
}

void PolygonWsClient::start_read_(const std::shared_ptr<WsStream>& ws,
                                  const std::shared_ptr<beast::flat_buffer>& buffer) {
    ws->async_read(*buffer, [this, ws, buffer](const beast::error_code& ec, std::size_t bytes) {
        if (ec) {
            if (ec != websocket::error::closed && running_.load(std::memory_order_acquire)) {
                LOG_WARN("PolygonWsClient: read failed: " << ec.message());
            }
            return;
        }

        const std::string payload = beast::buffers_to_string(buffer->cdata());
        buffer->consume(bytes);
        try {
            const auto stats = decode_messages(payload, handlers_);
            for (const auto& status : stats.statuses) {
                LOG_DEBUG("PolygonWsClient: status " << status);
            }
        } catch (const std::exception& ex) {
            LOG_WARN("PolygonWsClient: failed to process message: " << ex.what());
        }

        if (running_.load(std::memory_order_acquire)) {
            start_read_(ws, buffer);
        }
    });
}

void PolygonWsClient::run_() {
    std::size_t attempt = 0;
    std::mt19937 rng{std::random_device{}()};

    while (running_.load(std::memory_order_acquire)) {
        auto ioc = std::make_shared<net::io_context>();
        ssl::context sslCtx(ssl::context::tls_client);
        sslCtx.set_default_verify_paths();
        sslCtx.set_verify_mode(ssl::verify_peer);
        auto ws = std::make_shared<WsStream>(*ioc, sslCtx);

        try {
            LOG_INFO("PolygonWsClient: connecting to " << endpoint_.host << ':' << endpoint_.port
                                                       << " (attempt=" << attempt + 1 << ")");
            connect_and_subscribe_(*ws, *ioc);
            {
                std::lock_guard<std::mutex> lock(ws_mutex_);
                active_ws_ = ws;
                active_ioc_ = ioc;
            }
            LOG_INFO("PolygonWsClient: subscribed to " << subscription_params());

            if (handlers_.onReconnected) {
                try {
                    handlers_.onReconnected();
                } catch (const std::exception& ex) {
                    LOG_WARN("PolygonWsClient: on_reconnected callback failed: " << ex.what());
                }
            }

            attempt = 0;
            if (running_.load(std::memory_order_acquire)) {
                start_read_(ws, std::make_shared<beast::flat_buffer>());
                ioc->run();
            }
        } catch (const std::exception& ex) {
            LOG_WARN("PolygonWsClient: connection error: " << ex.what());
        }

        {
            std::lock_guard<std::mutex> lock(ws_mutex_);
            active_ws_.reset();
            active_ioc_.reset();
        }

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }

        ++attempt;
        const auto exponent = std::min<std::size_t>(attempt - 1, static_cast<std::size_t>(10));
        auto backoff = std::chrono::milliseconds(kBackoffBase.count() * static_cast<std::int64_t>(1ULL << exponent));
        if (backoff > kBackoffCap) {
            backoff = kBackoffCap;
        }
        std::uniform_int_distribution<std::int64_t> jitterDist(0, backoff.count() / 2);
        const auto waitTime = std::min(backoff + std::chrono::milliseconds(jitterDist(rng)), kBackoffCap);
        LOG_INFO("PolygonWsClient: reconnect attempt=" << attempt << " wait_ms=" << waitTime.count());

        auto waited = std::chrono::milliseconds{0};
        while (waited < waitTime && running_.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(kStopPoll);
            waited += kStopPoll;
        }
    }

    LOG_INFO("PolygonWsClient: worker thread stopping");
}

PolygonWsClient::DecodeStats PolygonWsClient::decode_messages(
    const std::string& payload,
    const domain::contracts::StreamHandlers& handlers) {
    boost::json::error_code ec;
    auto root = boost::json::parse(payload, ec);
    if (ec) {
        throw make_error("invalid JSON payload: " + ec.message());
    }

    boost::json::array single;
    const boost::json::array* events = nullptr;
    if (root.is_array()) {
        events = &root.as_array();
    } else if (root.is_object()) {
        single.push_back(root);
        events = &single;
    } else {
        throw make_error("unexpected payload type");
    }

    DecodeStats stats;
    for (const auto& item : *events) {
        if (!item.is_object()) {
            ++stats.skipped;
            continue;
        }
        const auto& obj = item.as_object();
        const std::string ev = json::string_or_empty(obj, "ev");
        try {
            if (ev == "AM") {
                auto bar = decode_aggregate(obj);
                ++stats.bars;
                if (handlers.onBar) {
                    handlers.onBar(bar);
                }
            } else if (ev == "Q") {
                auto quote = decode_quote(obj);
                ++stats.quotes;
                if (handlers.onQuote) {
                    handlers.onQuote(quote);
                }
            } else if (ev == "T") {
                auto trade = decode_trade(obj);
                ++stats.trades;
                if (handlers.onTrade) {
                    handlers.onTrade(trade);
                }
            } else if (ev == "status") {
                const std::string status = json::string_or_empty(obj, "status");
                LOG_INFO("PolygonWsClient: status=" << status << " message=" << json::string_or_empty(obj, "message"));
                stats.statuses.push_back(status);
            } else {
                ++stats.skipped;
            }
        } catch (const std::runtime_error& ex) {
            ++stats.skipped;
            LOG_WARN("PolygonWsClient: skipping malformed '" << ev << "' event: " << ex.what());
        }
    }
    return stats;
}

}  // namespace adapters::polygon
