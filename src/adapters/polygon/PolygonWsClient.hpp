#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::polygon {

// Streaming client for the Polygon stocks cluster. Authenticates, subscribes to minute
// aggregates, quotes and trades, and reconnects with capped backoff until stopped.
class PolygonWsClient : public domain::contracts::IMarketStream {
public:
    struct Options {
        std::string wsServers{"wss://socket.polygon.io"};
        std::string apiKey;
        std::set<domain::DataType> dataTypes;
        // Empty subscribes to every ticker.
        std::vector<domain::Symbol> symbols;
    };

    struct DecodeStats {
        std::size_t bars{0};
        std::size_t quotes{0};
        std::size_t trades{0};
        std::size_t skipped{0};
        std::vector<std::string> statuses;
    };

    explicit PolygonWsClient(Options options);
    ~PolygonWsClient() override;

    PolygonWsClient(const PolygonWsClient&) = delete;
    PolygonWsClient& operator=(const PolygonWsClient&) = delete;

    void start(domain::contracts::StreamHandlers handlers) override;
    void stop() override;

    // Comma separated channel list, e.g. "AM.AAPL,Q.AAPL" or "AM.*".
    std::string subscription_params() const;

    // Dispatches every event of one frame to `handlers`. Throws std::runtime_error when the
    // frame is not JSON; malformed events are counted as skipped.
    static DecodeStats decode_messages(const std::string& payload,
                                       const domain::contracts::StreamHandlers& handlers);

private:
    using WsStream = boost::beast::websocket::stream<
        boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    void run_();
    void connect_and_subscribe_(WsStream& ws, boost::asio::io_context& ioc);
    std::vector<std::string> read_statuses_(WsStream& ws);
    void start_read_(const std::shared_ptr<WsStream>& ws,
                     const std::shared_ptr<boost::beast::flat_buffer>& buffer);

    Options options_;
    infra::http::HttpsUrl endpoint_;
    domain::contracts::StreamHandlers handlers_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::mutex ws_mutex_;
    std::shared_ptr<WsStream> active_ws_;
    std::shared_ptr<boost::asio::io_context> active_ioc_;
};

}  // namespace adapters::polygon
