#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "adapters/duckdb/DuckMarketRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/polygon/PolygonRestClient.hpp"
#include "adapters/polygon/PolygonWsClient.hpp"
#include "app/FetcherService.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        auto config = gapfill::common::Config::fromArgs(argc, argv);
        gapfill::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << gapfill::log::levelToString(config.logLevel));
        LOG_INFO("  REST base: " << config.baseUrl);
        LOG_INFO("  WS servers: " << config.wsServers);
        LOG_INFO("  Data types: " << joinList(config.dataTypes));
        LOG_INFO("  Symbols: " << (config.symbols.empty() ? std::string{"*"} : joinList(config.symbols)));
        LOG_INFO("  Query start: " << (config.queryStart.empty() ? std::string{"<store>"} : config.queryStart));
        LOG_INFO("  DuckDB: " << config.duckdbPath);
        LOG_INFO("  Backfill interval: " << config.backfillIntervalMs << " ms");
        if (config.apiKey.empty()) {
            LOG_WARN("No Polygon API key configured; authentication will fail");
        }

        adapters::duckdb::DuckStore store(config.duckdbPath);
        store.migrate();
        adapters::duckdb::DuckMarketRepo repo(store);

        adapters::polygon::PolygonRestClient::Options restOptions;
        restOptions.baseUrl = config.baseUrl;
        restOptions.apiKey = config.apiKey;
        adapters::polygon::PolygonRestClient rest(restOptions);

        adapters::polygon::PolygonWsClient::Options wsOptions;
        wsOptions.wsServers = config.wsServers;
        wsOptions.apiKey = config.apiKey;
        wsOptions.dataTypes = config.enabledTypes();
        wsOptions.symbols = config.symbols;
        adapters::polygon::PolygonWsClient ws(wsOptions);

        app::FetcherService service(config, repo, repo, rest, ws);

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        service.start();
        LOG_INFO("Fetcher running. Waiting for signal...");

        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("Signal " << gSignalStatus << " received, stopping services...");
        service.stop();
        LOG_INFO("Shutdown complete");
    } catch (const gapfill::ConfigurationError& ex) {
        LOG_ERR("Invalid configuration: " << ex.what());
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
