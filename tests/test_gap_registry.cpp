#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "app/GapRegistry.hpp"

namespace {

int gFailures = 0;

void expect(bool condition, const std::string& message) {
    if (!condition) {
        std::cerr << "FAIL: " << message << "\n";
        ++gFailures;
    }
}

}  // namespace

int main() {
    // A symbol is handed out once and only comes back after a new mark.
    {
        app::GapRegistry registry;
        registry.notify_gap("AAPL", 1000);
        auto first = registry.claim_all(10);
        expect(first.size() == 1 && first[0].symbol == "AAPL" && first[0].lastKnown == 1000,
               "first claim returns the marked symbol with its marker");
        expect(registry.is_in_flight("AAPL"), "claimed symbol is in flight");
        expect(registry.claim_all(10).empty(), "second claim without a new mark is empty");

        registry.release("AAPL");
        expect(!registry.is_in_flight("AAPL"), "release clears in flight");
        expect(!registry.pending_marker("AAPL").has_value(), "nothing pending after release");
        expect(registry.claim_all(10).empty(), "released symbol without mark is not claimable");
    }

    // Last write wins.
    {
        app::GapRegistry registry;
        registry.mark_pending("MSFT", 100);
        registry.mark_pending("MSFT", 200);
        expect(registry.pending_marker("MSFT") == 200, "later mark overwrites earlier one");
        auto claims = registry.claim_all(1);
        expect(claims.size() == 1 && claims[0].lastKnown == 200, "claim carries the latest marker");
    }

    // Marks during flight survive the release and are claimable afterwards.
    {
        app::GapRegistry registry;
        registry.notify_gap("TSLA", 10);
        (void)registry.claim_all(5);
        registry.notify_gap("TSLA", 20);
        expect(registry.claim_all(5).empty(), "in-flight symbol is not claimed twice");
        registry.release("TSLA", 10);
        expect(registry.pending_marker("TSLA") == 20, "retry marker does not replace a fresher mark");
        auto claims = registry.claim_all(5);
        expect(claims.size() == 1 && claims[0].lastKnown == 20, "fresh mark is claimed after release");
    }

    // Retry marker re-arms when nothing newer arrived.
    {
        app::GapRegistry registry;
        registry.notify_gap("NVDA", 42);
        (void)registry.claim_all(1);
        registry.release("NVDA", 42);
        expect(registry.pending_marker("NVDA") == 42, "retry marker re-arms the symbol");
    }

    // Limit bounds each claim and rotation reaches every symbol.
    {
        app::GapRegistry registry;
        const std::vector<std::string> symbols{"A", "B", "C", "D", "E", "F", "G", "H", "I", "J"};
        for (const auto& symbol : symbols) {
            registry.notify_gap(symbol, 1);
        }
        expect(registry.claim_all(0).empty(), "limit 0 claims nothing");

        std::set<std::string> seen;
        for (int round = 0; round < 3; ++round) {
            auto claims = registry.claim_all(4);
            expect(claims.size() <= 4, "claim never exceeds the limit");
            for (const auto& claim : claims) {
                expect(seen.insert(claim.symbol).second, "symbol " + claim.symbol + " claimed twice");
                registry.release(claim.symbol);
            }
        }
        expect(seen.size() == symbols.size(), "every pending symbol is claimed within three rounds");
        expect(registry.pending_count() == 0 && registry.in_flight_count() == 0, "registry drained");
    }

    // A constantly re-marked symbol does not starve later ones.
    {
        app::GapRegistry registry;
        registry.notify_gap("AAA", 1);
        registry.notify_gap("ZZZ", 1);
        auto first = registry.claim_all(1);
        expect(first.size() == 1 && first[0].symbol == "AAA", "first rotation starts at the beginning");
        registry.release("AAA");
        registry.notify_gap("AAA", 2);
        auto second = registry.claim_all(1);
        expect(second.size() == 1 && second[0].symbol == "ZZZ", "rotation continues after the last claim");
    }

    // Concurrent marks from many threads are all recorded.
    {
        app::GapRegistry registry;
        constexpr int kThreads = 8;
        constexpr int kSymbolsPerThread = 50;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&registry, t]() {
                for (int i = 0; i < kSymbolsPerThread; ++i) {
                    registry.notify_gap("S" + std::to_string(t) + "_" + std::to_string(i), i);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        expect(registry.pending_count() == kThreads * kSymbolsPerThread, "no concurrent mark is lost");
        auto claims = registry.claim_all(1000);
        expect(claims.size() == kThreads * kSymbolsPerThread, "all concurrently marked symbols are claimable");
    }

    // Release of an unknown symbol is harmless.
    {
        app::GapRegistry registry;
        registry.release("UNKNOWN");
        expect(registry.pending_count() == 0, "unknown release leaves the registry empty");
    }

    if (gFailures != 0) {
        std::cerr << gFailures << " check(s) failed\n";
        return 1;
    }
    return 0;
}
