#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "config/config.hpp"
#include "core/clock.hpp"
#include "core/shared_state.hpp"
#include "execution/gateways.hpp"
#include "execution/resolution_coordinator.hpp"
#include "market_data/streams.hpp"
#include "market_data/venue_query.hpp"

namespace tarb {

/**
 * Runs one SymbolStateMachine thread per configured symbol over a shared
 * set of caches, collaborators and one reference price stream.
 */
class Orchestrator {
public:
    struct Collaborators {
        VenueQuery& venue;
        OrderGateway& orders;
        SettlementGateway& settlement;
        OrderBookStream& book_stream;
        ReferencePriceStream& reference_stream;
        Clock& clock;
    };

    Orchestrator(const StrategyConfig& config, SharedMarketState& state, Collaborators collaborators);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Blocks until every symbol loop has returned
    void run();

    // Raise the shutdown flag and stop the reference stream; callable from any thread
    void stop();

    bool stopping() const { return shutdown_.load(); }

    // True once run() has returned, whether stopped or because every symbol loop ended
    bool finished() const { return finished_.load(); }

    // Symbols whose loop ended with an error, and the error text
    std::map<std::string, std::string> failed_symbols() const;

private:
    void run_symbol(const std::string& symbol);

    static constexpr int WARM_UP_SECS = 2;

    const StrategyConfig& config_;
    SharedMarketState& state_;
    Collaborators collab_;
    ResolutionCoordinator resolver_;

    std::atomic<bool> shutdown_{false};
    std::atomic<bool> stream_started_{false};
    std::atomic<bool> finished_{false};

    mutable std::mutex failures_mutex_;
    std::map<std::string, std::string> failures_;
};

} // namespace tarb
