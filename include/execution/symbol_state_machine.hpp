#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/clock.hpp"
#include "core/shared_state.hpp"
#include "arbitrage/leg_selector.hpp"
#include "execution/gateways.hpp"
#include "execution/resolution_coordinator.hpp"
#include "market_data/market_discovery.hpp"
#include "market_data/streams.hpp"
#include "market_data/venue_query.hpp"

namespace tarb {

enum class ArbPhase {
    WAITING_FOR_OVERLAP,
    WAITING_FOR_REFERENCE_PRICES,
    TRADING,
    RESOLVING,
    REDEEMING
};

inline std::string phase_to_string(ArbPhase p) {
    switch (p) {
        case ArbPhase::WAITING_FOR_OVERLAP: return "WAITING_FOR_OVERLAP";
        case ArbPhase::WAITING_FOR_REFERENCE_PRICES: return "WAITING_FOR_REFERENCE_PRICES";
        case ArbPhase::TRADING: return "TRADING";
        case ArbPhase::RESOLVING: return "RESOLVING";
        case ArbPhase::REDEEMING: return "REDEEMING";
    }
    return "UNKNOWN";
}

// The two markets traded during one overlap window
struct RoundMarkets {
    int64_t period_15{0};
    int64_t period_5{0};
    DiscoveredMarket market_15;
    DiscoveredMarket market_5;
    OutcomeTokens tokens_15;
    OutcomeTokens tokens_5;
};

struct CycleReport {
    int64_t period_15{0};
    int64_t period_5{0};
    bool abandoned{false};      // Reference prices too far apart
    bool interrupted{false};    // Shutdown before the round completed
    std::vector<TradeRecord> trades;
    int leg_failures{0};
    std::optional<BatchSettlement> settlement;
};

/**
 * Per-symbol trading loop.
 *
 * One cycle covers one 15m period:
 *   WAITING_FOR_OVERLAP          -> both markets of the last 5 minutes discovered
 *   WAITING_FOR_REFERENCE_PRICES -> both price-to-beat values cached and close enough
 *   TRADING                      -> buy cheap cross-tenor pairs until the period ends
 *   RESOLVING / REDEEMING        -> settle the round's trades
 *
 * Transient venue problems are retried inside a phase. ConfigurationError
 * ends run() for this symbol only.
 */
class SymbolStateMachine {
public:
    SymbolStateMachine(
        std::string symbol,
        const StrategyConfig& config,
        SharedMarketState& state,
        VenueQuery& venue,
        OrderGateway& orders,
        OrderBookStream& book_stream,
        ResolutionCoordinator& resolver,
        Clock& clock,
        const std::atomic<bool>& shutdown
    );

    // Runs cycles until shutdown. Rethrows ConfigurationError.
    void run();

    // One pass through every phase
    CycleReport run_cycle();

    ArbPhase phase() const { return phase_.load(); }
    const std::string& symbol() const { return symbol_; }

private:
    enum class ReferenceWait { READY, WINDOW_CLOSED, ABANDONED, STOPPED };

    std::optional<RoundMarkets> wait_for_overlap();
    std::optional<RoundMarkets> discover_round(int64_t period_15, int64_t period_5);
    ReferenceWait wait_for_reference_prices(const RoundMarkets& round);
    void trade_round(const RoundMarkets& round, CycleReport& report);
    std::optional<TradeRecord> execute(const RoundMarkets& round, const ArbSelection& selection, CycleReport& report);
    void seed_quotes(const std::vector<std::string>& token_ids);
    bool in_cooldown() const;
    void set_phase(ArbPhase p);

    std::string symbol_;
    std::string tag_;  // Upper-case symbol for log lines
    const StrategyConfig& config_;
    SharedMarketState& state_;
    VenueQuery& venue_;
    MarketDiscovery discovery_;
    OrderGateway& orders_;
    OrderBookStream& book_stream_;
    ResolutionCoordinator& resolver_;
    Clock& clock_;
    const std::atomic<bool>& shutdown_;

    std::atomic<ArbPhase> phase_{ArbPhase::WAITING_FOR_OVERLAP};
    std::optional<int64_t> abandoned_period_15_;
    std::optional<Timestamp> last_trade_time_;
};

} // namespace tarb
