#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "core/clock.hpp"
#include "execution/gateways.hpp"
#include "market_data/venue_query.hpp"
#include "position/pnl_calculator.hpp"

namespace tarb {

struct ResolvedMarkets {
    Market market_15;
    Market market_5;
    WinningTokens winners;
};

struct BatchSettlement {
    bool resolved{false};
    double batch_pnl{0.0};
    double cumulative_pnl{0.0};
    std::vector<RedemptionTarget> targets;  // Winning legs, deduplicated
    size_t redemptions_submitted{0};
    size_t redemptions_failed{0};
};

/**
 * Waits for the two markets of a round to resolve, books the round's PnL
 * and hands the winning legs to settlement.
 *
 * Resolution is polled by condition id: first after a settle delay, then
 * every poll interval until both markets are closed with a single winning
 * token each, or the max wait runs out. A timed-out batch is dropped with
 * no PnL and no redemption.
 */
class ResolutionCoordinator {
public:
    ResolutionCoordinator(
        const StrategyConfig& config,
        VenueQuery& venue,
        SettlementGateway& settlement,
        CumulativePnl& pnl,
        Clock& clock,
        const std::atomic<bool>& shutdown
    );

    // nullopt on timeout or shutdown
    std::optional<ResolvedMarkets> await_resolution(const std::string& cid_15, const std::string& cid_5);

    BatchSettlement settle(const std::string& symbol, const std::vector<TradeRecord>& trades,
                           const ResolvedMarkets& resolved);

    // Returns the number of targets accepted by the gateway
    size_t submit(const std::vector<RedemptionTarget>& targets, BatchSettlement* outcome = nullptr);

    // await_resolution -> settle -> submit for one round. `on_resolved`
    // runs between resolution and settlement.
    BatchSettlement process(const std::string& symbol, const std::vector<TradeRecord>& trades,
                            const std::function<void()>& on_resolved = {});

private:
    static bool is_resolved(const Market& market);

    const StrategyConfig& config_;
    VenueQuery& venue_;
    SettlementGateway& settlement_;
    CumulativePnl& pnl_;
    Clock& clock_;
    const std::atomic<bool>& shutdown_;
};

} // namespace tarb
