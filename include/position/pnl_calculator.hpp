#pragma once

#include <string>
#include <map>
#include <mutex>
#include "common/types.hpp"

namespace tarb {

// condition id -> winning token id
using WinningTokens = std::map<std::string, std::string>;

struct TradePnl {
    double cost{0.0};
    double payout{0.0};
    double pnl{0.0};
    bool leg1_won{false};
    bool leg2_won{false};
};

/**
 * Settle one trade against the resolved winners. Each share of a winning
 * leg pays 1.0; a leg whose market is missing from `winners` lost.
 */
TradePnl compute_trade_pnl(const TradeRecord& trade, const WinningTokens& winners);

/**
 * Process-wide realized PnL across all symbols.
 */
class CumulativePnl {
public:
    // Returns the new total
    double add(double delta);
    double total() const;

private:
    mutable std::mutex mutex_;
    double total_{0.0};
};

} // namespace tarb
