#pragma once

#include "market_data/price_feed_cache.hpp"
#include "position/pnl_calculator.hpp"

namespace tarb {

/**
 * State shared by every symbol loop and both stream clients. Created once
 * at startup and passed by reference; each member does its own locking.
 */
struct SharedMarketState {
    explicit SharedMarketState(int64_t capture_window_secs = 2)
        : references(capture_window_secs) {}

    SharedMarketState(const SharedMarketState&) = delete;
    SharedMarketState& operator=(const SharedMarketState&) = delete;

    QuoteCache quotes;
    ReferencePriceCache references;
    CumulativePnl pnl;
};

} // namespace tarb
