#include "position/pnl_calculator.hpp"
#include "utils/metrics.hpp"

namespace tarb {

namespace {
    bool leg_won(const TradeLeg& leg, const WinningTokens& winners) {
        auto it = winners.find(leg.condition_id);
        return it != winners.end() && it->second == leg.token_id;
    }
}

TradePnl compute_trade_pnl(const TradeRecord& trade, const WinningTokens& winners) {
    TradePnl result;
    result.cost = (trade.leg1.price + trade.leg2.price) * trade.size;
    result.leg1_won = leg_won(trade.leg1, winners);
    result.leg2_won = leg_won(trade.leg2, winners);

    int winning_legs = (result.leg1_won ? 1 : 0) + (result.leg2_won ? 1 : 0);
    result.payout = trade.size * winning_legs;
    result.pnl = result.payout - result.cost;
    return result;
}

double CumulativePnl::add(double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_ += delta;
    // Published under the lock so the gauge never lags behind a later add
    TARB_METRIC_GAUGE("cumulative_pnl").set(total_);
    return total_;
}

double CumulativePnl::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

} // namespace tarb
