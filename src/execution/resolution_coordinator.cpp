#include "execution/resolution_coordinator.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <spdlog/spdlog.h>

namespace tarb {

namespace {
    std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

ResolutionCoordinator::ResolutionCoordinator(
    const StrategyConfig& config,
    VenueQuery& venue,
    SettlementGateway& settlement,
    CumulativePnl& pnl,
    Clock& clock,
    const std::atomic<bool>& shutdown)
    : config_(config)
    , venue_(venue)
    , settlement_(settlement)
    , pnl_(pnl)
    , clock_(clock)
    , shutdown_(shutdown)
{
}

bool ResolutionCoordinator::is_resolved(const Market& market) {
    return market.closed && market.sole_winner().has_value();
}

std::optional<ResolvedMarkets> ResolutionCoordinator::await_resolution(const std::string& cid_15, const std::string& cid_5) {
    if (!sleep_unless_stopped(clock_, std::chrono::seconds(config_.resolution_settle_delay_secs), shutdown_)) {
        return std::nullopt;
    }

    const int64_t deadline = clock_.epoch_seconds() + config_.resolution_max_wait_secs;
    int attempt = 0;

    while (!shutdown_.load()) {
        ++attempt;
        try {
            Market m15 = venue_.get_market(cid_15);
            Market m5 = venue_.get_market(cid_5);

            if (is_resolved(m15) && is_resolved(m5)) {
                ResolvedMarkets resolved;
                resolved.winners[cid_15] = m15.sole_winner()->token_id;
                resolved.winners[cid_5] = m5.sole_winner()->token_id;
                resolved.market_15 = std::move(m15);
                resolved.market_5 = std::move(m5);
                return resolved;
            }
            spdlog::debug("Resolution poll {}: 15m closed={}, 5m closed={}", attempt, m15.closed, m5.closed);
        } catch (const std::exception& e) {
            spdlog::debug("Resolution poll {} failed: {}", attempt, e.what());
        }

        if (clock_.epoch_seconds() >= deadline) {
            return std::nullopt;
        }
        if (!sleep_unless_stopped(clock_, std::chrono::seconds(config_.resolution_poll_interval_secs), shutdown_)) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

BatchSettlement ResolutionCoordinator::settle(const std::string& symbol, const std::vector<TradeRecord>& trades,
                                              const ResolvedMarkets& resolved) {
    const std::string tag = upper(symbol);
    BatchSettlement outcome;
    outcome.resolved = true;

    std::set<RedemptionTarget> seen;
    auto add_target = [&](const TradeLeg& leg) {
        RedemptionTarget target{leg.condition_id, leg.outcome};
        if (seen.insert(target).second) {
            outcome.targets.push_back(target);
        }
    };

    for (const auto& trade : trades) {
        TradePnl pnl = compute_trade_pnl(trade, resolved.winners);
        outcome.batch_pnl += pnl.pnl;

        if (pnl.leg1_won) add_target(trade.leg1);
        if (pnl.leg2_won) add_target(trade.leg2);

        spdlog::info("[{}] 15m {} {} | 5m {} {} | cost=${:.4f} payout=${:.2f} pnl=${:+.4f}",
                     tag,
                     trade.leg1.outcome, pnl.leg1_won ? "WON" : "lost",
                     trade.leg2.outcome, pnl.leg2_won ? "WON" : "lost",
                     pnl.cost, pnl.payout, pnl.pnl);
    }

    outcome.cumulative_pnl = pnl_.add(outcome.batch_pnl);
    spdlog::info("[{}] Round settled: {} trade(s), pnl=${:+.4f}, cumulative=${:+.4f}",
                 tag, trades.size(), outcome.batch_pnl, outcome.cumulative_pnl);
    return outcome;
}

size_t ResolutionCoordinator::submit(const std::vector<RedemptionTarget>& targets, BatchSettlement* outcome) {
    if (config_.simulation_mode || !config_.auto_redeem) {
        spdlog::info("Skipping redemption of {} position(s) (simulation={}, auto_redeem={})",
                     targets.size(), config_.simulation_mode, config_.auto_redeem);
        return 0;
    }

    size_t accepted = 0;
    for (const auto& target : targets) {
        bool ok = false;
        try {
            ok = settlement_.redeem(target);
        } catch (const std::exception& e) {
            spdlog::error("Redemption of {} ({}) threw: {}", target.condition_id, target.outcome, e.what());
        }

        if (ok) {
            ++accepted;
            TARB_METRIC_COUNTER("redemptions_submitted").increment();
        } else {
            spdlog::warn("Redemption of {} ({}) was not accepted", target.condition_id, target.outcome);
            TARB_METRIC_COUNTER("redemption_failures").increment();
        }
    }

    if (outcome) {
        outcome->redemptions_submitted = accepted;
        outcome->redemptions_failed = targets.size() - accepted;
    }
    return accepted;
}

BatchSettlement ResolutionCoordinator::process(const std::string& symbol, const std::vector<TradeRecord>& trades,
                                               const std::function<void()>& on_resolved) {
    BatchSettlement outcome;
    if (trades.empty()) {
        return outcome;
    }

    const std::string tag = upper(symbol);
    const auto& first = trades.front();
    spdlog::info("[{}] Waiting for resolution of {} (15m) and {} (5m)", tag, first.cid_15, first.cid_5);

    auto resolved = await_resolution(first.cid_15, first.cid_5);
    if (!resolved) {
        if (shutdown_.load()) {
            spdlog::warn("[{}] Shutdown before resolution; {} trade(s) left unsettled", tag, trades.size());
        } else {
            spdlog::warn("[{}] Markets not resolved within {}; dropping {} trade(s)", tag,
                         time_utils::format_duration(std::chrono::seconds(config_.resolution_max_wait_secs)),
                         trades.size());
            TARB_METRIC_COUNTER("resolution_timeouts").increment();
        }
        return outcome;
    }

    if (on_resolved) {
        on_resolved();
    }
    outcome = settle(symbol, trades, *resolved);
    submit(outcome.targets, &outcome);
    return outcome;
}

} // namespace tarb
