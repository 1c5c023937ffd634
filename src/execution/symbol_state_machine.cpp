#include "execution/symbol_state_machine.hpp"
#include "common/errors.hpp"
#include "strategy/window_clock.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <future>
#include <spdlog/spdlog.h>

namespace tarb {

SymbolStateMachine::SymbolStateMachine(
    std::string symbol,
    const StrategyConfig& config,
    SharedMarketState& state,
    VenueQuery& venue,
    OrderGateway& orders,
    OrderBookStream& book_stream,
    ResolutionCoordinator& resolver,
    Clock& clock,
    const std::atomic<bool>& shutdown)
    : symbol_(std::move(symbol))
    , config_(config)
    , state_(state)
    , venue_(venue)
    , discovery_(venue)
    , orders_(orders)
    , book_stream_(book_stream)
    , resolver_(resolver)
    , clock_(clock)
    , shutdown_(shutdown)
{
    std::transform(symbol_.begin(), symbol_.end(), symbol_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    tag_ = symbol_;
    std::transform(tag_.begin(), tag_.end(), tag_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
}

void SymbolStateMachine::set_phase(ArbPhase p) {
    if (phase_.exchange(p) != p) {
        spdlog::debug("[{}] Phase -> {}", tag_, phase_to_string(p));
    }
}

void SymbolStateMachine::run() {
    spdlog::info("[{}] Symbol loop started (threshold={:.4f}, shares={}, simulation={})",
                 tag_, config_.sum_threshold, config_.arb_shares, config_.simulation_mode);

    while (!shutdown_.load()) {
        try {
            run_cycle();
        } catch (const ConfigurationError& e) {
            spdlog::error("[{}] Fatal configuration error, stopping symbol loop: {}", tag_, e.what());
            throw;
        } catch (const std::exception& e) {
            spdlog::error("[{}] Cycle failed: {}", tag_, e.what());
        }

        sleep_unless_stopped(clock_, std::chrono::seconds(config_.round_pause_secs), shutdown_);
    }

    spdlog::info("[{}] Symbol loop stopped", tag_);
}

CycleReport SymbolStateMachine::run_cycle() {
    CycleReport report;
    std::optional<RoundMarkets> round;

    while (true) {
        set_phase(ArbPhase::WAITING_FOR_OVERLAP);
        round = wait_for_overlap();
        if (!round) {
            report.interrupted = true;
            return report;
        }
        report.period_15 = round->period_15;
        report.period_5 = round->period_5;

        set_phase(ArbPhase::WAITING_FOR_REFERENCE_PRICES);
        ReferenceWait wait = wait_for_reference_prices(*round);
        if (wait == ReferenceWait::READY) {
            break;
        }
        if (wait == ReferenceWait::ABANDONED) {
            report.abandoned = true;
            set_phase(ArbPhase::WAITING_FOR_OVERLAP);
            return report;
        }
        if (wait == ReferenceWait::STOPPED) {
            report.interrupted = true;
            return report;
        }
        spdlog::info("[{}] Overlap window closed before reference prices arrived", tag_);
    }

    set_phase(ArbPhase::TRADING);
    trade_round(*round, report);

    if (report.trades.empty()) {
        spdlog::info("[{}] No trades in period {}", tag_, time_utils::to_iso8601_seconds(round->period_15));
    } else if (!shutdown_.load()) {
        set_phase(ArbPhase::RESOLVING);
        report.settlement = resolver_.process(symbol_, report.trades,
                                              [this]() { set_phase(ArbPhase::REDEEMING); });
    } else {
        report.interrupted = true;
    }

    set_phase(ArbPhase::WAITING_FOR_OVERLAP);
    return report;
}

std::optional<RoundMarkets> SymbolStateMachine::wait_for_overlap() {
    const auto poll = std::chrono::seconds(config_.overlap_poll_secs);

    while (!shutdown_.load()) {
        int64_t now_s = clock_.epoch_seconds();
        int64_t p15 = window_clock::period_start(now_s, Granularity::FIFTEEN_MIN);

        if (window_clock::is_overlap(now_s, p15) && abandoned_period_15_ != p15) {
            int64_t p5 = window_clock::period_start(now_s, Granularity::FIVE_MIN);
            auto round = discover_round(p15, p5);
            if (round) {
                spdlog::info("[{}] Overlap: 15m {} ({}) / 5m {} ({})", tag_,
                             round->market_15.slug, round->market_15.condition_id,
                             round->market_5.slug, round->market_5.condition_id);
                return round;
            }
        }

        if (!sleep_unless_stopped(clock_, poll, shutdown_)) {
            break;
        }
    }
    return std::nullopt;
}

std::optional<RoundMarkets> SymbolStateMachine::discover_round(int64_t period_15, int64_t period_5) {
    auto m15 = discovery_.find_market(symbol_, Granularity::FIFTEEN_MIN, period_15);
    if (!m15) {
        spdlog::info("[{}] 15m market for {} not available yet", tag_, period_15);
        return std::nullopt;
    }
    auto m5 = discovery_.find_market(symbol_, Granularity::FIVE_MIN, period_5);
    if (!m5) {
        spdlog::info("[{}] 5m market for {} not available yet", tag_, period_5);
        return std::nullopt;
    }

    RoundMarkets round;
    round.period_15 = period_15;
    round.period_5 = period_5;
    round.market_15 = std::move(*m15);
    round.market_5 = std::move(*m5);

    try {
        round.tokens_15 = discovery_.get_outcome_tokens(round.market_15.condition_id);
        round.tokens_5 = discovery_.get_outcome_tokens(round.market_5.condition_id);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Outcome tokens unavailable: {}", tag_, e.what());
        return std::nullopt;
    }
    return round;
}

SymbolStateMachine::ReferenceWait SymbolStateMachine::wait_for_reference_prices(const RoundMarkets& round) {
    const auto poll = std::chrono::seconds(config_.reference_poll_secs);
    const double tolerance = config_.tolerance_for(symbol_);

    while (!shutdown_.load()) {
        if (!window_clock::is_overlap(clock_.epoch_seconds(), round.period_15)) {
            return ReferenceWait::WINDOW_CLOSED;
        }

        auto ref15 = state_.references.get(symbol_, Granularity::FIFTEEN_MIN, round.period_15);
        auto ref5 = state_.references.get(symbol_, Granularity::FIVE_MIN, round.period_5);

        if (ref15 && ref5) {
            double diff = std::fabs(*ref15 - *ref5);
            if (diff > tolerance) {
                spdlog::info("[{}] Price-to-beat mismatch: 15m={} 5m={} diff={} > {}; skipping period {}",
                             tag_, *ref15, *ref5, diff, tolerance, round.period_15);
                abandoned_period_15_ = round.period_15;
                TARB_METRIC_COUNTER("overlaps_abandoned").increment();
                return ReferenceWait::ABANDONED;
            }
            spdlog::info("[{}] Price-to-beat 15m={} 5m={} (diff {} <= {})", tag_, *ref15, *ref5, diff, tolerance);
            return ReferenceWait::READY;
        }

        spdlog::info("[{}] Waiting for price-to-beat (15m {}, 5m {})", tag_,
                     ref15 ? "ok" : "missing", ref5 ? "ok" : "missing");
        if (!sleep_unless_stopped(clock_, poll, shutdown_)) {
            break;
        }
    }
    return ReferenceWait::STOPPED;
}

void SymbolStateMachine::seed_quotes(const std::vector<std::string>& token_ids) {
    for (const auto& token : token_ids) {
        try {
            auto q = venue_.get_best_prices(token);
            if (q) {
                state_.quotes.apply(token, q->bid, q->ask);
            }
        } catch (const std::exception& e) {
            spdlog::debug("[{}] Book snapshot for {} failed: {}", tag_, token, e.what());
        }
    }
}

bool SymbolStateMachine::in_cooldown() const {
    if (!last_trade_time_) {
        return false;
    }
    return clock_.steady_now() - *last_trade_time_ < std::chrono::seconds(config_.trade_interval_secs);
}

void SymbolStateMachine::trade_round(const RoundMarkets& round, CycleReport& report) {
    const std::vector<std::string> tokens{
        round.tokens_15.up, round.tokens_15.down, round.tokens_5.up, round.tokens_5.down
    };
    const LegTokens legs{round.tokens_15.up, round.tokens_15.down, round.tokens_5.up, round.tokens_5.down};
    const int64_t end = window_clock::period_end(round.period_15, Granularity::FIFTEEN_MIN);
    const auto poll = std::chrono::milliseconds(config_.live_poll_ms);

    seed_quotes(tokens);
    auto subscription = book_stream_.subscribe(tokens);

    try {
        while (!shutdown_.load() && clock_.epoch_seconds() < end) {
            if (!in_cooldown()) {
                LegAsks asks{
                    state_.quotes.best_ask(legs.up_15),
                    state_.quotes.best_ask(legs.down_15),
                    state_.quotes.best_ask(legs.up_5),
                    state_.quotes.best_ask(legs.down_5)
                };
                auto selection = select_arb_legs(asks, legs, config_.sum_threshold);
                if (selection) {
                    auto record = execute(round, *selection, report);
                    if (record) {
                        report.trades.push_back(std::move(*record));
                    }
                }
            }
            clock_.sleep_for(poll);
        }
    } catch (...) {
        subscription->cancel();
        state_.quotes.forget(tokens);
        throw;
    }

    subscription->cancel();
    state_.quotes.forget(tokens);
}

std::optional<TradeRecord> SymbolStateMachine::execute(const RoundMarkets& round, const ArbSelection& selection,
                                                       CycleReport& report) {
    TradeRecord record;
    record.symbol = symbol_;
    record.period_15 = round.period_15;
    record.period_5 = round.period_5;
    record.cid_15 = round.market_15.condition_id;
    record.cid_5 = round.market_5.condition_id;
    record.leg1 = TradeLeg{selection.leg_15.token_id, selection.leg_15.outcome, record.cid_15, selection.leg_15.price};
    record.leg2 = TradeLeg{selection.leg_5.token_id, selection.leg_5.outcome, record.cid_5, selection.leg_5.price};
    record.size = config_.arb_shares;

    if (config_.simulation_mode) {
        spdlog::info("[{}] SIM arb: 15m {} @ {:.4f} + 5m {} @ {:.4f} = {:.4f} x {}",
                     tag_, selection.leg_15.outcome, selection.leg_15.price,
                     selection.leg_5.outcome, selection.leg_5.price, selection.sum(), record.size);
        TARB_METRIC_COUNTER("arb_sim_trades").increment();
        last_trade_time_ = clock_.steady_now();
        return record;
    }

    OrderRequest req1{selection.leg_15.token_id, Side::BUY, selection.leg_15.price, record.size, OrderType::GTC};
    OrderRequest req2{selection.leg_5.token_id, Side::BUY, selection.leg_5.price, record.size, OrderType::GTC};

    std::exception_ptr fatal;
    auto collect = [&fatal](std::future<OrderResponse>& f) {
        OrderResponse response;
        try {
            response = f.get();
        } catch (const ConfigurationError& e) {
            if (!fatal) fatal = std::current_exception();
            response.error_message = e.what();
        } catch (const std::exception& e) {
            response.error_message = e.what();
        }
        return response;
    };

    OrderResponse res1;
    OrderResponse res2;
    {
        ScopedLatency latency(TARB_METRIC_HISTOGRAM("order_pair_latency"));
        auto f1 = std::async(std::launch::async, [this, &req1]() { return orders_.place_order(req1); });
        auto f2 = std::async(std::launch::async, [this, &req2]() { return orders_.place_order(req2); });
        res1 = collect(f1);
        res2 = collect(f2);
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    if (res1.success && res2.success) {
        spdlog::info("[{}] ARB placed: 15m {} @ {:.4f} ({}) + 5m {} @ {:.4f} ({}) = {:.4f} x {}",
                     tag_, selection.leg_15.outcome, selection.leg_15.price, res1.order_id,
                     selection.leg_5.outcome, selection.leg_5.price, res2.order_id,
                     selection.sum(), record.size);
        TARB_METRIC_COUNTER("arb_trades").increment();
        last_trade_time_ = clock_.steady_now();
        return record;
    }

    spdlog::warn("[{}] Leg failure: 15m {} {} | 5m {} {}", tag_,
                 selection.leg_15.outcome, res1.success ? "ok (" + res1.order_id + ")" : "FAILED: " + res1.error_message,
                 selection.leg_5.outcome, res2.success ? "ok (" + res2.order_id + ")" : "FAILED: " + res2.error_message);
    TARB_METRIC_COUNTER("leg_failures").increment();
    report.leg_failures++;
    return std::nullopt;
}

} // namespace tarb
