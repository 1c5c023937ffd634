#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <shared_mutex>
#include <cstdint>
#include "common/types.hpp"

namespace tarb {

// Bids under this and asks over this mark a market with no real liquidity
constexpr Price PLACEHOLDER_BID = 0.05;
constexpr Price PLACEHOLDER_ASK = 0.95;

/**
 * Latest best bid/ask per outcome token, written by the order-book stream
 * and read by every symbol loop.
 */
class QuoteCache {
public:
    // False when the update carries no side or looks like a placeholder book
    bool apply(const std::string& token_id, std::optional<Price> bid, std::optional<Price> ask);

    std::optional<Quote> quote(const std::string& token_id) const;
    std::optional<Price> best_ask(const std::string& token_id) const;

    void forget(const std::vector<std::string>& token_ids);
    size_t size() const;

    static bool is_placeholder(std::optional<Price> bid, std::optional<Price> ask);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Quote> quotes_;
};

// Which granularities accepted a tick
struct ReferenceCapture {
    bool five_min{false};
    bool fifteen_min{false};

    bool any() const { return five_min || fifteen_min; }
};

/**
 * Reference ("price to beat") per (symbol, granularity, period start).
 * The first tick inside the capture window at a period's start wins.
 */
class ReferencePriceCache {
public:
    static constexpr int64_t RETENTION_SECS = 24 * 3600;

    explicit ReferencePriceCache(int64_t capture_window_secs = 2);

    ReferenceCapture record_tick(const std::string& symbol, int64_t timestamp_secs, double value);

    std::optional<double> get(const std::string& symbol, Granularity g, int64_t period_start) const;

    size_t slot_count() const;

private:
    bool record_slot(const std::string& symbol, Granularity g, int64_t timestamp_secs, double value);

    using Key = std::pair<std::string, Granularity>;

    int64_t capture_window_secs_;
    mutable std::shared_mutex mutex_;
    std::map<Key, std::map<int64_t, double>> slots_;
};

} // namespace tarb
