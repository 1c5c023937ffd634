#include "market_data/price_feed_cache.hpp"
#include "strategy/window_clock.hpp"
#include "utils/metrics.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/spdlog.h>

namespace tarb {

bool QuoteCache::is_placeholder(std::optional<Price> bid, std::optional<Price> ask) {
    if (bid && ask) {
        return *bid < PLACEHOLDER_BID && *ask > PLACEHOLDER_ASK;
    }
    if (bid) {
        return *bid < PLACEHOLDER_BID;
    }
    if (ask) {
        return *ask > PLACEHOLDER_ASK;
    }
    return false;
}

bool QuoteCache::apply(const std::string& token_id, std::optional<Price> bid, std::optional<Price> ask) {
    if (!bid && !ask) {
        return false;
    }
    if (is_placeholder(bid, ask)) {
        TARB_METRIC_COUNTER("quotes_rejected").increment();
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& q = quotes_[token_id];
    if (bid) q.bid = bid;
    if (ask) q.ask = ask;
    return true;
}

std::optional<Quote> QuoteCache::quote(const std::string& token_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = quotes_.find(token_id);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Price> QuoteCache::best_ask(const std::string& token_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = quotes_.find(token_id);
    if (it == quotes_.end()) {
        return std::nullopt;
    }
    return it->second.ask;
}

void QuoteCache::forget(const std::vector<std::string>& token_ids) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& id : token_ids) {
        quotes_.erase(id);
    }
}

size_t QuoteCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return quotes_.size();
}

ReferencePriceCache::ReferencePriceCache(int64_t capture_window_secs)
    : capture_window_secs_(capture_window_secs)
{
}

ReferenceCapture ReferencePriceCache::record_tick(const std::string& symbol, int64_t timestamp_secs, double value) {
    std::string sym = symbol;
    std::transform(sym.begin(), sym.end(), sym.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    ReferenceCapture capture;
    capture.five_min = record_slot(sym, Granularity::FIVE_MIN, timestamp_secs, value);
    capture.fifteen_min = record_slot(sym, Granularity::FIFTEEN_MIN, timestamp_secs, value);

    if (capture.any()) {
        spdlog::debug("[{}] reference captured {} at {} (5m={}, 15m={})",
                      sym, value, timestamp_secs, capture.five_min, capture.fifteen_min);
    }
    return capture;
}

bool ReferencePriceCache::record_slot(const std::string& symbol, Granularity g,
                                      int64_t timestamp_secs, double value) {
    int64_t start = window_clock::period_start(timestamp_secs, g);
    if (timestamp_secs < start || timestamp_secs >= start + capture_window_secs_) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& periods = slots_[Key{symbol, g}];
    auto [it, inserted] = periods.emplace(start, value);
    if (inserted) {
        // Only the written key is trimmed, other symbols age out on their own next insert
        periods.erase(periods.begin(), periods.lower_bound(timestamp_secs - RETENTION_SECS));
    }
    return inserted;
}

std::optional<double> ReferencePriceCache::get(const std::string& symbol, Granularity g, int64_t period_start) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(Key{symbol, g});
    if (it == slots_.end()) {
        return std::nullopt;
    }
    auto slot = it->second.find(period_start);
    if (slot == it->second.end()) {
        return std::nullopt;
    }
    return slot->second;
}

size_t ReferencePriceCache::slot_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [key, periods] : slots_) {
        n += periods.size();
    }
    return n;
}

} // namespace tarb
