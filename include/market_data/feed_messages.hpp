#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace tarb {

class QuoteCache;

// Best bid/ask for one asset as carried by a market channel event
struct QuoteUpdate {
    std::string token_id;
    std::optional<Price> bid;
    std::optional<Price> ask;
};

// One oracle price tick from the RTDS Chainlink topic
struct ChainlinkTick {
    std::string symbol;        // "btc"
    int64_t timestamp_secs{0};
    double value{0.0};
};

constexpr const char* CHAINLINK_TOPIC = "crypto_prices_chainlink";

// Timestamps above this are milliseconds
constexpr int64_t MILLISECOND_TIMESTAMP_FLOOR = 1000000000000LL;

/**
 * Market channel subscribe frame: {"assets_ids": [...], "type": "market"}.
 */
std::string market_subscription(const std::vector<std::string>& token_ids);

/**
 * RTDS subscribe frame for every symbol on the Chainlink topic.
 */
std::string rtds_subscription();

/**
 * Quote updates carried by a market channel text frame. Handles `book`
 * and `price_change` events, single objects or arrays of them. Other
 * events and keep-alive text yield nothing. Throws nlohmann::json
 * exceptions on malformed JSON.
 */
std::vector<QuoteUpdate> parse_market_message(const std::string& text);

/**
 * Parse a frame and push its updates through QuoteCache::apply.
 * Returns the number of accepted updates; malformed frames are logged and
 * count as zero.
 */
size_t apply_market_message(const std::string& text, QuoteCache& cache);

/**
 * Best bid (highest) and best ask (lowest) from price level arrays of
 * {"price": "0.52", "size": "10"} entries.
 */
QuoteUpdate best_from_levels(const nlohmann::json& bids, const nlohmann::json& asks);

/**
 * "BTC/USD" -> "btc".
 */
std::string normalize_feed_symbol(const std::string& feed_symbol);

/**
 * Chainlink tick from an RTDS text frame, restricted to `symbols`
 * (lower-case). nullopt for other topics, other symbols, or payloads that
 * do not parse.
 */
std::optional<ChainlinkTick> parse_chainlink_tick(const std::string& text, const std::set<std::string>& symbols);

/**
 * Gamma `/events/slug/{slug}` response -> first listed market (no tokens).
 */
std::optional<Market> parse_gamma_event(const nlohmann::json& event);

/**
 * CLOB `/markets/{condition_id}` response -> market with tokens and winner flags.
 */
Market parse_clob_market(const nlohmann::json& j);

} // namespace tarb
