#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "common/types.hpp"
#include "market_data/venue_query.hpp"

namespace tarb {

struct DiscoveredMarket {
    std::string condition_id;
    std::string slug;
    std::string question;
    std::optional<double> question_reference;  // "price to beat" printed in the question
};

struct OutcomeTokens {
    std::string up;
    std::string down;
};

/**
 * Event slug of a symbol's up/down market, e.g. "btc-updown-15m-1699999200".
 */
std::string build_slug(const std::string& symbol, Granularity g, int64_t period_start);

/**
 * Dollar amount after "above " (case-insensitive) or else after the first
 * '$' in a market question. Thousands separators are dropped.
 */
std::optional<double> parse_reference_price(const std::string& question);

/**
 * Locates the up/down market for a (symbol, tenor, period) on the venue.
 */
class MarketDiscovery {
public:
    explicit MarketDiscovery(VenueQuery& venue);

    // nullopt when the market is missing, inactive, closed or the lookup failed
    std::optional<DiscoveredMarket> find_market(const std::string& symbol, Granularity g, int64_t period_start);

    // Throws std::runtime_error when either outcome cannot be identified
    OutcomeTokens get_outcome_tokens(const std::string& condition_id);

    static bool is_up_label(const std::string& outcome);
    static bool is_down_label(const std::string& outcome);

private:
    VenueQuery& venue_;
};

} // namespace tarb
