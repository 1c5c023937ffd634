#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace tarb {

/**
 * Read-only market lookups against the venue.
 */
class VenueQuery {
public:
    virtual ~VenueQuery() = default;

    // Market for an event slug; nullopt when the venue does not know it
    virtual std::optional<Market> get_market_by_slug(const std::string& slug) = 0;

    // Market by condition id with token winner flags. Throws on failure.
    virtual Market get_market(const std::string& condition_id) = 0;

    // Best bid/ask snapshot from the REST order book
    virtual std::optional<Quote> get_best_prices(const std::string& token_id) = 0;
};

} // namespace tarb
