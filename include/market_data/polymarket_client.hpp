#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "execution/gateways.hpp"
#include "market_data/venue_query.hpp"

namespace tarb {

/**
 * Polymarket REST client: Gamma for slug lookups, CLOB for market state,
 * order books and order placement.
 *
 * Order placement uses L2 (API key) authentication. The order payload is
 * expected to be signed upstream; this client only forwards it.
 */
class PolymarketClient : public VenueQuery, public OrderGateway {
public:
    PolymarketClient(const ConnectionConfig& connection, const CredentialsConfig& credentials);
    ~PolymarketClient() override;

    PolymarketClient(const PolymarketClient&) = delete;
    PolymarketClient& operator=(const PolymarketClient&) = delete;

    std::optional<Market> get_market_by_slug(const std::string& slug) override;
    Market get_market(const std::string& condition_id) override;
    std::optional<Quote> get_best_prices(const std::string& token_id) override;

    OrderResponse place_order(const OrderRequest& request) override;

    bool has_credentials() const;

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    HttpResponse http_get(const std::string& url);
    HttpResponse http_post(const std::string& url, const std::string& body,
                           const std::vector<std::string>& extra_headers);

    std::vector<std::string> l2_headers(const std::string& method, const std::string& path,
                                        const std::string& body) const;

    ConnectionConfig connection_;
    CredentialsConfig credentials_;
};

} // namespace tarb
