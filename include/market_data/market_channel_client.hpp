#pragma once

#include <string>
#include <vector>
#include <memory>
#include "market_data/ws_client_base.hpp"
#include "market_data/price_feed_cache.hpp"
#include "market_data/streams.hpp"

namespace tarb {

/**
 * CLOB market channel connection for a fixed set of assets. Every book
 * and price_change update goes through QuoteCache::apply.
 */
class MarketChannelClient : public WebSocketClientBase {
public:
    MarketChannelClient(const std::string& ws_base_url, std::vector<std::string> token_ids, QuoteCache& quotes);
    ~MarketChannelClient() override;

    static std::string channel_url(const std::string& ws_base_url);

protected:
    void on_open() override;
    void handle_message(const std::string& msg) override;

private:
    std::vector<std::string> token_ids_;
    QuoteCache& quotes_;
};

/**
 * OrderBookStream backed by one market channel connection per subscription.
 */
class PolymarketOrderBookStream : public OrderBookStream {
public:
    PolymarketOrderBookStream(std::string ws_base_url, QuoteCache& quotes, int reconnect_delay_ms);

    std::unique_ptr<QuoteSubscription> subscribe(const std::vector<std::string>& token_ids) override;

private:
    std::string ws_base_url_;
    QuoteCache& quotes_;
    int reconnect_delay_ms_;
};

} // namespace tarb
