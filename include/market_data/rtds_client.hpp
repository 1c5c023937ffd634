#pragma once

#include <string>
#include <set>
#include <vector>
#include "market_data/ws_client_base.hpp"
#include "market_data/price_feed_cache.hpp"
#include "market_data/streams.hpp"

namespace tarb {

/**
 * Chainlink oracle prices from the real-time data service. Ticks for the
 * configured symbols feed ReferencePriceCache::record_tick, which keeps the
 * ones that open a 5m or 15m period.
 */
class RtdsPriceClient : public WebSocketClientBase, public ReferencePriceStream {
public:
    RtdsPriceClient(const std::string& url, const std::vector<std::string>& symbols, ReferencePriceCache& references);
    ~RtdsPriceClient() override;

    void start() override { connect(); }
    void stop() override { disconnect(); }

    int64_t ticks_received() const { return ticks_.load(); }

protected:
    void on_open() override;
    void handle_message(const std::string& msg) override;

private:
    std::set<std::string> symbols_;
    ReferencePriceCache& references_;
    std::atomic<int64_t> ticks_{0};
};

} // namespace tarb
