#include "market_data/market_channel_client.hpp"
#include "market_data/feed_messages.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tarb {

MarketChannelClient::MarketChannelClient(const std::string& ws_base_url, std::vector<std::string> token_ids,
                                         QuoteCache& quotes)
    : WebSocketClientBase(channel_url(ws_base_url), "MarketChannel")
    , token_ids_(std::move(token_ids))
    , quotes_(quotes)
{
}

MarketChannelClient::~MarketChannelClient() {
    disconnect();
}

std::string MarketChannelClient::channel_url(const std::string& ws_base_url) {
    std::string base = ws_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/ws/market";
}

void MarketChannelClient::on_open() {
    if (!send(market_subscription(token_ids_))) {
        throw std::runtime_error("failed to send market subscription");
    }
    spdlog::info("{} subscribed to {} assets", name(), token_ids_.size());
}

void MarketChannelClient::handle_message(const std::string& msg) {
    apply_market_message(msg, quotes_);
}

namespace {

class MarketChannelSubscription : public QuoteSubscription {
public:
    explicit MarketChannelSubscription(std::unique_ptr<MarketChannelClient> client)
        : client_(std::move(client)) {}

    ~MarketChannelSubscription() override { cancel(); }

    void cancel() override {
        if (client_) {
            client_->disconnect();
            client_.reset();
        }
    }

private:
    std::unique_ptr<MarketChannelClient> client_;
};

} // namespace

PolymarketOrderBookStream::PolymarketOrderBookStream(std::string ws_base_url, QuoteCache& quotes,
                                                     int reconnect_delay_ms)
    : ws_base_url_(std::move(ws_base_url))
    , quotes_(quotes)
    , reconnect_delay_ms_(reconnect_delay_ms)
{
}

std::unique_ptr<QuoteSubscription> PolymarketOrderBookStream::subscribe(const std::vector<std::string>& token_ids) {
    auto client = std::make_unique<MarketChannelClient>(ws_base_url_, token_ids, quotes_);
    client->set_reconnect_delay(reconnect_delay_ms_);
    client->connect();
    return std::make_unique<MarketChannelSubscription>(std::move(client));
}

} // namespace tarb
