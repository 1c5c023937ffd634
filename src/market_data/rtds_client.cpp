#include "market_data/rtds_client.hpp"
#include "market_data/feed_messages.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tarb {

RtdsPriceClient::RtdsPriceClient(const std::string& url, const std::vector<std::string>& symbols,
                                 ReferencePriceCache& references)
    : WebSocketClientBase(url, "RTDS")
    , references_(references)
{
    for (auto s : symbols) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        symbols_.insert(s);
    }
}

RtdsPriceClient::~RtdsPriceClient() {
    disconnect();
}

void RtdsPriceClient::on_open() {
    if (!send(rtds_subscription())) {
        throw std::runtime_error("failed to send RTDS subscription");
    }
    spdlog::info("RTDS subscribed to {} ({} symbols)", CHAINLINK_TOPIC, symbols_.size());
}

void RtdsPriceClient::handle_message(const std::string& msg) {
    auto tick = parse_chainlink_tick(msg, symbols_);
    if (!tick) {
        return;
    }
    ticks_++;

    auto captured = references_.record_tick(tick->symbol, tick->timestamp_secs, tick->value);
    if (captured.fifteen_min) {
        spdlog::info("Price-to-beat 15m {}: {} (feed_ts={})", tick->symbol, tick->value, tick->timestamp_secs);
    }
    if (captured.five_min) {
        spdlog::info("Price-to-beat 5m {}: {} (feed_ts={})", tick->symbol, tick->value, tick->timestamp_secs);
    }
}

} // namespace tarb
