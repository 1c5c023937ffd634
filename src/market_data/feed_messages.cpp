#include "market_data/feed_messages.hpp"
#include "market_data/price_feed_cache.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace tarb {

namespace {
    // Venue prices arrive as strings; some payloads use bare numbers
    std::optional<double> as_number(const nlohmann::json& v) {
        if (v.is_number()) {
            return v.get<double>();
        }
        if (v.is_string()) {
            const auto& s = v.get_ref<const std::string&>();
            try {
                size_t consumed = 0;
                double d = std::stod(s, &consumed);
                if (consumed == 0) return std::nullopt;
                return d;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<double> field_number(const nlohmann::json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        return as_number(*it);
    }

    const nlohmann::json& levels(const nlohmann::json& j, const char* primary, const char* alias) {
        static const nlohmann::json empty = nlohmann::json::array();
        if (j.contains(primary) && j.at(primary).is_array()) return j.at(primary);
        if (j.contains(alias) && j.at(alias).is_array()) return j.at(alias);
        return empty;
    }

    void parse_event(const nlohmann::json& event, std::vector<QuoteUpdate>& out) {
        if (!event.is_object()) return;
        std::string type = event.value("event_type", "");

        if (type == "book") {
            std::string asset = event.value("asset_id", "");
            if (asset.empty()) return;
            QuoteUpdate update = best_from_levels(levels(event, "bids", "buys"), levels(event, "asks", "sells"));
            update.token_id = asset;
            out.push_back(std::move(update));
        } else if (type == "price_change") {
            auto it = event.find("price_changes");
            if (it == event.end() || !it->is_array()) return;
            for (const auto& change : *it) {
                std::string asset = change.value("asset_id", "");
                if (asset.empty()) continue;
                out.push_back(QuoteUpdate{asset, field_number(change, "best_bid"), field_number(change, "best_ask")});
            }
        }
    }
}

std::string market_subscription(const std::vector<std::string>& token_ids) {
    nlohmann::json j = {
        {"assets_ids", token_ids},
        {"type", "market"}
    };
    return j.dump();
}

std::string rtds_subscription() {
    nlohmann::json j = {
        {"action", "subscribe"},
        {"subscriptions", nlohmann::json::array({
            {{"topic", CHAINLINK_TOPIC}, {"type", "*"}, {"filters", ""}}
        })}
    };
    return j.dump();
}

QuoteUpdate best_from_levels(const nlohmann::json& bids, const nlohmann::json& asks) {
    QuoteUpdate update;
    for (const auto& level : bids) {
        if (!level.is_object() || !level.contains("price")) continue;
        auto p = as_number(level.at("price"));
        if (p && (!update.bid || *p > *update.bid)) update.bid = p;
    }
    for (const auto& level : asks) {
        if (!level.is_object() || !level.contains("price")) continue;
        auto p = as_number(level.at("price"));
        if (p && (!update.ask || *p < *update.ask)) update.ask = p;
    }
    return update;
}

std::vector<QuoteUpdate> parse_market_message(const std::string& text) {
    std::vector<QuoteUpdate> out;
    if (text.empty() || text == "PONG" || text == "pong") {
        return out;
    }

    auto j = nlohmann::json::parse(text);
    if (j.is_array()) {
        for (const auto& event : j) parse_event(event, out);
    } else {
        parse_event(j, out);
    }
    return out;
}

size_t apply_market_message(const std::string& text, QuoteCache& cache) {
    std::vector<QuoteUpdate> updates;
    try {
        updates = parse_market_message(text);
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Unparseable market message ({}): {}", e.what(), text.substr(0, 200));
        return 0;
    }

    size_t accepted = 0;
    for (const auto& u : updates) {
        if (cache.apply(u.token_id, u.bid, u.ask)) ++accepted;
    }
    return accepted;
}

std::string normalize_feed_symbol(const std::string& feed_symbol) {
    std::string s = feed_symbol;
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto slash = s.find('/');
    if (slash != std::string::npos) {
        s.resize(slash);
    }
    return s;
}

std::optional<ChainlinkTick> parse_chainlink_tick(const std::string& text, const std::set<std::string>& symbols) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto topic = j.find("topic");
    if (topic == j.end() || !topic->is_string() || topic->get<std::string>() != CHAINLINK_TOPIC) {
        return std::nullopt;
    }

    auto payload = j.find("payload");
    if (payload == j.end() || !payload->is_object()) return std::nullopt;

    auto sym = payload->find("symbol");
    if (sym == payload->end() || !sym->is_string()) return std::nullopt;

    ChainlinkTick tick;
    tick.symbol = normalize_feed_symbol(sym->get<std::string>());
    if (symbols.count(tick.symbol) == 0) return std::nullopt;

    auto ts = field_number(*payload, "timestamp");
    auto value = field_number(*payload, "value");
    if (!ts || !value) return std::nullopt;

    // Network input: anything non-finite or past int64 range is dropped before the cast
    constexpr double max_ts = static_cast<double>(std::numeric_limits<int64_t>::max());
    if (!std::isfinite(*ts) || *ts < 0.0 || *ts >= max_ts || !std::isfinite(*value)) {
        return std::nullopt;
    }

    auto raw = static_cast<int64_t>(*ts);
    tick.timestamp_secs = raw > MILLISECOND_TIMESTAMP_FLOOR ? raw / 1000 : raw;
    tick.value = *value;
    return tick;
}

std::optional<Market> parse_gamma_event(const nlohmann::json& event) {
    auto markets = event.find("markets");
    if (markets == event.end() || !markets->is_array() || markets->empty()) {
        return std::nullopt;
    }

    const auto& m = markets->front();
    Market market;
    market.condition_id = m.value("conditionId", "");
    market.question = m.value("question", "");
    market.slug = m.value("slug", "");
    market.active = m.value("active", false);
    market.closed = m.value("closed", false);
    if (market.condition_id.empty()) {
        return std::nullopt;
    }
    return market;
}

Market parse_clob_market(const nlohmann::json& j) {
    Market market;
    market.condition_id = j.at("condition_id").get<std::string>();
    market.question = j.value("question", "");
    market.slug = j.value("market_slug", "");
    market.active = j.value("active", false);
    market.closed = j.value("closed", false);

    if (j.contains("tokens") && j.at("tokens").is_array()) {
        for (const auto& t : j.at("tokens")) {
            MarketToken token;
            token.token_id = t.value("token_id", "");
            token.outcome = t.value("outcome", "");
            token.winner = t.value("winner", false);
            market.tokens.push_back(std::move(token));
        }
    }
    return market;
}

} // namespace tarb
