#include "market_data/market_discovery.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tarb {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

std::string build_slug(const std::string& symbol, Granularity g, int64_t period_start) {
    return to_lower(symbol) + "-updown-" + granularity_label(g) + "-" + std::to_string(period_start);
}

std::optional<double> parse_reference_price(const std::string& question) {
    size_t pos = to_lower(question).find("above ");
    if (pos == std::string::npos) {
        pos = question.find('$');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
    }

    while (pos < question.size() && question[pos] != '$' &&
           !std::isdigit(static_cast<unsigned char>(question[pos]))) {
        ++pos;
    }
    if (pos < question.size() && question[pos] == '$') {
        ++pos;
    }

    std::string literal;
    for (; pos < question.size(); ++pos) {
        char c = question[pos];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            literal.push_back(c);
        } else if (c != ',') {
            break;
        }
    }

    if (literal.empty()) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double value = std::stod(literal, &consumed);
        if (consumed != literal.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

MarketDiscovery::MarketDiscovery(VenueQuery& venue)
    : venue_(venue)
{
}

std::optional<DiscoveredMarket> MarketDiscovery::find_market(const std::string& symbol, Granularity g, int64_t period_start) {
    std::string slug = build_slug(symbol, g, period_start);

    std::optional<Market> market;
    try {
        market = venue_.get_market_by_slug(slug);
    } catch (const std::exception& e) {
        spdlog::warn("Market lookup for {} failed: {}", slug, e.what());
        return std::nullopt;
    }

    if (!market) {
        spdlog::debug("Market {} not listed yet", slug);
        return std::nullopt;
    }
    if (!market->active || market->closed) {
        spdlog::debug("Market {} not tradeable (active={}, closed={})", slug, market->active, market->closed);
        return std::nullopt;
    }

    DiscoveredMarket found;
    found.condition_id = market->condition_id;
    found.slug = slug;
    found.question = market->question;
    found.question_reference = parse_reference_price(market->question);
    return found;
}

bool MarketDiscovery::is_up_label(const std::string& outcome) {
    std::string upper = to_upper(outcome);
    return upper.find("UP") != std::string::npos || upper == "1";
}

bool MarketDiscovery::is_down_label(const std::string& outcome) {
    std::string upper = to_upper(outcome);
    return upper.find("DOWN") != std::string::npos || upper == "0";
}

OutcomeTokens MarketDiscovery::get_outcome_tokens(const std::string& condition_id) {
    Market market = venue_.get_market(condition_id);

    OutcomeTokens tokens;
    for (const auto& token : market.tokens) {
        if (is_up_label(token.outcome)) {
            tokens.up = token.token_id;
        } else if (is_down_label(token.outcome)) {
            tokens.down = token.token_id;
        }
    }

    if (tokens.up.empty() || tokens.down.empty()) {
        throw std::runtime_error("Could not identify Up/Down tokens for market " + condition_id);
    }
    return tokens;
}

} // namespace tarb
