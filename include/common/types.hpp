#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <vector>
#include <cstdint>

namespace tarb {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

// Prices are outcome probabilities in [0, 1]
using Price = double;
using Size = double;

// Both legs are always bought and rest until filled
enum class Side {
    BUY
};

inline std::string side_to_string(Side) {
    return "BUY";
}

enum class OrderType {
    GTC  // Good Till Cancel
};

inline std::string order_type_to_string(OrderType) {
    return "GTC";
}

// Connection status
enum class ConnectionStatus {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING,
    ERROR
};

inline std::string conn_status_to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::DISCONNECTED: return "DISCONNECTED";
        case ConnectionStatus::CONNECTING: return "CONNECTING";
        case ConnectionStatus::CONNECTED: return "CONNECTED";
        case ConnectionStatus::RECONNECTING: return "RECONNECTING";
        case ConnectionStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

// Market tenor. Both up/down markets of a symbol come in these two sizes.
enum class Granularity {
    FIVE_MIN,
    FIFTEEN_MIN
};

inline int granularity_minutes(Granularity g) {
    return g == Granularity::FIVE_MIN ? 5 : 15;
}

inline std::string granularity_label(Granularity g) {
    return g == Granularity::FIVE_MIN ? "5m" : "15m";
}

// Outcome labels used by the up/down markets
inline const std::string OUTCOME_UP = "Up";
inline const std::string OUTCOME_DOWN = "Down";

// Best bid/ask for one outcome token
struct Quote {
    std::optional<Price> bid;
    std::optional<Price> ask;
};

// One outcome token of a market as reported by the venue
struct MarketToken {
    std::string token_id;
    std::string outcome;  // "Up" / "Down"
    bool winner{false};
};

// Market as reported by the venue. Never cached locally.
struct Market {
    std::string condition_id;
    std::string question;
    std::string slug;
    bool active{false};
    bool closed{false};
    std::vector<MarketToken> tokens;

    // Winning token once resolved; nullopt unless exactly one token is flagged
    std::optional<MarketToken> sole_winner() const {
        std::optional<MarketToken> found;
        for (const auto& token : tokens) {
            if (!token.winner) continue;
            if (found) return std::nullopt;
            found = token;
        }
        return found;
    }
};

// Order submission
struct OrderRequest {
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};
    Size size{0.0};
    OrderType type{OrderType::GTC};
};

struct OrderResponse {
    bool success{false};
    std::string order_id;
    std::string error_message;
};

// One leg of an executed (or simulated) two-leg trade
struct TradeLeg {
    std::string token_id;
    std::string outcome;
    std::string condition_id;
    Price price{0.0};
};

// Record of one arbitrage trade, kept until its round resolves
struct TradeRecord {
    std::string symbol;
    int64_t period_15{0};
    int64_t period_5{0};
    std::string cid_15;
    std::string cid_5;
    TradeLeg leg1;  // 15m leg
    TradeLeg leg2;  // 5m leg
    Size size{0.0};
};

// Winning position handed to settlement
struct RedemptionTarget {
    std::string condition_id;
    std::string outcome;

    bool operator==(const RedemptionTarget& other) const {
        return condition_id == other.condition_id && outcome == other.outcome;
    }
    bool operator<(const RedemptionTarget& other) const {
        if (condition_id != other.condition_id) return condition_id < other.condition_id;
        return outcome < other.outcome;
    }
};

} // namespace tarb
