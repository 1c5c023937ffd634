#pragma once

#include <string>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace tarb {

struct StrategyConfig {
    std::vector<std::string> symbols{"btc", "eth", "sol", "xrp"};

    double sum_threshold{0.99};              // Trade when 15m ask + opposite 5m ask < this
    int trade_interval_secs{60};             // Cooldown after a placed arb
    bool simulation_mode{false};             // Record trades without placing orders
    double arb_shares{10.0};                 // Shares per leg

    // Max |15m price-to-beat - 5m price-to-beat| per symbol, in USD
    std::map<std::string, double> price_to_beat_tolerance{
        {"btc", 10.0},
        {"eth", 1.0},
        {"sol", 0.05},
        {"xrp", 0.0003}
    };

    // Resolution
    int resolution_settle_delay_secs{60};
    int resolution_poll_interval_secs{30};
    int resolution_max_wait_secs{600};
    bool auto_redeem{true};

    // Polling cadence
    int overlap_poll_secs{5};
    int reference_poll_secs{10};
    int live_poll_ms{10};
    int round_pause_secs{5};
    int reference_capture_window_secs{2};

    double tolerance_for(const std::string& symbol) const;
};

struct ConnectionConfig {
    std::string gamma_api_url{"https://gamma-api.polymarket.com"};
    std::string clob_api_url{"https://clob.polymarket.com"};
    std::string ws_url{"wss://ws-subscriptions-clob.polymarket.com"};
    std::string rtds_ws_url{"wss://ws-live-data.polymarket.com"};

    int market_ws_reconnect_delay_ms{3000};
    int rtds_reconnect_delay_ms{5000};
    int rtds_ping_interval_ms{5000};
    int http_timeout_secs{30};
};

struct CredentialsConfig {
    std::string api_key;
    std::string api_secret;
    std::string api_passphrase;
    std::string wallet_address;

    bool has_api_credentials() const { return !api_key.empty() && !api_secret.empty(); }
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format for the file sink
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct Config {
    StrategyConfig strategy;
    ConnectionConfig connection;
    CredentialsConfig credentials;
    LoggingConfig logging;

    std::string redemption_queue_path{"./data/redemptions.jsonl"};

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Overlay POLYMARKET_* environment variables onto credentials
    void apply_env_overrides();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const StrategyConfig& c);
void from_json(const nlohmann::json& j, StrategyConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace tarb
