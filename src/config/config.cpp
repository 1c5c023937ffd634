#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace tarb {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

double StrategyConfig::tolerance_for(const std::string& symbol) const {
    auto it = price_to_beat_tolerance.find(to_lower(symbol));
    if (it == price_to_beat_tolerance.end()) {
        return 0.0;
    }
    return it->second;
}

void to_json(nlohmann::json& j, const StrategyConfig& c) {
    j = nlohmann::json{
        {"symbols", c.symbols},
        {"sum_threshold", c.sum_threshold},
        {"trade_interval_secs", c.trade_interval_secs},
        {"simulation_mode", c.simulation_mode},
        {"arb_shares", c.arb_shares},
        {"price_to_beat_tolerance", c.price_to_beat_tolerance},
        {"resolution_settle_delay_secs", c.resolution_settle_delay_secs},
        {"resolution_poll_interval_secs", c.resolution_poll_interval_secs},
        {"resolution_max_wait_secs", c.resolution_max_wait_secs},
        {"auto_redeem", c.auto_redeem},
        {"overlap_poll_secs", c.overlap_poll_secs},
        {"reference_poll_secs", c.reference_poll_secs},
        {"live_poll_ms", c.live_poll_ms},
        {"round_pause_secs", c.round_pause_secs},
        {"reference_capture_window_secs", c.reference_capture_window_secs}
    };
}

void from_json(const nlohmann::json& j, StrategyConfig& c) {
    if (j.contains("symbols")) {
        j.at("symbols").get_to(c.symbols);
        for (auto& s : c.symbols) s = to_lower(s);
    }
    if (j.contains("sum_threshold")) j.at("sum_threshold").get_to(c.sum_threshold);
    if (j.contains("trade_interval_secs")) j.at("trade_interval_secs").get_to(c.trade_interval_secs);
    if (j.contains("simulation_mode")) j.at("simulation_mode").get_to(c.simulation_mode);
    if (j.contains("arb_shares")) {
        // Older configs carry the share count as a string
        const auto& shares = j.at("arb_shares");
        if (shares.is_string()) {
            c.arb_shares = std::stod(shares.get<std::string>());
        } else {
            shares.get_to(c.arb_shares);
        }
    }

    // Flat per-symbol keys first, the map overrides them
    if (j.contains("price_to_beat_tolerance_usd")) {
        j.at("price_to_beat_tolerance_usd").get_to(c.price_to_beat_tolerance["btc"]);
    }
    for (const auto& [key, value] : j.items()) {
        const std::string suffix = "_price_to_beat_tolerance_usd";
        if (key.size() > suffix.size() &&
            key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
            c.price_to_beat_tolerance[to_lower(key.substr(0, key.size() - suffix.size()))] =
                value.get<double>();
        }
    }
    if (j.contains("price_to_beat_tolerance")) {
        for (const auto& [sym, value] : j.at("price_to_beat_tolerance").items()) {
            c.price_to_beat_tolerance[to_lower(sym)] = value.get<double>();
        }
    }

    if (j.contains("resolution_settle_delay_secs")) j.at("resolution_settle_delay_secs").get_to(c.resolution_settle_delay_secs);
    if (j.contains("resolution_poll_interval_secs")) j.at("resolution_poll_interval_secs").get_to(c.resolution_poll_interval_secs);
    if (j.contains("resolution_max_wait_secs")) j.at("resolution_max_wait_secs").get_to(c.resolution_max_wait_secs);
    if (j.contains("auto_redeem")) j.at("auto_redeem").get_to(c.auto_redeem);
    if (j.contains("overlap_poll_secs")) j.at("overlap_poll_secs").get_to(c.overlap_poll_secs);
    if (j.contains("reference_poll_secs")) j.at("reference_poll_secs").get_to(c.reference_poll_secs);
    if (j.contains("live_poll_ms")) j.at("live_poll_ms").get_to(c.live_poll_ms);
    if (j.contains("round_pause_secs")) j.at("round_pause_secs").get_to(c.round_pause_secs);
    if (j.contains("reference_capture_window_secs")) j.at("reference_capture_window_secs").get_to(c.reference_capture_window_secs);
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"gamma_api_url", c.gamma_api_url},
        {"clob_api_url", c.clob_api_url},
        {"ws_url", c.ws_url},
        {"rtds_ws_url", c.rtds_ws_url},
        {"market_ws_reconnect_delay_ms", c.market_ws_reconnect_delay_ms},
        {"rtds_reconnect_delay_ms", c.rtds_reconnect_delay_ms},
        {"rtds_ping_interval_ms", c.rtds_ping_interval_ms},
        {"http_timeout_secs", c.http_timeout_secs}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("gamma_api_url")) j.at("gamma_api_url").get_to(c.gamma_api_url);
    if (j.contains("clob_api_url")) j.at("clob_api_url").get_to(c.clob_api_url);
    if (j.contains("ws_url")) j.at("ws_url").get_to(c.ws_url);
    if (j.contains("rtds_ws_url")) j.at("rtds_ws_url").get_to(c.rtds_ws_url);
    if (j.contains("market_ws_reconnect_delay_ms")) j.at("market_ws_reconnect_delay_ms").get_to(c.market_ws_reconnect_delay_ms);
    if (j.contains("rtds_reconnect_delay_ms")) j.at("rtds_reconnect_delay_ms").get_to(c.rtds_reconnect_delay_ms);
    if (j.contains("rtds_ping_interval_ms")) j.at("rtds_ping_interval_ms").get_to(c.rtds_ping_interval_ms);
    if (j.contains("http_timeout_secs")) j.at("http_timeout_secs").get_to(c.http_timeout_secs);
}

void to_json(nlohmann::json& j, const CredentialsConfig& c) {
    // Secrets are never written back out
    j = nlohmann::json{
        {"api_key", ""},
        {"api_secret", ""},
        {"api_passphrase", ""},
        {"wallet_address", c.wallet_address}
    };
}

void from_json(const nlohmann::json& j, CredentialsConfig& c) {
    if (j.contains("api_key") && j.at("api_key").is_string()) j.at("api_key").get_to(c.api_key);
    if (j.contains("api_secret") && j.at("api_secret").is_string()) j.at("api_secret").get_to(c.api_secret);
    if (j.contains("api_passphrase") && j.at("api_passphrase").is_string()) j.at("api_passphrase").get_to(c.api_passphrase);
    if (j.contains("wallet_address") && j.at("wallet_address").is_string()) j.at("wallet_address").get_to(c.wallet_address);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"strategy", c.strategy},
        {"connection", c.connection},
        {"credentials", c.credentials},
        {"logging", c.logging},
        {"redemption_queue_path", c.redemption_queue_path}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("strategy")) j.at("strategy").get_to(c.strategy);
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("credentials")) j.at("credentials").get_to(c.credentials);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("redemption_queue_path")) j.at("redemption_queue_path").get_to(c.redemption_queue_path);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    Config config;
    try {
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (strategy.symbols.empty()) {
        spdlog::error("strategy.symbols must not be empty");
        return false;
    }

    if (strategy.sum_threshold <= 0.0 || strategy.sum_threshold > 2.0) {
        spdlog::error("sum_threshold must be in (0, 2]");
        return false;
    }

    if (strategy.sum_threshold >= 1.0) {
        spdlog::warn("sum_threshold {:.4f} >= 1.0 admits trades that cannot both pay out",
                     strategy.sum_threshold);
    }

    if (strategy.arb_shares <= 0.0) {
        spdlog::error("arb_shares must be positive");
        return false;
    }

    if (strategy.overlap_poll_secs <= 0 || strategy.reference_poll_secs <= 0 ||
        strategy.live_poll_ms <= 0 || strategy.resolution_poll_interval_secs <= 0) {
        spdlog::error("poll intervals must be positive");
        return false;
    }

    if (strategy.trade_interval_secs < 0 || strategy.resolution_settle_delay_secs < 0 ||
        strategy.round_pause_secs < 0 || strategy.reference_capture_window_secs <= 0) {
        spdlog::error("delays must be non-negative and the capture window positive");
        return false;
    }

    if (strategy.resolution_max_wait_secs < strategy.resolution_poll_interval_secs) {
        spdlog::error("resolution_max_wait_secs must be >= resolution_poll_interval_secs");
        return false;
    }

    for (const auto& [symbol, tolerance] : strategy.price_to_beat_tolerance) {
        if (tolerance < 0.0) {
            spdlog::error("price_to_beat_tolerance for {} must be non-negative", symbol);
            return false;
        }
    }

    for (const auto& symbol : strategy.symbols) {
        if (strategy.price_to_beat_tolerance.find(symbol) == strategy.price_to_beat_tolerance.end()) {
            spdlog::warn("No price_to_beat_tolerance for {}; only identical reference prices will trade",
                         symbol);
        }
    }

    return true;
}

void Config::apply_env_overrides() {
    credentials.api_key = get_env("POLYMARKET_API_KEY", credentials.api_key);
    credentials.api_secret = get_env("POLYMARKET_API_SECRET", credentials.api_secret);
    credentials.api_passphrase = get_env("POLYMARKET_API_PASSPHRASE", credentials.api_passphrase);
    credentials.wallet_address = get_env("POLYMARKET_WALLET_ADDRESS", credentials.wallet_address);
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return (val && *val) ? std::string(val) : default_val;
}

} // namespace tarb
