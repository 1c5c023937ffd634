#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <filesystem>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "core/clock.hpp"
#include "core/orchestrator.hpp"
#include "core/shared_state.hpp"
#include "market_data/market_channel_client.hpp"
#include "market_data/polymarket_client.hpp"
#include "market_data/rtds_client.hpp"
#include "persistence/redemption_queue.hpp"
#include "utils/metrics.hpp"

using namespace tarb;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/tenorarb.log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("tenorarb", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

std::vector<std::string> split_symbols(const std::string& list) {
    std::vector<std::string> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(),
                                  [](unsigned char c) { return std::isspace(c); }),
                   item.end());
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void print_startup_banner(const Config& config) {
    const auto& s = config.strategy;
    std::string symbols;
    for (const auto& sym : s.symbols) {
        if (!symbols.empty()) symbols += ",";
        symbols += sym;
    }

    std::cout << "TenorArb - 15m/5m cross-tenor arbitrage\n";
    std::cout << "  symbols:        " << symbols << "\n";
    std::cout << "  sum threshold:  " << s.sum_threshold << "\n";
    std::cout << "  shares per leg: " << s.arb_shares << "\n";
    std::cout << "  cooldown:       " << s.trade_interval_secs << "s\n";
    if (s.simulation_mode) {
        std::cout << "[SIMULATION] Trades are recorded, no orders placed.\n\n";
    } else {
        std::cout << "WARNING: LIVE TRADING. Real orders will be placed.\n\n";
    }
}

// Queue the winning position of one resolved market and exit
int redeem_one(const Config& config, const std::string& condition_id) {
    PolymarketClient client(config.connection, config.credentials);
    RedemptionQueue queue(config.redemption_queue_path);

    Market market = client.get_market(condition_id);
    auto winner = market.sole_winner();
    if (!market.closed || !winner) {
        spdlog::error("Market {} is not resolved yet", condition_id);
        return 1;
    }

    if (!queue.redeem(RedemptionTarget{condition_id, winner->outcome})) {
        spdlog::error("Could not queue redemption for {}", condition_id);
        return 1;
    }
    spdlog::info("Queued {} ({}) in {}", condition_id, winner->outcome, queue.path());
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"TenorArb - 15m/5m up/down cross-tenor arbitrage"};

    std::string config_path = "config.json";
    std::string symbols_arg;
    std::string condition_id;
    bool simulate = false;
    bool live_mode = false;
    bool show_version = false;
    bool redeem = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--symbols", symbols_arg, "Comma separated symbols, overrides the config (e.g. btc,eth)");
    app.add_flag("--simulate", simulate, "Record trades without placing orders");
    app.add_flag("--live", live_mode, "Place real orders (requires explicit confirmation)");
    app.add_flag("--redeem", redeem, "Queue redemption of one resolved market and exit");
    app.add_option("--condition-id", condition_id, "Market to redeem with --redeem");
    app.add_flag("-v,--version", show_version, "Show version information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "TenorArb v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    if (simulate && live_mode) {
        std::cerr << "--simulate and --live are mutually exclusive\n";
        return 1;
    }

    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        } else {
            config.save(config_path);
            std::cerr << "No config at " << config_path << ", wrote defaults there.\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    config.apply_env_overrides();

    if (!symbols_arg.empty()) {
        config.strategy.symbols = split_symbols(symbols_arg);
    }
    if (simulate) {
        config.strategy.simulation_mode = true;
    } else if (live_mode) {
        config.strategy.simulation_mode = false;

        std::cout << "LIVE TRADING MODE REQUESTED\n";
        std::cout << "This will place REAL orders with REAL money.\n";
        std::cout << "Type 'CONFIRM' to proceed: ";
        std::string confirmation;
        std::getline(std::cin, confirmation);
        if (confirmation != "CONFIRM") {
            std::cout << "Live trading not confirmed. Exiting.\n";
            return 1;
        }
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration in {}", config_path);
        return 1;
    }

    if (redeem) {
        if (condition_id.empty()) {
            spdlog::error("--redeem needs --condition-id");
            return 1;
        }
        try {
            return redeem_one(config, condition_id);
        } catch (const std::exception& e) {
            spdlog::error("Redemption failed: {}", e.what());
            return 1;
        }
    }

    print_startup_banner(config);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Initializing TenorArb...");

    SharedMarketState state(config.strategy.reference_capture_window_secs);
    SystemClock clock;

    PolymarketClient polymarket(config.connection, config.credentials);
    if (!config.strategy.simulation_mode && !polymarket.has_credentials()) {
        spdlog::warn("No API credentials configured; live orders will fail. "
                     "Set POLYMARKET_API_KEY, POLYMARKET_API_SECRET and POLYMARKET_API_PASSPHRASE");
    }

    std::unique_ptr<RedemptionQueue> redemptions;
    try {
        redemptions = std::make_unique<RedemptionQueue>(config.redemption_queue_path);
    } catch (const std::exception& e) {
        spdlog::error("Cannot open redemption queue: {}", e.what());
        return 1;
    }

    PolymarketOrderBookStream book_stream(config.connection.ws_url, state.quotes,
                                          config.connection.market_ws_reconnect_delay_ms);

    RtdsPriceClient rtds(config.connection.rtds_ws_url, config.strategy.symbols, state.references);
    rtds.set_reconnect_delay(config.connection.rtds_reconnect_delay_ms);
    rtds.set_ping_interval(config.connection.rtds_ping_interval_ms);
    rtds.set_status_callback([](ConnectionStatus status) {
        spdlog::info("RTDS connection: {}", conn_status_to_string(status));
    });

    Orchestrator orchestrator(config.strategy, state,
                              Orchestrator::Collaborators{polymarket, polymarket, *redemptions,
                                                          book_stream, rtds, clock});

    std::thread runner([&orchestrator] { orchestrator.run(); });

    spdlog::info("TenorArb started. Mode: {}", config.strategy.simulation_mode ? "SIMULATION" : "LIVE");

    while (!g_shutdown.load() && !orchestrator.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (orchestrator.finished() && !g_shutdown.load()) {
        spdlog::warn("Every symbol loop has ended, nothing left to trade");
    }
    spdlog::info("Shutting down...");
    orchestrator.stop();
    runner.join();

    for (const auto& [symbol, error] : orchestrator.failed_symbols()) {
        spdlog::error("Symbol {} stopped with error: {}", symbol, error);
    }

    spdlog::info("Cumulative PnL: ${:.2f}", state.pnl.total());
    spdlog::info("Reference ticks received: {} ({} messages, {} reconnects)",
                 rtds.ticks_received(), rtds.messages_received(), rtds.reconnects());

    std::cout << "\nMetrics:\n" << MetricsRegistry::instance().to_json() << "\n";

    spdlog::info("TenorArb shutdown complete.");
    return 0;
}
