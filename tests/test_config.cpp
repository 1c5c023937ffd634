#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "config/config.hpp"

using namespace tarb;

class ConfigTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("tenorarb_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                  "_" + std::to_string(::getpid()) + ".json")).string();
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        ::unsetenv("POLYMARKET_API_KEY");
        ::unsetenv("POLYMARKET_API_SECRET");
    }

    void write(const std::string& text) {
        std::ofstream out(path_);
        out << text;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.strategy.symbols.size(), 4u);
    EXPECT_DOUBLE_EQ(config.strategy.sum_threshold, 0.99);
    EXPECT_EQ(config.strategy.trade_interval_secs, 60);
    EXPECT_DOUBLE_EQ(config.strategy.arb_shares, 10.0);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("BTC"), 10.0);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("xrp"), 0.0003);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("doge"), 0.0);
}

TEST_F(ConfigTest, LoadOverridesOnlyPresentKeys) {
    write(R"({"strategy": {"symbols": ["BTC", "Eth"], "sum_threshold": 0.97, "simulation_mode": true}})");
    Config config = Config::load(path_);

    EXPECT_EQ(config.strategy.symbols, (std::vector<std::string>{"btc", "eth"}));
    EXPECT_DOUBLE_EQ(config.strategy.sum_threshold, 0.97);
    EXPECT_TRUE(config.strategy.simulation_mode);
    EXPECT_EQ(config.strategy.resolution_max_wait_secs, 600);
    EXPECT_EQ(config.connection.clob_api_url, "https://clob.polymarket.com");
}

TEST_F(ConfigTest, SharesAcceptString) {
    write(R"({"strategy": {"arb_shares": "25"}})");
    EXPECT_DOUBLE_EQ(Config::load(path_).strategy.arb_shares, 25.0);
}

TEST_F(ConfigTest, FlatToleranceKeys) {
    write(R"({"strategy": {
        "price_to_beat_tolerance_usd": 12.5,
        "eth_price_to_beat_tolerance_usd": 2.0,
        "SOL_price_to_beat_tolerance_usd": 0.1
    }})");
    Config config = Config::load(path_);

    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("btc"), 12.5);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("eth"), 2.0);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("sol"), 0.1);
}

TEST_F(ConfigTest, ToleranceMapWinsOverFlatKeys) {
    write(R"({"strategy": {
        "btc_price_to_beat_tolerance_usd": 12.5,
        "price_to_beat_tolerance": {"BTC": 20.0, "doge": 0.001}
    }})");
    Config config = Config::load(path_);

    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("btc"), 20.0);
    EXPECT_DOUBLE_EQ(config.strategy.tolerance_for("doge"), 0.001);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load(path_ + ".missing"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedFileThrows) {
    write("{ not json");
    EXPECT_THROW(Config::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    write(R"({"strategy": {"sum_threshold": 0}})");
    EXPECT_THROW(Config::load(path_), std::runtime_error);

    Config config;
    config.strategy.symbols.clear();
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.strategy.arb_shares = 0;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.strategy.resolution_max_wait_secs = 10;
    EXPECT_FALSE(config.validate());

    config = Config{};
    config.strategy.price_to_beat_tolerance["btc"] = -1.0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, SaveDoesNotWriteSecrets) {
    Config config;
    config.credentials.api_key = "key";
    config.credentials.api_secret = "secret";
    config.credentials.wallet_address = "0xwallet";
    config.strategy.arb_shares = 7.0;
    config.save(path_);

    Config loaded = Config::load(path_);
    EXPECT_TRUE(loaded.credentials.api_key.empty());
    EXPECT_TRUE(loaded.credentials.api_secret.empty());
    EXPECT_EQ(loaded.credentials.wallet_address, "0xwallet");
    EXPECT_DOUBLE_EQ(loaded.strategy.arb_shares, 7.0);
}

TEST_F(ConfigTest, EnvironmentSuppliesCredentials) {
    ::setenv("POLYMARKET_API_KEY", "env-key", 1);
    ::setenv("POLYMARKET_API_SECRET", "env-secret", 1);

    Config config;
    EXPECT_FALSE(config.credentials.has_api_credentials());
    config.apply_env_overrides();

    EXPECT_EQ(config.credentials.api_key, "env-key");
    EXPECT_EQ(config.credentials.api_secret, "env-secret");
    EXPECT_TRUE(config.credentials.has_api_credentials());
}

TEST_F(ConfigTest, GetEnvFallsBackToDefault) {
    EXPECT_EQ(Config::get_env("TENORARB_SURELY_UNSET_VARIABLE", "fallback"), "fallback");
}
