#include <gtest/gtest.h>
#include <atomic>
#include "execution/resolution_coordinator.hpp"
#include "utils/metrics.hpp"
#include "test_doubles.hpp"

using namespace tarb;
using namespace tarb::testing_support;

class ResolutionCoordinatorTest : public ::testing::Test {
protected:
    static constexpr int64_t START = 1700000100;

    void SetUp() override {
        MetricsRegistry::instance().reset_all();
        config_.resolution_settle_delay_secs = 60;
        config_.resolution_poll_interval_secs = 30;
        config_.resolution_max_wait_secs = 600;

        m15_ = make_market("cid15", "15m", "up15", "down15");
        m5_ = make_market("cid5", "5m", "up5", "down5");
        venue_.add("slug15", m15_);
        venue_.add("slug5", m5_);
    }

    void resolve_markets(const std::string& win15, const std::string& win5) {
        resolve(venue_.by_cid["cid15"], win15);
        resolve(venue_.by_cid["cid5"], win5);
    }

    ResolutionCoordinator make_coordinator() {
        return ResolutionCoordinator(config_, venue_, settlement_, pnl_, clock_, shutdown_);
    }

    TradeRecord make_trade() {
        TradeRecord t;
        t.symbol = "btc";
        t.cid_15 = "cid15";
        t.cid_5 = "cid5";
        t.leg1 = TradeLeg{"up15", "Up", "cid15", 0.45};
        t.leg2 = TradeLeg{"down5", "Down", "cid5", 0.47};
        t.size = 10.0;
        return t;
    }

    StrategyConfig config_;
    FakeVenue venue_;
    FakeSettlement settlement_;
    CumulativePnl pnl_;
    ManualClock clock_{START};
    std::atomic<bool> shutdown_{false};
    Market m15_;
    Market m5_;
};

TEST_F(ResolutionCoordinatorTest, SettlesAndRedeemsWinningLegsOnce) {
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade(), make_trade()});

    EXPECT_TRUE(outcome.resolved);
    EXPECT_NEAR(outcome.batch_pnl, 21.6, 1e-9);
    EXPECT_NEAR(outcome.cumulative_pnl, 21.6, 1e-9);
    EXPECT_NEAR(pnl_.total(), 21.6, 1e-9);

    ASSERT_EQ(outcome.targets.size(), 2u);
    EXPECT_EQ(outcome.targets[0], (RedemptionTarget{"cid15", "Up"}));
    EXPECT_EQ(outcome.targets[1], (RedemptionTarget{"cid5", "Down"}));
    EXPECT_EQ(settlement_.redeemed.size(), 2u);
    EXPECT_EQ(outcome.redemptions_submitted, 2u);
    EXPECT_EQ(outcome.redemptions_failed, 0u);

    // Only the settle delay elapsed
    EXPECT_EQ(clock_.epoch_seconds(), START + 60);
}

TEST_F(ResolutionCoordinatorTest, LosingLegsAreNotRedeemed) {
    resolve_markets("Down", "Down");
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade()});

    EXPECT_NEAR(outcome.batch_pnl, 0.8, 1e-9);
    ASSERT_EQ(outcome.targets.size(), 1u);
    EXPECT_EQ(outcome.targets[0], (RedemptionTarget{"cid5", "Down"}));
}

TEST_F(ResolutionCoordinatorTest, TimeoutDropsBatch) {
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade()});

    EXPECT_FALSE(outcome.resolved);
    EXPECT_DOUBLE_EQ(pnl_.total(), 0.0);
    EXPECT_TRUE(settlement_.redeemed.empty());
    EXPECT_EQ(TARB_METRIC_COUNTER("resolution_timeouts").value(), 1);
    EXPECT_EQ(clock_.epoch_seconds(), START + 60 + 600);
    // Polls at 0, 30, ..., 600 seconds after the settle delay
    EXPECT_EQ(venue_.market_calls, 2 * 21);
}

TEST_F(ResolutionCoordinatorTest, VenueErrorsAreRetried) {
    resolve_markets("Up", "Down");
    venue_.market_failures = 3;
    auto coordinator = make_coordinator();

    auto resolved = coordinator.await_resolution("cid15", "cid5");

    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->winners.at("cid15"), "up15");
    EXPECT_EQ(resolved->winners.at("cid5"), "down5");
    EXPECT_EQ(clock_.epoch_seconds(), START + 60 + 3 * 30);
}

TEST_F(ResolutionCoordinatorTest, ClosedWithoutWinnerIsNotResolved) {
    venue_.by_cid["cid15"].closed = true;
    resolve(venue_.by_cid["cid5"], "Down");
    auto coordinator = make_coordinator();

    EXPECT_FALSE(coordinator.await_resolution("cid15", "cid5").has_value());
}

TEST_F(ResolutionCoordinatorTest, SimulationBooksPnlWithoutRedeeming) {
    config_.simulation_mode = true;
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade()});

    EXPECT_NEAR(outcome.batch_pnl, 10.8, 1e-9);
    EXPECT_EQ(outcome.targets.size(), 2u);
    EXPECT_TRUE(settlement_.redeemed.empty());
    EXPECT_EQ(outcome.redemptions_submitted, 0u);
}

TEST_F(ResolutionCoordinatorTest, AutoRedeemOffSkipsSettlement) {
    config_.auto_redeem = false;
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    coordinator.process("btc", {make_trade()});
    EXPECT_TRUE(settlement_.redeemed.empty());
}

TEST_F(ResolutionCoordinatorTest, RedemptionFailuresAreCounted) {
    settlement_.throw_on_redeem = true;
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade()});

    EXPECT_TRUE(outcome.resolved);
    EXPECT_EQ(outcome.redemptions_submitted, 0u);
    EXPECT_EQ(outcome.redemptions_failed, 2u);
    EXPECT_EQ(TARB_METRIC_COUNTER("redemption_failures").value(), 2);
    EXPECT_NEAR(pnl_.total(), 10.8, 1e-9);
}

TEST_F(ResolutionCoordinatorTest, ShutdownAbortsWithoutTimeout) {
    shutdown_ = true;
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    auto outcome = coordinator.process("btc", {make_trade()});

    EXPECT_FALSE(outcome.resolved);
    EXPECT_EQ(venue_.market_calls, 0);
    EXPECT_EQ(TARB_METRIC_COUNTER("resolution_timeouts").value(), 0);
}

TEST_F(ResolutionCoordinatorTest, ResolvedHookRunsBeforeSettlement) {
    resolve_markets("Up", "Down");
    auto coordinator = make_coordinator();

    double pnl_seen_by_hook = -1.0;
    coordinator.process("btc", {make_trade()}, [&] { pnl_seen_by_hook = pnl_.total(); });

    EXPECT_DOUBLE_EQ(pnl_seen_by_hook, 0.0);
    EXPECT_NEAR(pnl_.total(), 10.8, 1e-9);
}

TEST_F(ResolutionCoordinatorTest, EmptyBatchDoesNothing) {
    auto coordinator = make_coordinator();
    auto outcome = coordinator.process("btc", {});

    EXPECT_FALSE(outcome.resolved);
    EXPECT_EQ(venue_.market_calls, 0);
    EXPECT_EQ(clock_.epoch_seconds(), START);
}
