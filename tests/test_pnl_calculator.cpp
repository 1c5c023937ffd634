#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "position/pnl_calculator.hpp"
#include "utils/metrics.hpp"

using namespace tarb;

class PnlCalculatorTest : public ::testing::Test {
protected:
    TradeRecord make_trade(double p1, double p2, double size = 10.0) {
        TradeRecord t;
        t.symbol = "btc";
        t.cid_15 = "cid15";
        t.cid_5 = "cid5";
        t.leg1 = TradeLeg{"up15", "Up", "cid15", p1};
        t.leg2 = TradeLeg{"down5", "Down", "cid5", p2};
        t.size = size;
        return t;
    }
};

TEST_F(PnlCalculatorTest, BothLegsWin) {
    WinningTokens winners{{"cid15", "up15"}, {"cid5", "down5"}};
    auto pnl = compute_trade_pnl(make_trade(0.45, 0.47), winners);

    EXPECT_NEAR(pnl.cost, 9.2, 1e-9);
    EXPECT_NEAR(pnl.payout, 20.0, 1e-9);
    EXPECT_NEAR(pnl.pnl, 10.8, 1e-9);
    EXPECT_TRUE(pnl.leg1_won);
    EXPECT_TRUE(pnl.leg2_won);
}

TEST_F(PnlCalculatorTest, OneLegWins) {
    WinningTokens winners{{"cid15", "up15"}, {"cid5", "up5"}};
    auto pnl = compute_trade_pnl(make_trade(0.45, 0.47), winners);

    EXPECT_NEAR(pnl.payout, 10.0, 1e-9);
    EXPECT_NEAR(pnl.pnl, 0.8, 1e-9);
    EXPECT_TRUE(pnl.leg1_won);
    EXPECT_FALSE(pnl.leg2_won);
}

TEST_F(PnlCalculatorTest, NoLegWins) {
    WinningTokens winners{{"cid15", "down15"}, {"cid5", "up5"}};
    auto pnl = compute_trade_pnl(make_trade(0.45, 0.47), winners);

    EXPECT_NEAR(pnl.payout, 0.0, 1e-9);
    EXPECT_NEAR(pnl.pnl, -9.2, 1e-9);
}

TEST_F(PnlCalculatorTest, MissingMarketCountsAsLost) {
    WinningTokens winners{{"cid15", "up15"}};
    auto pnl = compute_trade_pnl(make_trade(0.45, 0.47), winners);

    EXPECT_TRUE(pnl.leg1_won);
    EXPECT_FALSE(pnl.leg2_won);
}

TEST(CumulativePnlTest, AddReturnsRunningTotalAndPublishesGauge) {
    CumulativePnl total;
    EXPECT_NEAR(total.add(10.8), 10.8, 1e-9);
    EXPECT_NEAR(total.add(-9.2), 1.6, 1e-9);
    EXPECT_NEAR(total.total(), 1.6, 1e-9);
    EXPECT_NEAR(TARB_METRIC_GAUGE("cumulative_pnl").value(), 1.6, 1e-9);
}

TEST(CumulativePnlTest, ConcurrentAddsAreNotLost) {
    CumulativePnl total;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&total] {
            for (int j = 0; j < 1000; ++j) total.add(0.5);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_NEAR(total.total(), 2000.0, 1e-6);
}

TEST(CumulativePnlTest, GaugeSettlesOnFinalTotalUnderConcurrentAdds) {
    CumulativePnl total;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&total] {
            for (int j = 0; j < 500; ++j) total.add(0.25);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_NEAR(total.total(), 1000.0, 1e-6);
    EXPECT_NEAR(TARB_METRIC_GAUGE("cumulative_pnl").value(), total.total(), 1e-9);
}
