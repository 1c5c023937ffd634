#include <gtest/gtest.h>
#include <stdexcept>
#include "market_data/market_discovery.hpp"
#include "test_doubles.hpp"

using namespace tarb;
using namespace tarb::testing_support;

TEST(MarketDiscoveryTest, BuildSlug) {
    EXPECT_EQ(build_slug("BTC", Granularity::FIFTEEN_MIN, 1699999200), "btc-updown-15m-1699999200");
    EXPECT_EQ(build_slug("eth", Granularity::FIVE_MIN, 1699999800), "eth-updown-5m-1699999800");
}

TEST(MarketDiscoveryTest, ParseReferencePrice_AfterAbove) {
    auto p = parse_reference_price("Will BTC be above $97,250.50 at 5:15PM ET?");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(*p, 97250.50);
}

TEST(MarketDiscoveryTest, ParseReferencePrice_FirstDollarAmount) {
    auto p = parse_reference_price("XRP Up or Down: price to beat $2.1834");
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(*p, 2.1834);
}

TEST(MarketDiscoveryTest, ParseReferencePrice_None) {
    EXPECT_FALSE(parse_reference_price("Bitcoin Up or Down - November 14, 5:00PM ET").has_value());
    EXPECT_FALSE(parse_reference_price("Price $ unknown").has_value());
}

class MarketDiscoveryVenueTest : public ::testing::Test {
protected:
    void SetUp() override {
        venue_.add("btc-updown-15m-1699999200",
                   make_market("0xabc", "Bitcoin Up or Down above $37,000", "up-tok", "down-tok"));
    }

    FakeVenue venue_;
};

TEST_F(MarketDiscoveryVenueTest, FindMarket_ReturnsActiveMarket) {
    MarketDiscovery discovery(venue_);
    auto found = discovery.find_market("btc", Granularity::FIFTEEN_MIN, 1699999200);

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->condition_id, "0xabc");
    EXPECT_EQ(found->slug, "btc-updown-15m-1699999200");
    ASSERT_TRUE(found->question_reference.has_value());
    EXPECT_DOUBLE_EQ(*found->question_reference, 37000.0);
}

TEST_F(MarketDiscoveryVenueTest, FindMarket_MissingIsNullopt) {
    MarketDiscovery discovery(venue_);
    EXPECT_FALSE(discovery.find_market("btc", Granularity::FIVE_MIN, 1699999800).has_value());
    EXPECT_EQ(venue_.slug_lookups.back(), "btc-updown-5m-1699999800");
}

TEST_F(MarketDiscoveryVenueTest, FindMarket_ClosedOrInactiveIsNullopt) {
    MarketDiscovery discovery(venue_);

    venue_.by_slug["btc-updown-15m-1699999200"].closed = true;
    EXPECT_FALSE(discovery.find_market("btc", Granularity::FIFTEEN_MIN, 1699999200).has_value());

    venue_.by_slug["btc-updown-15m-1699999200"].closed = false;
    venue_.by_slug["btc-updown-15m-1699999200"].active = false;
    EXPECT_FALSE(discovery.find_market("btc", Granularity::FIFTEEN_MIN, 1699999200).has_value());
}

TEST_F(MarketDiscoveryVenueTest, FindMarket_LookupErrorIsNullopt) {
    MarketDiscovery discovery(venue_);
    venue_.fail_lookups = true;
    EXPECT_FALSE(discovery.find_market("btc", Granularity::FIFTEEN_MIN, 1699999200).has_value());
}

TEST_F(MarketDiscoveryVenueTest, OutcomeTokens_ByLabel) {
    MarketDiscovery discovery(venue_);
    auto tokens = discovery.get_outcome_tokens("0xabc");
    EXPECT_EQ(tokens.up, "up-tok");
    EXPECT_EQ(tokens.down, "down-tok");
}

TEST_F(MarketDiscoveryVenueTest, OutcomeTokens_NumericLabels) {
    Market m = make_market("0xdef", "", "one", "zero");
    m.tokens[0].outcome = "1";
    m.tokens[1].outcome = "0";
    venue_.add("x", m);

    MarketDiscovery discovery(venue_);
    auto tokens = discovery.get_outcome_tokens("0xdef");
    EXPECT_EQ(tokens.up, "one");
    EXPECT_EQ(tokens.down, "zero");
}

TEST_F(MarketDiscoveryVenueTest, OutcomeTokens_UnrecognisedLabelsThrow) {
    Market m = make_market("0xyes", "", "yes-tok", "no-tok");
    m.tokens[0].outcome = "Yes";
    m.tokens[1].outcome = "No";
    venue_.add("y", m);

    MarketDiscovery discovery(venue_);
    EXPECT_THROW(discovery.get_outcome_tokens("0xyes"), std::runtime_error);
}

TEST(MarketDiscoveryLabelTest, LabelsAreCaseInsensitive) {
    EXPECT_TRUE(MarketDiscovery::is_up_label("up"));
    EXPECT_TRUE(MarketDiscovery::is_up_label("UP"));
    EXPECT_TRUE(MarketDiscovery::is_down_label("Down"));
    EXPECT_FALSE(MarketDiscovery::is_up_label("Down"));
    EXPECT_FALSE(MarketDiscovery::is_down_label("Yes"));
}
