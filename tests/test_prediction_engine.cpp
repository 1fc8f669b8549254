#include <gtest/gtest.h>
#include <memory>
#include "paperdesk/ledger_store.hpp"
#include "paperdesk/prediction_engine.hpp"

using paperdesk::ErrorCode;

class PredictionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<paperdesk::PredictionEngine>();
        store_.seed_defaults();

        paperdesk::PredictionMarket market;
        market.market_id = "m-test";
        market.question = "Test market";
        market.outcomes = {{"YES", 0.4}, {"NO", 0.6}};
        store_.upsert_market(market);

        alpha_ = store_.create_account("alpha", 2000.0).value().account_id;
        beta_ = store_.create_account("beta", 2000.0).value().account_id;
    }

    void TearDown() override {
        engine_.reset();
    }

    paperdesk::Result<paperdesk::Bet> bet(const std::string& account_id, const std::string& market_id,
                                          const std::string& outcome, double amount) {
        return engine_->place_bet(*store_.find_account(account_id), store_.find_market(market_id), outcome, amount);
    }

    paperdesk::Account& account(const std::string& id) { return *store_.find_account(id); }

    std::unique_ptr<paperdesk::PredictionEngine> engine_;
    paperdesk::LedgerStore store_;
    std::string alpha_;
    std::string beta_;
};

TEST_F(PredictionEngineTest, BetBuysSharesAtCurrentOdds) {
    auto placed = bet(alpha_, "poly-us-recession-2026", "YES", 42.0);
    ASSERT_TRUE(placed.ok());
    EXPECT_DOUBLE_EQ(placed->odds, 0.42);
    EXPECT_NEAR(placed->shares, 100.0, 1e-9);

    EXPECT_DOUBLE_EQ(account(alpha_).cash, 1958.0);
    EXPECT_NEAR(account(alpha_).poly.shares("poly-us-recession-2026", "YES"), 100.0, 1e-9);
}

TEST_F(PredictionEngineTest, RepeatedBetsAccumulateSharesAndCost) {
    ASSERT_TRUE(bet(alpha_, "m-test", "yes", 4.0).ok());
    ASSERT_TRUE(bet(alpha_, "m-test", " Yes ", 2.0).ok());

    const auto* outcomes = account(alpha_).poly.find("m-test");
    ASSERT_NE(outcomes, nullptr);
    auto holding = outcomes->find("YES");
    ASSERT_NE(holding, outcomes->end());
    EXPECT_NEAR(holding->second.shares, 15.0, 1e-9);
    EXPECT_DOUBLE_EQ(holding->second.cost_basis, 6.0);
}

TEST_F(PredictionEngineTest, BetValidation) {
    EXPECT_EQ(bet(alpha_, "missing", "YES", 10.0).error(), ErrorCode::MarketNotFound);
    EXPECT_EQ(bet(alpha_, "m-test", "MAYBE", 10.0).error(), ErrorCode::InvalidOutcome);
    EXPECT_EQ(bet(alpha_, "m-test", "YES", 0.0).error(), ErrorCode::InvalidAmount);
    EXPECT_EQ(bet(alpha_, "m-test", "YES", 2500.0).error(), ErrorCode::InsufficientCash);
    EXPECT_DOUBLE_EQ(account(alpha_).cash, 2000.0);
    EXPECT_TRUE(account(alpha_).poly.empty());
}

TEST_F(PredictionEngineTest, NonPositiveOddsRejected) {
    paperdesk::PredictionMarket market;
    market.market_id = "m-zero";
    market.outcomes = {{"YES", 0.0}, {"NO", 1.0}};
    store_.upsert_market(market);

    auto placed = bet(alpha_, "m-zero", "YES", 5.0);
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.error(), ErrorCode::InvalidOdds);
}

TEST_F(PredictionEngineTest, ResolutionPaysWinnersAndClearsBooks) {
    ASSERT_TRUE(bet(alpha_, "m-test", "YES", 4.0).ok());
    ASSERT_TRUE(bet(beta_, "m-test", "NO", 6.0).ok());

    auto resolution = engine_->resolve_market(store_, "m-test", "YES");
    ASSERT_TRUE(resolution.ok());
    ASSERT_EQ(resolution->payouts.size(), 1u);
    EXPECT_EQ(resolution->payouts[0].account_id, alpha_);
    EXPECT_NEAR(resolution->payouts[0].payout, 10.0, 1e-9);

    EXPECT_NEAR(account(alpha_).cash, 2006.0, 1e-9);
    EXPECT_NEAR(account(alpha_).poly_realized_pnl, 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(account(beta_).cash, 1994.0);
    EXPECT_EQ(account(alpha_).poly.find("m-test"), nullptr);
    EXPECT_EQ(account(beta_).poly.find("m-test"), nullptr);

    const auto* market = store_.find_market("m-test");
    ASSERT_NE(market, nullptr);
    EXPECT_TRUE(market->resolved);
    EXPECT_EQ(market->winning_outcome, "YES");
}

TEST_F(PredictionEngineTest, ResolutionIsExactlyOnce) {
    ASSERT_TRUE(bet(alpha_, "m-test", "YES", 4.0).ok());
    ASSERT_TRUE(bet(beta_, "m-test", "NO", 6.0).ok());
    ASSERT_TRUE(engine_->resolve_market(store_, "m-test", "YES").ok());

    auto again = engine_->resolve_market(store_, "m-test", "NO");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error(), ErrorCode::AlreadyResolved);
    EXPECT_EQ(engine_->resolve_market(store_, "m-test", "YES").error(), ErrorCode::AlreadyResolved);

    EXPECT_NEAR(account(alpha_).cash, 2006.0, 1e-9);
    EXPECT_DOUBLE_EQ(account(beta_).cash, 1994.0);
    EXPECT_EQ(store_.find_market("m-test")->winning_outcome, "YES");
}

TEST_F(PredictionEngineTest, ResolutionValidation) {
    EXPECT_EQ(engine_->resolve_market(store_, "missing", "YES").error(), ErrorCode::MarketNotFound);
    EXPECT_EQ(engine_->resolve_market(store_, "m-test", "MAYBE").error(), ErrorCode::InvalidWinningOutcome);
    EXPECT_FALSE(store_.find_market("m-test")->resolved);
}

TEST_F(PredictionEngineTest, ResolvedMarketRejectsBets) {
    ASSERT_TRUE(engine_->resolve_market(store_, "m-test", "no").ok());
    auto placed = bet(alpha_, "m-test", "YES", 1.0);
    ASSERT_FALSE(placed.ok());
    EXPECT_EQ(placed.error(), ErrorCode::MarketAlreadyResolved);
}

TEST_F(PredictionEngineTest, FeedRefreshNeverTouchesResolvedMarket) {
    ASSERT_TRUE(engine_->resolve_market(store_, "m-test", "YES").ok());

    paperdesk::PredictionMarket incoming;
    incoming.market_id = "m-test";
    incoming.question = "Reworded";
    incoming.outcomes = {{"YES", 0.9}, {"NO", 0.1}};
    EXPECT_FALSE(store_.upsert_market(incoming));

    const auto* market = store_.find_market("m-test");
    EXPECT_EQ(market->question, "Test market");
    EXPECT_DOUBLE_EQ(market->outcomes.at("YES"), 0.4);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
