#include <gtest/gtest.h>
#include <fstream>
#include "../src/core/session_checkpoint.hpp"
#include "test_fakes.hpp"

using namespace intraday;
using namespace intraday::fakes;

TEST(SessionCheckpointTest, SaveAndLoad) {
    auto dir = temp_dir("checkpoint");

    SessionCheckpoint ck;
    ck.account_id = "acct";
    ck.state.reset("2025-07-01");
    ck.state.last_phase = Phase::MIDDAY;
    ck.state.phases_entered = {Phase::PRE_MARKET, Phase::OPENING, Phase::MIDDAY};
    ck.state.carryover_symbols = {"AAA"};
    ck.state.liquidation_announced = {"carryover"};
    ck.state.starting_cash = 250000.0;
    ck.state.post_market_ran = false;

    Order o;
    o.order_id = "P7";
    o.client_order_id = "cid-7";
    o.signal = make_signal("alpha", "BBB", OrderSide::BUY, 12);
    o.signal.type = OrderType::LIMIT;
    o.signal.limit_price = 99.5;
    o.submitted_at = kst(2025, 7, 1, 9, 12);
    o.filled_quantity = 4;
    o.status = OrderStatus::PARTIALLY_FILLED;
    o.estimated_price = 104.475;
    o.timeout_escalated = true;
    ck.open_orders.push_back(o);
    ck.position_owners = {{"BBB", "alpha"}, {"AAA", "carryover"}};

    save_checkpoint(ck, dir);
    EXPECT_FALSE(std::filesystem::exists(checkpoint_path(dir, "acct") + ".tmp"));

    auto loaded = load_checkpoint("acct", dir);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state.trading_date, "2025-07-01");
    EXPECT_EQ(loaded->state.last_phase, Phase::MIDDAY);
    EXPECT_EQ(loaded->state.phases_entered.size(), 3u);
    EXPECT_EQ(loaded->state.carryover_symbols.count("AAA"), 1u);
    EXPECT_EQ(loaded->state.liquidation_announced.count("carryover"), 1u);
    EXPECT_DOUBLE_EQ(loaded->state.starting_cash, 250000.0);
    EXPECT_FALSE(loaded->state.post_market_ran);
    EXPECT_GT(loaded->saved_at_ns, 0);

    ASSERT_EQ(loaded->open_orders.size(), 1u);
    const auto& lo = loaded->open_orders[0];
    EXPECT_EQ(lo.order_id, "P7");
    EXPECT_EQ(lo.client_order_id, "cid-7");
    EXPECT_EQ(lo.signal.strategy_id, "alpha");
    EXPECT_EQ(lo.signal.type, OrderType::LIMIT);
    ASSERT_TRUE(lo.signal.limit_price.has_value());
    EXPECT_DOUBLE_EQ(*lo.signal.limit_price, 99.5);
    EXPECT_EQ(lo.submitted_at, o.submitted_at);
    EXPECT_EQ(lo.filled_quantity, 4);
    EXPECT_EQ(lo.status, OrderStatus::PARTIALLY_FILLED);
    EXPECT_TRUE(lo.timeout_escalated);
    EXPECT_EQ(loaded->position_owners.at("BBB"), "alpha");
}

TEST(SessionCheckpointTest, MissingFileIsEmpty) {
    EXPECT_FALSE(load_checkpoint("nobody", temp_dir("checkpoint_missing")).has_value());
}

TEST(SessionCheckpointTest, CorruptFileStartsClean) {
    auto dir = temp_dir("checkpoint_corrupt");
    std::ofstream(checkpoint_path(dir, "acct")) << "{ not json";
    EXPECT_FALSE(load_checkpoint("acct", dir).has_value());
}

TEST(SessionCheckpointTest, ResetClearsDailyState) {
    SessionState s;
    s.reset("2025-07-01");
    s.post_market_ran = true;
    s.carryover_symbols.insert("AAA");
    s.reset("2025-07-02");
    EXPECT_EQ(s.trading_date, "2025-07-02");
    EXPECT_FALSE(s.post_market_ran);
    EXPECT_TRUE(s.carryover_symbols.empty());
    EXPECT_FALSE(s.last_phase.has_value());
}
