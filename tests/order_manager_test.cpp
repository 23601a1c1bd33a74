#include <gtest/gtest.h>
#include "../src/core/order_manager.hpp"
#include "test_fakes.hpp"

using namespace intraday;
using namespace intraday::fakes;

namespace {

class OrderManagerTest : public ::testing::Test {
protected:
    OrderManagerTest()
        : clock(CalendarConfig{}, SessionConfig{}),
          schedule({window_config("alpha", hms(9, 0), hms(9, 30)),
                    window_config("beta", hms(10, 0), hms(14, 0))},
                   SessionConfig{}) {
        config.slippage_buffer = 0.07;
        broker = std::make_shared<FakeBroker>();
        broker->quotes = {{"AAA", 2200.0}, {"BBB", 2200.0}};
        notifier = std::make_shared<RecordingNotifier>();
        portfolio.load_snapshot(1000000.0, {});
    }

    std::unique_ptr<OrderManager> make(std::unique_ptr<SizingPolicy> sizing = nullptr) {
        return std::make_unique<OrderManager>(config, clock, schedule, portfolio, broker, notifier,
                                              std::move(sizing));
    }

    const Timestamp at_open = kst(2025, 7, 1, 9, 5);

    OrderConfig config;
    MarketClock clock;
    StrategySchedule schedule;
    Portfolio portfolio;
    std::shared_ptr<FakeBroker> broker;
    std::shared_ptr<RecordingNotifier> notifier;
};

} // namespace

TEST_F(OrderManagerTest, AcceptedBuyIsRegistered) {
    auto om = make();
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 10), at_open);

    ASSERT_TRUE(result.accepted());
    ASSERT_TRUE(result.order.has_value());
    EXPECT_EQ(result.order->order_id, "F1");
    EXPECT_DOUBLE_EQ(result.order->estimated_price, 2200.0 * 1.07);
    EXPECT_EQ(result.order->submitted_at, at_open);
    EXPECT_FALSE(result.order->client_order_id.empty());

    EXPECT_TRUE(portfolio.find_order("F1").has_value());
    ASSERT_EQ(broker->accepted.size(), 1u);
    EXPECT_EQ(broker->accepted[0].quantity, 10);
    EXPECT_EQ(broker->accepted[0].client_order_id, result.order->client_order_id);
    EXPECT_EQ(om->submitted_count(), 1u);
    EXPECT_EQ(notifier->count_title("Order submitted"), 1u);
}

TEST_F(OrderManagerTest, InsufficientFundsIncludesSlippageBuffer) {
    portfolio.load_snapshot(100000.0, {});
    auto om = make();
    // 50 x 2200 = 110000 before the buffer, 117700 after.
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 50), at_open);

    EXPECT_EQ(result.reason, RejectReason::INSUFFICIENT_FUNDS);
    EXPECT_FALSE(result.order.has_value());
    EXPECT_EQ(broker->place_calls, 0);
    EXPECT_EQ(portfolio.open_order_count(), 0u);
    EXPECT_EQ(om->rejected_count(), 1u);
    EXPECT_EQ(notifier->count_title("Order rejected: InsufficientFunds"), 1u);
}

TEST_F(OrderManagerTest, PendingBuysCommitCash) {
    portfolio.load_snapshot(100000.0, {});
    auto om = make();
    ASSERT_TRUE(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 30), at_open).accepted());

    // 30 x 2354 = 70620 is committed; 20 more needs 47080 of the remaining 29380.
    auto second = om->submit(make_signal("alpha", "BBB", OrderSide::BUY, 20), at_open);
    EXPECT_EQ(second.reason, RejectReason::INSUFFICIENT_FUNDS);
    EXPECT_TRUE(om->submit(make_signal("alpha", "BBB", OrderSide::BUY, 10), at_open).accepted());
}

TEST_F(OrderManagerTest, SellWithoutPositionRejected) {
    auto om = make();
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::SELL, 5), at_open);
    EXPECT_EQ(result.reason, RejectReason::NO_POSITION);
    EXPECT_EQ(broker->place_calls, 0);
}

TEST_F(OrderManagerTest, SellIsCappedToSellable) {
    portfolio.load_snapshot(1000000.0, {{"AAA", 10, 2000.0}});
    auto om = make();
    auto result = om->submit(make_signal(kLiquidationStrategyId, "AAA", OrderSide::SELL, 25), at_open);
    ASSERT_TRUE(result.accepted());
    EXPECT_EQ(result.order->signal.quantity, 10);
    EXPECT_EQ(broker->accepted.at(0).quantity, 10);

    // Everything held is already committed to the open sell.
    auto again = om->submit(make_signal("alpha", "AAA", OrderSide::SELL, 1), at_open);
    EXPECT_EQ(again.reason, RejectReason::NO_POSITION);
}

TEST_F(OrderManagerTest, OpenOrderBlocksDuplicate) {
    auto om = make();
    ASSERT_TRUE(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open).accepted());
    auto dup = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open + std::chrono::seconds(90));
    EXPECT_EQ(dup.reason, RejectReason::DUPLICATE_ORDER);
    EXPECT_EQ(broker->place_calls, 1);
}

TEST_F(OrderManagerTest, CooldownBlocksRepeatedSignal) {
    auto om = make();
    auto first = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open);
    ASSERT_TRUE(first.accepted());
    portfolio.close_order(first.order->order_id, OrderStatus::CANCELLED);

    auto soon = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open + std::chrono::seconds(30));
    EXPECT_EQ(soon.reason, RejectReason::DUPLICATE_ORDER);

    auto later = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open + std::chrono::seconds(61));
    EXPECT_TRUE(later.accepted());
}

TEST_F(OrderManagerTest, TimeGateFollowsWindowsAndSession) {
    auto om = make();
    // Past alpha's liquidation deadline (09:29).
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), kst(2025, 7, 1, 9, 29, 30)).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    // Pre-market.
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), kst(2025, 7, 1, 8, 55)).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    // Weekend.
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), kst(2025, 7, 5, 9, 5)).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    // No such strategy.
    EXPECT_EQ(om->submit(make_signal("gamma", "AAA", OrderSide::BUY, 1), at_open).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    // beta's window has not opened yet.
    EXPECT_EQ(om->submit(make_signal("beta", "AAA", OrderSide::BUY, 1), at_open).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    EXPECT_EQ(broker->place_calls, 0);
}

TEST_F(OrderManagerTest, LiquidationIgnoresWindowsButNotSession) {
    portfolio.load_snapshot(1000000.0, {{"AAA", 10, 2000.0}});
    auto om = make();
    EXPECT_EQ(om->submit(make_signal(kLiquidationStrategyId, "AAA", OrderSide::SELL, 10), kst(2025, 7, 1, 8, 55)).reason,
              RejectReason::OUTSIDE_TRADING_WINDOW);
    EXPECT_TRUE(om->submit(make_signal(kLiquidationStrategyId, "AAA", OrderSide::SELL, 10),
                           kst(2025, 7, 1, 15, 25)).accepted());
}

TEST_F(OrderManagerTest, KellySizingCapsQuantity) {
    auto om = make(std::make_unique<KellySizing>(0.6, 0.02, 0.02, 0.5));   // 10% of available cash
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 100), at_open);
    ASSERT_TRUE(result.accepted());
    EXPECT_EQ(result.order->signal.quantity, 42);   // floor(100000 / 2354)
}

TEST_F(OrderManagerTest, SizeZeroWhenPolicyAllowsNothing) {
    auto om = make(std::make_unique<KellySizing>(0.3, 0.03, 0.02, 0.5));
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 10), at_open);
    EXPECT_EQ(result.reason, RejectReason::SIZE_ZERO);
    EXPECT_EQ(broker->place_calls, 0);
}

TEST_F(OrderManagerTest, BrokerRejectionReleasesSlot) {
    broker->place_failures = {FakeBroker::Failure::PERMANENT};
    auto om = make();
    auto failed = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open);
    EXPECT_EQ(failed.reason, RejectReason::SUBMISSION_FAILED);
    EXPECT_EQ(notifier->count(Severity::ERROR), 1u);
    EXPECT_EQ(portfolio.open_order_count(), 0u);

    EXPECT_TRUE(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open).accepted());
}

TEST_F(OrderManagerTest, TransientSubmitFailureIsReported) {
    broker->place_failures = {FakeBroker::Failure::TRANSIENT};
    auto om = make();
    auto result = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open);
    EXPECT_EQ(result.reason, RejectReason::SUBMISSION_FAILED);
    EXPECT_EQ(portfolio.open_order_count(), 0u);
}

TEST_F(OrderManagerTest, UnexpectedBrokerErrorReleasesSlot) {
    broker->place_failures = {FakeBroker::Failure::UNEXPECTED};
    auto om = make();
    auto failed = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open);
    EXPECT_EQ(failed.reason, RejectReason::SUBMISSION_FAILED);
    EXPECT_NE(failed.detail.find("socket reset"), std::string::npos);
    EXPECT_EQ(portfolio.open_order_count(), 0u);

    auto retry = om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open + std::chrono::minutes(5));
    EXPECT_TRUE(retry.accepted());
}

TEST_F(OrderManagerTest, MissingQuoteIsPriceUnavailable) {
    auto om = make();
    EXPECT_EQ(om->submit(make_signal("alpha", "ZZZ", OrderSide::BUY, 1), at_open).reason,
              RejectReason::PRICE_UNAVAILABLE);
}

TEST_F(OrderManagerTest, LimitBuyUsesLimitPrice) {
    auto om = make();
    auto signal = make_signal("alpha", "ZZZ", OrderSide::BUY, 10);
    signal.type = OrderType::LIMIT;
    signal.limit_price = 1000.0;
    auto result = om->submit(signal, at_open);
    ASSERT_TRUE(result.accepted());
    EXPECT_DOUBLE_EQ(result.order->estimated_price, 1070.0);
    EXPECT_EQ(broker->quote_calls, 0);
}

TEST_F(OrderManagerTest, MalformedSignalsRejected) {
    auto om = make();
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 0), at_open).reason,
              RejectReason::INVALID_SIGNAL);
    EXPECT_EQ(om->submit(make_signal("alpha", "", OrderSide::BUY, 1), at_open).reason,
              RejectReason::INVALID_SIGNAL);
    auto limit = make_signal("alpha", "AAA", OrderSide::BUY, 1);
    limit.type = OrderType::LIMIT;
    EXPECT_EQ(om->submit(limit, at_open).reason, RejectReason::INVALID_SIGNAL);
}

TEST_F(OrderManagerTest, HaltedManagerRejectsEverything) {
    auto om = make();
    om->halt();
    EXPECT_TRUE(om->halted());
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open).reason, RejectReason::HALTED);
    EXPECT_EQ(broker->place_calls, 0);
}

TEST_F(OrderManagerTest, PositionLimitCountsHeldAndPendingSymbols) {
    config.max_open_positions = 1;
    portfolio.load_snapshot(1000000.0, {{"BBB", 5, 2000.0}});
    auto om = make();
    EXPECT_EQ(om->submit(make_signal("alpha", "AAA", OrderSide::BUY, 1), at_open).reason,
              RejectReason::POSITION_LIMIT);
    EXPECT_TRUE(om->submit(make_signal("alpha", "BBB", OrderSide::BUY, 1), at_open).accepted());
}

TEST(RejectReasonTest, Names) {
    EXPECT_STREQ(to_string(RejectReason::INSUFFICIENT_FUNDS), "InsufficientFunds");
    EXPECT_STREQ(to_string(RejectReason::OUTSIDE_TRADING_WINDOW), "OutsideTradingWindow");
    EXPECT_STREQ(to_string(RejectReason::DUPLICATE_ORDER), "DuplicateOrder");
}
