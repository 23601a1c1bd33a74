#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/core/retrying_broker.hpp"
#include "test_fakes.hpp"

using namespace intraday;
using namespace intraday::fakes;

namespace {

class RetryingBrokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        inner = std::make_shared<FakeBroker>();
        inner->quotes["AAA"] = 100.0;
        notifier = std::make_shared<RecordingNotifier>();
        config.escalation_threshold = 2;
    }

    std::unique_ptr<RetryingBroker> make(std::chrono::milliseconds quote_ttl = std::chrono::milliseconds(0)) {
        return std::make_unique<RetryingBroker>(inner, config, notifier, quote_ttl,
                                                [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    OrderRequest buy(const std::string& client_id) {
        OrderRequest r;
        r.client_order_id = client_id;
        r.symbol = "AAA";
        r.side = OrderSide::BUY;
        r.quantity = 10;
        return r;
    }

    std::shared_ptr<FakeBroker> inner;
    std::shared_ptr<RecordingNotifier> notifier;
    RetryConfig config;
    std::vector<std::chrono::milliseconds> sleeps;
};

} // namespace

TEST(BackoffDelayTest, ExponentialWithCap) {
    RetryPolicy p{5, 100, 2.0, 350, 0.0};
    EXPECT_EQ(backoff_delay(p, 1, 0.0).count(), 100);
    EXPECT_EQ(backoff_delay(p, 2, 0.0).count(), 200);
    EXPECT_EQ(backoff_delay(p, 3, 0.0).count(), 350);
    EXPECT_EQ(backoff_delay(p, 9, 0.0).count(), 350);
}

TEST(BackoffDelayTest, JitterScalesDelay) {
    RetryPolicy p{5, 1000, 2.0, 8000, 0.1};
    EXPECT_EQ(backoff_delay(p, 1, 1.0).count(), 1100);
    EXPECT_EQ(backoff_delay(p, 1, -1.0).count(), 900);
    EXPECT_EQ(backoff_delay(p, 1, 5.0).count(), 1100);   // clamped
}

TEST_F(RetryingBrokerTest, TransientQuoteFailureIsRetried) {
    inner->quote_failures = {true, true};
    auto broker = make();
    EXPECT_DOUBLE_EQ(broker->get_quote("AAA").price, 100.0);
    EXPECT_EQ(inner->quote_calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(notifier->sent().size(), 0u);
}

TEST_F(RetryingBrokerTest, PermanentRejectionIsNotRetried) {
    auto broker = make();
    EXPECT_THROW(broker->get_quote("ZZZ"), PermanentRejection);
    EXPECT_EQ(inner->quote_calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryingBrokerTest, ExhaustionAlertsAndEscalates) {
    config.status.max_attempts = 2;
    inner->reports["F1"] = OrderStatusReport{"F1", OrderStatus::PENDING, {}, ""};
    inner->status_failures = {true, true, true, true};
    auto broker = make();

    try {
        broker->get_order_status("F1");
        FAIL() << "expected RetryExhausted";
    } catch (const RetryExhausted& e) {
        EXPECT_EQ(e.attempts(), 2);
    }
    EXPECT_EQ(notifier->count(Severity::ERROR), 1u);
    EXPECT_EQ(notifier->count(Severity::CRITICAL), 0u);

    // RetryExhausted is still a transient failure to callers.
    EXPECT_THROW(broker->get_order_status("F1"), TransientApiFailure);
    EXPECT_EQ(broker->consecutive_exhaustions(), 2);
    EXPECT_EQ(notifier->count(Severity::CRITICAL), 1u);

    EXPECT_EQ(broker->get_order_status("F1").status, OrderStatus::PENDING);
    EXPECT_EQ(broker->consecutive_exhaustions(), 0);
}

TEST_F(RetryingBrokerTest, SubmitRetriesUntilAccepted) {
    inner->place_failures = {FakeBroker::Failure::TRANSIENT, FakeBroker::Failure::TRANSIENT};
    auto broker = make();
    auto id = broker->place_order(buy("c1"));
    EXPECT_EQ(id, "F1");
    EXPECT_EQ(inner->place_calls, 3);
    EXPECT_EQ(inner->find_calls, 2);
    EXPECT_EQ(inner->live_orders(), 1u);
}

TEST_F(RetryingBrokerTest, SubmitAcceptedDespiteLostResponseIsNotResent) {
    inner->place_failures = {FakeBroker::Failure::TRANSIENT_AFTER_ACCEPT};
    auto broker = make();
    auto id = broker->place_order(buy("c1"));
    EXPECT_EQ(id, "F1");
    EXPECT_EQ(inner->place_calls, 1);
    EXPECT_EQ(inner->live_orders(), 1u);
}

TEST_F(RetryingBrokerTest, SubmitExhaustionLeavesNoOrder) {
    inner->place_failures = {FakeBroker::Failure::TRANSIENT, FakeBroker::Failure::TRANSIENT,
                             FakeBroker::Failure::TRANSIENT};
    auto broker = make();
    EXPECT_THROW(broker->place_order(buy("c1")), RetryExhausted);
    EXPECT_EQ(inner->place_calls, config.submit.max_attempts);
    EXPECT_EQ(inner->live_orders(), 0u);
    EXPECT_EQ(notifier->count_title("Broker call failed"), 1u);
}

TEST_F(RetryingBrokerTest, SubmitAbandonedWhenLookupFails) {
    inner->place_failures = {FakeBroker::Failure::TRANSIENT};
    inner->find_failures = {true};
    auto broker = make();
    EXPECT_THROW(broker->place_order(buy("c1")), RetryExhausted);
    EXPECT_EQ(inner->place_calls, 1);
    EXPECT_EQ(inner->live_orders(), 0u);
}

TEST_F(RetryingBrokerTest, SubmitRejectionPassesThrough) {
    inner->place_failures = {FakeBroker::Failure::PERMANENT};
    auto broker = make();
    EXPECT_THROW(broker->place_order(buy("c1")), PermanentRejection);
    EXPECT_EQ(inner->place_calls, 1);
    EXPECT_EQ(inner->find_calls, 0);
}

TEST_F(RetryingBrokerTest, QuotesAreCachedWithinTtl) {
    auto broker = make(std::chrono::minutes(1));
    broker->get_quote("AAA");
    inner->quotes["AAA"] = 120.0;
    EXPECT_DOUBLE_EQ(broker->get_quote("AAA").price, 100.0);
    EXPECT_EQ(inner->quote_calls, 1);

    auto uncached = make();
    EXPECT_DOUBLE_EQ(uncached->get_quote("AAA").price, 120.0);
}

TEST_F(RetryingBrokerTest, CallsWaitForRateBudget) {
    auto now = std::chrono::steady_clock::time_point(std::chrono::seconds(1000));
    RateLimitConfig limits;
    limits.window_ms = 1000;
    limits.quote = 2;
    limits.submit = 1;
    auto limiter = make_rate_limiter(limits, [&now] { return now; });
    RetryingBroker broker(inner, config, notifier, std::chrono::milliseconds(0),
                          [&](std::chrono::milliseconds d) {
                              sleeps.push_back(d);
                              now += d;
                          },
                          limiter);

    broker.get_quote("AAA");
    broker.get_quote("AAA");
    EXPECT_TRUE(sleeps.empty());
    broker.get_quote("AAA");
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0].count(), 1000);
    EXPECT_EQ(inner->quote_calls, 3);

    // Other call classes keep their own budget.
    broker.place_order(buy("C1"));
    broker.get_cash_balance();
    EXPECT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(inner->place_calls, 1);
}
