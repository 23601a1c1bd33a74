#include <gtest/gtest.h>
#include <fstream>
#include "../src/core/end_of_day.hpp"
#include "test_fakes.hpp"

using namespace intraday;
using namespace intraday::fakes;

namespace {

Fill fill(const std::string& exec) {
    Fill f;
    f.execution_id = exec;
    f.order_id = "F1";
    f.symbol = "AAA";
    f.quantity = 1;
    f.price = 100.0;
    return f;
}

SessionSummary summary() {
    SessionSummary s;
    s.account_id = "acct";
    s.trading_date = "2025-07-01";
    s.session_start = kst(2025, 7, 1, 8, 50);
    s.generated_at = kst(2025, 7, 1, 15, 30);
    s.starting_cash = 100000.0;
    s.cash = 100500.0;
    s.equity = 100500.0;
    s.realized_pnl = 500.0;
    s.orders_submitted = 4;
    s.signals_rejected = 1;
    s.fills = {fill("E1"), fill("E2")};
    s.performance.closed_trades = 2;
    return s;
}

} // namespace

TEST(SessionReportWriterTest, WritesDailyReport) {
    SessionReportWriter writer(temp_dir("reports") + "/out");
    auto s = summary();
    writer.run(s);

    auto path = writer.report_path("2025-07-01");
    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["account_id"], "acct");
    EXPECT_EQ(j["trading_date"], "2025-07-01");
    EXPECT_DOUBLE_EQ(j["realized_pnl"].get<double>(), 500.0);
    EXPECT_EQ(j["orders_submitted"], 4);
    EXPECT_EQ(j["fills"].size(), 2u);
    EXPECT_EQ(j["performance"]["closed_trades"], 2);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST(FillAuditTaskTest, CleanWhenLedgerMatchesBroker) {
    auto broker = std::make_shared<FakeBroker>();
    broker->add_fill("F1", "E1", 1, 100.0, OrderStatus::PARTIALLY_FILLED, kst(2025, 7, 1, 9, 1));
    broker->add_fill("F1", "E2", 1, 100.0, OrderStatus::FILLED, kst(2025, 7, 1, 9, 2));
    // Yesterday's execution is outside the session.
    broker->add_fill("F0", "E0", 1, 100.0, OrderStatus::FILLED, kst(2025, 6, 30, 14, 0));
    auto notifier = std::make_shared<RecordingNotifier>();

    FillAuditTask audit(broker, notifier);
    audit.run(summary());
    EXPECT_EQ(audit.last_mismatches(), 0u);
    EXPECT_EQ(notifier->sent().size(), 0u);
}

TEST(FillAuditTaskTest, ReportsMissingAndUnknownExecutions) {
    auto broker = std::make_shared<FakeBroker>();
    broker->add_fill("F1", "E1", 1, 100.0, OrderStatus::PARTIALLY_FILLED, kst(2025, 7, 1, 9, 1));
    broker->add_fill("F1", "E3", 1, 100.0, OrderStatus::FILLED, kst(2025, 7, 1, 9, 3));
    auto notifier = std::make_shared<RecordingNotifier>();

    FillAuditTask audit(broker, notifier);
    audit.run(summary());
    EXPECT_EQ(audit.last_mismatches(), 2u);   // E3 missing, E2 unknown
    ASSERT_EQ(notifier->count_title("Fill audit mismatch"), 1u);
    auto body = notifier->sent()[0].body;
    EXPECT_NE(body.find("missing: E3"), std::string::npos);
    EXPECT_NE(body.find("unknown: E2"), std::string::npos);
}
