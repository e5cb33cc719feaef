#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sec_subledger/services/average_cost_gl_poster.h"
#include "sec_subledger/services/ledger_aggregator.h"
#include "sec_subledger/services/ledger_controls.h"

namespace sec_subledger {
namespace {

GlPosting MakePosting(const std::string& date,
                      AccountCode account,
                      DebitCredit dr_cr,
                      double amount,
                      const std::string& currency = "GBP") {
    GlPosting posting;
    posting.posting_date = date;
    posting.deal_id = "T1";
    posting.customer_id = "CIF001";
    posting.instrument_id = "GB1";
    posting.currency = currency;
    posting.account_code = account;
    posting.dr_cr = dr_cr;
    posting.amount = amount;
    return posting;
}

Trade MakeTrade(const std::string& id, const std::string& date, TradeSide side, double qty,
                double price) {
    Trade trade;
    trade.trade_id = id;
    trade.customer_id = "CIF001";
    trade.instrument_id = "GB1";
    trade.currency = "GBP";
    trade.trade_date = date;
    trade.side = side;
    trade.quantity = qty;
    trade.price = price;
    return trade;
}

}  // namespace

TEST(LedgerAggregatorTest, RunsSignedBalancePerAccountAndCurrency) {
    const std::vector<GlPosting> postings = {
        MakePosting("2025-01-03", 200100, DebitCredit::kCredit, 40.0),
        MakePosting("2025-01-02", 200100, DebitCredit::kDebit, 100.0),
        MakePosting("2025-01-02", 200100, DebitCredit::kDebit, 5.0),
        MakePosting("2025-01-02", 100000, DebitCredit::kCredit, 105.0),
        MakePosting("2025-01-02", 200100, DebitCredit::kDebit, 7.0, "USD"),
    };
    const auto balances = AggregateThinLedger(postings);
    ASSERT_EQ(balances.size(), 4U);

    EXPECT_EQ(balances[0].account_code, 100000);
    EXPECT_DOUBLE_EQ(balances[0].balance, -105.0);

    EXPECT_EQ(balances[1].account_code, 200100);
    EXPECT_EQ(balances[1].currency, "GBP");
    EXPECT_EQ(balances[1].posting_date, "2025-01-02");
    EXPECT_DOUBLE_EQ(balances[1].day_change, 105.0);
    EXPECT_DOUBLE_EQ(balances[1].balance, 105.0);
    EXPECT_EQ(balances[2].posting_date, "2025-01-03");
    EXPECT_DOUBLE_EQ(balances[2].day_change, -40.0);
    EXPECT_DOUBLE_EQ(balances[2].balance, 65.0);

    // A new currency restarts the running balance.
    EXPECT_EQ(balances[3].currency, "USD");
    EXPECT_DOUBLE_EQ(balances[3].balance, 7.0);
}

TEST(LedgerControlsTest, RebuiltLedgerReconcilesAgainstItself) {
    const AccountCodes accounts;
    const auto postings = AverageCostGlPoster(accounts, CostBasisPolicy::kPreserve)
                              .PostGroup({
                                  MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 100.0, 10.0),
                                  MakeTrade("T2", "2025-01-03", TradeSide::kSell, 40.0, 12.5),
                              })
                              .postings;
    const auto rebuilt = AggregateThinLedger(postings);

    std::vector<ThinLedgerBalance> thin;
    for (const auto& row : rebuilt) {
        thin.push_back(ThinLedgerBalance{row.posting_date, row.account_code, row.currency,
                                         row.balance});
    }
    const LedgerControls controls;
    const auto records = controls.BuildThinLedgerControl(thin, rebuilt);
    ASSERT_EQ(records.size(), rebuilt.size());
    for (const auto& record : records) {
        EXPECT_DOUBLE_EQ(record.difference, 0.0);
        EXPECT_FALSE(record.is_break);
    }

    const auto daily = controls.BuildJournalDailyTotals(postings);
    ASSERT_EQ(daily.size(), 2U);
    for (const auto& total : daily) {
        EXPECT_DOUBLE_EQ(total.net_debit_minus_credit, 0.0) << total.posting_date;
        EXPECT_FALSE(total.is_break);
    }
    EXPECT_DOUBLE_EQ(daily[0].total_debit, 1000.0);
    EXPECT_DOUBLE_EQ(daily[1].total_debit, 500.0);
}

TEST(LedgerControlsTest, UsesBalanceAsOfDateAndZeroForUnknownAccounts) {
    const std::vector<GlPosting> postings = {
        MakePosting("2025-01-02", 200100, DebitCredit::kDebit, 100.0),
        MakePosting("2025-01-06", 200100, DebitCredit::kCredit, 30.0),
    };
    const auto rebuilt = AggregateThinLedger(postings);
    const std::vector<ThinLedgerBalance> thin = {
        {"2025-01-06", 200100, "GBP", 70.0},
        {"2025-01-03", 200100, "GBP", 100.0},
        {"2025-01-01", 200100, "GBP", 0.0},
        {"2025-01-03", 999999, "GBP", 12.0},
    };
    const auto records = LedgerControls().BuildThinLedgerControl(thin, rebuilt);
    ASSERT_EQ(records.size(), 4U);
    EXPECT_EQ(records[0].posting_date, "2025-01-01");
    EXPECT_DOUBLE_EQ(records[0].balance_from_journals, 0.0);
    EXPECT_FALSE(records[0].is_break);
    EXPECT_EQ(records[1].account_code, 200100);
    EXPECT_DOUBLE_EQ(records[1].balance_from_journals, 100.0);
    EXPECT_FALSE(records[1].is_break);
    EXPECT_EQ(records[2].account_code, 999999);
    EXPECT_DOUBLE_EQ(records[2].difference, 12.0);
    EXPECT_TRUE(records[2].is_break);
    EXPECT_DOUBLE_EQ(records[3].balance_from_journals, 70.0);
    EXPECT_FALSE(records[3].is_break);
}

TEST(LedgerControlsTest, UnbalancedDayIsABreak) {
    const std::vector<GlPosting> postings = {
        MakePosting("2025-01-02", 200100, DebitCredit::kDebit, 100.0),
        MakePosting("2025-01-02", 100000, DebitCredit::kCredit, 90.0),
    };
    const auto daily = LedgerControls().BuildJournalDailyTotals(postings);
    ASSERT_EQ(daily.size(), 1U);
    EXPECT_DOUBLE_EQ(daily[0].net_debit_minus_credit, 10.0);
    EXPECT_TRUE(daily[0].is_break);
}

}  // namespace sec_subledger
