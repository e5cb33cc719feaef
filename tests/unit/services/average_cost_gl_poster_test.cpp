#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "sec_subledger/services/average_cost_gl_poster.h"
#include "sec_subledger/services/trade_gl_control.h"

namespace sec_subledger {
namespace {

Trade MakeTrade(const std::string& id,
                const std::string& date,
                TradeSide side,
                double quantity,
                double price) {
    Trade trade;
    trade.trade_id = id;
    trade.customer_id = "CIF001";
    trade.instrument_id = "GB1";
    trade.currency = "GBP";
    trade.trade_date = date;
    trade.side = side;
    trade.quantity = quantity;
    trade.price = price;
    return trade;
}

std::vector<GlPosting> PostingsFor(const TradePostingResult& result, const std::string& deal_id) {
    std::vector<GlPosting> out;
    for (const auto& posting : result.postings) {
        if (posting.deal_id.value_or("") == deal_id) {
            out.push_back(posting);
        }
    }
    return out;
}

const GlPosting* FindPosting(const std::vector<GlPosting>& postings, PostingType type,
                             AccountCode account) {
    for (const auto& posting : postings) {
        if (posting.posting_type == type && posting.account_code == account) {
            return &posting;
        }
    }
    return nullptr;
}

}  // namespace

TEST(AverageCostGlPosterTest, SellRelievesAverageCostAndBooksGain) {
    const AccountCodes accounts;
    const AverageCostGlPoster poster(accounts, CostBasisPolicy::kPreserve);
    const auto result = poster.PostGroup({
        MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 100.0, 10.0),
        MakeTrade("T2", "2025-01-03", TradeSide::kBuy, 100.0, 20.0),
        MakeTrade("T3", "2025-01-04", TradeSide::kSell, 100.0, 18.0),
    });

    const auto buy = PostingsFor(result, "T1");
    ASSERT_EQ(buy.size(), 2U);
    const auto* asset_dr = FindPosting(buy, PostingType::kPurchase, accounts.security_asset);
    const auto* cash_cr = FindPosting(buy, PostingType::kPurchase, accounts.cash);
    ASSERT_NE(asset_dr, nullptr);
    ASSERT_NE(cash_cr, nullptr);
    EXPECT_EQ(asset_dr->dr_cr, DebitCredit::kDebit);
    EXPECT_EQ(cash_cr->dr_cr, DebitCredit::kCredit);
    EXPECT_DOUBLE_EQ(asset_dr->amount, 1000.0);

    const auto sell = PostingsFor(result, "T3");
    ASSERT_EQ(sell.size(), 3U);
    const auto* cash_dr = FindPosting(sell, PostingType::kSale, accounts.cash);
    const auto* asset_cr = FindPosting(sell, PostingType::kSale, accounts.security_asset);
    const auto* pnl = FindPosting(sell, PostingType::kSalePnl, accounts.realized_pnl);
    ASSERT_NE(cash_dr, nullptr);
    ASSERT_NE(asset_cr, nullptr);
    ASSERT_NE(pnl, nullptr);
    EXPECT_DOUBLE_EQ(cash_dr->amount, 1800.0);
    EXPECT_EQ(cash_dr->dr_cr, DebitCredit::kDebit);
    EXPECT_DOUBLE_EQ(asset_cr->amount, 1500.0);
    EXPECT_EQ(asset_cr->dr_cr, DebitCredit::kCredit);
    EXPECT_DOUBLE_EQ(pnl->amount, 300.0);
    EXPECT_EQ(pnl->dr_cr, DebitCredit::kCredit);

    EXPECT_DOUBLE_EQ(result.closing_position.quantity, 100.0);
    EXPECT_DOUBLE_EQ(result.closing_position.cost_basis, 1500.0);
    EXPECT_TRUE(result.degenerate_sales.empty());
}

TEST(AverageCostGlPosterTest, LossIsDebitedAndEveryDealBalances) {
    const AccountCodes accounts;
    const AverageCostGlPoster poster(accounts, CostBasisPolicy::kPreserve);
    const auto result = poster.PostAll({
        MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 30.0, 10.0),
        MakeTrade("T2", "2025-01-03", TradeSide::kBuy, 70.0, 13.0),
        MakeTrade("T3", "2025-01-04", TradeSide::kSell, 40.0, 9.5),
        MakeTrade("T4", "2025-01-05", TradeSide::kSell, 60.0, 14.25),
    });

    const auto loss = PostingsFor(result, "T3");
    const auto* pnl = FindPosting(loss, PostingType::kSalePnl, accounts.realized_pnl);
    ASSERT_NE(pnl, nullptr);
    EXPECT_EQ(pnl->dr_cr, DebitCredit::kDebit);
    EXPECT_NEAR(pnl->amount, 40.0 * 12.1 - 380.0, 1e-9);

    std::map<std::string, double> net_by_deal;
    for (const auto& posting : result.postings) {
        ASSERT_TRUE(posting.deal_id.has_value());
        EXPECT_GE(posting.amount, 0.0);
        net_by_deal[*posting.deal_id] += posting.signed_amount();
    }
    ASSERT_EQ(net_by_deal.size(), 4U);
    for (const auto& [deal_id, net] : net_by_deal) {
        EXPECT_NEAR(net, 0.0, 1e-9) << deal_id;
    }

    const auto control = TradeGlControl(accounts).Build(
        {
            MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 30.0, 10.0),
            MakeTrade("T2", "2025-01-03", TradeSide::kBuy, 70.0, 13.0),
            MakeTrade("T3", "2025-01-04", TradeSide::kSell, 40.0, 9.5),
            MakeTrade("T4", "2025-01-05", TradeSide::kSell, 60.0, 14.25),
        },
        result.postings);
    ASSERT_EQ(control.buys.size(), 2U);
    ASSERT_EQ(control.sells.size(), 2U);
    for (const auto& record : control.buys) {
        EXPECT_FALSE(record.is_break) << record.trade.trade_id;
    }
    for (const auto& record : control.sells) {
        EXPECT_FALSE(record.is_break) << record.trade.trade_id;
        EXPECT_DOUBLE_EQ(record.diff_cash, 0.0);
        EXPECT_DOUBLE_EQ(record.balance_check, 0.0);
    }
}

TEST(AverageCostGlPosterTest, SaleWithoutInventoryUsesSalePriceAndIsRecorded) {
    const AccountCodes accounts;
    const AverageCostGlPoster poster(accounts, CostBasisPolicy::kPreserve);
    const auto result = poster.PostGroup({
        MakeTrade("T1", "2025-01-02", TradeSide::kSell, 10.0, 12.0),
    });

    ASSERT_EQ(result.degenerate_sales.size(), 1U);
    EXPECT_EQ(result.degenerate_sales[0].trade_id, "T1");
    EXPECT_DOUBLE_EQ(result.degenerate_sales[0].quantity_before, 0.0);
    EXPECT_DOUBLE_EQ(result.degenerate_sales[0].fallback_price, 12.0);

    // Cost relieved at the sale price, so no P&L line.
    ASSERT_EQ(result.postings.size(), 2U);
    const auto* asset_cr = FindPosting(result.postings, PostingType::kSale, accounts.security_asset);
    ASSERT_NE(asset_cr, nullptr);
    EXPECT_DOUBLE_EQ(asset_cr->amount, 120.0);
    EXPECT_EQ(FindPosting(result.postings, PostingType::kSalePnl, accounts.realized_pnl), nullptr);
    EXPECT_DOUBLE_EQ(result.closing_position.quantity, -10.0);
    EXPECT_DOUBLE_EQ(result.closing_position.cost_basis, -120.0);
}

TEST(AverageCostGlPosterTest, ResetWhenFlatDropsResidualCostBasis) {
    const std::vector<Trade> trades = {
        MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 100.0, 10.0),
        MakeTrade("T2", "2025-01-03", TradeSide::kSell, 150.0, 10.0),
        MakeTrade("T3", "2025-01-04", TradeSide::kBuy, 100.0, 20.0),
        MakeTrade("T4", "2025-01-05", TradeSide::kSell, 50.0, 30.0),
    };
    const AccountCodes accounts;

    const auto preserved = AverageCostGlPoster(accounts, CostBasisPolicy::kPreserve).PostGroup(trades);
    EXPECT_DOUBLE_EQ(preserved.closing_position.quantity, 0.0);
    EXPECT_NEAR(preserved.closing_position.cost_basis, 0.0, 1e-9);
    EXPECT_EQ(FindPosting(PostingsFor(preserved, "T4"), PostingType::kSalePnl,
                          accounts.realized_pnl),
              nullptr);

    const auto reset =
        AverageCostGlPoster(accounts, CostBasisPolicy::kResetWhenFlat).PostGroup(trades);
    const auto t4 = PostingsFor(reset, "T4");
    const auto* asset_cr = FindPosting(t4, PostingType::kSale, accounts.security_asset);
    const auto* pnl = FindPosting(t4, PostingType::kSalePnl, accounts.realized_pnl);
    ASSERT_NE(asset_cr, nullptr);
    ASSERT_NE(pnl, nullptr);
    EXPECT_DOUBLE_EQ(asset_cr->amount, 2000.0);
    EXPECT_EQ(pnl->dr_cr, DebitCredit::kDebit);
    EXPECT_DOUBLE_EQ(pnl->amount, 500.0);
    EXPECT_DOUBLE_EQ(reset.closing_position.cost_basis, 0.0);
}

TEST(TradeGlControlTest, FlagsTradesWithMissingOrWrongJournals) {
    const AccountCodes accounts;
    const Trade buy = MakeTrade("T1", "2025-01-02", TradeSide::kBuy, 10.0, 10.0);
    const Trade sell = MakeTrade("T2", "2025-01-03", TradeSide::kSell, 5.0, 12.0);
    auto postings = AverageCostGlPoster(accounts, CostBasisPolicy::kPreserve).PostGroup({buy, sell})
                        .postings;
    // Drop the P&L line so the sale no longer balances, and mis-state the buy.
    std::vector<GlPosting> tampered;
    for (auto posting : postings) {
        if (posting.posting_type == PostingType::kSalePnl) {
            continue;
        }
        if (posting.posting_type == PostingType::kPurchase && posting.account_code == accounts.cash) {
            posting.amount = 99.0;
        }
        tampered.push_back(posting);
    }

    const Trade unposted = MakeTrade("T3", "2025-01-04", TradeSide::kBuy, 1.0, 5.0);
    const auto control = TradeGlControl(accounts).Build({buy, sell, unposted}, tampered);
    ASSERT_EQ(control.buys.size(), 2U);
    ASSERT_EQ(control.sells.size(), 1U);
    EXPECT_DOUBLE_EQ(control.buys[0].diff_asset, 0.0);
    EXPECT_DOUBLE_EQ(control.buys[0].diff_cash, -1.0);
    EXPECT_TRUE(control.buys[0].is_break);
    EXPECT_DOUBLE_EQ(control.buys[1].gl_asset, 0.0);
    EXPECT_DOUBLE_EQ(control.buys[1].diff_asset, -5.0);
    EXPECT_TRUE(control.buys[1].is_break);
    EXPECT_DOUBLE_EQ(control.sells[0].diff_cash, 0.0);
    EXPECT_DOUBLE_EQ(control.sells[0].gl_pnl, 0.0);
    EXPECT_DOUBLE_EQ(control.sells[0].balance_check, 10.0);
    EXPECT_TRUE(control.sells[0].is_break);
}

}  // namespace sec_subledger
