#include "sec_subledger/services/trade_gl_control.h"

#include <string>
#include <unordered_map>
#include <utility>

#include "sec_subledger/core/amount_rounding.h"

namespace sec_subledger {
namespace {

struct DealTotals {
    double asset_debit{0.0};
    double asset_credit{0.0};
    double cash_debit{0.0};
    double cash_credit{0.0};
    double pnl_signed{0.0};
};

}  // namespace

TradeGlControl::TradeGlControl(AccountCodes accounts, ControlConfig config)
    : accounts_(accounts), config_(config) {}

TradeGlControlResult TradeGlControl::Build(const std::vector<Trade>& trades,
                                           const std::vector<GlPosting>& trade_postings) const {
    std::unordered_map<std::string, DealTotals> purchases;
    std::unordered_map<std::string, DealTotals> sales;
    for (const auto& posting : trade_postings) {
        if (!posting.deal_id.has_value()) {
            continue;
        }
        const bool debit = posting.dr_cr == DebitCredit::kDebit;
        if (posting.posting_type == PostingType::kPurchase) {
            auto& totals = purchases[*posting.deal_id];
            if (posting.account_code == accounts_.security_asset && debit) {
                totals.asset_debit += posting.amount;
            } else if (posting.account_code == accounts_.cash && !debit) {
                totals.cash_credit += posting.amount;
            }
            continue;
        }
        if (posting.posting_type != PostingType::kSale &&
            posting.posting_type != PostingType::kSalePnl) {
            continue;
        }
        auto& totals = sales[*posting.deal_id];
        if (posting.account_code == accounts_.cash && debit) {
            totals.cash_debit += posting.amount;
        } else if (posting.account_code == accounts_.security_asset && !debit) {
            totals.asset_credit += posting.amount;
        } else if (posting.account_code == accounts_.realized_pnl) {
            totals.pnl_signed += debit ? -posting.amount : posting.amount;
        }
    }

    const auto round = [this](double value) {
        return AmountRounding::Round(value, config_.difference_scale);
    };

    TradeGlControlResult result;
    for (const auto& trade : trades) {
        const double notional = trade.notional();
        if (trade.side == TradeSide::kBuy) {
            BuyTradeControlRecord record;
            record.trade = trade;
            record.trade_notional = notional;
            const auto it = purchases.find(trade.trade_id);
            if (it != purchases.end()) {
                record.gl_asset = it->second.asset_debit;
                record.gl_cash = it->second.cash_credit;
            }
            record.diff_asset = round(record.gl_asset - notional);
            record.diff_cash = round(record.gl_cash - notional);
            record.is_break = AmountRounding::IsBreak(record.diff_asset, config_.tolerance) ||
                              AmountRounding::IsBreak(record.diff_cash, config_.tolerance);
            result.buys.push_back(std::move(record));
            continue;
        }

        SellTradeControlRecord record;
        record.trade = trade;
        record.trade_notional = notional;
        const auto it = sales.find(trade.trade_id);
        if (it != sales.end()) {
            record.gl_cash = it->second.cash_debit;
            record.gl_asset = it->second.asset_credit;
            record.gl_pnl = it->second.pnl_signed;
        }
        record.diff_cash = round(record.gl_cash - notional);
        record.balance_check = round(record.gl_cash - (record.gl_asset + record.gl_pnl));
        record.is_break = AmountRounding::IsBreak(record.diff_cash, config_.tolerance) ||
                          AmountRounding::IsBreak(record.balance_check, config_.tolerance);
        result.sells.push_back(std::move(record));
    }
    return result;
}

}  // namespace sec_subledger
