#include "sec_subledger/services/average_cost_gl_poster.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <tuple>
#include <utility>

#include "sec_subledger/core/group_partition.h"
#include "sec_subledger/services/fifo_lot_matcher.h"

namespace sec_subledger {

AverageCostGlPoster::AverageCostGlPoster(AccountCodes accounts, CostBasisPolicy cost_basis_policy)
    : accounts_(accounts), cost_basis_policy_(cost_basis_policy) {}

TradePostingResult AverageCostGlPoster::PostGroup(const std::vector<Trade>& group_trades) const {
    TradePostingResult result;
    std::vector<Trade> sorted = group_trades;
    SortByTradeDateAndId(&sorted);
    result.postings.reserve(sorted.size() * 3);

    CostPosition position;
    for (const auto& trade : sorted) {
        if (trade.side == TradeSide::kBuy) {
            ApplyBuy(trade, &position, &result);
        } else {
            ApplySell(trade, &position, &result);
        }
    }
    result.closing_position = position;
    return result;
}

TradePostingResult AverageCostGlPoster::PostAll(const std::vector<Trade>& trades) const {
    TradePostingResult merged;
    for (const auto& [group, group_trades] : PartitionByGroup(trades)) {
        (void)group;
        TradePostingResult result = PostGroup(group_trades);
        merged.postings.insert(merged.postings.end(),
                               std::make_move_iterator(result.postings.begin()),
                               std::make_move_iterator(result.postings.end()));
        merged.degenerate_sales.insert(merged.degenerate_sales.end(),
                                       result.degenerate_sales.begin(),
                                       result.degenerate_sales.end());
    }
    SortTradePostings(&merged.postings);
    return merged;
}

void AverageCostGlPoster::ApplyBuy(const Trade& trade,
                                   CostPosition* position,
                                   TradePostingResult* result) const {
    const double notional = trade.notional();
    position->quantity += trade.quantity;
    position->cost_basis += notional;

    result->postings.push_back(MakePosting(
        trade, accounts_.security_asset, DebitCredit::kDebit, notional, PostingType::kPurchase));
    result->postings.push_back(
        MakePosting(trade, accounts_.cash, DebitCredit::kCredit, notional, PostingType::kPurchase));
}

void AverageCostGlPoster::ApplySell(const Trade& trade,
                                    CostPosition* position,
                                    TradePostingResult* result) const {
    double avg_cost = 0.0;
    if (position->quantity <= 0.0) {
        avg_cost = trade.price;
        DegenerateSaleRecord record;
        record.group = trade.group();
        record.trade_id = trade.trade_id;
        record.trade_date = trade.trade_date;
        record.quantity_before = position->quantity;
        record.cost_basis_before = position->cost_basis;
        record.fallback_price = trade.price;
        result->degenerate_sales.push_back(std::move(record));
    } else {
        avg_cost = position->cost_basis / position->quantity;
    }

    const double cost_of_sold = avg_cost * trade.quantity;
    const double proceeds = trade.notional();
    const double pnl = proceeds - cost_of_sold;

    position->quantity -= trade.quantity;
    position->cost_basis -= cost_of_sold;
    if (cost_basis_policy_ == CostBasisPolicy::kResetWhenFlat && position->quantity <= 0.0) {
        position->cost_basis = 0.0;
    }

    result->postings.push_back(
        MakePosting(trade, accounts_.cash, DebitCredit::kDebit, proceeds, PostingType::kSale));
    result->postings.push_back(MakePosting(
        trade, accounts_.security_asset, DebitCredit::kCredit, cost_of_sold, PostingType::kSale));
    if (pnl != 0.0) {
        const DebitCredit side = pnl > 0.0 ? DebitCredit::kCredit : DebitCredit::kDebit;
        result->postings.push_back(MakePosting(
            trade, accounts_.realized_pnl, side, std::fabs(pnl), PostingType::kSalePnl));
    }
}

GlPosting AverageCostGlPoster::MakePosting(const Trade& trade,
                                           AccountCode account,
                                           DebitCredit dr_cr,
                                           double amount,
                                           PostingType type) const {
    GlPosting posting;
    posting.posting_date = trade.trade_date;
    posting.deal_id = trade.trade_id;
    posting.customer_id = trade.customer_id;
    posting.instrument_id = trade.instrument_id;
    posting.currency = trade.currency;
    posting.account_code = account;
    posting.dr_cr = dr_cr;
    posting.amount = amount;
    posting.posting_type = type;
    return posting;
}

void SortTradePostings(std::vector<GlPosting>* postings) {
    if (postings == nullptr) {
        return;
    }
    std::stable_sort(postings->begin(), postings->end(),
                     [](const GlPosting& lhs, const GlPosting& rhs) {
                         const std::string lhs_deal = lhs.deal_id.value_or("");
                         const std::string rhs_deal = rhs.deal_id.value_or("");
                         return std::tie(lhs.customer_id, lhs.instrument_id, lhs.posting_date,
                                         lhs_deal) <
                                std::tie(rhs.customer_id, rhs.instrument_id, rhs.posting_date,
                                         rhs_deal);
                     });
}

}  // namespace sec_subledger
