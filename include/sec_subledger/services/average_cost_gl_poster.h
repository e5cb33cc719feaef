#pragma once

#include <vector>

#include "sec_subledger/contracts/types.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Running weighted-average inventory for one group.
struct CostPosition {
    double quantity{0.0};
    double cost_basis{0.0};
};

struct TradePostingResult {
    std::vector<GlPosting> postings;
    std::vector<DegenerateSaleRecord> degenerate_sales;
    CostPosition closing_position;
};

// Trade settlement journals under the average-cost method:
//   BUY  : Dr security asset / Cr cash at quantity * price        (PURCHASE)
//   SELL : Dr cash proceeds / Cr security asset at average cost   (SALE)
//          plus Cr realized P&L on a gain, Dr on a loss           (SALE_PNL)
// Selling with no positive inventory values the sold units at the sale price.
class AverageCostGlPoster {
public:
    AverageCostGlPoster(AccountCodes accounts, CostBasisPolicy cost_basis_policy);

    // Trades of a single group; processed in (trade_date, trade_id) order.
    TradePostingResult PostGroup(const std::vector<Trade>& group_trades) const;

    // Every group, concatenated in (customer, instrument, date, deal id) order.
    TradePostingResult PostAll(const std::vector<Trade>& trades) const;

private:
    void ApplyBuy(const Trade& trade, CostPosition* position, TradePostingResult* result) const;
    void ApplySell(const Trade& trade, CostPosition* position, TradePostingResult* result) const;
    GlPosting MakePosting(const Trade& trade,
                          AccountCode account,
                          DebitCredit dr_cr,
                          double amount,
                          PostingType type) const;

    AccountCodes accounts_;
    CostBasisPolicy cost_basis_policy_{CostBasisPolicy::kPreserve};
};

// Stable order used for the trade journal: (customer, instrument, posting date, deal id).
void SortTradePostings(std::vector<GlPosting>* postings);

}  // namespace sec_subledger
