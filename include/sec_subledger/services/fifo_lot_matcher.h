#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Quantities at or below this are treated as zero when closing lots and
// detecting oversells.
constexpr double kLotQuantityEpsilon = 1e-9;

struct MatchedTrade {
    Trade trade;
    double remaining_quantity{0.0};
};

struct LotMatchResult {
    // Sorted by (trade_date, trade_id); sells always carry 0 remaining.
    std::vector<MatchedTrade> trades;
    std::vector<OversellRecord> oversells;
    double total_bought{0.0};
    double total_matched{0.0};
};

class FifoLotMatcher {
public:
    explicit FifoLotMatcher(OversellPolicy oversell_policy = OversellPolicy::kReport);

    // All trades must share one group key. Buys seed the lot queue in
    // (trade_date, trade_id) order, then sells consume the oldest open lot
    // first in that same order.
    bool MatchGroup(const std::vector<Trade>& group_trades,
                    LotMatchResult* result,
                    std::string* error) const;

    OversellPolicy oversell_policy() const { return oversell_policy_; }

private:
    OversellPolicy oversell_policy_{OversellPolicy::kReport};
};

// Sorts by (trade_date, trade_id) with a stable sort so equal keys keep input order.
void SortByTradeDateAndId(std::vector<Trade>* trades);

}  // namespace sec_subledger
