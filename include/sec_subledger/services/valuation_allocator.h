#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Spreads a position-level valuation across the group's open trades pro-rata
// by open notional (remaining_quantity * price).
//
// kSingleDate joins on the group key only; after filtering the feed to
// valuation_as_of_date (when set) a group may have at most one row.
// kTimeSeries joins on the group key and yields one row per (open trade,
// snapshot date); each (group, snapshot date) is allocated independently.
//
// A group without a valuation row keeps valuation_amount empty and allocates
// 0. A group whose open notional sums to 0 allocates 0 to every member.
class ValuationAllocator {
public:
    explicit ValuationAllocator(ValuationJoinMode mode = ValuationJoinMode::kSingleDate);

    bool Allocate(const std::vector<OpenTrade>& open_trades,
                  const std::vector<ValuationSnapshot>& valuations,
                  const std::string& valuation_as_of_date,
                  std::vector<AllocatedTrade>* out,
                  std::string* error) const;

    ValuationJoinMode mode() const { return mode_; }

private:
    ValuationJoinMode mode_{ValuationJoinMode::kSingleDate};
};

}  // namespace sec_subledger
