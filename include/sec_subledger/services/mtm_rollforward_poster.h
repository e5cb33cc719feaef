#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Carried between dates of one group's valuation series.
struct MtmRollState {
    double prev_mtm{0.0};
};

// Daily revaluation journals. On each date of a group's series the prior
// valuation is reversed (MTM_REVERSAL, amount -prev_mtm) and today's valuation
// is booked (MTM). Zero amounts produce no postings.
class MtmRollForwardPoster {
public:
    explicit MtmRollForwardPoster(AccountCodes accounts);

    // One group's series; rows are ordered by as_of_date here. A repeated
    // date or an undated row fails the call.
    bool PostGroup(const std::vector<ValuationSnapshot>& series,
                   std::vector<GlPosting>* postings,
                   std::string* error) const;

    // Every group, ordered by (customer, instrument, currency, posting date).
    bool PostAll(const std::vector<ValuationSnapshot>& series,
                 std::vector<GlPosting>* postings,
                 std::string* error) const;

    // Positive: Dr revaluation / Cr unrealized P&L. Negative: Dr unrealized
    // P&L / Cr revaluation. Both legs carry |amount|.
    void AppendDoubleEntry(const ValuationSnapshot& row,
                           double amount,
                           PostingType type,
                           std::vector<GlPosting>* postings) const;

private:
    AccountCodes accounts_;
};

void SortMtmPostings(std::vector<GlPosting>* postings);

}  // namespace sec_subledger
