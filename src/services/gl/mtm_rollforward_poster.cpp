#include "sec_subledger/services/mtm_rollforward_poster.h"

#include <algorithm>
#include <cmath>
#include <tuple>
#include <utility>

#include "sec_subledger/core/group_partition.h"

namespace sec_subledger {

MtmRollForwardPoster::MtmRollForwardPoster(AccountCodes accounts) : accounts_(accounts) {}

bool MtmRollForwardPoster::PostGroup(const std::vector<ValuationSnapshot>& series,
                                     std::vector<GlPosting>* postings,
                                     std::string* error) const {
    if (postings == nullptr) {
        if (error != nullptr) {
            *error = "postings output is null";
        }
        return false;
    }

    std::vector<ValuationSnapshot> sorted = series;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ValuationSnapshot& lhs, const ValuationSnapshot& rhs) {
                         return lhs.as_of_date < rhs.as_of_date;
                     });

    MtmRollState state;
    for (std::size_t index = 0; index < sorted.size(); ++index) {
        const auto& row = sorted[index];
        if (row.as_of_date.empty()) {
            if (error != nullptr) {
                *error = "mtm series row without as_of_date for " + row.customer_id + "/" +
                         row.instrument_id + "/" + row.currency;
            }
            return false;
        }
        if (index > 0 && sorted[index - 1].as_of_date == row.as_of_date) {
            if (error != nullptr) {
                *error = "duplicate mtm series date " + row.as_of_date + " for " +
                         row.customer_id + "/" + row.instrument_id + "/" + row.currency;
            }
            return false;
        }

        if (state.prev_mtm != 0.0) {
            AppendDoubleEntry(row, -state.prev_mtm, PostingType::kMtmReversal, postings);
        }
        if (row.mtm_amount != 0.0) {
            AppendDoubleEntry(row, row.mtm_amount, PostingType::kMtm, postings);
        }
        state.prev_mtm = row.mtm_amount;
    }
    return true;
}

bool MtmRollForwardPoster::PostAll(const std::vector<ValuationSnapshot>& series,
                                   std::vector<GlPosting>* postings,
                                   std::string* error) const {
    if (postings == nullptr) {
        if (error != nullptr) {
            *error = "postings output is null";
        }
        return false;
    }
    std::vector<GlPosting> merged;
    for (const auto& [group, rows] : PartitionByGroup(series)) {
        (void)group;
        if (!PostGroup(rows, &merged, error)) {
            return false;
        }
    }
    SortMtmPostings(&merged);
    *postings = std::move(merged);
    return true;
}

void MtmRollForwardPoster::AppendDoubleEntry(const ValuationSnapshot& row,
                                             double amount,
                                             PostingType type,
                                             std::vector<GlPosting>* postings) const {
    if (amount == 0.0 || postings == nullptr) {
        return;
    }
    GlPosting base;
    base.posting_date = row.as_of_date;
    base.customer_id = row.customer_id;
    base.instrument_id = row.instrument_id;
    base.currency = row.currency;
    base.amount = std::fabs(amount);
    base.posting_type = type;

    GlPosting debit = base;
    GlPosting credit = base;
    debit.dr_cr = DebitCredit::kDebit;
    credit.dr_cr = DebitCredit::kCredit;
    if (amount > 0.0) {
        debit.account_code = accounts_.revaluation;
        credit.account_code = accounts_.unrealized_pnl;
    } else {
        debit.account_code = accounts_.unrealized_pnl;
        credit.account_code = accounts_.revaluation;
    }
    postings->push_back(std::move(debit));
    postings->push_back(std::move(credit));
}

void SortMtmPostings(std::vector<GlPosting>* postings) {
    if (postings == nullptr) {
        return;
    }
    std::stable_sort(postings->begin(), postings->end(),
                     [](const GlPosting& lhs, const GlPosting& rhs) {
                         return std::tie(lhs.customer_id, lhs.instrument_id, lhs.currency,
                                         lhs.posting_date) <
                                std::tie(rhs.customer_id, rhs.instrument_id, rhs.currency,
                                         rhs.posting_date);
                     });
}

}  // namespace sec_subledger
