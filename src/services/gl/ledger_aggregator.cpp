#include "sec_subledger/services/ledger_aggregator.h"

#include <map>
#include <string>
#include <tuple>

namespace sec_subledger {

std::vector<LedgerBalance> AggregateThinLedger(const std::vector<GlPosting>& postings) {
    std::map<std::tuple<AccountCode, std::string, std::string>, double> day_changes;
    for (const auto& posting : postings) {
        day_changes[std::make_tuple(posting.account_code, posting.currency,
                                    posting.posting_date)] += posting.signed_amount();
    }

    std::vector<LedgerBalance> balances;
    balances.reserve(day_changes.size());
    const LedgerBalance* previous = nullptr;
    for (const auto& [key, change] : day_changes) {
        LedgerBalance row;
        row.account_code = std::get<0>(key);
        row.currency = std::get<1>(key);
        row.posting_date = std::get<2>(key);
        row.day_change = change;
        const bool same_series = previous != nullptr &&
                                 previous->account_code == row.account_code &&
                                 previous->currency == row.currency;
        row.balance = (same_series ? previous->balance : 0.0) + change;
        balances.push_back(row);
        previous = &balances.back();
    }
    return balances;
}

}  // namespace sec_subledger
