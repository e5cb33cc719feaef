#include "sec_subledger/services/ledger_controls.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <tuple>
#include <utility>

#include "sec_subledger/core/amount_rounding.h"

namespace sec_subledger {

LedgerControls::LedgerControls(ControlConfig config) : config_(config) {}

std::vector<ThinLedgerControlRecord> LedgerControls::BuildThinLedgerControl(
    const std::vector<ThinLedgerBalance>& thin_ledger,
    const std::vector<LedgerBalance>& rebuilt) const {
    // (account, currency) -> date-ordered running balances
    std::map<std::pair<AccountCode, std::string>, std::map<std::string, double>> series;
    for (const auto& row : rebuilt) {
        series[std::make_pair(row.account_code, row.currency)][row.posting_date] = row.balance;
    }

    std::vector<ThinLedgerControlRecord> records;
    records.reserve(thin_ledger.size());
    for (const auto& row : thin_ledger) {
        ThinLedgerControlRecord record;
        record.posting_date = row.posting_date;
        record.account_code = row.account_code;
        record.currency = row.currency;
        record.balance_thin_ledger = row.balance;

        const auto it = series.find(std::make_pair(row.account_code, row.currency));
        if (it != series.end()) {
            auto upper = it->second.upper_bound(row.posting_date);
            if (upper != it->second.begin()) {
                record.balance_from_journals = std::prev(upper)->second;
            }
        }
        record.difference = AmountRounding::Round(
            record.balance_thin_ledger - record.balance_from_journals, config_.difference_scale);
        record.is_break = AmountRounding::IsBreak(record.difference, config_.tolerance);
        records.push_back(std::move(record));
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const ThinLedgerControlRecord& lhs, const ThinLedgerControlRecord& rhs) {
                         return std::tie(lhs.posting_date, lhs.account_code, lhs.currency) <
                                std::tie(rhs.posting_date, rhs.account_code, rhs.currency);
                     });
    return records;
}

std::vector<JournalDailyTotal> LedgerControls::BuildJournalDailyTotals(
    const std::vector<GlPosting>& postings) const {
    std::map<std::pair<std::string, std::string>, JournalDailyTotal> totals;
    for (const auto& posting : postings) {
        auto& total = totals[std::make_pair(posting.posting_date, posting.currency)];
        total.posting_date = posting.posting_date;
        total.currency = posting.currency;
        if (posting.dr_cr == DebitCredit::kDebit) {
            total.total_debit += posting.amount;
        } else {
            total.total_credit += posting.amount;
        }
    }

    std::vector<JournalDailyTotal> records;
    records.reserve(totals.size());
    for (auto& [key, total] : totals) {
        (void)key;
        total.net_debit_minus_credit = AmountRounding::Round(
            total.total_debit - total.total_credit, config_.difference_scale);
        total.is_break = AmountRounding::IsBreak(total.net_debit_minus_credit, config_.tolerance);
        records.push_back(std::move(total));
    }
    return records;
}

}  // namespace sec_subledger
