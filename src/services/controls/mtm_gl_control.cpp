#include "sec_subledger/services/mtm_gl_control.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

#include "sec_subledger/core/amount_rounding.h"
#include "sec_subledger/core/group_partition.h"

namespace sec_subledger {
namespace {

using GroupDateKey = std::pair<GroupKey, std::string>;

std::vector<ValuationSnapshot> SortedByDate(std::vector<ValuationSnapshot> rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const ValuationSnapshot& lhs, const ValuationSnapshot& rhs) {
                         return lhs.as_of_date < rhs.as_of_date;
                     });
    return rows;
}

}  // namespace

MtmGlControl::MtmGlControl(AccountCodes accounts, ControlConfig config)
    : accounts_(accounts), config_(config) {}

double MtmGlControl::RoundDifference(double value) const {
    return AmountRounding::Round(value, config_.difference_scale);
}

std::vector<MtmGlControlRecord> MtmGlControl::Build(const std::vector<ValuationSnapshot>& series,
                                                    const std::vector<GlPosting>& postings) const {
    // (group) -> (date -> signed revaluation change)
    std::map<GroupKey, std::map<std::string, double>> day_changes;
    for (const auto& posting : postings) {
        if (posting.account_code != accounts_.revaluation) {
            continue;
        }
        day_changes[posting.group()][posting.posting_date] += posting.signed_amount();
    }

    std::vector<MtmGlControlRecord> records;
    records.reserve(series.size());
    for (const auto& [group, rows] : PartitionByGroup(series)) {
        static const std::map<std::string, double> kNoChanges;
        const auto changes_it = day_changes.find(group);
        const auto& changes = changes_it == day_changes.end() ? kNoChanges : changes_it->second;

        auto change_it = changes.begin();
        double balance = 0.0;
        for (const auto& row : SortedByDate(rows)) {
            MtmGlControlRecord record;
            record.group = group;
            record.posting_date = row.as_of_date;
            record.fo_mtm = row.mtm_amount;
            while (change_it != changes.end() && change_it->first <= row.as_of_date) {
                balance += change_it->second;
                if (change_it->first == row.as_of_date) {
                    record.day_change = change_it->second;
                }
                ++change_it;
            }
            record.gl_mtm_balance = balance;
            record.difference = RoundDifference(record.gl_mtm_balance - record.fo_mtm);
            record.is_break = AmountRounding::IsBreak(record.difference, config_.tolerance);
            records.push_back(std::move(record));
        }
    }
    return records;
}

std::vector<PortfolioMtmControlRecord> MtmGlControl::BuildPortfolio(
    const std::vector<MtmGlControlRecord>& level_rows) const {
    std::map<std::string, PortfolioMtmControlRecord> by_date;
    for (const auto& row : level_rows) {
        auto& record = by_date[row.posting_date];
        record.posting_date = row.posting_date;
        record.sum_fo_mtm += row.fo_mtm;
        record.gl_reval_balance += row.gl_mtm_balance;
    }

    std::vector<PortfolioMtmControlRecord> records;
    records.reserve(by_date.size());
    for (auto& [date, record] : by_date) {
        (void)date;
        record.difference = RoundDifference(record.gl_reval_balance - record.sum_fo_mtm);
        record.is_break = AmountRounding::IsBreak(record.difference, config_.tolerance);
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<MtmDeltaControlRecord> MtmGlControl::BuildDelta(
    const std::vector<ValuationSnapshot>& series, const std::vector<GlPosting>& postings) const {
    std::map<GroupDateKey, double> journal_changes;
    for (const auto& posting : postings) {
        if (posting.account_code != accounts_.revaluation) {
            continue;
        }
        journal_changes[std::make_pair(posting.group(), posting.posting_date)] +=
            posting.signed_amount();
    }

    std::vector<MtmDeltaControlRecord> records;
    for (const auto& [group, rows] : PartitionByGroup(series)) {
        const auto sorted = SortedByDate(rows);
        for (std::size_t index = 1; index < sorted.size(); ++index) {
            MtmDeltaControlRecord record;
            record.group = group;
            record.posting_date = sorted[index].as_of_date;
            record.fo_mtm_change = sorted[index].mtm_amount - sorted[index - 1].mtm_amount;
            const auto it = journal_changes.find(std::make_pair(group, record.posting_date));
            if (it != journal_changes.end()) {
                record.journal_mtm_change = it->second;
            }
            record.difference = RoundDifference(record.fo_mtm_change - record.journal_mtm_change);
            record.is_break = AmountRounding::IsBreak(record.difference, config_.tolerance);
            records.push_back(std::move(record));
        }
    }
    return records;
}

}  // namespace sec_subledger
