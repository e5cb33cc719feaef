#include "sec_subledger/services/allocation_control.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

#include "sec_subledger/core/amount_rounding.h"

namespace sec_subledger {

AllocationControl::AllocationControl(ControlConfig config) : config_(config) {}

std::vector<AllocationControlRecord> AllocationControl::Build(
    const std::vector<AllocatedTrade>& allocated) const {
    std::map<std::pair<GroupKey, std::string>, AllocationControlRecord> units;
    for (const auto& row : allocated) {
        const GroupKey group = row.open.trade.group();
        auto [it, inserted] = units.try_emplace(std::make_pair(group, row.snapshot_date));
        auto& record = it->second;
        if (inserted) {
            record.group = group;
            record.snapshot_date = row.snapshot_date;
        }
        record.allocated_mtm += row.mtm_allocated;
        if (row.valuation_amount.has_value()) {
            record.fo_mtm = record.fo_mtm.has_value()
                                ? std::max(record.fo_mtm.value(), row.valuation_amount.value())
                                : row.valuation_amount.value();
        }
    }

    std::vector<AllocationControlRecord> records;
    records.reserve(units.size());
    for (auto& [unit, record] : units) {
        (void)unit;
        record.valuation_missing = !record.fo_mtm.has_value();
        record.difference = AmountRounding::Round(record.allocated_mtm - record.fo_mtm.value_or(0.0),
                                                  config_.difference_scale);
        record.is_break = record.valuation_missing ||
                          AmountRounding::IsBreak(record.difference, config_.tolerance);
        records.push_back(std::move(record));
    }
    return records;
}

}  // namespace sec_subledger
