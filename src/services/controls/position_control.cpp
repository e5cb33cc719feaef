#include "sec_subledger/services/position_control.h"

#include <map>
#include <utility>

#include "sec_subledger/core/amount_rounding.h"

namespace sec_subledger {
namespace {

struct SnapshotAgg {
    std::string as_of_date;
    double quantity{0.0};
};

}  // namespace

PositionControl::PositionControl(ControlConfig config) : config_(config) {}

std::vector<PositionControlRecord> PositionControl::Build(
    const std::vector<MatchedTrade>& matched,
    const std::vector<PositionSnapshot>& positions,
    const std::string& as_of_date) const {
    std::map<GroupKey, double> fifo_positions;
    for (const auto& item : matched) {
        fifo_positions[item.trade.group()] += item.remaining_quantity;
    }

    std::map<GroupKey, SnapshotAgg> snapshots;
    for (const auto& snapshot : positions) {
        if (!as_of_date.empty() && snapshot.as_of_date != as_of_date) {
            continue;
        }
        auto& agg = snapshots[snapshot.group()];
        if (agg.as_of_date.empty() || snapshot.as_of_date > agg.as_of_date) {
            agg.as_of_date = snapshot.as_of_date;
            agg.quantity = snapshot.quantity;
        } else if (snapshot.as_of_date == agg.as_of_date) {
            agg.quantity += snapshot.quantity;
        }
    }

    std::map<GroupKey, PositionControlRecord> merged;
    for (const auto& [group, quantity] : fifo_positions) {
        auto& record = merged[group];
        record.group = group;
        record.fifo_position_qty = quantity;
        record.snapshot_missing = true;
    }
    for (const auto& [group, agg] : snapshots) {
        auto& record = merged[group];
        record.group = group;
        record.position_quantity = agg.quantity;
        record.snapshot_missing = false;
    }

    std::vector<PositionControlRecord> records;
    records.reserve(merged.size());
    for (auto& [group, record] : merged) {
        (void)group;
        record.difference = AmountRounding::Round(record.fifo_position_qty - record.position_quantity,
                                                  config_.difference_scale);
        record.is_break = AmountRounding::IsBreak(record.difference, config_.tolerance);
        records.push_back(std::move(record));
    }
    return records;
}

}  // namespace sec_subledger
