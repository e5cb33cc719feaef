#include "sec_subledger/services/valuation_allocator.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>
#include <utility>

#include "sec_subledger/core/group_partition.h"

namespace sec_subledger {
namespace {

using AllocationUnit = std::pair<GroupKey, std::string>;

void AllocateUnit(std::vector<AllocatedTrade*>* members) {
    double total_notional = 0.0;
    for (const auto* member : *members) {
        total_notional += member->open_notional;
    }
    const bool degenerate = total_notional == 0.0 || !std::isfinite(total_notional);
    for (auto* member : *members) {
        if (degenerate || !member->valuation_amount.has_value()) {
            member->mtm_allocated = 0.0;
            continue;
        }
        member->mtm_allocated =
            member->valuation_amount.value() * (member->open_notional / total_notional);
    }
}

}  // namespace

ValuationAllocator::ValuationAllocator(ValuationJoinMode mode) : mode_(mode) {}

bool ValuationAllocator::Allocate(const std::vector<OpenTrade>& open_trades,
                                  const std::vector<ValuationSnapshot>& valuations,
                                  const std::string& valuation_as_of_date,
                                  std::vector<AllocatedTrade>* out,
                                  std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "allocation output pointer is null";
        }
        return false;
    }
    out->clear();

    std::vector<ValuationSnapshot> feed;
    feed.reserve(valuations.size());
    for (const auto& valuation : valuations) {
        if (valuation_as_of_date.empty() || valuation.as_of_date == valuation_as_of_date) {
            feed.push_back(valuation);
        }
    }
    auto by_group = PartitionByGroup(feed);
    for (auto& [group, rows] : by_group) {
        if (mode_ == ValuationJoinMode::kSingleDate && rows.size() > 1) {
            if (error != nullptr) {
                *error = "more than one valuation row for " + group.customer_id + "/" +
                         group.instrument_id + "/" + group.currency +
                         " in single-date mode; set run.valuation_as_of_date or use timeseries";
            }
            return false;
        }
        std::stable_sort(rows.begin(), rows.end(),
                         [](const ValuationSnapshot& lhs, const ValuationSnapshot& rhs) {
                             return lhs.as_of_date < rhs.as_of_date;
                         });
        for (std::size_t index = 1; index < rows.size(); ++index) {
            if (rows[index].as_of_date == rows[index - 1].as_of_date) {
                if (error != nullptr) {
                    *error = "duplicate valuation for " + group.customer_id + "/" +
                             group.instrument_id + "/" + group.currency + " on " +
                             rows[index].as_of_date;
                }
                return false;
            }
        }
    }

    std::vector<AllocatedTrade> allocated;
    for (const auto& open_trade : open_trades) {
        const auto it = by_group.find(open_trade.trade.group());
        AllocatedTrade row;
        row.open = open_trade;
        row.open_notional = open_trade.remaining_quantity * open_trade.trade.price;
        if (it == by_group.end() || it->second.empty()) {
            allocated.push_back(std::move(row));
            continue;
        }
        for (const auto& valuation : it->second) {
            AllocatedTrade joined = row;
            joined.snapshot_date = valuation.as_of_date;
            joined.valuation_amount = valuation.mtm_amount;
            allocated.push_back(std::move(joined));
        }
    }

    std::stable_sort(allocated.begin(), allocated.end(),
                     [](const AllocatedTrade& lhs, const AllocatedTrade& rhs) {
                         const GroupKey lhs_group = lhs.open.trade.group();
                         const GroupKey rhs_group = rhs.open.trade.group();
                         if (lhs_group != rhs_group) {
                             return lhs_group < rhs_group;
                         }
                         return std::tie(lhs.snapshot_date,
                                         lhs.open.trade.trade_date,
                                         lhs.open.trade.trade_id) <
                                std::tie(rhs.snapshot_date,
                                         rhs.open.trade.trade_date,
                                         rhs.open.trade.trade_id);
                     });

    std::map<AllocationUnit, std::vector<AllocatedTrade*>> units;
    for (auto& row : allocated) {
        units[AllocationUnit{row.open.trade.group(), row.snapshot_date}].push_back(&row);
    }
    for (auto& [unit, members] : units) {
        (void)unit;
        AllocateUnit(&members);
    }

    *out = std::move(allocated);
    return true;
}

}  // namespace sec_subledger
