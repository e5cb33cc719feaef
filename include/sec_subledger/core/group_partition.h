#pragma once

#include <map>
#include <vector>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

// Splits records by (customer, instrument, currency). Input order is kept
// within each group; groups iterate in key order.
template <typename Record>
std::map<GroupKey, std::vector<Record>> PartitionByGroup(const std::vector<Record>& records) {
    std::map<GroupKey, std::vector<Record>> groups;
    for (const auto& record : records) {
        groups[record.group()].push_back(record);
    }
    return groups;
}

}  // namespace sec_subledger
