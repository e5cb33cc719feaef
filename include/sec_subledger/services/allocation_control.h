#pragma once

#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

// Sum of allocated MTM per (group, snapshot date) against the source
// valuation. difference = allocated_mtm - fo_mtm. A unit with no valuation
// row is always a break.
class AllocationControl {
public:
    explicit AllocationControl(ControlConfig config = {});

    std::vector<AllocationControlRecord> Build(const std::vector<AllocatedTrade>& allocated) const;

private:
    ControlConfig config_;
};

}  // namespace sec_subledger
