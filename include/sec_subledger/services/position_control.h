#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/core/subledger_config.h"
#include "sec_subledger/services/fifo_lot_matcher.h"

namespace sec_subledger {

// FIFO-derived open position per group against the positions feed.
// difference = fifo_position_qty - position_quantity.
class PositionControl {
public:
    explicit PositionControl(ControlConfig config = {});

    // With an empty as_of_date each group is compared to its latest-dated
    // snapshot rows; otherwise only rows for that date are used. Groups on
    // either side only are reported with the missing side as 0.
    std::vector<PositionControlRecord> Build(const std::vector<MatchedTrade>& matched,
                                             const std::vector<PositionSnapshot>& positions,
                                             const std::string& as_of_date) const;

private:
    ControlConfig config_;
};

}  // namespace sec_subledger
