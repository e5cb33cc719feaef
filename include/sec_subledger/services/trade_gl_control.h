#pragma once

#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

struct TradeGlControlResult {
    std::vector<BuyTradeControlRecord> buys;
    std::vector<SellTradeControlRecord> sells;
};

// Reconciles trade notionals to the trade journal by deal id.
//   BUY : diff_asset = asset Dr - notional, diff_cash = cash Cr - notional
//   SELL: diff_cash = cash Dr - notional,
//         balance_check = cash Dr - (asset Cr + signed realized P&L)
class TradeGlControl {
public:
    TradeGlControl(AccountCodes accounts, ControlConfig config = {});

    TradeGlControlResult Build(const std::vector<Trade>& trades,
                               const std::vector<GlPosting>& trade_postings) const;

private:
    AccountCodes accounts_;
    ControlConfig config_;
};

}  // namespace sec_subledger
