#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/types.h"
#include "sec_subledger/services/fifo_lot_matcher.h"

namespace sec_subledger {

// Trades dated on or before as_of_date; an empty date keeps everything.
std::vector<Trade> FilterTradesAsOf(const std::vector<Trade>& trades, const std::string& as_of_date);

// Keeps only trades with positive remaining quantity and marks them open.
std::vector<OpenTrade> SelectOpenTrades(const std::vector<MatchedTrade>& matched);

}  // namespace sec_subledger
