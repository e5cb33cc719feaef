#include "sec_subledger/services/open_trade_view.h"

#include <utility>

namespace sec_subledger {

std::vector<Trade> FilterTradesAsOf(const std::vector<Trade>& trades,
                                    const std::string& as_of_date) {
    if (as_of_date.empty()) {
        return trades;
    }
    std::vector<Trade> filtered;
    filtered.reserve(trades.size());
    for (const auto& trade : trades) {
        if (trade.trade_date <= as_of_date) {
            filtered.push_back(trade);
        }
    }
    return filtered;
}

std::vector<OpenTrade> SelectOpenTrades(const std::vector<MatchedTrade>& matched) {
    std::vector<OpenTrade> open;
    for (const auto& item : matched) {
        if (item.remaining_quantity > 0.0) {
            OpenTrade trade;
            trade.trade = item.trade;
            trade.remaining_quantity = item.remaining_quantity;
            trade.open_flag = true;
            open.push_back(std::move(trade));
        }
    }
    return open;
}

}  // namespace sec_subledger
