#include "sec_subledger/services/fifo_lot_matcher.h"

#include <algorithm>
#include <deque>
#include <tuple>
#include <utility>

namespace sec_subledger {
namespace {

struct OpenLot {
    std::size_t index{0};
    double quantity{0.0};
};

}  // namespace

void SortByTradeDateAndId(std::vector<Trade>* trades) {
    if (trades == nullptr) {
        return;
    }
    std::stable_sort(trades->begin(), trades->end(), [](const Trade& lhs, const Trade& rhs) {
        return std::tie(lhs.trade_date, lhs.trade_id) < std::tie(rhs.trade_date, rhs.trade_id);
    });
}

FifoLotMatcher::FifoLotMatcher(OversellPolicy oversell_policy)
    : oversell_policy_(oversell_policy) {}

bool FifoLotMatcher::MatchGroup(const std::vector<Trade>& group_trades,
                                LotMatchResult* result,
                                std::string* error) const {
    if (result == nullptr) {
        if (error != nullptr) {
            *error = "lot match result pointer is null";
        }
        return false;
    }
    *result = LotMatchResult{};
    if (group_trades.empty()) {
        return true;
    }

    const GroupKey group = group_trades.front().group();
    std::vector<Trade> sorted = group_trades;
    SortByTradeDateAndId(&sorted);

    result->trades.reserve(sorted.size());
    std::deque<OpenLot> lots;
    for (std::size_t index = 0; index < sorted.size(); ++index) {
        if (sorted[index].group() != group) {
            if (error != nullptr) {
                *error = "trade " + sorted[index].trade_id + " does not belong to group " +
                         group.customer_id + "/" + group.instrument_id + "/" + group.currency;
            }
            *result = LotMatchResult{};
            return false;
        }
        MatchedTrade matched;
        matched.trade = sorted[index];
        if (sorted[index].side == TradeSide::kBuy) {
            matched.remaining_quantity = sorted[index].quantity;
            lots.push_back(OpenLot{index, sorted[index].quantity});
            result->total_bought += sorted[index].quantity;
        }
        result->trades.push_back(std::move(matched));
    }

    for (auto& sell : result->trades) {
        if (sell.trade.side != TradeSide::kSell) {
            continue;
        }
        double qty_to_match = sell.trade.quantity;
        while (qty_to_match > kLotQuantityEpsilon && !lots.empty()) {
            OpenLot& head = lots.front();
            const double used = std::min(head.quantity, qty_to_match);
            head.quantity -= used;
            qty_to_match -= used;
            auto& lot_trade = result->trades[head.index];
            lot_trade.remaining_quantity -= used;
            result->total_matched += used;
            if (head.quantity <= kLotQuantityEpsilon) {
                // Float residue of a closed lot counts as consumed.
                result->total_matched += head.quantity;
                lot_trade.remaining_quantity = 0.0;
                lots.pop_front();
            }
        }
        sell.remaining_quantity = 0.0;

        if (qty_to_match <= kLotQuantityEpsilon) {
            continue;
        }
        if (oversell_policy_ == OversellPolicy::kReject) {
            if (error != nullptr) {
                *error = "sell " + sell.trade.trade_id + " exceeds open FIFO inventory by " +
                         std::to_string(qty_to_match);
            }
            *result = LotMatchResult{};
            return false;
        }
        if (oversell_policy_ == OversellPolicy::kReport) {
            OversellRecord record;
            record.group = group;
            record.trade_id = sell.trade.trade_id;
            record.trade_date = sell.trade.trade_date;
            record.sell_quantity = sell.trade.quantity;
            record.unmatched_quantity = qty_to_match;
            result->oversells.push_back(std::move(record));
        }
    }
    return true;
}

}  // namespace sec_subledger
