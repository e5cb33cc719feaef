#pragma once

#include <optional>
#include <string>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

struct PositionControlRecord {
    GroupKey group;
    double fifo_position_qty{0.0};
    double position_quantity{0.0};
    double difference{0.0};
    bool snapshot_missing{false};
    bool is_break{false};
};

struct AllocationControlRecord {
    GroupKey group;
    std::string snapshot_date;
    double allocated_mtm{0.0};
    std::optional<double> fo_mtm;
    double difference{0.0};
    bool valuation_missing{false};
    bool is_break{false};
};

struct BuyTradeControlRecord {
    Trade trade;
    double trade_notional{0.0};
    double gl_asset{0.0};
    double gl_cash{0.0};
    double diff_asset{0.0};
    double diff_cash{0.0};
    bool is_break{false};
};

struct SellTradeControlRecord {
    Trade trade;
    double trade_notional{0.0};
    double gl_cash{0.0};
    double gl_asset{0.0};
    // Credit (gain) is positive, debit (loss) negative.
    double gl_pnl{0.0};
    double diff_cash{0.0};
    double balance_check{0.0};
    bool is_break{false};
};

struct MtmGlControlRecord {
    GroupKey group;
    std::string posting_date;
    double fo_mtm{0.0};
    double day_change{0.0};
    double gl_mtm_balance{0.0};
    double difference{0.0};
    bool is_break{false};
};

struct PortfolioMtmControlRecord {
    std::string posting_date;
    double sum_fo_mtm{0.0};
    double gl_reval_balance{0.0};
    double difference{0.0};
    bool is_break{false};
};

struct MtmDeltaControlRecord {
    GroupKey group;
    std::string posting_date;
    double fo_mtm_change{0.0};
    double journal_mtm_change{0.0};
    double difference{0.0};
    bool is_break{false};
};

struct ThinLedgerControlRecord {
    std::string posting_date;
    AccountCode account_code{0};
    std::string currency;
    double balance_thin_ledger{0.0};
    double balance_from_journals{0.0};
    double difference{0.0};
    bool is_break{false};
};

struct JournalDailyTotal {
    std::string posting_date;
    std::string currency;
    double total_debit{0.0};
    double total_credit{0.0};
    double net_debit_minus_credit{0.0};
    bool is_break{false};
};

}  // namespace sec_subledger
