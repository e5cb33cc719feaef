#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace sec_subledger {

using AccountCode = std::int64_t;

enum class TradeSide {
    kBuy,
    kSell,
};

enum class DebitCredit {
    kDebit,
    kCredit,
};

enum class PostingType {
    kPurchase,
    kSale,
    kSalePnl,
    kMtm,
    kMtmReversal,
};

struct GroupKey {
    std::string customer_id;
    std::string instrument_id;
    std::string currency;

    bool operator==(const GroupKey& rhs) const {
        return customer_id == rhs.customer_id && instrument_id == rhs.instrument_id &&
               currency == rhs.currency;
    }
    bool operator!=(const GroupKey& rhs) const { return !(*this == rhs); }
    bool operator<(const GroupKey& rhs) const {
        return std::tie(customer_id, instrument_id, currency) <
               std::tie(rhs.customer_id, rhs.instrument_id, rhs.currency);
    }
};

// Dates are ISO "YYYY-MM-DD" strings so lexical order is calendar order.
struct Trade {
    std::string trade_id;
    std::string customer_id;
    std::string instrument_id;
    std::string currency;
    std::string trade_date;
    TradeSide side{TradeSide::kBuy};
    double quantity{0.0};
    double price{0.0};

    GroupKey group() const { return GroupKey{customer_id, instrument_id, currency}; }
    double notional() const { return quantity * price; }
};

struct PositionSnapshot {
    std::string customer_id;
    std::string instrument_id;
    std::string currency;
    std::string as_of_date;
    double quantity{0.0};

    GroupKey group() const { return GroupKey{customer_id, instrument_id, currency}; }
};

// as_of_date is empty for an undated single-date feed.
struct ValuationSnapshot {
    std::string customer_id;
    std::string instrument_id;
    std::string currency;
    std::string as_of_date;
    double mtm_amount{0.0};

    GroupKey group() const { return GroupKey{customer_id, instrument_id, currency}; }
};

struct OpenTrade {
    Trade trade;
    double remaining_quantity{0.0};
    bool open_flag{true};
};

struct AllocatedTrade {
    OpenTrade open;
    std::string snapshot_date;
    double open_notional{0.0};
    std::optional<double> valuation_amount;
    double mtm_allocated{0.0};
};

struct GlPosting {
    std::string posting_date;
    std::optional<std::string> deal_id;
    std::string customer_id;
    std::string instrument_id;
    std::string currency;
    AccountCode account_code{0};
    DebitCredit dr_cr{DebitCredit::kDebit};
    double amount{0.0};
    PostingType posting_type{PostingType::kPurchase};

    GroupKey group() const { return GroupKey{customer_id, instrument_id, currency}; }
    double signed_amount() const { return dr_cr == DebitCredit::kDebit ? amount : -amount; }
};

struct LedgerBalance {
    std::string posting_date;
    AccountCode account_code{0};
    std::string currency;
    double day_change{0.0};
    double balance{0.0};
};

struct ThinLedgerBalance {
    std::string posting_date;
    AccountCode account_code{0};
    std::string currency;
    double balance{0.0};
};

struct OversellRecord {
    GroupKey group;
    std::string trade_id;
    std::string trade_date;
    double sell_quantity{0.0};
    double unmatched_quantity{0.0};
};

struct DegenerateSaleRecord {
    GroupKey group;
    std::string trade_id;
    std::string trade_date;
    double quantity_before{0.0};
    double cost_basis_before{0.0};
    double fallback_price{0.0};
};

inline const char* ToString(TradeSide side) {
    return side == TradeSide::kBuy ? "BUY" : "SELL";
}

inline const char* ToString(DebitCredit dr_cr) {
    return dr_cr == DebitCredit::kDebit ? "DR" : "CR";
}

inline const char* ToString(PostingType type) {
    switch (type) {
        case PostingType::kPurchase:
            return "PURCHASE";
        case PostingType::kSale:
            return "SALE";
        case PostingType::kSalePnl:
            return "SALE_PNL";
        case PostingType::kMtm:
            return "MTM";
        case PostingType::kMtmReversal:
            return "MTM_REVERSAL";
    }
    return "UNKNOWN";
}

}  // namespace sec_subledger
