#include "sec_subledger/core/csv_record_writer.h"

#include <exception>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace sec_subledger {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

void WriteGroup(std::ostream& out, const GroupKey& group) {
    out << CsvEscape(group.customer_id) << ',' << CsvEscape(group.instrument_id) << ','
        << CsvEscape(group.currency);
}

const char* CsvBool(bool value) { return value ? "true" : "false"; }

}  // namespace

std::string CsvEscape(const std::string& text) {
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string escaped;
    escaped.reserve(text.size() + 2);
    escaped.push_back('"');
    for (const char ch : text) {
        if (ch == '"') {
            escaped.push_back('"');
            escaped.push_back('"');
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('"');
    return escaped;
}

std::string CsvDouble(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(8) << value;
    return oss.str();
}

CsvRecordWriter::CsvRecordWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

template <typename Row>
bool CsvRecordWriter::WriteRows(const std::string& file_name,
                                const std::string& header,
                                const std::vector<Row>& rows,
                                const std::function<void(std::ostream&, const Row&)>& write_row,
                                std::string* error) {
    if (output_dir_.empty()) {
        return SetError("csv output directory is empty", error);
    }
    const std::filesystem::path out_path = output_dir_ / file_name;
    try {
        std::filesystem::create_directories(output_dir_);
    } catch (const std::exception& ex) {
        return SetError(std::string("unable to create output directory: ") + ex.what(), error);
    }
    std::ofstream out(out_path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        return SetError("unable to open output file: " + out_path.string(), error);
    }
    out << header << '\n';
    for (const Row& row : rows) {
        write_row(out, row);
        out << '\n';
    }
    out.flush();
    if (!out) {
        return SetError("failed writing output file: " + out_path.string(), error);
    }
    written_files_.push_back(out_path.string());
    return true;
}

bool CsvRecordWriter::WriteOpenTrades(const std::vector<OpenTrade>& rows, std::string* error) {
    return WriteRows<OpenTrade>(
        "open_trades.csv",
        "trade_id,customer_id,isin,ccy,trade_date,side,quantity,price,remaining_quantity,"
        "open_flag",
        rows,
        [](std::ostream& out, const OpenTrade& row) {
            const Trade& trade = row.trade;
            out << CsvEscape(trade.trade_id) << ',';
            WriteGroup(out, trade.group());
            out << ',' << trade.trade_date << ',' << ToString(trade.side) << ','
                << CsvDouble(trade.quantity) << ',' << CsvDouble(trade.price) << ','
                << CsvDouble(row.remaining_quantity) << ',' << CsvBool(row.open_flag);
        },
        error);
}

bool CsvRecordWriter::WriteAllocatedTrades(const std::vector<AllocatedTrade>& rows,
                                           std::string* error) {
    return WriteRows<AllocatedTrade>(
        "allocated_trades.csv",
        "trade_id,customer_id,isin,ccy,snapshot_date,remaining_quantity,price,open_notional,"
        "fo_mtm,mtm_allocated",
        rows,
        [](std::ostream& out, const AllocatedTrade& row) {
            const Trade& trade = row.open.trade;
            out << CsvEscape(trade.trade_id) << ',';
            WriteGroup(out, trade.group());
            out << ',' << row.snapshot_date << ',' << CsvDouble(row.open.remaining_quantity)
                << ',' << CsvDouble(trade.price) << ',' << CsvDouble(row.open_notional) << ','
                << (row.valuation_amount.has_value() ? CsvDouble(*row.valuation_amount) : "")
                << ',' << CsvDouble(row.mtm_allocated);
        },
        error);
}

bool CsvRecordWriter::WriteGlPostings(const std::string& file_name,
                                      const std::vector<GlPosting>& rows,
                                      std::string* error) {
    return WriteRows<GlPosting>(
        file_name,
        "posting_date,deal_id,customer_id,isin,ccy,account_code,dr_cr,amount,posting_type",
        rows,
        [](std::ostream& out, const GlPosting& row) {
            out << row.posting_date << ',' << CsvEscape(row.deal_id.value_or("")) << ',';
            WriteGroup(out, row.group());
            out << ',' << row.account_code << ',' << ToString(row.dr_cr) << ','
                << CsvDouble(row.amount) << ',' << ToString(row.posting_type);
        },
        error);
}

bool CsvRecordWriter::WriteThinLedger(const std::vector<LedgerBalance>& rows, std::string* error) {
    return WriteRows<LedgerBalance>(
        "thin_ledger.csv", "posting_date,account_code,ccy,day_change,balance", rows,
        [](std::ostream& out, const LedgerBalance& row) {
            out << row.posting_date << ',' << row.account_code << ',' << CsvEscape(row.currency)
                << ',' << CsvDouble(row.day_change) << ',' << CsvDouble(row.balance);
        },
        error);
}

bool CsvRecordWriter::WritePositionControl(const std::vector<PositionControlRecord>& rows,
                                           std::string* error) {
    return WriteRows<PositionControlRecord>(
        "control_position.csv",
        "customer_id,isin,ccy,fifo_position_qty,position_quantity,difference,snapshot_missing,"
        "is_break",
        rows,
        [](std::ostream& out, const PositionControlRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << CsvDouble(row.fifo_position_qty) << ','
                << CsvDouble(row.position_quantity) << ',' << CsvDouble(row.difference) << ','
                << CsvBool(row.snapshot_missing) << ',' << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteAllocationControl(const std::vector<AllocationControlRecord>& rows,
                                             std::string* error) {
    return WriteRows<AllocationControlRecord>(
        "control_allocation.csv",
        "customer_id,isin,ccy,snapshot_date,allocated_mtm,fo_mtm,difference,valuation_missing,"
        "is_break",
        rows,
        [](std::ostream& out, const AllocationControlRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << row.snapshot_date << ',' << CsvDouble(row.allocated_mtm) << ','
                << (row.fo_mtm.has_value() ? CsvDouble(*row.fo_mtm) : "") << ','
                << CsvDouble(row.difference) << ',' << CsvBool(row.valuation_missing) << ','
                << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteBuyTradeControl(const std::vector<BuyTradeControlRecord>& rows,
                                           std::string* error) {
    return WriteRows<BuyTradeControlRecord>(
        "control_trade_buys.csv",
        "trade_id,customer_id,isin,ccy,trade_date,quantity,price,trade_notional,gl_asset,gl_cash,"
        "diff_asset,diff_cash,is_break",
        rows,
        [](std::ostream& out, const BuyTradeControlRecord& row) {
            out << CsvEscape(row.trade.trade_id) << ',';
            WriteGroup(out, row.trade.group());
            out << ',' << row.trade.trade_date << ',' << CsvDouble(row.trade.quantity) << ','
                << CsvDouble(row.trade.price) << ',' << CsvDouble(row.trade_notional) << ','
                << CsvDouble(row.gl_asset) << ',' << CsvDouble(row.gl_cash) << ','
                << CsvDouble(row.diff_asset) << ',' << CsvDouble(row.diff_cash) << ','
                << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteSellTradeControl(const std::vector<SellTradeControlRecord>& rows,
                                            std::string* error) {
    return WriteRows<SellTradeControlRecord>(
        "control_trade_sells.csv",
        "trade_id,customer_id,isin,ccy,trade_date,quantity,price,trade_notional,gl_cash,gl_asset,"
        "gl_pnl,diff_cash,balance_check,is_break",
        rows,
        [](std::ostream& out, const SellTradeControlRecord& row) {
            out << CsvEscape(row.trade.trade_id) << ',';
            WriteGroup(out, row.trade.group());
            out << ',' << row.trade.trade_date << ',' << CsvDouble(row.trade.quantity) << ','
                << CsvDouble(row.trade.price) << ',' << CsvDouble(row.trade_notional) << ','
                << CsvDouble(row.gl_cash) << ',' << CsvDouble(row.gl_asset) << ','
                << CsvDouble(row.gl_pnl) << ',' << CsvDouble(row.diff_cash) << ','
                << CsvDouble(row.balance_check) << ',' << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteMtmGlControl(const std::vector<MtmGlControlRecord>& rows,
                                        std::string* error) {
    return WriteRows<MtmGlControlRecord>(
        "control_mtm_gl.csv",
        "customer_id,isin,ccy,posting_date,fo_mtm,day_change,gl_mtm_balance,difference,is_break",
        rows,
        [](std::ostream& out, const MtmGlControlRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << row.posting_date << ',' << CsvDouble(row.fo_mtm) << ','
                << CsvDouble(row.day_change) << ',' << CsvDouble(row.gl_mtm_balance) << ','
                << CsvDouble(row.difference) << ',' << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WritePortfolioMtmControl(const std::vector<PortfolioMtmControlRecord>& rows,
                                               std::string* error) {
    return WriteRows<PortfolioMtmControlRecord>(
        "control_portfolio_mtm.csv",
        "posting_date,sum_fo_mtm,gl_reval_balance,difference,is_break", rows,
        [](std::ostream& out, const PortfolioMtmControlRecord& row) {
            out << row.posting_date << ',' << CsvDouble(row.sum_fo_mtm) << ','
                << CsvDouble(row.gl_reval_balance) << ',' << CsvDouble(row.difference) << ','
                << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteMtmDeltaControl(const std::vector<MtmDeltaControlRecord>& rows,
                                           std::string* error) {
    return WriteRows<MtmDeltaControlRecord>(
        "control_mtm_delta.csv",
        "customer_id,isin,ccy,posting_date,fo_mtm_change,journal_mtm_change,difference,is_break",
        rows,
        [](std::ostream& out, const MtmDeltaControlRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << row.posting_date << ',' << CsvDouble(row.fo_mtm_change) << ','
                << CsvDouble(row.journal_mtm_change) << ',' << CsvDouble(row.difference) << ','
                << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteThinLedgerControl(const std::vector<ThinLedgerControlRecord>& rows,
                                             std::string* error) {
    return WriteRows<ThinLedgerControlRecord>(
        "control_thin_ledger.csv",
        "posting_date,account_code,ccy,balance_thin_ledger,balance_from_journals,difference,"
        "is_break",
        rows,
        [](std::ostream& out, const ThinLedgerControlRecord& row) {
            out << row.posting_date << ',' << row.account_code << ',' << CsvEscape(row.currency)
                << ',' << CsvDouble(row.balance_thin_ledger) << ','
                << CsvDouble(row.balance_from_journals) << ',' << CsvDouble(row.difference) << ','
                << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteJournalDailyTotals(const std::vector<JournalDailyTotal>& rows,
                                              std::string* error) {
    return WriteRows<JournalDailyTotal>(
        "journal_daily_totals.csv",
        "posting_date,ccy,total_debit,total_credit,net_debit_minus_credit,is_break", rows,
        [](std::ostream& out, const JournalDailyTotal& row) {
            out << row.posting_date << ',' << CsvEscape(row.currency) << ','
                << CsvDouble(row.total_debit) << ',' << CsvDouble(row.total_credit) << ','
                << CsvDouble(row.net_debit_minus_credit) << ',' << CsvBool(row.is_break);
        },
        error);
}

bool CsvRecordWriter::WriteOversells(const std::vector<OversellRecord>& rows, std::string* error) {
    return WriteRows<OversellRecord>(
        "oversells.csv", "customer_id,isin,ccy,trade_id,trade_date,sell_quantity,unmatched_quantity",
        rows,
        [](std::ostream& out, const OversellRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << CsvEscape(row.trade_id) << ',' << row.trade_date << ','
                << CsvDouble(row.sell_quantity) << ',' << CsvDouble(row.unmatched_quantity);
        },
        error);
}

bool CsvRecordWriter::WriteDegenerateSales(const std::vector<DegenerateSaleRecord>& rows,
                                           std::string* error) {
    return WriteRows<DegenerateSaleRecord>(
        "degenerate_sales.csv",
        "customer_id,isin,ccy,trade_id,trade_date,quantity_before,cost_basis_before,fallback_price",
        rows,
        [](std::ostream& out, const DegenerateSaleRecord& row) {
            WriteGroup(out, row.group);
            out << ',' << CsvEscape(row.trade_id) << ',' << row.trade_date << ','
                << CsvDouble(row.quantity_before) << ',' << CsvDouble(row.cost_basis_before)
                << ',' << CsvDouble(row.fallback_price);
        },
        error);
}

}  // namespace sec_subledger
