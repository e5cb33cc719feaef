#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

// Writes subledger record sets as CSV files with a header row under one
// output directory, which is created on first use. Group columns use the
// feed names (customer_id, isin, ccy).
class CsvRecordWriter {
public:
    explicit CsvRecordWriter(std::string output_dir);

    bool WriteOpenTrades(const std::vector<OpenTrade>& rows, std::string* error);
    bool WriteAllocatedTrades(const std::vector<AllocatedTrade>& rows, std::string* error);
    bool WriteGlPostings(const std::string& file_name,
                         const std::vector<GlPosting>& rows,
                         std::string* error);
    bool WriteThinLedger(const std::vector<LedgerBalance>& rows, std::string* error);
    bool WritePositionControl(const std::vector<PositionControlRecord>& rows, std::string* error);
    bool WriteAllocationControl(const std::vector<AllocationControlRecord>& rows,
                                std::string* error);
    bool WriteBuyTradeControl(const std::vector<BuyTradeControlRecord>& rows, std::string* error);
    bool WriteSellTradeControl(const std::vector<SellTradeControlRecord>& rows,
                               std::string* error);
    bool WriteMtmGlControl(const std::vector<MtmGlControlRecord>& rows, std::string* error);
    bool WritePortfolioMtmControl(const std::vector<PortfolioMtmControlRecord>& rows,
                                  std::string* error);
    bool WriteMtmDeltaControl(const std::vector<MtmDeltaControlRecord>& rows, std::string* error);
    bool WriteThinLedgerControl(const std::vector<ThinLedgerControlRecord>& rows,
                                std::string* error);
    bool WriteJournalDailyTotals(const std::vector<JournalDailyTotal>& rows, std::string* error);
    bool WriteOversells(const std::vector<OversellRecord>& rows, std::string* error);
    bool WriteDegenerateSales(const std::vector<DegenerateSaleRecord>& rows, std::string* error);

    const std::filesystem::path& output_dir() const { return output_dir_; }
    const std::vector<std::string>& written_files() const { return written_files_; }

private:
    template <typename Row>
    bool WriteRows(const std::string& file_name,
                   const std::string& header,
                   const std::vector<Row>& rows,
                   const std::function<void(std::ostream&, const Row&)>& write_row,
                   std::string* error);

    std::filesystem::path output_dir_;
    std::vector<std::string> written_files_;
};

std::string CsvEscape(const std::string& text);
std::string CsvDouble(double value);

}  // namespace sec_subledger
