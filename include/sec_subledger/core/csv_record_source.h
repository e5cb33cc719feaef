#pragma once

#include <string>
#include <vector>

#include "sec_subledger/core/subledger_config.h"
#include "sec_subledger/interfaces/subledger_record_source.h"

namespace sec_subledger {

// Reads the subledger feeds from CSV files with a header row. Columns are
// located by name, so extra columns and any column order are accepted.
//
//   trades          trade_id,customer_id,isin,ccy,trade_date,side,quantity,price
//   positions       customer_id,isin,ccy,as_of_date,position_quantity
//   valuations      customer_id,isin,ccy,[as_of_date],fo_mtm
//   mtm_timeseries  customer_id,isin,ccy,as_of_date,fo_mtm
//   thin_ledger     posting_date,account_code,ccy,balance
//
// A feed whose path is empty loads as an empty set.
class CsvRecordSource : public ISubledgerRecordSource {
public:
    explicit CsvRecordSource(InputConfig inputs);

    bool LoadTrades(std::vector<Trade>* out, std::string* error) const override;
    bool LoadPositions(std::vector<PositionSnapshot>* out, std::string* error) const override;
    bool LoadValuations(std::vector<ValuationSnapshot>* out, std::string* error) const override;
    bool LoadMtmTimeseries(std::vector<ValuationSnapshot>* out, std::string* error) const override;
    bool LoadThinLedger(std::vector<ThinLedgerBalance>* out, std::string* error) const override;

    const InputConfig& inputs() const { return inputs_; }

private:
    bool LoadValuationFile(const std::string& path,
                           bool require_date,
                           std::vector<ValuationSnapshot>* out,
                           std::string* error) const;

    InputConfig inputs_;
};

// Splits one CSV line; double quotes group a cell and "" inside quotes is a
// literal quote.
std::vector<std::string> SplitCsvLine(const std::string& line);

}  // namespace sec_subledger
