#include "sec_subledger/core/csv_record_source.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <stdexcept>
#include <utility>

#include "sec_subledger/core/date_text.h"

namespace sec_subledger {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

std::string Trim(std::string text) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.front()))) {
        text.erase(text.begin());
    }
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

bool ParseDouble(const std::string& raw, double* out) {
    const std::string text = Trim(raw);
    if (out == nullptr || text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const double value = std::stod(text, &parsed);
        if (parsed != text.size() || !std::isfinite(value)) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseInt64(const std::string& raw, std::int64_t* out) {
    const std::string text = Trim(raw);
    if (out == nullptr || text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const long long value = std::stoll(text, &parsed);
        if (parsed != text.size()) {
            return false;
        }
        *out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Sequential reader over one CSV file with a header row.
class CsvFile {
public:
    bool Open(const std::string& path, std::string* error) {
        path_ = path;
        input_.open(path);
        if (!input_.is_open()) {
            return SetError("unable to open csv file: " + path, error);
        }
        std::string header_line;
        if (!ReadLine(&header_line)) {
            return SetError("csv file is empty: " + path, error);
        }
        const auto headers = SplitCsvLine(header_line);
        for (std::size_t index = 0; index < headers.size(); ++index) {
            header_index_[ToLower(Trim(headers[index]))] = index;
        }
        return true;
    }

    bool RequireColumn(const std::string& name, std::size_t* index, std::string* error) const {
        if (FindColumn(name, index)) {
            return true;
        }
        return SetError(path_ + ": missing required column '" + name + "'", error);
    }

    bool FindColumn(const std::string& name, std::size_t* index) const {
        const auto it = header_index_.find(name);
        if (it == header_index_.end()) {
            return false;
        }
        *index = it->second;
        return true;
    }

    // Skips blank lines; returns false at end of file.
    bool NextRow(std::vector<std::string>* cells) {
        std::string line;
        while (ReadLine(&line)) {
            if (Trim(line).empty()) {
                continue;
            }
            *cells = SplitCsvLine(line);
            for (auto& cell : *cells) {
                cell = Trim(cell);
            }
            return true;
        }
        return false;
    }

    bool Cell(const std::vector<std::string>& cells,
              std::size_t index,
              const std::string& name,
              std::string* out,
              std::string* error) const {
        if (index >= cells.size()) {
            return SetError(Where() + ": missing value for '" + name + "'", error);
        }
        *out = cells[index];
        return true;
    }

    bool NumberCell(const std::vector<std::string>& cells,
                    std::size_t index,
                    const std::string& name,
                    double* out,
                    std::string* error) const {
        std::string text;
        if (!Cell(cells, index, name, &text, error)) {
            return false;
        }
        if (!ParseDouble(text, out)) {
            return SetError(Where() + ": invalid number '" + text + "' for '" + name + "'", error);
        }
        return true;
    }

    bool DateCell(const std::vector<std::string>& cells,
                  std::size_t index,
                  const std::string& name,
                  std::string* out,
                  std::string* error) const {
        std::string text;
        if (!Cell(cells, index, name, &text, error)) {
            return false;
        }
        if (!NormalizeIsoDate(text, out)) {
            return SetError(Where() + ": invalid date '" + text + "' for '" + name + "'", error);
        }
        return true;
    }

    std::string Where() const { return path_ + ":" + std::to_string(line_number_); }

private:
    bool ReadLine(std::string* line) {
        if (!std::getline(input_, *line)) {
            return false;
        }
        ++line_number_;
        if (!line->empty() && line->back() == '\r') {
            line->pop_back();
        }
        return true;
    }

    std::string path_;
    std::ifstream input_;
    std::map<std::string, std::size_t> header_index_;
    int line_number_{0};
};

bool ParseSide(const std::string& raw, TradeSide* out) {
    const std::string side = ToLower(Trim(raw));
    if (side == "buy" || side == "b") {
        *out = TradeSide::kBuy;
        return true;
    }
    if (side == "sell" || side == "s") {
        *out = TradeSide::kSell;
        return true;
    }
    return false;
}

struct GroupColumns {
    std::size_t customer{0};
    std::size_t instrument{0};
    std::size_t currency{0};
};

bool RequireGroupColumns(const CsvFile& file, GroupColumns* columns, std::string* error) {
    return file.RequireColumn("customer_id", &columns->customer, error) &&
           file.RequireColumn("isin", &columns->instrument, error) &&
           file.RequireColumn("ccy", &columns->currency, error);
}

bool ReadGroupCells(const CsvFile& file,
                    const std::vector<std::string>& cells,
                    const GroupColumns& columns,
                    std::string* customer_id,
                    std::string* instrument_id,
                    std::string* currency,
                    std::string* error) {
    return file.Cell(cells, columns.customer, "customer_id", customer_id, error) &&
           file.Cell(cells, columns.instrument, "isin", instrument_id, error) &&
           file.Cell(cells, columns.currency, "ccy", currency, error);
}

}  // namespace

std::vector<std::string> SplitCsvLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string current;
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char ch = line[index];
        if (ch == '"') {
            if (in_quotes && index + 1 < line.size() && line[index + 1] == '"') {
                current.push_back('"');
                ++index;
                continue;
            }
            in_quotes = !in_quotes;
            continue;
        }
        if (ch == ',' && !in_quotes) {
            cells.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    cells.push_back(current);
    return cells;
}

CsvRecordSource::CsvRecordSource(InputConfig inputs) : inputs_(std::move(inputs)) {}

bool CsvRecordSource::LoadTrades(std::vector<Trade>* out, std::string* error) const {
    if (out == nullptr) {
        return SetError("trades output is null", error);
    }
    out->clear();
    if (inputs_.trades.empty()) {
        return true;
    }

    CsvFile file;
    if (!file.Open(inputs_.trades, error)) {
        return false;
    }
    GroupColumns group;
    std::size_t trade_id = 0;
    std::size_t trade_date = 0;
    std::size_t side = 0;
    std::size_t quantity = 0;
    std::size_t price = 0;
    if (!file.RequireColumn("trade_id", &trade_id, error) ||
        !RequireGroupColumns(file, &group, error) ||
        !file.RequireColumn("trade_date", &trade_date, error) ||
        !file.RequireColumn("side", &side, error) ||
        !file.RequireColumn("quantity", &quantity, error) ||
        !file.RequireColumn("price", &price, error)) {
        return false;
    }

    std::vector<std::string> cells;
    while (file.NextRow(&cells)) {
        Trade trade;
        std::string side_text;
        if (!file.Cell(cells, trade_id, "trade_id", &trade.trade_id, error) ||
            !ReadGroupCells(file, cells, group, &trade.customer_id, &trade.instrument_id,
                            &trade.currency, error) ||
            !file.DateCell(cells, trade_date, "trade_date", &trade.trade_date, error) ||
            !file.Cell(cells, side, "side", &side_text, error) ||
            !file.NumberCell(cells, quantity, "quantity", &trade.quantity, error) ||
            !file.NumberCell(cells, price, "price", &trade.price, error)) {
            return false;
        }
        if (!ParseSide(side_text, &trade.side)) {
            return SetError(file.Where() + ": unknown side '" + side_text + "'", error);
        }
        out->push_back(std::move(trade));
    }
    return true;
}

bool CsvRecordSource::LoadPositions(std::vector<PositionSnapshot>* out, std::string* error) const {
    if (out == nullptr) {
        return SetError("positions output is null", error);
    }
    out->clear();
    if (inputs_.positions.empty()) {
        return true;
    }

    CsvFile file;
    if (!file.Open(inputs_.positions, error)) {
        return false;
    }
    GroupColumns group;
    std::size_t as_of_date = 0;
    std::size_t quantity = 0;
    if (!RequireGroupColumns(file, &group, error) ||
        !file.RequireColumn("as_of_date", &as_of_date, error) ||
        !file.RequireColumn("position_quantity", &quantity, error)) {
        return false;
    }

    std::vector<std::string> cells;
    while (file.NextRow(&cells)) {
        PositionSnapshot row;
        if (!ReadGroupCells(file, cells, group, &row.customer_id, &row.instrument_id,
                            &row.currency, error) ||
            !file.DateCell(cells, as_of_date, "as_of_date", &row.as_of_date, error) ||
            !file.NumberCell(cells, quantity, "position_quantity", &row.quantity, error)) {
            return false;
        }
        out->push_back(std::move(row));
    }
    return true;
}

bool CsvRecordSource::LoadValuations(std::vector<ValuationSnapshot>* out,
                                     std::string* error) const {
    return LoadValuationFile(inputs_.valuations, false, out, error);
}

bool CsvRecordSource::LoadMtmTimeseries(std::vector<ValuationSnapshot>* out,
                                        std::string* error) const {
    return LoadValuationFile(inputs_.mtm_timeseries, true, out, error);
}

bool CsvRecordSource::LoadValuationFile(const std::string& path,
                                        bool require_date,
                                        std::vector<ValuationSnapshot>* out,
                                        std::string* error) const {
    if (out == nullptr) {
        return SetError("valuations output is null", error);
    }
    out->clear();
    if (path.empty()) {
        return true;
    }

    CsvFile file;
    if (!file.Open(path, error)) {
        return false;
    }
    GroupColumns group;
    std::size_t mtm = 0;
    std::size_t as_of_date = 0;
    bool has_date = false;
    if (!RequireGroupColumns(file, &group, error) || !file.RequireColumn("fo_mtm", &mtm, error)) {
        return false;
    }
    if (require_date) {
        if (!file.RequireColumn("as_of_date", &as_of_date, error)) {
            return false;
        }
        has_date = true;
    } else {
        has_date = file.FindColumn("as_of_date", &as_of_date);
    }

    std::vector<std::string> cells;
    while (file.NextRow(&cells)) {
        ValuationSnapshot row;
        if (!ReadGroupCells(file, cells, group, &row.customer_id, &row.instrument_id,
                            &row.currency, error) ||
            !file.NumberCell(cells, mtm, "fo_mtm", &row.mtm_amount, error)) {
            return false;
        }
        if (has_date && !file.DateCell(cells, as_of_date, "as_of_date", &row.as_of_date, error)) {
            return false;
        }
        out->push_back(std::move(row));
    }
    return true;
}

bool CsvRecordSource::LoadThinLedger(std::vector<ThinLedgerBalance>* out,
                                     std::string* error) const {
    if (out == nullptr) {
        return SetError("thin ledger output is null", error);
    }
    out->clear();
    if (inputs_.thin_ledger.empty()) {
        return true;
    }

    CsvFile file;
    if (!file.Open(inputs_.thin_ledger, error)) {
        return false;
    }
    std::size_t posting_date = 0;
    std::size_t account_code = 0;
    std::size_t currency = 0;
    std::size_t balance = 0;
    if (!file.RequireColumn("posting_date", &posting_date, error) ||
        !file.RequireColumn("account_code", &account_code, error) ||
        !file.RequireColumn("ccy", &currency, error) ||
        !file.RequireColumn("balance", &balance, error)) {
        return false;
    }

    std::vector<std::string> cells;
    while (file.NextRow(&cells)) {
        ThinLedgerBalance row;
        std::string account_text;
        if (!file.DateCell(cells, posting_date, "posting_date", &row.posting_date, error) ||
            !file.Cell(cells, account_code, "account_code", &account_text, error) ||
            !file.Cell(cells, currency, "ccy", &row.currency, error) ||
            !file.NumberCell(cells, balance, "balance", &row.balance, error)) {
            return false;
        }
        if (!ParseInt64(account_text, &row.account_code)) {
            return SetError(file.Where() + ": invalid account_code '" + account_text + "'", error);
        }
        out->push_back(std::move(row));
    }
    return true;
}

}  // namespace sec_subledger
