#pragma once

#include <string>
#include <vector>

#include "sec_subledger/contracts/control_records.h"
#include "sec_subledger/contracts/types.h"
#include "sec_subledger/core/structured_log.h"
#include "sec_subledger/core/subledger_config.h"
#include "sec_subledger/interfaces/subledger_record_source.h"
#include "sec_subledger/services/fifo_lot_matcher.h"
#include "sec_subledger/services/trade_gl_control.h"

namespace sec_subledger {

struct SubledgerInputs {
    std::vector<Trade> trades;
    std::vector<PositionSnapshot> positions;
    std::vector<ValuationSnapshot> valuations;
    std::vector<ValuationSnapshot> mtm_timeseries;
    std::vector<ThinLedgerBalance> thin_ledger;
};

struct SubledgerBreakSummary {
    int position{0};
    int allocation{0};
    int trade_buy{0};
    int trade_sell{0};
    int mtm_level{0};
    int portfolio_mtm{0};
    int mtm_delta{0};
    int thin_ledger{0};
    int journal_daily{0};

    int total() const {
        return position + allocation + trade_buy + trade_sell + mtm_level + portfolio_mtm +
               mtm_delta + thin_ledger + journal_daily;
    }
};

struct SubledgerRunResult {
    std::vector<MatchedTrade> matched_trades;
    std::vector<OpenTrade> open_trades;
    std::vector<AllocatedTrade> allocated_trades;
    std::vector<GlPosting> trade_postings;
    std::vector<GlPosting> mtm_postings;
    // Trade postings followed by MTM postings.
    std::vector<GlPosting> gl_postings;
    std::vector<LedgerBalance> thin_ledger;

    std::vector<PositionControlRecord> position_control;
    std::vector<AllocationControlRecord> allocation_control;
    TradeGlControlResult trade_control;
    std::vector<MtmGlControlRecord> mtm_gl_control;
    std::vector<PortfolioMtmControlRecord> portfolio_mtm_control;
    std::vector<MtmDeltaControlRecord> mtm_delta_control;
    std::vector<ThinLedgerControlRecord> thin_ledger_control;
    std::vector<JournalDailyTotal> journal_daily_totals;

    std::vector<OversellRecord> oversells;
    std::vector<DegenerateSaleRecord> degenerate_sales;
    SubledgerBreakSummary breaks;
};

// One batch run: lot matching, position control, valuation allocation,
// trade and MTM journals, the thin ledger and every reconciliation control.
// Per-group work is spread over run.max_concurrent workers and merged in
// group-key order, so results do not depend on the worker count.
class SubledgerPipeline {
public:
    explicit SubledgerPipeline(SubledgerConfig config);

    bool Run(const ISubledgerRecordSource& source, SubledgerRunResult* out, std::string* error) const;
    bool Process(const SubledgerInputs& inputs, SubledgerRunResult* out, std::string* error) const;

    const SubledgerConfig& config() const { return config_; }

private:
    bool LoadInputs(const ISubledgerRecordSource& source,
                    SubledgerInputs* inputs,
                    std::string* error) const;
    bool BuildTradeSide(const std::vector<Trade>& trades,
                        SubledgerRunResult* out,
                        std::string* error) const;
    bool BuildMtmSide(const std::vector<ValuationSnapshot>& series,
                      SubledgerRunResult* out,
                      std::string* error) const;
    void CountBreaks(SubledgerRunResult* out) const;
    void LogRunSummary(const SubledgerRunResult& result) const;
    void RecordRunMetrics(const SubledgerRunResult& result, double elapsed_seconds) const;

    SubledgerConfig config_;
    StructuredLogger logger_;
};

}  // namespace sec_subledger
