#include "sec_subledger/services/subledger_pipeline.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <map>
#include <utility>

#include "sec_subledger/core/group_partition.h"
#include "sec_subledger/core/group_task_scheduler.h"
#include "sec_subledger/monitoring/metric_registry.h"
#include "sec_subledger/services/allocation_control.h"
#include "sec_subledger/services/average_cost_gl_poster.h"
#include "sec_subledger/services/ledger_aggregator.h"
#include "sec_subledger/services/ledger_controls.h"
#include "sec_subledger/services/mtm_gl_control.h"
#include "sec_subledger/services/mtm_rollforward_poster.h"
#include "sec_subledger/services/open_trade_view.h"
#include "sec_subledger/services/position_control.h"
#include "sec_subledger/services/valuation_allocator.h"

namespace sec_subledger {
namespace {

struct GroupTradeOutcome {
    bool ok{true};
    std::string error;
    LotMatchResult match;
    TradePostingResult posting;
};

struct GroupMtmOutcome {
    bool ok{true};
    std::string error;
    std::vector<GlPosting> postings;
};

template <typename Record>
std::vector<GroupKey> GroupKeys(const std::map<GroupKey, std::vector<Record>>& groups) {
    std::vector<GroupKey> keys;
    keys.reserve(groups.size());
    for (const auto& [key, rows] : groups) {
        (void)rows;
        keys.push_back(key);
    }
    return keys;
}

template <typename Record>
int CountBreakRows(const std::vector<Record>& rows) {
    return static_cast<int>(
        std::count_if(rows.begin(), rows.end(), [](const Record& row) { return row.is_break; }));
}

std::string GroupLabel(const GroupKey& group) {
    return group.customer_id + "/" + group.instrument_id + "/" + group.currency;
}

template <typename Record>
std::vector<Record> FilterDatedAsOf(const std::vector<Record>& rows,
                                    const std::string& as_of_date,
                                    std::string Record::*date_field) {
    if (as_of_date.empty()) {
        return rows;
    }
    std::vector<Record> filtered;
    filtered.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.*date_field <= as_of_date) {
            filtered.push_back(row);
        }
    }
    return filtered;
}

}  // namespace

SubledgerPipeline::SubledgerPipeline(SubledgerConfig config)
    : config_(std::move(config)), logger_("subledger_pipeline", config_.logging) {}

bool SubledgerPipeline::Run(const ISubledgerRecordSource& source,
                            SubledgerRunResult* out,
                            std::string* error) const {
    SubledgerInputs inputs;
    if (!LoadInputs(source, &inputs, error)) {
        logger_.Error("input_load_failed",
                      {{"error", error == nullptr ? std::string() : *error}});
        return false;
    }
    return Process(inputs, out, error);
}

bool SubledgerPipeline::LoadInputs(const ISubledgerRecordSource& source,
                                   SubledgerInputs* inputs,
                                   std::string* error) const {
    return source.LoadTrades(&inputs->trades, error) &&
           source.LoadPositions(&inputs->positions, error) &&
           source.LoadValuations(&inputs->valuations, error) &&
           source.LoadMtmTimeseries(&inputs->mtm_timeseries, error) &&
           source.LoadThinLedger(&inputs->thin_ledger, error);
}

bool SubledgerPipeline::Process(const SubledgerInputs& inputs,
                                SubledgerRunResult* out,
                                std::string* error) const {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "run result pointer is null";
        }
        return false;
    }
    *out = SubledgerRunResult{};
    const auto started = std::chrono::steady_clock::now();

    const std::string& as_of_date = config_.run.as_of_date;
    logger_.Info("run_start",
                 {{"as_of_date", as_of_date.empty() ? "all" : as_of_date},
                  {"trades", std::to_string(inputs.trades.size())},
                  {"positions", std::to_string(inputs.positions.size())},
                  {"valuations", std::to_string(inputs.valuations.size())},
                  {"mtm_rows", std::to_string(inputs.mtm_timeseries.size())},
                  {"thin_ledger_rows", std::to_string(inputs.thin_ledger.size())},
                  {"max_concurrent", std::to_string(config_.run.max_concurrent)},
                  {"valuation_mode", ToString(config_.run.valuation_mode)}});

    const auto trades = FilterTradesAsOf(inputs.trades, as_of_date);
    if (!BuildTradeSide(trades, out, error)) {
        return false;
    }

    out->position_control =
        PositionControl(config_.controls).Build(out->matched_trades, inputs.positions, as_of_date);

    out->open_trades = SelectOpenTrades(out->matched_trades);
    const ValuationAllocator allocator(config_.run.valuation_mode);
    if (!allocator.Allocate(out->open_trades, inputs.valuations, config_.run.valuation_as_of_date,
                            &out->allocated_trades, error)) {
        logger_.Error("allocation_failed",
                      {{"error", error == nullptr ? std::string() : *error}});
        return false;
    }
    out->allocation_control = AllocationControl(config_.controls).Build(out->allocated_trades);

    out->trade_control =
        TradeGlControl(config_.accounts, config_.controls).Build(trades, out->trade_postings);

    const auto series =
        FilterDatedAsOf(inputs.mtm_timeseries, as_of_date, &ValuationSnapshot::as_of_date);
    if (!BuildMtmSide(series, out, error)) {
        return false;
    }
    const MtmGlControl mtm_control(config_.accounts, config_.controls);
    out->mtm_gl_control = mtm_control.Build(series, out->mtm_postings);
    out->portfolio_mtm_control = mtm_control.BuildPortfolio(out->mtm_gl_control);
    out->mtm_delta_control = mtm_control.BuildDelta(series, out->mtm_postings);

    out->gl_postings.reserve(out->trade_postings.size() + out->mtm_postings.size());
    out->gl_postings.insert(out->gl_postings.end(), out->trade_postings.begin(),
                            out->trade_postings.end());
    out->gl_postings.insert(out->gl_postings.end(), out->mtm_postings.begin(),
                            out->mtm_postings.end());
    out->thin_ledger = AggregateThinLedger(out->gl_postings);

    const LedgerControls ledger_controls(config_.controls);
    const auto thin_ledger =
        FilterDatedAsOf(inputs.thin_ledger, as_of_date, &ThinLedgerBalance::posting_date);
    out->thin_ledger_control = ledger_controls.BuildThinLedgerControl(thin_ledger, out->thin_ledger);
    out->journal_daily_totals = ledger_controls.BuildJournalDailyTotals(out->gl_postings);

    CountBreaks(out);
    LogRunSummary(*out);
    RecordRunMetrics(
        *out, std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    return true;
}

bool SubledgerPipeline::BuildTradeSide(const std::vector<Trade>& trades,
                                       SubledgerRunResult* out,
                                       std::string* error) const {
    const auto groups = PartitionByGroup(trades);
    const auto keys = GroupKeys(groups);
    const FifoLotMatcher matcher(config_.policies.oversell);
    const AverageCostGlPoster poster(config_.accounts, config_.policies.cost_basis);

    const std::function<GroupTradeOutcome(std::size_t)> task = [&](std::size_t index) {
        GroupTradeOutcome outcome;
        const auto& group_trades = groups.at(keys[index]);
        outcome.ok = matcher.MatchGroup(group_trades, &outcome.match, &outcome.error);
        if (outcome.ok) {
            outcome.posting = poster.PostGroup(group_trades);
        }
        return outcome;
    };
    auto outcomes = GroupTaskScheduler(config_.run.max_concurrent)
                        .RunOrdered<GroupTradeOutcome>(keys.size(), task);

    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        auto& outcome = outcomes[index];
        if (!outcome.ok) {
            logger_.Error("lot_matching_failed",
                          {{"group", GroupLabel(keys[index])}, {"error", outcome.error}});
            if (error != nullptr) {
                *error = outcome.error;
            }
            return false;
        }
        auto& matched = outcome.match.trades;
        out->matched_trades.insert(out->matched_trades.end(),
                                   std::make_move_iterator(matched.begin()),
                                   std::make_move_iterator(matched.end()));
        out->oversells.insert(out->oversells.end(), outcome.match.oversells.begin(),
                              outcome.match.oversells.end());
        auto& postings = outcome.posting.postings;
        out->trade_postings.insert(out->trade_postings.end(),
                                   std::make_move_iterator(postings.begin()),
                                   std::make_move_iterator(postings.end()));
        out->degenerate_sales.insert(out->degenerate_sales.end(),
                                     outcome.posting.degenerate_sales.begin(),
                                     outcome.posting.degenerate_sales.end());
    }
    SortTradePostings(&out->trade_postings);

    for (const auto& oversell : out->oversells) {
        logger_.Warn("oversell",
                     {{"group", GroupLabel(oversell.group)},
                      {"trade_id", oversell.trade_id},
                      {"trade_date", oversell.trade_date},
                      {"sell_quantity", LogNumber(oversell.sell_quantity)},
                      {"unmatched_quantity", LogNumber(oversell.unmatched_quantity)}});
    }
    for (const auto& sale : out->degenerate_sales) {
        logger_.Warn("sale_without_inventory",
                     {{"group", GroupLabel(sale.group)},
                      {"trade_id", sale.trade_id},
                      {"trade_date", sale.trade_date},
                      {"quantity_before", LogNumber(sale.quantity_before)},
                      {"cost_basis_before", LogNumber(sale.cost_basis_before)},
                      {"fallback_price", LogNumber(sale.fallback_price)}});
    }
    return true;
}

bool SubledgerPipeline::BuildMtmSide(const std::vector<ValuationSnapshot>& series,
                                     SubledgerRunResult* out,
                                     std::string* error) const {
    const auto groups = PartitionByGroup(series);
    const auto keys = GroupKeys(groups);
    const MtmRollForwardPoster poster(config_.accounts);

    const std::function<GroupMtmOutcome(std::size_t)> task = [&](std::size_t index) {
        GroupMtmOutcome outcome;
        outcome.ok = poster.PostGroup(groups.at(keys[index]), &outcome.postings, &outcome.error);
        return outcome;
    };
    auto outcomes = GroupTaskScheduler(config_.run.max_concurrent)
                        .RunOrdered<GroupMtmOutcome>(keys.size(), task);

    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        auto& outcome = outcomes[index];
        if (!outcome.ok) {
            logger_.Error("mtm_posting_failed",
                          {{"group", GroupLabel(keys[index])}, {"error", outcome.error}});
            if (error != nullptr) {
                *error = outcome.error;
            }
            return false;
        }
        out->mtm_postings.insert(out->mtm_postings.end(),
                                 std::make_move_iterator(outcome.postings.begin()),
                                 std::make_move_iterator(outcome.postings.end()));
    }
    SortMtmPostings(&out->mtm_postings);
    return true;
}

void SubledgerPipeline::CountBreaks(SubledgerRunResult* out) const {
    auto& breaks = out->breaks;
    breaks.position = CountBreakRows(out->position_control);
    breaks.allocation = CountBreakRows(out->allocation_control);
    breaks.trade_buy = CountBreakRows(out->trade_control.buys);
    breaks.trade_sell = CountBreakRows(out->trade_control.sells);
    breaks.mtm_level = CountBreakRows(out->mtm_gl_control);
    breaks.portfolio_mtm = CountBreakRows(out->portfolio_mtm_control);
    breaks.mtm_delta = CountBreakRows(out->mtm_delta_control);
    breaks.thin_ledger = CountBreakRows(out->thin_ledger_control);
    breaks.journal_daily = CountBreakRows(out->journal_daily_totals);
}

void SubledgerPipeline::LogRunSummary(const SubledgerRunResult& result) const {
    const auto& breaks = result.breaks;
    logger_.Log(breaks.total() > 0 ? LogLevel::kWarn : LogLevel::kInfo,
                "control_breaks",
                {{"position", std::to_string(breaks.position)},
                 {"allocation", std::to_string(breaks.allocation)},
                 {"trade_buy", std::to_string(breaks.trade_buy)},
                 {"trade_sell", std::to_string(breaks.trade_sell)},
                 {"mtm_level", std::to_string(breaks.mtm_level)},
                 {"portfolio_mtm", std::to_string(breaks.portfolio_mtm)},
                 {"mtm_delta", std::to_string(breaks.mtm_delta)},
                 {"thin_ledger", std::to_string(breaks.thin_ledger)},
                 {"journal_daily", std::to_string(breaks.journal_daily)}});
    logger_.Info("run_finish",
                 {{"open_trades", std::to_string(result.open_trades.size())},
                  {"allocated_rows", std::to_string(result.allocated_trades.size())},
                  {"trade_postings", std::to_string(result.trade_postings.size())},
                  {"mtm_postings", std::to_string(result.mtm_postings.size())},
                  {"ledger_rows", std::to_string(result.thin_ledger.size())},
                  {"oversells", std::to_string(result.oversells.size())},
                  {"degenerate_sales", std::to_string(result.degenerate_sales.size())},
                  {"total_breaks", std::to_string(breaks.total())}});
}

void SubledgerPipeline::RecordRunMetrics(const SubledgerRunResult& result,
                                         double elapsed_seconds) const {
    auto& registry = MetricRegistry::Instance();
    registry.Counter("sec_subledger_runs_total", "Completed subledger batch runs")->Increment();
    registry
        .Histogram("sec_subledger_run_duration_seconds", "Wall time of one subledger batch run",
                   {0.01, 0.1, 1.0, 10.0, 60.0, 300.0})
        ->Observe(elapsed_seconds);

    const auto& breaks = result.breaks;
    const std::vector<std::pair<std::string, int>> break_counts = {
        {"position", breaks.position},
        {"allocation", breaks.allocation},
        {"trade_buy", breaks.trade_buy},
        {"trade_sell", breaks.trade_sell},
        {"mtm_level", breaks.mtm_level},
        {"portfolio_mtm", breaks.portfolio_mtm},
        {"mtm_delta", breaks.mtm_delta},
        {"thin_ledger", breaks.thin_ledger},
        {"journal_daily", breaks.journal_daily},
    };
    for (const auto& [control, count] : break_counts) {
        registry
            .Gauge("sec_subledger_control_breaks", "Break rows per control in the last run",
                   {{"control", control}})
            ->Set(static_cast<double>(count));
    }

    const std::vector<std::pair<std::string, std::size_t>> record_counts = {
        {"open_trades", result.open_trades.size()},
        {"gl_postings", result.gl_postings.size()},
        {"ledger_balances", result.thin_ledger.size()},
        {"oversells", result.oversells.size()},
        {"degenerate_sales", result.degenerate_sales.size()},
    };
    for (const auto& [kind, count] : record_counts) {
        registry
            .Gauge("sec_subledger_output_records", "Records produced by the last run",
                   {{"kind", kind}})
            ->Set(static_cast<double>(count));
    }
}

}  // namespace sec_subledger
