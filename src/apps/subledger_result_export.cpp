#include "sec_subledger/apps/subledger_result_export.h"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "sec_subledger/apps/cli_support.h"
#include "sec_subledger/core/csv_record_writer.h"
#include "sec_subledger/core/gl_posting_parquet_writer.h"

namespace sec_subledger::apps {
namespace {

bool WriteGlParquet(const std::vector<GlPosting>& postings,
                    const std::string& output_path,
                    std::string* error) {
    GlPostingParquetWriter writer;
    if (!writer.Open(output_path, error)) {
        return false;
    }
    for (const auto& posting : postings) {
        if (!writer.Append(posting, error)) {
            return false;
        }
    }
    return writer.Close(error);
}

void AppendBreakLine(std::ostringstream* oss, const char* name, int count) {
    (*oss) << "  " << std::left << std::setw(16) << name << std::right << std::setw(6) << count
           << '\n';
}

}  // namespace

bool ExportRunResult(const SubledgerRunResult& result,
                     const SubledgerConfig& config,
                     const std::string& output_dir,
                     std::vector<std::string>* written_files,
                     std::string* error) {
    if (output_dir.empty()) {
        return true;
    }

    CsvRecordWriter writer(output_dir);
    const bool ok =
        writer.WriteOpenTrades(result.open_trades, error) &&
        writer.WriteAllocatedTrades(result.allocated_trades, error) &&
        writer.WriteGlPostings("gl_trade_postings.csv", result.trade_postings, error) &&
        writer.WriteGlPostings("gl_mtm_postings.csv", result.mtm_postings, error) &&
        writer.WriteGlPostings("gl_postings.csv", result.gl_postings, error) &&
        writer.WriteThinLedger(result.thin_ledger, error) &&
        writer.WritePositionControl(result.position_control, error) &&
        writer.WriteAllocationControl(result.allocation_control, error) &&
        writer.WriteBuyTradeControl(result.trade_control.buys, error) &&
        writer.WriteSellTradeControl(result.trade_control.sells, error) &&
        writer.WriteMtmGlControl(result.mtm_gl_control, error) &&
        writer.WritePortfolioMtmControl(result.portfolio_mtm_control, error) &&
        writer.WriteMtmDeltaControl(result.mtm_delta_control, error) &&
        writer.WriteThinLedgerControl(result.thin_ledger_control, error) &&
        writer.WriteJournalDailyTotals(result.journal_daily_totals, error) &&
        writer.WriteOversells(result.oversells, error) &&
        writer.WriteDegenerateSales(result.degenerate_sales, error);
    if (!ok) {
        return false;
    }

    std::vector<std::string> files = writer.written_files();
    const std::string summary_path =
        (std::filesystem::path(output_dir) / "run_summary.json").string();
    if (!WriteTextFile(summary_path, RenderRunSummaryJson(result, config), error)) {
        return false;
    }
    files.push_back(summary_path);

    if (!config.outputs.gl_parquet.empty()) {
        if (!WriteGlParquet(result.gl_postings, config.outputs.gl_parquet, error)) {
            return false;
        }
        files.push_back(config.outputs.gl_parquet);
    }

    if (written_files != nullptr) {
        *written_files = std::move(files);
    }
    return true;
}

std::string RenderRunSummaryJson(const SubledgerRunResult& result, const SubledgerConfig& config) {
    const auto& breaks = result.breaks;
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"generated_ts_ms\": " << UnixEpochMillisNow() << ",\n";
    oss << "  \"config_path\": \"" << JsonEscape(config.config_path.string()) << "\",\n";
    oss << "  \"as_of_date\": \"" << JsonEscape(config.run.as_of_date) << "\",\n";
    oss << "  \"valuation_mode\": \"" << ToString(config.run.valuation_mode) << "\",\n";
    oss << "  \"oversell_policy\": \"" << ToString(config.policies.oversell) << "\",\n";
    oss << "  \"cost_basis_policy\": \"" << ToString(config.policies.cost_basis) << "\",\n";
    oss << "  \"counts\": {\n";
    oss << "    \"matched_trades\": " << result.matched_trades.size() << ",\n";
    oss << "    \"open_trades\": " << result.open_trades.size() << ",\n";
    oss << "    \"allocated_trades\": " << result.allocated_trades.size() << ",\n";
    oss << "    \"trade_postings\": " << result.trade_postings.size() << ",\n";
    oss << "    \"mtm_postings\": " << result.mtm_postings.size() << ",\n";
    oss << "    \"thin_ledger_rows\": " << result.thin_ledger.size() << ",\n";
    oss << "    \"oversells\": " << result.oversells.size() << ",\n";
    oss << "    \"degenerate_sales\": " << result.degenerate_sales.size() << "\n";
    oss << "  },\n";
    oss << "  \"breaks\": {\n";
    oss << "    \"position\": " << breaks.position << ",\n";
    oss << "    \"allocation\": " << breaks.allocation << ",\n";
    oss << "    \"trade_buy\": " << breaks.trade_buy << ",\n";
    oss << "    \"trade_sell\": " << breaks.trade_sell << ",\n";
    oss << "    \"mtm_level\": " << breaks.mtm_level << ",\n";
    oss << "    \"portfolio_mtm\": " << breaks.portfolio_mtm << ",\n";
    oss << "    \"mtm_delta\": " << breaks.mtm_delta << ",\n";
    oss << "    \"thin_ledger\": " << breaks.thin_ledger << ",\n";
    oss << "    \"journal_daily\": " << breaks.journal_daily << ",\n";
    oss << "    \"total\": " << breaks.total() << "\n";
    oss << "  }\n";
    oss << "}\n";
    return oss.str();
}

std::string RenderBreakSummaryText(const SubledgerBreakSummary& breaks) {
    std::ostringstream oss;
    oss << "control breaks\n";
    AppendBreakLine(&oss, "position", breaks.position);
    AppendBreakLine(&oss, "allocation", breaks.allocation);
    AppendBreakLine(&oss, "trade_buy", breaks.trade_buy);
    AppendBreakLine(&oss, "trade_sell", breaks.trade_sell);
    AppendBreakLine(&oss, "mtm_level", breaks.mtm_level);
    AppendBreakLine(&oss, "portfolio_mtm", breaks.portfolio_mtm);
    AppendBreakLine(&oss, "mtm_delta", breaks.mtm_delta);
    AppendBreakLine(&oss, "thin_ledger", breaks.thin_ledger);
    AppendBreakLine(&oss, "journal_daily", breaks.journal_daily);
    AppendBreakLine(&oss, "total", breaks.total());
    return oss.str();
}

}  // namespace sec_subledger::apps
