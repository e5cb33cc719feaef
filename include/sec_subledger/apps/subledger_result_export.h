#pragma once

#include <string>
#include <vector>

#include "sec_subledger/core/subledger_config.h"
#include "sec_subledger/services/subledger_pipeline.h"

namespace sec_subledger::apps {

// Writes every record set of a run as CSV under output_dir and, when
// outputs.gl_parquet is set, the combined journal as Parquet.
bool ExportRunResult(const SubledgerRunResult& result,
                     const SubledgerConfig& config,
                     const std::string& output_dir,
                     std::vector<std::string>* written_files,
                     std::string* error);

// Record counts and per-control break counts as a JSON object.
std::string RenderRunSummaryJson(const SubledgerRunResult& result, const SubledgerConfig& config);

// Human-readable break table printed by the CLI.
std::string RenderBreakSummaryText(const SubledgerBreakSummary& breaks);

}  // namespace sec_subledger::apps
