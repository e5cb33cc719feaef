#pragma once

#include <filesystem>
#include <string>

#include "sec_subledger/contracts/types.h"

namespace sec_subledger {

struct AccountCodes {
    AccountCode security_asset{200100};
    AccountCode cash{100000};
    AccountCode realized_pnl{300100};
    AccountCode revaluation{400200};
    AccountCode unrealized_pnl{400100};
};

enum class OversellPolicy {
    kIgnore,
    kReport,
    kReject,
};

enum class CostBasisPolicy {
    kPreserve,
    kResetWhenFlat,
};

enum class ValuationJoinMode {
    kSingleDate,
    kTimeSeries,
};

struct ControlConfig {
    double tolerance{1e-6};
    int difference_scale{6};
};

struct PolicyConfig {
    OversellPolicy oversell{OversellPolicy::kReport};
    CostBasisPolicy cost_basis{CostBasisPolicy::kPreserve};
};

struct RunConfig {
    std::string as_of_date;
    std::string valuation_as_of_date;
    ValuationJoinMode valuation_mode{ValuationJoinMode::kSingleDate};
    int max_concurrent{1};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string sink{"stderr"};
};

struct InputConfig {
    std::string trades;
    std::string positions;
    std::string valuations;
    std::string mtm_timeseries;
    std::string thin_ledger;
};

struct OutputConfig {
    std::string dir;
    std::string gl_parquet;
    // Prometheus text exposition of the run metrics; empty disables it.
    std::string metrics_file;
};

struct SubledgerConfig {
    std::filesystem::path config_path;
    AccountCodes accounts;
    ControlConfig controls;
    PolicyConfig policies;
    RunConfig run;
    LoggingConfig logging;
    InputConfig inputs;
    OutputConfig outputs;
};

bool ParseOversellPolicy(const std::string& raw, OversellPolicy* out);
bool ParseCostBasisPolicy(const std::string& raw, CostBasisPolicy* out);
bool ParseValuationJoinMode(const std::string& raw, ValuationJoinMode* out);
const char* ToString(OversellPolicy policy);
const char* ToString(CostBasisPolicy policy);
const char* ToString(ValuationJoinMode mode);

// Reads an indented YAML scalar map. Relative input and output paths are
// resolved against the directory holding the config file.
bool LoadSubledgerConfig(const std::string& yaml_path, SubledgerConfig* out, std::string* error);

}  // namespace sec_subledger
