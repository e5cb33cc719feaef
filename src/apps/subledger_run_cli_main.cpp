#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "sec_subledger/apps/cli_support.h"
#include "sec_subledger/apps/subledger_result_export.h"
#include "sec_subledger/core/csv_record_source.h"
#include "sec_subledger/core/structured_log.h"
#include "sec_subledger/core/subledger_config.h"
#include "sec_subledger/monitoring/metric_registry.h"
#include "sec_subledger/services/subledger_pipeline.h"

namespace {

constexpr const char* kLogApp = "subledger_run_cli";

const std::set<std::string> kKnownOptions = {
    "config",         "as-of-date", "valuation-as-of-date", "output-dir",
    "max-concurrent", "log-level",  "fail-on-break",        "help",
};

bool ApplyOverrides(const sec_subledger::apps::ArgMap& args,
                    sec_subledger::SubledgerConfig* config,
                    std::string* error) {
    using sec_subledger::apps::GetArg;
    using sec_subledger::apps::GetDateArg;
    if (!GetDateArg(args, "as-of-date", &config->run.as_of_date, error) ||
        !GetDateArg(args, "valuation-as-of-date", &config->run.valuation_as_of_date, error) ||
        !sec_subledger::apps::GetPositiveIntArg(
            args, "max-concurrent", &config->run.max_concurrent, error)) {
        return false;
    }
    const std::string output_dir = GetArg(args, "output-dir");
    if (!output_dir.empty()) {
        config->outputs.dir = output_dir;
    }
    const std::string log_level = GetArg(args, "log-level");
    if (!log_level.empty()) {
        sec_subledger::LogLevel level = sec_subledger::LogLevel::kInfo;
        if (!sec_subledger::ParseLogLevel(log_level, &level)) {
            if (error != nullptr) {
                *error = "invalid value for --log-level: " + log_level;
            }
            return false;
        }
        config->logging.level = sec_subledger::ToString(level);
    }
    return true;
}

void PrintUsage() {
    std::cerr << "usage: subledger_run_cli --config <yaml> [--as-of-date YYYY-MM-DD]\n"
                 "         [--valuation-as-of-date YYYY-MM-DD] [--output-dir DIR]\n"
                 "         [--max-concurrent N] [--log-level LEVEL] [--fail-on-break]\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace sec_subledger;
    const StructuredLogger bootstrap_log(kLogApp);
    apps::ArgMap args;
    std::string error;
    if (!apps::ParseArgs(argc, argv, kKnownOptions, &args, &error)) {
        bootstrap_log.Error("invalid_arguments", {{"error", error}});
        PrintUsage();
        return 1;
    }
    if (apps::HasArg(args, "help")) {
        PrintUsage();
        return 0;
    }

    const std::string config_path = apps::GetArg(args, "config");
    if (config_path.empty()) {
        bootstrap_log.Error("invalid_arguments", {{"error", "--config is required"}});
        PrintUsage();
        return 1;
    }

    SubledgerConfig config;
    if (!LoadSubledgerConfig(config_path, &config, &error)) {
        bootstrap_log.Error("config_load_failed", {{"config_path", config_path}, {"error", error}});
        return 1;
    }
    if (!ApplyOverrides(args, &config, &error)) {
        bootstrap_log.Error("invalid_arguments", {{"error", error}});
        return 1;
    }
    const StructuredLogger log(kLogApp, config.logging);

    const CsvRecordSource source(config.inputs);
    const SubledgerPipeline pipeline(config);
    SubledgerRunResult result;
    if (!pipeline.Run(source, &result, &error)) {
        log.Error("run_failed", {{"error", error}});
        return 1;
    }

    std::vector<std::string> written_files;
    if (!apps::ExportRunResult(result, config, config.outputs.dir, &written_files, &error)) {
        log.Error("export_failed", {{"output_dir", config.outputs.dir}, {"error", error}});
        return 1;
    }
    log.Info("export_done", {{"output_dir", config.outputs.dir},
                             {"files", std::to_string(written_files.size())}});

    const std::string& metrics_file = config.outputs.metrics_file;
    if (!metrics_file.empty()) {
        if (MetricRegistry::Instance().WriteTextFile(metrics_file, &error)) {
            log.Info("metrics_written", {{"path", metrics_file}});
        } else {
            log.Warn("metrics_write_failed", {{"path", metrics_file}, {"error", error}});
        }
    }

    std::cout << apps::RenderBreakSummaryText(result.breaks);
    if (apps::HasArg(args, "fail-on-break") && result.breaks.total() > 0) {
        return 2;
    }
    return 0;
}
