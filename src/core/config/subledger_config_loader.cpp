#include "sec_subledger/core/subledger_config.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sec_subledger/core/date_text.h"
#include "sec_subledger/core/structured_log.h"

namespace sec_subledger {
namespace {

std::string Trim(std::string text) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
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

std::string StripInlineComment(const std::string& line) {
    bool in_single_quote = false;
    bool in_double_quote = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char ch = line[index];
        if (ch == '\'' && !in_double_quote) {
            in_single_quote = !in_single_quote;
            continue;
        }
        if (ch == '"' && !in_single_quote) {
            in_double_quote = !in_double_quote;
            continue;
        }
        if (ch == '#' && !in_single_quote && !in_double_quote) {
            return line.substr(0, index);
        }
    }
    return line;
}

std::string Unquote(const std::string& raw) {
    std::string text = Trim(raw);
    if (text.size() >= 2 && ((text.front() == '"' && text.back() == '"') ||
                             (text.front() == '\'' && text.back() == '\''))) {
        text = text.substr(1, text.size() - 2);
    }
    return text;
}

bool ParseInt(const std::string& raw, int* out) {
    const std::string text = Trim(raw);
    if (out == nullptr || text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const int value = std::stoi(text, &parsed);
        if (parsed != text.size()) {
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
        const std::int64_t value = std::stoll(text, &parsed);
        if (parsed != text.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(const std::string& raw, double* out) {
    const std::string text = Trim(raw);
    if (out == nullptr || text.empty()) {
        return false;
    }
    try {
        std::size_t parsed = 0;
        const double value = std::stod(text, &parsed);
        if (parsed != text.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool LoadYamlScalarMap(const std::filesystem::path& path,
                       std::map<std::string, std::string>* out,
                       std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "yaml output is null";
        }
        return false;
    }

    std::ifstream input(path);
    if (!input.is_open()) {
        if (error != nullptr) {
            *error = "unable to open subledger config: " + path.string();
        }
        return false;
    }

    out->clear();
    std::vector<std::pair<int, std::string>> scope_stack;
    std::string line;
    while (std::getline(input, line)) {
        const std::string no_comment = StripInlineComment(line);
        const std::string trimmed = Trim(no_comment);
        if (trimmed.empty() || trimmed.front() == '-') {
            continue;
        }

        const auto first_non_space = no_comment.find_first_not_of(' ');
        const int indent =
            first_non_space == std::string::npos ? 0 : static_cast<int>(first_non_space);
        while (!scope_stack.empty() && indent <= scope_stack.back().first) {
            scope_stack.pop_back();
        }

        const std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = Trim(trimmed.substr(0, colon));
        const std::string value = Trim(trimmed.substr(colon + 1));
        if (key.empty()) {
            continue;
        }
        if (value.empty()) {
            scope_stack.emplace_back(indent, key);
            continue;
        }

        std::ostringstream full_key;
        for (const auto& scope : scope_stack) {
            full_key << scope.second << '.';
        }
        full_key << key;
        (*out)[full_key.str()] = Unquote(value);
    }

    if (input.bad()) {
        if (error != nullptr) {
            *error = "failed reading subledger config: " + path.string();
        }
        return false;
    }
    return true;
}

std::optional<std::string> GetString(const std::map<std::string, std::string>& values,
                                     const std::string& key) {
    const auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ResolvePath(const std::filesystem::path& base_dir, const std::string& raw) {
    if (raw.empty()) {
        return "";
    }
    const std::filesystem::path path = raw;
    if (path.is_absolute()) {
        return path.lexically_normal().string();
    }
    return std::filesystem::absolute(base_dir / path).lexically_normal().string();
}

bool InvalidValue(const std::string& key, const std::string& raw, std::string* error) {
    if (error != nullptr) {
        *error = "invalid value for " + key + ": " + raw;
    }
    return false;
}

bool ReadAccount(const std::map<std::string, std::string>& values,
                 const std::string& key,
                 AccountCode* target,
                 std::string* error) {
    const auto raw = GetString(values, key);
    if (!raw.has_value()) {
        return true;
    }
    std::int64_t parsed = 0;
    if (!ParseInt64(raw.value(), &parsed) || parsed <= 0) {
        return InvalidValue(key, raw.value(), error);
    }
    *target = parsed;
    return true;
}

bool ReadDate(const std::map<std::string, std::string>& values,
              const std::string& key,
              std::string* target,
              std::string* error) {
    const auto raw = GetString(values, key);
    if (!raw.has_value() || raw->empty()) {
        return true;
    }
    if (!NormalizeIsoDate(raw.value(), target)) {
        return InvalidValue(key, raw.value(), error);
    }
    return true;
}

std::string InputPath(const std::map<std::string, std::string>& values,
                      const std::filesystem::path& base_dir,
                      const std::string& key,
                      const std::string& data_dir,
                      const std::string& default_file) {
    const auto raw = GetString(values, key);
    if (raw.has_value()) {
        return ResolvePath(base_dir, raw.value());
    }
    if (data_dir.empty()) {
        return "";
    }
    // data_dir supplies only the feeds that are actually present.
    const std::filesystem::path candidate =
        (std::filesystem::path(data_dir) / default_file).lexically_normal();
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return "";
    }
    return candidate.string();
}

bool AccountsAreDistinct(const AccountCodes& accounts) {
    std::vector<AccountCode> codes{accounts.security_asset,
                                   accounts.cash,
                                   accounts.realized_pnl,
                                   accounts.revaluation,
                                   accounts.unrealized_pnl};
    std::sort(codes.begin(), codes.end());
    return std::adjacent_find(codes.begin(), codes.end()) == codes.end();
}

}  // namespace

bool ParseOversellPolicy(const std::string& raw, OversellPolicy* out) {
    if (out == nullptr) {
        return false;
    }
    const std::string normalized = ToLower(Trim(raw));
    if (normalized == "ignore") {
        *out = OversellPolicy::kIgnore;
        return true;
    }
    if (normalized == "report") {
        *out = OversellPolicy::kReport;
        return true;
    }
    if (normalized == "reject") {
        *out = OversellPolicy::kReject;
        return true;
    }
    return false;
}

bool ParseCostBasisPolicy(const std::string& raw, CostBasisPolicy* out) {
    if (out == nullptr) {
        return false;
    }
    const std::string normalized = ToLower(Trim(raw));
    if (normalized == "preserve") {
        *out = CostBasisPolicy::kPreserve;
        return true;
    }
    if (normalized == "reset_when_flat") {
        *out = CostBasisPolicy::kResetWhenFlat;
        return true;
    }
    return false;
}

bool ParseValuationJoinMode(const std::string& raw, ValuationJoinMode* out) {
    if (out == nullptr) {
        return false;
    }
    const std::string normalized = ToLower(Trim(raw));
    if (normalized == "single" || normalized == "single_date") {
        *out = ValuationJoinMode::kSingleDate;
        return true;
    }
    if (normalized == "timeseries" || normalized == "time_series") {
        *out = ValuationJoinMode::kTimeSeries;
        return true;
    }
    return false;
}

const char* ToString(OversellPolicy policy) {
    switch (policy) {
        case OversellPolicy::kIgnore:
            return "ignore";
        case OversellPolicy::kReport:
            return "report";
        case OversellPolicy::kReject:
            return "reject";
    }
    return "report";
}

const char* ToString(CostBasisPolicy policy) {
    return policy == CostBasisPolicy::kResetWhenFlat ? "reset_when_flat" : "preserve";
}

const char* ToString(ValuationJoinMode mode) {
    return mode == ValuationJoinMode::kTimeSeries ? "timeseries" : "single";
}

bool LoadSubledgerConfig(const std::string& yaml_path, SubledgerConfig* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "subledger config output is null";
        }
        return false;
    }

    const std::filesystem::path config_path =
        std::filesystem::absolute(yaml_path).lexically_normal();
    const std::filesystem::path config_dir = config_path.parent_path();

    std::map<std::string, std::string> values;
    if (!LoadYamlScalarMap(config_path, &values, error)) {
        return false;
    }

    SubledgerConfig config;
    config.config_path = config_path;

    if (!ReadAccount(values, "accounts.security_asset", &config.accounts.security_asset, error) ||
        !ReadAccount(values, "accounts.cash", &config.accounts.cash, error) ||
        !ReadAccount(values, "accounts.realized_pnl", &config.accounts.realized_pnl, error) ||
        !ReadAccount(values, "accounts.revaluation", &config.accounts.revaluation, error) ||
        !ReadAccount(values, "accounts.unrealized_pnl", &config.accounts.unrealized_pnl, error)) {
        return false;
    }
    if (!AccountsAreDistinct(config.accounts)) {
        if (error != nullptr) {
            *error = "accounts must use five distinct account codes";
        }
        return false;
    }

    if (const auto raw = GetString(values, "controls.tolerance")) {
        if (!ParseDouble(raw.value(), &config.controls.tolerance) ||
            config.controls.tolerance < 0.0) {
            return InvalidValue("controls.tolerance", raw.value(), error);
        }
    }
    if (const auto raw = GetString(values, "controls.difference_scale")) {
        if (!ParseInt(raw.value(), &config.controls.difference_scale) ||
            config.controls.difference_scale < 0 || config.controls.difference_scale > 12) {
            return InvalidValue("controls.difference_scale", raw.value(), error);
        }
    }

    if (const auto raw = GetString(values, "policies.oversell")) {
        if (!ParseOversellPolicy(raw.value(), &config.policies.oversell)) {
            return InvalidValue("policies.oversell", raw.value(), error);
        }
    }
    if (const auto raw = GetString(values, "policies.cost_basis")) {
        if (!ParseCostBasisPolicy(raw.value(), &config.policies.cost_basis)) {
            return InvalidValue("policies.cost_basis", raw.value(), error);
        }
    }

    if (!ReadDate(values, "run.as_of_date", &config.run.as_of_date, error) ||
        !ReadDate(values, "run.valuation_as_of_date", &config.run.valuation_as_of_date, error)) {
        return false;
    }
    if (const auto raw = GetString(values, "run.valuation_mode")) {
        if (!ParseValuationJoinMode(raw.value(), &config.run.valuation_mode)) {
            return InvalidValue("run.valuation_mode", raw.value(), error);
        }
    }
    if (const auto raw = GetString(values, "run.max_concurrent")) {
        if (!ParseInt(raw.value(), &config.run.max_concurrent) || config.run.max_concurrent <= 0) {
            return InvalidValue("run.max_concurrent", raw.value(), error);
        }
    }

    if (const auto raw = GetString(values, "logging.level")) {
        LogLevel level = LogLevel::kInfo;
        if (!ParseLogLevel(raw.value(), &level)) {
            return InvalidValue("logging.level", raw.value(), error);
        }
        config.logging.level = ToString(level);
    }
    if (const auto raw = GetString(values, "logging.sink")) {
        const std::string sink = ToLower(raw.value());
        if (sink != "stderr" && sink != "stdout") {
            return InvalidValue("logging.sink", raw.value(), error);
        }
        config.logging.sink = sink;
    }

    std::string data_dir;
    if (const auto raw = GetString(values, "inputs.data_dir")) {
        data_dir = ResolvePath(config_dir, raw.value());
    }
    config.inputs.trades =
        InputPath(values, config_dir, "inputs.trades", data_dir, "sec_trades.csv");
    config.inputs.positions =
        InputPath(values, config_dir, "inputs.positions", data_dir, "sec_positions.csv");
    config.inputs.valuations =
        InputPath(values, config_dir, "inputs.valuations", data_dir, "fo_sec_positions.csv");
    config.inputs.mtm_timeseries =
        InputPath(values, config_dir, "inputs.mtm_timeseries", data_dir, "fo_mtm_timeseries.csv");
    // The thin ledger is an optional external feed, never defaulted from data_dir.
    if (const auto raw = GetString(values, "inputs.thin_ledger")) {
        config.inputs.thin_ledger = ResolvePath(config_dir, raw.value());
    }

    if (const auto raw = GetString(values, "outputs.dir")) {
        config.outputs.dir = ResolvePath(config_dir, raw.value());
    }
    if (const auto raw = GetString(values, "outputs.gl_parquet")) {
        config.outputs.gl_parquet = ResolvePath(config_dir, raw.value());
    }
    if (const auto raw = GetString(values, "outputs.metrics_file")) {
        config.outputs.metrics_file = ResolvePath(config_dir, raw.value());
    }

    if (config.inputs.trades.empty()) {
        if (error != nullptr) {
            *error = "inputs.trades (or inputs.data_dir) is required";
        }
        return false;
    }

    *out = std::move(config);
    return true;
}

}  // namespace sec_subledger
