#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "sec_subledger/core/subledger_config.h"

namespace sec_subledger {

enum class LogLevel {
    kDebug = 10,
    kInfo = 20,
    kWarn = 30,
    kError = 40,
};

using LogFields = std::vector<std::pair<std::string, std::string>>;

// debug | info | warn | warning | error, any case.
bool ParseLogLevel(const std::string& raw, LogLevel* out);
const char* ToString(LogLevel level);

std::string LogNumber(double value);

// Emits one line per event:
//   ts_ns=<ns> level=<level> app=<app> event=<event> key="value" ...
// Events below the configured level are dropped. Lines from concurrent
// callers never interleave.
class StructuredLogger {
public:
    // Info level to stderr; used before a config is available.
    explicit StructuredLogger(std::string app);
    StructuredLogger(std::string app, const LoggingConfig& logging);

    bool Enabled(LogLevel level) const { return level >= min_level_; }

    void Log(LogLevel level, const std::string& event, const LogFields& fields = {}) const;
    void Debug(const std::string& event, const LogFields& fields = {}) const {
        Log(LogLevel::kDebug, event, fields);
    }
    void Info(const std::string& event, const LogFields& fields = {}) const {
        Log(LogLevel::kInfo, event, fields);
    }
    void Warn(const std::string& event, const LogFields& fields = {}) const {
        Log(LogLevel::kWarn, event, fields);
    }
    void Error(const std::string& event, const LogFields& fields = {}) const {
        Log(LogLevel::kError, event, fields);
    }

    const std::string& app() const { return app_; }
    LogLevel min_level() const { return min_level_; }

private:
    std::string app_;
    LogLevel min_level_{LogLevel::kInfo};
    std::ostream* sink_{nullptr};
};

}  // namespace sec_subledger
