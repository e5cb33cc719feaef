#include "sec_subledger/core/structured_log.h"

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sec_subledger {
namespace {

std::mutex& SinkMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string ToLowerTrimmed(const std::string& raw) {
    std::string value;
    value.reserve(raw.size());
    for (const char ch : raw) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    return value;
}

void AppendEscaped(const std::string& value, std::ostringstream* line) {
    for (const char ch : value) {
        if (ch == '"' || ch == '\\') {
            line->put('\\');
        }
        line->put(ch);
    }
}

std::int64_t NowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

bool ParseLogLevel(const std::string& raw, LogLevel* out) {
    const std::string value = ToLowerTrimmed(raw);
    LogLevel level = LogLevel::kInfo;
    if (value == "debug") {
        level = LogLevel::kDebug;
    } else if (value == "info") {
        level = LogLevel::kInfo;
    } else if (value == "warn" || value == "warning") {
        level = LogLevel::kWarn;
    } else if (value == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    if (out != nullptr) {
        *out = level;
    }
    return true;
}

const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "debug";
        case LogLevel::kInfo:
            return "info";
        case LogLevel::kWarn:
            return "warn";
        case LogLevel::kError:
            return "error";
    }
    return "info";
}

std::string LogNumber(double value) {
    std::ostringstream stream;
    stream << std::setprecision(12) << value;
    return stream.str();
}

StructuredLogger::StructuredLogger(std::string app) : app_(std::move(app)), sink_(&std::cerr) {}

StructuredLogger::StructuredLogger(std::string app, const LoggingConfig& logging)
    : app_(std::move(app)), sink_(&std::cerr) {
    LogLevel level = LogLevel::kInfo;
    if (ParseLogLevel(logging.level, &level)) {
        min_level_ = level;
    }
    if (ToLowerTrimmed(logging.sink) == "stdout") {
        sink_ = &std::cout;
    }
}

void StructuredLogger::Log(LogLevel level, const std::string& event, const LogFields& fields) const {
    if (!Enabled(level)) {
        return;
    }
    std::ostringstream line;
    line << "ts_ns=" << NowNs() << " level=" << ToString(level) << " app=" << app_
         << " event=" << event;
    for (const auto& [key, value] : fields) {
        line << ' ' << key << "=\"";
        AppendEscaped(value, &line);
        line << '"';
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(SinkMutex());
    (*sink_) << line.str();
    sink_->flush();
}

}  // namespace sec_subledger
