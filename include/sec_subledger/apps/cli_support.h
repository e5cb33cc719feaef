#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include "sec_subledger/core/date_text.h"

namespace sec_subledger::apps {

using ArgMap = std::unordered_map<std::string, std::string>;

// Accepts "--key value", "--key=value" and a bare "--flag" (stored as "true").
// Options outside known_options and stray positional tokens are rejected.
inline bool ParseArgs(int argc,
                      char** argv,
                      const std::set<std::string>& known_options,
                      ArgMap* out,
                      std::string* error) {
    ArgMap args;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            if (error != nullptr) {
                *error = "unexpected argument: " + token;
            }
            return false;
        }
        token = token.substr(2);
        std::string value = "true";
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string::npos) {
            value = token.substr(eq_pos + 1);
            token = token.substr(0, eq_pos);
        } else if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            value = argv[++i];
        }
        if (known_options.count(token) == 0) {
            if (error != nullptr) {
                *error = "unknown option: --" + token;
            }
            return false;
        }
        args[token] = value;
    }
    if (out != nullptr) {
        *out = std::move(args);
    }
    return true;
}

inline std::string GetArg(const ArgMap& args,
                          const std::string& key,
                          const std::string& fallback = "") {
    const auto it = args.find(key);
    return it == args.end() ? fallback : it->second;
}

inline bool HasArg(const ArgMap& args, const std::string& key) {
    return args.find(key) != args.end();
}

// Leaves *out untouched when the option is absent.
inline bool GetPositiveIntArg(const ArgMap& args,
                              const std::string& key,
                              int* out,
                              std::string* error) {
    const std::string raw = GetArg(args, key);
    if (raw.empty()) {
        return true;
    }
    try {
        std::size_t parsed = 0;
        const int value = std::stoi(raw, &parsed);
        if (parsed == raw.size() && value > 0) {
            *out = value;
            return true;
        }
    } catch (const std::exception&) {
    }
    if (error != nullptr) {
        *error = "invalid positive integer for --" + key + ": " + raw;
    }
    return false;
}

// Normalizes to YYYY-MM-DD; leaves *out untouched when the option is absent.
inline bool GetDateArg(const ArgMap& args,
                       const std::string& key,
                       std::string* out,
                       std::string* error) {
    const std::string raw = GetArg(args, key);
    if (raw.empty()) {
        return true;
    }
    if (!NormalizeIsoDate(raw, out)) {
        if (error != nullptr) {
            *error = "invalid date for --" + key + ": " + raw;
        }
        return false;
    }
    return true;
}

// Writes through "<path>.tmp" and renames, so readers never see a partial file.
inline bool WriteTextFile(const std::string& path, const std::string& content, std::string* error) {
    if (path.empty()) {
        return true;
    }
    try {
        const std::filesystem::path file_path(path);
        if (!file_path.parent_path().empty()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        const std::filesystem::path tmp_path = file_path.string() + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
            if (!out.is_open()) {
                if (error != nullptr) {
                    *error = "unable to open output file: " + tmp_path.string();
                }
                return false;
            }
            out << content;
            out.flush();
            if (!out) {
                if (error != nullptr) {
                    *error = "failed writing output file: " + tmp_path.string();
                }
                return false;
            }
        }
        std::filesystem::rename(tmp_path, file_path);
        return true;
    } catch (const std::exception& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        return false;
    }
}

inline std::string JsonEscape(const std::string& text) {
    std::ostringstream oss;
    for (const char ch : text) {
        switch (ch) {
            case '\"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                    oss << buffer;
                } else {
                    oss << ch;
                }
                break;
        }
    }
    return oss.str();
}

inline std::int64_t UnixEpochMillisNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace sec_subledger::apps
