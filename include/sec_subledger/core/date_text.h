#pragma once

#include <string>

namespace sec_subledger {

// Accepts "YYYY-MM-DD", "YYYYMMDD" and either form followed by a time part
// ("2025-01-06 00:00:00", "2025-01-06T00:00:00Z"). Writes "YYYY-MM-DD".
bool NormalizeIsoDate(const std::string& raw, std::string* out);

}  // namespace sec_subledger
