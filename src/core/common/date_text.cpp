#include "sec_subledger/core/date_text.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sec_subledger {
namespace {

bool IsDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    return true;
}

bool IsValidCalendarDay(int year, int month, int day) {
    if (year < 1900 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = kDaysInMonth[month - 1];
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        limit = 29;
    }
    return day <= limit;
}

}  // namespace

bool NormalizeIsoDate(const std::string& raw, std::string* out) {
    if (out == nullptr) {
        return false;
    }
    std::string text;
    for (char ch : raw) {
        if (!std::isspace(static_cast<unsigned char>(ch)) || !text.empty()) {
            text.push_back(ch);
        }
    }

    std::string digits;
    if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        digits = text.substr(0, 4) + text.substr(5, 2) + text.substr(8, 2);
        if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') {
            return false;
        }
    } else if (text.size() >= 8 && IsDigits(text.substr(0, 8))) {
        digits = text.substr(0, 8);
        if (text.size() > 8 && text[8] != ' ' && text[8] != 'T') {
            return false;
        }
    } else {
        return false;
    }
    if (!IsDigits(digits)) {
        return false;
    }

    const int year = std::stoi(digits.substr(0, 4));
    const int month = std::stoi(digits.substr(4, 2));
    const int day = std::stoi(digits.substr(6, 2));
    if (!IsValidCalendarDay(year, month, day)) {
        return false;
    }

    std::tm value{};
    value.tm_year = year - 1900;
    value.tm_mon = month - 1;
    value.tm_mday = day;
    std::ostringstream stream;
    stream << std::put_time(&value, "%Y-%m-%d");
    *out = stream.str();
    return true;
}

}  // namespace sec_subledger
