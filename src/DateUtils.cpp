#include "DateUtils.h"
#include "CommonUtils.h"

#include <cctype>
#include <cstdio>
#include <vector>

namespace {
constexpr int kMinYear = 1000;
constexpr int kMaxYear = 9999;

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char ch : s) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    }
    return true;
}

bool allAlpha(const std::string& s) {
    if (s.empty()) return false;
    for (char ch : s) {
        if (!std::isalpha(static_cast<unsigned char>(ch))) return false;
    }
    return true;
}

int toInt(const std::string& digits) {
    int value = 0;
    for (char ch : digits) value = value * 10 + (ch - '0');
    return value;
}

// Converts a 2- or 4-digit year token; returns -1 for other widths.
int yearFromToken(const std::string& token) {
    if (!allDigits(token)) return -1;
    if (token.size() == 4) return toInt(token);
    if (token.size() == 2) return DateUtils::expandTwoDigitYear(toInt(token));
    return -1;
}

bool isDayOrMonthToken(const std::string& token) {
    return allDigits(token) && token.size() <= 2;
}

bool finish(int year, int month, int day, DateUtils::CivilDate& out) {
    if (year < kMinYear || year > kMaxYear) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    out.days = DateUtils::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return true;
}

bool validTimePart(const std::string& timePart) {
    if (timePart.empty()) return true;
    if (timePart.size() < 5 || timePart[2] != ':') return false;
    if (!std::isdigit(static_cast<unsigned char>(timePart[0])) || !std::isdigit(static_cast<unsigned char>(timePart[1]))) return false;
    if (!std::isdigit(static_cast<unsigned char>(timePart[3])) || !std::isdigit(static_cast<unsigned char>(timePart[4]))) return false;
    const int hour = (timePart[0] - '0') * 10 + (timePart[1] - '0');
    const int minute = (timePart[3] - '0') * 10 + (timePart[4] - '0');
    return hour <= 23 && minute <= 59;
}

std::vector<std::string> splitOn(const std::string& s, const std::string& separators) {
    std::vector<std::string> parts;
    std::string cur;
    for (char ch : s) {
        if (separators.find(ch) != std::string::npos) {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

bool parseIsoWeek(const std::string& s, DateUtils::CivilDate& out) {
    // YYYY-Www-D
    if (s.size() != 10 || s[4] != '-' || (s[5] != 'W' && s[5] != 'w') || s[8] != '-') return false;
    const std::string y = s.substr(0, 4);
    const std::string w = s.substr(6, 2);
    const std::string d = s.substr(9, 1);
    if (!allDigits(y) || !allDigits(w) || !allDigits(d)) return false;
    const int isoYear = toInt(y);
    const int isoWeek = toInt(w);
    const int isoDay = toInt(d);
    if (isoWeek < 1 || isoWeek > 53 || isoDay < 1 || isoDay > 7) return false;
    if (isoYear < kMinYear || isoYear > kMaxYear) return false;

    const int64_t jan4 = DateUtils::daysFromCivil(isoYear, 1, 4);
    const int jan4WeekdayMon1 = static_cast<int>(((jan4 + 3) % 7 + 7) % 7) + 1;
    const int64_t week1Monday = jan4 - static_cast<int64_t>(jan4WeekdayMon1 - 1);
    out.days = week1Monday + static_cast<int64_t>((isoWeek - 1) * 7 + (isoDay - 1));
    return true;
}

bool parseNumericDate(const std::string& datePart, DateUtils::DateLocaleHint hint, DateUtils::CivilDate& out) {
    char sep = 0;
    for (char ch : datePart) {
        if (ch == '-' || ch == '/' || ch == '.') {
            if (sep != 0 && ch != sep) return false;
            sep = ch;
        } else if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    if (sep == 0) return false;

    const std::vector<std::string> p = splitOn(datePart, std::string(1, sep));
    if (p.size() == 2) {
        // YYYY-MM or MM-YYYY, first of month. Dotted pairs are decimals, not dates.
        if (sep == '.') return false;
        if (p[0].size() == 4 && isDayOrMonthToken(p[1])) return finish(toInt(p[0]), toInt(p[1]), 1, out);
        if (p[1].size() == 4 && isDayOrMonthToken(p[0])) return finish(toInt(p[1]), toInt(p[0]), 1, out);
        return false;
    }
    if (p.size() != 3) return false;

    if (p[0].size() == 4) {
        if (!isDayOrMonthToken(p[1]) || !isDayOrMonthToken(p[2])) return false;
        return finish(toInt(p[0]), toInt(p[1]), toInt(p[2]), out);
    }

    if (!isDayOrMonthToken(p[0]) || !isDayOrMonthToken(p[1])) return false;
    const int year = yearFromToken(p[2]);
    if (year < 0) return false;
    const int a = toInt(p[0]);
    const int b = toInt(p[1]);

    bool dayFirst = false;
    if (hint == DateUtils::DateLocaleHint::DMY) {
        dayFirst = true;
    } else if (hint == DateUtils::DateLocaleHint::MDY) {
        dayFirst = false;
    } else if (a > 12 && b <= 12) {
        dayFirst = true;
    } else if (b > 12 && a <= 12) {
        dayFirst = false;
    } else {
        // Ambiguous: dash and dot layouts default to day-first with 4-digit years, slashes to month-first.
        dayFirst = (sep != '/') && p[2].size() == 4;
    }
    return dayFirst ? finish(year, b, a, out) : finish(year, a, b, out);
}

bool parseMonthNameDate(const std::string& text, DateUtils::CivilDate& out) {
    const std::vector<std::string> tokens = splitOn(text, " -/,.");
    if (tokens.size() < 2 || tokens.size() > 3) return false;

    int monthPos = -1;
    int month = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!allAlpha(tokens[i])) continue;
        if (monthPos >= 0) return false;
        month = DateUtils::monthFromName(tokens[i]);
        if (month == 0) return false;
        monthPos = static_cast<int>(i);
    }
    if (monthPos < 0) return false;

    if (tokens.size() == 2) {
        // Mon-YY, Mon YYYY, or YYYY-Mon.
        const std::string& other = tokens[monthPos == 0 ? 1 : 0];
        if (monthPos == 1 && other.size() != 4) return false;
        const int year = yearFromToken(other);
        if (year < 0) return false;
        return finish(year, month, 1, out);
    }

    if (monthPos == 1) {
        // DD Mon YYYY
        if (!isDayOrMonthToken(tokens[0])) return false;
        const int year = yearFromToken(tokens[2]);
        if (year < 0) return false;
        return finish(year, month, toInt(tokens[0]), out);
    }
    if (monthPos == 0) {
        // Mon DD, YYYY
        if (!isDayOrMonthToken(tokens[1])) return false;
        const int year = yearFromToken(tokens[2]);
        if (year < 0) return false;
        return finish(year, month, toInt(tokens[1]), out);
    }
    return false;
}
} // namespace

namespace DateUtils {

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400) + (m <= 2 ? 1 : 0);
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

int expandTwoDigitYear(int yy) {
    return yy < 50 ? 2000 + yy : 1900 + yy;
}

int monthFromName(const std::string& token) {
    static const char* kMonthNames[12] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };
    const std::string lower = CommonUtils::toLower(token);
    if (lower.size() < 3) return 0;
    for (int i = 0; i < 12; ++i) {
        const std::string full = kMonthNames[i];
        if (lower == full || lower == full.substr(0, 3)) return i + 1;
    }
    if (lower == "sept") return 9;
    return 0;
}

bool parseDate(const std::string& text, CivilDate& out, DateLocaleHint hint) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() < 5 || s.size() > 40) return false;

    bool hasAlpha = false;
    for (char ch : s) {
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            hasAlpha = true;
            break;
        }
    }

    if (parseIsoWeek(s, out)) return true;

    std::string datePart = s;
    std::string timePart;
    if (s.size() > 10 && (s[10] == 'T' || s[10] == ' ') && std::isdigit(static_cast<unsigned char>(s[0]))) {
        datePart = s.substr(0, 10);
        timePart = CommonUtils::trim(s.substr(11));
    }

    if (!hasAlpha || !timePart.empty()) {
        if (!validTimePart(timePart)) return false;
        return parseNumericDate(datePart, hint, out);
    }
    return parseMonthNameDate(s, out);
}

std::string formatDate(const CivilDate& date) {
    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(date.days, year, month, day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

} // namespace DateUtils
