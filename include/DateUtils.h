#pragma once
#include <cstdint>
#include <string>

namespace DateUtils {

enum class DateLocaleHint {
    AUTO,
    DMY,
    MDY
};

/// Calendar date stored as days since 1970-01-01.
struct CivilDate {
    int64_t days = 0;

    bool operator==(const CivilDate& other) const noexcept { return days == other.days; }
    bool operator!=(const CivilDate& other) const noexcept { return days != other.days; }
    bool operator<(const CivilDate& other) const noexcept { return days < other.days; }
};

int64_t daysFromCivil(int year, unsigned month, unsigned day);
void civilFromDays(int64_t days, int& year, int& month, int& day);

/// Maps a two-digit year onto 1950-2049.
int expandTwoDigitYear(int yy);

/// Returns 1..12 for English month names and three-letter abbreviations, 0 otherwise.
int monthFromName(const std::string& token);

/**
 * @brief Parses a date string in one of the supported layouts.
 * @details Accepts ISO dates with optional time, slash dates, dash dates with day first, ISO week dates,
 *          year-month and month-year numeric forms, and month-name forms such as "Apr-23" or "15 Apr 2023".
 *          Month-year forms resolve to the first of the month. Any time component is dropped.
 * @return false when the text is not a recognizable calendar date.
 */
bool parseDate(const std::string& text, CivilDate& out, DateLocaleHint hint = DateLocaleHint::AUTO);

/// ISO "YYYY-MM-DD" rendering.
std::string formatDate(const CivilDate& date);

} // namespace DateUtils
