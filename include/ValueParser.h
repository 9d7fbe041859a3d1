#pragma once
#include <string>

namespace ValueParser {

enum class NumericSeparatorPolicy {
    AUTO,
    US_THOUSANDS,
    EUROPEAN
};

bool isMissingToken(const std::string& raw);

/// Recognizes true/false/yes/no/y/n/t/f/1/0 (case-insensitive).
bool parseBooleanToken(const std::string& raw, bool& out);

/**
 * @brief Parses a loosely formatted number.
 * @details Strips thousands separators, currency symbols, a trailing percent sign and accounting parentheses.
 *          The percent sign is removed without rescaling ("12%" parses as 12).
 * @return false for missing tokens, non-finite results and text that is not number-like.
 */
bool parseNumber(const std::string& raw, double& out, NumericSeparatorPolicy policy = NumericSeparatorPolicy::AUTO);

/// True when the trimmed token is a plain signed integer that fits in int64_t.
bool parseInteger(const std::string& raw, long long& out);

} // namespace ValueParser
