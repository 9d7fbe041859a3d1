#include "ValueParser.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace {
// UTF-8 currency signs that can prefix or suffix an amount.
const char* const kCurrencySigns[] = {"\xE2\x82\xAC", "\xC2\xA3", "\xC2\xA5", "\xE2\x82\xB9", "$"};

std::string stripCurrency(std::string s) {
    for (const char* sign : kCurrencySigns) {
        const std::string token(sign);
        size_t pos = s.find(token);
        while (pos != std::string::npos) {
            s.erase(pos, token.size());
            pos = s.find(token);
        }
    }
    return s;
}

std::string normalizeNumericToken(const std::string& input, ValueParser::NumericSeparatorPolicy policy) {
    std::string cleaned;
    cleaned.reserve(input.size());
    for (char ch : input) {
        if (!std::isspace(static_cast<unsigned char>(ch)) && ch != '_') {
            cleaned.push_back(ch);
        }
    }

    const auto toUS = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch != ',') out.push_back(ch);
        }
        return out;
    };

    const auto toEuropean = [](const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (char ch : s) {
            if (ch == '.') continue;
            out.push_back(ch == ',' ? '.' : ch);
        }
        return out;
    };

    if (policy == ValueParser::NumericSeparatorPolicy::US_THOUSANDS) return toUS(cleaned);
    if (policy == ValueParser::NumericSeparatorPolicy::EUROPEAN) return toEuropean(cleaned);

    const size_t dotPos = cleaned.find('.');
    const size_t commaPos = cleaned.find(',');
    if (dotPos != std::string::npos && commaPos != std::string::npos) {
        return cleaned.find_last_of(',') > cleaned.find_last_of('.') ? toEuropean(cleaned) : toUS(cleaned);
    }

    if (commaPos != std::string::npos) {
        const size_t commaCount = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
        const size_t digitsAfter = cleaned.size() - commaPos - 1;
        if (commaCount == 1 && digitsAfter >= 1 && digitsAfter <= 4) {
            const bool likelyThousands = digitsAfter == 3 && commaPos > 0 &&
                                         std::isdigit(static_cast<unsigned char>(cleaned[commaPos - 1]));
            if (!likelyThousands) {
                std::string out = cleaned;
                out[commaPos] = '.';
                return out;
            }
        }
        return toUS(cleaned);
    }

    if (dotPos != std::string::npos && std::count(cleaned.begin(), cleaned.end(), '.') > 1) {
        return toUS(cleaned);
    }
    return cleaned;
}

bool fromCharsExact(const std::string& s, double& out) {
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}
} // namespace

namespace ValueParser {

bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool parseBooleanToken(const std::string& raw, bool& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "true" || s == "yes" || s == "y" || s == "t" || s == "1") {
        out = true;
        return true;
    }
    if (s == "false" || s == "no" || s == "n" || s == "f" || s == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parseNumber(const std::string& raw, double& out, NumericSeparatorPolicy policy) {
    std::string s = CommonUtils::trim(raw);
    if (isMissingToken(s)) return false;

    bool negative = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = CommonUtils::trim(s.substr(1, s.size() - 2));
    }

    s = stripCurrency(s);
    s = CommonUtils::trim(s);
    if (!s.empty() && s.back() == '%') {
        s.pop_back();
        s = CommonUtils::trim(s);
    }
    if (s.empty()) return false;

    for (char ch : s) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (!(std::isdigit(uch) || ch == '.' || ch == ',' || ch == '+' || ch == '-' || ch == '_' ||
              ch == 'e' || ch == 'E' || std::isspace(uch))) {
            return false;
        }
    }

    std::string cleaned = normalizeNumericToken(s, policy);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (!fromCharsExact(cleaned, out)) return false;
    if (negative) out = -std::abs(out);
    return true;
}

bool parseInteger(const std::string& raw, long long& out) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    if (s.front() == '+') s.erase(s.begin());
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, 10);
    return ec == std::errc{} && p == e;
}

} // namespace ValueParser
