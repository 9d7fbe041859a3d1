#include "ColumnClassifier.h"
#include "CommonUtils.h"
#include "DateUtils.h"

#include <algorithm>
#include <unordered_set>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
struct ValueProfile {
    size_t nonMissing = 0;
    size_t nativeBoolean = 0;
    size_t nativeNumeric = 0;
    size_t numericConvertible = 0;
    size_t textual = 0;       // string cells
    size_t nativeDate = 0;
    size_t textualDates = 0;  // string cells that parse as dates
    std::unordered_set<std::string> distinctKeys;
};

bool tokenMatches(const std::string& token, const std::string& keyword, bool allowPlural) {
    if (token == keyword) return true;
    if (!allowPlural) return false;
    return token == keyword + "s" || token == keyword + "es";
}

bool hasKeyword(const std::vector<std::string>& tokens, const std::vector<std::string>& keywords, bool allowPlural = true) {
    for (const auto& token : tokens) {
        for (const auto& keyword : keywords) {
            if (tokenMatches(token, keyword, allowPlural)) return true;
        }
    }
    return false;
}

bool hasFragment(const std::string& lowerName, const std::vector<std::string>& fragments) {
    for (const auto& fragment : fragments) {
        if (lowerName.find(fragment) != std::string::npos) return true;
    }
    return false;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

ValueProfile profileValues(const std::vector<CellValue>& values, size_t sampleSize) {
    ValueProfile p;
    for (const auto& cell : values) {
        if (p.nonMissing >= sampleSize) break;
        if (CellUtils::isMissing(cell)) continue;
        ++p.nonMissing;

        switch (CellUtils::kindOf(cell)) {
            case CellKind::BOOLEAN:
                ++p.nativeBoolean;
                break;
            case CellKind::INTEGER:
            case CellKind::REAL:
                ++p.nativeNumeric;
                ++p.numericConvertible;
                break;
            case CellKind::DATE:
                ++p.nativeDate;
                break;
            case CellKind::TEXT: {
                ++p.textual;
                if (CellUtils::toNumber(cell).has_value()) ++p.numericConvertible;
                CivilDate parsed;
                if (DateUtils::parseDate(std::get<std::string>(cell), parsed)) ++p.textualDates;
                break;
            }
            case CellKind::MISSING:
                break;
        }
        if (p.distinctKeys.size() <= 16) {
            p.distinctKeys.insert(CommonUtils::toLower(CellUtils::toKey(cell)));
        }
    }
    return p;
}

bool looksBooleanByValues(const ValueProfile& p, size_t maxDistinct) {
    if (p.nonMissing == 0) return false;
    if (p.nativeBoolean == p.nonMissing) return true;
    if (p.distinctKeys.empty() || p.distinctKeys.size() > maxDistinct) return false;
    for (const auto& key : p.distinctKeys) {
        if (!contains(RoleVocabulary::kBooleanValueTokens, key)) return false;
    }
    return true;
}

bool looksDateByValues(const ValueProfile& p, double ratioThreshold) {
    const size_t candidates = p.textual + p.nativeDate;
    if (candidates == 0) return false;
    const double ratio = static_cast<double>(p.textualDates + p.nativeDate) / static_cast<double>(candidates);
    return ratio >= ratioThreshold;
}

bool looksNumericByValues(const ValueProfile& p, double ratioThreshold) {
    if (p.nonMissing == 0) return false;
    if (p.nativeNumeric == p.nonMissing) return true;
    const double ratio = static_cast<double>(p.numericConvertible) / static_cast<double>(p.nonMissing);
    return ratio >= ratioThreshold;
}
} // namespace

std::string roleName(ColumnRole role) {
    switch (role) {
        case ColumnRole::IDENTIFIER: return "identifier";
        case ColumnRole::MONETARY: return "monetary";
        case ColumnRole::RATE: return "rate";
        case ColumnRole::BOOLEAN: return "boolean";
        case ColumnRole::DATE: return "date";
        case ColumnRole::DERIVED: return "derived";
        case ColumnRole::NUMERIC: return "numeric";
        case ColumnRole::TEXT: return "text";
    }
    return "text";
}

bool isQuantitativeRole(ColumnRole role) {
    return role == ColumnRole::MONETARY || role == ColumnRole::RATE ||
           role == ColumnRole::DERIVED || role == ColumnRole::NUMERIC;
}

bool ColumnClassifier::isIdentifierName(const std::string& columnName) {
    const std::string lower = CommonUtils::toLower(CommonUtils::trim(columnName));
    if (lower.empty()) return false;
    if (lower == "id" || CommonUtils::endsWith(lower, "_id") || lower.find("_id_") != std::string::npos) return true;
    if (contains(RoleVocabulary::kIdentifierNames, lower)) return true;

    // Short names with a standalone "id" word: "Customer ID", "userId", "id number".
    const std::vector<std::string> tokens = CommonUtils::wordTokens(columnName);
    if (tokens.size() > 3) return false;
    for (const auto& token : tokens) {
        if (token == "id" || token == "uuid" || token == "guid") return true;
    }
    return false;
}

bool ColumnClassifier::isBooleanName(const std::string& columnName) {
    const std::vector<std::string> tokens = CommonUtils::wordTokens(columnName);
    if (tokens.size() >= 2 && contains(RoleVocabulary::kBooleanPrefixes, tokens.front())) return true;
    return !tokens.empty() && tokens.back() == "flag";
}

bool ColumnClassifier::isDateName(const std::string& columnName) {
    const std::vector<std::string> tokens = CommonUtils::wordTokens(columnName);
    if (hasKeyword(tokens, RoleVocabulary::kDurationKeywords, false)) return false;
    if (hasKeyword(tokens, RoleVocabulary::kDateKeywords, false)) return true;
    // created_at, updated_on
    if (tokens.size() >= 2 && (tokens.back() == "at" || tokens.back() == "on")) return true;
    return false;
}

bool ColumnClassifier::isMonetaryName(const std::string& columnName) {
    const std::string lower = CommonUtils::toLower(columnName);
    const std::vector<std::string> tokens = CommonUtils::wordTokens(columnName);
    return hasKeyword(tokens, RoleVocabulary::kMonetaryKeywords) ||
           hasFragment(lower, RoleVocabulary::kMonetaryFragments) ||
           lower.find('$') != std::string::npos;
}

bool ColumnClassifier::isRateName(const std::string& columnName) {
    const std::string lower = CommonUtils::toLower(columnName);
    if (lower.find('%') != std::string::npos || lower.find("percent") != std::string::npos) return true;
    return hasKeyword(CommonUtils::wordTokens(columnName), RoleVocabulary::kRateKeywords);
}

bool ColumnClassifier::isDerivedName(const std::string& columnName, const std::vector<std::string>& siblingNames) {
    const std::string lower = CommonUtils::toLower(columnName);
    const std::vector<std::string> tokens = CommonUtils::wordTokens(columnName);
    if (hasKeyword(tokens, RoleVocabulary::kDerivedKeywords, false)) return true;
    if (hasFragment(lower, {"efficiency", "productivity", "utilization"})) return true;

    if (tokens.size() >= 2 && hasKeyword(tokens, RoleVocabulary::kDerivedSummaryWords, false)) return true;

    if (tokens.size() == 1 && contains(RoleVocabulary::kDerivedSummaryWords, tokens.front())) {
        for (const auto& sibling : siblingNames) {
            if (CommonUtils::equalsIgnoreCase(sibling, columnName)) continue;
            if (hasKeyword(CommonUtils::wordTokens(sibling), RoleVocabulary::kBaseQuantityKeywords)) return true;
        }
    }
    return false;
}

ColumnRole ColumnClassifier::classify(const std::string& columnName,
                                      const std::vector<CellValue>& values,
                                      const std::vector<std::string>& siblingNames,
                                      const EngineTuning& tuning) {
    if (isIdentifierName(columnName)) return ColumnRole::IDENTIFIER;

    const ValueProfile profile = profileValues(values, std::max<size_t>(1, tuning.classifierSampleSize));

    if (isDateName(columnName) || looksDateByValues(profile, tuning.dateRatioThreshold)) return ColumnRole::DATE;
    if (isBooleanName(columnName) || looksBooleanByValues(profile, tuning.booleanMaxDistinct)) return ColumnRole::BOOLEAN;

    const bool numericValues = looksNumericByValues(profile, tuning.numericRatioThreshold);
    if (numericValues) {
        if (isMonetaryName(columnName)) return ColumnRole::MONETARY;
        if (isRateName(columnName)) return ColumnRole::RATE;
        if (isDerivedName(columnName, siblingNames)) return ColumnRole::DERIVED;
        return ColumnRole::NUMERIC;
    }
    return ColumnRole::TEXT;
}

std::vector<std::pair<std::string, ColumnRole>> ColumnClassifier::classifyTable(const DataTable& table,
                                                                                const EngineTuning& tuning) {
    const auto& columns = table.columns();
    const std::vector<std::string> names = table.columnNames();
    std::vector<ColumnRole> roles(columns.size(), ColumnRole::TEXT);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < columns.size(); ++i) {
        roles[i] = classify(columns[i].name, columns[i].cells, names, tuning);
    }

    std::vector<std::pair<std::string, ColumnRole>> out;
    out.reserve(columns.size());
    for (size_t i = 0; i < columns.size(); ++i) out.emplace_back(columns[i].name, roles[i]);
    return out;
}
