#pragma once
#include "DataTable.h"
#include "EngineConfig.h"

#include <string>
#include <utility>
#include <vector>

enum class ColumnRole { IDENTIFIER, MONETARY, RATE, BOOLEAN, DATE, DERIVED, NUMERIC, TEXT };

std::string roleName(ColumnRole role);

/// Roles whose values are summed, averaged or ranked numerically.
bool isQuantitativeRole(ColumnRole role);

// Keyword sets behind the name heuristics. Matching is against lowercase word tokens of the column
// name (see CommonUtils::wordTokens); a token also matches the plural forms kw+"s" and kw+"es" unless noted.
namespace RoleVocabulary {
inline const std::vector<std::string> kIdentifierNames = {
    "id", "order_id", "item_id", "customer_id", "user_id", "product_id", "transaction_id",
    "account_id", "session_id", "employee_id", "invoice_id", "uuid", "guid"
};
// Leading token of a boolean flag name: is_active, hasDiscount, can_edit.
inline const std::vector<std::string> kBooleanPrefixes = {
    "is", "has", "can", "should", "was", "did", "will", "allow", "allows", "enable"
};
inline const std::vector<std::string> kBooleanValueTokens = {
    "true", "false", "1", "0", "yes", "no", "y", "n", "t", "f"
};
// Exact tokens only, no plural forms.
inline const std::vector<std::string> kDateKeywords = {
    "date", "datetime", "timestamp", "time", "month", "year", "week", "quarter", "period", "dob"
};
// Tokens that turn a time-ish name into a duration measure instead of a date.
inline const std::vector<std::string> kDurationKeywords = {
    "duration", "latency", "elapsed", "seconds", "second", "secs", "sec", "ms", "millis",
    "minutes", "minute", "mins", "hours", "hour", "hrs", "days", "spent", "taken"
};
inline const std::vector<std::string> kMonetaryKeywords = {
    "price", "cost", "amount", "revenue", "fee", "total", "salary", "income", "expense", "budget",
    "payment", "spend", "sales", "profit", "tax", "wage", "charge", "balance", "usd", "eur", "gbp", "dollar"
};
// Substrings that mark glued monetary names such as "unitprice" or "totalamount".
inline const std::vector<std::string> kMonetaryFragments = {
    "price", "amount", "revenue", "salary", "payment", "income", "expense"
};
inline const std::vector<std::string> kRateKeywords = {
    "rate", "ratio", "percent", "percentage", "pct", "proportion", "share"
};
inline const std::vector<std::string> kDerivedKeywords = {
    "efficiency", "productivity", "utilization", "utilisation", "kpi", "throughput", "yield", "roi", "margin", "per"
};
// Summary words: derived when part of a longer name (avg_rating), or alone when siblings hold base quantities.
inline const std::vector<std::string> kDerivedSummaryWords = {
    "total", "average", "avg", "mean", "median", "sum"
};
inline const std::vector<std::string> kBaseQuantityKeywords = {
    "qty", "quantity", "amount", "price", "cost", "unit", "units", "count", "volume"
};
} // namespace RoleVocabulary

class ColumnClassifier {
public:
    /**
     * @brief Assigns exactly one semantic role to a column.
     * @details Candidate roles are checked in precedence order identifier > date > boolean > monetary > rate >
     *          derived > numeric > text; the first match wins. Only the first tuning.classifierSampleSize
     *          non-missing values are inspected. Monetary, rate and derived names additionally require
     *          number-like values, otherwise the column falls through to text.
     * @param siblingNames other column names of the same table, used by the derived-summary rule.
     * @post Never throws for well-formed input; ambiguous columns are text.
     */
    static ColumnRole classify(const std::string& columnName,
                               const std::vector<CellValue>& values,
                               const std::vector<std::string>& siblingNames = {},
                               const EngineTuning& tuning = EngineTuning{});

    /// Classifies every column of a table, in column order.
    static std::vector<std::pair<std::string, ColumnRole>> classifyTable(const DataTable& table,
                                                                         const EngineTuning& tuning = EngineTuning{});

    static bool isIdentifierName(const std::string& columnName);
    static bool isBooleanName(const std::string& columnName);
    static bool isDateName(const std::string& columnName);
    static bool isMonetaryName(const std::string& columnName);
    static bool isRateName(const std::string& columnName);
    static bool isDerivedName(const std::string& columnName, const std::vector<std::string>& siblingNames);
};
