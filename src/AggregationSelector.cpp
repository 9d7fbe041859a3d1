#include "AggregationSelector.h"
#include "CommonUtils.h"
#include "TallyExceptions.h"

#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace {
using IntentMatcher = std::optional<AggregationFunction> (*)(const std::string&);

bool anyPhrase(const std::string& text, std::initializer_list<const char*> phrases) {
    for (const char* phrase : phrases) {
        if (CommonUtils::containsPhrase(text, phrase)) return true;
    }
    return false;
}

std::optional<AggregationFunction> matchMean(const std::string& t) {
    if (anyPhrase(t, {"average", "averages", "mean", "typical", "avg"})) return AggregationFunction::MEAN;
    return std::nullopt;
}

std::optional<AggregationFunction> matchMedian(const std::string& t) {
    if (anyPhrase(t, {"median", "without outliers", "middle value"})) return AggregationFunction::MEDIAN;
    return std::nullopt;
}

// "top 5%" or "top 5 percent"; returns the N.
std::optional<int> topPercent(const std::string& t) {
    size_t pos = t.find("top");
    while (pos != std::string::npos) {
        size_t i = pos + 3;
        while (i < t.size() && t[i] == ' ') ++i;
        size_t digitsStart = i;
        while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) ++i;
        if (i > digitsStart && i - digitsStart <= 3) {
            const int n = std::stoi(t.substr(digitsStart, i - digitsStart));
            size_t j = i;
            while (j < t.size() && t[j] == ' ') ++j;
            if (j < t.size() && (t[j] == '%' || t.compare(j, 7, "percent") == 0)) return n;
        }
        pos = t.find("top", pos + 3);
    }
    return std::nullopt;
}

std::optional<AggregationFunction> matchPercentile(const std::string& t) {
    if (anyPhrase(t, {"p99", "99th"})) return AggregationFunction::P99;
    if (anyPhrase(t, {"p95", "95th"})) return AggregationFunction::P95;
    if (anyPhrase(t, {"p90", "90th"})) return AggregationFunction::P90;
    if (const auto n = topPercent(t)) {
        if (*n <= 1) return AggregationFunction::P99;
        if (*n <= 5) return AggregationFunction::P95;
        return AggregationFunction::P90;
    }
    if (anyPhrase(t, {"percentile", "percentiles"})) return AggregationFunction::P95;
    return std::nullopt;
}

std::optional<AggregationFunction> matchMax(const std::string& t) {
    if (anyPhrase(t, {"highest", "max", "maximum", "top", "largest", "peak", "biggest"})) return AggregationFunction::MAX;
    return std::nullopt;
}

std::optional<AggregationFunction> matchMin(const std::string& t) {
    if (anyPhrase(t, {"lowest", "min", "minimum", "bottom", "smallest", "least"})) return AggregationFunction::MIN;
    return std::nullopt;
}

std::optional<AggregationFunction> matchVariance(const std::string& t) {
    if (anyPhrase(t, {"variance", "var"})) return AggregationFunction::VAR;
    return std::nullopt;
}

std::optional<AggregationFunction> matchStd(const std::string& t) {
    if (anyPhrase(t, {"stddev", "std", "standard deviation", "deviation", "spread", "volatility"})) {
        return AggregationFunction::STD;
    }
    return std::nullopt;
}

// Evaluated top to bottom; the first family that matches decides.
const IntentMatcher kIntentFamilies[] = {
    matchMean,
    matchMedian,
    matchPercentile,
    matchMax,
    matchMin,
    matchVariance,
    matchStd,
};

const std::unordered_map<std::string, AggregationFunction>& functionAliases() {
    static const std::unordered_map<std::string, AggregationFunction> aliases = {
        {"sum", AggregationFunction::SUM},
        {"total", AggregationFunction::SUM},
        {"mean", AggregationFunction::MEAN},
        {"avg", AggregationFunction::MEAN},
        {"average", AggregationFunction::MEAN},
        {"median", AggregationFunction::MEDIAN},
        {"min", AggregationFunction::MIN},
        {"max", AggregationFunction::MAX},
        {"count", AggregationFunction::COUNT},
        {"std", AggregationFunction::STD},
        {"stddev", AggregationFunction::STD},
        {"var", AggregationFunction::VAR},
        {"variance", AggregationFunction::VAR},
        {"p90", AggregationFunction::P90},
        {"p95", AggregationFunction::P95},
        {"p99", AggregationFunction::P99},
        {"any", AggregationFunction::ANY},
        {"all", AggregationFunction::ALL},
        {"count_distinct", AggregationFunction::COUNT_DISTINCT},
        {"nunique", AggregationFunction::COUNT_DISTINCT},
        {"distinct", AggregationFunction::COUNT_DISTINCT},
    };
    return aliases;
}

const std::unordered_map<std::string, std::string>& entityCountLabels() {
    static const std::unordered_map<std::string, std::string> labels = {
        {"customer", "unique_customers"},
        {"user", "unique_users"},
        {"order", "unique_orders"},
        {"product", "unique_products"},
        {"transaction", "unique_transactions"},
        {"session", "unique_sessions"},
        {"item", "unique_items"},
        {"account", "unique_accounts"},
        {"employee", "unique_employees"},
        {"invoice", "unique_invoices"},
    };
    return labels;
}

bool isCountFunction(AggregationFunction f) {
    return f == AggregationFunction::COUNT || f == AggregationFunction::COUNT_DISTINCT;
}

bool isDateFunction(AggregationFunction f) {
    return isCountFunction(f) || f == AggregationFunction::MIN || f == AggregationFunction::MAX;
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}
} // namespace

std::string functionName(AggregationFunction function) {
    switch (function) {
        case AggregationFunction::SUM: return "sum";
        case AggregationFunction::MEAN: return "mean";
        case AggregationFunction::MEDIAN: return "median";
        case AggregationFunction::MIN: return "min";
        case AggregationFunction::MAX: return "max";
        case AggregationFunction::COUNT: return "count";
        case AggregationFunction::STD: return "std";
        case AggregationFunction::VAR: return "var";
        case AggregationFunction::P90: return "p90";
        case AggregationFunction::P95: return "p95";
        case AggregationFunction::P99: return "p99";
        case AggregationFunction::ANY: return "any";
        case AggregationFunction::ALL: return "all";
        case AggregationFunction::COUNT_DISTINCT: return "count_distinct";
    }
    return "sum";
}

AggregationFunction parseFunctionName(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    const auto& aliases = functionAliases();
    auto it = aliases.find(key);
    if (it == aliases.end()) {
        throw Tally::InvalidInputException(
            "Unknown aggregation function '" + name +
            "'. Supported: sum, mean, median, min, max, count, std, var, p90, p95, p99, any, all, count_distinct");
    }
    return it->second;
}

std::optional<AggregationFunction> AggregationSelector::functionFromIntent(const std::string& intent) {
    const std::string text = CommonUtils::toLower(CommonUtils::trim(intent));
    if (text.empty()) return std::nullopt;
    for (IntentMatcher matcher : kIntentFamilies) {
        if (auto function = matcher(text)) return function;
    }
    return std::nullopt;
}

std::string AggregationSelector::identifierLabel(const std::string& column) {
    const std::vector<std::string> tokens = CommonUtils::wordTokens(column);
    std::string base;
    if (tokens.size() >= 2 && tokens.back() == "id") {
        std::vector<std::string> head(tokens.begin(), tokens.end() - 1);
        base = CommonUtils::joinList(head, "_");
    } else {
        base = CommonUtils::joinList(tokens, "_");
    }
    if (base.empty()) base = "id";

    const auto& labels = entityCountLabels();
    auto it = labels.find(base);
    if (it != labels.end()) return it->second;
    return base + "_count";
}

std::string AggregationSelector::labelFor(const std::string& column, ColumnRole role, AggregationFunction function) {
    if (role == ColumnRole::IDENTIFIER && function == AggregationFunction::COUNT_DISTINCT) {
        return identifierLabel(column);
    }
    switch (function) {
        case AggregationFunction::SUM: return column + " (Sum)";
        case AggregationFunction::COUNT: return column + " (Count)";
        case AggregationFunction::MEAN: return "avg_" + column;
        default: return functionName(function) + "_" + column;
    }
}

AggregationSpec AggregationSelector::select(const std::string& column,
                                            ColumnRole role,
                                            const std::optional<std::string>& overrideName,
                                            const std::string& intent,
                                            bool explicitlyRequested,
                                            bool numericConvertible) {
    AggregationSpec spec;
    spec.column = column;
    spec.role = role;

    std::optional<AggregationFunction> requested;
    if (overrideName.has_value() && !CommonUtils::trim(*overrideName).empty()) {
        requested = parseFunctionName(*overrideName);
    }

    switch (role) {
        case ColumnRole::IDENTIFIER:
            spec.function = AggregationFunction::COUNT_DISTINCT;
            if (requested.has_value()) {
                if (isCountFunction(*requested)) {
                    spec.function = *requested;
                } else {
                    spec.warnings.push_back("Column " + quoted(column) + " is an identifier; '" +
                                            functionName(*requested) + "' was replaced by count_distinct.");
                }
            }
            break;

        case ColumnRole::DATE:
            if (!explicitlyRequested && !requested.has_value()) {
                spec.included = false;
                break;
            }
            spec.function = AggregationFunction::MAX;
            if (requested.has_value()) {
                if (!isDateFunction(*requested)) {
                    throw Tally::InvalidInputException("Function '" + functionName(*requested) +
                                                       "' is not defined for date column " + quoted(column) +
                                                       ". Use min, max, count or count_distinct.");
                }
                spec.function = *requested;
            }
            break;

        case ColumnRole::BOOLEAN:
            spec.function = requested.value_or(AggregationFunction::ANY);
            break;

        case ColumnRole::TEXT:
            if (requested.has_value() && isCountFunction(*requested)) {
                spec.function = *requested;
                break;
            }
            if (!explicitlyRequested || !numericConvertible) {
                spec.included = false;
                if (explicitlyRequested) {
                    spec.warnings.push_back("Column " + quoted(column) +
                                            " holds text that does not convert to numbers and was skipped.");
                }
                break;
            }
            spec.function = requested.value_or(functionFromIntent(intent).value_or(AggregationFunction::SUM));
            break;

        case ColumnRole::DERIVED:
            if (requested.has_value()) {
                spec.function = *requested;
            } else if (const auto fromIntent = functionFromIntent(intent)) {
                spec.function = *fromIntent;
            } else {
                spec.function = AggregationFunction::MEAN;
                spec.warnings.push_back("Column " + quoted(column) +
                                        " looks like a derived ratio; averaging it per group. For exact results "
                                        "aggregate its base components first and recompute the ratio.");
            }
            break;

        case ColumnRole::MONETARY:
        case ColumnRole::RATE:
        case ColumnRole::NUMERIC:
            spec.function = requested.value_or(functionFromIntent(intent).value_or(AggregationFunction::SUM));
            break;
    }

    spec.label = labelFor(column, role, spec.function);
    return spec;
}

std::vector<std::string> AggregationSelector::deduplicateLabels(std::vector<AggregationSpec>& specs,
                                                                const std::vector<std::string>& reserved) {
    std::vector<std::string> warnings;
    std::unordered_set<std::string> seen(reserved.begin(), reserved.end());
    for (auto& spec : specs) {
        if (!spec.included) continue;
        const std::string original = spec.label;
        if (seen.find(spec.label) != seen.end()) {
            size_t suffix = 2;
            while (seen.find(original + "_" + std::to_string(suffix)) != seen.end()) {
                ++suffix;
            }
            spec.label = original + "_" + std::to_string(suffix);
            warnings.push_back("Label " + quoted(original) + " for column " + quoted(spec.column) +
                               " clashes with another output column; renamed to " + quoted(spec.label) + ".");
        }
        seen.insert(spec.label);
    }
    return warnings;
}
