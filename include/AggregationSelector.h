#pragma once
#include "ColumnClassifier.h"

#include <optional>
#include <string>
#include <vector>

enum class AggregationFunction {
    SUM,
    MEAN,
    MEDIAN,
    MIN,
    MAX,
    COUNT,
    STD,
    VAR,
    P90,
    P95,
    P99,
    ANY,
    ALL,
    COUNT_DISTINCT
};

std::string functionName(AggregationFunction function);

/**
 * @brief Maps a user supplied function name to the enum.
 * @details Case-insensitive; accepts avg/average for mean, nunique/distinct for count_distinct
 *          and stddev for std.
 * @throws Tally::InvalidInputException listing the supported names.
 */
AggregationFunction parseFunctionName(const std::string& name);

struct AggregationSpec {
    std::string column;
    ColumnRole role = ColumnRole::TEXT;
    AggregationFunction function = AggregationFunction::SUM;
    std::string label;
    bool included = true;
    std::vector<std::string> warnings;
};

class AggregationSelector {
public:
    /**
     * @brief Resolves the function and output label for one value column.
     * @details Precedence is explicit override, then intent keyword families, then the role default.
     *          Identifier columns always resolve to count_distinct (or count when requested); a numeric
     *          override on an identifier is replaced and reported in warnings.
     *          Text columns come back with included == false unless explicitlyRequested is set and
     *          numericConvertible is true, or the override is count/count_distinct.
     * @throws Tally::InvalidInputException for an unknown override name.
     */
    static AggregationSpec select(const std::string& column,
                                  ColumnRole role,
                                  const std::optional<std::string>& overrideName,
                                  const std::string& intent,
                                  bool explicitlyRequested = false,
                                  bool numericConvertible = false);

    /// First intent family that matches, in fixed priority order; std::nullopt when none does.
    static std::optional<AggregationFunction> functionFromIntent(const std::string& intent);

    static std::string labelFor(const std::string& column, ColumnRole role, AggregationFunction function);

    /// "customer_id" -> "unique_customers", "region_id" -> "region_count".
    static std::string identifierLabel(const std::string& column);

    /// Makes labels unique within one result, appending _2, _3, ... to repeats.
    /// Returns one warning per renamed label.
    static std::vector<std::string> deduplicateLabels(std::vector<AggregationSpec>& specs, const std::vector<std::string>& reserved);
};
