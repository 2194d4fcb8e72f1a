#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docfill/row.hpp"

namespace docfill {

inline constexpr std::string_view cTokenPrefix = "{{";
inline constexpr std::string_view cTokenSuffix = "}}";
inline constexpr std::string_view cDefaultSeparator = "?:";

// Parsed form of {{column|filter|filter?:default}}.
struct TokenExpression {
  std::string base_name;
  std::vector<std::string> filters;
  std::optional<std::string> default_value;
};

// Total: anything without filter/default syntax is a bare column reference.
TokenExpression parseTokenExpression(const std::string& expr);

// Never throws. Missing column without default yields "".
std::string evaluateToken(const std::string& expr, const Row& row);
std::string evaluateToken(const TokenExpression& expr, const Row& row);

// "Amount|euros?:0" -> "Amount"
std::string collectBaseName(const std::string& expr);

// "NAME" -> "{{NAME}}"
std::string tokenFor(const std::string& column);

using FilterFn = std::function<std::string(const std::string&)>;

// nullptr for unknown filter names.
const FilterFn* findFilter(const std::string& name);
// Unknown filters pass the value through unchanged.
std::string applyFilter(const std::string& name, const std::string& value);

std::string formatEuros(const std::string& value);
std::string formatDateDmy(const std::string& value);

} // namespace docfill
