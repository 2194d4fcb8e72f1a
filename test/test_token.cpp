#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "docfill/row.hpp"
#include "docfill/token.hpp"

using docfill::Row;
using docfill::evaluateToken;

using namespace testing;

class TokenTestFixture : public Test {
protected:
  static Row sampleRow() {
    return Row({{"NAME", "Ana"}, {"AMOUNT", "1234,5"}, {"EMPTY", "  "}, {"DATE", "2024-03-05"}, {" PADDED ", "  x  "}});
  }
};

TEST_F(TokenTestFixture, parse_expression_parts) {
  auto expr = docfill::parseTokenExpression(" Amount | euros | trim ?: 0 ");
  EXPECT_EQ(expr.base_name, "Amount");
  ASSERT_EQ(expr.filters.size(), 2U);
  EXPECT_EQ(expr.filters[0], "euros");
  EXPECT_EQ(expr.filters[1], "trim");
  ASSERT_TRUE(expr.default_value.has_value());
  EXPECT_EQ(*expr.default_value, "0");
}

TEST_F(TokenTestFixture, parse_is_total) {
  auto bare = docfill::parseTokenExpression("Just a column");
  EXPECT_EQ(bare.base_name, "Just a column");
  EXPECT_TRUE(bare.filters.empty());
  EXPECT_FALSE(bare.default_value.has_value());

  auto only_default = docfill::parseTokenExpression("?:fallback");
  EXPECT_EQ(only_default.base_name, "");
  EXPECT_EQ(*only_default.default_value, "fallback");

  // Only the first separator splits.
  auto nested = docfill::parseTokenExpression("A?:b?:c");
  EXPECT_EQ(*nested.default_value, "b?:c");
}

TEST_F(TokenTestFixture, missing_column_without_default_is_empty) {
  EXPECT_EQ(evaluateToken("MISSING", sampleRow()), "");
  EXPECT_EQ(evaluateToken("MISSING|upper", sampleRow()), "");
  EXPECT_EQ(evaluateToken("", sampleRow()), "");
}

TEST_F(TokenTestFixture, default_used_for_missing_or_blank) {
  EXPECT_EQ(evaluateToken("MISSING?:N/A", sampleRow()), "N/A");
  EXPECT_EQ(evaluateToken("EMPTY ?: none", sampleRow()), "none");
  EXPECT_EQ(evaluateToken("NAME?:N/A", sampleRow()), "Ana");
}

TEST_F(TokenTestFixture, default_is_not_filtered) {
  EXPECT_EQ(evaluateToken("MISSING|upper?:n/a", sampleRow()), "n/a");
  EXPECT_EQ(evaluateToken("NAME|upper?:n/a", sampleRow()), "ANA");
}

TEST_F(TokenTestFixture, unknown_filter_is_noop) {
  EXPECT_EQ(evaluateToken("NAME|shout", sampleRow()), "Ana");
  EXPECT_EQ(evaluateToken("NAME|shout|lower", sampleRow()), "ana");
  EXPECT_EQ(docfill::findFilter("shout"), nullptr);
  EXPECT_NE(docfill::findFilter("euros"), nullptr);
}

TEST_F(TokenTestFixture, row_trims_names_and_values) {
  Row row = sampleRow();
  EXPECT_EQ(evaluateToken("PADDED", row), "x");
  EXPECT_EQ(row.value("EMPTY"), "");
  EXPECT_FALSE(row.contains(" PADDED "));
}

TEST_F(TokenTestFixture, euros_filter) {
  EXPECT_EQ(evaluateToken("AMOUNT|euros", sampleRow()), "1.234,50 €");
  EXPECT_EQ(docfill::formatEuros("1.234.567,891"), "1.234.567,89 €");
  EXPECT_EQ(docfill::formatEuros("0"), "0,00 €");
  EXPECT_EQ(docfill::formatEuros("-5"), "-5,00 €");
  EXPECT_EQ(docfill::formatEuros("999,999"), "1.000,00 €");
  EXPECT_EQ(docfill::formatEuros("abc"), "abc");
  EXPECT_EQ(docfill::formatEuros(""), "");
}

TEST_F(TokenTestFixture, euros_filter_keeps_every_digit_of_large_values) {
  std::string out = docfill::formatEuros("1e100");
  ASSERT_GT(out.size(), 10U);
  EXPECT_EQ(out.substr(out.size() - 7), ",00 €");
  std::string integral = out.substr(0, out.find(','));
  EXPECT_EQ(std::count_if(integral.begin(), integral.end(), [](char c) { return c >= '0' && c <= '9'; }), 101);
  EXPECT_EQ(integral.substr(0, 3), "10.");
}

TEST_F(TokenTestFixture, dmy_filter) {
  EXPECT_EQ(evaluateToken("DATE|dmy", sampleRow()), "05/03/2024");
  EXPECT_EQ(docfill::formatDateDmy("5/3/2024"), "05/03/2024");
  EXPECT_EQ(docfill::formatDateDmy("31-12-1999"), "31/12/1999");
  EXPECT_EQ(docfill::formatDateDmy("2024/02/29"), "29/02/2024");
  EXPECT_EQ(docfill::formatDateDmy(" 2023-02-29 "), "2023-02-29");
  EXPECT_EQ(docfill::formatDateDmy("tomorrow"), "tomorrow");
  EXPECT_EQ(docfill::formatDateDmy(""), "");
}

TEST_F(TokenTestFixture, dmy_filter_needs_four_digit_year) {
  EXPECT_EQ(docfill::formatDateDmy("05/03/24"), "05/03/24");
  EXPECT_EQ(docfill::formatDateDmy("24-01-05"), "24-01-05");
  EXPECT_EQ(docfill::formatDateDmy("5/3/024"), "5/3/024");
  EXPECT_EQ(docfill::formatDateDmy("2024-1-5"), "05/01/2024");
}

TEST_F(TokenTestFixture, case_and_trim_filters) {
  Row row(std::vector<Row::Cell>{{"T", "MiXeD"}});
  EXPECT_EQ(evaluateToken("T|upper", row), "MIXED");
  EXPECT_EQ(evaluateToken("T|lower", row), "mixed");
  EXPECT_EQ(docfill::applyFilter("trim", "  a b  "), "a b");
}

TEST_F(TokenTestFixture, case_filters_map_accented_letters) {
  Row row(std::vector<Row::Cell>{{"NAME", "María José Núñez"}});
  EXPECT_EQ(evaluateToken("NAME|upper", row), "MARÍA JOSÉ NÚÑEZ");
  EXPECT_EQ(evaluateToken("NAME|upper|lower", row), "maría josé núñez");
  EXPECT_EQ(docfill::applyFilter("lower", "ÁÉÍÓÚ Ü"), "áéíóú ü");
  EXPECT_EQ(docfill::applyFilter("upper", std::string("a\xFF") + "b"), std::string("A\xFF") + "B");
}

TEST_F(TokenTestFixture, base_name_and_token_text) {
  EXPECT_EQ(docfill::collectBaseName("Amount|euros?:0"), "Amount");
  EXPECT_EQ(docfill::collectBaseName(" B |upper"), "B");
  EXPECT_EQ(docfill::collectBaseName("C?:x|y"), "C");
  EXPECT_EQ(docfill::tokenFor("NAME"), "{{NAME}}");
}
