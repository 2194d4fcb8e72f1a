/// Token grammar, filter registry and evaluation.

#include "docfill/token.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unordered_map>

#include <utf8proc.h>

#include "docfill_internal.hpp"

namespace docfill {

namespace {

static bool isNumberText(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E')) {
      return false;
    }
  }
  return true;
}

static bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int daysInMonth(int y, int m) {
  static const int cDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) {
    return 29;
  }
  return cDays[m - 1];
}

static bool parseField(const std::string& s, size_t min_digits, size_t max_digits, int* out) {
  if (s.size() < min_digits || s.size() > max_digits) {
    return false;
  }
  int v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    v = v * 10 + (c - '0');
  }
  *out = v;
  return true;
}

// Matches one strptime-like layout: either year first (Y sep m sep d) or day first (d sep m sep Y).
static bool parseDate(const std::string& s, bool year_first, char sep, int* y, int* m, int* d) {
  size_t p1 = s.find(sep);
  if (p1 == std::string::npos) {
    return false;
  }
  size_t p2 = s.find(sep, p1 + 1);
  if (p2 == std::string::npos || s.find(sep, p2 + 1) != std::string::npos) {
    return false;
  }
  std::string a = s.substr(0, p1);
  std::string b = s.substr(p1 + 1, p2 - p1 - 1);
  std::string c = s.substr(p2 + 1);
  // Years take exactly four digits; day and month one or two.
  bool ok = year_first ? (parseField(a, 4, 4, y) && parseField(b, 1, 2, m) && parseField(c, 1, 2, d))
                       : (parseField(a, 1, 2, d) && parseField(b, 1, 2, m) && parseField(c, 4, 4, y));
  if (!ok || *y < 1 || *m < 1 || *m > 12 || *d < 1) {
    return false;
  }
  return *d <= daysInMonth(*y, *m);
}

// Per code point case mapping; bytes that are not valid UTF-8 are copied through.
static std::string mapCase(const std::string& s, utf8proc_int32_t (*map)(utf8proc_int32_t)) {
  std::string out;
  out.reserve(s.size());
  const auto* p = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
  auto left = static_cast<utf8proc_ssize_t>(s.size());
  while (left > 0) {
    utf8proc_int32_t cp = 0;
    utf8proc_ssize_t n = utf8proc_iterate(p, left, &cp);
    if (n <= 0) {
      out.push_back(static_cast<char>(*p));
      ++p;
      --left;
      continue;
    }
    utf8proc_uint8_t buf[4];
    utf8proc_ssize_t len = utf8proc_encode_char(map(cp), buf);
    out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
    p += n;
    left -= n;
  }
  return out;
}

static const std::unordered_map<std::string, FilterFn>& filterRegistry() {
  static const std::unordered_map<std::string, FilterFn> cRegistry = {
    {"trim", [](const std::string& s) { return trimCopy(s); }},
    {"upper", [](const std::string& s) { return mapCase(s, utf8proc_toupper); }},
    {"lower", [](const std::string& s) { return mapCase(s, utf8proc_tolower); }},
    {"euros", [](const std::string& s) { return formatEuros(s); }},
    {"dmy", [](const std::string& s) { return formatDateDmy(s); }},
  };
  return cRegistry;
}

} // namespace

std::string formatEuros(const std::string& value) {
  // Spanish input convention: '.' groups thousands, ',' is the decimal mark.
  std::string normalized = replaceAll(replaceAll(trimCopy(value), ".", ""), ",", ".");
  if (!isNumberText(normalized)) {
    return value;
  }
  char* end = nullptr;
  double v = std::strtod(normalized.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(v)) {
    return value;
  }
  int size = std::snprintf(nullptr, 0, "%.2f", v);
  if (size <= 0) {
    return value;
  }
  std::string fixed(static_cast<size_t>(size) + 1, '\0');
  std::snprintf(&fixed[0], fixed.size(), "%.2f", v);
  fixed.resize(static_cast<size_t>(size));
  std::string sign;
  if (!fixed.empty() && fixed[0] == '-') {
    sign = "-";
    fixed.erase(0, 1);
  }
  size_t dot = fixed.find('.');
  std::string integral = fixed.substr(0, dot);
  std::string decimals = dot == std::string::npos ? std::string("00") : fixed.substr(dot + 1);
  std::string grouped;
  for (size_t i = 0; i < integral.size(); ++i) {
    if (i != 0 && (integral.size() - i) % 3 == 0) {
      grouped.push_back('.');
    }
    grouped.push_back(integral[i]);
  }
  return sign + grouped + "," + decimals + " €";
}

std::string formatDateDmy(const std::string& value) {
  std::string s = trimCopy(value);
  if (s.empty()) {
    return std::string();
  }
  struct Layout {
    bool year_first;
    char sep;
  };
  static const Layout cLayouts[] = {{true, '-'}, {false, '/'}, {false, '-'}, {true, '/'}};
  for (const auto& layout : cLayouts) {
    int y = 0, m = 0, d = 0;
    if (parseDate(s, layout.year_first, layout.sep, &y, &m, &d)) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", d, m, y);
      return buf;
    }
  }
  return s;
}

const FilterFn* findFilter(const std::string& name) {
  const auto& registry = filterRegistry();
  auto it = registry.find(name);
  return it == registry.end() ? nullptr : &it->second;
}

std::string applyFilter(const std::string& name, const std::string& value) {
  const FilterFn* fn = findFilter(name);
  if (fn == nullptr) {
    return value;
  }
  return (*fn)(value);
}

TokenExpression parseTokenExpression(const std::string& expr) {
  TokenExpression out;
  std::string head = expr;
  size_t sep = head.find(cDefaultSeparator);
  if (sep != std::string::npos) {
    out.default_value = trimCopy(head.substr(sep + cDefaultSeparator.size()));
    head = trimCopy(head.substr(0, sep));
  }
  size_t start = 0;
  bool first = true;
  while (true) {
    size_t bar = head.find('|', start);
    std::string piece = trimCopy(head.substr(start, bar == std::string::npos ? std::string::npos : bar - start));
    if (first) {
      out.base_name = piece;
      first = false;
    } else {
      out.filters.push_back(piece);
    }
    if (bar == std::string::npos) {
      break;
    }
    start = bar + 1;
  }
  return out;
}

std::string evaluateToken(const TokenExpression& expr, const Row& row) {
  std::string value = row.value(expr.base_name);
  if (expr.default_value && trimCopy(value).empty()) {
    return *expr.default_value;
  }
  for (const auto& f : expr.filters) {
    value = applyFilter(f, value);
  }
  return value;
}

std::string evaluateToken(const std::string& expr, const Row& row) {
  return evaluateToken(parseTokenExpression(expr), row);
}

std::string collectBaseName(const std::string& expr) {
  std::string base = expr.substr(0, expr.find(cDefaultSeparator));
  return trimCopy(base.substr(0, base.find('|')));
}

std::string tokenFor(const std::string& column) {
  std::string out(cTokenPrefix);
  out += column;
  out += cTokenSuffix;
  return out;
}

} // namespace docfill
