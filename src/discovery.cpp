/// Token discovery for preflight validation. Never mutates the document.

#include "docfill/discovery.hpp"

#include <cctype>

#include "docfill/token.hpp"
#include "docfill_internal.hpp"

namespace docfill {

namespace {

// Characters a discoverable token may contain.
static bool isTokenChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ' ' || c == ':' || c == '|' ||
         c == '?';
}

static bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::set<std::string> collectTokensFromText(const std::string& text) {
  std::set<std::string> out;
  size_t pos = 0;
  while (true) {
    size_t open = text.find(cTokenPrefix, pos);
    if (open == std::string::npos) {
      break;
    }
    size_t i = open + cTokenPrefix.size();
    while (i < text.size() && isSpace(text[i]) && !isTokenChar(text[i])) {
      ++i;
    }
    size_t end = i;
    while (end < text.size() && isTokenChar(text[end])) {
      ++end;
    }
    size_t close = end;
    while (close < text.size() && isSpace(text[close])) {
      ++close;
    }
    if (end > i && text.compare(close, cTokenSuffix.size(), cTokenSuffix) == 0) {
      out.insert(trimCopy(text.substr(i, end - i)));
      pos = close + cTokenSuffix.size();
    } else {
      pos = open + 1;
    }
  }
  return out;
}

std::set<std::string> collectTokens(Document& doc, const WalkOptions& opts) {
  std::set<std::string> out;
  DocumentWalker walker(doc, opts);
  while (auto unit = walker.next()) {
    std::string text = unit->text();
    if (text.find(cTokenPrefix) == std::string::npos) {
      continue;
    }
    auto found = collectTokensFromText(text);
    out.insert(found.begin(), found.end());
  }
  return out;
}

std::set<std::string> collectTokensFromFile(const std::string& path, const WalkOptions& opts) {
  auto doc = openDocument(path);
  return collectTokens(*doc, opts);
}

PreflightReport comparePreflight(const std::set<std::string>& raw_tokens, const std::vector<std::string>& columns) {
  PreflightReport report;
  report.raw_tokens = raw_tokens;
  for (const auto& raw : raw_tokens) {
    report.base_names.insert(collectBaseName(raw));
  }
  std::set<std::string> column_set(columns.begin(), columns.end());
  for (const auto& base : report.base_names) {
    if (column_set.count(base) == 0) {
      report.missing_columns.insert(base);
    }
  }
  for (const auto& col : column_set) {
    if (report.base_names.count(col) == 0) {
      report.unused_columns.insert(col);
    }
  }
  return report;
}

} // namespace docfill
