/// Token substitution and run consolidation over structural units.

#include "docfill/consolidator.hpp"

#include <spdlog/spdlog.h>

#include "docfill/token.hpp"
#include "docfill_internal.hpp"

namespace docfill {

FastMap buildFastMap(const Row& row) {
  FastMap out;
  out.reserve(row.size());
  for (const auto& cell : row.cells()) {
    if (toUpperAscii(cell.first) == "TEMPLATE") {
      continue;
    }
    out.emplace_back(tokenFor(cell.first), cell.second);
  }
  return out;
}

std::string substituteText(const std::string& text, const Row& row, const FastMap& fast_map) {
  std::string s = text;
  for (const auto& entry : fast_map) {
    if (s.find(entry.first) != std::string::npos) {
      s = replaceAll(s, entry.first, entry.second);
    }
  }
  if (s.find(cTokenPrefix) == std::string::npos) {
    return s;
  }
  // "{{" opens, the first '}' must start "}}"; the inner text is non-empty.
  std::string result;
  result.reserve(s.size());
  size_t pos = 0;
  while (true) {
    size_t open = s.find(cTokenPrefix, pos);
    if (open == std::string::npos) {
      break;
    }
    size_t inner = open + cTokenPrefix.size();
    size_t close = s.find('}', inner);
    if (close == std::string::npos) {
      break;
    }
    if (close == inner || s.compare(close, cTokenSuffix.size(), cTokenSuffix) != 0) {
      result.append(s, pos, close + 1 - pos);
      pos = close + 1;
      continue;
    }
    result.append(s, pos, open - pos);
    result += evaluateToken(trimCopy(s.substr(inner, close - inner)), row);
    pos = close + cTokenSuffix.size();
  }
  result.append(s, pos, std::string::npos);
  return result;
}

bool substitute(StructuralUnit& unit, const Row& row, const FastMap& fast_map) {
  std::vector<Run> runs = unit.runs();
  std::string original;
  for (const auto& run : runs) {
    original += run.text;
  }
  if (original.empty()) {
    return false;
  }
  std::string replaced = substituteText(original, row, fast_map);
  if (replaced == original) {
    return false;
  }
  RunStyle style = runs.empty() ? RunStyle() : runs.front().style;
  unit.replaceRuns(replaced, style);
  return true;
}

size_t substituteDocument(Document& doc, const Row& row, const FastMap& fast_map, const WalkOptions& opts) {
  size_t changed = 0;
  DocumentWalker walker(doc, opts);
  while (auto unit = walker.next()) {
    if (substitute(*unit, row, fast_map)) {
      ++changed;
    }
  }
  spdlog::debug("Substituted {} structural unit(s) in {} document", changed, toString(doc.kind()));
  return changed;
}

} // namespace docfill
