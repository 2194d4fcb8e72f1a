#pragma once

#include <set>
#include <string>
#include <vector>

#include "docfill/document.hpp"

namespace docfill {

// Raw token inners ("Amount|euros?:0") found in a piece of text.
std::set<std::string> collectTokensFromText(const std::string& text);

// Read-only walk over every unit of the document.
std::set<std::string> collectTokens(Document& doc, const WalkOptions& opts);

// Opens a canonical template and collects its tokens.
std::set<std::string> collectTokensFromFile(const std::string& path, const WalkOptions& opts);

struct PreflightReport {
  std::set<std::string> raw_tokens;
  std::set<std::string> base_names;
  std::set<std::string> missing_columns; // tokens without a column
  std::set<std::string> unused_columns;  // columns no token refers to
};

// columns should already exclude TEMPLATE.
PreflightReport comparePreflight(const std::set<std::string>& raw_tokens, const std::vector<std::string>& columns);

} // namespace docfill
