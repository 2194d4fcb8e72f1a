#pragma once

#include <string>
#include <utility>
#include <vector>

#include "docfill/document.hpp"
#include "docfill/row.hpp"

namespace docfill {

// Literal "{{COL}}" -> value pairs replaced before expression evaluation.
using FastMap = std::vector<std::pair<std::string, std::string>>;

// Every column of the row except TEMPLATE (case-insensitive), in column order.
FastMap buildFastMap(const Row& row);

// Token-substituted text of a unit: fast map first, then remaining {{...}}
// expressions through the evaluator.
std::string substituteText(const std::string& text, const Row& row, const FastMap& fast_map);

// Rewrites the unit when its text changes: one run holding the full text,
// styled like the former first run. Returns true iff the text changed.
bool substitute(StructuralUnit& unit, const Row& row, const FastMap& fast_map);

// Walks the document once and substitutes every unit. Returns the number of changed units.
size_t substituteDocument(Document& doc, const Row& row, const FastMap& fast_map, const WalkOptions& opts);

} // namespace docfill
