#pragma once

#include <string>

#include "docfill/row.hpp"

namespace docfill {

// Expands {COLUMN} and {index[:spec]} placeholders; "{{" and "}}" are literal
// braces. spec is "d", "Nd" or "0Nd". Throws ConfigurationError for unknown
// columns and malformed patterns.
std::string expandFilenamePattern(const std::string& pattern, const Row& row, size_t index);

// Replaces <>:"/\|?* with '_' and trims.
std::string sanitizeFilename(const std::string& name);

// Sanitized name with ".pdf" appended unless already present (case-insensitive).
std::string outputFileName(const std::string& pattern, const Row& row, size_t index);

// SKIP column values that skip a row: 1, true, si, sí, x, y, yes.
bool isSkipValue(const std::string& value);

} // namespace docfill
