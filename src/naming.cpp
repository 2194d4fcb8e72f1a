/// Output file naming and row routing helpers.

#include "docfill/naming.hpp"

#include <cctype>
#include <cstdio>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"

namespace docfill {

namespace {

static std::string formatIndex(size_t index, const std::string& spec, const std::string& pattern) {
  if (spec.empty()) {
    return std::to_string(index);
  }
  if (spec.back() != 'd') {
    throw ConfigurationError("Unsupported format spec '" + spec + "' for index in pattern: " + pattern);
  }
  std::string width = spec.substr(0, spec.size() - 1);
  bool zero_pad = !width.empty() && width[0] == '0';
  for (char c : width) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw ConfigurationError("Unsupported format spec '" + spec + "' for index in pattern: " + pattern);
    }
  }
  int w = width.empty() ? 0 : std::stoi(width);
  char buf[64];
  std::snprintf(buf, sizeof(buf), zero_pad ? "%0*zu" : "%*zu", w, index);
  return buf;
}

} // namespace

std::string expandFilenamePattern(const std::string& pattern, const Row& row, size_t index) {
  std::string out;
  size_t i = 0;
  while (i < pattern.size()) {
    char c = pattern[i];
    if (c == '{') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
        out.push_back('{');
        i += 2;
        continue;
      }
      size_t close = pattern.find('}', i + 1);
      if (close == std::string::npos) {
        throw ConfigurationError("Unbalanced '{' in filename pattern: " + pattern);
      }
      std::string field = pattern.substr(i + 1, close - i - 1);
      std::string spec;
      size_t colon = field.find(':');
      if (colon != std::string::npos) {
        spec = field.substr(colon + 1);
        field = field.substr(0, colon);
      }
      if (field == "index") {
        out += formatIndex(index, spec, pattern);
      } else if (const std::string* value = row.find(field)) {
        if (!spec.empty()) {
          throw ConfigurationError("Format spec '" + spec + "' is only supported for index: " + pattern);
        }
        out += *value;
      } else {
        std::string columns;
        for (const auto& col : row.columns()) {
          columns += columns.empty() ? col : ", " + col;
        }
        throw ConfigurationError("Filename pattern requires a missing column: '" + field + "'. Pattern: " + pattern +
                                 " | Columns: [" + columns + "]");
      }
      i = close + 1;
      continue;
    }
    if (c == '}') {
      if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
        out.push_back('}');
        i += 2;
        continue;
      }
      throw ConfigurationError("Single '}' in filename pattern: " + pattern);
    }
    out.push_back(c);
    ++i;
  }
  return out;
}

std::string sanitizeFilename(const std::string& name) {
  static const std::string cUnsafe = "<>:\"/\\|?*";
  std::string out = name;
  for (auto& c : out) {
    if (cUnsafe.find(c) != std::string::npos) {
      c = '_';
    }
  }
  return trimCopy(out);
}

std::string outputFileName(const std::string& pattern, const Row& row, size_t index) {
  std::string name = sanitizeFilename(expandFilenamePattern(pattern, row, index));
  if (!endsWith(toLowerAscii(name), ".pdf")) {
    name += ".pdf";
  }
  return name;
}

bool isSkipValue(const std::string& value) {
  std::string v = toLowerAscii(trimCopy(value));
  return v == "1" || v == "true" || v == "si" || v == "s\xC3\xAD" || v == "s\xC3\x8D" || v == "x" || v == "y" ||
         v == "yes";
}

} // namespace docfill
