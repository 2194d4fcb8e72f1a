#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docfill {

enum class RenderStatus { Ok, Error, Skipped, DryRun };

// "OK", "ERROR", "SKIPPED", "DRY-RUN"
const char* toString(RenderStatus status);

// Outcome of one data row.
struct RenderResult {
  size_t row = 0;
  RenderStatus status = RenderStatus::Ok;
  std::optional<std::string> template_name;
  std::optional<std::string> output;
  std::optional<std::uintmax_t> bytes;
  std::optional<std::string> error;
};

// Array of objects keyed row, status, template, output, bytes, error (present keys only).
nlohmann::ordered_json resultsToJson(const std::vector<RenderResult>& results);

// Throw Error when the file cannot be written.
void writeJsonReport(const std::string& path, const std::vector<RenderResult>& results);
// Header is the sorted union of keys present in any result.
void writeCsvReport(const std::string& path, const std::vector<RenderResult>& results);

} // namespace docfill
