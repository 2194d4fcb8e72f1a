/// Batch result reports: JSON (nlohmann) and CSV.

#include "docfill/report.hpp"

#include <fstream>
#include <map>
#include <set>

#include "docfill/error.hpp"

namespace docfill {

namespace {

using json = nlohmann::ordered_json;

// Same fields as the JSON report, as strings for the CSV writer.
static std::map<std::string, std::string> resultFields(const RenderResult& r) {
  std::map<std::string, std::string> out;
  out["row"] = std::to_string(r.row);
  out["status"] = toString(r.status);
  if (r.template_name) {
    out["template"] = *r.template_name;
  }
  if (r.output) {
    out["output"] = *r.output;
  }
  if (r.bytes) {
    out["bytes"] = std::to_string(*r.bytes);
  }
  if (r.error) {
    out["error"] = *r.error;
  }
  return out;
}

static std::string csvField(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) {
    return s;
  }
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') {
      out += "\"\"";
    } else {
      out.push_back(c);
    }
  }
  out += "\"";
  return out;
}

} // namespace

const char* toString(RenderStatus status) {
  switch (status) {
    case RenderStatus::Ok:
      return "OK";
    case RenderStatus::Error:
      return "ERROR";
    case RenderStatus::Skipped:
      return "SKIPPED";
    case RenderStatus::DryRun:
      return "DRY-RUN";
  }
  return "ERROR";
}

nlohmann::ordered_json resultsToJson(const std::vector<RenderResult>& results) {
  json arr = json::array();
  for (const auto& r : results) {
    json obj;
    obj["row"] = r.row;
    obj["status"] = toString(r.status);
    if (r.template_name) {
      obj["template"] = *r.template_name;
    }
    if (r.output) {
      obj["output"] = *r.output;
    }
    if (r.bytes) {
      obj["bytes"] = *r.bytes;
    }
    if (r.error) {
      obj["error"] = *r.error;
    }
    arr.push_back(std::move(obj));
  }
  return arr;
}

void writeJsonReport(const std::string& path, const std::vector<RenderResult>& results) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw Error("Cannot write report: " + path);
  }
  ofs << resultsToJson(results).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
  if (!ofs) {
    throw Error("Failed writing report: " + path);
  }
}

void writeCsvReport(const std::string& path, const std::vector<RenderResult>& results) {
  std::vector<std::map<std::string, std::string>> rows;
  std::set<std::string> keys;
  for (const auto& r : results) {
    rows.push_back(resultFields(r));
    for (const auto& kv : rows.back()) {
      keys.insert(kv.first);
    }
  }
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw Error("Cannot write report: " + path);
  }
  bool first = true;
  for (const auto& k : keys) {
    ofs << (first ? "" : ",") << csvField(k);
    first = false;
  }
  ofs << "\r\n";
  for (const auto& row : rows) {
    first = true;
    for (const auto& k : keys) {
      auto it = row.find(k);
      ofs << (first ? "" : ",") << (it == row.end() ? std::string() : csvField(it->second));
      first = false;
    }
    ofs << "\r\n";
  }
  if (!ofs) {
    throw Error("Failed writing report: " + path);
  }
}

} // namespace docfill
