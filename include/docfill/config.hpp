#pragma once

#include <map>
#include <string>
#include <vector>

#include "docfill/document.hpp"
#include "docfill/exporter.hpp"

namespace docfill {

struct Config {
  std::string data = "datos.xlsx";
  std::string output_dir = "salida";
  std::string template_dir = "plantillas";
  std::string sheet = "0"; // name or zero-based index
  std::string filename_pattern = "{NOMBRE} - {SALIDA}.pdf";
  WalkOptions walk;
  std::string soffice_bin = "soffice";
  std::string default_template; // used when TEMPLATE is empty
  std::vector<std::string> required_columns{"TEMPLATE"};
  bool dry_run = false;
  bool strict = false; // abort when a token has no matching column
  ExportOptions export_options;
  std::map<std::string, std::string> column_formatters; // column -> filter name
};

// Defaults plus environment overrides (SOFFICE_BIN).
Config defaultConfig();

// Overlays keys found in a YAML document on cfg. Unknown keys are ignored.
// Throws ConfigurationError for malformed YAML or values of the wrong type.
void loadConfigString(const std::string& yaml, Config* cfg);
void loadConfigFile(const std::string& path, Config* cfg);

} // namespace docfill
