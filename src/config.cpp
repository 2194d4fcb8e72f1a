/// YAML configuration (yaml-cpp).

#include "docfill/config.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "docfill/error.hpp"
#include "docfill/token.hpp"

namespace docfill {

namespace {

template <typename T>
static void readValue(const YAML::Node& root, const char* key, T* out) {
  const YAML::Node node = root[key];
  if (!node || node.IsNull()) {
    return;
  }
  try {
    *out = node.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
  }
}

static void applyYaml(const YAML::Node& root, Config* cfg) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigurationError("Configuration must be a mapping of keys to values");
  }
  readValue(root, "data", &cfg->data);
  readValue(root, "output_dir", &cfg->output_dir);
  readValue(root, "template_dir", &cfg->template_dir);
  readValue(root, "sheet", &cfg->sheet);
  readValue(root, "filename_pattern", &cfg->filename_pattern);
  readValue(root, "scan_masters", &cfg->walk.scan_masters);
  readValue(root, "scan_headers_footers", &cfg->walk.scan_headers_footers);
  readValue(root, "soffice_bin", &cfg->soffice_bin);
  readValue(root, "default_template", &cfg->default_template);
  readValue(root, "required_columns", &cfg->required_columns);
  readValue(root, "dry_run", &cfg->dry_run);
  readValue(root, "strict", &cfg->strict);
  readValue(root, "export_retries", &cfg->export_options.retries);
  readValue(root, "pdf_filter", &cfg->export_options.filter);
  readValue(root, "pdf_filter_opts", &cfg->export_options.filter_options);

  std::string engine;
  readValue(root, "export_engine", &engine);
  if (!engine.empty()) {
    auto choice = parseEngineChoice(engine);
    if (!choice) {
      throw ConfigurationError("Invalid export_engine '" + engine + "' (expected auto, libreoffice or msoffice)");
    }
    cfg->export_options.engine = *choice;
  }
  if (cfg->export_options.retries < 0) {
    throw ConfigurationError("export_retries must not be negative");
  }

  readValue(root, "column_formatters", &cfg->column_formatters);
  for (const auto& entry : cfg->column_formatters) {
    if (findFilter(entry.second) == nullptr) {
      spdlog::warn("Unknown formatter '{}' for column '{}' is ignored", entry.second, entry.first);
    }
  }
}

} // namespace

Config defaultConfig() {
  Config cfg;
  if (const char* bin = std::getenv("SOFFICE_BIN")) {
    if (*bin != '\0') {
      cfg.soffice_bin = bin;
    }
  }
  return cfg;
}

void loadConfigString(const std::string& yaml, Config* cfg) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(std::string("Malformed configuration: ") + e.what());
  }
  applyYaml(root, cfg);
}

void loadConfigFile(const std::string& path, Config* cfg) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigurationError("Cannot read configuration file: " + path);
  } catch (const YAML::Exception& e) {
    throw ConfigurationError("Malformed configuration file " + path + ": " + e.what());
  }
  applyYaml(root, cfg);
  spdlog::debug("Loaded configuration from {}", path);
}

} // namespace docfill
