/// Per-row orchestration: routing, normalization, substitution and export.

#include "docfill/renderer.hpp"

#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

#include "docfill/consolidator.hpp"
#include "docfill/document.hpp"
#include "docfill/error.hpp"
#include "docfill/naming.hpp"
#include "docfill/scratch.hpp"
#include "docfill/token.hpp"
#include "docfill_internal.hpp"

namespace fs = std::filesystem;

namespace docfill {

namespace {

static std::string joinSorted(const std::set<std::string>& items) {
  std::string out = "[";
  for (const auto& item : items) {
    out += out.size() > 1 ? ", '" + item + "'" : "'" + item + "'";
  }
  return out + "]";
}

static void ensureDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw Error("Cannot create directory " + dir.string() + ": " + ec.message());
  }
}

} // namespace

RenderContext::RenderContext(std::unique_ptr<ConversionEngine> engine, std::unique_ptr<AutomationChannel> channel)
  : engine_(std::move(engine)), channel_(std::move(channel)), normalizer_(*engine_) {}

Renderer::Renderer(Config cfg, RenderContext& ctx)
  : cfg_(std::move(cfg)), ctx_(ctx), exporter_(ctx.engine(), ctx.channel(), cfg_.export_options) {}

std::string Renderer::resolveTemplatePath(const std::string& template_name) const {
  std::string name = trimCopy(template_name);
  if (name.empty()) {
    if (cfg_.default_template.empty()) {
      throw ConfigurationError("Column 'TEMPLATE' is empty and no default template is configured");
    }
    name = cfg_.default_template;
  }
  if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    throw ConfigurationError("'TEMPLATE' must be a file name only (no directories). Received: '" + name + "'");
  }
  fs::path path = fs::path(cfg_.template_dir) / name;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw ResolutionError("Template file not found: " + path.string());
  }
  return path.string();
}

Row Renderer::prepareRow(const Row& row) const {
  Row out = row;
  for (const auto& entry : cfg_.column_formatters) {
    if (const std::string* value = out.find(entry.first)) {
      out = out.withValue(entry.first, applyFilter(entry.second, *value));
    }
  }
  return out;
}

void Renderer::renderDocument(const std::string& template_path, const Row& row, const std::string& output) {
  std::string canonical = ctx_.normalizer().normalize(template_path);
  auto doc = openDocument(canonical);
  substituteDocument(*doc, row, buildFastMap(row), cfg_.walk);

  ScratchDir scratch("docfill_render");
  std::string edited = (fs::path(scratch.path()) / ("edited" + canonicalExtension(doc->kind()))).string();
  doc->save(edited);
  ExportReport report = exporter_.exportDocument(edited, doc->kind(), output);
  spdlog::debug("Exported {} after {} conversion attempt(s)", output, report.conversion_attempts);
}

PreflightReport Renderer::preflight(const Table& table) {
  std::set<std::string> templates;
  bool has_empty = false;
  for (const auto& row : table.rows) {
    std::string name = trimCopy(row.value("TEMPLATE"));
    if (name.empty()) {
      has_empty = true;
    } else {
      templates.insert(name);
    }
  }
  if ((has_empty || templates.empty()) && !cfg_.default_template.empty()) {
    templates.insert(cfg_.default_template);
  }

  std::set<std::string> raw_tokens;
  for (const auto& name : templates) {
    try {
      std::string canonical = ctx_.normalizer().normalize(resolveTemplatePath(name));
      auto tokens = collectTokensFromFile(canonical, cfg_.walk);
      raw_tokens.insert(tokens.begin(), tokens.end());
    } catch (const Error& e) {
      // Reported again for each affected row.
      spdlog::warn("[Preflight] Cannot scan template '{}': {}", name, e.what());
    }
  }

  std::vector<std::string> columns;
  for (const auto& col : table.columns) {
    if (toUpperAscii(col) != "TEMPLATE") {
      columns.push_back(col);
    }
  }
  PreflightReport report = comparePreflight(raw_tokens, columns);
  spdlog::info("[Preflight] Tokens found in templates (raw): {}", joinSorted(report.raw_tokens));
  spdlog::info("[Preflight] Base token names: {}", joinSorted(report.base_names));
  if (!report.missing_columns.empty()) {
    spdlog::warn("[Preflight] Tokens without matching columns: {}", joinSorted(report.missing_columns));
  }
  if (!report.unused_columns.empty()) {
    spdlog::info("[Preflight] Columns not used by any token: {}", joinSorted(report.unused_columns));
  }
  if (cfg_.strict && !report.missing_columns.empty()) {
    throw ConfigurationError("[STRICT] Missing columns for tokens: " + joinSorted(report.missing_columns));
  }
  return report;
}

RenderResult Renderer::renderRow(const Row& row, size_t index, size_t position, size_t total) {
  RenderResult result;
  result.row = index;
  const std::string progress = "[" + std::to_string(position) + "/" + std::to_string(total) + "]";

  if (isSkipValue(row.value("SKIP"))) {
    spdlog::info("{} SKIP set, row skipped", progress);
    result.status = RenderStatus::Skipped;
    return result;
  }

  const std::string template_name = row.value("TEMPLATE");
  std::string template_path;
  try {
    template_path = resolveTemplatePath(template_name);
  } catch (const Error& e) {
    spdlog::error("{} Template resolve failed: {}", progress, e.what());
    result.status = RenderStatus::Error;
    result.error = e.what();
    return result;
  }

  Row prepared = prepareRow(row);
  std::string pdf_name;
  try {
    pdf_name = outputFileName(cfg_.filename_pattern, prepared, index);
  } catch (const ConfigurationError& e) {
    spdlog::error("{} {}", progress, e.what());
    result.status = RenderStatus::Error;
    result.error = e.what();
    return result;
  }

  std::string subdir = trimCopy(row.value("OUTPUT"));
  fs::path target_dir = subdir.empty() ? fs::path(cfg_.output_dir) : fs::path(cfg_.output_dir) / sanitizeFilename(subdir);
  const std::string pdf_path = (target_dir / pdf_name).string();
  result.template_name = template_name;
  result.output = pdf_path;

  if (cfg_.dry_run) {
    spdlog::info("{} [DRY-RUN] Template={} -> {}", progress, fs::path(template_path).filename().string(), pdf_name);
    result.status = RenderStatus::DryRun;
    return result;
  }

  try {
    ensureDirectory(target_dir);
    spdlog::info("{} {} -> {}", progress, fs::path(template_path).filename().string(), pdf_name);
    renderDocument(template_path, prepared, pdf_path);
    std::error_code ec;
    auto size = fs::file_size(pdf_path, ec);
    result.status = RenderStatus::Ok;
    result.bytes = ec ? 0 : size;
  } catch (const Error& e) {
    result.status = RenderStatus::Error;
    result.error = e.what();
  } catch (const std::exception& e) {
    result.status = RenderStatus::Error;
    result.error = std::string("unexpected: ") + e.what();
  }
  if (result.status == RenderStatus::Error) {
    spdlog::error("Row {} ({}) -> {}", index, fs::path(template_path).filename().string(), *result.error);
  }
  return result;
}

std::vector<RenderResult> Renderer::runBatch(const Table& table) {
  std::vector<std::string> missing;
  for (const auto& col : cfg_.required_columns) {
    if (!table.hasColumn(col)) {
      missing.push_back(col);
    }
  }
  if (!missing.empty()) {
    std::string msg = "Missing required columns:";
    for (const auto& col : missing) {
      msg += " '" + col + "'";
    }
    throw ConfigurationError(msg);
  }
  ensureDirectory(cfg_.output_dir);
  preflight(table);

  const size_t total = table.size();
  spdlog::info("Rows to process: {}", total);
  std::vector<RenderResult> results;
  results.reserve(total);
  for (size_t i = 0; i < total; ++i) {
    results.push_back(renderRow(table.rows[i], table.indices[i], i + 1, total));
  }
  writeReports(results);
  spdlog::info("Done.");
  return results;
}

void Renderer::writeReports(const std::vector<RenderResult>& results) const {
  const std::string json_path = (fs::path(cfg_.output_dir) / "_report.json").string();
  try {
    writeJsonReport(json_path, results);
    spdlog::info("Report saved to: {}", json_path);
  } catch (const Error& e) {
    spdlog::warn("Could not write JSON report: {}", e.what());
  }
  const std::string csv_path = (fs::path(cfg_.output_dir) / "_report.csv").string();
  try {
    writeCsvReport(csv_path, results);
    spdlog::info("Report saved to: {}", csv_path);
  } catch (const Error& e) {
    spdlog::warn("Could not write CSV report: {}", e.what());
  }
}

} // namespace docfill
