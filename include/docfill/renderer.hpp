#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docfill/config.hpp"
#include "docfill/conversion.hpp"
#include "docfill/discovery.hpp"
#include "docfill/exporter.hpp"
#include "docfill/normalizer.hpp"
#include "docfill/report.hpp"
#include "docfill/row.hpp"
#include "docfill/table.hpp"

namespace docfill {

// Process-wide services shared by every row: the conversion engine, the
// normalization cache built on it and the optional automation channel.
class RenderContext {
public:
  RenderContext(std::unique_ptr<ConversionEngine> engine, std::unique_ptr<AutomationChannel> channel);

  RenderContext(const RenderContext&) = delete;
  RenderContext& operator=(const RenderContext&) = delete;

  ConversionEngine& engine() { return *engine_; }
  FormatNormalizer& normalizer() { return normalizer_; }
  AutomationChannel* channel() { return channel_.get(); }

private:
  std::unique_ptr<ConversionEngine> engine_;
  std::unique_ptr<AutomationChannel> channel_;
  FormatNormalizer normalizer_;
};

class Renderer {
public:
  Renderer(Config cfg, RenderContext& ctx);

  // template_dir/<name>. Empty names fall back to default_template. Throws
  // ConfigurationError for empty names without default or names with path
  // separators, ResolutionError when the file does not exist.
  std::string resolveTemplatePath(const std::string& template_name) const;

  // Row with configured column formatters applied.
  Row prepareRow(const Row& row) const;

  // normalize -> substitute -> export to output.
  void renderDocument(const std::string& template_path, const Row& row, const std::string& output);

  // Tokens of every distinct template against the table columns. Throws
  // ConfigurationError when strict and a token has no column.
  PreflightReport preflight(const Table& table);

  // Never throws for row-level failures; they are recorded in the result.
  RenderResult renderRow(const Row& row, size_t index, size_t position, size_t total);

  // Required columns check, preflight, every row, then the reports.
  std::vector<RenderResult> runBatch(const Table& table);

  void writeReports(const std::vector<RenderResult>& results) const;

  const Config& config() const { return cfg_; }

private:
  Config cfg_;
  RenderContext& ctx_;
  Exporter exporter_;
};

} // namespace docfill
