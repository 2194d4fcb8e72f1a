#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "docfill/config.hpp"
#include "docfill/conversion.hpp"
#include "docfill/error.hpp"
#include "docfill/exporter.hpp"
#include "docfill/logging.hpp"
#include "docfill/renderer.hpp"
#include "docfill/table.hpp"

#ifndef DOCFILL_VERSION
#define DOCFILL_VERSION "0.9.0"
#endif

namespace {

struct CliOptions {
  std::optional<std::string> config_path;
  std::optional<std::string> data;
  std::optional<std::string> output_dir;
  std::optional<std::string> template_dir;
  std::optional<std::string> sheet;
  std::optional<std::string> pattern;
  std::optional<std::string> engine;
  std::optional<std::string> pdf_filter_opts;
  std::optional<long> retries;
  std::optional<long> from;
  std::optional<long> to;
  bool strict = false;
  bool dry_run = false;
  bool verbose = false;
  bool version = false;
  bool check = false;
};

} // namespace

static void print_usage() {
  std::cerr << "Usage: docfill [data] [outdir] [templates] [--config FILE] [--sheet S] [--pattern P]\n"
               "               [--engine auto|libreoffice|msoffice] [--strict] [--dry-run]\n"
               "               [--pdf-filter-opts O] [--retries N] [--from N] [--to N]\n"
               "               [--verbose] [--version] [--check]\n";
}

static bool parse_long(const std::string& s, long* out) {
  try {
    size_t pos = 0;
    long v = std::stol(s, &pos);
    if (pos != s.size()) {
      return false;
    }
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// Returns false on usage errors.
static bool parse_args(int argc, char** argv, CliOptions* opts) {
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::optional<std::string>* dst) {
      if (i + 1 >= argc) {
        std::cerr << "docfill: option " << a << " requires a value\n";
        return false;
      }
      *dst = argv[++i];
      return true;
    };
    auto number = [&](std::optional<long>* dst) {
      long v = 0;
      if (i + 1 >= argc || !parse_long(argv[i + 1], &v)) {
        std::cerr << "docfill: option " << a << " requires an integer\n";
        return false;
      }
      ++i;
      *dst = v;
      return true;
    };
    if (a == "--config") { if (!value(&opts->config_path)) return false; continue; }
    if (a == "--sheet") { if (!value(&opts->sheet)) return false; continue; }
    if (a == "--pattern") { if (!value(&opts->pattern)) return false; continue; }
    if (a == "--engine") { if (!value(&opts->engine)) return false; continue; }
    if (a == "--pdf-filter-opts") { if (!value(&opts->pdf_filter_opts)) return false; continue; }
    if (a == "--retries") { if (!number(&opts->retries)) return false; continue; }
    if (a == "--from") { if (!number(&opts->from)) return false; continue; }
    if (a == "--to") { if (!number(&opts->to)) return false; continue; }
    if (a == "--strict") { opts->strict = true; continue; }
    if (a == "--dry-run") { opts->dry_run = true; continue; }
    if (a == "--verbose" || a == "-v") { opts->verbose = true; continue; }
    if (a == "--version") { opts->version = true; continue; }
    if (a == "--check") { opts->check = true; continue; }
    if (a == "-h" || a == "--help") { return false; }
    if (!a.empty() && a[0] == '-') {
      std::cerr << "docfill: unknown option " << a << "\n";
      return false;
    }
    switch (positional++) {
      case 0: opts->data = a; break;
      case 1: opts->output_dir = a; break;
      case 2: opts->template_dir = a; break;
      default:
        std::cerr << "docfill: unexpected argument " << a << "\n";
        return false;
    }
  }
  if (opts->engine && !docfill::parseEngineChoice(*opts->engine)) {
    std::cerr << "docfill: --engine must be auto, libreoffice or msoffice\n";
    return false;
  }
  if (opts->retries && *opts->retries < 0) {
    std::cerr << "docfill: --retries must not be negative\n";
    return false;
  }
  return true;
}

static void apply_overrides(const CliOptions& opts, docfill::Config* cfg) {
  if (opts.data) cfg->data = *opts.data;
  if (opts.output_dir) cfg->output_dir = *opts.output_dir;
  if (opts.template_dir) cfg->template_dir = *opts.template_dir;
  if (opts.sheet) cfg->sheet = *opts.sheet;
  if (opts.pattern) cfg->filename_pattern = *opts.pattern;
  if (opts.engine) cfg->export_options.engine = *docfill::parseEngineChoice(*opts.engine);
  if (opts.pdf_filter_opts) cfg->export_options.filter_options = *opts.pdf_filter_opts;
  if (opts.retries) cfg->export_options.retries = static_cast<int>(*opts.retries);
  if (opts.strict) cfg->strict = true;
  if (opts.dry_run) cfg->dry_run = true;
}

static int run_check(const docfill::Config& cfg) {
  docfill::LibreOfficeEngine engine(cfg.soffice_bin);
  std::string info;
  bool ok = engine.probe(&info);
  spdlog::info("[Check] LibreOffice: {} ({})", ok ? "OK" : "NOT FOUND", info);
  auto channel = docfill::createAutomationChannel();
  spdlog::info("[Check] Office automation: {}", channel ? "available" : "not available on this platform");
  return 0;
}

int main(int argc, char** argv) {
  CliOptions opts;
  if (!parse_args(argc, argv, &opts)) {
    print_usage();
    return 1;
  }
  if (opts.version) {
    std::cout << DOCFILL_VERSION << "\n";
    return 0;
  }
  docfill::setupLogging(opts.verbose);

  try {
    docfill::Config cfg = docfill::defaultConfig();
    if (opts.config_path) {
      docfill::loadConfigFile(*opts.config_path, &cfg);
    }
    apply_overrides(opts, &cfg);

    if (opts.check) {
      return run_check(cfg);
    }

    // Automation channel lives for the whole batch.
    std::unique_ptr<docfill::AutomationChannel> channel;
    if (cfg.export_options.engine != docfill::EngineChoice::LibreOffice) {
      channel = docfill::createAutomationChannel();
    }
    docfill::RenderContext ctx(std::make_unique<docfill::LibreOfficeEngine>(cfg.soffice_bin), std::move(channel));

    docfill::Table table = docfill::readTable(cfg.data, cfg.sheet);
    table = docfill::sliceRows(table, opts.from, opts.to);

    docfill::Renderer renderer(cfg, ctx);
    renderer.runBatch(table);
    return 0;
  } catch (const docfill::Error& e) {
    spdlog::error("docfill error: {}", e.what());
  } catch (const std::exception& e) {
    spdlog::error("docfill unexpected error: {}", e.what());
  }
  return 2;
}
