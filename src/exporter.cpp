/// Fixed-layout export: primary automation channel, then the conversion engine with retries.

#include "docfill/exporter.hpp"

#include <exception>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "docfill/error.hpp"
#include "docfill/scratch.hpp"
#include "docfill_internal.hpp"

namespace fs = std::filesystem;

namespace docfill {

const char* toString(EngineChoice choice) {
  switch (choice) {
    case EngineChoice::Auto:
      return "auto";
    case EngineChoice::MsOffice:
      return "msoffice";
    case EngineChoice::LibreOffice:
      return "libreoffice";
  }
  return "auto";
}

std::optional<EngineChoice> parseEngineChoice(const std::string& text) {
  std::string lower = toLowerAscii(trimCopy(text));
  if (lower == "auto") {
    return EngineChoice::Auto;
  }
  if (lower == "msoffice") {
    return EngineChoice::MsOffice;
  }
  if (lower == "libreoffice") {
    return EngineChoice::LibreOffice;
  }
  return std::nullopt;
}

std::unique_ptr<AutomationChannel> createAutomationChannel() {
  // Office automation is Windows-only; nothing to drive here.
  return nullptr;
}

const char* toString(ExportState state) {
  switch (state) {
    case ExportState::TryPrimary:
      return "TryPrimary";
    case ExportState::TryConversionEngine:
      return "TryConversionEngine";
    case ExportState::Succeeded:
      return "Succeeded";
    case ExportState::Failed:
      return "Failed";
  }
  return "Failed";
}

ExportStateMachine::ExportStateMachine(EngineChoice choice, bool primary_available, int retries)
  : state_(ExportState::TryPrimary), max_attempts_(retries < 0 ? 1 : retries + 1) {
  if (choice == EngineChoice::LibreOffice || !primary_available) {
    enterConversion();
  }
}

void ExportStateMachine::enterConversion() {
  state_ = ExportState::TryConversionEngine;
  attempt_ = 1;
}

void ExportStateMachine::primaryFinished(bool ok) {
  if (state_ != ExportState::TryPrimary) {
    return;
  }
  if (ok) {
    state_ = ExportState::Succeeded;
  } else {
    enterConversion();
  }
}

void ExportStateMachine::conversionFinished(bool ok) {
  if (state_ != ExportState::TryConversionEngine) {
    return;
  }
  if (ok) {
    state_ = ExportState::Succeeded;
  } else if (attempt_ < max_attempts_) {
    ++attempt_;
  } else {
    state_ = ExportState::Failed;
  }
}

Exporter::Exporter(ConversionEngine& engine, AutomationChannel* channel, ExportOptions options)
  : engine_(engine), channel_(channel), options_(std::move(options)) {}

ExportReport Exporter::exportDocument(const std::string& edited, DocumentKind kind, const std::string& output) {
  ExportReport report;
  fs::path out_path(output);
  if (out_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
      throw Error("Cannot create output directory " + out_path.parent_path().string() + ": " + ec.message());
    }
  }
  const bool primary_available = channel_ != nullptr && channel_->isReady(kind);
  ExportStateMachine machine(options_.engine, primary_available, options_.retries);
  const std::string produced_ext = options_.filter.substr(0, options_.filter.find(':'));
  std::exception_ptr last_error;

  while (!machine.done()) {
    if (machine.state() == ExportState::TryPrimary) {
      report.used_primary = true;
      bool ok = false;
      try {
        ScratchDir scratch("docfill_export");
        fs::path target = fs::path(scratch.path()) / (stemOf(edited) + ".pdf");
        std::error_code ec;
        ok = channel_->exportFixedLayout(edited, target.string()) && fs::exists(target, ec);
        if (ok) {
          moveFile(target.string(), output);
        }
      } catch (const Error& e) {
        ok = false;
        report.warnings.push_back(e.what());
      }
      if (!ok) {
        std::string msg = std::string("Native ") + toString(kind) + " export failed for " + edited +
                          ", falling back to the conversion engine";
        spdlog::warn(msg);
        report.warnings.push_back(msg);
      }
      machine.primaryFinished(ok);
      continue;
    }

    const int attempt = machine.attempt();
    report.conversion_attempts = attempt;
    try {
      ScratchDir scratch("docfill_export");
      engine_.convert(edited, scratch.path(), options_.filter, options_.filter_options);
      fs::path expected = fs::path(scratch.path()) / (stemOf(edited) + "." + produced_ext);
      std::error_code ec;
      if (!fs::exists(expected, ec)) {
        throw MissingArtifactError("No " + produced_ext + " produced for " + edited);
      }
      moveFile(expected.string(), output);
      machine.conversionFinished(true);
    } catch (const Error& e) {
      last_error = std::current_exception();
      std::string msg = "Export attempt " + std::to_string(attempt) + "/" + std::to_string(machine.maxAttempts()) +
                        " failed: " + e.what();
      spdlog::warn(msg);
      report.warnings.push_back(msg);
      machine.conversionFinished(false);
    }
  }

  if (machine.state() == ExportState::Failed) {
    std::rethrow_exception(last_error);
  }
  return report;
}

} // namespace docfill
