#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docfill/conversion.hpp"
#include "docfill/document.hpp"

namespace docfill {

enum class EngineChoice { Auto, MsOffice, LibreOffice };

const char* toString(EngineChoice choice);
// "auto", "msoffice", "libreoffice" (case-insensitive).
std::optional<EngineChoice> parseEngineChoice(const std::string& text);

// Native office automation used as the primary exporter when present.
class AutomationChannel {
public:
  virtual ~AutomationChannel() = default;

  virtual bool isReady(DocumentKind kind) const = 0;
  // Writes a fixed-layout rendition of input to output. false on failure.
  virtual bool exportFixedLayout(const std::string& input, const std::string& output) = 0;
};

// Process-wide channel, nullptr where the platform offers none.
std::unique_ptr<AutomationChannel> createAutomationChannel();

struct ExportOptions {
  EngineChoice engine = EngineChoice::Auto;
  int retries = 2;
  std::string filter = "pdf";  // conversion target, "pdf" or "pdf:<filter name>"
  std::string filter_options;  // appended as ":<options>" when non-empty
};

enum class ExportState { TryPrimary, TryConversionEngine, Succeeded, Failed };

const char* toString(ExportState state);

// Strategy sequencing for one export: the primary channel at most once, then
// up to retries + 1 conversion-engine attempts.
class ExportStateMachine {
public:
  ExportStateMachine(EngineChoice choice, bool primary_available, int retries);

  ExportState state() const { return state_; }
  // 1-based conversion-engine attempt; 0 before the first one.
  int attempt() const { return attempt_; }
  int maxAttempts() const { return max_attempts_; }
  bool done() const { return state_ == ExportState::Succeeded || state_ == ExportState::Failed; }

  void primaryFinished(bool ok);
  void conversionFinished(bool ok);

private:
  void enterConversion();

  ExportState state_;
  int attempt_ = 0;
  int max_attempts_;
};

struct ExportReport {
  bool used_primary = false;
  int conversion_attempts = 0;
  std::vector<std::string> warnings;
};

class Exporter {
public:
  // channel may be nullptr.
  Exporter(ConversionEngine& engine, AutomationChannel* channel, ExportOptions options);

  // Exports edited to output through a scratch directory; output's parent is
  // created. Throws the last conversion error once every strategy failed.
  ExportReport exportDocument(const std::string& edited, DocumentKind kind, const std::string& output);

  const ExportOptions& options() const { return options_; }

private:
  ConversionEngine& engine_;
  AutomationChannel* channel_;
  ExportOptions options_;
};

} // namespace docfill
