#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "docfill/conversion.hpp"
#include "docfill/document.hpp"
#include "docfill/scratch.hpp"

namespace docfill {

// Canonical kind a template extension is edited as: .docx/.doc/.odt/.rtf and
// .pptx/.ppt/.odp. Case-insensitive; std::nullopt for anything else.
std::optional<DocumentKind> editableKindForExtension(const std::string& ext);

// Converts legacy templates to DOCX/PPTX once per source path. Converted
// files live in scratch directories owned by the normalizer.
class FormatNormalizer {
public:
  explicit FormatNormalizer(ConversionEngine& engine);

  FormatNormalizer(const FormatNormalizer&) = delete;
  FormatNormalizer& operator=(const FormatNormalizer&) = delete;

  // Canonical paths come back unchanged. Throws UnsupportedFormatError for
  // unknown extensions without touching the engine, and the engine's errors
  // for failed conversions (which are not cached).
  std::string normalize(const std::string& source);

  size_t cachedEntries() const;

private:
  ConversionEngine& engine_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_future<std::string>> cache_;
  std::vector<std::unique_ptr<ScratchDir>> scratch_;
};

} // namespace docfill
