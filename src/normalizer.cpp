/// Legacy-format normalization cache.

#include "docfill/normalizer.hpp"

#include <exception>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"

namespace fs = std::filesystem;

namespace docfill {

namespace {

struct LegacyFormat {
  const char* ext;
  DocumentKind kind;
};

static const LegacyFormat cLegacyFormats[] = {
  {".doc", DocumentKind::WordProcessing}, {".odt", DocumentKind::WordProcessing},
  {".rtf", DocumentKind::WordProcessing}, {".ppt", DocumentKind::SlideDeck},
  {".odp", DocumentKind::SlideDeck},
};

static std::string cacheKeyFor(const std::string& source) {
  std::error_code ec;
  fs::path p = fs::weakly_canonical(fs::absolute(source, ec), ec);
  if (ec) {
    return fs::absolute(source).lexically_normal().string();
  }
  return p.string();
}

} // namespace

std::optional<DocumentKind> editableKindForExtension(const std::string& ext) {
  std::string lower = toLowerAscii(ext);
  if (auto kind = canonicalKindForExtension(lower)) {
    return kind;
  }
  for (const auto& f : cLegacyFormats) {
    if (lower == f.ext) {
      return f.kind;
    }
  }
  return std::nullopt;
}

FormatNormalizer::FormatNormalizer(ConversionEngine& engine) : engine_(engine) {}

std::string FormatNormalizer::normalize(const std::string& source) {
  std::string ext = extensionOf(source);
  if (canonicalKindForExtension(ext)) {
    return source;
  }
  auto kind = editableKindForExtension(ext);
  if (!kind) {
    throw UnsupportedFormatError("Unsupported template extension '" + ext + "': " + source);
  }
  const std::string key = cacheKeyFor(source);

  std::promise<std::string> promise;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      std::shared_future<std::string> pending = it->second;
      lock.unlock();
      // Blocks while another requester converts the same source.
      return pending.get();
    }
    cache_.emplace(key, promise.get_future().share());
  }

  try {
    auto scratch = std::make_unique<ScratchDir>("docfill_norm");
    std::string target = canonicalExtension(*kind).substr(1);
    spdlog::info("Converting {} to {}", key, target);
    std::string produced = engine_.convert(key, scratch->path(), target, std::string());
    fs::path expected = fs::path(scratch->path()) / (stemOf(key) + "." + target);
    std::error_code ec;
    if (!fs::exists(expected, ec)) {
      throw MissingArtifactError("Conversion of " + key + " did not produce " + expected.string());
    }
    if (produced != expected.string()) {
      spdlog::debug("Engine reported {}, using {}", produced, expected.string());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      scratch_.push_back(std::move(scratch));
    }
    promise.set_value(expected.string());
    return expected.string();
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cache_.erase(key);
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

size_t FormatNormalizer::cachedEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

} // namespace docfill
