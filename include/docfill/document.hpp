#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docfill/package.hpp"

namespace tinyxml2 { class XMLElement; }

namespace docfill {

enum class DocumentKind { WordProcessing, SlideDeck };

const char* toString(DocumentKind kind);
// ".docx" / ".pptx"
std::string canonicalExtension(DocumentKind kind);
// Canonical formats only; std::nullopt for anything else.
std::optional<DocumentKind> canonicalKindForExtension(const std::string& ext);

// Explicitly set run attributes; unset members inherit the document defaults.
struct RunStyle {
  std::optional<double> size_pt;
  std::optional<bool> bold;
  std::optional<bool> italic;
  std::optional<std::string> font_name;
  std::optional<std::string> underline; // raw format token ("single", "sng", "none", ...)
  std::optional<std::string> color;     // RRGGBB

  bool empty() const {
    return !size_pt && !bold && !italic && !font_name && !underline && !color;
  }
};

struct Run {
  std::string text;
  RunStyle style;
};

// A paragraph-like node. Concatenating runs() texts yields text().
class StructuralUnit {
public:
  virtual ~StructuralUnit() = default;

  virtual std::vector<Run> runs() const = 0;
  std::string text() const;

  // Removes every run and inserts a single run holding text, styled with the
  // explicitly set attributes of style. The new run takes the first old run's place.
  virtual void replaceRuns(const std::string& text, const RunStyle& style) = 0;
};

struct WalkOptions {
  bool scan_masters = true;         // slide masters and layouts
  bool scan_headers_footers = true; // word-processing headers and footers
};

// A walkable subtree: one XML part plus the role it plays in the document.
struct Region {
  enum class Role { Master, Layout, Body, Header, Footer, Slide, Notes };
  Role role;
  std::string part;
};

// Canonical document opened from a DOCX or PPTX package.
class Document {
public:
  explicit Document(Package package) : package_(std::move(package)) {}
  virtual ~Document() = default;

  virtual DocumentKind kind() const = 0;

  // Regions in visiting order.
  virtual std::vector<Region> regions(const WalkOptions& opts) = 0;
  // Root element to traverse for a region, nullptr when the region is absent.
  virtual tinyxml2::XMLElement* regionRoot(const Region& region) = 0;
  virtual bool isUnitElement(const tinyxml2::XMLElement* el) const = 0;
  virtual std::unique_ptr<StructuralUnit> makeUnit(tinyxml2::XMLElement* el) = 0;

  void save(const std::string& path) const { package_.save(path); }
  Package& package() { return package_; }

protected:
  Package package_;
};

// Opens a .docx or .pptx file. Throws UnsupportedFormatError for other extensions
// and PackageError for unreadable packages.
std::unique_ptr<Document> openDocument(const std::string& path);

// Single pass over every structural unit of a document: masters/layouts, body,
// headers/footers, slides, notes. Regions are resolved only when reached and
// absent ones are skipped.
class DocumentWalker {
public:
  DocumentWalker(Document& doc, const WalkOptions& opts);

  // nullptr once the traversal is exhausted.
  std::unique_ptr<StructuralUnit> next();

private:
  Document& doc_;
  std::vector<Region> regions_;
  size_t next_region_ = 0;
  std::vector<tinyxml2::XMLElement*> stack_;
};

} // namespace docfill
