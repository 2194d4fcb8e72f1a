/// Document kinds, shared XML helpers and the format-agnostic walker.

#include "docfill/document.hpp"

#include <tinyxml2.h>

#include <cstring>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"
#include "document_internal.hpp"

namespace docfill {

const char* toString(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::WordProcessing:
      return "word-processing";
    case DocumentKind::SlideDeck:
      return "slide-deck";
  }
  return "unknown";
}

std::string canonicalExtension(DocumentKind kind) {
  return kind == DocumentKind::WordProcessing ? ".docx" : ".pptx";
}

std::optional<DocumentKind> canonicalKindForExtension(const std::string& ext) {
  std::string lower = toLowerAscii(ext);
  if (lower == ".docx") {
    return DocumentKind::WordProcessing;
  }
  if (lower == ".pptx") {
    return DocumentKind::SlideDeck;
  }
  return std::nullopt;
}

std::string StructuralUnit::text() const {
  std::string out;
  for (const auto& run : runs()) {
    out += run.text;
  }
  return out;
}

bool hasName(const tinyxml2::XMLElement* el, const char* name) {
  return el != nullptr && el->Name() != nullptr && std::strcmp(el->Name(), name) == 0;
}

std::string getAttr(const tinyxml2::XMLElement* el, const char* name) {
  const char* v = el ? el->Attribute(name) : nullptr;
  return v ? std::string(v) : std::string();
}

bool parseOnOff(const tinyxml2::XMLElement* el, const char* val_attr) {
  const char* v = el->Attribute(val_attr);
  if (v == nullptr) {
    return true;
  }
  std::string lower = toLowerAscii(v);
  return lower == "1" || lower == "true" || lower == "on";
}

void insertBefore(tinyxml2::XMLNode* parent, tinyxml2::XMLNode* ref, tinyxml2::XMLNode* child) {
  if (!parent || !child) {
    return;
  }
  if (!ref) {
    parent->InsertEndChild(child);
    return;
  }
  tinyxml2::XMLNode* prev = ref->PreviousSibling();
  if (prev) {
    parent->InsertAfterChild(prev, child);
  } else {
    parent->InsertFirstChild(child);
  }
}

std::vector<tinyxml2::XMLElement*> childElements(tinyxml2::XMLElement* parent, const char* name) {
  std::vector<tinyxml2::XMLElement*> out;
  if (!parent) {
    return out;
  }
  for (auto* c = parent->FirstChildElement(name); c; c = c->NextSiblingElement(name)) {
    out.push_back(c);
  }
  return out;
}

std::unique_ptr<Document> openDocument(const std::string& path) {
  auto kind = canonicalKindForExtension(extensionOf(path));
  if (!kind) {
    throw UnsupportedFormatError("Unsupported document extension: " + extensionOf(path));
  }
  Package pkg = Package::open(path);
  if (*kind == DocumentKind::WordProcessing) {
    return std::make_unique<DocxDocument>(std::move(pkg));
  }
  return std::make_unique<PptxDocument>(std::move(pkg));
}

DocumentWalker::DocumentWalker(Document& doc, const WalkOptions& opts) : doc_(doc), regions_(doc.regions(opts)) {}

std::unique_ptr<StructuralUnit> DocumentWalker::next() {
  while (true) {
    while (!stack_.empty()) {
      auto* cur = stack_.back();
      stack_.pop_back();
      if (doc_.isUnitElement(cur)) {
        // Units are leaves: runs and nested content belong to the unit.
        return doc_.makeUnit(cur);
      }
      for (auto* c = cur->LastChildElement(); c; c = c->PreviousSiblingElement()) {
        stack_.push_back(c);
      }
    }
    if (next_region_ >= regions_.size()) {
      return nullptr;
    }
    if (auto* root = doc_.regionRoot(regions_[next_region_++])) {
      stack_.push_back(root);
    }
  }
}

} // namespace docfill
