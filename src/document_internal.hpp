#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docfill/document.hpp"

namespace tinyxml2 { class XMLElement; class XMLNode; }

namespace docfill {

bool hasName(const tinyxml2::XMLElement* el, const char* name);
std::string getAttr(const tinyxml2::XMLElement* el, const char* name);
// OOXML on/off values: absent val, "1", "true", "on" -> true.
bool parseOnOff(const tinyxml2::XMLElement* el, const char* val_attr);
void insertBefore(tinyxml2::XMLNode* parent, tinyxml2::XMLNode* ref, tinyxml2::XMLNode* child);
// Direct element children with the given name, in order. Taken before any mutation.
std::vector<tinyxml2::XMLElement*> childElements(tinyxml2::XMLElement* parent, const char* name);

class DocxDocument : public Document {
public:
  explicit DocxDocument(Package package);

  DocumentKind kind() const override { return DocumentKind::WordProcessing; }
  std::vector<Region> regions(const WalkOptions& opts) override;
  tinyxml2::XMLElement* regionRoot(const Region& region) override;
  bool isUnitElement(const tinyxml2::XMLElement* el) const override;
  std::unique_ptr<StructuralUnit> makeUnit(tinyxml2::XMLElement* el) override;

private:
  std::string main_part_;
};

class PptxDocument : public Document {
public:
  explicit PptxDocument(Package package);

  DocumentKind kind() const override { return DocumentKind::SlideDeck; }
  std::vector<Region> regions(const WalkOptions& opts) override;
  tinyxml2::XMLElement* regionRoot(const Region& region) override;
  bool isUnitElement(const tinyxml2::XMLElement* el) const override;
  std::unique_ptr<StructuralUnit> makeUnit(tinyxml2::XMLElement* el) override;

private:
  std::string main_part_;

  // Relationship ids listed under list_name/item_name of an XML part, resolved to part names.
  std::vector<std::string> orderedTargets(const std::string& part, const char* list_name, const char* item_name);
};

} // namespace docfill
