#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tinyxml2 { class XMLDocument; }

namespace docfill {

struct Relationship {
  std::string id;
  std::string type;
  std::string target; // resolved part name, or the raw target for external links
  bool external = false;
};

// OPC package (DOCX/PPTX/XLSX): every zip entry is kept in memory, XML parts
// are parsed on first access and written back from the DOM on save().
class Package {
public:
  Package();
  ~Package();
  Package(Package&&) noexcept;
  Package& operator=(Package&&) noexcept;

  // Throws PackageError when the file is missing or not a zip archive.
  static Package open(const std::string& path);

  bool hasPart(const std::string& name) const;
  std::vector<std::string> partNames() const { return order_; }
  // Raw bytes; throws PackageError for unknown parts. Parsed parts are serialized first.
  std::string partData(const std::string& name) const;
  // Adds or replaces a part and drops any parsed DOM for it.
  void setPartData(const std::string& name, std::string data);

  // Parsed XML part, nullptr when the part does not exist. Throws PackageError on malformed XML.
  tinyxml2::XMLDocument* xmlPart(const std::string& name);

  // Relationships of source_part ("" for the package root), in file order.
  std::vector<Relationship> relationships(const std::string& source_part);
  // First relationship whose type ends with "/<type_suffix>".
  const Relationship* findRelationship(const std::vector<Relationship>& rels, const std::string& type_suffix) const;

  void save(const std::string& path) const;

  // "word/document.xml" -> "word/_rels/document.xml.rels"
  static std::string relationshipsPartFor(const std::string& source_part);
  // Resolves a relationship target against the directory of source_part.
  static std::string resolvePartName(const std::string& source_part, const std::string& target);

private:
  std::vector<std::string> order_;
  std::map<std::string, std::string> data_;
  std::map<std::string, std::unique_ptr<tinyxml2::XMLDocument>> xml_;
};

} // namespace docfill
