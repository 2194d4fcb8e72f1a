/// Word-processing adapter: paragraphs (w:p) of the body, tables and headers/footers.

#include <tinyxml2.h>

#include <cmath>
#include <cstdlib>
#include <set>
#include <string>

#include "docfill/error.hpp"
#include "docfill_internal.hpp"
#include "document_internal.hpp"

namespace docfill {

namespace {

static std::string docxRunText(const tinyxml2::XMLElement* r) {
  std::string out;
  for (auto* c = r->FirstChildElement(); c; c = c->NextSiblingElement()) {
    if (hasName(c, "w:t")) {
      const char* t = c->GetText();
      if (t) {
        out += t;
      }
    } else if (hasName(c, "w:tab")) {
      out += '\t';
    } else if (hasName(c, "w:br")) {
      std::string type = getAttr(c, "w:type");
      if (type.empty() || type == "textWrapping") {
        out += '\n';
      }
    } else if (hasName(c, "w:cr")) {
      out += '\n';
    } else if (hasName(c, "w:noBreakHyphen")) {
      out += '-';
    }
  }
  return out;
}

static RunStyle docxRunStyle(const tinyxml2::XMLElement* r) {
  RunStyle style;
  const auto* rpr = r->FirstChildElement("w:rPr");
  if (!rpr) {
    return style;
  }
  if (const auto* sz = rpr->FirstChildElement("w:sz")) {
    const char* v = sz->Attribute("w:val");
    if (v) {
      style.size_pt = std::atof(v) / 2.0;
    }
  }
  if (const auto* b = rpr->FirstChildElement("w:b")) {
    style.bold = parseOnOff(b, "w:val");
  }
  if (const auto* i = rpr->FirstChildElement("w:i")) {
    style.italic = parseOnOff(i, "w:val");
  }
  if (const auto* fonts = rpr->FirstChildElement("w:rFonts")) {
    std::string name = getAttr(fonts, "w:ascii");
    if (name.empty()) {
      name = getAttr(fonts, "w:hAnsi");
    }
    if (!name.empty()) {
      style.font_name = name;
    }
  }
  if (const auto* u = rpr->FirstChildElement("w:u")) {
    std::string val = getAttr(u, "w:val");
    style.underline = val.empty() ? std::string("single") : val;
  }
  if (const auto* color = rpr->FirstChildElement("w:color")) {
    std::string val = getAttr(color, "w:val");
    if (!val.empty()) {
      style.color = val;
    }
  }
  return style;
}

static tinyxml2::XMLElement* makeOnOff(tinyxml2::XMLDocument* doc, const char* name, bool on) {
  auto* el = doc->NewElement(name);
  if (!on) {
    el->SetAttribute("w:val", "0");
  }
  return el;
}

// w:rPr children in schema order: rFonts, b, i, color, sz, u.
static tinyxml2::XMLElement* makeDocxRunProperties(tinyxml2::XMLDocument* doc, const RunStyle& style) {
  auto* rpr = doc->NewElement("w:rPr");
  if (style.font_name) {
    auto* fonts = doc->NewElement("w:rFonts");
    fonts->SetAttribute("w:ascii", style.font_name->c_str());
    fonts->SetAttribute("w:hAnsi", style.font_name->c_str());
    rpr->InsertEndChild(fonts);
  }
  if (style.bold) {
    rpr->InsertEndChild(makeOnOff(doc, "w:b", *style.bold));
  }
  if (style.italic) {
    rpr->InsertEndChild(makeOnOff(doc, "w:i", *style.italic));
  }
  if (style.color) {
    auto* color = doc->NewElement("w:color");
    color->SetAttribute("w:val", style.color->c_str());
    rpr->InsertEndChild(color);
  }
  if (style.size_pt) {
    auto* sz = doc->NewElement("w:sz");
    sz->SetAttribute("w:val", static_cast<int>(std::lround(*style.size_pt * 2.0)));
    rpr->InsertEndChild(sz);
  }
  if (style.underline) {
    auto* u = doc->NewElement("w:u");
    u->SetAttribute("w:val", style.underline->c_str());
    rpr->InsertEndChild(u);
  }
  return rpr;
}

// Tabs and line breaks become w:tab / w:br siblings of the w:t pieces.
static void appendDocxText(tinyxml2::XMLDocument* doc, tinyxml2::XMLElement* r, const std::string& text) {
  std::string pending;
  auto flush = [&](bool force) {
    if (pending.empty() && !force) {
      return;
    }
    auto* t = doc->NewElement("w:t");
    t->SetAttribute("xml:space", "preserve");
    t->SetText(pending.c_str());
    r->InsertEndChild(t);
    pending.clear();
  };
  for (char c : text) {
    if (c == '\t') {
      flush(false);
      r->InsertEndChild(doc->NewElement("w:tab"));
    } else if (c == '\n') {
      flush(false);
      r->InsertEndChild(doc->NewElement("w:br"));
    } else {
      pending.push_back(c);
    }
  }
  flush(text.empty());
}

class DocxParagraph : public StructuralUnit {
public:
  explicit DocxParagraph(tinyxml2::XMLElement* p) : p_(p) {}

  std::vector<Run> runs() const override {
    std::vector<Run> out;
    for (auto* r = p_->FirstChildElement("w:r"); r; r = r->NextSiblingElement("w:r")) {
      out.push_back(Run{docxRunText(r), docxRunStyle(r)});
    }
    return out;
  }

  void replaceRuns(const std::string& text, const RunStyle& style) override {
    std::vector<tinyxml2::XMLElement*> old_runs = childElements(p_, "w:r");
    auto* doc = p_->GetDocument();
    auto* r = doc->NewElement("w:r");
    if (!style.empty()) {
      r->InsertEndChild(makeDocxRunProperties(doc, style));
    }
    appendDocxText(doc, r, text);
    insertBefore(p_, old_runs.empty() ? nullptr : old_runs.front(), r);
    for (auto* old : old_runs) {
      p_->DeleteChild(old);
    }
  }

private:
  tinyxml2::XMLElement* p_;
};

} // namespace

DocxDocument::DocxDocument(Package package) : Document(std::move(package)) {
  auto rels = package_.relationships("");
  const Relationship* office = package_.findRelationship(rels, "officeDocument");
  main_part_ = office ? office->target : std::string("word/document.xml");
  if (!package_.hasPart(main_part_)) {
    throw PackageError("Word-processing package has no main document part");
  }
}

std::vector<Region> DocxDocument::regions(const WalkOptions& opts) {
  std::vector<Region> out;
  out.push_back(Region{Region::Role::Body, main_part_});
  if (!opts.scan_headers_footers) {
    return out;
  }
  tinyxml2::XMLDocument* main = package_.xmlPart(main_part_);
  auto* body = main && main->RootElement() ? main->RootElement()->FirstChildElement("w:body") : nullptr;
  if (!body) {
    return out;
  }
  auto rels = package_.relationships(main_part_);
  auto partFor = [&](const std::string& id) -> std::string {
    for (const auto& rel : rels) {
      if (rel.id == id && !rel.external) {
        return rel.target;
      }
    }
    return std::string();
  };
  // Section properties live in paragraph properties and at the end of the body.
  std::vector<tinyxml2::XMLElement*> sections;
  std::vector<tinyxml2::XMLElement*> st{body};
  while (!st.empty()) {
    auto* cur = st.back();
    st.pop_back();
    if (hasName(cur, "w:sectPr")) {
      sections.push_back(cur);
      continue;
    }
    for (auto* c = cur->LastChildElement(); c; c = c->PreviousSiblingElement()) {
      st.push_back(c);
    }
  }
  std::set<std::string> seen;
  for (auto* sect : sections) {
    for (auto* ref = sect->FirstChildElement("w:headerReference"); ref; ref = ref->NextSiblingElement("w:headerReference")) {
      std::string part = partFor(getAttr(ref, "r:id"));
      if (!part.empty() && seen.insert(part).second) {
        out.push_back(Region{Region::Role::Header, part});
      }
    }
    for (auto* ref = sect->FirstChildElement("w:footerReference"); ref; ref = ref->NextSiblingElement("w:footerReference")) {
      std::string part = partFor(getAttr(ref, "r:id"));
      if (!part.empty() && seen.insert(part).second) {
        out.push_back(Region{Region::Role::Footer, part});
      }
    }
  }
  return out;
}

tinyxml2::XMLElement* DocxDocument::regionRoot(const Region& region) {
  tinyxml2::XMLDocument* xml = package_.xmlPart(region.part);
  if (!xml || !xml->RootElement()) {
    return nullptr;
  }
  if (region.role == Region::Role::Body) {
    return xml->RootElement()->FirstChildElement("w:body");
  }
  return xml->RootElement();
}

bool DocxDocument::isUnitElement(const tinyxml2::XMLElement* el) const {
  return hasName(el, "w:p");
}

std::unique_ptr<StructuralUnit> DocxDocument::makeUnit(tinyxml2::XMLElement* el) {
  return std::make_unique<DocxParagraph>(el);
}

} // namespace docfill
