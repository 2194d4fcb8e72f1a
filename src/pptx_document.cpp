/// Slide-deck adapter: shape trees of masters, layouts, slides and the notes body.

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

static std::optional<bool> drawingBool(const tinyxml2::XMLElement* el, const char* name) {
  const char* v = el->Attribute(name);
  if (v == nullptr) {
    return std::nullopt;
  }
  std::string lower = toLowerAscii(v);
  return lower == "1" || lower == "true";
}

static RunStyle pptxRunStyle(const tinyxml2::XMLElement* r) {
  RunStyle style;
  const auto* rpr = r->FirstChildElement("a:rPr");
  if (!rpr) {
    return style;
  }
  if (const char* sz = rpr->Attribute("sz")) {
    style.size_pt = std::atof(sz) / 100.0;
  }
  style.bold = drawingBool(rpr, "b");
  style.italic = drawingBool(rpr, "i");
  if (const char* u = rpr->Attribute("u")) {
    style.underline = std::string(u);
  }
  if (const auto* fill = rpr->FirstChildElement("a:solidFill")) {
    if (const auto* rgb = fill->FirstChildElement("a:srgbClr")) {
      std::string val = getAttr(rgb, "val");
      if (!val.empty()) {
        style.color = val;
      }
    }
  }
  if (const auto* latin = rpr->FirstChildElement("a:latin")) {
    std::string face = getAttr(latin, "typeface");
    if (!face.empty()) {
      style.font_name = face;
    }
  }
  return style;
}

// a:rPr: sz/b/i/u attributes, then solidFill before latin as the schema requires.
static tinyxml2::XMLElement* makePptxRunProperties(tinyxml2::XMLDocument* doc, const RunStyle& style) {
  auto* rpr = doc->NewElement("a:rPr");
  if (style.size_pt) {
    rpr->SetAttribute("sz", static_cast<int>(std::lround(*style.size_pt * 100.0)));
  }
  if (style.bold) {
    rpr->SetAttribute("b", *style.bold ? "1" : "0");
  }
  if (style.italic) {
    rpr->SetAttribute("i", *style.italic ? "1" : "0");
  }
  if (style.underline) {
    rpr->SetAttribute("u", style.underline->c_str());
  }
  if (style.color) {
    auto* fill = doc->NewElement("a:solidFill");
    auto* rgb = doc->NewElement("a:srgbClr");
    rgb->SetAttribute("val", style.color->c_str());
    fill->InsertEndChild(rgb);
    rpr->InsertEndChild(fill);
  }
  if (style.font_name) {
    auto* latin = doc->NewElement("a:latin");
    latin->SetAttribute("typeface", style.font_name->c_str());
    rpr->InsertEndChild(latin);
  }
  return rpr;
}

class PptxParagraph : public StructuralUnit {
public:
  explicit PptxParagraph(tinyxml2::XMLElement* p) : p_(p) {}

  std::vector<Run> runs() const override {
    std::vector<Run> out;
    for (auto* r = p_->FirstChildElement("a:r"); r; r = r->NextSiblingElement("a:r")) {
      const auto* t = r->FirstChildElement("a:t");
      const char* text = t ? t->GetText() : nullptr;
      out.push_back(Run{text ? std::string(text) : std::string(), pptxRunStyle(r)});
    }
    return out;
  }

  void replaceRuns(const std::string& text, const RunStyle& style) override {
    std::vector<tinyxml2::XMLElement*> old_runs = childElements(p_, "a:r");
    auto* doc = p_->GetDocument();
    auto* r = doc->NewElement("a:r");
    if (!style.empty()) {
      r->InsertEndChild(makePptxRunProperties(doc, style));
    }
    auto* t = doc->NewElement("a:t");
    t->SetText(text.c_str());
    r->InsertEndChild(t);
    // Runs must precede a:endParaRPr.
    tinyxml2::XMLNode* anchor = old_runs.empty() ? p_->FirstChildElement("a:endParaRPr") : old_runs.front();
    insertBefore(p_, anchor, r);
    for (auto* old : old_runs) {
      p_->DeleteChild(old);
    }
  }

private:
  tinyxml2::XMLElement* p_;
};

static tinyxml2::XMLElement* shapeTree(tinyxml2::XMLDocument* xml) {
  if (!xml || !xml->RootElement()) {
    return nullptr;
  }
  auto* csld = xml->RootElement()->FirstChildElement("p:cSld");
  return csld ? csld->FirstChildElement("p:spTree") : nullptr;
}

} // namespace

PptxDocument::PptxDocument(Package package) : Document(std::move(package)) {
  auto rels = package_.relationships("");
  const Relationship* office = package_.findRelationship(rels, "officeDocument");
  main_part_ = office ? office->target : std::string("ppt/presentation.xml");
  if (!package_.hasPart(main_part_)) {
    throw PackageError("Slide-deck package has no presentation part");
  }
}

std::vector<std::string> PptxDocument::orderedTargets(const std::string& part, const char* list_name,
                                                      const char* item_name) {
  std::vector<std::string> out;
  tinyxml2::XMLDocument* xml = package_.xmlPart(part);
  if (!xml || !xml->RootElement()) {
    return out;
  }
  auto* list = xml->RootElement()->FirstChildElement(list_name);
  if (!list) {
    return out;
  }
  auto rels = package_.relationships(part);
  for (auto* item = list->FirstChildElement(item_name); item; item = item->NextSiblingElement(item_name)) {
    std::string id = getAttr(item, "r:id");
    for (const auto& rel : rels) {
      if (rel.id == id && !rel.external) {
        out.push_back(rel.target);
        break;
      }
    }
  }
  return out;
}

std::vector<Region> PptxDocument::regions(const WalkOptions& opts) {
  std::vector<Region> out;
  if (opts.scan_masters) {
    std::set<std::string> seen_layouts;
    for (const auto& master : orderedTargets(main_part_, "p:sldMasterIdLst", "p:sldMasterId")) {
      out.push_back(Region{Region::Role::Master, master});
      for (const auto& layout : orderedTargets(master, "p:sldLayoutIdLst", "p:sldLayoutId")) {
        if (seen_layouts.insert(layout).second) {
          out.push_back(Region{Region::Role::Layout, layout});
        }
      }
    }
  }
  for (const auto& slide : orderedTargets(main_part_, "p:sldIdLst", "p:sldId")) {
    out.push_back(Region{Region::Role::Slide, slide});
    auto rels = package_.relationships(slide);
    if (const Relationship* notes = package_.findRelationship(rels, "notesSlide")) {
      if (!notes->external) {
        out.push_back(Region{Region::Role::Notes, notes->target});
      }
    }
  }
  return out;
}

tinyxml2::XMLElement* PptxDocument::regionRoot(const Region& region) {
  auto* tree = shapeTree(package_.xmlPart(region.part));
  if (!tree || region.role != Region::Role::Notes) {
    return tree;
  }
  // Speaker notes: only the body placeholder's text frame.
  for (auto* sp = tree->FirstChildElement("p:sp"); sp; sp = sp->NextSiblingElement("p:sp")) {
    auto* nv = sp->FirstChildElement("p:nvSpPr");
    auto* nvpr = nv ? nv->FirstChildElement("p:nvPr") : nullptr;
    auto* ph = nvpr ? nvpr->FirstChildElement("p:ph") : nullptr;
    if (ph && getAttr(ph, "type") == "body") {
      return sp->FirstChildElement("p:txBody");
    }
  }
  return nullptr;
}

bool PptxDocument::isUnitElement(const tinyxml2::XMLElement* el) const {
  return hasName(el, "a:p");
}

std::unique_ptr<StructuralUnit> PptxDocument::makeUnit(tinyxml2::XMLElement* el) {
  return std::make_unique<PptxParagraph>(el);
}

} // namespace docfill
