#include "fixtures.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include "docfill/document.hpp"
#include "docfill/error.hpp"
#include "docfill/package.hpp"

namespace fs = std::filesystem;

namespace docfill_test {

namespace {

const char* const cRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";
const char* const cRelType = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";
const char* const cWordNs =
  "xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
  "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"";
const char* const cDrawingNs =
  "xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\" "
  "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\" "
  "xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"";

struct Rel {
  std::string id;
  std::string type;
  std::string target;
};

std::string relsXml(const std::vector<Rel>& rels) {
  std::string out = std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<Relationships xmlns=\"") +
                    cRelNs + "\">";
  for (const auto& r : rels) {
    out += "<Relationship Id=\"" + r.id + "\" Type=\"" + cRelType + r.type + "\" Target=\"" + r.target + "\"/>";
  }
  return out + "</Relationships>";
}

std::string contentTypes(const std::string& overrides) {
  return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
         "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
         "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
         "<Default Extension=\"xml\" ContentType=\"application/xml\"/>" +
         overrides + "</Types>";
}

std::string slidePart(const char* root, const std::string& shapes) {
  return std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<p:") + root + " " + cDrawingNs +
         "><p:cSld><p:spTree><p:nvGrpSpPr><p:cNvPr id=\"1\" name=\"\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
         "<p:grpSpPr/>" +
         shapes + "</p:spTree></p:cSld></p:" + root + ">";
}

std::string escapeXml(const std::string& s) {
  std::string out;
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      default: out.push_back(c);
    }
  }
  return out;
}

} // namespace

std::string docxParagraph(const std::vector<std::string>& runs, bool styled) {
  std::string out = "<w:p><w:pPr><w:jc w:val=\"left\"/></w:pPr>";
  for (size_t i = 0; i < runs.size(); ++i) {
    out += "<w:r>";
    if (styled && i == 0) {
      out += "<w:rPr><w:b/><w:color w:val=\"FF0000\"/><w:sz w:val=\"24\"/></w:rPr>";
    }
    out += "<w:t xml:space=\"preserve\">" + escapeXml(runs[i]) + "</w:t></w:r>";
  }
  return out + "</w:p>";
}

std::string docxTable(const std::vector<std::vector<std::string>>& cells) {
  std::string out = "<w:tbl><w:tblPr/>";
  for (const auto& row : cells) {
    out += "<w:tr>";
    for (const auto& cell : row) {
      out += "<w:tc><w:tcPr/>" + cell + "</w:tc>";
    }
    out += "</w:tr>";
  }
  return out + "</w:tbl>";
}

void writeDocx(const std::string& path, const std::string& body, const std::string& header, const std::string& footer) {
  docfill::Package pkg;
  pkg.setPartData("[Content_Types].xml",
                  contentTypes("<Override PartName=\"/word/document.xml\" "
                               "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml."
                               "document.main+xml\"/>"));
  pkg.setPartData("_rels/.rels", relsXml({{"rId1", "officeDocument", "word/document.xml"}}));
  std::vector<Rel> doc_rels;
  std::string sect = "<w:sectPr>";
  if (!header.empty()) {
    doc_rels.push_back({"rId1", "header", "header1.xml"});
    sect += "<w:headerReference w:type=\"default\" r:id=\"rId1\"/>";
    pkg.setPartData("word/header1.xml", std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<w:hdr ") + cWordNs +
                                          ">" + header + "</w:hdr>");
  }
  if (!footer.empty()) {
    doc_rels.push_back({"rId2", "footer", "footer1.xml"});
    sect += "<w:footerReference w:type=\"default\" r:id=\"rId2\"/>";
    pkg.setPartData("word/footer1.xml", std::string("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<w:ftr ") + cWordNs +
                                          ">" + footer + "</w:ftr>");
  }
  sect += "<w:pgSz w:w=\"11906\" w:h=\"16838\"/></w:sectPr>";
  pkg.setPartData("word/_rels/document.xml.rels", relsXml(doc_rels));
  pkg.setPartData("word/document.xml", std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
                                                   "<w:document ") +
                                         cWordNs + "><w:body>" + body + sect + "</w:body></w:document>");
  pkg.save(path);
}

std::string pptxParagraph(const std::vector<std::string>& runs) {
  std::string out = "<a:p>";
  for (const auto& text : runs) {
    out += "<a:r><a:rPr lang=\"es-ES\" sz=\"1800\"/><a:t>" + escapeXml(text) + "</a:t></a:r>";
  }
  return out + "<a:endParaRPr lang=\"es-ES\"/></a:p>";
}

std::string pptxShape(const std::string& paragraphs, const std::string& ph_type) {
  std::string ph = ph_type.empty() ? std::string() : "<p:ph type=\"" + ph_type + "\"/>";
  return "<p:sp><p:nvSpPr><p:cNvPr id=\"2\" name=\"Shape\"/><p:cNvSpPr/><p:nvPr>" + ph +
         "</p:nvPr></p:nvSpPr><p:spPr/><p:txBody><a:bodyPr/><a:lstStyle/>" + paragraphs + "</p:txBody></p:sp>";
}

std::string pptxGroup(const std::string& shapes) {
  return "<p:grpSp><p:nvGrpSpPr><p:cNvPr id=\"10\" name=\"Group\"/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>"
         "<p:grpSpPr/>" +
         shapes + "</p:grpSp>";
}

std::string pptxTable(const std::vector<std::string>& cell_texts) {
  std::string out = "<p:graphicFrame><p:nvGraphicFramePr><p:cNvPr id=\"20\" name=\"Table\"/><p:cNvGraphicFramePr/>"
                    "<p:nvPr/></p:nvGraphicFramePr><p:xfrm/><a:graphic>"
                    "<a:graphicData uri=\"http://schemas.openxmlformats.org/drawingml/2006/table\"><a:tbl><a:tr h=\"0\">";
  for (const auto& text : cell_texts) {
    out += "<a:tc><a:txBody><a:bodyPr/>" + pptxParagraph({text}) + "</a:txBody></a:tc>";
  }
  return out + "</a:tr></a:tbl></a:graphicData></a:graphic></p:graphicFrame>";
}

void writePptx(const std::string& path, const std::string& master_shapes, const std::string& layout_shapes,
               const std::string& slide_shapes, const std::string& notes_shapes) {
  docfill::Package pkg;
  pkg.setPartData("[Content_Types].xml",
                  contentTypes("<Override PartName=\"/ppt/presentation.xml\" "
                               "ContentType=\"application/vnd.openxmlformats-officedocument.presentationml."
                               "presentation.main+xml\"/>"));
  pkg.setPartData("_rels/.rels", relsXml({{"rId1", "officeDocument", "ppt/presentation.xml"}}));
  pkg.setPartData("ppt/presentation.xml",
                  std::string("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n<p:presentation ") +
                    cDrawingNs +
                    "><p:sldMasterIdLst><p:sldMasterId id=\"2147483648\" r:id=\"rId1\"/></p:sldMasterIdLst>"
                    "<p:sldIdLst><p:sldId id=\"256\" r:id=\"rId2\"/></p:sldIdLst>"
                    "<p:sldSz cx=\"9144000\" cy=\"6858000\"/></p:presentation>");
  pkg.setPartData("ppt/_rels/presentation.xml.rels",
                  relsXml({{"rId1", "slideMaster", "slideMasters/slideMaster1.xml"}, {"rId2", "slide", "slides/slide1.xml"}}));

  std::string master = slidePart("sldMaster", master_shapes);
  master.insert(master.rfind("</p:sldMaster>"),
                "<p:sldLayoutIdLst><p:sldLayoutId id=\"2147483649\" r:id=\"rId1\"/></p:sldLayoutIdLst>");
  pkg.setPartData("ppt/slideMasters/slideMaster1.xml", master);
  pkg.setPartData("ppt/slideMasters/_rels/slideMaster1.xml.rels",
                  relsXml({{"rId1", "slideLayout", "../slideLayouts/slideLayout1.xml"}}));
  pkg.setPartData("ppt/slideLayouts/slideLayout1.xml", slidePart("sldLayout", layout_shapes));
  pkg.setPartData("ppt/slideLayouts/_rels/slideLayout1.xml.rels",
                  relsXml({{"rId1", "slideMaster", "../slideMasters/slideMaster1.xml"}}));

  pkg.setPartData("ppt/slides/slide1.xml", slidePart("sld", slide_shapes));
  std::vector<Rel> slide_rels{{"rId1", "slideLayout", "../slideLayouts/slideLayout1.xml"}};
  if (!notes_shapes.empty()) {
    slide_rels.push_back({"rId2", "notesSlide", "../notesSlides/notesSlide1.xml"});
    pkg.setPartData("ppt/notesSlides/notesSlide1.xml", slidePart("notes", notes_shapes));
  }
  pkg.setPartData("ppt/slides/_rels/slide1.xml.rels", relsXml(slide_rels));
  pkg.save(path);
}

void writeXlsx(const std::string& path) {
  const std::string ns = "xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
                         "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"";
  docfill::Package pkg;
  pkg.setPartData("[Content_Types].xml", contentTypes(""));
  pkg.setPartData("_rels/.rels", relsXml({{"rId1", "officeDocument", "xl/workbook.xml"}}));
  pkg.setPartData("xl/workbook.xml", "<workbook " + ns +
                                       "><sheets><sheet name=\"Datos\" sheetId=\"1\" r:id=\"rId1\"/>"
                                       "<sheet name=\"Otra\" sheetId=\"2\" r:id=\"rId2\"/></sheets></workbook>");
  pkg.setPartData("xl/_rels/workbook.xml.rels", relsXml({{"rId1", "worksheet", "worksheets/sheet1.xml"},
                                                         {"rId2", "worksheet", "worksheets/sheet2.xml"},
                                                         {"rId3", "sharedStrings", "sharedStrings.xml"}}));
  pkg.setPartData("xl/sharedStrings.xml", "<sst " + ns +
                                            " count=\"3\" uniqueCount=\"3\"><si><t>TEMPLATE</t></si>"
                                            "<si><r><t>NOM</t></r><r><t>BRE</t></r></si>"
                                            "<si><t>carta.docx</t></si></sst>");
  pkg.setPartData("xl/worksheets/sheet1.xml",
                  "<worksheet " + ns +
                    "><sheetData>"
                    "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c>"
                    "<c r=\"C1\" t=\"inlineStr\"><is><t>IMPORTE</t></is></c></row>"
                    "<row r=\"2\"><c r=\"A2\" t=\"s\"><v>2</v></c><c r=\"B2\" t=\"inlineStr\"><is><t> Ana </t></is></c>"
                    "<c r=\"C2\"><v>1234.5</v></c></row>"
                    "<row r=\"4\"><c r=\"A4\" t=\"s\"><v>2</v></c><c r=\"C4\"><v>7</v></c></row>"
                    "</sheetData></worksheet>");
  pkg.setPartData("xl/worksheets/sheet2.xml",
                  "<worksheet " + ns +
                    "><sheetData><row r=\"1\"><c r=\"A1\" t=\"inlineStr\"><is><t>X</t></is></c></row>"
                    "<row r=\"2\"><c r=\"A2\" t=\"inlineStr\"><is><t>y</t></is></c></row></sheetData></worksheet>");
  pkg.save(path);
}

void writeXlsxSheet(const std::string& path, const std::string& sheet_data) {
  const std::string ns = "xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
                         "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"";
  docfill::Package pkg;
  pkg.setPartData("[Content_Types].xml", contentTypes(""));
  pkg.setPartData("_rels/.rels", relsXml({{"rId1", "officeDocument", "xl/workbook.xml"}}));
  pkg.setPartData("xl/workbook.xml", "<workbook " + ns + "><sheets><sheet name=\"Hoja1\" sheetId=\"1\" r:id=\"rId1\"/></sheets></workbook>");
  pkg.setPartData("xl/_rels/workbook.xml.rels", relsXml({{"rId1", "worksheet", "worksheets/sheet1.xml"}}));
  pkg.setPartData("xl/worksheets/sheet1.xml", "<worksheet " + ns + "><sheetData>" + sheet_data + "</sheetData></worksheet>");
  pkg.save(path);
}

void writeTextFile(const std::string& path, const std::string& content) {
  std::ofstream ofs(path, std::ios::binary);
  ofs << content;
}

std::string readTextFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

std::vector<std::string> unitTexts(const std::string& path) {
  std::vector<std::string> out;
  auto doc = docfill::openDocument(path);
  docfill::DocumentWalker walker(*doc, docfill::WalkOptions());
  while (auto unit = walker.next()) {
    out.push_back(unit->text());
  }
  return out;
}

std::string FakeEngine::convert(const std::string& input, const std::string& output_dir,
                                const std::string& target_format, const std::string& format_options) {
  ++calls;
  inputs.push_back(input);
  formats.push_back(format_options.empty() ? target_format : target_format + ":" + format_options);
  std::string in_ext = fs::path(input).extension().string();
  if (record_texts && (in_ext == ".docx" || in_ext == ".pptx")) {
    input_texts.push_back(unitTexts(input));
  }
  if (calls <= fail_first) {
    throw docfill::ConversionError("fake engine failure", 1, "simulated crash");
  }
  std::string ext = target_format.substr(0, target_format.find(':'));
  fs::path out = fs::path(output_dir) / (fs::path(input).stem().string() + "." + ext);
  if (!produce) {
    return out.string();
  }
  if (ext != "pdf" && !canonical_source.empty()) {
    fs::copy_file(canonical_source, out, fs::copy_options::overwrite_existing);
  } else {
    writeTextFile(out.string(), "%PDF-1.4\n% fake rendition\n");
  }
  return out.string();
}

bool FakeChannel::exportFixedLayout(const std::string&, const std::string& output) {
  ++calls;
  if (!succeed) {
    return false;
  }
  writeTextFile(output, "%PDF-1.4\n% native rendition\n");
  return true;
}

} // namespace docfill_test
