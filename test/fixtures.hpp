#pragma once

#include <string>
#include <vector>

#include "docfill/conversion.hpp"
#include "docfill/exporter.hpp"

namespace docfill_test {

// <w:p> with one run per text; the first run gets bold + 12pt when styled.
std::string docxParagraph(const std::vector<std::string>& runs, bool styled = false);
// <w:tbl> with one row per entry, one cell per inner entry; cell content is raw XML.
std::string docxTable(const std::vector<std::vector<std::string>>& cells);

// Minimal word-processing package. Header/footer parts are added when their content is non-empty.
void writeDocx(const std::string& path, const std::string& body, const std::string& header = std::string(),
               const std::string& footer = std::string());

// <a:p> with one run per text.
std::string pptxParagraph(const std::vector<std::string>& runs);
// <p:sp> holding the paragraphs; ph_type adds a placeholder of that type.
std::string pptxShape(const std::string& paragraphs, const std::string& ph_type = std::string());
// <p:grpSp> around shapes.
std::string pptxGroup(const std::string& shapes);
// <p:graphicFrame> with a one-row table.
std::string pptxTable(const std::vector<std::string>& cell_texts);

// One master, one layout and one slide. Notes are added when non-empty.
void writePptx(const std::string& path, const std::string& master_shapes, const std::string& layout_shapes,
               const std::string& slide_shapes, const std::string& notes_shapes = std::string());

// Workbook with sheets "Datos" (inline and shared strings) and "Otra".
void writeXlsx(const std::string& path);
// Workbook with one sheet "Hoja1" holding the given <sheetData> content.
void writeXlsxSheet(const std::string& path, const std::string& sheet_data);

void writeTextFile(const std::string& path, const std::string& content);
std::string readTextFile(const std::string& path);

// Every unit text of a canonical document, in walk order.
std::vector<std::string> unitTexts(const std::string& path);

// Conversion engine double: records calls, fails on demand and writes the
// expected artifact. Non-PDF targets copy canonical_source when set.
class FakeEngine : public docfill::ConversionEngine {
public:
  std::string convert(const std::string& input, const std::string& output_dir, const std::string& target_format,
                      const std::string& format_options) override;

  int calls = 0;
  int fail_first = 0;
  bool produce = true;
  bool record_texts = false;
  std::string canonical_source;
  std::vector<std::string> inputs;
  std::vector<std::string> formats;
  std::vector<std::vector<std::string>> input_texts; // unit texts of DOCX/PPTX inputs
};

class FakeChannel : public docfill::AutomationChannel {
public:
  bool isReady(docfill::DocumentKind) const override { return ready; }
  bool exportFixedLayout(const std::string& input, const std::string& output) override;

  bool ready = true;
  bool succeed = true;
  int calls = 0;
};

} // namespace docfill_test
