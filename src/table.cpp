/// CSV and XLSX readers producing trimmed string rows.

#include "docfill/table.hpp"

#include <tinyxml2.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "docfill/error.hpp"
#include "docfill/package.hpp"
#include "docfill_internal.hpp"
#include "document_internal.hpp"

namespace docfill {

namespace {

using Record = std::vector<std::string>;

static bool isBlankRecord(const Record& rec) {
  return std::all_of(rec.begin(), rec.end(), [](const std::string& s) { return trimCopy(s).empty(); });
}

// Header names are trimmed; blanks become "Unnamed: N" and repeats get ".k" suffixes.
static std::vector<std::string> headerNames(const Record& header) {
  std::vector<std::string> names;
  std::unordered_map<std::string, int> seen;
  for (size_t i = 0; i < header.size(); ++i) {
    std::string name = trimCopy(header[i]);
    if (name.empty()) {
      name = "Unnamed: " + std::to_string(i);
    }
    int& count = seen[name];
    if (count > 0) {
      std::string base = name;
      do {
        name = base + "." + std::to_string(count++);
      } while (seen.count(name) != 0);
      seen[name] = 1;
    } else {
      count = 1;
    }
    names.push_back(name);
  }
  return names;
}

static Table tableFromRecords(const std::vector<Record>& records) {
  Table table;
  auto it = std::find_if(records.begin(), records.end(), [](const Record& r) { return !isBlankRecord(r); });
  if (it == records.end()) {
    return table;
  }
  table.columns = headerNames(*it);
  size_t position = 0;
  for (++it; it != records.end(); ++it) {
    if (isBlankRecord(*it)) {
      continue;
    }
    std::vector<Row::Cell> cells;
    cells.reserve(table.columns.size());
    for (size_t c = 0; c < table.columns.size(); ++c) {
      cells.emplace_back(table.columns[c], c < it->size() ? (*it)[c] : std::string());
    }
    table.rows.emplace_back(std::move(cells));
    table.indices.push_back(position++);
  }
  return table;
}

static std::string readTextFile(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw ConfigurationError("Cannot open data file: " + path);
  }
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Worksheets end at column XFD.
constexpr long cMaxColumns = 16384;

// "BC12" -> 54 (zero-based column), -1 when there are no letters. Throws
// ConfigurationError past the last worksheet column.
static long columnIndexFromRef(const std::string& ref) {
  long col = 0;
  size_t i = 0;
  for (; i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i])); ++i) {
    col = col * 26 + (std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    if (col > cMaxColumns) {
      throw ConfigurationError("Cell reference beyond column XFD: " + ref);
    }
  }
  return i == 0 ? -1 : col - 1;
}

// Concatenated <t> text of a rich or plain string item, phonetic runs excluded.
static std::string stringItemText(const tinyxml2::XMLElement* si) {
  std::string out;
  for (auto* c = si->FirstChildElement(); c; c = c->NextSiblingElement()) {
    if (hasName(c, "t")) {
      if (const char* t = c->GetText()) {
        out += t;
      }
    } else if (hasName(c, "r")) {
      if (auto* t = c->FirstChildElement("t")) {
        if (const char* txt = t->GetText()) {
          out += txt;
        }
      }
    }
  }
  return out;
}

static std::vector<std::string> readSharedStrings(Package& pkg, const std::string& workbook_part) {
  std::vector<std::string> out;
  auto rels = pkg.relationships(workbook_part);
  const Relationship* rel = pkg.findRelationship(rels, "sharedStrings");
  if (!rel) {
    return out;
  }
  tinyxml2::XMLDocument* xml = pkg.xmlPart(rel->target);
  if (!xml || !xml->RootElement()) {
    return out;
  }
  for (auto* si = xml->RootElement()->FirstChildElement("si"); si; si = si->NextSiblingElement("si")) {
    out.push_back(stringItemText(si));
  }
  return out;
}

static std::string cellText(const tinyxml2::XMLElement* c, const std::vector<std::string>& shared) {
  std::string type = getAttr(c, "t");
  if (type == "inlineStr") {
    const auto* is = c->FirstChildElement("is");
    return is ? stringItemText(is) : std::string();
  }
  const auto* v = c->FirstChildElement("v");
  const char* raw = v ? v->GetText() : nullptr;
  std::string value = raw ? raw : "";
  if (type == "s") {
    char* end = nullptr;
    long idx = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || idx < 0 || static_cast<size_t>(idx) >= shared.size()) {
      return std::string();
    }
    return shared[static_cast<size_t>(idx)];
  }
  if (type == "b") {
    return value == "1" ? "TRUE" : "FALSE";
  }
  return value;
}

} // namespace

bool Table::hasColumn(const std::string& name) const {
  return std::find(columns.begin(), columns.end(), name) != columns.end();
}

Table parseCsv(const std::string& text) {
  std::vector<Record> records;
  Record rec;
  std::string field;
  bool in_quotes = false;
  bool field_started = false;
  size_t i = 0;
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    i = 3;
  }
  auto endField = [&]() {
    rec.push_back(field);
    field.clear();
    field_started = false;
  };
  auto endRecord = [&]() {
    endField();
    records.push_back(std::move(rec));
    rec.clear();
  };
  for (; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    if (c == '"' && !field_started) {
      in_quotes = true;
      field_started = true;
    } else if (c == ',') {
      endField();
    } else if (c == '\r' || c == '\n') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      endRecord();
    } else {
      field.push_back(c);
      field_started = true;
    }
  }
  if (in_quotes) {
    throw ConfigurationError("Unterminated quoted field in CSV data");
  }
  if (!rec.empty() || !field.empty() || field_started) {
    endRecord();
  }
  return tableFromRecords(records);
}

Table readCsv(const std::string& path) {
  return parseCsv(readTextFile(path));
}

Table readXlsx(const std::string& path, const std::string& sheet) {
  Package pkg = Package::open(path);
  auto root_rels = pkg.relationships("");
  const Relationship* office = pkg.findRelationship(root_rels, "officeDocument");
  const std::string workbook_part = office ? office->target : std::string("xl/workbook.xml");
  tinyxml2::XMLDocument* workbook = pkg.xmlPart(workbook_part);
  auto* sheets = workbook && workbook->RootElement() ? workbook->RootElement()->FirstChildElement("sheets") : nullptr;
  if (!sheets) {
    throw ConfigurationError("Workbook has no sheets: " + path);
  }
  std::vector<std::pair<std::string, std::string>> sheet_ids; // name, r:id
  for (auto* s = sheets->FirstChildElement("sheet"); s; s = s->NextSiblingElement("sheet")) {
    sheet_ids.emplace_back(getAttr(s, "name"), getAttr(s, "r:id"));
  }
  std::string wanted = trimCopy(sheet);
  const std::pair<std::string, std::string>* chosen = nullptr;
  if (wanted.empty()) {
    chosen = sheet_ids.empty() ? nullptr : &sheet_ids.front();
  } else {
    for (const auto& entry : sheet_ids) {
      if (entry.first == wanted) {
        chosen = &entry;
        break;
      }
    }
    if (!chosen && wanted.size() < 10 && std::all_of(wanted.begin(), wanted.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
      size_t idx = std::stoul(wanted);
      if (idx < sheet_ids.size()) {
        chosen = &sheet_ids[idx];
      }
    }
  }
  if (!chosen) {
    throw ConfigurationError("Worksheet '" + wanted + "' not found in " + path);
  }
  std::string sheet_part;
  for (const auto& rel : pkg.relationships(workbook_part)) {
    if (rel.id == chosen->second) {
      sheet_part = rel.target;
      break;
    }
  }
  tinyxml2::XMLDocument* ws = sheet_part.empty() ? nullptr : pkg.xmlPart(sheet_part);
  if (!ws || !ws->RootElement()) {
    throw ConfigurationError("Worksheet '" + chosen->first + "' has no data part in " + path);
  }
  spdlog::debug("Reading worksheet '{}' ({})", chosen->first, sheet_part);
  const auto shared = readSharedStrings(pkg, workbook_part);

  std::map<long, Record> by_row;
  auto* data = ws->RootElement()->FirstChildElement("sheetData");
  long next_row = 1;
  for (auto* r = data ? data->FirstChildElement("row") : nullptr; r; r = r->NextSiblingElement("row")) {
    long row_no = r->IntAttribute("r", static_cast<int>(next_row));
    next_row = row_no + 1;
    Record& rec = by_row[row_no];
    long next_col = 0;
    for (auto* c = r->FirstChildElement("c"); c; c = c->NextSiblingElement("c")) {
      long col = columnIndexFromRef(getAttr(c, "r"));
      if (col < 0) {
        col = next_col;
      }
      if (col >= cMaxColumns) {
        throw ConfigurationError("Worksheet row " + std::to_string(row_no) + " has more than 16384 columns");
      }
      next_col = col + 1;
      if (rec.size() <= static_cast<size_t>(col)) {
        rec.resize(static_cast<size_t>(col) + 1);
      }
      rec[static_cast<size_t>(col)] = cellText(c, shared);
    }
  }
  std::vector<Record> records;
  records.reserve(by_row.size());
  for (auto& entry : by_row) {
    records.push_back(std::move(entry.second));
  }
  return tableFromRecords(records);
}

Table readTable(const std::string& path, const std::string& sheet) {
  if (extensionOf(path) == ".csv") {
    return readCsv(path);
  }
  return readXlsx(path, sheet);
}

Table sliceRows(const Table& table, std::optional<long> from, std::optional<long> to) {
  const long n = static_cast<long>(table.size());
  long start = from ? std::max(0L, *from) : 0L;
  long stop = to ? std::min(n, *to + 1) : n;
  Table out;
  out.columns = table.columns;
  for (long i = start; i < stop; ++i) {
    out.rows.push_back(table.rows[static_cast<size_t>(i)]);
    out.indices.push_back(table.indices[static_cast<size_t>(i)]);
  }
  return out;
}

} // namespace docfill
