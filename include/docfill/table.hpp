#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docfill/row.hpp"

namespace docfill {

// Tabular input: header columns plus one Row per data record. indices holds
// each row's zero-based position in the source, kept across slicing.
struct Table {
  std::vector<std::string> columns;
  std::vector<Row> rows;
  std::vector<size_t> indices;

  size_t size() const { return rows.size(); }
  bool hasColumn(const std::string& name) const;
};

// First record is the header. Blank lines are skipped, a UTF-8 BOM is dropped.
Table parseCsv(const std::string& text);
Table readCsv(const std::string& path);

// sheet: name, or zero-based index written as digits; empty means the first sheet.
Table readXlsx(const std::string& path, const std::string& sheet);

// Dispatches on the extension: .csv, otherwise a workbook.
Table readTable(const std::string& path, const std::string& sheet);

// Rows at positions [from, to], both inclusive and optional.
Table sliceRows(const Table& table, std::optional<long> from, std::optional<long> to);

} // namespace docfill
