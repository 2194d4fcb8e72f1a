#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docfill {

// One data record: ordered column -> value mapping. Names and values are
// whitespace-trimmed on construction; missing cells are empty strings.
class Row {
public:
  using Cell = std::pair<std::string, std::string>;

  Row() = default;
  explicit Row(std::vector<Cell> cells);

  // nullptr when the column does not exist.
  const std::string* find(const std::string& column) const;
  // Empty string when the column does not exist.
  std::string value(const std::string& column) const;
  bool contains(const std::string& column) const { return find(column) != nullptr; }

  const std::vector<Cell>& cells() const { return cells_; }
  std::vector<std::string> columns() const;
  size_t size() const { return cells_.size(); }
  bool empty() const { return cells_.empty(); }

  // Copy of this row with one value replaced (or appended).
  Row withValue(const std::string& column, const std::string& value) const;

private:
  std::vector<Cell> cells_;
  std::unordered_map<std::string, size_t> index_;
};

} // namespace docfill
