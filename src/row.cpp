#include "docfill/row.hpp"

#include "docfill_internal.hpp"

namespace docfill {

Row::Row(std::vector<Cell> cells) : cells_(std::move(cells)) {
  for (size_t i = 0; i < cells_.size(); ++i) {
    cells_[i].first = trimCopy(cells_[i].first);
    cells_[i].second = trimCopy(cells_[i].second);
    // First occurrence wins for duplicated headers.
    index_.emplace(cells_[i].first, i);
  }
}

const std::string* Row::find(const std::string& column) const {
  auto it = index_.find(column);
  if (it == index_.end()) {
    return nullptr;
  }
  return &cells_[it->second].second;
}

std::string Row::value(const std::string& column) const {
  const std::string* v = find(column);
  return v ? *v : std::string();
}

std::vector<std::string> Row::columns() const {
  std::vector<std::string> out;
  out.reserve(cells_.size());
  for (const auto& cell : cells_) {
    out.push_back(cell.first);
  }
  return out;
}

Row Row::withValue(const std::string& column, const std::string& value) const {
  std::vector<Cell> cells = cells_;
  auto it = index_.find(trimCopy(column));
  if (it != index_.end()) {
    cells[it->second].second = value;
  } else {
    cells.emplace_back(column, value);
  }
  return Row(std::move(cells));
}

} // namespace docfill
