#include "table.hpp"

#include <stdexcept>
#include <utility>

std::optional<std::int64_t> TableCell::as_timestamp_seconds() const {
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t pos = 0;
    std::int64_t ts = std::stoll(*value, &pos);
    if (pos != value->size()) {
      return std::nullopt;
    }
    return ts;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

Table::Table(std::string name) : name_(std::move(name)) {}

std::size_t Table::add_column(const std::string &name, ColumnType type) {
  columns_.push_back(TableColumn{name, type});
  return columns_.size() - 1;
}

std::size_t Table::add_timestamp_column(const std::string &name) {
  timestamp_column_ = add_column(name, ColumnType::Timestamp);
  return *timestamp_column_;
}

std::size_t Table::add_row() {
  rows_.emplace_back();
  return rows_.size() - 1;
}

void Table::set_cell(std::size_t row, std::size_t column,
                     std::optional<std::string> value) {
  if (row >= rows_.size() || column >= columns_.size()) {
    throw std::out_of_range("Table::set_cell: index out of range");
  }
  rows_[row].cells[column] = TableCell{std::move(value)};
}

std::vector<std::size_t> Table::columns_without_timestamp() const {
  std::vector<std::size_t> result;
  result.reserve(columns_.size());
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (timestamp_column_ && *timestamp_column_ == i) {
      continue;
    }
    result.push_back(i);
  }
  return result;
}

const TableCell *Table::cell(std::size_t column, std::size_t row) const {
  if (row >= rows_.size()) {
    return nullptr;
  }
  const auto &cells = rows_[row].cells;
  auto it = cells.find(column);
  return it == cells.end() ? nullptr : &it->second;
}
