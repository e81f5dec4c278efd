#include "line_protocol.hpp"

#include "text_utils.hpp"

#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace {

std::optional<std::string> build_field(const Table &table, std::size_t column,
                                       std::size_t row) {
  const TableCell *cell = table.cell(column, row);
  if (!cell || !cell->value) {
    return std::nullopt;
  }

  const TableColumn &col = table.columns()[column];
  const std::string &value = *cell->value;
  if (col.type == ColumnType::String) {
    return col.name + "=\"" + value + "\"";
  }
  if (trim(value).empty()) {
    return std::nullopt;
  }
  return col.name + "=" + value;
}

} // namespace

std::string encode_table(const Table &table, std::int64_t fallback_timestamp) {
  const auto data_columns = table.columns_without_timestamp();
  const auto ts_column = table.timestamp_column();

  std::ostringstream ss;
  for (std::size_t row = 0; row < table.row_count(); ++row) {
    std::vector<std::string> fields;
    for (std::size_t column : data_columns) {
      if (auto field = build_field(table, column, row)) {
        fields.push_back(std::move(*field));
      }
    }
    if (fields.empty()) {
      continue;
    }

    std::int64_t timestamp = fallback_timestamp;
    if (ts_column) {
      if (const TableCell *ts_cell = table.cell(*ts_column, row)) {
        timestamp = ts_cell->as_timestamp_seconds().value_or(fallback_timestamp);
      }
    }

    ss << table.name() << ' ';
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        ss << ',';
      }
      ss << fields[i];
    }
    ss << ' ' << timestamp << '\n';
  }
  return ss.str();
}

std::string encode_snapshot(const Snapshot &snapshot,
                            std::int64_t fallback_timestamp) {
  std::string body;
  for (const auto &table : snapshot.tables) {
    body += encode_table(table, fallback_timestamp);
  }
  return body;
}
