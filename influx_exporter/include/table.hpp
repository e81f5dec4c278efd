#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class ColumnType { String, Number, Boolean, Timestamp };

struct TableColumn {
  std::string name;
  ColumnType type{ColumnType::Number};
};

// Уже вычисленное значение ячейки.
struct TableCell {
  std::optional<std::string> value;

  // Для колонки-метки времени: секунды с начала эпохи.
  std::optional<std::int64_t> as_timestamp_seconds() const;
};

struct TableRow {
  std::unordered_map<std::size_t, TableCell> cells;
};

// Таблица измерений: имя, упорядоченные колонки и строки.
// Одна из колонок может быть объявлена меткой времени.
class Table {
public:
  explicit Table(std::string name);

  const std::string &name() const { return name_; }

  std::size_t add_column(const std::string &name, ColumnType type);
  std::size_t add_timestamp_column(const std::string &name);

  std::size_t add_row();
  // std::nullopt: ячейка есть, но значение не вычислено.
  void set_cell(std::size_t row, std::size_t column,
                std::optional<std::string> value);

  const std::vector<TableColumn> &columns() const { return columns_; }
  std::size_t row_count() const { return rows_.size(); }

  std::optional<std::size_t> timestamp_column() const {
    return timestamp_column_;
  }

  // Индексы колонок без колонки-метки времени, в исходном порядке.
  std::vector<std::size_t> columns_without_timestamp() const;

  const TableCell *cell(std::size_t column, std::size_t row) const;

private:
  std::string name_;
  std::vector<TableColumn> columns_;
  std::vector<TableRow> rows_;
  std::optional<std::size_t> timestamp_column_;
};
