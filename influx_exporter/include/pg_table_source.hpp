#pragma once

#include "snapshot.hpp"
#include "table.hpp"

#include <postgresql/libpq-fe.h>

#include <optional>
#include <string>
#include <vector>

struct SourceQuery {
  std::string table_name;
  std::string sql;
};

// Источник снимков из PostgreSQL: каждый запрос даёт одну таблицу,
// колонки и их типы берутся из результата.
class PgTableSource {
public:
  PgTableSource(std::string conninfo, std::vector<SourceQuery> queries,
                std::string timestamp_column);
  ~PgTableSource();

  PgTableSource(const PgTableSource &) = delete;
  PgTableSource &operator=(const PgTableSource &) = delete;

  bool is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
  }

  // Таблицы, запросы которых выполнились. Без соединения - пустой снимок.
  Snapshot load_snapshot(std::int64_t timestamp);

  static ColumnType column_type_from_oid(Oid oid);

  // NULL в результате -> ячейки нет.
  static Table table_from_result(const std::string &table_name,
                                 const PGresult *res,
                                 const std::string &timestamp_column);

private:
  bool ensure_connected();
  std::optional<Table> load_table(const SourceQuery &query);

  PGconn *conn_{nullptr};
  std::string conninfo_;
  std::vector<SourceQuery> queries_;
  std::string timestamp_column_;
};
