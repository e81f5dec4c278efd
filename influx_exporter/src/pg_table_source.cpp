#include "pg_table_source.hpp"

#include <iostream>
#include <utility>

namespace {

// pg_type.oid
constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kOidOid = 26;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;
constexpr Oid kNumericOid = 1700;

} // namespace

PgTableSource::PgTableSource(std::string conninfo,
                             std::vector<SourceQuery> queries,
                             std::string timestamp_column)
    : conninfo_(std::move(conninfo)), queries_(std::move(queries)),
      timestamp_column_(std::move(timestamp_column)) {}

PgTableSource::~PgTableSource() {
  if (conn_) {
    PQfinish(conn_);
    conn_ = nullptr;
  }
}

bool PgTableSource::ensure_connected() {
  if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
    return true;
  }

  if (conn_) {
    PQfinish(conn_);
    conn_ = nullptr;
  }

  if (conninfo_.empty()) {
    std::cerr << "PgTableSource: empty conninfo, cannot connect\n";
    return false;
  }

  conn_ = PQconnectdb(conninfo_.c_str());
  if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
    std::cerr << "PgTableSource: connection failed: "
              << (conn_ ? PQerrorMessage(conn_) : "PQconnectdb returned null")
              << "\n";
    if (conn_) {
      PQfinish(conn_);
      conn_ = nullptr;
    }
    return false;
  }

  return true;
}

Snapshot PgTableSource::load_snapshot(std::int64_t timestamp) {
  Snapshot snapshot;
  snapshot.timestamp = timestamp;
  if (!ensure_connected()) {
    return snapshot;
  }

  for (const auto &query : queries_) {
    if (auto table = load_table(query)) {
      snapshot.tables.push_back(std::move(*table));
    }
  }
  return snapshot;
}

std::optional<Table> PgTableSource::load_table(const SourceQuery &query) {
  PGresult *res = PQexec(conn_, query.sql.c_str());
  if (PQresultStatus(res) != PGRES_TUPLES_OK) {
    std::cerr << "PgTableSource: query for '" << query.table_name
              << "' failed: " << PQerrorMessage(conn_);
    PQclear(res);
    // при обрыве соединения переподключимся на следующем опросе
    if (PQstatus(conn_) != CONNECTION_OK) {
      PQfinish(conn_);
      conn_ = nullptr;
    }
    return std::nullopt;
  }

  Table table = table_from_result(query.table_name, res, timestamp_column_);
  PQclear(res);
  return table;
}

ColumnType PgTableSource::column_type_from_oid(Oid oid) {
  switch (oid) {
  case kBoolOid:
    return ColumnType::Boolean;
  case kInt8Oid:
  case kInt2Oid:
  case kInt4Oid:
  case kOidOid:
  case kFloat4Oid:
  case kFloat8Oid:
  case kNumericOid:
    return ColumnType::Number;
  default:
    return ColumnType::String;
  }
}

Table PgTableSource::table_from_result(const std::string &table_name,
                                       const PGresult *res,
                                       const std::string &timestamp_column) {
  Table table(table_name);

  const int fields = PQnfields(res);
  for (int f = 0; f < fields; ++f) {
    const std::string name = PQfname(res, f);
    if (!timestamp_column.empty() && name == timestamp_column &&
        !table.timestamp_column()) {
      table.add_timestamp_column(name);
    } else {
      table.add_column(name, column_type_from_oid(PQftype(res, f)));
    }
  }

  const int rows = PQntuples(res);
  for (int r = 0; r < rows; ++r) {
    const std::size_t row = table.add_row();
    for (int f = 0; f < fields; ++f) {
      if (PQgetisnull(res, r, f)) {
        continue;
      }
      std::string value = PQgetvalue(res, r, f);
      // PostgreSQL отдаёт bool как t/f
      if (table.columns()[static_cast<std::size_t>(f)].type ==
          ColumnType::Boolean) {
        value = (value == "t") ? "true" : "false";
      }
      table.set_cell(row, static_cast<std::size_t>(f), std::move(value));
    }
  }
  return table;
}
