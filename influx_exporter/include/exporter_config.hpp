#pragma once

#include "connection_settings.hpp"
#include "pg_table_source.hpp"

#include <string>
#include <vector>

inline constexpr long long kMinPort = 1;
inline constexpr long long kMaxPort = 65535;
inline constexpr long long kMaxReadTimeoutMs = 3600000; // час
inline constexpr long long kMaxIntervalSec = 86400;     // сутки

struct ExporterConfig {
  std::string name{"influx"};

  std::string host{"localhost"};
  int port{8086};
  std::string user;
  std::string password;
  std::string db{"solarreader"};
  bool ssl{false};
  long read_timeout_ms{5000};

  bool verbose{false};
  bool test_connection{false};

  std::string pg_conninfo;
  std::vector<SourceQuery> sources;
  std::string timestamp_column;
  int interval_sec{10};

  // Пустые user/password считаются незаданными.
  ConnectionSettings connection_settings() const;
};

// Строки KEY=VALUE; уже заданные переменные окружения не перезаписываются.
void load_env_from_file(const std::string &path);

// ENV_FILE, иначе .env в текущем каталоге и ../.env (для запуска из build/).
void load_env();

// INFLUX_*, PG_CONNINFO, EXPORT_* поверх значений по умолчанию.
ExporterConfig config_from_env();

// Флаги командной строки поверх cfg.
void apply_cli(ExporterConfig &cfg, int argc, char **argv);

ExporterConfig parse_cli(int argc, char **argv);
