#include "exporter_config.hpp"

#include "text_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

std::string get_env(const char *name) {
  const char *v = std::getenv(name);
  return (v && *v) ? std::string(v) : std::string{};
}

bool parse_bool(const std::string &value) {
  return value == "1" || value == "true" || value == "TRUE" ||
         value == "yes" || value == "on";
}

// Значение вне [min_value, max_value] отбрасывается, out не меняется.
template <typename Int>
void parse_number(const std::string &key, const std::string &value, Int &out,
                  long long min_value, long long max_value) {
  if (value.empty()) {
    return;
  }
  long long parsed = 0;
  try {
    std::size_t used = 0;
    parsed = std::stoll(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::exception &) {
    std::cerr << "ExporterConfig: invalid number for " << key << ": '"
              << value << "', keeping " << out << "\n";
    return;
  }
  if (parsed < min_value || parsed > max_value) {
    std::cerr << "ExporterConfig: " << key << " out of range [" << min_value
              << ", " << max_value << "]: " << parsed << ", keeping " << out
              << "\n";
    return;
  }
  out = static_cast<Int>(parsed);
}

bool parse_source(const std::string &text, SourceQuery &out) {
  auto pos = text.find('=');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= text.size()) {
    return false;
  }
  out.table_name = trim(std::string_view(text).substr(0, pos));
  out.sql = trim(std::string_view(text).substr(pos + 1));
  return !out.table_name.empty() && !out.sql.empty();
}

} // namespace

ConnectionSettings ExporterConfig::connection_settings() const {
  ConnectionSettings settings(host, port, db, ssl, read_timeout_ms);
  settings.with_credentials(
      user.empty() ? std::nullopt : std::optional<std::string>(user),
      password.empty() ? std::nullopt : std::optional<std::string>(password));
  return settings;
}

void load_env_from_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto pos = line.find('=');
    if (pos == std::string::npos) {
      continue;
    }
    std::string key = trim(std::string_view(line).substr(0, pos));
    std::string value = trim(std::string_view(line).substr(pos + 1));

    if (key.empty()) {
      continue;
    }

    if (std::getenv(key.c_str()) == nullptr) {
      setenv(key.c_str(), value.c_str(), 0);
    }
  }
}

void load_env() {
  if (const char *env_file = std::getenv("ENV_FILE")) {
    if (*env_file) {
      load_env_from_file(env_file);
    }
  } else {
    load_env_from_file(".env");
    load_env_from_file("../.env");
  }
}

ExporterConfig config_from_env() {
  ExporterConfig cfg;

  if (auto v = get_env("INFLUX_EXPORTER_NAME"); !v.empty())
    cfg.name = v;
  if (auto v = get_env("INFLUX_HOST"); !v.empty())
    cfg.host = v;
  parse_number("INFLUX_PORT", get_env("INFLUX_PORT"), cfg.port, kMinPort,
               kMaxPort);
  cfg.user = get_env("INFLUX_USER");
  cfg.password = get_env("INFLUX_PASSWORD");
  if (auto v = get_env("INFLUX_DB"); !v.empty())
    cfg.db = v;
  if (auto v = get_env("INFLUX_SSL"); !v.empty())
    cfg.ssl = parse_bool(v);
  parse_number("INFLUX_READ_TIMEOUT_MS", get_env("INFLUX_READ_TIMEOUT_MS"),
               cfg.read_timeout_ms, 1, kMaxReadTimeoutMs);
  if (auto v = get_env("INFLUX_VERBOSE"); !v.empty())
    cfg.verbose = parse_bool(v);

  cfg.pg_conninfo = get_env("PG_CONNINFO");
  cfg.timestamp_column = get_env("EXPORT_TIMESTAMP_COLUMN");
  parse_number("EXPORT_INTERVAL_SEC", get_env("EXPORT_INTERVAL_SEC"),
               cfg.interval_sec, 1, kMaxIntervalSec);
  return cfg;
}

void apply_cli(ExporterConfig &cfg, int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_string = [&](std::string &value) {
      if (i + 1 >= argc)
        return;
      value = argv[++i];
    };
    auto next_number = [&](auto &value, long long min_value,
                           long long max_value) {
      std::string raw;
      next_string(raw);
      parse_number(arg, raw, value, min_value, max_value);
    };

    if (arg == "--test-connection") {
      cfg.test_connection = true;
    } else if (arg == "--verbose") {
      cfg.verbose = true;
    } else if (arg == "--ssl") {
      cfg.ssl = true;
    } else if (arg == "--name") {
      next_string(cfg.name);
    } else if (arg == "--host") {
      next_string(cfg.host);
    } else if (arg == "--port") {
      next_number(cfg.port, kMinPort, kMaxPort);
    } else if (arg == "--user") {
      next_string(cfg.user);
    } else if (arg == "--password") {
      next_string(cfg.password);
    } else if (arg == "--db" || arg == "--bucket") {
      next_string(cfg.db);
    } else if (arg == "--read-timeout-ms") {
      next_number(cfg.read_timeout_ms, 1, kMaxReadTimeoutMs);
    } else if (arg == "--pg-conninfo") {
      next_string(cfg.pg_conninfo);
    } else if (arg == "--timestamp-column") {
      next_string(cfg.timestamp_column);
    } else if (arg == "--interval-sec") {
      next_number(cfg.interval_sec, 1, kMaxIntervalSec);
    } else if (arg == "--source") {
      std::string text;
      next_string(text);
      SourceQuery query;
      if (parse_source(text, query)) {
        cfg.sources.push_back(std::move(query));
      } else {
        std::cerr << "ExporterConfig: ignoring malformed --source '" << text
                  << "', expected NAME=SQL\n";
      }
    } else {
      std::cerr << "ExporterConfig: unknown argument '" << arg << "'\n";
    }
  }
}

ExporterConfig parse_cli(int argc, char **argv) {
  ExporterConfig cfg = config_from_env();
  apply_cli(cfg, argc, argv);
  return cfg;
}
