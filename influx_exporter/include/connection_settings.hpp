#pragma once

#include <optional>
#include <string>
#include <string_view>

// Параметры подключения к InfluxDB.
// Всё, кроме version, задаётся один раз при создании. version заполняется
// после первого успешного запроса к серверу и живёт до пересоздания настроек.
class ConnectionSettings {
public:
  ConnectionSettings() = default;
  ConnectionSettings(std::string host, int port, std::string db_name,
                     bool ssl = false, long read_timeout_ms = 5000);

  static ConnectionSettings defaults();

  ConnectionSettings &with_credentials(std::optional<std::string> user,
                                       std::optional<std::string> password);

  const std::string &host() const { return host_; }
  int port() const { return port_; }
  const std::optional<std::string> &user() const { return user_; }
  const std::optional<std::string> &password() const { return password_; }
  const std::string &db_name() const { return db_name_; }
  bool ssl() const { return ssl_; }
  long read_timeout_ms() const { return read_timeout_ms_; }

  bool has_credentials() const { return user_ && password_; }

  // http(s)://host:port
  std::string base_url() const;
  // http(s)://host:port/
  std::string root_url() const;

  const std::optional<std::string> &version() const { return version_; }

  // Returns false if a version was already cached.
  bool set_version_if_absent(const std::string &version);
  void reset_version() { version_.reset(); }

  // Пусто, если версия ещё не определена.
  std::optional<int> major_version() const;

  // "1.8.3" -> 1, "v2.1" -> 2, всё нераспознанное -> 1.
  static int parse_major_version(std::string_view version);

private:
  std::string host_{"localhost"};
  int port_{8086};
  std::optional<std::string> user_;
  std::optional<std::string> password_;
  std::string db_name_{"solarreader"};
  bool ssl_{false};
  long read_timeout_ms_{5000};

  std::optional<std::string> version_;
};
