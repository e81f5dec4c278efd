#pragma once

#include "connection_settings.hpp"
#include "http_connection.hpp"

#include <memory>
#include <string>

// Диалект HTTP API InfluxDB: форма URL записи и схема авторизации.
class InfluxVersion {
public:
  virtual ~InfluxVersion() = default;

  virtual std::string build_write_url(const ConnectionSettings &settings) const = 0;

  // Пустая карта, если user или password не заданы.
  virtual HttpHeaders
  authorization_headers(const ConnectionSettings &settings) const = 0;
};

// InfluxDB 1.x: /write?db=..., Basic-авторизация.
class InfluxVersionV1 : public InfluxVersion {
public:
  std::string build_write_url(const ConnectionSettings &settings) const override;
  HttpHeaders
  authorization_headers(const ConnectionSettings &settings) const override;
};

// InfluxDB 2.x: /api/v2/write?bucket=...&org=..., авторизация по токену.
// user используется как имя организации, password - как API-токен.
class InfluxVersionV2 : public InfluxVersion {
public:
  std::string build_write_url(const ConnectionSettings &settings) const override;
  HttpHeaders
  authorization_headers(const ConnectionSettings &settings) const override;
};

// nullptr для неподдерживаемых мажорных версий.
std::unique_ptr<InfluxVersion> make_influx_version(int major_version);
