#pragma once

#include <stdexcept>
#include <string>

// Ошибка ввода-вывода при работе с InfluxDB: сбой транспорта, таймаут,
// отказ сервера при проверке соединения.
class InfluxIoError : public std::runtime_error {
public:
  explicit InfluxIoError(const std::string &what) : std::runtime_error(what) {}
};

class MalformedUrlError : public InfluxIoError {
public:
  explicit MalformedUrlError(const std::string &url)
      : InfluxIoError("malformed url: " + url) {}
};
