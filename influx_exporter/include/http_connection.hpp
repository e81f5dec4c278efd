#pragma once

#include "connection_settings.hpp"

#include <map>
#include <memory>
#include <string>

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string url;
  HttpHeaders headers;
  std::string body;
};

struct HttpResponse {
  long status{0};
  HttpHeaders headers;
  std::string body;

  // Поиск заголовка без учёта регистра. Пустая строка, если его нет.
  std::string header(const std::string &name) const;
};

// HTTP-транспорт. Сборка запросов общая, отправка - в наследниках.
// Ошибки транспорта - InfluxIoError, некорректный URL - MalformedUrlError.
class HttpConnection {
public:
  virtual ~HttpConnection() = default;

  HttpRequest build_get_request(const std::string &url,
                                const HttpHeaders &headers) const;

  HttpRequest build_post_request(const std::string &url,
                                 const HttpHeaders &headers,
                                 const std::string &body) const;

  virtual HttpResponse send_request(const HttpRequest &request) = 0;

  virtual HttpResponse get(const std::string &url);

  // Throws MalformedUrlError if libcurl rejects the URL.
  static void validate_url(const std::string &url);
};

class HttpConnectionFactory {
public:
  virtual ~HttpConnectionFactory() = default;

  virtual std::unique_ptr<HttpConnection>
  create_connection(const ConnectionSettings &settings) = 0;
};
