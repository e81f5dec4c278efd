#pragma once

#include "http_connection.hpp"

#include <memory>

// Транспорт на libcurl: по одному easy-handle на запрос.
class CurlHttpConnection : public HttpConnection {
public:
  explicit CurlHttpConnection(long read_timeout_ms);

  HttpResponse send_request(const HttpRequest &request) override;

private:
  long read_timeout_ms_;
};

// Владеет глобальной инициализацией libcurl.
class CurlHttpConnectionFactory : public HttpConnectionFactory {
public:
  CurlHttpConnectionFactory();
  ~CurlHttpConnectionFactory() override;

  CurlHttpConnectionFactory(const CurlHttpConnectionFactory &) = delete;
  CurlHttpConnectionFactory &
  operator=(const CurlHttpConnectionFactory &) = delete;

  std::unique_ptr<HttpConnection>
  create_connection(const ConnectionSettings &settings) override;
};
