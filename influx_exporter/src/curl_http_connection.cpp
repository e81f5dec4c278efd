#include "curl_http_connection.hpp"

#include "influx_error.hpp"
#include "text_utils.hpp"

#include <curl/curl.h>

#include <string>

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *buffer = static_cast<std::string *>(userdata);
  buffer->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t header_callback(char *ptr, size_t size, size_t nitems,
                       void *userdata) {
  auto *headers = static_cast<HttpHeaders *>(userdata);
  const std::string line(ptr, size * nitems);
  auto colon = line.find(':');
  // статусная строка и пустая строка в конце заголовков
  if (colon != std::string::npos) {
    std::string name = trim(std::string_view(line).substr(0, colon));
    std::string value = trim(std::string_view(line).substr(colon + 1));
    (*headers)[name] = value;
  }
  return size * nitems;
}

} // namespace

CurlHttpConnection::CurlHttpConnection(long read_timeout_ms)
    : read_timeout_ms_(read_timeout_ms) {}

HttpResponse CurlHttpConnection::send_request(const HttpRequest &request) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw InfluxIoError("Failed to init CURL");
  }

  HttpResponse response;
  struct curl_slist *headers = nullptr;
  for (const auto &[name, value] : request.headers) {
    const std::string line = name + ": " + value;
    headers = curl_slist_append(headers, line.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, read_timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  if (request.method == "POST") {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  CURLcode res = curl_easy_perform(curl);
  curl_slist_free_all(headers);

  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    if (res == CURLE_URL_MALFORMAT) {
      throw MalformedUrlError(request.url);
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
      throw InfluxIoError("connection timeout");
    }
    throw InfluxIoError("CURL request failed: " +
                        std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  curl_easy_cleanup(curl);
  return response;
}

CurlHttpConnectionFactory::CurlHttpConnectionFactory() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpConnectionFactory::~CurlHttpConnectionFactory() {
  curl_global_cleanup();
}

std::unique_ptr<HttpConnection>
CurlHttpConnectionFactory::create_connection(const ConnectionSettings &settings) {
  return std::make_unique<CurlHttpConnection>(settings.read_timeout_ms());
}
