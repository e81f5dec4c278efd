#include "http_connection.hpp"

#include "influx_error.hpp"

#include <curl/curl.h>

#include <cctype>

namespace {

bool iequals(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string HttpResponse::header(const std::string &name) const {
  for (const auto &[key, value] : headers) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return {};
}

void HttpConnection::validate_url(const std::string &url) {
  CURLU *handle = curl_url();
  if (!handle) {
    throw InfluxIoError("Failed to init CURL url handle");
  }
  CURLUcode rc = curl_url_set(handle, CURLUPART_URL, url.c_str(), 0);
  curl_url_cleanup(handle);
  if (rc != CURLUE_OK) {
    throw MalformedUrlError(url);
  }
}

HttpRequest HttpConnection::build_get_request(const std::string &url,
                                              const HttpHeaders &headers) const {
  validate_url(url);
  return HttpRequest{"GET", url, headers, {}};
}

HttpRequest HttpConnection::build_post_request(const std::string &url,
                                               const HttpHeaders &headers,
                                               const std::string &body) const {
  validate_url(url);
  return HttpRequest{"POST", url, headers, body};
}

HttpResponse HttpConnection::get(const std::string &url) {
  return send_request(build_get_request(url, {}));
}
