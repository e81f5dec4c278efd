#include "influx_request.hpp"

#include "influx_error.hpp"
#include "influx_version.hpp"

#include <iostream>

std::string fetch_influx_version(HttpConnection &connection,
                                 const ConnectionSettings &settings) {
  HttpResponse response = connection.get(settings.root_url());
  std::string version = response.header(kInfluxVersionHeader);
  return version.empty() ? std::string("unknown") : version;
}

std::optional<HttpRequest> build_influx_request(HttpConnection &connection,
                                                const ConnectionSettings &settings,
                                                const std::string &body) {
  const auto major = settings.major_version();
  if (!major) {
    std::cerr << "InfluxRequest: influx version of " << settings.root_url()
              << " is not resolved, request not built\n";
    return std::nullopt;
  }

  auto influx_version = make_influx_version(*major);
  if (!influx_version) {
    std::cerr << "InfluxRequest: unsupported or unknown influx DB version '"
              << settings.version().value_or("") << "'\n";
    return std::nullopt;
  }

  const std::string url = influx_version->build_write_url(settings);
  HttpHeaders headers = influx_version->authorization_headers(settings);
  headers["Content-Type"] = "text/plain; charset=utf-8";

  try {
    return connection.build_post_request(url, headers, body);
  } catch (const MalformedUrlError &ex) {
    std::cerr << "InfluxRequest: " << ex.what() << "\n";
    return std::nullopt;
  }
}
