#include "influx_version.hpp"

#include "text_utils.hpp"

#include <boost/beast/core/detail/base64.hpp>

namespace {

std::string base64(const std::string &data) {
  std::string out;
  out.resize(boost::beast::detail::base64::encoded_size(data.size()));
  const std::size_t written =
      boost::beast::detail::base64::encode(out.data(), data.data(), data.size());
  out.resize(written);
  return out;
}

} // namespace

std::string
InfluxVersionV1::build_write_url(const ConnectionSettings &settings) const {
  return settings.base_url() + "/write?db=" + settings.db_name() +
         "&precision=s";
}

HttpHeaders
InfluxVersionV1::authorization_headers(const ConnectionSettings &settings) const {
  if (!settings.has_credentials()) {
    return {};
  }
  // Basic-авторизация кодируется из байтов ISO-8859-1.
  const std::string credentials =
      to_latin1(*settings.user() + ":" + *settings.password());
  return {{"Authorization", "Basic " + base64(credentials)}};
}

std::string
InfluxVersionV2::build_write_url(const ConnectionSettings &settings) const {
  return settings.base_url() + "/api/v2/write?bucket=" + settings.db_name() +
         "&precision=s&org=" + settings.user().value_or("");
}

HttpHeaders
InfluxVersionV2::authorization_headers(const ConnectionSettings &settings) const {
  if (!settings.has_credentials()) {
    return {};
  }
  return {{"Authorization", "Token " + *settings.password()}};
}

std::unique_ptr<InfluxVersion> make_influx_version(int major_version) {
  switch (major_version) {
  case 1:
    return std::make_unique<InfluxVersionV1>();
  case 2:
    return std::make_unique<InfluxVersionV2>();
  default:
    return nullptr;
  }
}
