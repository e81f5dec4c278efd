#include "connection_settings.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>

ConnectionSettings::ConnectionSettings(std::string host, int port,
                                       std::string db_name, bool ssl,
                                       long read_timeout_ms)
    : host_(std::move(host)), port_(port), db_name_(std::move(db_name)),
      ssl_(ssl), read_timeout_ms_(read_timeout_ms) {}

ConnectionSettings ConnectionSettings::defaults() {
  return ConnectionSettings("localhost", 8086, "solarreader", false, 5000);
}

ConnectionSettings &
ConnectionSettings::with_credentials(std::optional<std::string> user,
                                     std::optional<std::string> password) {
  user_ = std::move(user);
  password_ = std::move(password);
  return *this;
}

std::string ConnectionSettings::base_url() const {
  return std::string(ssl_ ? "https" : "http") + "://" + host_ + ":" +
         std::to_string(port_);
}

std::string ConnectionSettings::root_url() const { return base_url() + "/"; }

bool ConnectionSettings::set_version_if_absent(const std::string &version) {
  if (version_) {
    return false;
  }
  version_ = version;
  return true;
}

std::optional<int> ConnectionSettings::major_version() const {
  if (!version_) {
    return std::nullopt;
  }
  return parse_major_version(*version_);
}

int ConnectionSettings::parse_major_version(std::string_view version) {
  std::string cleaned;
  for (char c : version) {
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
      cleaned.push_back(c);
    }
  }
  cleaned.push_back('.');

  const std::string first = cleaned.substr(0, cleaned.find('.'));
  if (first.empty()) {
    return 1;
  }
  try {
    return std::stoi(first);
  } catch (const std::exception &) {
    return 1;
  }
}
