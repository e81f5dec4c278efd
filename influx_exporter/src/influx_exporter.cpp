#include "influx_exporter.hpp"

#include "influx_error.hpp"
#include "influx_request.hpp"
#include "line_protocol.hpp"
#include "text_utils.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace {

std::int64_t utc_now_seconds() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::string one_line(std::string s) {
  for (char &c : s) {
    if (c == '\n') {
      c = ' ';
    }
  }
  return s;
}

} // namespace

InfluxExporter::InfluxExporter(std::string name, ConnectionSettings settings,
                               std::shared_ptr<HttpConnectionFactory> factory)
    : name_(std::move(name)), factory_(std::move(factory)) {
  update_configuration(settings);
}

InfluxExporter::~InfluxExporter() { shutdown(); }

void InfluxExporter::initialize() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (state_ != ExporterState::Created) {
    std::cerr << "InfluxExporter: '" << name_
              << "' is already started or stopped, initialize ignored\n";
    return;
  }
  running_ = true;
  state_ = ExporterState::Running;
  worker_ = std::thread(&InfluxExporter::process_queue, this);
}

void InfluxExporter::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (state_ == ExporterState::Stopped) {
    return;
  }
  running_ = false;
  state_ = ExporterState::Stopped;
  pipe_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void InfluxExporter::add_export(Snapshot snapshot) {
  if (snapshot.tables.empty()) {
    if (verbose_) {
      std::cout << "InfluxExporter: no exporting tables, skip export\n";
    }
    return;
  }
  if (verbose_) {
    std::cout << "InfluxExporter: add export to '" << name_ << "'\n";
  }
  last_call_ = snapshot.timestamp;
  if (!pipe_.write(std::move(snapshot))) {
    std::cerr << "InfluxExporter: '" << name_
              << "' is stopped, snapshot dropped\n";
  }
}

std::string
InfluxExporter::test_connection(const ConnectionSettings &candidate) {
  ConnectionSettings settings = candidate;
  settings.reset_version();
  auto connection = factory_->create_connection(settings);

  try {
    const std::string version = fetch_influx_version(*connection, settings);
    settings.set_version_if_absent(version);

    auto request = build_influx_request(*connection, settings, "");
    if (!request) {
      throw InfluxIoError("cannot build write request for influx version '" +
                          version + "'");
    }

    HttpResponse response = connection->send_request(*request);
    if (response.status >= 200 && response.status <= 300) {
      return "Connection successful, InfluxDB version " + version;
    }

    std::cerr << "InfluxExporter: connection test returns " << response.status
              << "\n";
    if (contains_ignore_case(response.header("Content-Type"),
                             "application/json")) {
      std::string error = extract_json_value(response.body, "error");
      if (error.empty()) {
        error = extract_json_value(response.body, "message");
      }
      if (error.empty()) {
        error = "unknown json error with " + std::to_string(response.status);
      }
      throw InfluxIoError(error);
    }
    throw InfluxIoError(std::to_string(response.status));
  } catch (const MalformedUrlError &) {
    throw InfluxIoError("malformed url");
  }
}

void InfluxExporter::update_configuration(const ConnectionSettings &settings) {
  ExportTarget target;
  target.settings = std::make_shared<ConnectionSettings>(settings);
  target.settings->reset_version();
  target.connection = factory_->create_connection(settings);

  std::lock_guard<std::mutex> lock(target_mutex_);
  target_ = std::move(target);
}

InfluxExporter::ExportTarget InfluxExporter::current_target() const {
  std::lock_guard<std::mutex> lock(target_mutex_);
  return target_;
}

void InfluxExporter::process_queue() {
  while (running_) {
    Snapshot snapshot;
    if (!pipe_.read(snapshot)) {
      // очередь закрыта в shutdown()
      break;
    }
    if (!running_) {
      break;
    }
    try {
      export_snapshot(snapshot);
    } catch (const std::exception &ex) {
      std::cerr << "InfluxExporter: export to '" << name_
                << "' failed: " << ex.what() << "\n";
    }
  }
}

void InfluxExporter::export_snapshot(const Snapshot &snapshot) {
  if (snapshot.tables.empty()) {
    if (verbose_) {
      std::cout << "InfluxExporter: no exporting tables, skip export\n";
    }
    return;
  }

  const auto start = std::chrono::steady_clock::now();
  const std::int64_t now_ts = utc_now_seconds();

  const std::string body = encode_snapshot(snapshot, now_ts);
  if (body.empty()) {
    std::cerr << "InfluxExporter: empty table(s), skip export\n";
    return;
  }

  send_body(current_target(), body);

  if (verbose_) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << "InfluxExporter: export to '" << name_ << "' finished in "
              << elapsed.count() << " ms\n";
  }
}

void InfluxExporter::send_body(const ExportTarget &target,
                               const std::string &body) {
  ConnectionSettings &settings = *target.settings;
  HttpConnection &connection = *target.connection;

  if (!settings.version()) {
    try {
      const std::string version = fetch_influx_version(connection, settings);
      settings.set_version_if_absent(version);
      if (verbose_) {
        std::cout << "InfluxExporter: influx version=" << version << "\n";
      }
    } catch (const InfluxIoError &ex) {
      std::cerr << "InfluxExporter: database error: " << ex.what() << "\n";
    }
  }

  if (verbose_) {
    std::cout << "InfluxExporter: build data " << one_line(body) << "\n";
  }

  auto request = build_influx_request(connection, settings, body);
  if (!request) {
    std::cerr << "InfluxExporter: batch for '" << name_ << "' dropped\n";
    return;
  }

  HttpResponse response;
  try {
    response = connection.send_request(*request);
  } catch (const InfluxIoError &ex) {
    std::cerr << "InfluxExporter: send to " << request->url
              << " failed: " << ex.what() << "\n";
    return;
  }

  if (response.status >= 300) {
    std::cerr << "InfluxExporter: Influx returns error code " << response.status
              << ", data=" << body;
  }
}
