#include "http_connection.hpp"
#include "influx_error.hpp"
#include "influx_exporter.hpp"
#include "table.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

// Поддельный сервер InfluxDB: отвечает на GET / заголовком версии,
// запоминает все POST-запросы записи.
struct FakeInfluxServer {
  std::mutex mutex;
  std::condition_variable cv;

  std::string version{"1.8.10"};
  bool fail_probe{false};
  int probe_count{0};

  long write_status{204};
  HttpHeaders write_headers;
  std::string write_body;
  std::vector<HttpRequest> writes;

  bool block_writes{false};
  bool write_in_progress{false};

  HttpResponse handle(const HttpRequest &request) {
    std::unique_lock<std::mutex> lock(mutex);
    if (request.method == "GET") {
      ++probe_count;
      cv.notify_all();
      if (fail_probe) {
        throw InfluxIoError("connection refused");
      }
      HttpResponse response;
      response.status = 204;
      if (!version.empty()) {
        response.headers["X-Influxdb-Version"] = version;
      }
      return response;
    }

    write_in_progress = true;
    cv.notify_all();
    cv.wait(lock, [this] { return !block_writes; });
    writes.push_back(request);
    write_in_progress = false;
    cv.notify_all();

    HttpResponse response;
    response.status = write_status;
    response.headers = write_headers;
    response.body = write_body;
    return response;
  }

  template <typename Pred> bool wait_until(Pred pred) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, 5s, pred);
  }

  bool wait_for_writes(std::size_t n) {
    return wait_until([this, n] { return writes.size() >= n; });
  }

  void set_blocked(bool blocked) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      block_writes = blocked;
    }
    cv.notify_all();
  }
};

class FakeHttpConnection : public HttpConnection {
public:
  explicit FakeHttpConnection(std::shared_ptr<FakeInfluxServer> server)
      : server_(std::move(server)) {}

  HttpResponse send_request(const HttpRequest &request) override {
    return server_->handle(request);
  }

private:
  std::shared_ptr<FakeInfluxServer> server_;
};

class FakeConnectionFactory : public HttpConnectionFactory {
public:
  explicit FakeConnectionFactory(std::shared_ptr<FakeInfluxServer> server)
      : server_(std::move(server)) {}

  std::unique_ptr<HttpConnection>
  create_connection(const ConnectionSettings & /*settings*/) override {
    return std::make_unique<FakeHttpConnection>(server_);
  }

private:
  std::shared_ptr<FakeInfluxServer> server_;
};

Snapshot make_snapshot(const std::string &table_name, const std::string &value,
                       std::int64_t ts = 1700000000) {
  Table table(table_name);
  const auto v = table.add_column("value", ColumnType::Number);
  const auto t = table.add_timestamp_column("ts");
  const auto row = table.add_row();
  table.set_cell(row, v, value);
  table.set_cell(row, t, std::to_string(ts));

  Snapshot snapshot;
  snapshot.timestamp = ts;
  snapshot.tables.push_back(std::move(table));
  return snapshot;
}

class InfluxExporterFunctionalTest : public ::testing::Test {
protected:
  InfluxExporterFunctionalTest()
      : server_(std::make_shared<FakeInfluxServer>()),
        factory_(std::make_shared<FakeConnectionFactory>(server_)) {}

  std::unique_ptr<InfluxExporter>
  make_exporter(const ConnectionSettings &settings) {
    return std::make_unique<InfluxExporter>("InfluxTest", settings, factory_);
  }

  std::shared_ptr<FakeInfluxServer> server_;
  std::shared_ptr<FakeConnectionFactory> factory_;
};

} // namespace

TEST_F(InfluxExporterFunctionalTest, DeliversSnapshotToV1Server) {
  ConnectionSettings settings("influx", 8086, "solar");
  settings.with_credentials("admin", "secret");
  auto exporter = make_exporter(settings);
  exporter->initialize();

  Table table("inverter");
  const auto power = table.add_column("power", ColumnType::Number);
  const auto status = table.add_column("status", ColumnType::String);
  const auto ts = table.add_timestamp_column("ts");
  const auto row = table.add_row();
  table.set_cell(row, power, "12.5");
  table.set_cell(row, status, "OK");
  table.set_cell(row, ts, "1700000000");
  Snapshot snapshot;
  snapshot.timestamp = 1700000005;
  snapshot.tables.push_back(table);

  exporter->add_export(snapshot);
  ASSERT_TRUE(server_->wait_for_writes(1));
  exporter->shutdown();

  EXPECT_EQ(exporter->last_call(), 1700000005);
  std::lock_guard<std::mutex> lock(server_->mutex);
  const HttpRequest &request = server_->writes[0];
  EXPECT_EQ(request.url, "http://influx:8086/write?db=solar&precision=s");
  EXPECT_EQ(request.headers.at("Authorization"), "Basic YWRtaW46c2VjcmV0");
  EXPECT_EQ(request.body, "inverter power=12.5,status=\"OK\" 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, DeliversSnapshotToV2Server) {
  server_->version = "v2.1";
  ConnectionSettings settings("influx", 8086, "bucket1", /*ssl=*/true);
  settings.with_credentials("org1", "tok");
  auto exporter = make_exporter(settings);
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", "42"));
  ASSERT_TRUE(server_->wait_for_writes(1));
  exporter->shutdown();

  std::lock_guard<std::mutex> lock(server_->mutex);
  const HttpRequest &request = server_->writes[0];
  EXPECT_EQ(request.url, "https://influx:8086/api/v2/write?bucket=bucket1"
                         "&precision=s&org=org1");
  EXPECT_EQ(request.headers.at("Authorization"), "Token tok");
  EXPECT_EQ(request.body, "meter value=42 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, ProbesVersionOnceAndCachesIt) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  for (int i = 0; i < 3; ++i) {
    exporter->add_export(make_snapshot("meter", std::to_string(i)));
  }
  ASSERT_TRUE(server_->wait_for_writes(3));
  exporter->shutdown();

  std::lock_guard<std::mutex> lock(server_->mutex);
  EXPECT_EQ(server_->probe_count, 1);
}

TEST_F(InfluxExporterFunctionalTest, FailedProbeIsRetriedWithNextBatch) {
  server_->fail_probe = true;
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", "1"));
  ASSERT_TRUE(server_->wait_until([this] { return server_->probe_count >= 1; }));
  {
    std::lock_guard<std::mutex> lock(server_->mutex);
    server_->fail_probe = false;
  }

  exporter->add_export(make_snapshot("meter", "2"));
  ASSERT_TRUE(server_->wait_for_writes(1));
  exporter->shutdown();

  std::lock_guard<std::mutex> lock(server_->mutex);
  EXPECT_EQ(server_->probe_count, 2);
  ASSERT_EQ(server_->writes.size(), 1u);
  EXPECT_EQ(server_->writes[0].body, "meter value=2 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, UnsupportedVersionDropsBatch) {
  server_->version = "3.0.0";
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", "1"));
  ASSERT_TRUE(server_->wait_until([this] { return server_->probe_count >= 1; }));

  // новые настройки сбрасывают кэш версии
  {
    std::lock_guard<std::mutex> lock(server_->mutex);
    server_->version = "2.7.4";
  }
  exporter->update_configuration(ConnectionSettings::defaults());
  exporter->add_export(make_snapshot("meter", "2"));
  ASSERT_TRUE(server_->wait_for_writes(1));
  exporter->shutdown();

  std::lock_guard<std::mutex> lock(server_->mutex);
  EXPECT_EQ(server_->probe_count, 2);
  ASSERT_EQ(server_->writes.size(), 1u);
  EXPECT_EQ(server_->writes[0].body, "meter value=2 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, SnapshotWithoutTablesIsIgnored) {
  auto exporter = make_exporter(ConnectionSettings::defaults());

  Snapshot empty;
  empty.timestamp = 123;
  exporter->add_export(empty);
  EXPECT_EQ(exporter->pending(), 0u);
  EXPECT_EQ(exporter->last_call(), 0);

  exporter->add_export(make_snapshot("meter", "1", 456));
  EXPECT_EQ(exporter->pending(), 1u);
  EXPECT_EQ(exporter->last_call(), 456);
}

TEST_F(InfluxExporterFunctionalTest, EmptyBodySkipsNetwork) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", " "));
  exporter->add_export(make_snapshot("meter", "5"));
  ASSERT_TRUE(server_->wait_for_writes(1));
  exporter->shutdown();

  std::lock_guard<std::mutex> lock(server_->mutex);
  EXPECT_EQ(server_->probe_count, 1);
  ASSERT_EQ(server_->writes.size(), 1u);
  EXPECT_EQ(server_->writes[0].body, "meter value=5 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, RowsWithoutTimestampUseExportTime) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  Table table("meter");
  const auto v = table.add_column("value", ColumnType::Number);
  table.set_cell(table.add_row(), v, "1");
  table.set_cell(table.add_row(), v, "2");
  Snapshot snapshot;
  snapshot.tables.push_back(table);

  const auto before = static_cast<std::int64_t>(std::time(nullptr));
  exporter->add_export(snapshot);
  ASSERT_TRUE(server_->wait_for_writes(1));
  const auto after = static_cast<std::int64_t>(std::time(nullptr));
  exporter->shutdown();

  std::string body;
  {
    std::lock_guard<std::mutex> lock(server_->mutex);
    body = server_->writes[0].body;
  }
  const auto first_end = body.find('\n');
  ASSERT_NE(first_end, std::string::npos);
  const std::string first = body.substr(0, first_end);
  const std::string second = body.substr(first_end + 1);

  const auto ts1 = std::stoll(first.substr(first.rfind(' ') + 1));
  const auto ts2 = std::stoll(second.substr(second.rfind(' ') + 1));
  EXPECT_GE(ts1, before);
  EXPECT_LE(ts1, after);
  EXPECT_EQ(ts1, ts2);
}

TEST_F(InfluxExporterFunctionalTest, ErrorStatusDoesNotBlockNextBatches) {
  server_->write_status = 500;
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", "1"));
  exporter->add_export(make_snapshot("meter", "2"));
  ASSERT_TRUE(server_->wait_for_writes(2));
  exporter->shutdown();
}

TEST_F(InfluxExporterFunctionalTest, KeepsFifoOrderWithConcurrentProducers) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  constexpr int kProducers = 4;
  constexpr int kPerProducer = 25;
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&exporter, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        exporter->add_export(
            make_snapshot("producer" + std::to_string(p), std::to_string(i)));
      }
    });
  }
  for (auto &t : producers) {
    t.join();
  }

  ASSERT_TRUE(server_->wait_for_writes(kProducers * kPerProducer));
  exporter->shutdown();

  std::map<std::string, int> last_seen;
  std::lock_guard<std::mutex> lock(server_->mutex);
  ASSERT_EQ(server_->writes.size(),
            static_cast<std::size_t>(kProducers * kPerProducer));
  for (const auto &request : server_->writes) {
    const std::string &body = request.body;
    const std::string table = body.substr(0, body.find(' '));
    const auto value_pos = body.find("value=") + 6;
    const int value =
        std::stoi(body.substr(value_pos, body.find(' ', value_pos) - value_pos));

    auto it = last_seen.find(table);
    if (it == last_seen.end()) {
      EXPECT_EQ(value, 0);
    } else {
      EXPECT_EQ(value, it->second + 1);
    }
    last_seen[table] = value;
  }
  EXPECT_EQ(last_seen.size(), static_cast<std::size_t>(kProducers));
}

TEST_F(InfluxExporterFunctionalTest, ShutdownStopsFurtherSends) {
  server_->set_blocked(true);
  auto exporter = make_exporter(ConnectionSettings::defaults());
  exporter->initialize();

  exporter->add_export(make_snapshot("meter", "1"));
  exporter->add_export(make_snapshot("meter", "2"));
  exporter->add_export(make_snapshot("meter", "3"));
  ASSERT_TRUE(server_->wait_until([this] { return server_->write_in_progress; }));

  std::thread stopper([&exporter] { exporter->shutdown(); });
  while (exporter->state() != ExporterState::Stopped) {
    std::this_thread::sleep_for(1ms);
  }
  server_->set_blocked(false);
  stopper.join();

  exporter->add_export(make_snapshot("meter", "4"));
  EXPECT_EQ(exporter->pending(), 0u);

  std::lock_guard<std::mutex> lock(server_->mutex);
  ASSERT_EQ(server_->writes.size(), 1u);
  EXPECT_EQ(server_->writes[0].body, "meter value=1 1700000000\n");
}

TEST_F(InfluxExporterFunctionalTest, StoppedExporterIsNotRestarted) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  EXPECT_EQ(exporter->state(), ExporterState::Created);
  exporter->initialize();
  EXPECT_EQ(exporter->state(), ExporterState::Running);
  exporter->shutdown();
  EXPECT_EQ(exporter->state(), ExporterState::Stopped);

  exporter->initialize();
  EXPECT_EQ(exporter->state(), ExporterState::Stopped);
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestReportsVersion) {
  server_->version = "v2.1";
  server_->write_status = 200;
  auto exporter = make_exporter(ConnectionSettings::defaults());

  ConnectionSettings candidate("influx", 8086, "bucket1");
  candidate.with_credentials("org1", "tok");
  const std::string message = exporter->test_connection(candidate);
  EXPECT_NE(message.find("v2.1"), std::string::npos);

  std::lock_guard<std::mutex> lock(server_->mutex);
  ASSERT_EQ(server_->writes.size(), 1u);
  EXPECT_TRUE(server_->writes[0].body.empty());
  EXPECT_EQ(exporter->pending(), 0u);
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestSurfacesJsonError) {
  server_->version = "1.8.3";
  server_->write_status = 404;
  server_->write_headers["Content-Type"] = "application/json";
  server_->write_body = R"({"error":"database not found: test"})";
  auto exporter = make_exporter(ConnectionSettings::defaults());

  try {
    exporter->test_connection(ConnectionSettings("influx", 8086, "test"));
    FAIL() << "expected InfluxIoError";
  } catch (const InfluxIoError &ex) {
    EXPECT_STREQ(ex.what(), "database not found: test");
  }
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestKeepsEscapedQuotesInError) {
  server_->version = "1.8.3";
  server_->write_status = 400;
  server_->write_headers["Content-Type"] = "application/json";
  server_->write_body =
      R"({"error":"partial write: field type conflict: input field \"value\" on measurement \"m\" is type float"})";
  auto exporter = make_exporter(ConnectionSettings::defaults());

  try {
    exporter->test_connection(ConnectionSettings("influx", 8086, "test"));
    FAIL() << "expected InfluxIoError";
  } catch (const InfluxIoError &ex) {
    EXPECT_STREQ(ex.what(), "partial write: field type conflict: input field "
                            "\"value\" on measurement \"m\" is type float");
  }
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestSurfacesJsonMessage) {
  server_->version = "2.7.4";
  server_->write_status = 401;
  server_->write_headers["content-type"] = "application/json; charset=utf-8";
  server_->write_body = R"({"code":"unauthorized","message":"unauthorized access"})";
  auto exporter = make_exporter(ConnectionSettings::defaults());

  try {
    exporter->test_connection(ConnectionSettings::defaults());
    FAIL() << "expected InfluxIoError";
  } catch (const InfluxIoError &ex) {
    EXPECT_STREQ(ex.what(), "unauthorized access");
  }
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestSurfacesStatusCode) {
  server_->write_status = 503;
  server_->write_headers["Content-Type"] = "text/html";
  auto exporter = make_exporter(ConnectionSettings::defaults());

  try {
    exporter->test_connection(ConnectionSettings::defaults());
    FAIL() << "expected InfluxIoError";
  } catch (const InfluxIoError &ex) {
    EXPECT_STREQ(ex.what(), "503");
  }
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestNormalizesMalformedUrl) {
  auto exporter = make_exporter(ConnectionSettings::defaults());
  try {
    exporter->test_connection(ConnectionSettings("bad host", 8086, "test"));
    FAIL() << "expected InfluxIoError";
  } catch (const InfluxIoError &ex) {
    EXPECT_STREQ(ex.what(), "malformed url");
  }
}

TEST_F(InfluxExporterFunctionalTest, ConnectionTestPropagatesProbeFailure) {
  server_->fail_probe = true;
  auto exporter = make_exporter(ConnectionSettings::defaults());
  EXPECT_THROW(exporter->test_connection(ConnectionSettings::defaults()),
               InfluxIoError);
}
