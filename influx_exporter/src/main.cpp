#include "curl_http_connection.hpp"
#include "exporter_config.hpp"
#include "influx_error.hpp"
#include "influx_exporter.hpp"
#include "pg_table_source.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop.store(true); }

void print_usage() {
  std::cerr << "Usage: influx_exporter [--test-connection] [--verbose]\n"
            << "  [--host H] [--port P] [--ssl] [--user U] [--password P]\n"
            << "  [--db NAME] [--read-timeout-ms MS] [--name NAME]\n"
            << "  --pg-conninfo CONNINFO --source TABLE=SQL [--source ...]\n"
            << "  [--timestamp-column COLUMN] [--interval-sec SEC]\n";
}

} // namespace

int main(int argc, char **argv) {
  load_env();
  ExporterConfig cfg = parse_cli(argc, argv);

  auto factory = std::make_shared<CurlHttpConnectionFactory>();
  InfluxExporter exporter(cfg.name, cfg.connection_settings(), factory);
  exporter.set_verbose(cfg.verbose);

  if (cfg.test_connection) {
    try {
      std::cout << exporter.test_connection(cfg.connection_settings()) << "\n";
      return 0;
    } catch (const InfluxIoError &ex) {
      std::cerr << "Connection test failed: " << ex.what() << "\n";
      return 1;
    }
  }

  if (cfg.pg_conninfo.empty() || cfg.sources.empty()) {
    std::cerr << "Missing data source. Provide --pg-conninfo and at least one "
              << "--source TABLE=SQL\n";
    print_usage();
    return 1;
  }
  if (cfg.interval_sec <= 0) {
    cfg.interval_sec = 10;
  }

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  PgTableSource source(cfg.pg_conninfo, cfg.sources, cfg.timestamp_column);
  exporter.initialize();

  // Опрос источника с заданным интервалом; ожидание дробим,
  // чтобы быстро реагировать на сигнал остановки.
  while (!g_stop.load()) {
    const auto now = static_cast<std::int64_t>(std::time(nullptr));
    exporter.add_export(source.load_snapshot(now));

    const long long steps = static_cast<long long>(cfg.interval_sec) * 10;
    for (long long i = 0; i < steps && !g_stop.load(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  exporter.shutdown();
  return 0;
}
