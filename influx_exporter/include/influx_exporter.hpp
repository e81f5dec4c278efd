#pragma once

#include "connection_settings.hpp"
#include "export_pipe.hpp"
#include "http_connection.hpp"
#include "snapshot.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class ExporterState { Created, Running, Stopped };

// Асинхронный экспорт снимков в InfluxDB (v1 и v2).
// add_export() только кладёт снимок в очередь; кодирование в line protocol,
// определение версии сервера и отправка выполняются одним фоновым потоком
// строго по очереди. Неудачная порция логируется и отбрасывается.
class InfluxExporter {
public:
  InfluxExporter(std::string name, ConnectionSettings settings,
                 std::shared_ptr<HttpConnectionFactory> factory);

  ~InfluxExporter();

  InfluxExporter(const InfluxExporter &) = delete;
  InfluxExporter &operator=(const InfluxExporter &) = delete;

  // Created -> Running. Повторный запуск после shutdown() не выполняется.
  void initialize();
  // -> Stopped. Снимки, оставшиеся в очереди, отбрасываются; текущая
  // отправка завершается сама.
  void shutdown();

  // Никогда не блокирует. Снимки без таблиц игнорируются.
  void add_export(Snapshot snapshot);

  // Синхронная проверка настроек, независимая от очереди.
  // Возвращает сообщение об успехе с версией сервера, иначе InfluxIoError.
  std::string test_connection(const ConnectionSettings &candidate);

  // Новые настройки и соединение; кэш версии начинается заново.
  void update_configuration(const ConnectionSettings &settings);

  const std::string &name() const { return name_; }
  std::int64_t last_call() const { return last_call_.load(); }
  std::size_t pending() const { return pipe_.size(); }
  ExporterState state() const { return state_.load(); }

  void set_verbose(bool verbose) { verbose_.store(verbose); }

private:
  struct ExportTarget {
    std::shared_ptr<ConnectionSettings> settings;
    std::shared_ptr<HttpConnection> connection;
  };

  ExportTarget current_target() const;

  void process_queue();
  void export_snapshot(const Snapshot &snapshot);
  void send_body(const ExportTarget &target, const std::string &body);

  std::string name_;
  std::shared_ptr<HttpConnectionFactory> factory_;

  mutable std::mutex target_mutex_;
  ExportTarget target_;

  ExportPipe<Snapshot> pipe_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<ExporterState> state_{ExporterState::Created};
  std::thread worker_;

  std::atomic<std::int64_t> last_call_{0};
  std::atomic<bool> verbose_{false};
};
