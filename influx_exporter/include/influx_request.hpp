#pragma once

#include "connection_settings.hpp"
#include "http_connection.hpp"

#include <optional>
#include <string>

inline constexpr const char *kInfluxVersionHeader = "X-Influxdb-Version";

// GET на корень сервера, версия из заголовка X-Influxdb-Version
// ("unknown", если заголовка нет). Без повторов; при сбое транспорта
// бросает InfluxIoError.
std::string fetch_influx_version(HttpConnection &connection,
                                 const ConnectionSettings &settings);

// POST-запрос записи для диалекта, выбранного по мажорной версии.
// std::nullopt (с записью в лог) если версия не определена, не
// поддерживается или URL некорректен.
std::optional<HttpRequest> build_influx_request(HttpConnection &connection,
                                                const ConnectionSettings &settings,
                                                const std::string &body);
