#pragma once

#include "snapshot.hpp"
#include "table.hpp"

#include <cstdint>
#include <string>

// Сериализация таблиц в line protocol InfluxDB (precision=s, без тегов):
//   <table> <field1>,<field2>,... <timestamp>\n
//
// Строки без единого непустого поля пропускаются. Метка времени берётся из
// колонки-метки времени, если она есть у строки, иначе fallback_timestamp.
// Спецсимволы в именах и строковых значениях не экранируются.
std::string encode_table(const Table &table, std::int64_t fallback_timestamp);

// Все таблицы снимка одним телом запроса.
std::string encode_snapshot(const Snapshot &snapshot,
                            std::int64_t fallback_timestamp);
