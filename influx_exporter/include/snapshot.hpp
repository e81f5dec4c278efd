#pragma once

#include "table.hpp"

#include <cstdint>
#include <vector>

// Порция данных на экспорт: момент съёма и набор таблиц.
struct Snapshot {
  std::int64_t timestamp{};
  std::vector<Table> tables;
};
