#pragma once

#include <string>
#include <string_view>

// UTF-8 -> ISO-8859-1. Символы вне Latin-1 и битые последовательности
// заменяются на '?'.
std::string to_latin1(std::string_view utf8);

std::string trim(std::string_view s);

// Значение поля верхнего уровня JSON-объекта: {"error":"...", "code":...}.
// Строки возвращаются с раскрытыми escape-последовательностями, вложенные
// объекты и массивы пропускаются. Пустая строка, если ключа нет, значение
// null или тело не разбирается.
std::string extract_json_value(const std::string &body, const std::string &key);

bool contains_ignore_case(std::string_view haystack, std::string_view needle);
