#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

char lower(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

void skip_spaces(std::string_view s, std::size_t &pos) {
  while (pos < s.size() && is_space(s[pos]))
    ++pos;
}

void append_utf8(std::string &out, unsigned long cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool read_hex4(std::string_view s, std::size_t pos, unsigned long &out) {
  if (pos + 4 > s.size())
    return false;
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char c = s[i];
    out <<= 4;
    if (c >= '0' && c <= '9')
      out |= static_cast<unsigned long>(c - '0');
    else if (c >= 'a' && c <= 'f')
      out |= static_cast<unsigned long>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      out |= static_cast<unsigned long>(c - 'A' + 10);
    else
      return false;
  }
  return true;
}

// Строка JSON, pos указывает на открывающую кавычку. После успешного
// чтения pos стоит за закрывающей кавычкой.
bool read_json_string(std::string_view s, std::size_t &pos, std::string &out) {
  out.clear();
  ++pos;
  while (pos < s.size()) {
    const char c = s[pos++];
    if (c == '"')
      return true;
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (pos >= s.size())
      return false;
    const char esc = s[pos++];
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      out.push_back(esc);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      unsigned long cp = 0;
      if (!read_hex4(s, pos, cp))
        return false;
      pos += 4;
      // суррогатная пара
      unsigned long low = 0;
      if (cp >= 0xD800 && cp <= 0xDBFF && pos + 1 < s.size() &&
          s[pos] == '\\' && s[pos + 1] == 'u' && read_hex4(s, pos + 2, low) &&
          low >= 0xDC00 && low <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        pos += 6;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      return false;
    }
  }
  return false;
}

// Пропуск значения любого вида: строки, вложенного объекта/массива
// или скаляра. Скаляр возвращается в raw.
bool skip_json_value(std::string_view s, std::size_t &pos, std::string &raw) {
  raw.clear();
  if (pos >= s.size())
    return false;
  if (s[pos] == '"') {
    return read_json_string(s, pos, raw);
  }
  if (s[pos] == '{' || s[pos] == '[') {
    int depth = 0;
    std::string ignored;
    while (pos < s.size()) {
      const char c = s[pos];
      if (c == '"') {
        if (!read_json_string(s, pos, ignored))
          return false;
        continue;
      }
      if (c == '{' || c == '[')
        ++depth;
      else if (c == '}' || c == ']')
        --depth;
      ++pos;
      if (depth == 0)
        return true;
    }
    return false;
  }
  const auto begin = pos;
  while (pos < s.size() && s[pos] != ',' && s[pos] != '}' && s[pos] != ']')
    ++pos;
  raw = trim(s.substr(begin, pos - begin));
  return !raw.empty();
}

} // namespace

std::string to_latin1(std::string_view utf8) {
  std::string out;
  out.reserve(utf8.size());
  std::size_t i = 0;
  while (i < utf8.size()) {
    const auto lead = static_cast<unsigned char>(utf8[i]);
    std::size_t len = 0;
    unsigned long cp = 0;
    if (lead < 0x80) {
      len = 1;
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp = lead & 0x07;
    }

    bool valid = len != 0 && i + len <= utf8.size();
    for (std::size_t k = 1; valid && k < len; ++k) {
      const auto cont = static_cast<unsigned char>(utf8[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = (cp << 6) | (cont & 0x3F);
      }
    }

    if (!valid) {
      out.push_back('?');
      ++i;
      continue;
    }
    out.push_back(cp <= 0xFF ? static_cast<char>(cp) : '?');
    i += len;
  }
  return out;
}

std::string trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return std::string(s);
}

std::string extract_json_value(const std::string &body,
                               const std::string &key) {
  const std::string_view s(body);
  std::size_t pos = 0;
  skip_spaces(s, pos);
  if (pos >= s.size() || s[pos] != '{')
    return {};
  ++pos;

  std::string name;
  std::string value;
  while (true) {
    skip_spaces(s, pos);
    if (pos >= s.size() || s[pos] != '"')
      return {};
    if (!read_json_string(s, pos, name))
      return {};
    skip_spaces(s, pos);
    if (pos >= s.size() || s[pos] != ':')
      return {};
    ++pos;
    skip_spaces(s, pos);

    const bool is_string = pos < s.size() && s[pos] == '"';
    if (!skip_json_value(s, pos, value))
      return {};
    if (name == key) {
      if (!is_string && value == "null")
        return {};
      return value;
    }

    skip_spaces(s, pos);
    if (pos >= s.size() || s[pos] != ',')
      return {};
    ++pos;
  }
}

bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(),
                        [](char a, char b) { return lower(a) == lower(b); });
  return it != haystack.end();
}
