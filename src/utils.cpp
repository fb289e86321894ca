#include "quicgate/utils.hpp"

#include <cstdio>

namespace quicgate {

std::string format_http_date(std::time_t when) {
  static constexpr const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  std::tm tm_buf{};
  gmtime_r(&when, &tm_buf);

  // Locale independent: strftime %a/%b would follow LC_TIME
  char buf[40];
  int n = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT", kDays[tm_buf.tm_wday],
                        tm_buf.tm_mday, kMonths[tm_buf.tm_mon], tm_buf.tm_year + 1900, tm_buf.tm_hour,
                        tm_buf.tm_min, tm_buf.tm_sec);
  if (n <= 0) {
    return std::string();
  }
  return std::string(buf, static_cast<size_t>(n));
}

std::string http_date_now() { return format_http_date(std::time(nullptr)); }

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

std::vector<std::string> split_comma_list(std::string_view value) {
  std::vector<std::string> items;
  while (!value.empty()) {
    size_t comma = value.find(',');
    std::string_view item = trim(value.substr(0, comma));
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    value.remove_prefix(comma + 1);
  }
  return items;
}

bool is_valid_utf8(std::string_view data) {
  size_t i = 0;
  const size_t n = data.size();
  while (i < n) {
    uint8_t c = static_cast<uint8_t>(data[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      uint8_t cc = static_cast<uint8_t>(data[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong encodings, surrogates and out-of-range code points
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

}  // namespace quicgate
