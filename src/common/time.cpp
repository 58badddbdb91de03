#include "tai/common/time.hpp"

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace tai::common {

std::string format_rfc3339_utc(const std::time_t seconds) {
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::optional<std::time_t> parse_rfc3339_utc(const std::string &text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::string rest;
  std::getline(in, rest);
  std::size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    while (pos < rest.size() && rest[pos] >= '0' && rest[pos] <= '9') {
      ++pos;
    }
  }

  long offset_seconds = 0;
  if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
    ++pos;
  } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
    int hours = 0;
    int minutes = 0;
    if (std::sscanf(rest.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
      return std::nullopt;
    }
    offset_seconds = (hours * 3600L + minutes * 60L) * (rest[pos] == '+' ? 1 : -1);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != rest.size()) {
    return std::nullopt;
  }

  const std::time_t local = timegm(&tm);
  if (local == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return local - offset_seconds;
}

std::time_t now_seconds() {
  return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace tai::common
