#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace tai::common {

/// "2024-05-01T12:30:00Z"
[[nodiscard]] std::string format_rfc3339_utc(std::time_t seconds);

/// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and a
/// "Z" or "+HH:MM"/"-HH:MM" offset.
[[nodiscard]] std::optional<std::time_t> parse_rfc3339_utc(const std::string &text);

[[nodiscard]] std::time_t now_seconds();

} // namespace tai::common
