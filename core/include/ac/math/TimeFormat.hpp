#pragma once
#include <ctime>
#include <string>

namespace ac {

// x-axis label text for a point timestamp. `utc` selects gmtime over the
// local zone. Fractional seconds are truncated.
inline std::string formatTimestamp(double epochSeconds, const std::string& fmt, bool utc = false) {
  auto epoch = static_cast<std::time_t>(epochSeconds);
  std::tm tm{};
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  char buf[128];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
  return std::string(buf, n);
}

} // namespace ac
