// D6.2 - Timestamp formatting for x-labels (pure C++)

#include "ac/math/TimeFormat.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // 1700000000 = 2023-11-14 22:13:20 UTC
  {
    requireTrue(ac::formatTimestamp(1700000000.0, "%Y", true) == "2023", "year");
    requireTrue(ac::formatTimestamp(1700000000.0, "%d", true) == "14", "day");
    requireTrue(ac::formatTimestamp(1700000000.0, "%H:%M", true) == "22:13", "time");
    requireTrue(ac::formatTimestamp(1700000000.0, "%b %d", true).size() == 6, "\"Mon DD\"");
    std::printf("  Test 1 (UTC formatting) PASS\n");
  }

  {
    std::string a = ac::formatTimestamp(1700000000.0, "%d", true);
    std::string b = ac::formatTimestamp(1700000000.0 + 86400.0, "%d", true);
    requireTrue(a != b, "next day differs");
    requireTrue(ac::formatTimestamp(1700000000.9, "%S", true) == "20", "fraction truncated");
    requireTrue(ac::formatTimestamp(1700000000.0, "", true).empty(), "empty pattern");
    requireTrue(!ac::formatTimestamp(1700000000.0, "%b %d").empty(), "local time");
    std::printf("  Test 2 (edge cases) PASS\n");
  }

  std::printf("D6.2 time format: ALL PASS\n");
  return 0;
}
