#include "bqa_timestamp.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bqa {

std::string to_iso_utc(const std::chrono::system_clock::time_point& tp) {
  std::ostringstream oss;
  auto time_t_val = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time_t_val, &tm);

  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string get_timestamp() {
  return to_iso_utc(std::chrono::system_clock::now());
}

} // namespace bqa
