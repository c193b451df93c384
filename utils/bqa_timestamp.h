#ifndef BQA_TIMESTAMP_H
#define BQA_TIMESTAMP_H

#include <chrono>
#include <string>

namespace bqa {

// ISO 8601 UTC timestamp with second precision, e.g. "2024-05-01T12:30:00Z".
std::string to_iso_utc(const std::chrono::system_clock::time_point& tp);

// Timestamp of the current moment; taken once per run and stamped on every report.
std::string get_timestamp();

} // namespace bqa

#endif // BQA_TIMESTAMP_H
