#ifndef BQA_LOG_H
#define BQA_LOG_H

#include <fstream>
#include <sstream>
#include <string>

namespace bqa {

enum class log_level {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3
};

// Process-wide log sink. Messages go to std::cerr as
// "[LEVEL] [component] message" and are mirrored into an optional log file.
class bqa_log {
public:
  static void set_level(log_level level);
  static log_level get_level();

  // Accepts DEBUG, INFO, WARNING, ERROR (case-insensitive).
  // Returns false and leaves the level untouched for anything else.
  static bool set_level(const std::string& name);
  static bool parse_level(const std::string& name, log_level& out);

  // Opens (appends to) the given file. An empty path closes the current file.
  static bool set_file(const std::string& path);

  static bool enabled(log_level level);
  static void write(log_level level, const std::string& component, const std::string& message);

  static const char* level_name(log_level level);

private:
  static log_level level_;
  static std::ofstream file_;
};

// Stream-style helper: bqa_log_line(log_level::INFO, "pipeline") << "page " << id;
// The message is emitted when the temporary goes out of scope.
class bqa_log_line {
public:
  bqa_log_line(log_level level, const char* component)
    : level_(level), component_(component), active_(bqa_log::enabled(level)) {}

  ~bqa_log_line() {
    if (active_) {
      bqa_log::write(level_, component_, stream_.str());
    }
  }

  template <typename T>
  bqa_log_line& operator<<(const T& value) {
    if (active_) {
      stream_ << value;
    }
    return *this;
  }

private:
  log_level level_;
  const char* component_;
  bool active_;
  std::ostringstream stream_;
};

} // namespace bqa

#define BQA_LOG_DEBUG(component) ::bqa::bqa_log_line(::bqa::log_level::DEBUG, component)
#define BQA_LOG_INFO(component) ::bqa::bqa_log_line(::bqa::log_level::INFO, component)
#define BQA_LOG_WARNING(component) ::bqa::bqa_log_line(::bqa::log_level::WARNING, component)
#define BQA_LOG_ERROR(component) ::bqa::bqa_log_line(::bqa::log_level::ERROR, component)

#endif // BQA_LOG_H
