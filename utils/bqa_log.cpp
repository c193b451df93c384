#include "bqa_log.h"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace bqa {

log_level bqa_log::level_ = log_level::INFO;
std::ofstream bqa_log::file_;

void bqa_log::set_level(log_level level) {
  level_ = level;
}

log_level bqa_log::get_level() {
  return level_;
}

bool bqa_log::parse_level(const std::string& name, log_level& out) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") {
    out = log_level::DEBUG;
  } else if (upper == "INFO") {
    out = log_level::INFO;
  } else if (upper == "WARNING") {
    out = log_level::WARNING;
  } else if (upper == "ERROR") {
    out = log_level::ERROR;
  } else {
    return false;
  }
  return true;
}

bool bqa_log::set_level(const std::string& name) {
  log_level parsed;
  if (!parse_level(name, parsed)) {
    return false;
  }
  level_ = parsed;
  return true;
}

bool bqa_log::set_file(const std::string& path) {
  if (file_.is_open()) {
    file_.close();
  }
  if (path.empty()) {
    return true;
  }
  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

bool bqa_log::enabled(log_level level) {
  return static_cast<int>(level) >= static_cast<int>(level_);
}

const char* bqa_log::level_name(log_level level) {
  switch (level) {
    case log_level::DEBUG:
      return "DEBUG";
    case log_level::INFO:
      return "INFO";
    case log_level::WARNING:
      return "WARNING";
    case log_level::ERROR:
      return "ERROR";
  }
  return "INFO";
}

void bqa_log::write(log_level level, const std::string& component, const std::string& message) {
  if (!enabled(level)) {
    return;
  }

  std::cerr << "[" << level_name(level) << "] [" << component << "] " << message << std::endl;
  if (file_.is_open()) {
    file_ << "[" << level_name(level) << "] [" << component << "] " << message << std::endl;
  }
}

} // namespace bqa
