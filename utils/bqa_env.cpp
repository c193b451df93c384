#include "bqa_env.h"
#include "bqa_string_utils.h"
#include <cstdlib>
#include <fstream>

namespace bqa {

bool load_env_file(const std::string& filepath, bool override_existing) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = trim(line);

    if (trimmed.empty() || starts_with(trimmed, "#")) {
      continue;
    }

    size_t pos = trimmed.find('=');
    if (pos == std::string::npos) {
      continue;
    }

    std::string key = trim(trimmed.substr(0, pos));
    std::string value = trim(trimmed.substr(pos + 1));
    if (key.empty()) {
      continue;
    }

    setenv(key.c_str(), value.c_str(), override_existing ? 1 : 0);
  }
  return true;
}

std::string get_env(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return std::string(value);
}

} // namespace bqa
