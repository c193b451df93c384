#ifndef BQA_ENV_H
#define BQA_ENV_H

#include <string>

namespace bqa {

// Reads KEY=VALUE lines from a .env file into the process environment.
// Blank lines and lines starting with '#' are ignored. Values already present
// in the environment are overwritten only if override_existing is true.
// Returns false if the file cannot be opened.
bool load_env_file(const std::string& filepath, bool override_existing = false);

// Value of an environment variable or fallback if it is unset or empty.
std::string get_env(const char* name, const std::string& fallback = std::string());

} // namespace bqa

#endif // BQA_ENV_H
