#ifndef BQA_CONFIG_H
#define BQA_CONFIG_H

#include <optional>
#include <string>
#include <vector>

namespace bqa {

// Settings shared by both tools. Command line wins over the environment
// (BQA_LOG_LEVEL, BQA_LOG_FILE), which wins over the defaults.
struct bqa_log_config {
  std::string log_level = "INFO";
  std::string log_file;
};

// bboxqa <input> [--output FILE] [--git_version V] [--iiif-gallica-v3] [--random]
//        [--http-timeout-base SECONDS] [--log-level L] [--log-file FILE]
struct bqa_check_config {
  std::string input;
  std::string output = "output.jsonl";
  std::optional<std::string> git_version;     // also from BQA_GIT_VERSION
  bool iiif_gallica_v3 = false;
  bool random = false;
  long http_timeout_base = 1;
  bqa_log_config log;
  bool show_help = false;

  // Throws bqa_config_error on unknown options, missing values or missing input.
  static bqa_check_config parse(const std::vector<std::string>& args);
  static std::string usage(const std::string& program);
};

// bqa_page_stats -i INPUT -o OUTPUT [--log-level L] [--log-file FILE]
struct bqa_stats_config {
  std::string input;
  std::string output;
  bqa_log_config log;
  bool show_help = false;

  static bqa_stats_config parse(const std::vector<std::string>& args);
  static std::string usage(const std::string& program);
};

// Applies level and file to bqa_log. Throws bqa_config_error for an unknown
// level or an unwritable log file.
void apply_log_config(const bqa_log_config& config);

} // namespace bqa

#endif // BQA_CONFIG_H
