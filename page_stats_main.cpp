/**
 * Page statistics tool - layout statistics for a single page record
 *
 * Usage:
 *   ./bqa_page_stats -i page.json -o stats.jsonl
 *   ./bqa_page_stats -i page.json -o -
 */

#include "api/json/bqa_json.h"
#include "documents/io/bqa_report_writer.h"
#include "qaprocesses/stats/bqa_layout_statistics.h"
#include "utils/bqa_config.h"
#include "utils/bqa_env.h"
#include "utils/bqa_exceptions.h"
#include "utils/bqa_log.h"
#include "utils/bqa_timestamp.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace bqa;

static std::string read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw bqa_io_error("Cannot open input file", path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

int main(int argc, char* argv[]) {
  load_env_file(".env");

  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.push_back(argv[i]);
  }

  bqa_stats_config config;
  try {
    config = bqa_stats_config::parse(args);
    if (config.show_help) {
      std::cout << bqa_stats_config::usage(argv[0]);
      return 0;
    }
    apply_log_config(config.log);
  } catch (const bqa_config_error& e) {
    std::cerr << e.what() << "\n\n" << bqa_stats_config::usage(argv[0]);
    return 2;
  }

  try {
    bqa_page page = bqa_json::parse_page(read_file(config.input));
    bqa_page_stats stats = bqa_layout_statistics::compute(page);

    bqa_report_writer writer(config.output);
    writer.write_line(bqa_json::create(stats, get_timestamp()));

    BQA_LOG_INFO("page_stats") << "Wrote statistics for page " << page.id << " to " << config.output;
  } catch (const std::exception& e) {
    BQA_LOG_ERROR("page_stats") << "Error processing " << config.input << ": " << e.what();
    return 1;
  }

  return 0;
}
