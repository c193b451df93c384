#include "bqa_config.h"
#include "bqa_env.h"
#include "bqa_exceptions.h"
#include "bqa_log.h"
#include "bqa_string_utils.h"
#include <sstream>
#include <stdexcept>

namespace bqa {

namespace {

bqa_log_config log_defaults() {
  bqa_log_config config;
  config.log_level = get_env("BQA_LOG_LEVEL", config.log_level);
  config.log_file = get_env("BQA_LOG_FILE");
  return config;
}

// Splits "--name=value" into name and value; "--name" alone leaves value empty.
bool split_inline_value(const std::string& arg, std::string& name, std::string& value) {
  size_t eq = arg.find('=');
  if (eq == std::string::npos || !starts_with(arg, "--")) {
    name = arg;
    return false;
  }
  name = arg.substr(0, eq);
  value = arg.substr(eq + 1);
  return true;
}

// Value for option name: either inline ("--x=v") or the following argument.
std::string take_value(const std::vector<std::string>& args, size_t& i,
                       const std::string& name, bool has_inline, const std::string& inline_value) {
  if (has_inline) {
    return inline_value;
  }
  if (i + 1 >= args.size()) {
    throw bqa_config_error("Option " + name + " requires a value");
  }
  return args[++i];
}

bool parse_log_option(const std::vector<std::string>& args, size_t& i, const std::string& name,
                      bool has_inline, const std::string& inline_value, bqa_log_config& log) {
  if (name == "--log-level") {
    log.log_level = take_value(args, i, name, has_inline, inline_value);
    return true;
  }
  if (name == "--log-file") {
    log.log_file = take_value(args, i, name, has_inline, inline_value);
    return true;
  }
  return false;
}

} // namespace

bqa_check_config bqa_check_config::parse(const std::vector<std::string>& args) {
  bqa_check_config config;
  config.log = log_defaults();
  std::string git_version = get_env("BQA_GIT_VERSION");
  if (!git_version.empty()) {
    config.git_version = git_version;
  }

  for (size_t i = 0; i < args.size(); ++i) {
    std::string name;
    std::string inline_value;
    bool has_inline = split_inline_value(args[i], name, inline_value);

    if (name == "-h" || name == "--help") {
      config.show_help = true;
      return config;
    }
    if (parse_log_option(args, i, name, has_inline, inline_value, config.log)) {
      continue;
    }
    if (name == "--output" || name == "-o") {
      config.output = take_value(args, i, name, has_inline, inline_value);
    } else if (name == "--git_version" || name == "--git-version") {
      config.git_version = take_value(args, i, name, has_inline, inline_value);
    } else if (name == "--iiif-gallica-v3") {
      config.iiif_gallica_v3 = true;
    } else if (name == "--random") {
      config.random = true;
    } else if (name == "--http-timeout-base") {
      std::string value = take_value(args, i, name, has_inline, inline_value);
      try {
        size_t used = 0;
        config.http_timeout_base = std::stol(value, &used);
        if (used != value.size() || config.http_timeout_base <= 0) {
          throw bqa_config_error("Invalid value for --http-timeout-base: " + value);
        }
      } catch (const std::logic_error&) {
        throw bqa_config_error("Invalid value for --http-timeout-base: " + value);
      }
    } else if (starts_with(name, "-") && name != "-") {
      throw bqa_config_error("Unknown option: " + name);
    } else if (config.input.empty()) {
      config.input = args[i];
    } else {
      throw bqa_config_error("Unexpected argument: " + args[i]);
    }
  }

  if (config.input.empty()) {
    throw bqa_config_error("Missing input path");
  }
  return config;
}

std::string bqa_check_config::usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage:\n"
      << "  " << program << " <input> [options]\n\n"
      << "Checks OCR line, paragraph and region coordinates against the image size\n"
      << "and writes one JSON report per page.\n\n"
      << "Arguments:\n"
      << "  <input>                     Page JSON-lines file or directory of *.jsonl files\n\n"
      << "Options:\n"
      << "  -o, --output FILE           Report file, '-' for stdout (default: output.jsonl)\n"
      << "  --git_version VERSION       Version tag added to every report\n"
      << "  --iiif-gallica-v3           Rewrite Gallica IIIF links to the v3 endpoint\n"
      << "  --random                    Process input files in random order\n"
      << "  --http-timeout-base SECONDS Base timeout for IIIF info requests (default: 1)\n"
      << "  --log-level LEVEL           DEBUG, INFO, WARNING or ERROR (env BQA_LOG_LEVEL)\n"
      << "  --log-file FILE             Also append log messages to FILE (env BQA_LOG_FILE)\n"
      << "  -h, --help                  Show this help\n";
  return out.str();
}

bqa_stats_config bqa_stats_config::parse(const std::vector<std::string>& args) {
  bqa_stats_config config;
  config.log = log_defaults();

  for (size_t i = 0; i < args.size(); ++i) {
    std::string name;
    std::string inline_value;
    bool has_inline = split_inline_value(args[i], name, inline_value);

    if (name == "-h" || name == "--help") {
      config.show_help = true;
      return config;
    }
    if (parse_log_option(args, i, name, has_inline, inline_value, config.log)) {
      continue;
    }
    if (name == "-i" || name == "--input") {
      config.input = take_value(args, i, name, has_inline, inline_value);
    } else if (name == "-o" || name == "--output") {
      config.output = take_value(args, i, name, has_inline, inline_value);
    } else {
      throw bqa_config_error("Unexpected argument: " + args[i]);
    }
  }

  if (config.input.empty()) {
    throw bqa_config_error("Missing required option -i/--input");
  }
  if (config.output.empty()) {
    throw bqa_config_error("Missing required option -o/--output");
  }
  return config;
}

std::string bqa_stats_config::usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage:\n"
      << "  " << program << " -i INPUT -o OUTPUT [options]\n\n"
      << "Computes layout statistics for a single page JSON file.\n\n"
      << "Options:\n"
      << "  -i, --input FILE      Page JSON file\n"
      << "  -o, --output FILE     Statistics JSON file, '-' for stdout\n"
      << "  --log-level LEVEL     DEBUG, INFO, WARNING or ERROR (env BQA_LOG_LEVEL)\n"
      << "  --log-file FILE       Also append log messages to FILE (env BQA_LOG_FILE)\n"
      << "  -h, --help            Show this help\n";
  return out.str();
}

void apply_log_config(const bqa_log_config& config) {
  if (!bqa_log::set_level(config.log_level)) {
    throw bqa_config_error("Unknown log level: " + config.log_level);
  }
  if (!bqa_log::set_file(config.log_file)) {
    throw bqa_config_error("Cannot open log file: " + config.log_file);
  }
}

} // namespace bqa
