#include "bqa_page_source.h"
#include "../../api/json/bqa_json.h"
#include "../../utils/bqa_exceptions.h"
#include "../../utils/bqa_log.h"
#include "../../utils/bqa_string_utils.h"
#include <algorithm>
#include <filesystem>
#include <random>

namespace bqa {

bqa_page_source::bqa_page_source(const std::string& path, bool randomize) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    for (const auto& entry : fs::recursive_directory_iterator(path, ec)) {
      if (entry.is_regular_file() && ends_with(entry.path().filename().string(), ".jsonl")) {
        files_.push_back(entry.path().string());
      }
    }
    if (ec) {
      throw bqa_io_error("Cannot list input directory", path);
    }
    std::sort(files_.begin(), files_.end());
  } else if (fs::is_regular_file(path, ec)) {
    files_.push_back(path);
  } else {
    throw bqa_io_error("Input not found", path);
  }

  if (randomize) {
    std::random_device rd;
    std::mt19937 rng(rd());
    std::shuffle(files_.begin(), files_.end(), rng);
  }

  BQA_LOG_INFO("source") << "Found " << files_.size() << " page file(s) under " << path;
}

bool bqa_page_source::open_next_file() {
  if (current_.is_open()) {
    current_.close();
    ++file_index_;
  }
  if (file_index_ >= files_.size()) {
    return false;
  }

  current_.clear();
  current_.open(files_[file_index_]);
  if (!current_.is_open()) {
    throw bqa_io_error("Cannot open page file", files_[file_index_]);
  }
  line_number_ = 0;
  BQA_LOG_DEBUG("source") << "Reading " << files_[file_index_];
  return true;
}

bool bqa_page_source::next(bqa_page& page) {
  while (true) {
    if (!current_.is_open() && !open_next_file()) {
      return false;
    }

    std::string line;
    while (std::getline(current_, line)) {
      ++line_number_;
      if (trim(line).empty()) {
        continue;
      }
      page = bqa_json::parse_page(line);
      return true;
    }

    if (!open_next_file()) {
      return false;
    }
  }
}

std::string bqa_page_source::position() const {
  if (file_index_ >= files_.size()) {
    return std::string();
  }
  return files_[file_index_] + ":" + std::to_string(line_number_);
}

} // namespace bqa
