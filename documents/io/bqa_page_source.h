#ifndef BQA_PAGE_SOURCE_H
#define BQA_PAGE_SOURCE_H

#include "../page/bqa_page.h"
#include <fstream>
#include <string>
#include <vector>

namespace bqa {

// Sequence of page records consumed by the pipeline.
class i_page_source {
public:
  virtual ~i_page_source() = default;
  // Fills page with the next record; false once the source is exhausted.
  virtual bool next(bqa_page& page) = 0;
};

/**
 * @brief Streams page records from local JSON-lines files.
 *
 * The input path may be a single file or a directory; directories are
 * searched recursively for files ending in ".jsonl" (e.g. "*-pages.jsonl").
 * Files are visited in sorted order, or shuffled when randomize is set.
 * Each non-blank line is one page record.
 *
 * Usage:
 *   bqa_page_source source("data/GDL-1900", false);
 *   bqa_page page;
 *   while (source.next(page)) { ... }
 */
class bqa_page_source : public i_page_source {
public:
  explicit bqa_page_source(const std::string& path, bool randomize = false);

  // Reads the next page. Returns false when all files are exhausted.
  // Throws bqa_io_error, bqa_json_error or bqa_schema_error.
  bool next(bqa_page& page) override;

  // Location of the last record returned by next(), "file:line".
  std::string position() const;

private:
  bool open_next_file();

  std::vector<std::string> files_;
  size_t file_index_ = 0;
  size_t line_number_ = 0;
  std::ifstream current_;
};

} // namespace bqa

#endif // BQA_PAGE_SOURCE_H
