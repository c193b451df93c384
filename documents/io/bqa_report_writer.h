#ifndef BQA_REPORT_WRITER_H
#define BQA_REPORT_WRITER_H

#include "../../qaprocesses/pipeline/bqa_page_report.h"
#include <fstream>
#include <ostream>
#include <string>

namespace bqa {

// Receives finished page reports.
class i_report_sink {
public:
  virtual ~i_report_sink() = default;
  virtual void write(const bqa_page_report& report) = 0;
};

// JSON-lines sink: one report object per line, to a file or to stdout ("-").
class bqa_report_writer : public i_report_sink {
public:
  // Throws bqa_io_error if the file cannot be created.
  explicit bqa_report_writer(const std::string& path);
  explicit bqa_report_writer(std::ostream& out);

  void write(const bqa_page_report& report) override;
  void write_line(const std::string& json_line);

  size_t written() const { return written_; }

private:
  std::ofstream file_;
  std::ostream* out_;
  size_t written_ = 0;
};

} // namespace bqa

#endif // BQA_REPORT_WRITER_H
