#include "bqa_report_writer.h"
#include "../../api/json/bqa_json.h"
#include "../../utils/bqa_exceptions.h"
#include <iostream>

namespace bqa {

bqa_report_writer::bqa_report_writer(const std::string& path)
  : out_(&std::cout)
{
  if (path.empty() || path == "-") {
    return;
  }
  file_.open(path, std::ios::out | std::ios::trunc);
  if (!file_.is_open()) {
    throw bqa_io_error("Cannot open output file", path);
  }
  out_ = &file_;
}

bqa_report_writer::bqa_report_writer(std::ostream& out)
  : out_(&out)
{
}

void bqa_report_writer::write(const bqa_page_report& report) {
  write_line(bqa_json::create(report));
}

void bqa_report_writer::write_line(const std::string& json_line) {
  *out_ << json_line << '\n';
  if (!*out_) {
    throw bqa_io_error("Write failed", "report stream");
  }
  ++written_;
}

} // namespace bqa
