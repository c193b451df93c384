#ifndef BQA_JSON_H
#define BQA_JSON_H

#include "../../documents/page/bqa_page.h"
#include "../../qaprocesses/pipeline/bqa_page_report.h"
#include <string>

// nlohmann::json stays inside bqa_json.cpp; callers only see domain types and strings.

namespace bqa {

class bqa_json {
public:
  /**
   * @brief Parses one page record (one line of a pages JSON-lines file).
   * @throws bqa_json_error if the text is not a JSON object.
   * @throws bqa_schema_error if "id" is missing or a nested element has the wrong shape.
   * @note Missing "r", "p" or "l" sequences are kept as absent; the engines
   * report them when they traverse the page.
   */
  static bqa_page parse_page(const std::string& json_text);

  /**
   * @brief Reads "width" and "height" from a IIIF image info.json document.
   * @throws bqa_json_error if the document is malformed or lacks either field.
   */
  static bqa_image_size parse_iiif_info(const std::string& json_text);

  // Single-line JSON of a report, without trailing newline.
  static std::string create(const bqa_page_report& report);

  // Single-line JSON of a statistics record with an added "timestamp" field.
  static std::string create(const bqa_page_stats& stats, const std::string& timestamp);
};

} // namespace bqa

#endif // BQA_JSON_H
