#ifndef BQA_PAGE_REPORT_H
#define BQA_PAGE_REPORT_H

#include "../../api/iiif/bqa_dimension_provider.h"
#include "../bounds/bqa_boundary_validator.h"
#include "../stats/bqa_layout_statistics.h"
#include <optional>
#include <string>

namespace bqa {

// One output record of the boundary check, written as a single JSON line.
struct bqa_page_report {
  std::string page_id;
  std::string ts;
  bqa_image_size facsimile;
  bqa_validation_result validation;
  bqa_page_stats pages_stats;
  std::optional<std::string> cc_json;       // pass-through of the page's "cc"
  std::string iiif_base_uri;                // image reference the dimensions came from
  std::optional<std::string> error;         // dimension provider failure message
  std::optional<std::string> git_version;
};

} // namespace bqa

#endif // BQA_PAGE_REPORT_H
