#ifndef BQA_PAGE_PIPELINE_H
#define BQA_PAGE_PIPELINE_H

#include "bqa_page_report.h"
#include "../../api/iiif/bqa_dimension_provider.h"
#include "../../documents/io/bqa_page_source.h"
#include "../../documents/io/bqa_report_writer.h"
#include <optional>
#include <string>

namespace bqa {

// Additive per-run counters. Skipped pages are tracked separately and never
// contribute to the line and out-of-bounds sums.
struct bqa_batch_totals {
  size_t total_lines = 0;
  size_t out_of_bounds_lines = 0;
  size_t out_of_bounds_paragraphs = 0;
  size_t out_of_bounds_regions = 0;
  size_t total_pages = 0;
  size_t skipped_pages = 0;

  size_t total_out_of_bounds() const {
    return out_of_bounds_lines + out_of_bounds_paragraphs + out_of_bounds_regions;
  }

  void add(const bqa_page_report& report);
  void add_skipped() { ++skipped_pages; }
  void merge(const bqa_batch_totals& other);
};

struct bqa_pipeline_options {
  std::string timestamp;
  std::optional<std::string> git_version;
  bool iiif_gallica_v3 = false;
};

/**
 * @brief Per-page orchestration: dimensions -> bounds -> statistics -> report.
 *
 * A page without image reference, or whose provider reports no size, is
 * skipped. A provider failure (bqa_dimension_error) is not fatal: the page is
 * validated against the sentinel size 999999 x 999999 and the report carries
 * the error text. Schema errors propagate and end the run.
 */
class bqa_page_pipeline {
public:
  static constexpr long long sentinel_dimension = 999999;
  static constexpr const char* gallica_iiif_prefix = "https://gallica.bnf.fr/iiif";
  static constexpr const char* gallica_iiif_v3_prefix = "https://openapi.bnf.fr/iiif/presentation/v3";

  explicit bqa_page_pipeline(bqa_pipeline_options options);

  std::optional<bqa_page_report> process_page(bqa_page& page, i_dimension_provider& provider);

  // Processes every page of the source, writes each report and returns the totals.
  bqa_batch_totals run(i_page_source& source, i_dimension_provider& provider, i_report_sink& sink);

  static void log_summary(const bqa_batch_totals& totals);

private:
  void patch_gallica_link(bqa_page& page) const;

  bqa_pipeline_options options_;
};

} // namespace bqa

#endif // BQA_PAGE_PIPELINE_H
