#ifndef BQA_LAYOUT_STATISTICS_H
#define BQA_LAYOUT_STATISTICS_H

#include "../../documents/page/bqa_page.h"
#include "bqa_descriptive_stats.h"
#include <optional>
#include <vector>

namespace bqa {

struct bqa_paragraph_coverage {
  bqa_coord_quad coords;       // bounding box of the paragraph's line quads
  double coverage_percent = 0.0;
};

struct bqa_page_stats {
  size_t num_regions = 0;
  size_t num_paragraphs = 0;
  size_t num_lines = 0;
  size_t num_empty_lines = 0;
  double avg_paragraphs_per_region = 0.0;
  double avg_lines_per_region = 0.0;
  double avg_lines_per_paragraph = 0.0;
  bqa_descriptive_stats line_width_stats;
  bqa_descriptive_stats line_height_stats;

  // Largest paragraph bounding box by area; logged, not serialized.
  std::optional<bqa_coord_quad> largest_paragraph;

  std::vector<bqa_paragraph_coverage> paragraph_coverages;
};

/**
 * @brief Structural and geometric statistics of one page.
 *
 * compute() annotates every line with its joined text (bqa_line::text) before
 * counting empty lines, so the page is taken by reference. Reversed line
 * order and low paragraph coverage are reported through the log only.
 * Throws bqa_schema_error on missing "r", "p" or "l" sequences.
 */
class bqa_layout_statistics {
public:
  static constexpr double coverage_warning_percent = 80.0;
  static constexpr double coverage_dump_percent = 70.0;

  static bqa_page_stats compute(bqa_page& page);

private:
  static void check_reversed_lines(const bqa_page& page);
  static void annotate_text(bqa_page& page);
  static void count_elements(const bqa_page& page, bqa_page_stats& stats);
  static void collect_line_sizes(const bqa_page& page, bqa_page_stats& stats);
  static void find_largest_paragraph(const bqa_page& page, bqa_page_stats& stats);
  static void compute_coverages(const bqa_page& page, bqa_page_stats& stats);
};

} // namespace bqa

#endif // BQA_LAYOUT_STATISTICS_H
