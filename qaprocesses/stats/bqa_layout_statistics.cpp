#include "bqa_layout_statistics.h"
#include "bqa_text_extractor.h"
#include "../../utils/bqa_log.h"

namespace bqa {

namespace {

  std::vector<bqa_coord_quad> line_quads(const std::vector<bqa_line>& lines) {
    std::vector<bqa_coord_quad> quads;
    for (const auto& line : lines) {
      if (auto quad = line.quad()) {
        quads.push_back(*quad);
      }
    }
    return quads;
  }

  bqa_bounding_box bounding_box_of(const std::vector<bqa_coord_quad>& quads) {
    bqa_bounding_box box;
    for (const auto& quad : quads) {
      box.include(quad);
    }
    return box;
  }

  double safe_average(size_t numerator, size_t denominator) {
    if (denominator == 0) {
      return 0.0;
    }
    return round_to(static_cast<double>(numerator) / static_cast<double>(denominator), 2);
  }

} // namespace

void bqa_layout_statistics::check_reversed_lines(const bqa_page& page) {
  size_t paragraph_counter = 0;
  const auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      ++paragraph_counter;
      std::vector<bqa_coord_quad> quads = line_quads(lines_of(paragraphs[paragraph_seq], paragraph_seq));

      for (size_t idx = 1; idx < quads.size(); ++idx) {
        const bqa_coord_quad& prev = quads[idx - 1];
        const bqa_coord_quad& curr = quads[idx];
        if (curr.get_bottom() < prev.get_top()) {
          BQA_LOG_WARNING("stats") << "Paragraph " << paragraph_counter
                                   << " has reversed line order between lines " << (idx - 1)
                                   << " and " << idx << ": prev top y=" << prev.get_top()
                                   << ", next bottom y=" << curr.get_bottom();
        }
      }
    }
  }
}

void bqa_layout_statistics::annotate_text(bqa_page& page) {
  auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      for (auto& line : lines_of(paragraphs[paragraph_seq], paragraph_seq)) {
        line.text = bqa_text_extractor::extract(line);
      }
    }
  }
}

void bqa_layout_statistics::count_elements(const bqa_page& page, bqa_page_stats& stats) {
  const auto& regions = regions_of(page);
  stats.num_regions = regions.size();

  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    stats.num_paragraphs += paragraphs.size();

    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      const auto& lines = lines_of(paragraphs[paragraph_seq], paragraph_seq);
      stats.num_lines += lines.size();
      for (const auto& line : lines) {
        if (line.empty_structure || line.text.empty()) {
          ++stats.num_empty_lines;
        }
      }
    }
  }

  stats.avg_paragraphs_per_region = safe_average(stats.num_paragraphs, stats.num_regions);
  stats.avg_lines_per_region = safe_average(stats.num_lines, stats.num_regions);
  stats.avg_lines_per_paragraph = safe_average(stats.num_lines, stats.num_paragraphs);
}

// Heights are only taken from lines that carry a non-empty segment list,
// widths from every line with a quad.
void bqa_layout_statistics::collect_line_sizes(const bqa_page& page, bqa_page_stats& stats) {
  std::vector<double> widths;
  std::vector<double> heights;

  const auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      for (const auto& line : lines_of(paragraphs[paragraph_seq], paragraph_seq)) {
        auto quad = line.quad();
        if (!quad) {
          continue;
        }
        widths.push_back(quad->width);
        if (line.t && !line.t->empty()) {
          heights.push_back(quad->height);
        }
      }
    }
  }

  stats.line_width_stats = bqa_descriptive_stats_calculator::compute(widths);
  stats.line_height_stats = bqa_descriptive_stats_calculator::compute(heights);
}

void bqa_layout_statistics::find_largest_paragraph(const bqa_page& page, bqa_page_stats& stats) {
  double max_area = 0.0;

  const auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      std::vector<bqa_coord_quad> quads = line_quads(lines_of(paragraphs[paragraph_seq], paragraph_seq));
      if (quads.empty()) {
        continue;
      }

      bqa_bounding_box box = bounding_box_of(quads);
      if (box.area() > max_area) {
        max_area = box.area();
        stats.largest_paragraph = box.to_quad();
      }
    }
  }

  if (stats.largest_paragraph) {
    const bqa_coord_quad& q = *stats.largest_paragraph;
    BQA_LOG_INFO("stats") << "Largest paragraph coordinates: x=" << q.x << ", y=" << q.y
                          << ", width=" << q.width << ", height=" << q.height;
  } else {
    BQA_LOG_INFO("stats") << "Largest paragraph coordinates: none";
  }
}

void bqa_layout_statistics::compute_coverages(const bqa_page& page, bqa_page_stats& stats) {
  size_t paragraph_counter = 0;

  const auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const auto& paragraphs = paragraphs_of(regions[region_seq], region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      ++paragraph_counter;
      const auto& lines = lines_of(paragraphs[paragraph_seq], paragraph_seq);
      std::vector<bqa_coord_quad> quads = line_quads(lines);
      if (quads.empty()) {
        continue;
      }

      bqa_bounding_box box = bounding_box_of(quads);
      double total_line_area = 0.0;
      for (const auto& quad : quads) {
        total_line_area += quad.area();
      }

      double bounding_area = box.area();
      double coverage = bounding_area > 0 ? round_to(total_line_area / bounding_area * 100.0, 2) : 0.0;
      bqa_coord_quad coords = box.to_quad();

      if (coverage < coverage_warning_percent) {
        BQA_LOG_WARNING("stats") << "Paragraph " << paragraph_counter << " coverage below 80%: "
                                 << coverage << "% at x=" << coords.x << ", y=" << coords.y
                                 << ", width=" << coords.width << ", height=" << coords.height;
      }
      if (coverage < coverage_dump_percent) {
        BQA_LOG_DEBUG("stats") << "Paragraph " << paragraph_counter
                               << " coverage below 70%, emitting line texts:";
        for (const auto& line : lines) {
          BQA_LOG_DEBUG("stats") << line.text;
        }
      }

      bqa_paragraph_coverage entry;
      entry.coords = coords;
      entry.coverage_percent = coverage;
      stats.paragraph_coverages.push_back(entry);
    }
  }
}

bqa_page_stats bqa_layout_statistics::compute(bqa_page& page) {
  bqa_page_stats stats;

  check_reversed_lines(page);
  annotate_text(page);
  count_elements(page, stats);
  collect_line_sizes(page, stats);
  find_largest_paragraph(page, stats);
  compute_coverages(page, stats);

  return stats;
}

} // namespace bqa
