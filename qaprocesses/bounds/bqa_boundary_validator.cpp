#include "bqa_boundary_validator.h"
#include "../../utils/bqa_log.h"
#include <sstream>

namespace bqa {

namespace {

  std::string coord_to_text(const std::vector<double>& coord) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < coord.size(); ++i) {
      if (i > 0) ss << ", ";
      ss << coord[i];
    }
    ss << "]";
    return ss.str();
  }

} // namespace

std::optional<bqa_out_of_bounds_entry> bqa_boundary_validator::check(const std::vector<double>& coord,
                                                                     size_t seq,
                                                                     const std::optional<std::string>& p_of_json,
                                                                     double image_width,
                                                                     double image_height) {
  auto quad = bqa_coord_quad::from_list(coord);
  if (!quad || quad->within_image(image_width, image_height)) {
    return std::nullopt;
  }

  bqa_out_of_bounds_entry entry;
  entry.seq = seq;
  entry.coord = coord;
  entry.p_of_json = p_of_json;
  entry.excess = quad->excess(image_width, image_height);
  return entry;
}

bqa_validation_result bqa_boundary_validator::validate(const bqa_page& page, double image_width, double image_height) {
  bqa_validation_result result;
  std::optional<std::string> current_p_of_json;

  const auto& regions = regions_of(page);
  for (size_t region_seq = 0; region_seq < regions.size(); ++region_seq) {
    const bqa_region& region = regions[region_seq];
    if (region.p_of_json) {
      current_p_of_json = region.p_of_json;
    }

    if (auto entry = check(region.c, region_seq, current_p_of_json, image_width, image_height)) {
      BQA_LOG_ERROR("bounds") << "Region out of bounds: " << coord_to_text(region.c);
      result.out_of_bounds_regions.push_back(std::move(*entry));
    }

    const auto& paragraphs = paragraphs_of(region, region_seq);
    for (size_t paragraph_seq = 0; paragraph_seq < paragraphs.size(); ++paragraph_seq) {
      const bqa_paragraph& paragraph = paragraphs[paragraph_seq];

      if (auto entry = check(paragraph.c, paragraph_seq, current_p_of_json, image_width, image_height)) {
        BQA_LOG_ERROR("bounds") << "Paragraph out of bounds: " << coord_to_text(paragraph.c);
        result.out_of_bounds_paragraphs.push_back(std::move(*entry));
      }

      const auto& lines = lines_of(paragraph, paragraph_seq);
      for (size_t line_seq = 0; line_seq < lines.size(); ++line_seq) {
        const bqa_line& line = lines[line_seq];
        ++result.total_lines;

        if (auto entry = check(line.c, line_seq, current_p_of_json, image_width, image_height)) {
          BQA_LOG_ERROR("bounds") << "Line out of bounds: " << coord_to_text(line.c);
          result.out_of_bounds_lines.push_back(std::move(*entry));
        }
      }
    }
  }

  return result;
}

} // namespace bqa
