#ifndef BQA_BOUNDARY_VALIDATOR_H
#define BQA_BOUNDARY_VALIDATOR_H

#include "../../documents/page/bqa_page.h"
#include <optional>
#include <string>
#include <vector>

namespace bqa {

struct bqa_out_of_bounds_entry {
  size_t seq = 0;                       // index within the parent sequence
  std::vector<double> coord;            // raw "c" list as found on the element
  std::optional<std::string> p_of_json; // raw "pOf" in effect for the element
  bqa_excess excess;
};

struct bqa_validation_result {
  size_t total_lines = 0;
  std::vector<bqa_out_of_bounds_entry> out_of_bounds_lines;
  std::vector<bqa_out_of_bounds_entry> out_of_bounds_paragraphs;
  std::vector<bqa_out_of_bounds_entry> out_of_bounds_regions;

  size_t total_out_of_bounds() const {
    return out_of_bounds_lines.size() + out_of_bounds_paragraphs.size() + out_of_bounds_regions.size();
  }
};

// Checks every region, paragraph and line quad of a page against the image
// canvas [0, image_width] x [0, image_height]. Elements without a quad of at
// least four values are not checked; lines are counted regardless.
// Throws bqa_schema_error if a region lacks "p" or a paragraph lacks "l".
class bqa_boundary_validator {
public:
  static bqa_validation_result validate(const bqa_page& page, double image_width, double image_height);

private:
  static std::optional<bqa_out_of_bounds_entry> check(const std::vector<double>& coord,
                                                      size_t seq,
                                                      const std::optional<std::string>& p_of_json,
                                                      double image_width,
                                                      double image_height);
};

} // namespace bqa

#endif // BQA_BOUNDARY_VALIDATOR_H
