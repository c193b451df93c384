#ifndef BQA_PAGE_H
#define BQA_PAGE_H

#include "bqa_coord_quad.h"
#include <optional>
#include <string>
#include <vector>

namespace bqa {

// One OCR token group ("t" entry) of a line; "tx" may be absent.
struct bqa_text_segment {
  std::optional<std::string> tx;
};

struct bqa_line {
  std::vector<double> c;                               // raw "c" list, empty if absent
  std::optional<std::vector<bqa_text_segment>> t;      // "t", absent on some lines
  bool empty_structure = false;                        // record was [] or {}

  // Joined segment text, filled in by the statistics engine.
  std::string text;

  bool has_coords() const { return c.size() >= 4; }
  std::optional<bqa_coord_quad> quad() const { return bqa_coord_quad::from_list(c); }
};

struct bqa_paragraph {
  std::vector<double> c;
  std::optional<std::vector<bqa_line>> l;

  bool has_coords() const { return c.size() >= 4; }
  std::optional<bqa_coord_quad> quad() const { return bqa_coord_quad::from_list(c); }
};

struct bqa_region {
  std::vector<double> c;
  std::optional<std::string> p_of_json;                // "pOf" as raw JSON text, sticky across later regions
  std::optional<std::vector<bqa_paragraph>> p;

  bool has_coords() const { return c.size() >= 4; }
  std::optional<bqa_coord_quad> quad() const { return bqa_coord_quad::from_list(c); }
};

struct bqa_page {
  std::string id;
  std::optional<std::string> iiif_img_base_uri;        // empty when the key is present but null
  std::optional<std::string> iiif;
  std::optional<std::string> cc_json;                  // "cc" as raw JSON text
  std::optional<std::vector<bqa_region>> r;

  // "iiif_img_base_uri" whenever the key is present, otherwise "iiif".
  // Empty references yield nullopt.
  std::optional<std::string> image_ref() const;
};

// Accessors for the required nested sequences. They throw bqa_schema_error
// naming the missing field and its position in the page.
const std::vector<bqa_region>& regions_of(const bqa_page& page);
std::vector<bqa_region>& regions_of(bqa_page& page);
const std::vector<bqa_paragraph>& paragraphs_of(const bqa_region& region, size_t region_seq);
std::vector<bqa_paragraph>& paragraphs_of(bqa_region& region, size_t region_seq);
const std::vector<bqa_line>& lines_of(const bqa_paragraph& paragraph, size_t paragraph_seq);
std::vector<bqa_line>& lines_of(bqa_paragraph& paragraph, size_t paragraph_seq);

} // namespace bqa

#endif // BQA_PAGE_H
