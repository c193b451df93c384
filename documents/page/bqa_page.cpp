#include "bqa_page.h"
#include "../../utils/bqa_exceptions.h"

namespace bqa {

std::optional<std::string> bqa_page::image_ref() const {
  if (iiif_img_base_uri) {
    if (iiif_img_base_uri->empty()) {
      return std::nullopt;
    }
    return iiif_img_base_uri;
  }
  if (iiif && !iiif->empty()) {
    return iiif;
  }
  return std::nullopt;
}

const std::vector<bqa_region>& regions_of(const bqa_page& page) {
  if (!page.r) {
    throw bqa_schema_error("r", "page " + page.id);
  }
  return *page.r;
}

std::vector<bqa_region>& regions_of(bqa_page& page) {
  if (!page.r) {
    throw bqa_schema_error("r", "page " + page.id);
  }
  return *page.r;
}

const std::vector<bqa_paragraph>& paragraphs_of(const bqa_region& region, size_t region_seq) {
  if (!region.p) {
    throw bqa_schema_error("p", "region " + std::to_string(region_seq));
  }
  return *region.p;
}

std::vector<bqa_paragraph>& paragraphs_of(bqa_region& region, size_t region_seq) {
  if (!region.p) {
    throw bqa_schema_error("p", "region " + std::to_string(region_seq));
  }
  return *region.p;
}

const std::vector<bqa_line>& lines_of(const bqa_paragraph& paragraph, size_t paragraph_seq) {
  if (!paragraph.l) {
    throw bqa_schema_error("l", "paragraph " + std::to_string(paragraph_seq));
  }
  return *paragraph.l;
}

std::vector<bqa_line>& lines_of(bqa_paragraph& paragraph, size_t paragraph_seq) {
  if (!paragraph.l) {
    throw bqa_schema_error("l", "paragraph " + std::to_string(paragraph_seq));
  }
  return *paragraph.l;
}

} // namespace bqa
