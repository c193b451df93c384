#include "bqa_pagination_xml.h"
#include "../../utils/bqa_exceptions.h"
#include "../../utils/bqa_string_utils.h"
#include <pugixml.hpp>
#include <cstdlib>

namespace bqa {

namespace {

  bool parse_dimension(const pugi::xml_node& page, const char* name, long long& out) {
    pugi::xml_node node = page.child(name);
    if (!node) {
      return false;
    }
    std::string text = trim(node.text().as_string());
    if (text.empty()) {
      return false;
    }
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
      return false;
    }
    out = value;
    return true;
  }

} // namespace

bqa_pagination_table bqa_pagination_xml::parse(const std::string& xml_text) {
  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_buffer(xml_text.data(), xml_text.size());
  if (!result) {
    throw bqa_xml_error(std::string("Invalid pagination XML: ") + result.description());
  }

  bqa_pagination_table table;
  for (const pugi::xpath_node& xnode : doc.select_nodes("//page")) {
    pugi::xml_node page = xnode.node();
    pugi::xml_node ordre = page.child("ordre");
    if (!ordre) {
      continue;
    }

    bqa_image_size size;
    if (!parse_dimension(page, "image_width", size.width) ||
        !parse_dimension(page, "image_height", size.height)) {
      continue;
    }

    std::string key = trim(ordre.text().as_string());
    // First <page> with a given ordre wins, like a linear search would.
    table.emplace(key, size);
  }
  return table;
}

} // namespace bqa
