#ifndef BQA_PAGINATION_XML_H
#define BQA_PAGINATION_XML_H

#include "../iiif/bqa_dimension_provider.h"
#include <map>
#include <string>

namespace bqa {

// Page sizes of one Gallica document keyed by the <ordre> value of each <page>.
using bqa_pagination_table = std::map<std::string, bqa_image_size>;

class bqa_pagination_xml {
public:
  /**
   * @brief Parses a Gallica pagination document (services/Pagination?ark=...).
   *
   * Every <page> element at any depth that carries <ordre>, <image_width> and
   * <image_height> with non-empty integer text contributes one entry; pages
   * missing any of them are left out.
   * @throws bqa_xml_error if the document is not well-formed XML.
   */
  static bqa_pagination_table parse(const std::string& xml_text);
};

} // namespace bqa

#endif // BQA_PAGINATION_XML_H
