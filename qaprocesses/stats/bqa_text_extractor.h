#ifndef BQA_TEXT_EXTRACTOR_H
#define BQA_TEXT_EXTRACTOR_H

#include "../../documents/page/bqa_page.h"
#include <string>

namespace bqa {

class bqa_text_extractor {
public:
  // Non-empty "tx" fragments of the line joined by single spaces, trimmed.
  // Empty when the line has no segment list or only empty fragments.
  static std::string extract(const bqa_line& line);
};

} // namespace bqa

#endif // BQA_TEXT_EXTRACTOR_H
