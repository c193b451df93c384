#include "bqa_text_extractor.h"
#include "../../utils/bqa_string_utils.h"
#include <vector>

namespace bqa {

std::string bqa_text_extractor::extract(const bqa_line& line) {
  if (!line.t) {
    return std::string();
  }

  std::vector<std::string> fragments;
  fragments.reserve(line.t->size());
  for (const auto& segment : *line.t) {
    if (segment.tx && !segment.tx->empty()) {
      fragments.push_back(*segment.tx);
    }
  }
  return trim(join(fragments, " "));
}

} // namespace bqa
