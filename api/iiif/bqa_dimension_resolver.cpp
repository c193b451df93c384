#include "bqa_dimension_resolver.h"
#include "../../utils/bqa_log.h"

namespace bqa {

bqa_dimension_resolver::bqa_dimension_resolver(std::shared_ptr<i_http_client> client)
  : cache_(std::make_shared<bqa_pagination_cache>())
  , gallica_(client, cache_)
  , iiif_(client)
{
}

std::optional<bqa_image_size> bqa_dimension_resolver::resolve_dimensions(const std::string& image_ref) {
  if (auto ref = bqa_gallica_dimension_provider::match(image_ref)) {
    BQA_LOG_DEBUG("resolver") << "Detected Gallica URI, using pagination XML for ARK "
                              << ref->ark_id << ", page " << ref->page;
    return gallica_.resolve(ref->ark_id, ref->page);
  }
  return iiif_.resolve_dimensions(image_ref);
}

} // namespace bqa
