#ifndef BQA_DIMENSION_RESOLVER_H
#define BQA_DIMENSION_RESOLVER_H

#include "bqa_dimension_provider.h"
#include "bqa_gallica_dimension_provider.h"
#include "bqa_iiif_dimension_provider.h"
#include <memory>

namespace bqa {

// Routes Gallica image URIs to the pagination service and everything else to
// the IIIF info.json lookup. Owns the pagination cache for the run.
class bqa_dimension_resolver : public i_dimension_provider {
public:
  explicit bqa_dimension_resolver(std::shared_ptr<i_http_client> client);

  std::optional<bqa_image_size> resolve_dimensions(const std::string& image_ref) override;

  bqa_iiif_dimension_provider& iiif() { return iiif_; }
  const bqa_pagination_cache& cache() const { return *cache_; }

private:
  std::shared_ptr<bqa_pagination_cache> cache_;
  bqa_gallica_dimension_provider gallica_;
  bqa_iiif_dimension_provider iiif_;
};

} // namespace bqa

#endif // BQA_DIMENSION_RESOLVER_H
