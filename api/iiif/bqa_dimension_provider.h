#ifndef BQA_DIMENSION_PROVIDER_H
#define BQA_DIMENSION_PROVIDER_H

#include <optional>
#include <string>

namespace bqa {

struct bqa_image_size {
  long long width = 0;
  long long height = 0;
};

// Source of page image dimensions.
//
// resolve_dimensions() returns the pixel size of the image behind image_ref,
// nullopt when the service answered but knows no size for this image, and
// throws bqa_dimension_error when the lookup itself failed.
class i_dimension_provider {
public:
  virtual ~i_dimension_provider() = default;
  virtual std::optional<bqa_image_size> resolve_dimensions(const std::string& image_ref) = 0;
};

} // namespace bqa

#endif // BQA_DIMENSION_PROVIDER_H
