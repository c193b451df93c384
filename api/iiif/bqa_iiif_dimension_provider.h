#ifndef BQA_IIIF_DIMENSION_PROVIDER_H
#define BQA_IIIF_DIMENSION_PROVIDER_H

#include "bqa_dimension_provider.h"
#include "../client/bqa_http_client.h"
#include <chrono>
#include <functional>
#include <memory>

namespace bqa {

// ============================================================================
// IIIF IMAGE API - info.json lookup with retries
// ============================================================================
//
// GET <image_ref>/info.json and read "width"/"height".
// Attempt n (0-based) uses a timeout of (1 + n) * timeout_base_seconds and,
// on failure, waits (1 + n) * retry_unit before the next attempt.
// After max_attempts failed attempts bqa_dimension_error is thrown.
//
// ============================================================================

class bqa_iiif_dimension_provider : public i_dimension_provider {
public:
  using sleep_function = std::function<void(std::chrono::milliseconds)>;

  explicit bqa_iiif_dimension_provider(std::shared_ptr<i_http_client> client);

  std::optional<bqa_image_size> resolve_dimensions(const std::string& image_ref) override;

  void set_max_attempts(int attempts);
  void set_timeout_base_seconds(long seconds);
  void set_retry_unit(std::chrono::milliseconds unit);
  void set_sleep_function(sleep_function sleeper);

  int get_max_attempts() const { return max_attempts_; }

private:
  std::shared_ptr<i_http_client> client_;
  int max_attempts_ = 5;
  long timeout_base_seconds_ = 1;
  std::chrono::milliseconds retry_unit_{1000};
  sleep_function sleep_;
};

} // namespace bqa

#endif // BQA_IIIF_DIMENSION_PROVIDER_H
