#include "bqa_iiif_dimension_provider.h"
#include "../json/bqa_json.h"
#include "../../utils/bqa_exceptions.h"
#include "../../utils/bqa_log.h"
#include <algorithm>
#include <thread>

namespace bqa {

bqa_iiif_dimension_provider::bqa_iiif_dimension_provider(std::shared_ptr<i_http_client> client)
  : client_(std::move(client))
  , sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); })
{
}

void bqa_iiif_dimension_provider::set_max_attempts(int attempts) {
  max_attempts_ = std::max(1, attempts);
}

void bqa_iiif_dimension_provider::set_timeout_base_seconds(long seconds) {
  timeout_base_seconds_ = std::max(1L, seconds);
}

void bqa_iiif_dimension_provider::set_retry_unit(std::chrono::milliseconds unit) {
  retry_unit_ = unit;
}

void bqa_iiif_dimension_provider::set_sleep_function(sleep_function sleeper) {
  sleep_ = std::move(sleeper);
}

std::optional<bqa_image_size> bqa_iiif_dimension_provider::resolve_dimensions(const std::string& image_ref) {
  const std::string manifest_url = image_ref + "/info.json";
  std::string last_error;

  for (int attempt = 0; attempt < max_attempts_; ++attempt) {
    BQA_LOG_DEBUG("iiif") << "Loading IIIF manifest from " << manifest_url << " (attempt " << (attempt + 1) << ")";

    bqa_http_response response = client_->get(manifest_url, timeout_base_seconds_ * (1 + attempt));
    if (response.ok) {
      try {
        bqa_image_size size = bqa_json::parse_iiif_info(response.body);
        BQA_LOG_DEBUG("iiif") << "Fetched image dimensions from " << manifest_url << ": "
                              << size.width << "x" << size.height;
        return size;
      } catch (const bqa_json_error& e) {
        last_error = e.what();
      }
    } else {
      last_error = response.error_message;
    }

    BQA_LOG_ERROR("iiif") << "Attempt " << (attempt + 1) << " failed for " << manifest_url << ": " << last_error;
    if (attempt + 1 < max_attempts_) {
      sleep_(retry_unit_ * (1 + attempt));
    }
  }

  BQA_LOG_ERROR("iiif") << "Failed to fetch image dimensions from " << manifest_url << " after "
                        << max_attempts_ << " attempts.";
  throw bqa_dimension_error(last_error, image_ref, max_attempts_);
}

} // namespace bqa
