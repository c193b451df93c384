#include "bqa_gallica_dimension_provider.h"
#include "../../utils/bqa_exceptions.h"
#include "../../utils/bqa_log.h"
#include "../../utils/bqa_string_utils.h"
#include <regex>

namespace bqa {

const bqa_pagination_table* bqa_pagination_cache::find(const std::string& ark_id) const {
  auto it = tables_.find(ark_id);
  return it != tables_.end() ? &it->second : nullptr;
}

const bqa_pagination_table& bqa_pagination_cache::store(const std::string& ark_id, bqa_pagination_table table) {
  return tables_[ark_id] = std::move(table);
}

bqa_gallica_dimension_provider::bqa_gallica_dimension_provider(std::shared_ptr<i_http_client> client,
                                                               std::shared_ptr<bqa_pagination_cache> cache)
  : client_(std::move(client)), cache_(std::move(cache))
{
}

std::optional<bqa_gallica_ref> bqa_gallica_dimension_provider::match(const std::string& image_ref) {
  static const std::regex pattern(R"(^https://gallica\.bnf\.fr/iiif/ark:/12148/([^/]+)/(f\d+))");
  std::smatch m;
  if (!std::regex_search(image_ref, m, pattern)) {
    return std::nullopt;
  }
  return bqa_gallica_ref{m[1].str(), m[2].str()};
}

std::optional<bqa_image_size> bqa_gallica_dimension_provider::resolve_dimensions(const std::string& image_ref) {
  auto ref = match(image_ref);
  if (!ref) {
    BQA_LOG_WARNING("gallica") << "Not a Gallica IIIF URI: " << image_ref;
    return std::nullopt;
  }
  return resolve(ref->ark_id, ref->page);
}

std::optional<bqa_image_size> bqa_gallica_dimension_provider::resolve(const std::string& ark_id, const std::string& page) {
  std::string page_num = page;
  if (starts_with(page_num, "f")) {
    page_num = page_num.substr(1);
  }

  const bqa_pagination_table* table = cache_->find(ark_id);
  if (table != nullptr) {
    BQA_LOG_DEBUG("gallica") << "Using cached pagination XML for ARK " << ark_id;
  } else {
    std::string url = std::string(pagination_service) + ark_id;
    BQA_LOG_INFO("gallica") << "Fetching pagination XML from " << url;

    bqa_http_response response = client_->get(url, timeout_seconds_);
    if (!response.ok) {
      BQA_LOG_ERROR("gallica") << "Failed to fetch dimensions from Gallica XML for " << ark_id
                               << ", page " << page << ": " << response.error_message;
      return std::nullopt;
    }

    try {
      table = &cache_->store(ark_id, bqa_pagination_xml::parse(response.body));
    } catch (const bqa_xml_error& e) {
      BQA_LOG_ERROR("gallica") << "Failed to fetch dimensions from Gallica XML for " << ark_id
                               << ", page " << page << ": " << e.what();
      return std::nullopt;
    }
    BQA_LOG_INFO("gallica") << "Cached pagination XML for ARK " << ark_id;
  }

  auto it = table->find(page_num);
  if (it == table->end()) {
    BQA_LOG_WARNING("gallica") << "Page " << page_num << " not found in pagination XML for " << ark_id;
    return std::nullopt;
  }

  BQA_LOG_DEBUG("gallica") << "Found dimensions for page " << page_num << ": "
                           << it->second.width << "x" << it->second.height;
  return it->second;
}

} // namespace bqa
