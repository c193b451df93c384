#ifndef BQA_GALLICA_DIMENSION_PROVIDER_H
#define BQA_GALLICA_DIMENSION_PROVIDER_H

#include "bqa_dimension_provider.h"
#include "../client/bqa_http_client.h"
#include "../xml/bqa_pagination_xml.h"
#include <map>
#include <memory>
#include <string>

namespace bqa {

// Pagination tables keyed by ARK identifier. Lives for one run, never evicts.
class bqa_pagination_cache {
public:
  const bqa_pagination_table* find(const std::string& ark_id) const;
  const bqa_pagination_table& store(const std::string& ark_id, bqa_pagination_table table);
  size_t size() const { return tables_.size(); }

private:
  std::map<std::string, bqa_pagination_table> tables_;
};

// Parts of a Gallica IIIF image URI, e.g.
// https://gallica.bnf.fr/iiif/ark:/12148/bpt6k6703122r/f4 -> {bpt6k6703122r, f4}
struct bqa_gallica_ref {
  std::string ark_id;
  std::string page;
};

/**
 * @brief Dimension lookup through Gallica's pagination service.
 *
 * One request per document fetches the sizes of all its pages; the parsed
 * table is kept in the shared cache. Failures to fetch or parse, and pages
 * absent from the table, are logged and reported as nullopt.
 */
class bqa_gallica_dimension_provider : public i_dimension_provider {
public:
  static constexpr const char* pagination_service = "https://gallica.bnf.fr/services/Pagination?ark=";

  bqa_gallica_dimension_provider(std::shared_ptr<i_http_client> client,
                                 std::shared_ptr<bqa_pagination_cache> cache);

  static std::optional<bqa_gallica_ref> match(const std::string& image_ref);

  std::optional<bqa_image_size> resolve_dimensions(const std::string& image_ref) override;

  std::optional<bqa_image_size> resolve(const std::string& ark_id, const std::string& page);

private:
  std::shared_ptr<i_http_client> client_;
  std::shared_ptr<bqa_pagination_cache> cache_;
  long timeout_seconds_ = 10;
};

} // namespace bqa

#endif // BQA_GALLICA_DIMENSION_PROVIDER_H
