#ifndef BQA_HTTP_CLIENT_H
#define BQA_HTTP_CLIENT_H

#include <string>

namespace bqa {

struct bqa_http_response {
  bool ok = false;
  int status_code = 0;
  std::string body;
  std::string error_message;
};

// Minimal GET seam used by the dimension providers; tests substitute a mock.
class i_http_client {
public:
  virtual ~i_http_client() = default;
  virtual bqa_http_response get(const std::string& url, long timeout_seconds) = 0;
};

// libcurl backed client built on bqa_http_request.
class bqa_curl_http_client : public i_http_client {
public:
  explicit bqa_curl_http_client(bool verify_tls = false);

  bqa_http_response get(const std::string& url, long timeout_seconds) override;

private:
  bool verify_tls_;
};

} // namespace bqa

#endif // BQA_HTTP_CLIENT_H
