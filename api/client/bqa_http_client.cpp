#include "bqa_http_client.h"
#include "bqa_http_request.h"

namespace bqa {

bqa_curl_http_client::bqa_curl_http_client(bool verify_tls)
  : verify_tls_(verify_tls)
{
}

bqa_http_response bqa_curl_http_client::get(const std::string& url, long timeout_seconds) {
  bqa_http_request request(url);
  request.set_header("User-Agent", "bboxqa");
  request.set_timeout_seconds(timeout_seconds);
  request.set_verify_tls(verify_tls_);

  bqa_http_response response;
  response.ok = request.send();
  response.status_code = request.get_status_code();
  response.body = request.get_response_body();
  response.error_message = request.get_error_message();
  return response;
}

} // namespace bqa
