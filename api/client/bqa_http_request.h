#ifndef BQA_HTTP_REQUEST_H
#define BQA_HTTP_REQUEST_H

#include <map>
#include <string>

// libcurl is only used in the .cpp file.

namespace bqa {

// Holds libcurl's global state for the lifetime of the process; create one in main().
class bqa_http_global {
public:
  bqa_http_global();
  ~bqa_http_global();

  bqa_http_global(const bqa_http_global&) = delete;
  bqa_http_global& operator=(const bqa_http_global&) = delete;
};

class bqa_http_request {
public:
  explicit bqa_http_request(const std::string& url);

  void set_header(const std::string& key, const std::string& value);

  /**
   * @brief Total transfer timeout in seconds. 0 means no limit.
   */
  void set_timeout_seconds(long seconds);

  /**
   * @brief Enables or disables TLS peer and host verification (on by default).
   * Image servers of some libraries ship broken certificate chains.
   */
  void set_verify_tls(bool verify);

  /**
   * @brief Sends a synchronous GET request.
   * @return true on a 2xx status, false otherwise. See get_error_message().
   */
  bool send();

  int get_status_code() const;
  const std::string& get_response_body() const;
  const std::string& get_error_message() const;

private:
  std::string url_;
  std::map<std::string, std::string> headers_;
  long timeout_seconds_;
  bool verify_tls_;

  int status_code_;
  std::string response_body_;
  std::string error_message_;
};

} // namespace bqa

#endif // BQA_HTTP_REQUEST_H
