#include "bqa_http_request.h"
#include <curl/curl.h>
#include <memory>

namespace bqa {

namespace {

  // Appends the received chunk to the std::string passed as user data.
  size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    std::string* mem = static_cast<std::string*>(userp);
    mem->append(static_cast<char*>(contents), real_size);
    return real_size;
  }

} // namespace

bqa_http_global::bqa_http_global() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

bqa_http_global::~bqa_http_global() {
  curl_global_cleanup();
}

bqa_http_request::bqa_http_request(const std::string& url)
    : url_(url), timeout_seconds_(0), verify_tls_(true), status_code_(0) {}

void bqa_http_request::set_header(const std::string& key, const std::string& value) { headers_[key] = value; }
void bqa_http_request::set_timeout_seconds(long seconds) { timeout_seconds_ = seconds; }
void bqa_http_request::set_verify_tls(bool verify) { verify_tls_ = verify; }

bool bqa_http_request::send() {
  status_code_ = 0;
  response_body_.clear();
  error_message_.clear();

  if (url_.empty()) {
    error_message_ = "URL is empty.";
    return false;
  }

  // RAII wrappers so CURL handle and header list are always released
  auto curl_deleter = [](CURL* c) { if (c) curl_easy_cleanup(c); };
  auto slist_deleter = [](struct curl_slist* s) { if (s) curl_slist_free_all(s); };

  std::unique_ptr<CURL, decltype(curl_deleter)> curl(curl_easy_init(), curl_deleter);
  if (!curl) {
    error_message_ = "Failed to initialize libcurl.";
    return false;
  }

  std::unique_ptr<struct curl_slist, decltype(slist_deleter)> header_list(nullptr, slist_deleter);
  char errbuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body_);

  if (timeout_seconds_ > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
  }
  if (!verify_tls_) {
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
  }

  for (const auto& pair : headers_) {
    std::string header_string = pair.first + ": " + pair.second;
    header_list.reset(curl_slist_append(header_list.release(), header_string.c_str()));
  }
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    error_message_ = std::string("libcurl error: ") + curl_easy_strerror(res) + " - " + errbuf;
    return false;
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  status_code_ = static_cast<int>(http_code);

  if (status_code_ < 200 || status_code_ >= 300) {
    error_message_ = "HTTP error: " + std::to_string(status_code_) + " for url: " + url_;
    return false;
  }
  return true;
}

int bqa_http_request::get_status_code() const { return status_code_; }
const std::string& bqa_http_request::get_response_body() const { return response_body_; }
const std::string& bqa_http_request::get_error_message() const { return error_message_; }

} // namespace bqa
