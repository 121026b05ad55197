#define TOOLGATE_LOG_COMPONENT "tools.http"

#include "toolgate/tools/http_client.h"

#include <atomic>
#include <mutex>

#include <curl/curl.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace tools {

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

std::once_flag curl_init_once;

}  // namespace

class HttpClient::Impl {
 public:
  explicit Impl(const Config& config) : config_(config) {
    // curl_global_init is not thread-safe; run it once per process
    std::call_once(curl_init_once, []() { curl_global_init(CURL_GLOBAL_ALL); });
  }

  RestResponse get(const RestRequest& request) {
    auto start = std::chrono::steady_clock::now();
    RestResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
      response.error = "Failed to initialize curl";
      ++failed_requests_;
      return response;
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
      std::string line = header.first + ": " + header.second;
      headers = curl_slist_append(headers, line.c_str());
    }
    if (headers) {
      curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER,
                     config_.verify_ssl_certificates ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST,
                     config_.verify_ssl_certificates ? 2L : 0L);
    if (!config_.ca_bundle_path.empty()) {
      curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config_.connection_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                     static_cast<long>(request.timeout.count()));
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(body);

    if (res != CURLE_OK) {
      response.error = curl_easy_strerror(res);
      ++failed_requests_;
      TOOLGATE_LOG(Warning, "GET {} failed: {}", request.url, response.error);
    }

    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    ++total_requests_;
    total_latency_ms_ += response.latency.count();

    TOOLGATE_LOG(Debug, "GET {} -> {} in {}ms", request.url,
                 response.status_code, response.latency.count());

    if (headers) {
      curl_slist_free_all(headers);
    }
    curl_easy_cleanup(curl);
    return response;
  }

  Stats stats() const {
    Stats stats;
    stats.total_requests = total_requests_;
    stats.failed_requests = failed_requests_;
    stats.avg_latency =
        total_requests_ > 0
            ? std::chrono::milliseconds(total_latency_ms_ / total_requests_)
            : std::chrono::milliseconds(0);
    return stats;
  }

 private:
  Config config_;
  std::atomic<size_t> total_requests_{0};
  std::atomic<size_t> failed_requests_{0};
  std::atomic<long long> total_latency_ms_{0};
};

HttpClient::HttpClient() : HttpClient(Config()) {}

HttpClient::HttpClient(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

RestResponse HttpClient::get(const RestRequest& request) {
  return impl_->get(request);
}

HttpClient::Stats HttpClient::stats() const { return impl_->stats(); }

}  // namespace tools
}  // namespace toolgate
