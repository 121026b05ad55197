#ifndef TOOLGATE_TOOLS_HTTP_CLIENT_H
#define TOOLGATE_TOOLS_HTTP_CLIENT_H

#include <chrono>
#include <memory>
#include <string>

#include "toolgate/tools/rest_client.h"

namespace toolgate {
namespace tools {

/**
 * @brief libcurl implementation of RestClient
 *
 * Each request uses its own easy handle, so concurrent calls from several
 * workers are safe.
 */
class HttpClient : public RestClient {
 public:
  struct Config {
    std::chrono::seconds connection_timeout{10};
    bool verify_ssl_certificates{true};
    std::string ca_bundle_path;
    std::string user_agent{"toolgate/1.0"};
  };

  struct Stats {
    size_t total_requests;
    size_t failed_requests;
    std::chrono::milliseconds avg_latency;
  };

  HttpClient();
  explicit HttpClient(const Config& config);
  ~HttpClient() override;

  RestResponse get(const RestRequest& request) override;

  Stats stats() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_HTTP_CLIENT_H
