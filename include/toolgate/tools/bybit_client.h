#ifndef TOOLGATE_TOOLS_BYBIT_CLIENT_H
#define TOOLGATE_TOOLS_BYBIT_CLIENT_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "toolgate/core/result.h"
#include "toolgate/json/envelope.h"
#include "toolgate/tools/request_signer.h"
#include "toolgate/tools/rest_client.h"

namespace toolgate {
namespace tools {

constexpr const char* kBybitMainnetUrl = "https://api.bybit.com";
constexpr const char* kBybitTestnetUrl = "https://api-testnet.bybit.com";

// Ordered key/value pairs; order is part of the signature
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// key=value&... with RFC 3986 percent-encoding
std::string buildQueryString(const QueryParams& params);

std::string percentEncode(const std::string& value);

/**
 * @brief Bybit v5 REST access
 *
 * Blocking; call from a worker thread. A call fails when the transport
 * fails, the HTTP status is not 2xx, or retCode is non-zero. On success the
 * "result" member of the response is returned.
 */
class BybitClient {
 public:
  struct Config {
    std::string api_key;
    std::string api_secret;
    bool testnet{false};
    int64_t recv_window_ms{5000};
    std::chrono::seconds timeout{10};
  };

  // Milliseconds since the epoch
  using TimeSource = std::function<int64_t()>;

  BybitClient(std::shared_ptr<RestClient> rest, const Config& config);
  BybitClient(std::shared_ptr<RestClient> rest,
              const Config& config,
              TimeSource time_source);

  Result<json::JsonValue> get(const std::string& path,
                              const QueryParams& params,
                              bool authenticated);

  bool hasCredentials() const {
    return !config_.api_key.empty() && !config_.api_secret.empty();
  }
  const std::string& baseUrl() const { return base_url_; }

 private:
  std::shared_ptr<RestClient> rest_;
  Config config_;
  TimeSource time_source_;
  std::string base_url_;
  RequestSigner signer_;
};

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_BYBIT_CLIENT_H
