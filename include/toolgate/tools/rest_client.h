#ifndef TOOLGATE_TOOLS_REST_CLIENT_H
#define TOOLGATE_TOOLS_REST_CLIENT_H

#include <chrono>
#include <map>
#include <string>

namespace toolgate {
namespace tools {

struct RestRequest {
  std::string url;
  std::map<std::string, std::string> headers;
  std::chrono::seconds timeout{10};
};

struct RestResponse {
  // 0 when the request never got a response
  int status_code{0};
  std::string body;
  // Transport error text, empty on success
  std::string error;
  std::chrono::milliseconds latency{0};

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

/**
 * @brief Blocking HTTP GET. Called from worker threads only.
 */
class RestClient {
 public:
  virtual ~RestClient() = default;

  virtual RestResponse get(const RestRequest& request) = 0;
};

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_REST_CLIENT_H
