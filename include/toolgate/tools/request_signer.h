#ifndef TOOLGATE_TOOLS_REQUEST_SIGNER_H
#define TOOLGATE_TOOLS_REQUEST_SIGNER_H

#include <cstdint>
#include <map>
#include <string>

namespace toolgate {
namespace tools {

// Lowercase hex HMAC-SHA256 of data under key
std::string hmacSha256Hex(const std::string& key, const std::string& data);

/**
 * @brief Produces the authentication headers for private exchange calls
 *
 * signature = hex(HMAC-SHA256(secret, timestamp + api_key + recv_window +
 *                             query_string))
 */
class RequestSigner {
 public:
  RequestSigner(std::string api_key, std::string api_secret,
                int64_t recv_window_ms = 5000);

  std::map<std::string, std::string> sign(int64_t timestamp_ms,
                                          const std::string& query) const;

  std::string signature(int64_t timestamp_ms, const std::string& query) const;

 private:
  std::string api_key_;
  std::string api_secret_;
  int64_t recv_window_ms_;
};

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_REQUEST_SIGNER_H
