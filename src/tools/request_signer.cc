#include "toolgate/tools/request_signer.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

#include <fmt/format.h>

namespace toolgate {
namespace tools {

std::string hmacSha256Hex(const std::string& key, const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(),
            digest, &digest_len)) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex += fmt::format("{:02x}", static_cast<unsigned>(digest[i]));
  }
  return hex;
}

RequestSigner::RequestSigner(std::string api_key, std::string api_secret,
                             int64_t recv_window_ms)
    : api_key_(std::move(api_key)),
      api_secret_(std::move(api_secret)),
      recv_window_ms_(recv_window_ms) {}

std::string RequestSigner::signature(int64_t timestamp_ms,
                                     const std::string& query) const {
  std::string payload =
      fmt::format("{}{}{}{}", timestamp_ms, api_key_, recv_window_ms_, query);
  return hmacSha256Hex(api_secret_, payload);
}

std::map<std::string, std::string> RequestSigner::sign(
    int64_t timestamp_ms, const std::string& query) const {
  std::map<std::string, std::string> headers;
  headers["X-BAPI-API-KEY"] = api_key_;
  headers["X-BAPI-TIMESTAMP"] = std::to_string(timestamp_ms);
  headers["X-BAPI-RECV-WINDOW"] = std::to_string(recv_window_ms_);
  headers["X-BAPI-SIGN"] = signature(timestamp_ms, query);
  return headers;
}

}  // namespace tools
}  // namespace toolgate
