#ifndef TOOLGATE_CONFIG_GATEWAY_CONFIG_H
#define TOOLGATE_CONFIG_GATEWAY_CONFIG_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "toolgate/config/parse_error.h"
#include "toolgate/core/compat.h"
#include "toolgate/gateway/gateway.h"
#include "toolgate/server/http_server.h"
#include "toolgate/tools/bybit_client.h"

namespace toolgate {
namespace config {

struct ServerSection {
  std::string host{"0.0.0.0"};
  uint16_t port{3000};
  size_t max_body_bytes{1024 * 1024};
};

struct GatewaySection {
  std::chrono::milliseconds heartbeat_interval{30000};
  size_t max_pending_messages{0};
  std::chrono::milliseconds pending_ttl{0};
};

struct LoggingSection {
  std::string level{"info"};
  // "text" or "json"
  std::string format{"text"};
  // Empty logs to stderr
  std::string file;
};

struct BybitSection {
  std::string api_key;
  std::string api_secret;
  bool testnet{false};
  int64_t recv_window_ms{5000};
  std::chrono::seconds timeout{10};
};

struct GatewayConfig {
  ServerSection server;
  GatewaySection gateway;
  LoggingSection logging;
  BybitSection bybit;

  // File the values came from; empty when defaults were used
  std::string source;

  gateway::Gateway::Options gatewayOptions() const;
  server::HttpServer::Config serverConfig() const;
  tools::BybitClient::Config bybitConfig() const;
};

// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<optional<std::string>(const std::string&)>;

optional<std::string> processEnvironment(const std::string& name);

/**
 * Candidate files in search order: $TOOLGATE_CONFIG, ./config/config.yaml,
 * ./config.yaml, /etc/toolgate/config.yaml.
 */
std::vector<std::string> configSearchPaths(
    const EnvLookup& env = processEnvironment);

/**
 * Parse YAML (or JSON) text. Missing keys keep their defaults.
 * @throws ConfigParseError on syntax errors and invalid values
 */
GatewayConfig parseGatewayConfig(const std::string& content,
                                 const std::string& file = "");

/**
 * Load a configuration file. With an empty path the search paths are tried
 * in order and the defaults are returned when none exists. An explicit
 * path that cannot be read is an error.
 */
GatewayConfig loadGatewayConfig(const std::string& path = "",
                                const EnvLookup& env = processEnvironment);

/**
 * BYBIT_API_KEY, BYBIT_API_SECRET, BYBIT_USE_TESTNET, DEBUG and
 * TOOLGATE_PORT take precedence over file values.
 */
void applyEnvironmentOverrides(GatewayConfig& config,
                               const EnvLookup& env = processEnvironment);

// Throws ConfigParseError naming the first invalid field
void validateGatewayConfig(const GatewayConfig& config);

// Configures the global logger registry from the logging section
void applyLogging(const LoggingSection& logging);

}  // namespace config
}  // namespace toolgate

#endif  // TOOLGATE_CONFIG_GATEWAY_CONFIG_H
