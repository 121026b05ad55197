#define TOOLGATE_LOG_COMPONENT "config.file"

// Configuration search order:
// 1. --config CLI argument (passed as the explicit path)
// 2. TOOLGATE_CONFIG environment variable
// 3. Local directory: ./config/config.yaml, ./config.yaml
// 4. System directory: /etc/toolgate/config.yaml
//
// Environment variables are applied after the file and win over it.

#include "toolgate/config/gateway_config.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "toolgate/logging/log_macros.h"
#include "toolgate/logging/log_sink.h"
#include "toolgate/logging/logger_registry.h"

namespace toolgate {
namespace config {

namespace {

bool fileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

class SectionReader {
 public:
  SectionReader(const YAML::Node& root,
                const std::string& section,
                const std::string& file)
      : section_name_(section), file_(file) {
    if (root && root.IsMap()) {
      node_ = root[section];
    }
    if (node_ && !node_.IsNull() && !node_.IsMap()) {
      throw ConfigParseError("Section must be a mapping", section_name_, file_,
                             node_.Mark().line + 1);
    }
  }

  template <typename T>
  bool read(const std::string& key, T& out) const {
    if (!node_ || !node_.IsMap()) {
      return false;
    }
    const YAML::Node value = node_[key];
    if (!value || value.IsNull()) {
      return false;
    }
    if (!value.IsScalar()) {
      throw ConfigParseError("Expected a scalar value", field(key), file_,
                             value.Mark().line + 1);
    }
    try {
      out = value.as<T>();
    } catch (const YAML::Exception&) {
      throw ConfigParseError("Invalid value '" + value.Scalar() + "'",
                             field(key), file_, value.Mark().line + 1);
    }
    return true;
  }

  std::string field(const std::string& key) const {
    return section_name_ + "." + key;
  }

 private:
  YAML::Node node_;
  std::string section_name_;
  std::string file_;
};

int64_t parsePort(const std::string& text, const std::string& field) {
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || errno != 0 || end == nullptr || *end != '\0') {
    throw ConfigParseError("Invalid port '" + text + "'", field);
  }
  return value;
}

std::string readFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigParseError("Failed to open file", "", path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

gateway::Gateway::Options GatewayConfig::gatewayOptions() const {
  gateway::Gateway::Options options;
  options.heartbeat_interval = gateway.heartbeat_interval;
  options.broadcaster.max_pending_messages = gateway.max_pending_messages;
  options.broadcaster.pending_ttl = gateway.pending_ttl;
  return options;
}

server::HttpServer::Config GatewayConfig::serverConfig() const {
  server::HttpServer::Config config;
  config.host = server.host;
  config.port = server.port;
  config.max_body_bytes = server.max_body_bytes;
  return config;
}

tools::BybitClient::Config GatewayConfig::bybitConfig() const {
  tools::BybitClient::Config config;
  config.api_key = bybit.api_key;
  config.api_secret = bybit.api_secret;
  config.testnet = bybit.testnet;
  config.recv_window_ms = bybit.recv_window_ms;
  config.timeout = bybit.timeout;
  return config;
}

optional<std::string> processEnvironment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return nullopt;
  }
  return std::string(value);
}

std::vector<std::string> configSearchPaths(const EnvLookup& env) {
  std::vector<std::string> paths;
  auto from_env = env("TOOLGATE_CONFIG");
  if (from_env && !from_env->empty()) {
    paths.push_back(*from_env);
  }
  paths.push_back("./config/config.yaml");
  paths.push_back("./config.yaml");
  paths.push_back("/etc/toolgate/config.yaml");
  return paths;
}

GatewayConfig parseGatewayConfig(const std::string& content,
                                 const std::string& file) {
  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    throw ConfigParseError("YAML syntax error: " + e.msg, "", file,
                           e.mark.line + 1);
  }

  if (root && !root.IsNull() && !root.IsMap()) {
    throw ConfigParseError("Top level must be a mapping", "", file);
  }

  GatewayConfig config;
  config.source = file;

  SectionReader server_section(root, "server", file);
  server_section.read("host", config.server.host);
  int64_t port = 0;
  if (server_section.read("port", port)) {
    if (port < 1 || port > 65535) {
      throw ConfigParseError("Port must be between 1 and 65535",
                             server_section.field("port"), file);
    }
    config.server.port = static_cast<uint16_t>(port);
  }
  int64_t max_body = 0;
  if (server_section.read("max_body_bytes", max_body)) {
    if (max_body <= 0) {
      throw ConfigParseError("Must be positive",
                             server_section.field("max_body_bytes"), file);
    }
    config.server.max_body_bytes = static_cast<size_t>(max_body);
  }

  SectionReader gateway_section(root, "gateway", file);
  int64_t heartbeat_ms = 0;
  if (gateway_section.read("heartbeat_interval_ms", heartbeat_ms)) {
    config.gateway.heartbeat_interval = std::chrono::milliseconds(heartbeat_ms);
  }
  int64_t max_pending = 0;
  if (gateway_section.read("max_pending_messages", max_pending)) {
    if (max_pending < 0) {
      throw ConfigParseError(
          "Must not be negative",
          gateway_section.field("max_pending_messages"), file);
    }
    config.gateway.max_pending_messages = static_cast<size_t>(max_pending);
  }
  int64_t ttl_ms = 0;
  if (gateway_section.read("pending_ttl_ms", ttl_ms)) {
    config.gateway.pending_ttl = std::chrono::milliseconds(ttl_ms);
  }

  SectionReader logging_section(root, "logging", file);
  logging_section.read("level", config.logging.level);
  logging_section.read("format", config.logging.format);
  logging_section.read("file", config.logging.file);

  SectionReader bybit_section(root, "bybit", file);
  bybit_section.read("api_key", config.bybit.api_key);
  bybit_section.read("api_secret", config.bybit.api_secret);
  bybit_section.read("testnet", config.bybit.testnet);
  bybit_section.read("recv_window_ms", config.bybit.recv_window_ms);
  int64_t timeout_s = 0;
  if (bybit_section.read("timeout_s", timeout_s)) {
    config.bybit.timeout = std::chrono::seconds(timeout_s);
  }

  return config;
}

void applyEnvironmentOverrides(GatewayConfig& config, const EnvLookup& env) {
  if (auto key = env("BYBIT_API_KEY")) {
    config.bybit.api_key = *key;
  }
  if (auto secret = env("BYBIT_API_SECRET")) {
    config.bybit.api_secret = *secret;
  }
  if (auto testnet = env("BYBIT_USE_TESTNET")) {
    config.bybit.testnet = (*testnet == "true");
  }
  auto debug = env("DEBUG");
  if (debug && *debug == "true") {
    config.logging.level = "debug";
  }
  if (auto port = env("TOOLGATE_PORT")) {
    int64_t value = parsePort(*port, "TOOLGATE_PORT");
    if (value < 1 || value > 65535) {
      throw ConfigParseError("Port must be between 1 and 65535",
                             "TOOLGATE_PORT");
    }
    config.server.port = static_cast<uint16_t>(value);
  }
}

void validateGatewayConfig(const GatewayConfig& config) {
  const std::string& file = config.source;

  if (config.server.host.empty()) {
    throw ConfigParseError("Host must not be empty", "server.host", file);
  }
  if (config.server.port == 0) {
    throw ConfigParseError("Port must be between 1 and 65535", "server.port",
                           file);
  }
  if (config.gateway.heartbeat_interval.count() <= 0) {
    throw ConfigParseError("Heartbeat interval must be positive",
                           "gateway.heartbeat_interval_ms", file);
  }
  if (config.gateway.pending_ttl.count() < 0) {
    throw ConfigParseError("Must not be negative", "gateway.pending_ttl_ms",
                           file);
  }
  if (!logging::isKnownLogLevel(config.logging.level)) {
    throw ConfigParseError("Unknown log level '" + config.logging.level + "'",
                           "logging.level", file);
  }
  if (config.logging.format != "text" && config.logging.format != "json") {
    throw ConfigParseError(
        "Unknown log format '" + config.logging.format + "'; use text or json",
        "logging.format", file);
  }
  if (config.bybit.recv_window_ms <= 0) {
    throw ConfigParseError("Must be positive", "bybit.recv_window_ms", file);
  }
  if (config.bybit.timeout.count() <= 0) {
    throw ConfigParseError("Must be positive", "bybit.timeout_s", file);
  }
}

GatewayConfig loadGatewayConfig(const std::string& path, const EnvLookup& env) {
  GatewayConfig config;

  if (!path.empty()) {
    config = parseGatewayConfig(readFile(path), path);
  } else {
    for (const auto& candidate : configSearchPaths(env)) {
      if (fileExists(candidate)) {
        config = parseGatewayConfig(readFile(candidate), candidate);
        break;
      }
      TOOLGATE_LOG(Debug, "No configuration at {}", candidate);
    }
  }

  applyEnvironmentOverrides(config, env);
  validateGatewayConfig(config);

  if (config.source.empty()) {
    TOOLGATE_LOG(Info, "No configuration file found, using defaults");
  } else {
    TOOLGATE_LOG(Info, "Loaded configuration from {}", config.source);
  }
  return config;
}

void applyLogging(const LoggingSection& logging) {
  auto formatter = logging::createFormatter(logging.format);
  if (!formatter) {
    throw ConfigParseError("Unknown log format '" + logging.format + "'",
                           "logging.format");
  }

  std::unique_ptr<logging::LogSink> sink;
  if (logging.file.empty()) {
    sink = logging::SinkFactory::createStdioSink(true);
  } else {
    logging::RotatingFileSink::Config file_config;
    file_config.base_filename = logging.file;
    auto file_sink = std::make_unique<logging::RotatingFileSink>(file_config);
    if (!file_sink->isOpen()) {
      throw ConfigParseError("Cannot open log file '" + logging.file + "'",
                             "logging.file");
    }
    sink = std::move(file_sink);
  }
  sink->setFormatter(std::move(formatter));

  auto& registry = logging::LoggerRegistry::instance();
  registry.setDefaultSink(std::shared_ptr<logging::LogSink>(std::move(sink)));
  registry.setGlobalLevel(logging::stringToLogLevel(logging.level));
}

}  // namespace config
}  // namespace toolgate
