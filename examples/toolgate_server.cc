/**
 * toolgate server
 *
 * Serves the Bybit market tools over HTTP:
 * - GET  /sse             Server-Sent Events stream
 * - POST /mcp, /message   JSON-RPC 2.0 requests
 * - GET  /mcp/tools       Tool catalog
 * - POST /mcp/tools/call  Direct tool invocation
 * - GET  /                Health check
 *
 * Usage:
 *   ./toolgate_server --port 3000
 *   BYBIT_API_KEY=... BYBIT_API_SECRET=... ./toolgate_server --config cfg.yaml
 */

#define TOOLGATE_LOG_COMPONENT "server.main"

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "toolgate/config/gateway_config.h"
#include "toolgate/event/event_loop.h"
#include "toolgate/event/worker.h"
#include "toolgate/gateway/gateway.h"
#include "toolgate/gateway/tool_registry.h"
#include "toolgate/logging/log_macros.h"
#include "toolgate/server/http_server.h"
#include "toolgate/tools/bybit_client.h"
#include "toolgate/tools/http_client.h"
#include "toolgate/tools/market_tools.h"
#include "toolgate/tools/tool_executor.h"

using namespace toolgate;

namespace {

// Command-line options
struct ServerOptions {
  std::string config_path;
  int port = 0;  // 0 keeps the configured port
  std::string host;
  int workers = 4;
  bool verbose = false;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options]\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>      Configuration file (YAML or JSON)\n";
  std::cerr << "  --port <port>        Listen port (default: 3000)\n";
  std::cerr << "  --host <address>     Bind address (default: 0.0.0.0)\n";
  std::cerr << "  --workers <n>        Threads for exchange requests "
               "(default: 4)\n";
  std::cerr << "  --verbose            Enable debug logging\n";
  std::cerr << "  --help               Show this help message\n";
  std::cerr << "\nENVIRONMENT:\n";
  std::cerr << "  BYBIT_API_KEY, BYBIT_API_SECRET, BYBIT_USE_TESTNET=true,\n";
  std::cerr << "  DEBUG=true, TOOLGATE_PORT, TOOLGATE_CONFIG\n";
}

int parsePositive(const std::string& option, const char* value, int max) {
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0' || parsed < 1 || parsed > max) {
    std::cerr << "[ERROR] Invalid value for " << option << ": " << value
              << std::endl;
    exit(1);
  }
  return static_cast<int>(parsed);
}

ServerOptions parseArguments(int argc, char* argv[]) {
  ServerOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      exit(0);
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      options.port = parsePositive(arg, argv[++i], 65535);
    } else if (arg == "--host" && i + 1 < argc) {
      options.host = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      options.workers = parsePositive(arg, argv[++i], 64);
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      printUsage(argv[0]);
      exit(1);
    }
  }

  return options;
}

}  // namespace

int main(int argc, char* argv[]) {
  ServerOptions options = parseArguments(argc, argv);

  config::GatewayConfig config;
  try {
    config = config::loadGatewayConfig(options.config_path);
    if (options.port != 0) {
      config.server.port = static_cast<uint16_t>(options.port);
    }
    if (!options.host.empty()) {
      config.server.host = options.host;
    }
    if (options.verbose) {
      config.logging.level = "debug";
    }
    config::applyLogging(config.logging);
  } catch (const config::ConfigParseError& e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  auto factory = event::createLibeventDispatcherFactory();
  auto dispatcher = factory->createDispatcher("main");

  event::WorkerPool workers(*factory, static_cast<size_t>(options.workers),
                            "tool");
  workers.start();

  auto rest = std::make_shared<tools::HttpClient>();
  auto bybit = std::make_shared<tools::BybitClient>(rest, config.bybitConfig());
  auto executor =
      std::make_shared<tools::WorkerToolExecutor>(workers, *dispatcher);

  gateway::ToolRegistry::Builder builder;
  tools::registerMarketTools(builder, bybit, executor);

  int exit_code = 0;
  {
    gateway::Gateway gateway(*dispatcher, builder.build(),
                             config.gatewayOptions());
    server::HttpServer server(*dispatcher, gateway, config.serverConfig());

    auto started = server.start();
    if (isError(started)) {
      TOOLGATE_LOG(Critical, "Failed to start server: {}",
                   getError(started).message);
      exit_code = 1;
    } else {
      TOOLGATE_LOG(Info, "Listening on {}:{} ({} network)",
                   config.server.host, server.port(),
                   bybit->hasCredentials() ? "authenticated" : "public");
      TOOLGATE_LOG(Info, "Exchange endpoint {}", bybit->baseUrl());

      auto shutdown = [&](const char* signal_name) {
        TOOLGATE_LOG(Info, "Received {}, shutting down", signal_name);
        gateway.shutdown();
        server.stop();
        dispatcher->exit();
      };
      auto sigint = dispatcher->listenForSignal(
          SIGINT, [&shutdown]() { shutdown("SIGINT"); });
      auto sigterm = dispatcher->listenForSignal(
          SIGTERM, [&shutdown]() { shutdown("SIGTERM"); });
      signal(SIGPIPE, SIG_IGN);

      dispatcher->run(event::RunType::RunUntilExit);
    }
  }

  workers.stop();
  TOOLGATE_LOG(Info, "Server stopped");
  return exit_code;
}
