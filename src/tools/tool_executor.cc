#define TOOLGATE_LOG_COMPONENT "tools.executor"

#include "toolgate/tools/tool_executor.h"

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace tools {

gateway::ToolResult runGuarded(const ToolWork& work) {
  try {
    return work();
  } catch (const std::exception& e) {
    TOOLGATE_LOG(Error, "Tool work threw: {}", e.what());
    return makeError<json::JsonValue>(jsonrpc::TOOL_ERROR, e.what());
  }
}

void InlineToolExecutor::run(ToolWork work, gateway::ToolCallback done) {
  done(runGuarded(work));
}

void WorkerToolExecutor::run(ToolWork work, gateway::ToolCallback done) {
  event::Dispatcher* main = &main_;
  workers_.post([work, done, main]() {
    auto result = runGuarded(work);
    main->post([done, result]() { done(result); });
  });
}

}  // namespace tools
}  // namespace toolgate
