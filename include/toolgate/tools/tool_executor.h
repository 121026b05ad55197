#ifndef TOOLGATE_TOOLS_TOOL_EXECUTOR_H
#define TOOLGATE_TOOLS_TOOL_EXECUTOR_H

#include <functional>

#include "toolgate/event/event_loop.h"
#include "toolgate/event/worker.h"
#include "toolgate/gateway/tool_registry.h"

namespace toolgate {
namespace tools {

using ToolWork = std::function<gateway::ToolResult()>;

/**
 * @brief Decides where blocking tool work runs
 *
 * done() is always invoked on the thread that owns the gateway.
 */
class ToolExecutor {
 public:
  virtual ~ToolExecutor() = default;

  virtual void run(ToolWork work, gateway::ToolCallback done) = 0;
};

// Runs the work on the calling thread
class InlineToolExecutor : public ToolExecutor {
 public:
  void run(ToolWork work, gateway::ToolCallback done) override;
};

/**
 * Runs the work on a worker pool and posts the result back to the main
 * dispatcher.
 */
class WorkerToolExecutor : public ToolExecutor {
 public:
  WorkerToolExecutor(event::WorkerPool& workers, event::Dispatcher& main)
      : workers_(workers), main_(main) {}

  void run(ToolWork work, gateway::ToolCallback done) override;

 private:
  event::WorkerPool& workers_;
  event::Dispatcher& main_;
};

// Exceptions from the work become tool errors
gateway::ToolResult runGuarded(const ToolWork& work);

}  // namespace tools
}  // namespace toolgate

#endif  // TOOLGATE_TOOLS_TOOL_EXECUTOR_H
