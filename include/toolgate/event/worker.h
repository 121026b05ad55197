#ifndef TOOLGATE_EVENT_WORKER_H
#define TOOLGATE_EVENT_WORKER_H

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "toolgate/event/event_loop.h"

namespace toolgate {
namespace event {

/**
 * @brief A thread running its own dispatcher
 *
 * Work handed to post() runs on the worker thread. Used for blocking calls
 * that must stay off the main dispatcher.
 */
class Worker {
 public:
  Worker(DispatcherFactory& factory, const std::string& name);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start();

  // Finish the callback in progress, then join. Queued work is dropped.
  void stop();

  void post(PostCb callback) { dispatcher_->post(std::move(callback)); }

  Dispatcher& dispatcher() { return *dispatcher_; }
  const std::string& name() const { return name_; }
  bool running() const { return running_; }

 private:
  void threadRoutine();

  std::string name_;
  DispatcherPtr dispatcher_;
  std::atomic<bool> running_{false};
  std::unique_ptr<std::thread> thread_;
};

/**
 * @brief Fixed set of workers fed round-robin
 */
class WorkerPool {
 public:
  WorkerPool(DispatcherFactory& factory,
             size_t size,
             const std::string& name_prefix = "worker");
  ~WorkerPool();

  void start();
  void stop();

  // Thread-safe
  void post(PostCb callback);

  size_t size() const { return workers_.size(); }

 private:
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<size_t> next_{0};
};

}  // namespace event
}  // namespace toolgate

#endif  // TOOLGATE_EVENT_WORKER_H
