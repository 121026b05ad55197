#define TOOLGATE_LOG_COMPONENT "event.worker"

#include "toolgate/event/worker.h"

#include <pthread.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace event {

Worker::Worker(DispatcherFactory& factory, const std::string& name)
    : name_(name), dispatcher_(factory.createDispatcher(name)) {}

Worker::~Worker() { stop(); }

void Worker::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::make_unique<std::thread>([this]() { threadRoutine(); });
}

void Worker::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Exit from inside the loop so a stop issued before run() starts is not
  // lost
  Dispatcher* dispatcher = dispatcher_.get();
  dispatcher_->post([dispatcher]() { dispatcher->exit(); });

  if (thread_ && thread_->joinable()) {
    thread_->join();
  }
  thread_.reset();
}

void Worker::threadRoutine() {
#ifdef __linux__
  // Linux limits thread names to 15 characters
  pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
#endif

  TOOLGATE_LOG(Debug, "Worker {} started", name_);
  dispatcher_->run(RunType::RunUntilExit);
  TOOLGATE_LOG(Debug, "Worker {} stopped", name_);
}

WorkerPool::WorkerPool(DispatcherFactory& factory,
                       size_t size,
                       const std::string& name_prefix) {
  if (size == 0) {
    size = 1;
  }
  workers_.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    workers_.emplace_back(
        new Worker(factory, name_prefix + "_" + std::to_string(i)));
  }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  for (auto& worker : workers_) {
    worker->start();
  }
}

void WorkerPool::stop() {
  for (auto& worker : workers_) {
    worker->stop();
  }
}

void WorkerPool::post(PostCb callback) {
  size_t index = next_.fetch_add(1) % workers_.size();
  workers_[index]->post(std::move(callback));
}

}  // namespace event
}  // namespace toolgate
