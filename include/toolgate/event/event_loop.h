#ifndef TOOLGATE_EVENT_EVENT_LOOP_H
#define TOOLGATE_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace toolgate {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// File event types (matches epoll/kqueue semantics)
enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04,
  Error = 0x08
};

inline FileReadyType operator|(FileReadyType a, FileReadyType b) {
  return static_cast<FileReadyType>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class FileTriggerType {
  // Fires continuously while the condition holds
  Level,
  // Fires only on state transitions (EV_ET on epoll)
  Edge
};

enum class RunType {
  Block,        // Run until exit() is called or no events remain
  NonBlock,     // Run one non-blocking iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Watches a file descriptor for read/write readiness
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Activate the file event explicitly as if the given events were ready.
   */
  virtual void activate(uint32_t events) = 0;

  /**
   * Replace the set of event types being monitored. Zero disables the event.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * @brief One-shot timer. Re-arm from the callback for periodic behavior.
 */
class Timer {
 public:
  virtual ~Timer() = default;

  /**
   * Disable the timer. No-op if already disabled.
   */
  virtual void disableTimer() = 0;

  /**
   * Enable the timer to fire once after the given duration. Re-enabling an
   * armed timer restarts it.
   */
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;

  virtual bool enabled() = 0;
};

class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * @brief Main event dispatcher interface
 *
 * - Single-threaded event loop per dispatcher
 * - Thread-safe posting from other threads
 * - Integrated file events, timers, and signals
 *
 * Objects created by a dispatcher must be destroyed before it.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  /**
   * Listen for a signal. Only one dispatcher per process should listen for
   * signals.
   */
  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  /**
   * Exit the event loop. Thread-safe.
   */
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;

  /**
   * Return approximate monotonic time without a system call. Refreshed
   * before every callback.
   */
  virtual std::chrono::steady_clock::time_point approximateMonotonicTime()
      const = 0;

  virtual void updateApproximateMonotonicTime() = 0;
};

/**
 * @brief Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

/**
 * @brief Create a libevent-based dispatcher factory
 */
DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace toolgate

#endif  // TOOLGATE_EVENT_EVENT_LOOP_H
