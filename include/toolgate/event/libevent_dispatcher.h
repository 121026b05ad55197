#ifndef TOOLGATE_EVENT_LIBEVENT_DISPATCHER_H
#define TOOLGATE_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "toolgate/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace toolgate {
namespace event {

// Rename to avoid conflict with struct event
using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               FileTriggerType trigger,
                               uint32_t events) override;

  TimerPtr createTimer(TimerCb cb) override;

  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void exit() override;

  void run(RunType type) override;

  std::chrono::steady_clock::time_point approximateMonotonicTime()
      const override;
  void updateApproximateMonotonicTime() override;

  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  FileTriggerType trigger,
                  uint32_t events);
    ~FileEventImpl() override;

    void activate(uint32_t events) override;
    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    FileTriggerType trigger_;
    libevent_event* event_{nullptr};
    uint32_t enabled_events_{0};
    bool event_added_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    TimerCb cb_;
    libevent_event* event_;
    bool enabled_{false};
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher,
                    int signal_num,
                    SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    SignalCb cb_;
    libevent_event* event_;
  };

  void initializeLibevent();
  void runPostCallbacks();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};
  libevent_event* wakeup_event_{nullptr};

  std::chrono::steady_clock::time_point approximate_monotonic_time_;
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace toolgate

#endif  // TOOLGATE_EVENT_LIBEVENT_DISPATCHER_H
