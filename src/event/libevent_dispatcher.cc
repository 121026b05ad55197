#define TOOLGATE_LOG_COMPONENT "event.libevent"

#include "toolgate/event/libevent_dispatcher.h"

#include <fcntl.h>
#include <stdexcept>
#include <sys/time.h>
#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#include "toolgate/logging/log_macros.h"

namespace toolgate {
namespace event {

namespace {

short toLibeventEvents(uint32_t events, FileTriggerType trigger) {
  short result = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }
#ifdef EV_ET
  if (trigger == FileTriggerType::Edge) {
    result |= EV_ET;
  }
#else
  (void)trigger;
#endif
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  if (events & EV_CLOSED) {
    result |= static_cast<uint32_t>(FileReadyType::Closed);
  }
  return result;
}

timeval toTimeval(std::chrono::milliseconds duration) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

// post() may be called from helper threads, so libevent's locking must be
// enabled once before the first event_base is created
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();
  initializeLibevent();
  updateApproximateMonotonicTime();
}

LibeventDispatcher::~LibeventDispatcher() {
  // Callbacks that never ran may own events; release them while the base
  // is still alive
  {
    std::queue<PostCb> dropped;
    {
      std::lock_guard<std::mutex> lock(post_mutex_);
      dropped.swap(post_callbacks_);
    }
  }

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  event_config* config = event_config_new();
  if (config) {
    event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  TOOLGATE_LOG(Debug, "Dispatcher '{}' using libevent backend: {}", name_,
               method ? method : "unknown");

  // Pipe for waking up the event loop from other threads
  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);
  evutil_make_socket_closeonexec(wakeup_fd_[0]);
  evutil_make_socket_closeonexec(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  // Callbacks posted from the dispatcher thread also go through the pipe so
  // they run on the next iteration instead of being stranded in the queue
  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // EAGAIN means a wakeup is already pending
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  // Not yet running: no thread owns the dispatcher
  std::thread::id owner = thread_id_.load();
  if (owner == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == owner;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), trigger,
                                         events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    post([this]() { event_base_loopbreak(base_); });
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();
  updateApproximateMonotonicTime();

  switch (type) {
    case RunType::Block:
      // event_base_loop clears a break requested by the callbacks above
      if (!exit_requested_) {
        event_base_loop(base_, 0);
      }
      break;
    case RunType::NonBlock:
      event_base_loop(base_, EVLOOP_NONBLOCK);
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        updateApproximateMonotonicTime();
        event_base_loop(base_, EVLOOP_ONCE);
        runPostCallbacks();
      }
      break;
  }

  runPostCallbacks();
}

std::chrono::steady_clock::time_point
LibeventDispatcher::approximateMonotonicTime() const {
  return approximate_monotonic_time_;
}

void LibeventDispatcher::updateApproximateMonotonicTime() {
  approximate_monotonic_time_ = std::chrono::steady_clock::now();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->updateApproximateMonotonicTime();
  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

// FileEventImpl

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)), trigger_(trigger) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::eventCallback,
                     this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    if (event_added_) {
      event_del(event_);
    }
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::activate(uint32_t events) {
  short libevent_events = 0;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    libevent_events |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    libevent_events |= EV_WRITE;
  }
  if (libevent_events != 0) {
    event_active(event_, libevent_events, 0);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (event_added_ && enabled_events_ == events) {
    return;
  }

  if (event_added_) {
    event_del(event_);
    event_added_ = false;
  }
  enabled_events_ = events;

  if (events != 0) {
    event_assign(event_, dispatcher_.base(), fd_,
                 toLibeventEvents(events, trigger_),
                 &FileEventImpl::eventCallback, this);
    event_add(event_, nullptr);
    event_added_ = true;
  }
}

void LibeventDispatcher::FileEventImpl::eventCallback(int /*fd*/,
                                                      short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);
  file_event->dispatcher_.updateApproximateMonotonicTime();

  uint32_t ready_events = fromLibeventEvents(events);
  if (ready_events != 0) {
    file_event->cb_(ready_events);
  }
}

// TimerImpl

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher_.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (enabled_) {
    event_del(event_);
    enabled_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  timeval tv = toTimeval(duration);
  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->dispatcher_.updateApproximateMonotonicTime();
  // The callback may destroy this timer; nothing below may touch it
  timer->cb_();
}

// SignalEventImpl

LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : dispatcher_(dispatcher), cb_(std::move(cb)) {
  event_ = evsignal_new(dispatcher_.base(), signal_num,
                        &SignalEventImpl::signalCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }
  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int /*fd*/,
                                                         short /*events*/,
                                                         void* arg) {
  auto* signal_event = static_cast<SignalEventImpl*>(arg);
  signal_event->dispatcher_.updateApproximateMonotonicTime();
  signal_event->cb_();
}

// LibeventDispatcherFactory

const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace toolgate
