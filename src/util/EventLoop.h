#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// Single worker thread that runs posted tasks in order. Threads that do not
// own scheduler state (SIP callbacks, media threads) hand work over with
// post() instead of touching that state directly.
class EventLoop {
public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  EventLoop();
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void start();
  void stop(); // pending tasks are discarded

  bool post(Task task);
  bool postDelayed(std::chrono::milliseconds delay, Task task);

  // Blocks until every task posted so far (delayed ones that are due
  // included) has run. Must not be called from the loop thread.
  void waitIdle();

  bool isLoopThread() const;

private:
  void loop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idleCv_;
  std::deque<Task> tasks_;
  std::multimap<Clock::time_point, Task> timers_;
  bool running_ = false;
  bool busy_ = false;
  std::thread thread_;
};
