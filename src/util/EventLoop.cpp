#include "EventLoop.h"
#include "../app/Logger.h"

EventLoop::EventLoop() {}

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  running_ = true;
  thread_ = std::thread(&EventLoop::loop, this);
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();

  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.clear();
  timers_.clear();
  idleCv_.notify_all();
}

bool EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return false;
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return false;
    timers_.emplace(Clock::now() + delay, std::move(task));
  }
  cv_.notify_one();
  return true;
}

void EventLoop::waitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idleCv_.wait(lock, [this] {
    bool timerDue = !timers_.empty() && timers_.begin()->first <= Clock::now();
    return !running_ || (tasks_.empty() && !busy_ && !timerDue);
  });
}

bool EventLoop::isLoopThread() const {
  return std::this_thread::get_id() == thread_.get_id();
}

void EventLoop::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now) {
      tasks_.push_back(std::move(timers_.begin()->second));
      timers_.erase(timers_.begin());
    }

    if (tasks_.empty()) {
      idleCv_.notify_all();
      if (timers_.empty()) {
        cv_.wait(lock);
      } else {
        cv_.wait_until(lock, timers_.begin()->first);
      }
      continue;
    }

    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    busy_ = true;
    lock.unlock();

    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("Unhandled exception in event loop task: " << e.what());
    }

    lock.lock();
    busy_ = false;
  }
  idleCv_.notify_all();
}
