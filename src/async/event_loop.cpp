#include "launchpad/async/event_loop.hpp"

namespace launchpad::async {

EventLoop::~EventLoop() {
  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void EventLoop::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  cv_.notify_all();
}

TimerId EventLoop::schedule(const Duration delay, std::function<void()> task) {
  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_timer_id_++;
    const auto due = Clock::now() + delay;
    timers_.emplace(TimerKey{due, id}, std::move(task));
    timer_due_[id] = due;
  }
  cv_.notify_all();
  return id;
}

bool EventLoop::cancel(const TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = timer_due_.find(id);
  if (it == timer_due_.end()) {
    return false;
  }
  timers_.erase(TimerKey{it->second, id});
  timer_due_.erase(it);
  return true;
}

void EventLoop::spawn_worker(std::function<void()> blocking, std::function<void()> on_done) {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(mutex_);
  ++active_workers_;
  workers_.push_back(Worker{
      std::thread([this, finished, blocking = std::move(blocking),
                   on_done = std::move(on_done)]() mutable {
        blocking();
        {
          std::lock_guard<std::mutex> inner(mutex_);
          tasks_.push_back(std::move(on_done));
          --active_workers_;
        }
        cv_.notify_all();
        finished->store(true);
      }),
      finished});
}

void EventLoop::reap_workers() {
  std::list<Worker> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->finished->load()) {
        auto next = std::next(it);
        done.splice(done.end(), workers_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : done) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

EventLoop::Step EventLoop::step(const std::optional<Clock::time_point> deadline) {
  std::function<void()> task;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    if (!tasks_.empty()) {
      task = std::move(tasks_.front());
      tasks_.pop_front();
    } else if (!timers_.empty() && timers_.begin()->first.first <= now) {
      auto it = timers_.begin();
      task = std::move(it->second);
      timer_due_.erase(it->first.second);
      timers_.erase(it);
    } else {
      std::optional<Clock::time_point> wake = deadline;
      if (!timers_.empty()) {
        const auto due = timers_.begin()->first.first;
        if (!wake.has_value() || due < *wake) {
          wake = due;
        }
      }
      if (wake.has_value()) {
        cv_.wait_until(lock, *wake);
        return Step::Waited;
      }
      if (active_workers_ > 0) {
        cv_.wait(lock);
        return Step::Waited;
      }
      return Step::Starved;
    }
  }

  task();
  reap_workers();
  return Step::Ran;
}

bool EventLoop::run_until(const std::function<bool()> &done, const std::optional<Duration> limit) {
  std::optional<Clock::time_point> deadline;
  if (limit.has_value()) {
    deadline = Clock::now() + *limit;
  }

  while (!done()) {
    if (deadline.has_value() && Clock::now() >= *deadline) {
      return false;
    }
    if (step(deadline) == Step::Starved) {
      return done();
    }
  }
  return true;
}

bool EventLoop::run_until_idle(const std::optional<Duration> limit) {
  return run_until([this]() { return idle(); }, limit);
}

void EventLoop::run_for(const Duration duration) {
  (void)run_until([]() { return false; }, duration);
}

std::size_t EventLoop::pending_timers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

bool EventLoop::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.empty() && timers_.empty() && active_workers_ == 0;
}

} // namespace launchpad::async
