#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace launchpad::async {

using Clock = std::chrono::steady_clock;
using Duration = std::chrono::milliseconds;
using TimerId = std::uint64_t;

/// Single-threaded cooperative executor.
///
/// Tasks and timers always run on the thread that drives the loop (the one calling one of the
/// run_* methods). post() and spawn_worker() may be called from any thread; everything else is
/// loop-thread only. Blocking work is pushed to a worker thread whose completion is posted back,
/// so state owned by loop-side objects is never touched concurrently.
class EventLoop {
public:
  EventLoop() = default;
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void post(std::function<void()> task);

  /// Run `task` once after `delay`. Returns a handle usable with cancel().
  TimerId schedule(Duration delay, std::function<void()> task);

  /// Returns false when the timer already fired or was never scheduled.
  bool cancel(TimerId id);

  /// Run `blocking` on a worker thread, then run `on_done` on the loop thread.
  void spawn_worker(std::function<void()> blocking, std::function<void()> on_done);

  /// Drive the loop until `done` returns true. Gives up once `limit` elapses or when nothing
  /// is left that could ever make progress.
  bool run_until(const std::function<bool()> &done, std::optional<Duration> limit = std::nullopt);

  bool run_until_idle(std::optional<Duration> limit = std::nullopt);

  void run_for(Duration duration);

  [[nodiscard]] std::size_t pending_timers() const;
  [[nodiscard]] bool idle() const;

private:
  enum class Step { Ran, Waited, Starved };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  using TimerKey = std::pair<Clock::time_point, TimerId>;

  Step step(std::optional<Clock::time_point> deadline);
  void reap_workers();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::map<TimerKey, std::function<void()>> timers_;
  std::unordered_map<TimerId, Clock::time_point> timer_due_;
  TimerId next_timer_id_ = 1;
  std::size_t active_workers_ = 0;
  std::list<Worker> workers_;
};

} // namespace launchpad::async
