#pragma once

#include "launchpad/async/event_loop.hpp"
#include "launchpad/common/result.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace launchpad::async {

constexpr const char *TIMEOUT_ERROR = "operation timed out";

[[nodiscard]] inline bool is_timeout(const std::string &error) { return error == TIMEOUT_ERROR; }

namespace detail {

template <typename T> struct SharedState {
  std::optional<common::Result<T>> result;
  std::vector<std::function<void(const common::Result<T> &)>> callbacks;
};

} // namespace detail

template <typename T> class Future;

/// Write side of a Future. Settles at most once; later attempts are ignored and reported
/// through the return value. Loop-thread only.
template <typename T> class Promise {
public:
  Promise() : state_(std::make_shared<detail::SharedState<T>>()) {}

  [[nodiscard]] Future<T> future() const { return Future<T>(state_); }

  bool resolve(T value) { return settle(common::Result<T>::success(std::move(value))); }
  bool reject(std::string error) { return settle(common::Result<T>::failure(std::move(error))); }

  bool settle(common::Result<T> result) {
    if (state_->result.has_value()) {
      return false;
    }
    state_->result.emplace(std::move(result));
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto &callback : callbacks) {
      callback(*state_->result);
    }
    return true;
  }

  [[nodiscard]] bool is_settled() const { return state_->result.has_value(); }

private:
  std::shared_ptr<detail::SharedState<T>> state_;
};

/// Read side of an asynchronous result. Callbacks registered on a settled future run
/// immediately; otherwise they run, in registration order, when the promise settles.
template <typename T> class Future {
public:
  using Callback = std::function<void(const common::Result<T> &)>;

  Future() = default;

  [[nodiscard]] static Future ready(T value) {
    Promise<T> promise;
    promise.resolve(std::move(value));
    return promise.future();
  }

  [[nodiscard]] static Future failed(std::string error) {
    Promise<T> promise;
    promise.reject(std::move(error));
    return promise.future();
  }

  [[nodiscard]] bool valid() const { return state_ != nullptr; }
  [[nodiscard]] bool is_ready() const { return state_ != nullptr && state_->result.has_value(); }

  [[nodiscard]] const common::Result<T> &result() const { return *state_->result; }

  void then(Callback callback) const {
    if (state_->result.has_value()) {
      callback(*state_->result);
      return;
    }
    state_->callbacks.push_back(std::move(callback));
  }

private:
  friend class Promise<T>;
  explicit Future(std::shared_ptr<detail::SharedState<T>> state) : state_(std::move(state)) {}

  std::shared_ptr<detail::SharedState<T>> state_;
};

template <typename U, typename T, typename Fn>
[[nodiscard]] Future<U> map_result(const Future<T> &source, Fn fn) {
  Promise<U> promise;
  source.then([promise, fn = std::move(fn)](const common::Result<T> &result) mutable {
    promise.settle(fn(result));
  });
  return promise.future();
}

template <typename U, typename T, typename Fn>
[[nodiscard]] Future<U> flat_map(const Future<T> &source, Fn fn) {
  Promise<U> promise;
  source.then([promise, fn = std::move(fn)](const common::Result<T> &result) mutable {
    if (!result.ok()) {
      promise.reject(result.error());
      return;
    }
    fn(result.value()).then([promise](const common::Result<U> &next) mutable {
      promise.settle(next);
    });
  });
  return promise.future();
}

/// Settles once every input has settled. Output order matches input order regardless of
/// completion order; individual failures are reported per slot and never fail the whole.
template <typename T>
[[nodiscard]] Future<std::vector<common::Result<T>>> when_all(const std::vector<Future<T>> &futures) {
  using Slots = std::vector<std::optional<common::Result<T>>>;
  Promise<std::vector<common::Result<T>>> promise;
  if (futures.empty()) {
    promise.resolve({});
    return promise.future();
  }

  auto slots = std::make_shared<Slots>(futures.size());
  auto remaining = std::make_shared<std::size_t>(futures.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    futures[i].then([promise, slots, remaining, i](const common::Result<T> &result) mutable {
      (*slots)[i].emplace(result);
      if (--(*remaining) > 0) {
        return;
      }
      std::vector<common::Result<T>> out;
      out.reserve(slots->size());
      for (auto &slot : *slots) {
        out.push_back(std::move(*slot));
      }
      promise.resolve(std::move(out));
    });
  }
  return promise.future();
}

/// Fail with TIMEOUT_ERROR if `source` has not settled within `timeout`. The source keeps
/// running; its late result is dropped.
template <typename T>
[[nodiscard]] Future<T> with_timeout(EventLoop &loop, const Future<T> &source, Duration timeout) {
  Promise<T> promise;
  auto timer = std::make_shared<TimerId>(0);
  *timer = loop.schedule(timeout, [promise]() mutable { promise.reject(TIMEOUT_ERROR); });
  source.then([&loop, promise, timer](const common::Result<T> &result) mutable {
    loop.cancel(*timer);
    promise.settle(result);
  });
  return promise.future();
}

template <typename T> [[nodiscard]] Future<T> delayed(EventLoop &loop, Duration delay, T value) {
  Promise<T> promise;
  loop.schedule(delay, [promise, value = std::move(value)]() mutable {
    promise.resolve(std::move(value));
  });
  return promise.future();
}

/// Drive `loop` until `future` settles. Returns TIMEOUT_ERROR if `limit` elapses first or if
/// nothing left on the loop could settle it.
template <typename T>
[[nodiscard]] common::Result<T> wait(EventLoop &loop, const Future<T> &future,
                                     std::optional<Duration> limit = std::nullopt) {
  loop.run_until([&future]() { return future.is_ready(); }, limit);
  if (!future.is_ready()) {
    return common::Result<T>::failure(TIMEOUT_ERROR);
  }
  return future.result();
}

} // namespace launchpad::async
