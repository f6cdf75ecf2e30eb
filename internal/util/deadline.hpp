#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/util/errors.hpp"

namespace taskorch::util {

/*
  Deadline helpers for suspension points (executor calls, status sources,
  broadcast sends).

  The callable runs on a detached thread and reports through a promise, so
  the returned future never blocks in its destructor. A call that misses its
  deadline keeps running in the background; whatever it captures must be
  owned by the callable (shared_ptr or by value).
*/

template <typename Fn>
auto RunDetached(Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
  using R = std::invoke_result_t<Fn&>;

  auto promise = std::make_shared<std::promise<R>>();
  auto future  = promise->get_future();

  std::thread([promise, fn = std::move(fn)]() mutable {
    try {
      if constexpr (std::is_void_v<R>) {
        fn();
        promise->set_value();
      } else {
        promise->set_value(fn());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  return future;
}

// Throws TimeoutError when fn does not finish within timeout; rethrows
// whatever fn throws otherwise.
template <typename Fn>
auto CallWithTimeout(Fn fn, std::chrono::milliseconds timeout, std::string_view what) -> std::invoke_result_t<Fn&> {
  auto future = RunDetached(std::move(fn));
  if (future.wait_for(timeout) != std::future_status::ready) {
    throw TimeoutError(std::string(what) + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  return future.get();
}

} // namespace taskorch::util
