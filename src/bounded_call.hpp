#pragma once

#include "wake/errors.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace wake {

// Workers a single decorator may leave running past their timeout.
constexpr int kMaxOutstandingCalls = 4;

// Runs `fn` on a detached worker and waits at most `timeout` for it. The
// callable must own everything it touches (capture by value): on timeout the
// worker keeps running after this function has returned. `outstanding`
// counts unfinished workers; once kMaxOutstandingCalls are stuck, further
// calls fail without starting another thread.
template <typename Fn>
auto call_with_timeout(Fn&& fn,
                       std::chrono::milliseconds timeout,
                       const std::string& what,
                       const std::shared_ptr<std::atomic<int>>& outstanding)
    -> decltype(fn()) {
  using Result = decltype(fn());
  if (outstanding->fetch_add(1) >= kMaxOutstandingCalls) {
    outstanding->fetch_sub(1);
    throw CollaboratorUnavailableError(what + " still running " +
                                       std::to_string(kMaxOutstandingCalls) +
                                       " earlier calls");
  }
  auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
  auto future = task->get_future();
  try {
    std::thread([task, outstanding]() {
      (*task)();
      outstanding->fetch_sub(1);
    }).detach();
  } catch (const std::system_error& ex) {
    outstanding->fetch_sub(1);
    throw CollaboratorUnavailableError(what + " could not start: " + ex.what());
  }

  if (future.wait_for(timeout) == std::future_status::timeout) {
    throw CollaboratorTimeoutError(what + " timed out after " +
                                   std::to_string(timeout.count()) + "ms");
  }
  try {
    return future.get();
  } catch (const CollaboratorError&) {
    throw;
  } catch (const std::exception& ex) {
    throw CollaboratorUnavailableError(what + " failed: " + ex.what());
  }
}

} // namespace wake
