#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace tsbatch::util {

/*
  Sleeps for `duration` unless `token` is stopped first.

  Returns false when the wait ended because of a stop request.
*/
template <typename Rep, typename Period>
bool SleepFor(std::stop_token token, std::chrono::duration<Rep, Period> duration) {
  if (token.stop_requested()) return false;

  std::mutex                  mutex;
  std::condition_variable_any cv;
  std::unique_lock            lock(mutex);

  // Nothing ever notifies cv; the wait ends on timeout or on a stop request.
  cv.wait_for(lock, token, duration, [] { return false; });
  return !token.stop_requested();
}

} // namespace tsbatch::util
