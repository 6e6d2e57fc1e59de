#include "nbkernel/CancellationToken.h"

#include <algorithm>

using namespace nbkernel;

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    Reason expected = Reason::None;
    reason.compare_exchange_strong(expected, Reason::Cancelled);
  }
  cv.notify_all();
}

bool CancellationToken::isFired() {
  if (reason.load() != Reason::None)
    return true;
  if (Clock::now() >= deadline) {
    Reason expected = Reason::None;
    reason.compare_exchange_strong(expected, Reason::TimedOut);
    return true;
  }
  return false;
}

bool CancellationToken::waitUntil(Clock::time_point time) {
  time = std::min(time, deadline);
  std::unique_lock<std::mutex> lock(mutex);
  auto fired = [&] { return reason.load() != Reason::None; };
  if (time == Clock::time_point::max())
    cv.wait(lock, fired);
  else
    cv.wait_until(lock, time, fired);
  lock.unlock();
  return isFired();
}
