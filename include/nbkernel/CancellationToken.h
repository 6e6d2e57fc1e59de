#ifndef NBKERNEL_CANCELLATIONTOKEN_H
#define NBKERNEL_CANCELLATIONTOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace nbkernel {

/// Tells a running job to stop. The job checks the token at safe points; the
/// token fires either when cancel() is called (from another thread) or when
/// the wall-clock deadline passes.
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  enum class Reason { None, Cancelled, TimedOut };

  CancellationToken() = default;
  explicit CancellationToken(Clock::time_point deadline) : deadline(deadline) {}

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Thread-safe.
  void cancel();

  /// Check whether the job should stop, updating the reason if the deadline
  /// has passed.
  bool isFired();

  Reason getReason() const { return reason.load(); }

  Clock::time_point getDeadline() const { return deadline; }

  /// Sleep until the given time, the deadline, or cancellation, whichever
  /// comes first. Returns isFired().
  bool waitUntil(Clock::time_point time);

private:
  std::atomic<Reason> reason = Reason::None;
  Clock::time_point deadline = Clock::time_point::max();
  std::mutex mutex;
  std::condition_variable cv;
};

} // end namespace nbkernel

#endif // NBKERNEL_CANCELLATIONTOKEN_H
