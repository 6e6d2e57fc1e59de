/*
 * # Worker pool
 *
 * The pool owns a fixed number of shared worker processes, plus any number of
 * reserved workers handed out by reserve(). Each worker runs at most one job
 * at a time; jobs for the shared workers wait in a FIFO queue until one is
 * idle.
 *
 * ## Synchronization
 *
 * Everything happens on the threads running the caller's io_context, and the
 * caller must not run the context on more than one thread. There are no
 * locks: the active job map is only modified by handlers.
 *
 * ## Timers
 *
 * Each active job has a deadline timer (timeoutMs + cancelGraceMs) and, once
 * it has been cancelled, a grace timer. Cancelling a steady_timer doesn't
 * help if its handler has already been queued, so every active job gets a
 * serial number, and a timer handler only acts if the job it finds under its
 * jobId still has the serial the timer was started with. A job that settles
 * and a new job that reuses the same id can't be confused this way.
 *
 * ## Failure handling
 *
 * A job settles exactly once, through settle(), which removes its entry,
 * gives the worker back to its owner (the shared slots, or a reserved worker)
 * and only then calls the job's handler. A worker that was killed or exited
 * is marked crashed and replaced when it is given back. Idle shared workers
 * that exit are replaced immediately.
 */

#include "nbkernel/WorkerPool.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <limits>
#include <list>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringMap.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include "WorkerProcess.h"
#include "nbkernel/Support.h"

using namespace nbkernel;
namespace net = boost::asio;

unsigned PoolOptions::getDefaultSize() {
  unsigned cpus = std::thread::hardware_concurrency();
  return std::max(1u, std::min(2u, cpus));
}

std::string PoolOptions::getDefaultWorkerPath() {
  return NBKERNEL_WORKER_PATH;
}

std::string PoolOptions::getDefaultWorkspaceRoot() {
  llvm::SmallString<128> path;
  llvm::sys::path::system_temp_directory(true, path);
  llvm::sys::path::append(path, "nbkernel");
  return std::string(path);
}

template <typename T>
static void readNumber(const char *name, T &value, T min, T max) {
  const char *text = std::getenv(name);
  if (!text)
    return;
  T result;
  if (llvm::StringRef(text).trim().getAsInteger(10, result) || result < min ||
      result > max) {
    llvm::errs() << "nbkernel: ignoring invalid " << name << "=" << text
                 << "\n";
    return;
  }
  value = result;
}

static void readString(const char *name, std::string &value) {
  const char *text = std::getenv(name);
  if (text && *text)
    value = text;
}

PoolOptions PoolOptions::fromEnvironment() {
  PoolOptions options;
  readNumber<unsigned>("NBKERNEL_POOL_SIZE", options.size, 1, 1024);
  readNumber<std::uint32_t>("NBKERNEL_TIMEOUT_MS", options.perJobTimeoutMs, 1,
                            kMaxTimeoutMs);
  readNumber<unsigned>("NBKERNEL_MEMORY_MB", options.memoryMb, 1, 1 << 20);
  readNumber<std::size_t>("NBKERNEL_MAX_OUTPUT_BYTES", options.maxOutputBytes,
                          1, std::numeric_limits<std::size_t>::max());
  readNumber<unsigned>("NBKERNEL_BATCH_MS", options.batchMs, 0, 60000);
  readNumber<unsigned>("NBKERNEL_CANCEL_GRACE_MS", options.cancelGraceMs, 0,
                       60000);
  readString("NBKERNEL_WORKER", options.workerPath);
  readString("NBKERNEL_WORKSPACE", options.workspaceRoot);
  readString("NBKERNEL_TRANSPILER", options.transpilerCommand);
  readString("NBKERNEL_INSTALLER", options.installerCommand);
  return options;
}

ReservedWorker::~ReservedWorker() {}

static void rejectLater(net::io_context &ioContext, ResultHandler handler,
                        std::errc code, std::string message) {
  net::post(ioContext, [handler = std::move(handler), code,
                        message = std::move(message)] {
    if (handler)
      handler(llvm::createStringError(std::make_error_code(code), message));
  });
}

static ControlMessage makeControlMessage(llvm::StringRef jobId, const Job &job,
                                         std::uint32_t timeoutMs) {
  if (job.kind == JobKind::InvokeHandler) {
    InvokeHandler message;
    message.jobId = jobId.str();
    message.handlerId = job.handlerId;
    message.notebookId = job.notebookId;
    message.env = job.env;
    message.event = job.event;
    message.payload = job.payload;
    message.componentId = job.componentId;
    message.cellId = job.cellId;
    message.timeoutMs = timeoutMs;
    message.globals = job.globals;
    return message;
  }
  RunCell message;
  message.jobId = jobId.str();
  message.cell = job.cell;
  message.code = job.code;
  message.notebookId = job.notebookId;
  message.env = job.env;
  message.timeoutMs = timeoutMs;
  message.globals = job.globals;
  return message;
}

namespace {
struct PendingJob {
  std::string jobId;
  Job job;
  ResultHandler handler;
};

using ReleaseHook =
    std::function<void(const std::shared_ptr<WorkerProcess> &worker)>;

struct ActiveJob {
  std::uint64_t serial;
  std::shared_ptr<WorkerProcess> worker;
  Job job;
  ResultHandler handler;
  ReleaseHook release;
  std::uint32_t timeoutMs;
  std::int64_t started;
  std::size_t outputBytes = 0;
  bool cancelling = false;
  net::steady_timer deadline;
  net::steady_timer grace;

  explicit ActiveJob(net::io_context &ioContext)
      : deadline(ioContext), grace(ioContext) {}
};

struct PingRound {
  std::vector<const WorkerProcess *> pending;
  unsigned asked = 0;
  unsigned responded = 0;
  std::function<void(unsigned, unsigned)> handler;
  net::steady_timer timer;

  explicit PingRound(net::io_context &ioContext) : timer(ioContext) {}
};
} // end anonymous namespace

namespace nbkernel {
class WorkerPoolImpl : public std::enable_shared_from_this<WorkerPoolImpl>,
                       public WorkerProcess::Listener {
public:
  WorkerPoolImpl(net::io_context &ioContext, PoolOptions options);

  void startSlots();
  void shutdown();

  llvm::Expected<std::shared_ptr<WorkerProcess>> spawnWorker();
  bool isKnownJob(llvm::StringRef jobId) const;
  void run(std::string jobId, Job job, ResultHandler handler);
  void cancel(llvm::StringRef jobId);
  void dispatch(std::shared_ptr<WorkerProcess> worker, std::string jobId,
                Job job, ResultHandler handler, ReleaseHook release);
  void settle(llvm::StringRef jobId, llvm::Expected<ExecutionResult> result);
  void ping(std::function<void(unsigned, unsigned)> handler);

  void onFrame(WorkerProcess &worker, Frame frame) override;
  void onExit(WorkerProcess &worker) override;

  net::io_context &ioContext;
  PoolOptions options;
  std::vector<std::shared_ptr<WorkerProcess>> slots;
  std::deque<PendingJob> queue;
  llvm::StringMap<std::unique_ptr<ActiveJob>> active;
  std::list<std::shared_ptr<PingRound>> pings;
  bool shuttingDown = false;

private:
  bool isIdle(const std::shared_ptr<WorkerProcess> &worker) const;
  void fillSlots();
  void dispatchQueued();
  void releaseShared(const std::shared_ptr<WorkerProcess> &worker);
  void replaceSlot(std::shared_ptr<WorkerProcess> &slot);
  void startTimer(net::steady_timer &timer, llvm::StringRef jobId,
                  std::uint64_t serial, unsigned ms,
                  void (WorkerPoolImpl::*expired)(llvm::StringRef));
  void deadlineExpired(llvm::StringRef jobId);
  void graceExpired(llvm::StringRef jobId);
  void handlePong(const WorkerProcess &worker);
  void finishPing(const std::shared_ptr<PingRound> &round);

  // Every worker we started, for shutdown.
  std::vector<std::weak_ptr<WorkerProcess>> allWorkers;
  std::string lastSpawnError;
  std::uint64_t nextSerial = 1;
};
} // end namespace nbkernel

WorkerPoolImpl::WorkerPoolImpl(net::io_context &ioContext, PoolOptions options)
    : ioContext(ioContext), options(std::move(options)) {
  slots.resize(std::max(1u, this->options.size));
}

void WorkerPoolImpl::startSlots() { fillSlots(); }

llvm::Expected<std::shared_ptr<WorkerProcess>> WorkerPoolImpl::spawnWorker() {
  auto worker = WorkerProcess::spawn(ioContext, options);
  if (!worker)
    return worker.takeError();
  (*worker)->start(this);
  allWorkers.erase(std::remove_if(allWorkers.begin(), allWorkers.end(),
                                  [](const std::weak_ptr<WorkerProcess> &w) {
                                    return w.expired();
                                  }),
                   allWorkers.end());
  allWorkers.push_back(*worker);
  return worker;
}

bool WorkerPoolImpl::isIdle(
    const std::shared_ptr<WorkerProcess> &worker) const {
  return worker && !worker->crashed && worker->currentJobId.empty();
}

void WorkerPoolImpl::replaceSlot(std::shared_ptr<WorkerProcess> &slot) {
  if (slot)
    slot->detach();
  slot = nullptr;
  auto worker = spawnWorker();
  if (!worker) {
    lastSpawnError = llvm::toString(worker.takeError());
    llvm::errs() << "nbkernel: can't start worker: " << lastSpawnError << "\n";
    return;
  }
  slot = std::move(*worker);
}

void WorkerPoolImpl::fillSlots() {
  for (auto &slot : slots)
    if (!slot)
      replaceSlot(slot);
}

bool WorkerPoolImpl::isKnownJob(llvm::StringRef jobId) const {
  if (active.count(jobId))
    return true;
  return std::any_of(queue.begin(), queue.end(), [&](const PendingJob &job) {
    return job.jobId == jobId;
  });
}

void WorkerPoolImpl::run(std::string jobId, Job job, ResultHandler handler) {
  if (shuttingDown) {
    rejectLater(ioContext, std::move(handler), std::errc::operation_canceled,
                "Worker pool shut down");
    return;
  }
  if (isKnownJob(jobId)) {
    rejectLater(ioContext, std::move(handler), std::errc::invalid_argument,
                "Job is already active: " + jobId);
    return;
  }
  queue.push_back(PendingJob{std::move(jobId), std::move(job),
                             std::move(handler)});
  fillSlots();
  dispatchQueued();
}

void WorkerPoolImpl::dispatchQueued() {
  while (!queue.empty()) {
    auto idle = std::find_if(
        slots.begin(), slots.end(),
        [&](const std::shared_ptr<WorkerProcess> &w) { return isIdle(w); });
    if (idle == slots.end()) {
      bool anyAlive = std::any_of(
          slots.begin(), slots.end(),
          [](const std::shared_ptr<WorkerProcess> &w) { return w != nullptr; });
      if (!anyAlive) {
        // Nothing will ever pick these up.
        while (!queue.empty()) {
          rejectLater(ioContext, std::move(queue.front().handler),
                      std::errc::resource_unavailable_try_again,
                      "No workers available: " + lastSpawnError);
          queue.pop_front();
        }
      }
      return;
    }
    PendingJob next = std::move(queue.front());
    queue.pop_front();
    dispatch(*idle, std::move(next.jobId), std::move(next.job),
             std::move(next.handler),
             [this](const std::shared_ptr<WorkerProcess> &worker) {
               releaseShared(worker);
             });
  }
}

void WorkerPoolImpl::releaseShared(
    const std::shared_ptr<WorkerProcess> &worker) {
  if (shuttingDown)
    return;
  if (worker->crashed) {
    auto slot = std::find(slots.begin(), slots.end(), worker);
    if (slot != slots.end()) {
      if (options.verbose)
        llvm::errs() << "nbkernel: replacing worker " << worker->getPid()
                     << "\n";
      replaceSlot(*slot);
    }
  }
  dispatchQueued();
}

void WorkerPoolImpl::dispatch(std::shared_ptr<WorkerProcess> worker,
                              std::string jobId, Job job,
                              ResultHandler handler, ReleaseHook release) {
  auto entry = std::make_unique<ActiveJob>(ioContext);
  entry->serial = nextSerial++;
  entry->timeoutMs = std::min(
      std::max<std::uint32_t>(job.timeoutMs.value_or(options.perJobTimeoutMs),
                              1),
      kMaxTimeoutMs);
  entry->started = currentTimeMillis();
  ControlMessage message = makeControlMessage(jobId, job, entry->timeoutMs);
  entry->worker = worker;
  entry->job = std::move(job);
  entry->handler = std::move(handler);
  entry->release = std::move(release);
  startTimer(entry->deadline, jobId, entry->serial,
             entry->timeoutMs + options.cancelGraceMs,
             &WorkerPoolImpl::deadlineExpired);
  worker->currentJobId = jobId;
  worker->used = true;
  active.try_emplace(jobId, std::move(entry));

  if (!worker->send(message) && worker->hasExited())
    settle(jobId, llvm::createStringError(
                      std::make_error_code(std::errc::broken_pipe),
                      "Worker exited before the job could be sent"));
  // Otherwise a failed send killed the worker, and onExit() settles the job.
}

void WorkerPoolImpl::settle(llvm::StringRef jobId,
                            llvm::Expected<ExecutionResult> result) {
  auto it = active.find(jobId);
  if (it == active.end()) {
    llvm::consumeError(result.takeError());
    return;
  }
  std::unique_ptr<ActiveJob> entry = std::move(it->second);
  active.erase(it);
  entry->deadline.cancel();
  entry->grace.cancel();
  entry->worker->currentJobId.clear();
  if (entry->release)
    entry->release(entry->worker);
  if (entry->handler)
    entry->handler(std::move(result));
  else
    llvm::consumeError(result.takeError());
}

void WorkerPoolImpl::startTimer(
    net::steady_timer &timer, llvm::StringRef jobId, std::uint64_t serial,
    unsigned ms, void (WorkerPoolImpl::*expired)(llvm::StringRef)) {
  timer.expires_after(std::chrono::milliseconds(ms));
  std::weak_ptr<WorkerPoolImpl> weak = shared_from_this();
  timer.async_wait([weak, jobId = jobId.str(), serial,
                    expired](const boost::system::error_code &ec) {
    if (ec)
      return;
    auto self = weak.lock();
    if (!self)
      return;
    auto it = self->active.find(jobId);
    if (it == self->active.end() || it->second->serial != serial)
      return;
    ((*self).*expired)(jobId);
  });
}

void WorkerPoolImpl::deadlineExpired(llvm::StringRef jobId) {
  ActiveJob &entry = *active.find(jobId)->second;
  std::string ms = std::to_string(entry.timeoutMs);
  if (options.verbose)
    llvm::errs() << "nbkernel: job " << jobId << " exceeded " << ms
                 << "ms, killing worker " << entry.worker->getPid() << "\n";
  entry.worker->kill();

  ExecutionResult result;
  result.execution.started = entry.started;
  result.execution.ended = currentTimeMillis();
  result.execution.status = ExecutionStatus::Aborted;
  result.execution.error = ExecutionError{
      "TimeoutError", "Execution timed out after " + ms + "ms", std::nullopt};
  std::string id = jobId.str();
  if (entry.job.onStderr && !entry.cancelling)
    entry.job.onStderr("[timeout] Execution exceeded " + ms +
                       "ms and was stopped.\n");
  settle(id, std::move(result));
}

void WorkerPoolImpl::graceExpired(llvm::StringRef jobId) {
  ActiveJob &entry = *active.find(jobId)->second;
  if (options.verbose)
    llvm::errs() << "nbkernel: job " << jobId
                 << " ignored cancellation, killing worker "
                 << entry.worker->getPid() << "\n";
  entry.worker->kill();
  settle(jobId.str(), llvm::createStringError(
                          std::make_error_code(std::errc::operation_canceled),
                          "Job cancelled"));
}

void WorkerPoolImpl::cancel(llvm::StringRef jobId) {
  auto queued =
      std::find_if(queue.begin(), queue.end(),
                   [&](const PendingJob &job) { return job.jobId == jobId; });
  if (queued != queue.end()) {
    rejectLater(ioContext, std::move(queued->handler),
                std::errc::operation_canceled, "Job cancelled");
    queue.erase(queued);
    return;
  }

  auto it = active.find(jobId);
  if (it == active.end())
    return;
  ActiveJob &entry = *it->second;
  if (entry.cancelling)
    return;
  entry.cancelling = true;
  startTimer(entry.grace, jobId, entry.serial, options.cancelGraceMs,
             &WorkerPoolImpl::graceExpired);
  // If this fails the worker is killed, and onExit() rejects the job.
  entry.worker->send(Cancel{jobId.str()});
}

void WorkerPoolImpl::onFrame(WorkerProcess &worker, Frame frame) {
  // A callback below may destroy the pool.
  auto keepAlive = shared_from_this();
  if (frame.kind == FrameKind::Message) {
    auto message = decodeEventMessage(frame.payload);
    if (!message)
      return;
    std::visit(
        Overloaded{
            [&](Ack &) {},
            [&](Result &msg) {
              if (!msg.jobId.empty() && msg.jobId == worker.currentJobId)
                settle(msg.jobId, std::move(msg.result));
            },
            [&](ErrorMessage &msg) {
              if (msg.jobId && !msg.jobId->empty() &&
                  *msg.jobId == worker.currentJobId) {
                settle(*msg.jobId,
                       llvm::createStringError(
                           std::make_error_code(std::errc::io_error),
                           msg.message));
                return;
              }
              llvm::errs() << "nbkernel: worker " << worker.getPid()
                           << " reported " << msg.name << ": " << msg.message
                           << "\n";
            },
            [&](Pong &) { handlePong(worker); },
        },
        *message);
    return;
  }

  auto it = active.find(worker.currentJobId);
  if (it == active.end())
    return;
  ActiveJob &entry = *it->second;
  // Output produced after a cancel request is dropped.
  if (entry.cancelling)
    return;
  entry.outputBytes += frame.payload.size();
  if (entry.outputBytes > options.maxOutputBytes) {
    std::string jobId = worker.currentJobId;
    if (options.verbose)
      llvm::errs() << "nbkernel: job " << jobId
                   << " exceeded the output limit, killing worker "
                   << worker.getPid() << "\n";
    worker.kill();
    settle(jobId, llvm::createStringError(
                      std::make_error_code(std::errc::value_too_large),
                      "Output limit exceeded"));
    return;
  }

  switch (frame.kind) {
  case FrameKind::Stdout:
    if (entry.job.onStdout)
      entry.job.onStdout(sanitizeUTF8(frame.getText()));
    break;
  case FrameKind::Stderr:
    if (entry.job.onStderr)
      entry.job.onStderr(sanitizeUTF8(frame.getText()));
    break;
  case FrameKind::Display: {
    auto output = Node::loadFromCBOR(frame.payload);
    if (!output) {
      llvm::consumeError(output.takeError());
      break;
    }
    if (entry.job.onDisplay)
      entry.job.onDisplay(*output);
    break;
  }
  case FrameKind::Message:
    break;
  }
}

void WorkerPoolImpl::onExit(WorkerProcess &worker) {
  auto keepAlive = shared_from_this();
  std::shared_ptr<WorkerProcess> self = worker.shared_from_this();

  for (auto i = pings.begin(); i != pings.end();) {
    auto round = *i++;
    auto &pending = round->pending;
    pending.erase(std::remove(pending.begin(), pending.end(), &worker),
                  pending.end());
    if (pending.empty())
      finishPing(round);
  }

  auto it = active.find(worker.currentJobId);
  if (!worker.currentJobId.empty() && it != active.end()) {
    std::string jobId = worker.currentJobId;
    if (it->second->cancelling)
      settle(jobId, llvm::createStringError(
                        std::make_error_code(std::errc::operation_canceled),
                        "Job cancelled"));
    else
      settle(jobId, llvm::createStringError(
                        std::make_error_code(std::errc::broken_pipe),
                        "Worker exited unexpectedly"));
    return;
  }

  if (shuttingDown)
    return;
  auto slot = std::find(slots.begin(), slots.end(), self);
  if (slot == slots.end())
    return;
  if (options.verbose)
    llvm::errs() << "nbkernel: idle worker " << worker.getPid()
                 << " exited\n";
  if (!worker.used) {
    // It died during startup. Leave the slot empty until the next job, rather
    // than restarting it in a loop.
    lastSpawnError = "worker exited during startup";
    *slot = nullptr;
    return;
  }
  replaceSlot(*slot);
  dispatchQueued();
}

void WorkerPoolImpl::ping(std::function<void(unsigned, unsigned)> handler) {
  auto round = std::make_shared<PingRound>(ioContext);
  round->handler = std::move(handler);
  fillSlots();
  for (auto &worker : slots) {
    if (!isIdle(worker) || !worker->send(Ping{}))
      continue;
    round->pending.push_back(worker.get());
    round->asked++;
  }
  pings.push_back(round);
  if (round->asked == 0) {
    net::post(ioContext, [weak = std::weak_ptr<WorkerPoolImpl>(
                              shared_from_this()),
                          round] {
      if (auto self = weak.lock())
        self->finishPing(round);
    });
    return;
  }
  round->timer.expires_after(std::chrono::milliseconds(options.cancelGraceMs));
  std::weak_ptr<WorkerPoolImpl> weak = shared_from_this();
  std::weak_ptr<PingRound> weakRound = round;
  round->timer.async_wait([weak, weakRound](const boost::system::error_code &) {
    auto self = weak.lock();
    auto round = weakRound.lock();
    if (self && round)
      self->finishPing(round);
  });
}

void WorkerPoolImpl::handlePong(const WorkerProcess &worker) {
  for (auto i = pings.begin(); i != pings.end();) {
    auto round = *i++;
    auto &pending = round->pending;
    auto found = std::find(pending.begin(), pending.end(), &worker);
    if (found == pending.end())
      continue;
    pending.erase(found);
    round->responded++;
    if (pending.empty())
      finishPing(round);
  }
}

void WorkerPoolImpl::finishPing(const std::shared_ptr<PingRound> &round) {
  auto it = std::find(pings.begin(), pings.end(), round);
  if (it == pings.end())
    return;
  pings.erase(it);
  round->timer.cancel();
  if (round->handler)
    round->handler(round->responded, round->asked);
}

void WorkerPoolImpl::shutdown() {
  shuttingDown = true;

  std::deque<PendingJob> queued = std::move(queue);
  queue.clear();
  for (PendingJob &job : queued)
    if (job.handler)
      job.handler(llvm::createStringError(
          std::make_error_code(std::errc::operation_canceled),
          "Worker pool shut down"));

  std::vector<std::unique_ptr<ActiveJob>> entries;
  for (auto &item : active)
    entries.push_back(std::move(item.second));
  active.clear();
  for (auto &entry : entries) {
    entry->deadline.cancel();
    entry->grace.cancel();
    entry->worker->currentJobId.clear();
    if (entry->handler)
      entry->handler(llvm::createStringError(
          std::make_error_code(std::errc::operation_canceled),
          "Worker pool shut down"));
  }

  auto rounds = std::move(pings);
  pings.clear();
  for (auto &round : rounds) {
    round->timer.cancel();
    if (round->handler)
      round->handler(round->responded, round->asked);
  }

  for (auto &weak : allWorkers)
    if (auto worker = weak.lock())
      worker->detach();
  allWorkers.clear();
  slots.clear();
}

namespace {
class ReservedWorkerImpl : public ReservedWorker {
public:
  explicit ReservedWorkerImpl(const std::shared_ptr<WorkerPoolImpl> &pool);
  ~ReservedWorkerImpl() override;

  void run(llvm::StringRef jobId, Job job, ResultHandler handler) override;
  void cancel(llvm::StringRef jobId) override;
  void release() override;
  int getPid() const override { return worker ? worker->getPid() : -1; }
  unsigned getGeneration() const override { return generation; }

private:
  llvm::Error startWorker(WorkerPoolImpl &pool);
  void dispatchNext();
  void rejectQueued(std::errc code, const std::string &message);

  std::weak_ptr<WorkerPoolImpl> pool;
  net::io_context &ioContext;
  std::shared_ptr<WorkerProcess> worker;
  std::deque<PendingJob> queue;
  std::string currentJobId;
  unsigned generation = 0;
  bool released = false;
};
} // end anonymous namespace

ReservedWorkerImpl::ReservedWorkerImpl(
    const std::shared_ptr<WorkerPoolImpl> &pool)
    : pool(pool), ioContext(pool->ioContext) {
  if (llvm::Error error = startWorker(*pool))
    llvm::errs() << "nbkernel: can't start reserved worker: "
                 << llvm::toString(std::move(error)) << "\n";
}

ReservedWorkerImpl::~ReservedWorkerImpl() { release(); }

llvm::Error ReservedWorkerImpl::startWorker(WorkerPoolImpl &pool) {
  if (worker) {
    worker->detach();
    worker = nullptr;
    generation++;
  }
  auto spawned = pool.spawnWorker();
  if (!spawned)
    return spawned.takeError();
  worker = std::move(*spawned);
  return llvm::Error::success();
}

void ReservedWorkerImpl::rejectQueued(std::errc code,
                                      const std::string &message) {
  while (!queue.empty()) {
    rejectLater(ioContext, std::move(queue.front().handler), code, message);
    queue.pop_front();
  }
}

void ReservedWorkerImpl::run(llvm::StringRef jobId, Job job,
                             ResultHandler handler) {
  auto pool = this->pool.lock();
  if (released || !pool || pool->shuttingDown) {
    rejectLater(ioContext, std::move(handler), std::errc::operation_canceled,
                "Worker released");
    return;
  }
  bool duplicate =
      jobId == currentJobId || pool->isKnownJob(jobId) ||
      std::any_of(queue.begin(), queue.end(),
                  [&](const PendingJob &job) { return job.jobId == jobId; });
  if (duplicate) {
    rejectLater(ioContext, std::move(handler), std::errc::invalid_argument,
                "Job is already active: " + jobId.str());
    return;
  }
  queue.push_back(PendingJob{jobId.str(), std::move(job), std::move(handler)});
  dispatchNext();
}

void ReservedWorkerImpl::dispatchNext() {
  if (released || !currentJobId.empty() || queue.empty())
    return;
  auto pool = this->pool.lock();
  if (!pool || pool->shuttingDown) {
    rejectQueued(std::errc::operation_canceled, "Worker pool shut down");
    return;
  }
  if (!worker || worker->crashed) {
    if (llvm::Error error = startWorker(*pool)) {
      rejectQueued(std::errc::resource_unavailable_try_again,
                   llvm::toString(std::move(error)));
      return;
    }
  }
  PendingJob next = std::move(queue.front());
  queue.pop_front();
  currentJobId = next.jobId;
  pool->dispatch(worker, std::move(next.jobId), std::move(next.job),
                 std::move(next.handler),
                 [this](const std::shared_ptr<WorkerProcess> &finished) {
                   currentJobId.clear();
                   if (released)
                     return;
                   // Replace a killed worker right away, so the session can
                   // carry on with the next job.
                   if (finished->crashed && finished == worker) {
                     auto pool = this->pool.lock();
                     if (pool && !pool->shuttingDown)
                       if (llvm::Error error = startWorker(*pool))
                         llvm::errs() << "nbkernel: can't restart reserved "
                                         "worker: "
                                      << llvm::toString(std::move(error))
                                      << "\n";
                   }
                   dispatchNext();
                 });
}

void ReservedWorkerImpl::cancel(llvm::StringRef jobId) {
  auto queued =
      std::find_if(queue.begin(), queue.end(),
                   [&](const PendingJob &job) { return job.jobId == jobId; });
  if (queued != queue.end()) {
    rejectLater(ioContext, std::move(queued->handler),
                std::errc::operation_canceled, "Job cancelled");
    queue.erase(queued);
    return;
  }
  if (jobId != currentJobId)
    return;
  if (auto pool = this->pool.lock())
    pool->cancel(jobId);
}

void ReservedWorkerImpl::release() {
  if (released)
    return;
  released = true;
  rejectQueued(std::errc::operation_canceled, "Worker released");
  auto pool = this->pool.lock();
  if (!currentJobId.empty() && pool && worker) {
    std::string jobId = currentJobId;
    worker->kill();
    pool->settle(jobId, llvm::createStringError(
                            std::make_error_code(std::errc::operation_canceled),
                            "Worker released"));
  }
  if (worker)
    worker->detach();
  worker = nullptr;
}

WorkerPool::WorkerPool(net::io_context &ioContext, PoolOptions options)
    : impl(std::make_shared<WorkerPoolImpl>(ioContext, std::move(options))) {
  impl->startSlots();
}

WorkerPool::~WorkerPool() { impl->shutdown(); }

void WorkerPool::run(llvm::StringRef jobId, Job job, ResultHandler handler) {
  impl->run(jobId.str(), std::move(job), std::move(handler));
}

void WorkerPool::cancel(llvm::StringRef jobId) { impl->cancel(jobId); }

std::unique_ptr<ReservedWorker> WorkerPool::reserve() {
  return std::make_unique<ReservedWorkerImpl>(impl);
}

void WorkerPool::setPerJobTimeoutMs(std::int64_t ms) {
  if (ms <= 0)
    return;
  impl->options.perJobTimeoutMs =
      static_cast<std::uint32_t>(std::min<std::int64_t>(ms, kMaxTimeoutMs));
}

std::uint32_t WorkerPool::getPerJobTimeoutMs() const {
  return impl->options.perJobTimeoutMs;
}

void WorkerPool::ping(std::function<void(unsigned, unsigned)> handler) {
  impl->ping(std::move(handler));
}

const PoolOptions &WorkerPool::getOptions() const { return impl->options; }

net::io_context &WorkerPool::getIOContext() const { return impl->ioContext; }

std::size_t WorkerPool::size() const {
  return std::count_if(
      impl->slots.begin(), impl->slots.end(),
      [](const std::shared_ptr<WorkerProcess> &w) { return w != nullptr; });
}

std::size_t WorkerPool::idleCount() const {
  return std::count_if(impl->slots.begin(), impl->slots.end(),
                       [](const std::shared_ptr<WorkerProcess> &w) {
                         return w && !w->crashed && w->currentJobId.empty();
                       });
}

std::size_t WorkerPool::activeCount() const { return impl->active.size(); }

std::size_t WorkerPool::queuedCount() const { return impl->queue.size(); }

std::vector<int> WorkerPool::workerPids() const {
  std::vector<int> result;
  for (const auto &worker : impl->slots)
    if (worker)
      result.push_back(worker->getPid());
  return result;
}
