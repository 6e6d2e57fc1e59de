#ifndef NBKERNEL_WORKERPOOL_H
#define NBKERNEL_WORKERPOOL_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include "Node.h"
#include "Protocol.h"

namespace nbkernel {

/// Configuration of a WorkerPool. The defaults can be overridden with
/// NBKERNEL_* environment variables via fromEnvironment().
struct PoolOptions {
  /// Number of shared workers.
  unsigned size = getDefaultSize();

  /// Heap limit of each worker's script engine.
  unsigned memoryMb = 256;

  /// Timeout for jobs that don't specify their own.
  std::uint32_t perJobTimeoutMs = 10000;

  /// Jobs that stream more output than this are killed.
  std::size_t maxOutputBytes = 5000000;

  /// How long workers coalesce stdout/stderr text before sending it.
  unsigned batchMs = 25;

  /// How long a cancelled job has to stop before its worker is killed. Also
  /// the slack added to a job's timeout before the pool gives up on it.
  unsigned cancelGraceMs = 250;

  /// Path of the nbkernel-worker executable.
  std::string workerPath = getDefaultWorkerPath();

  /// Parent of the per-notebook sandbox directories.
  std::string workspaceRoot = getDefaultWorkspaceRoot();

  /// Shell command used to transpile TypeScript, or empty.
  std::string transpilerCommand;

  /// Shell command that installs a notebook's packages, run in its sandbox
  /// directory. Empty disables installation.
  std::string installerCommand = kDefaultInstallerCommand;

  /// Log worker lifecycle events to stderr.
  bool verbose = false;

  /// Defaults, overridden by any valid NBKERNEL_* environment variables.
  static PoolOptions fromEnvironment();

  static unsigned getDefaultSize();
  static std::string getDefaultWorkerPath();
  static std::string getDefaultWorkspaceRoot();
};

enum class JobKind { Execute, InvokeHandler };

/// A unit of work for a worker.
struct Job {
  JobKind kind = JobKind::Execute;

  /// \name Execute jobs
  /// @{
  Node cell = Node(node_map_arg);
  std::string code;
  /// @}

  /// \name InvokeHandler jobs
  /// @{
  std::string handlerId;
  std::string event;
  Node payload;
  std::optional<std::string> componentId;
  std::optional<std::string> cellId;
  /// @}

  std::string notebookId;
  Node env = Node(node_map_arg);
  Node globals = Node(node_map_arg);

  /// If unset, the pool's current default is used.
  std::optional<std::uint32_t> timeoutMs;

  /// Streamed output, delivered in the order the worker produced it and
  /// always before the job's result.
  std::function<void(llvm::StringRef)> onStdout;
  std::function<void(llvm::StringRef)> onStderr;
  std::function<void(const Node &)> onDisplay;
};

/// Called exactly once per job. Errors carry one of these codes:
///  - std::errc::operation_canceled: the job was cancelled and its worker
///    had to be killed ("Job cancelled").
///  - std::errc::value_too_large: the job exceeded maxOutputBytes ("Output
///    limit exceeded").
///  - std::errc::broken_pipe: the worker exited while running the job.
///  - std::errc::io_error: the worker reported an internal error.
///  - std::errc::invalid_argument: the jobId is already active.
///  - std::errc::resource_unavailable_try_again: no worker could be started.
using ResultHandler = std::function<void(llvm::Expected<ExecutionResult>)>;

/// A worker dedicated to one caller, outside the shared pool. Jobs run one at
/// a time, in submission order.
class ReservedWorker {
public:
  virtual ~ReservedWorker();

  virtual void run(llvm::StringRef jobId, Job job, ResultHandler handler) = 0;

  /// Like WorkerPool::cancel. If the worker has to be killed, a new one is
  /// started in its place, without the old one's globals.
  virtual void cancel(llvm::StringRef jobId) = 0;

  /// Kill the worker. Outstanding jobs are rejected. Later calls to run()
  /// fail.
  virtual void release() = 0;

  /// Process id of the current worker, or -1.
  virtual int getPid() const = 0;

  /// Number of times the worker has been replaced after being killed or
  /// crashing. Each replacement loses the previous worker's state.
  virtual unsigned getGeneration() const = 0;
};

class WorkerPoolImpl;

/// A fixed-size set of worker processes that execute jobs.
///
/// All methods must be called from a thread running the io_context, and
/// every callback is invoked from there. The orchestrator never blocks while
/// a job is running.
class WorkerPool {
public:
  WorkerPool(boost::asio::io_context &ioContext, PoolOptions options);

  /// Rejects every outstanding job and kills all workers.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Run a job on the next idle shared worker. Jobs wait in FIFO order when
  /// every worker is busy.
  void run(llvm::StringRef jobId, Job job, ResultHandler handler);

  /// Ask the job to stop. If it hasn't finished within cancelGraceMs, its
  /// worker is killed and the job is rejected. Unknown ids are ignored.
  void cancel(llvm::StringRef jobId);

  /// Start a dedicated worker for sticky sessions.
  std::unique_ptr<ReservedWorker> reserve();

  /// Change the default timeout for later jobs. Values <= 0 are ignored.
  void setPerJobTimeoutMs(std::int64_t ms);
  std::uint32_t getPerJobTimeoutMs() const;

  /// Send Ping to every idle shared worker, and report how many answered
  /// within cancelGraceMs.
  void ping(std::function<void(unsigned responded, unsigned asked)> handler);

  const PoolOptions &getOptions() const;
  boost::asio::io_context &getIOContext() const;

  /// \name Introspection
  /// @{
  std::size_t size() const;
  std::size_t idleCount() const;
  std::size_t activeCount() const;
  std::size_t queuedCount() const;
  std::vector<int> workerPids() const;
  /// @}

private:
  std::shared_ptr<WorkerPoolImpl> impl;
};

} // end namespace nbkernel

#endif // NBKERNEL_WORKERPOOL_H
