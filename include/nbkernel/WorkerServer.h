#ifndef NBKERNEL_WORKERSERVER_H
#define NBKERNEL_WORKERSERVER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "CancellationToken.h"
#include "FrameWriter.h"
#include "Protocol.h"
#include "Sandbox.h"

namespace nbkernel {

struct WorkerOptions {
  std::size_t memoryMb = 256;
  std::chrono::milliseconds batchInterval{25};
  std::string workspaceRoot;
  std::string transpilerCommand;
  std::string installerCommand = kDefaultInstallerCommand;
};

/// The worker side of the protocol. Reads control messages from the socket,
/// runs jobs one at a time in a Sandbox, and streams output and results back.
///
/// A reader thread decodes incoming frames. Cancel and Ping are handled on
/// that thread as soon as they arrive; RunCell and InvokeHandler are queued
/// for serve(), which runs them on the calling thread.
class WorkerServer {
public:
  /// Takes ownership of fd.
  WorkerServer(int fd, WorkerOptions options);
  ~WorkerServer();

  WorkerServer(const WorkerServer &) = delete;
  WorkerServer &operator=(const WorkerServer &) = delete;

  /// Run jobs until the orchestrator closes the socket. Returns the process
  /// exit code.
  int serve();

private:
  using Job = std::variant<RunCell, InvokeHandler>;

  void readMessages(int fd);
  void handleMessage(ControlMessage message);
  /// job must already be current (currentJobId and currentToken set).
  void runJob(const Job &job, const std::shared_ptr<CancellationToken> &token);

  FrameWriter writer;
  Sandbox sandbox;

  std::mutex mutex;
  std::condition_variable cv;
  std::deque<Job> queue;
  std::string currentJobId;
  std::shared_ptr<CancellationToken> currentToken;
  bool closed = false;
  int readFD;
};

} // end namespace nbkernel

#endif // NBKERNEL_WORKERSERVER_H
