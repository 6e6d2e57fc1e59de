#ifndef NBKERNEL_WORKERPROCESS_H
#define NBKERNEL_WORKERPROCESS_H

// Internal to the orchestrator: one nbkernel-worker child process and the
// socket connected to its fd 3.

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <llvm/Support/Error.h>

#include "nbkernel/FrameCodec.h"
#include "nbkernel/Protocol.h"
#include "nbkernel/WorkerPool.h"

namespace nbkernel {

class WorkerProcess : public std::enable_shared_from_this<WorkerProcess> {
public:
  class Listener {
  public:
    virtual ~Listener();
    virtual void onFrame(WorkerProcess &worker, Frame frame) = 0;

    /// Called once, after the process has exited and been reaped, or after
    /// the stream from it became corrupt.
    virtual void onExit(WorkerProcess &worker) = 0;
  };

  /// Start a worker. The result doesn't read anything until start() is
  /// called.
  static llvm::Expected<std::shared_ptr<WorkerProcess>>
  spawn(boost::asio::io_context &ioContext, const PoolOptions &options);

  WorkerProcess(boost::asio::local::stream_protocol::socket socket, pid_t pid,
                bool verbose);
  ~WorkerProcess();

  WorkerProcess(const WorkerProcess &) = delete;
  WorkerProcess &operator=(const WorkerProcess &) = delete;

  void start(Listener *listener);

  /// Stop delivering callbacks and kill the process.
  void detach();

  /// Returns false if the worker can't be written to. The caller will get
  /// onExit() soon after.
  bool send(const ControlMessage &message);

  /// SIGKILL the process. onExit() follows asynchronously.
  void kill();

  pid_t getPid() const { return pid; }
  bool hasExited() const { return exited; }

  /// Set by the owner when the process must not be given more jobs (it was
  /// killed, exited, or sent garbage).
  bool crashed = false;

  /// The job the worker is running, or "" if it is idle.
  std::string currentJobId;

  /// Whether the worker has been given a job yet.
  bool used = false;

private:
  void startRead();
  void handleExit();

  boost::asio::local::stream_protocol::socket socket;
  pid_t pid;
  bool verbose;
  bool exited = false;
  Listener *listener = nullptr;
  FrameDecoder decoder;
  std::array<std::uint8_t, 64 * 1024> readBuffer;
};

} // end namespace nbkernel

#endif // NBKERNEL_WORKERPROCESS_H
