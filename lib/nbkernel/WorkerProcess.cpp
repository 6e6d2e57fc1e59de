#include "WorkerProcess.h"

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/write.hpp>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

using namespace nbkernel;
namespace net = boost::asio;
using net::local::stream_protocol;

// The worker reads control messages from this descriptor.
static constexpr int kWorkerFD = 3;

WorkerProcess::Listener::~Listener() {}

llvm::Expected<std::shared_ptr<WorkerProcess>>
WorkerProcess::spawn(net::io_context &ioContext, const PoolOptions &options) {
  if (!llvm::sys::fs::can_execute(options.workerPath))
    return llvm::createStringError(
        std::make_error_code(std::errc::resource_unavailable_try_again),
        "Can't execute worker " + options.workerPath);

  stream_protocol::socket parentSocket(ioContext), childSocket(ioContext);
  boost::system::error_code ec;
  net::local::connect_pair(parentSocket, childSocket, ec);
  if (ec)
    return llvm::createStringError(
        std::make_error_code(std::errc::resource_unavailable_try_again),
        "Can't create socket pair: " + ec.message());

  // Neither end may leak into other workers. The child's copy on fd 3 is
  // made by dup2, which clears the flag.
  ::fcntl(parentSocket.native_handle(), F_SETFD, FD_CLOEXEC);
  ::fcntl(childSocket.native_handle(), F_SETFD, FD_CLOEXEC);

  // Everything the child needs is prepared before fork(), since only
  // async-signal-safe functions may be called between fork() and exec().
  std::vector<std::string> args = {
      options.workerPath,
      "--memory-mb=" + std::to_string(options.memoryMb),
      "--batch-ms=" + std::to_string(options.batchMs),
      "--workspace=" + options.workspaceRoot,
  };
  if (!options.transpilerCommand.empty())
    args.push_back("--transpiler=" + options.transpilerCommand);
  args.push_back("--installer=" + options.installerCommand);
  std::vector<char *> argv;
  for (std::string &arg : args)
    argv.push_back(arg.data());
  argv.push_back(nullptr);
  int childFD = childSocket.native_handle();

  pid_t pid = ::fork();
  if (pid < 0)
    return llvm::createStringError(
        std::make_error_code(std::errc::resource_unavailable_try_again),
        "Can't fork worker");

  if (pid == 0) {
    if (childFD == kWorkerFD)
      ::fcntl(kWorkerFD, F_SETFD, 0);
    else if (::dup2(childFD, kWorkerFD) < 0)
      ::_exit(127);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGPIPE, SIG_DFL);
    ::execv(argv[0], argv.data());
    ::_exit(127);
  }

  childSocket.close(ec);
  if (options.verbose)
    llvm::errs() << "nbkernel: started worker " << pid << "\n";
  return std::make_shared<WorkerProcess>(std::move(parentSocket), pid,
                                         options.verbose);
}

WorkerProcess::WorkerProcess(stream_protocol::socket socket, pid_t pid,
                             bool verbose)
    : socket(std::move(socket)), pid(pid), verbose(verbose) {}

WorkerProcess::~WorkerProcess() {
  if (!exited) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
  }
}

void WorkerProcess::start(Listener *listener) {
  this->listener = listener;
  startRead();
}

void WorkerProcess::detach() {
  listener = nullptr;
  kill();
}

void WorkerProcess::startRead() {
  auto self = shared_from_this();
  socket.async_read_some(
      net::buffer(readBuffer),
      [self](const boost::system::error_code &ec, std::size_t size) {
        if (ec) {
          self->handleExit();
          return;
        }
        self->decoder.feed(
            llvm::ArrayRef<std::uint8_t>(self->readBuffer.data(), size));
        while (auto frame = self->decoder.next()) {
          if (!self->listener)
            return;
          self->listener->onFrame(*self, std::move(*frame));
          // The listener may have killed us.
          if (self->exited)
            return;
        }
        if (self->decoder.isCorrupt()) {
          llvm::errs() << "nbkernel: corrupt stream from worker " << self->pid
                       << "\n";
          self->handleExit();
          return;
        }
        self->startRead();
      });
}

bool WorkerProcess::send(const ControlMessage &message) {
  if (exited)
    return false;
  std::vector<std::uint8_t> bytes = encodeMessage(message);
  boost::system::error_code ec;
  net::write(socket, net::buffer(bytes), ec);
  if (ec) {
    if (verbose)
      llvm::errs() << "nbkernel: can't write to worker " << pid << ": "
                   << ec.message() << "\n";
    kill();
    return false;
  }
  return true;
}

void WorkerProcess::kill() {
  crashed = true;
  if (exited)
    return;
  ::kill(pid, SIGKILL);
  boost::system::error_code ec;
  // Wakes the pending read with operation_aborted, which leads to onExit().
  socket.close(ec);
}

void WorkerProcess::handleExit() {
  if (exited)
    return;
  exited = true;
  crashed = true;
  // EOF doesn't guarantee the process is gone, so make sure before waiting.
  ::kill(pid, SIGKILL);
  int status = 0;
  ::waitpid(pid, &status, 0);
  if (verbose) {
    llvm::errs() << "nbkernel: worker " << pid;
    if (WIFEXITED(status))
      llvm::errs() << " exited with status " << WEXITSTATUS(status) << "\n";
    else if (WIFSIGNALED(status))
      llvm::errs() << " killed by signal " << WTERMSIG(status) << "\n";
    else
      llvm::errs() << " exited\n";
  }
  boost::system::error_code ec;
  socket.close(ec);
  if (listener) {
    Listener *l = listener;
    listener = nullptr;
    l->onExit(*this);
  }
}
