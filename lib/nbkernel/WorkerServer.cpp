#include "nbkernel/WorkerServer.h"

#include <thread>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <llvm/Support/raw_ostream.h>
#include <sys/socket.h>
#include <unistd.h>

#include "nbkernel/FrameCodec.h"
#include "nbkernel/Support.h"

using namespace nbkernel;

static SandboxOptions makeSandboxOptions(const WorkerOptions &options) {
  SandboxOptions result;
  result.memoryLimit = options.memoryMb * 1024 * 1024;
  result.workspaceRoot = options.workspaceRoot;
  result.transpiler = Transpiler::createDefault(options.transpilerCommand);
  result.installerCommand = options.installerCommand;
  return result;
}

WorkerServer::WorkerServer(int fd, WorkerOptions options)
    : writer(::dup(fd), options.batchInterval),
      sandbox(makeSandboxOptions(options)), readFD(fd) {}

WorkerServer::~WorkerServer() {
  if (readFD >= 0)
    ::close(readFD);
}

void WorkerServer::readMessages(int fd) {
  boost::asio::io_context ioContext;
  boost::asio::local::stream_protocol::socket socket(
      ioContext, boost::asio::local::stream_protocol(), fd);
  FrameDecoder decoder;
  std::vector<std::uint8_t> buffer(64 * 1024);
  while (true) {
    boost::system::error_code ec;
    std::size_t size =
        socket.read_some(boost::asio::buffer(buffer.data(), buffer.size()), ec);
    if (ec)
      break;
    decoder.feed(llvm::ArrayRef<std::uint8_t>(buffer.data(), size));
    while (auto frame = decoder.next()) {
      if (frame->kind != FrameKind::Message)
        continue;
      if (auto message = decodeControlMessage(frame->payload))
        handleMessage(std::move(*message));
    }
    if (decoder.isCorrupt()) {
      llvm::errs() << "nbkernel-worker: corrupt input from orchestrator\n";
      break;
    }
  }

  std::lock_guard<std::mutex> lock(mutex);
  closed = true;
  if (currentToken)
    currentToken->cancel();
  cv.notify_all();
}

static std::string getJobId(const std::variant<RunCell, InvokeHandler> &job) {
  return std::visit([](const auto &job) { return job.jobId; }, job);
}

void WorkerServer::handleMessage(ControlMessage message) {
  std::visit(
      Overloaded{
          [&](RunCell &msg) {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(std::move(msg));
            cv.notify_all();
          },
          [&](InvokeHandler &msg) {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push_back(std::move(msg));
            cv.notify_all();
          },
          [&](Cancel &msg) {
            std::unique_lock<std::mutex> lock(mutex);
            if (msg.jobId == currentJobId && currentToken) {
              currentToken->cancel();
              lock.unlock();
              writer.discardPending();
              return;
            }
            for (auto i = queue.begin(); i != queue.end(); ++i) {
              if (getJobId(*i) != msg.jobId)
                continue;
              queue.erase(i);
              lock.unlock();
              Result result;
              result.jobId = msg.jobId;
              result.result.execution.started = currentTimeMillis();
              result.result.execution.ended = result.result.execution.started;
              result.result.execution.status = ExecutionStatus::Aborted;
              writer.writeMessage(result);
              return;
            }
          },
          [&](Ping &) { writer.writeMessage(Pong{}); },
      },
      message);
}

void WorkerServer::runJob(const Job &job,
                          const std::shared_ptr<CancellationToken> &token) {
  std::string jobId = getJobId(job);
  writer.writeMessage(Ack{jobId});

  auto result = std::visit(
      Overloaded{
          [&](const RunCell &msg) {
            return sandbox.runCell(msg, writer, *token);
          },
          [&](const InvokeHandler &msg) {
            return sandbox.invokeHandler(msg, writer, *token);
          },
      },
      job);

  {
    std::lock_guard<std::mutex> lock(mutex);
    currentJobId.clear();
    currentToken.reset();
  }
  if (token->getReason() == CancellationToken::Reason::Cancelled)
    writer.discardPending();

  if (!result) {
    std::string message = llvm::toString(result.takeError());
    llvm::errs() << "nbkernel-worker: job " << jobId << " failed: " << message
                 << "\n";
    writer.writeMessage(ErrorMessage{jobId, "Error", message, std::nullopt});
    return;
  }
  writer.writeMessage(Result{jobId, std::move(*result)});
}

int WorkerServer::serve() {
  int fd = ::dup(readFD);
  if (fd < 0) {
    llvm::errs() << "nbkernel-worker: can't duplicate socket\n";
    return 1;
  }
  std::thread reader([this, fd] { readMessages(fd); });

  while (true) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&] { return closed || !queue.empty(); });
    if (closed)
      break;
    Job job = std::move(queue.front());
    queue.pop_front();
    // The job becomes current in the same critical section that dequeues it,
    // so a Cancel always finds it either queued or running.
    std::uint32_t timeoutMs =
        std::visit([](const auto &job) { return job.timeoutMs; }, job);
    auto token = std::make_shared<CancellationToken>(
        CancellationToken::Clock::now() + std::chrono::milliseconds(timeoutMs));
    currentJobId = getJobId(job);
    currentToken = token;
    lock.unlock();
    runJob(job, token);
    if (writer.isBroken())
      break;
  }

  // Wake the reader if it is still blocked.
  ::shutdown(readFD, SHUT_RDWR);
  reader.join();
  return 0;
}
