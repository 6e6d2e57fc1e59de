#include "nbkernel/SessionClient.h"

#include <algorithm>

#include <boost/asio/post.hpp>

#include "nbkernel/Protocol.h"
#include "nbkernel/Support.h"

using namespace nbkernel;

SessionClient::SessionClient(WorkerPool &pool, std::string sessionId,
                             SessionMode mode)
    : pool(pool), sessionId(std::move(sessionId)), mode(mode),
      state(std::make_shared<State>()) {}

SessionClient::~SessionClient() { release(); }

std::string SessionClient::makeJobId(llvm::StringRef cellId) {
  lastJobMillis = std::max(currentTimeMillis(), lastJobMillis + 1);
  return sessionId + ":" + cellId.str() + ":" + std::to_string(lastJobMillis);
}

int SessionClient::getWorkerPid() const {
  return reserved ? reserved->getPid() : -1;
}

void SessionClient::execute(ExecuteOptions options, ResultHandler handler) {
  std::string cellId = options.cell.get_value_or<std::string>("id", "cell");
  Job job;
  job.kind = JobKind::Execute;
  job.cell = std::move(options.cell);
  job.code = std::move(options.code);
  job.notebookId = std::move(options.notebookId);
  job.env = std::move(options.env);
  job.globals = std::move(options.globals);
  job.timeoutMs = options.timeoutMs;
  submit(makeJobId(cellId), std::move(job), std::move(options.onOutput),
         std::move(handler));
}

void SessionClient::invokeInteraction(InteractionOptions options,
                                      ResultHandler handler) {
  Job job;
  job.kind = JobKind::InvokeHandler;
  job.handlerId = std::move(options.handlerId);
  job.event = std::move(options.event);
  job.payload = std::move(options.payload);
  job.componentId = std::move(options.componentId);
  job.cellId = std::move(options.cellId);
  job.notebookId = std::move(options.notebookId);
  job.env = std::move(options.env);
  job.globals = std::move(options.globals);
  job.timeoutMs = options.timeoutMs;
  submit(makeJobId(job.handlerId), std::move(job),
         std::move(options.onOutput), std::move(handler));
}

void SessionClient::submit(std::string jobId, Job job, OutputHandler onOutput,
                           ResultHandler handler) {
  if (released) {
    boost::asio::post(pool.getIOContext(), [handler = std::move(handler)] {
      handler(llvm::createStringError(
          std::make_error_code(std::errc::operation_canceled),
          "Session released"));
    });
    return;
  }

  if (onOutput) {
    job.onStdout = [onOutput](llvm::StringRef text) {
      onOutput(makeStreamOutput("stdout", text));
    };
    job.onStderr = [onOutput](llvm::StringRef text) {
      onOutput(makeStreamOutput("stderr", text));
    };
    job.onDisplay = [onOutput](const Node &output) { onOutput(output); };
  }

  state->currentJobId = jobId;
  std::weak_ptr<State> weak = state;
  ResultHandler finish = [weak, jobId,
                          handler = std::move(handler)](
                             llvm::Expected<ExecutionResult> result) {
    if (auto state = weak.lock())
      if (state->currentJobId == jobId)
        state->currentJobId.clear();
    handler(std::move(result));
  };

  if (mode == SessionMode::Shared) {
    pool.run(jobId, std::move(job), std::move(finish));
    return;
  }

  if (!reserved)
    reserved = pool.reserve();
  unsigned generation = reserved->getGeneration();
  if (generation != seenGeneration) {
    seenGeneration = generation;
    if (onStateReset)
      onStateReset();
  }
  reserved->run(jobId, std::move(job), std::move(finish));
}

void SessionClient::cancel() {
  if (state->currentJobId.empty())
    return;
  std::string jobId = state->currentJobId;
  if (reserved)
    reserved->cancel(jobId);
  else
    pool.cancel(jobId);
}

void SessionClient::release() {
  if (released)
    return;
  released = true;
  if (reserved) {
    reserved->release();
    reserved.reset();
  } else if (!state->currentJobId.empty()) {
    pool.cancel(std::string(state->currentJobId));
  }
}
