#ifndef NBKERNEL_SESSIONCLIENT_H
#define NBKERNEL_SESSIONCLIENT_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <llvm/ADT/StringRef.h>

#include "Node.h"
#include "WorkerPool.h"

namespace nbkernel {

enum class SessionMode {
  /// Every job of the session runs on one reserved worker, so globals carry
  /// over from cell to cell.
  Sticky,
  /// Jobs run on whichever shared worker is free.
  Shared,
};

/// Receives stream, display_data and other output records as they are
/// produced.
using OutputHandler = std::function<void(const Node &output)>;

struct ExecuteOptions {
  /// Cell descriptor; "id" is used in the job id and "language" selects the
  /// transpiler.
  Node cell = Node(node_map_arg);
  std::string code;
  std::string notebookId;
  Node env = Node(node_map_arg);
  Node globals = Node(node_map_arg);
  std::optional<std::uint32_t> timeoutMs;
  OutputHandler onOutput;
};

struct InteractionOptions {
  std::string handlerId;
  std::string event;
  Node payload;
  std::optional<std::string> componentId;
  std::optional<std::string> cellId;
  std::string notebookId;
  Node env = Node(node_map_arg);
  Node globals = Node(node_map_arg);
  std::optional<std::uint32_t> timeoutMs;
  OutputHandler onOutput;
};

/// What a caller (for example, the handler of one open notebook connection)
/// holds for the lifetime of its session.
///
/// In sticky mode the session reserves a worker on first use and keeps it
/// until release(). If that worker has to be killed (after a cancel that it
/// ignored, a timeout, or a crash), a new one takes its place and the
/// session's globals are lost; the state reset handler is told about it
/// before the next job runs.
class SessionClient {
public:
  SessionClient(WorkerPool &pool, std::string sessionId,
                SessionMode mode = SessionMode::Sticky);

  /// Calls release().
  ~SessionClient();

  SessionClient(const SessionClient &) = delete;
  SessionClient &operator=(const SessionClient &) = delete;

  void execute(ExecuteOptions options, ResultHandler handler);
  void invokeInteraction(InteractionOptions options, ResultHandler handler);

  /// Cancel the current job, if there is one.
  void cancel();

  /// Kill the session's worker. Must be called when the session ends, or the
  /// worker process is leaked until the pool is destroyed.
  void release();

  void setStateResetHandler(std::function<void()> handler) {
    onStateReset = std::move(handler);
  }

  llvm::StringRef getSessionId() const { return sessionId; }
  SessionMode getMode() const { return mode; }
  bool isReleased() const { return released; }

  /// The most recently submitted job that hasn't finished, or "".
  llvm::StringRef getCurrentJobId() const { return state->currentJobId; }

  /// Process id of the reserved worker, or -1.
  int getWorkerPid() const;

  /// Make a job id of the form "{sessionId}:{cellId}:{epochMillis}". The
  /// ids of one session are strictly increasing.
  std::string makeJobId(llvm::StringRef cellId);

private:
  struct State {
    std::string currentJobId;
  };

  void submit(std::string jobId, Job job, OutputHandler onOutput,
              ResultHandler handler);

  WorkerPool &pool;
  std::string sessionId;
  SessionMode mode;
  std::unique_ptr<ReservedWorker> reserved;
  unsigned seenGeneration = 0;
  std::int64_t lastJobMillis = 0;
  bool released = false;
  std::function<void()> onStateReset;

  // Shared with the result handlers of outstanding jobs, which may run after
  // the session is gone.
  std::shared_ptr<State> state;
};

} // end namespace nbkernel

#endif // NBKERNEL_SESSIONCLIENT_H
