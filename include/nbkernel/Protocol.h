#ifndef NBKERNEL_PROTOCOL_H
#define NBKERNEL_PROTOCOL_H

// Structured messages exchanged between the orchestrator and a worker. Each
// message is a CBOR map with a "type" field, sent in a FrameKind::Message
// frame. Receivers validate every message against its schema and silently
// drop anything that doesn't match.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include "Node.h"

namespace nbkernel {

/// Largest timeout a job may request.
constexpr std::uint32_t kMaxTimeoutMs = 600000;

/// Installs the packages listed in package.json in the current directory.
constexpr char kDefaultInstallerCommand[] = "npm install --no-audit --no-fund";

enum class ExecutionStatus { Ok, Error, Aborted };

llvm::StringRef getStatusName(ExecutionStatus status);
std::optional<ExecutionStatus> parseStatusName(llvm::StringRef name);

struct ExecutionError {
  std::string name;
  std::string message;
  std::optional<std::string> stack;
};

/// The "execution" record of a finished job. Times are epoch milliseconds.
struct ExecutionRecord {
  std::int64_t started = 0;
  std::int64_t ended = 0;
  ExecutionStatus status = ExecutionStatus::Ok;
  std::optional<ExecutionError> error;
};

/// Terminal outcome of a job: the outputs that were not streamed (the final
/// display value, error outputs, timeout notes) plus the execution record.
struct ExecutionResult {
  std::vector<Node> outputs;
  ExecutionRecord execution;
};

// Output record helpers. These are the shapes callers receive.
Node makeStreamOutput(llvm::StringRef name, llvm::StringRef text);
Node makeDisplayOutput(Node data, Node metadata = Node(node_map_arg));
Node makeErrorOutput(const ExecutionError &error);

// Control messages (orchestrator to worker).

struct RunCell {
  std::string jobId;
  Node cell = Node(node_map_arg);
  std::string code;
  std::string notebookId;
  Node env = Node(node_map_arg);
  std::uint32_t timeoutMs = 0;
  Node globals = Node(node_map_arg);
};

struct InvokeHandler {
  std::string jobId;
  std::string handlerId;
  std::string notebookId;
  Node env = Node(node_map_arg);
  std::string event;
  Node payload;
  std::optional<std::string> componentId;
  std::optional<std::string> cellId;
  std::uint32_t timeoutMs = 0;
  Node globals = Node(node_map_arg);
};

struct Cancel {
  std::string jobId;
};

struct Ping {};

using ControlMessage = std::variant<RunCell, InvokeHandler, Cancel, Ping>;

// Event messages (worker to orchestrator).

/// Sent when a worker accepts a job.
struct Ack {
  std::string jobId;
};

struct Result {
  std::string jobId;
  ExecutionResult result;
};

/// Sent when a job fails outside of user code.
struct ErrorMessage {
  std::optional<std::string> jobId;
  std::string name;
  std::string message;
  std::optional<std::string> stack;
};

struct Pong {};

using EventMessage = std::variant<Ack, Result, ErrorMessage, Pong>;

Node toNode(const ControlMessage &message);
Node toNode(const EventMessage &message);
Node toNode(const ExecutionRecord &record);

/// Validate a decoded message. Returns std::nullopt for anything that doesn't
/// match the schema of a known message type.
std::optional<ControlMessage> parseControlMessage(const Node &node);
std::optional<EventMessage> parseEventMessage(const Node &node);
std::optional<ExecutionRecord> parseExecutionRecord(const Node &node);

/// Encode a message as a complete FrameKind::Message frame.
std::vector<std::uint8_t> encodeMessage(const ControlMessage &message);
std::vector<std::uint8_t> encodeMessage(const EventMessage &message);

/// Decode the payload of a FrameKind::Message frame.
std::optional<ControlMessage>
decodeControlMessage(llvm::ArrayRef<std::uint8_t> payload);
std::optional<EventMessage>
decodeEventMessage(llvm::ArrayRef<std::uint8_t> payload);

/// Return the jobId of a message, or an empty string if it has none.
llvm::StringRef getJobId(const ControlMessage &message);

} // end namespace nbkernel

#endif // NBKERNEL_PROTOCOL_H
