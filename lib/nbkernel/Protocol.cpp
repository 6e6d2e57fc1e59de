#include "nbkernel/Protocol.h"

#include <llvm/ADT/StringSwitch.h>

#include "nbkernel/FrameCodec.h"

using namespace nbkernel;

// Used when a RunCell or InvokeHandler message doesn't carry a timeout.
static constexpr std::uint32_t DefaultTimeoutMs = 10000;

llvm::StringRef nbkernel::getStatusName(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::Ok:
    return "ok";
  case ExecutionStatus::Error:
    return "error";
  case ExecutionStatus::Aborted:
    return "aborted";
  }
  llvm_unreachable("invalid ExecutionStatus");
}

std::optional<ExecutionStatus> nbkernel::parseStatusName(llvm::StringRef name) {
  return llvm::StringSwitch<std::optional<ExecutionStatus>>(name)
      .Case("ok", ExecutionStatus::Ok)
      .Case("error", ExecutionStatus::Error)
      .Case("aborted", ExecutionStatus::Aborted)
      .Default(std::nullopt);
}

Node nbkernel::makeStreamOutput(llvm::StringRef name, llvm::StringRef text) {
  return Node(node_map_arg, {{"type", "stream"},
                             {"name", Node(utf8_string_arg, name)},
                             {"text", Node(utf8_string_arg, text)}});
}

Node nbkernel::makeDisplayOutput(Node data, Node metadata) {
  return Node(node_map_arg, {{"type", "display_data"},
                             {"data", std::move(data)},
                             {"metadata", std::move(metadata)}});
}

Node nbkernel::makeErrorOutput(const ExecutionError &error) {
  Node traceback(node_list_arg);
  llvm::StringRef stack = error.stack ? llvm::StringRef(*error.stack) : "";
  while (!stack.empty()) {
    auto [line, rest] = stack.split('\n');
    traceback.emplace_back(Node(utf8_string_arg, line));
    stack = rest;
  }
  return Node(node_map_arg, {{"type", "error"},
                             {"ename", Node(utf8_string_arg, error.name)},
                             {"evalue", Node(utf8_string_arg, error.message)},
                             {"traceback", std::move(traceback)}});
}

// Serialization

static Node stringOrNull(const std::optional<std::string> &value) {
  return value ? Node(utf8_string_arg, *value) : Node(nullptr);
}

static Node executionErrorToNode(const ExecutionError &error) {
  Node result(node_map_arg, {{"name", Node(utf8_string_arg, error.name)},
                             {"message", Node(utf8_string_arg, error.message)}});
  if (error.stack)
    result["stack"] = Node(utf8_string_arg, *error.stack);
  return result;
}

Node nbkernel::toNode(const ExecutionRecord &record) {
  Node result(node_map_arg, {{"started", record.started},
                             {"ended", record.ended},
                             {"status", Node(utf8_string_arg,
                                             getStatusName(record.status))}});
  if (record.error)
    result["error"] = executionErrorToNode(*record.error);
  return result;
}

Node nbkernel::toNode(const ControlMessage &message) {
  return std::visit(
      Overloaded{
          [](const RunCell &msg) {
            return Node(node_map_arg,
                        {{"type", "RunCell"},
                         {"jobId", Node(utf8_string_arg, msg.jobId)},
                         {"cell", msg.cell},
                         {"code", Node(utf8_string_arg, msg.code)},
                         {"notebookId", Node(utf8_string_arg, msg.notebookId)},
                         {"env", msg.env},
                         {"timeoutMs", msg.timeoutMs},
                         {"globals", msg.globals}});
          },
          [](const InvokeHandler &msg) {
            return Node(node_map_arg,
                        {{"type", "InvokeHandler"},
                         {"jobId", Node(utf8_string_arg, msg.jobId)},
                         {"handlerId", Node(utf8_string_arg, msg.handlerId)},
                         {"notebookId", Node(utf8_string_arg, msg.notebookId)},
                         {"env", msg.env},
                         {"event", Node(utf8_string_arg, msg.event)},
                         {"payload", msg.payload},
                         {"componentId", stringOrNull(msg.componentId)},
                         {"cellId", stringOrNull(msg.cellId)},
                         {"timeoutMs", msg.timeoutMs},
                         {"globals", msg.globals}});
          },
          [](const Cancel &msg) {
            return Node(node_map_arg,
                        {{"type", "Cancel"},
                         {"jobId", Node(utf8_string_arg, msg.jobId)}});
          },
          [](const Ping &) { return Node(node_map_arg, {{"type", "Ping"}}); },
      },
      message);
}

Node nbkernel::toNode(const EventMessage &message) {
  return std::visit(
      Overloaded{
          [](const Ack &msg) {
            return Node(node_map_arg,
                        {{"type", "Ack"},
                         {"jobId", Node(utf8_string_arg, msg.jobId)}});
          },
          [](const Result &msg) {
            return Node(node_map_arg,
                        {{"type", "Result"},
                         {"jobId", Node(utf8_string_arg, msg.jobId)},
                         {"outputs", Node(msg.result.outputs)},
                         {"execution", toNode(msg.result.execution)}});
          },
          [](const ErrorMessage &msg) {
            Node result(node_map_arg,
                        {{"type", "Error"},
                         {"name", Node(utf8_string_arg, msg.name)},
                         {"message", Node(utf8_string_arg, msg.message)}});
            if (msg.jobId)
              result["jobId"] = Node(utf8_string_arg, *msg.jobId);
            if (msg.stack)
              result["stack"] = Node(utf8_string_arg, *msg.stack);
            return result;
          },
          [](const Pong &) { return Node(node_map_arg, {{"type", "Pong"}}); },
      },
      message);
}

// Validation

namespace {
// Helpers that check one field of a message map. Each returns false if the
// field is missing or has the wrong type.
class FieldReader {
public:
  explicit FieldReader(const Node &node) : node(node) {}

  bool string(llvm::StringRef key, std::string &out) const {
    const Node &value = node.at_or_null(key);
    if (!value.is<llvm::StringRef>())
      return false;
    out = value.as<std::string>();
    return true;
  }

  bool nonEmptyString(llvm::StringRef key, std::string &out) const {
    return string(key, out) && !out.empty();
  }

  // Missing and null are both accepted as "absent".
  bool optionalString(llvm::StringRef key,
                      std::optional<std::string> &out) const {
    const Node &value = node.at_or_null(key);
    if (value.is_null()) {
      out.reset();
      return true;
    }
    if (!value.is<llvm::StringRef>())
      return false;
    out = value.as<std::string>();
    return true;
  }

  // Missing and null become an empty map.
  bool map(llvm::StringRef key, Node &out) const {
    const Node &value = node.at_or_null(key);
    if (value.is_null()) {
      out = Node(node_map_arg);
      return true;
    }
    if (!value.is_map())
      return false;
    out = value;
    return true;
  }

  bool timeout(llvm::StringRef key, std::uint32_t &out) const {
    const Node &value = node.at_or_null(key);
    if (value.is_null()) {
      out = DefaultTimeoutMs;
      return true;
    }
    if (!value.is<std::uint32_t>())
      return false;
    out = value.as<std::uint32_t>();
    return out > 0 && out <= kMaxTimeoutMs;
  }

  const Node &get(llvm::StringRef key) const { return node.at_or_null(key); }

private:
  const Node &node;
};
} // end anonymous namespace

static llvm::StringRef getType(const Node &node) {
  if (!node.is_map())
    return "";
  return node.get_value_or<llvm::StringRef>("type", "");
}

std::optional<ControlMessage> nbkernel::parseControlMessage(const Node &node) {
  FieldReader fields(node);
  llvm::StringRef type = getType(node);
  if (type == "RunCell") {
    RunCell msg;
    if (!fields.nonEmptyString("jobId", msg.jobId) ||
        !fields.map("cell", msg.cell) || !fields.string("code", msg.code) ||
        !fields.string("notebookId", msg.notebookId) ||
        !fields.map("env", msg.env) ||
        !fields.timeout("timeoutMs", msg.timeoutMs) ||
        !fields.map("globals", msg.globals))
      return std::nullopt;
    return msg;
  }
  if (type == "InvokeHandler") {
    InvokeHandler msg;
    if (!fields.nonEmptyString("jobId", msg.jobId) ||
        !fields.nonEmptyString("handlerId", msg.handlerId) ||
        !fields.string("notebookId", msg.notebookId) ||
        !fields.map("env", msg.env) || !fields.string("event", msg.event) ||
        !fields.optionalString("componentId", msg.componentId) ||
        !fields.optionalString("cellId", msg.cellId) ||
        !fields.timeout("timeoutMs", msg.timeoutMs) ||
        !fields.map("globals", msg.globals))
      return std::nullopt;
    msg.payload = fields.get("payload");
    return msg;
  }
  if (type == "Cancel") {
    Cancel msg;
    if (!fields.nonEmptyString("jobId", msg.jobId))
      return std::nullopt;
    return msg;
  }
  if (type == "Ping")
    return Ping{};
  return std::nullopt;
}

std::optional<ExecutionRecord>
nbkernel::parseExecutionRecord(const Node &node) {
  if (!node.is_map())
    return std::nullopt;
  ExecutionRecord record;
  const Node &started = node.at_or_null("started");
  const Node &ended = node.at_or_null("ended");
  if (!started.is<std::int64_t>() || !ended.is<std::int64_t>())
    return std::nullopt;
  record.started = started.as<std::int64_t>();
  record.ended = ended.as<std::int64_t>();
  auto status =
      parseStatusName(node.get_value_or<llvm::StringRef>("status", ""));
  if (!status)
    return std::nullopt;
  record.status = *status;
  const Node &error = node.at_or_null("error");
  if (!error.is_null()) {
    FieldReader fields(error);
    ExecutionError value;
    if (!error.is_map() || !fields.string("name", value.name) ||
        !fields.string("message", value.message) ||
        !fields.optionalString("stack", value.stack))
      return std::nullopt;
    record.error = std::move(value);
  }
  return record;
}

std::optional<EventMessage> nbkernel::parseEventMessage(const Node &node) {
  FieldReader fields(node);
  llvm::StringRef type = getType(node);
  if (type == "Ack") {
    Ack msg;
    if (!fields.nonEmptyString("jobId", msg.jobId))
      return std::nullopt;
    return msg;
  }
  if (type == "Result") {
    Result msg;
    if (!fields.nonEmptyString("jobId", msg.jobId))
      return std::nullopt;
    const Node &outputs = fields.get("outputs");
    if (!outputs.is_list())
      return std::nullopt;
    for (const Node &output : outputs.list_range()) {
      if (!output.is_map())
        return std::nullopt;
      msg.result.outputs.push_back(output);
    }
    auto record = parseExecutionRecord(fields.get("execution"));
    if (!record)
      return std::nullopt;
    msg.result.execution = std::move(*record);
    return msg;
  }
  if (type == "Error") {
    ErrorMessage msg;
    if (!fields.optionalString("jobId", msg.jobId) ||
        !fields.string("name", msg.name) ||
        !fields.string("message", msg.message) ||
        !fields.optionalString("stack", msg.stack))
      return std::nullopt;
    return msg;
  }
  if (type == "Pong")
    return Pong{};
  return std::nullopt;
}

std::vector<std::uint8_t> nbkernel::encodeMessage(const ControlMessage &message) {
  return encodeFrame(FrameKind::Message, toNode(message).saveAsCBOR());
}

std::vector<std::uint8_t> nbkernel::encodeMessage(const EventMessage &message) {
  return encodeFrame(FrameKind::Message, toNode(message).saveAsCBOR());
}

std::optional<ControlMessage>
nbkernel::decodeControlMessage(llvm::ArrayRef<std::uint8_t> payload) {
  auto node = Node::loadFromCBOR(payload);
  if (!node) {
    llvm::consumeError(node.takeError());
    return std::nullopt;
  }
  return parseControlMessage(*node);
}

std::optional<EventMessage>
nbkernel::decodeEventMessage(llvm::ArrayRef<std::uint8_t> payload) {
  auto node = Node::loadFromCBOR(payload);
  if (!node) {
    llvm::consumeError(node.takeError());
    return std::nullopt;
  }
  return parseEventMessage(*node);
}

llvm::StringRef nbkernel::getJobId(const ControlMessage &message) {
  return std::visit(Overloaded{
                        [](const RunCell &msg) -> llvm::StringRef {
                          return msg.jobId;
                        },
                        [](const InvokeHandler &msg) -> llvm::StringRef {
                          return msg.jobId;
                        },
                        [](const Cancel &msg) -> llvm::StringRef {
                          return msg.jobId;
                        },
                        [](const Ping &) -> llvm::StringRef { return ""; },
                    },
                    message);
}
