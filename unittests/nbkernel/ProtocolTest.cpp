#include "nbkernel/Protocol.h"

#include <optional>
#include <variant>

#include "nbkernel/FrameCodec.h"
#include "gtest/gtest.h"

using namespace nbkernel;

namespace {

Node runCellNode() {
  return Node(node_map_arg,
              {{"type", "RunCell"},
               {"jobId", "s:c:1"},
               {"cell", Node(node_map_arg, {{"id", "c"}, {"language", "js"}})},
               {"code", "1 + 1"},
               {"notebookId", "nb"},
               {"env", Node(node_map_arg)},
               {"timeoutMs", 500},
               {"globals", Node(node_map_arg, {{"x", 1}})}});
}

TEST(ProtocolTest, ParseRunCell) {
  auto message = parseControlMessage(runCellNode());
  ASSERT_TRUE(message.has_value());
  ASSERT_TRUE(std::holds_alternative<RunCell>(*message));
  const RunCell &run = std::get<RunCell>(*message);
  EXPECT_EQ("s:c:1", run.jobId);
  EXPECT_EQ("1 + 1", run.code);
  EXPECT_EQ("nb", run.notebookId);
  EXPECT_EQ(500u, run.timeoutMs);
  EXPECT_EQ(Node(1), run.globals["x"]);
  EXPECT_EQ("s:c:1", getJobId(*message));
}

TEST(ProtocolTest, DefaultsForMissingFields) {
  Node node = runCellNode();
  node.erase("env");
  node.erase("globals");
  node.erase("timeoutMs");
  auto message = parseControlMessage(node);
  ASSERT_TRUE(message.has_value());
  const RunCell &run = std::get<RunCell>(*message);
  EXPECT_TRUE(run.env.is_map());
  EXPECT_TRUE(run.globals.is_map());
  EXPECT_EQ(10000u, run.timeoutMs);
}

TEST(ProtocolTest, TimeoutBounds) {
  Node node = runCellNode();
  node["timeoutMs"] = kMaxTimeoutMs;
  EXPECT_TRUE(parseControlMessage(node).has_value());
  node["timeoutMs"] = kMaxTimeoutMs + 1;
  EXPECT_FALSE(parseControlMessage(node).has_value());
  node["timeoutMs"] = 0;
  EXPECT_FALSE(parseControlMessage(node).has_value());
  node["timeoutMs"] = -5;
  EXPECT_FALSE(parseControlMessage(node).has_value());
  node["timeoutMs"] = 1.5;
  EXPECT_FALSE(parseControlMessage(node).has_value());
}

TEST(ProtocolTest, RejectInvalidControlMessages) {
  EXPECT_FALSE(parseControlMessage(Node(1)).has_value());
  EXPECT_FALSE(parseControlMessage(Node(node_map_arg)).has_value());
  EXPECT_FALSE(
      parseControlMessage(Node(node_map_arg, {{"type", "Launch"}})).has_value());

  Node node = runCellNode();
  node["jobId"] = "";
  EXPECT_FALSE(parseControlMessage(node).has_value());
  node = runCellNode();
  node["code"] = 12;
  EXPECT_FALSE(parseControlMessage(node).has_value());
  node = runCellNode();
  node["cell"] = "c";
  EXPECT_FALSE(parseControlMessage(node).has_value());

  EXPECT_FALSE(
      parseControlMessage(Node(node_map_arg, {{"type", "Cancel"}})).has_value());
  EXPECT_FALSE(parseControlMessage(Node(node_map_arg, {{"type", "Cancel"},
                                                       {"jobId", 4}}))
                   .has_value());
}

TEST(ProtocolTest, ParseInvokeHandler) {
  Node node(node_map_arg, {{"type", "InvokeHandler"},
                           {"jobId", "j"},
                           {"handlerId", "h1"},
                           {"notebookId", "nb"},
                           {"event", "click"},
                           {"payload", Node(node_list_arg, {1, 2})},
                           {"componentId", "button"},
                           {"cellId", nullptr}});
  auto message = parseControlMessage(node);
  ASSERT_TRUE(message.has_value());
  const InvokeHandler &invoke = std::get<InvokeHandler>(*message);
  EXPECT_EQ("h1", invoke.handlerId);
  EXPECT_EQ("click", invoke.event);
  EXPECT_EQ(Node(node_list_arg, {1, 2}), invoke.payload);
  EXPECT_EQ(std::optional<std::string>("button"), invoke.componentId);
  EXPECT_FALSE(invoke.cellId.has_value());

  node["handlerId"] = "";
  EXPECT_FALSE(parseControlMessage(node).has_value());
}

TEST(ProtocolTest, ControlMessageFrames) {
  RunCell run;
  run.jobId = "j1";
  run.code = "console.log(1)";
  run.notebookId = "nb";
  run.timeoutMs = 1000;
  auto frame = tryDecodeFrame(encodeMessage(ControlMessage(run)));
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(FrameKind::Message, frame->kind);
  auto decoded = decodeControlMessage(frame->payload);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ("console.log(1)", std::get<RunCell>(*decoded).code);

  frame = tryDecodeFrame(encodeMessage(ControlMessage(Ping{})));
  ASSERT_TRUE(frame.has_value());
  decoded = decodeControlMessage(frame->payload);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(std::holds_alternative<Ping>(*decoded));
  EXPECT_EQ("", getJobId(*decoded));

  // Not CBOR.
  std::vector<std::uint8_t> garbage = {0xff, 0x00};
  EXPECT_FALSE(decodeControlMessage(garbage).has_value());
}

TEST(ProtocolTest, ResultMessage) {
  Result result;
  result.jobId = "j2";
  result.result.outputs.push_back(
      makeDisplayOutput(Node(node_map_arg, {{"text/plain", "2"}})));
  result.result.execution.started = 1000;
  result.result.execution.ended = 1010;
  result.result.execution.status = ExecutionStatus::Error;
  result.result.execution.error =
      ExecutionError{"TypeError", "x is not a function", std::nullopt};

  Node node = toNode(EventMessage(result));
  EXPECT_EQ(Node("Result"), node["type"]);
  EXPECT_EQ(Node("error"), node["execution"]["status"]);
  EXPECT_EQ(Node("TypeError"), node["execution"]["error"]["name"]);

  auto frame = tryDecodeFrame(encodeMessage(EventMessage(result)));
  ASSERT_TRUE(frame.has_value());
  auto decoded = decodeEventMessage(frame->payload);
  ASSERT_TRUE(decoded.has_value());
  const Result &parsed = std::get<Result>(*decoded);
  EXPECT_EQ("j2", parsed.jobId);
  ASSERT_EQ(1u, parsed.result.outputs.size());
  EXPECT_EQ(result.result.outputs[0], parsed.result.outputs[0]);
  EXPECT_EQ(ExecutionStatus::Error, parsed.result.execution.status);
  EXPECT_EQ(1010, parsed.result.execution.ended);
  ASSERT_TRUE(parsed.result.execution.error.has_value());
  EXPECT_EQ("x is not a function", parsed.result.execution.error->message);
}

TEST(ProtocolTest, RejectInvalidEventMessages) {
  Node execution(node_map_arg,
                 {{"started", 1}, {"ended", 2}, {"status", "ok"}});
  Node node(node_map_arg, {{"type", "Result"},
                           {"jobId", "j"},
                           {"outputs", Node(node_list_arg)},
                           {"execution", execution}});
  EXPECT_TRUE(parseEventMessage(node).has_value());

  node["execution"]["status"] = "finished";
  EXPECT_FALSE(parseEventMessage(node).has_value());
  node["execution"] = execution;
  node["outputs"] = Node(node_list_arg, {"text"});
  EXPECT_FALSE(parseEventMessage(node).has_value());
  node["outputs"] = Node(node_map_arg);
  EXPECT_FALSE(parseEventMessage(node).has_value());
  node["outputs"] = Node(node_list_arg);
  node["execution"]["started"] = "now";
  EXPECT_FALSE(parseEventMessage(node).has_value());

  EXPECT_FALSE(parseEventMessage(Node(node_map_arg, {{"type", "Ack"}}))
                   .has_value());
  EXPECT_FALSE(parseEventMessage(Node(node_map_arg, {{"type", "Error"},
                                                     {"name", "Error"}}))
                   .has_value());
}

TEST(ProtocolTest, ErrorMessageWithoutJob) {
  auto decoded = parseEventMessage(Node(
      node_map_arg,
      {{"type", "Error"}, {"name", "Error"}, {"message", "bad input"}}));
  ASSERT_TRUE(decoded.has_value());
  const ErrorMessage &error = std::get<ErrorMessage>(*decoded);
  EXPECT_FALSE(error.jobId.has_value());
  EXPECT_EQ("bad input", error.message);
}

TEST(ProtocolTest, OutputRecords) {
  Node stream = makeStreamOutput("stdout", "hello\n");
  EXPECT_EQ(Node("stream"), stream["type"]);
  EXPECT_EQ(Node("stdout"), stream["name"]);
  EXPECT_EQ(Node("hello\n"), stream["text"]);

  Node display = makeDisplayOutput(Node(node_map_arg, {{"text/plain", "1"}}));
  EXPECT_EQ(Node("display_data"), display["type"]);
  EXPECT_EQ(Node("1"), display["data"]["text/plain"]);
  EXPECT_TRUE(display["metadata"].is_map());

  Node error = makeErrorOutput(
      ExecutionError{"RangeError", "too big", std::string("line 1\nline 2")});
  EXPECT_EQ(Node("error"), error["type"]);
  EXPECT_EQ(Node("RangeError"), error["ename"]);
  EXPECT_EQ(Node("too big"), error["evalue"]);
  EXPECT_EQ(Node(node_list_arg, {"line 1", "line 2"}), error["traceback"]);
}

TEST(ProtocolTest, StatusNames) {
  EXPECT_EQ("ok", getStatusName(ExecutionStatus::Ok));
  EXPECT_EQ("error", getStatusName(ExecutionStatus::Error));
  EXPECT_EQ("aborted", getStatusName(ExecutionStatus::Aborted));
  EXPECT_EQ(ExecutionStatus::Aborted, parseStatusName("aborted"));
  EXPECT_FALSE(parseStatusName("Aborted").has_value());
}

} // end anonymous namespace
