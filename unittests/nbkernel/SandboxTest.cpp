#include "nbkernel/Sandbox.h"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include "TestingSupport.h"

using namespace nbkernel;
using ::testing::HasSubstr;

namespace {

class SandboxTest : public ::testing::Test {
protected:
  SandboxTest() : sandbox(makeOptions(dir.get(), 64)) {}

  static SandboxOptions makeOptions(llvm::StringRef root, std::size_t mb) {
    SandboxOptions options;
    options.workspaceRoot = root.str();
    options.memoryLimit = mb * 1024 * 1024;
    options.installerCommand = "";
    return options;
  }

  static RunCell makeCell(llvm::StringRef code, llvm::StringRef notebookId,
                          std::uint32_t timeoutMs) {
    RunCell job;
    job.jobId = "job";
    job.cell = Node(node_map_arg, {{"id", "c1"}, {"language", "js"}});
    job.code = code.str();
    job.notebookId = notebookId.str();
    job.timeoutMs = timeoutMs;
    return job;
  }

  ExecutionResult run(const RunCell &job, CancellationToken &token) {
    auto result = sandbox.runCell(job, sink, token);
    EXPECT_TRUE(static_cast<bool>(result))
        << llvm::toString(result.takeError());
    return result ? std::move(*result) : ExecutionResult();
  }

  ExecutionResult run(const RunCell &job) {
    CancellationToken token(CancellationToken::Clock::now() +
                            std::chrono::milliseconds(job.timeoutMs));
    return run(job, token);
  }

  ExecutionResult run(llvm::StringRef code, llvm::StringRef notebookId = "nb",
                      std::uint32_t timeoutMs = 5000) {
    return run(makeCell(code, notebookId, timeoutMs));
  }

  // The text/plain form of the final value, or "" if there is none.
  static std::string lastValue(const ExecutionResult &result) {
    for (const Node &output : result.outputs)
      if (output.get_value_or<llvm::StringRef>("type", "") == "display_data")
        return output.at_or_null("data").get_value_or<std::string>(
            "text/plain", "");
    return "";
  }

  TempDir dir;
  RecordingSink sink;
  Sandbox sandbox;
};

TEST_F(SandboxTest, Console) {
  auto result = run("console.log('hi', 1, {a: [1, 'x']}); console.error('bad')");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("hi 1 { a: [1, \"x\"] }\n", sink.stdoutText);
  EXPECT_EQ("bad\n", sink.stderrText);
  EXPECT_TRUE(result.outputs.empty());
  EXPECT_LE(result.execution.started, result.execution.ended);
}

TEST_F(SandboxTest, LastValue) {
  auto result = run("var x = 2; x * 3");
  ASSERT_EQ(1u, result.outputs.size());
  EXPECT_EQ(Node("display_data"), result.outputs[0]["type"]);
  EXPECT_EQ("6", lastValue(result));
  EXPECT_TRUE(result.outputs[0]["data"].contains("application/json"));

  EXPECT_EQ("\"text\"", lastValue(run("'text'")));
  EXPECT_TRUE(run("var y = 1;").outputs.empty());
  EXPECT_TRUE(run("(function () {})").outputs.empty());
}

TEST_F(SandboxTest, Display) {
  run("display({a: 1}); display(undefined); display('two')");
  ASSERT_EQ(2u, sink.displays.size());
  const Node &data = sink.displays[0]["data"];
  EXPECT_EQ(Node("{ a: 1 }"), data["text/plain"]);
  EXPECT_EQ(Node(node_map_arg, {{"a", 1}}), data["application/json"]);
  EXPECT_EQ(Node("display_data"), sink.displays[1]["type"]);
}

TEST_F(SandboxTest, Errors) {
  auto result = run("null.foo");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  ASSERT_TRUE(result.execution.error.has_value());
  EXPECT_EQ("TypeError", result.execution.error->name);
  ASSERT_EQ(1u, result.outputs.size());
  EXPECT_EQ(Node("error"), result.outputs[0]["type"]);
  EXPECT_EQ(Node("TypeError"), result.outputs[0]["ename"]);

  result = run("throw 'boom'");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("Error", result.execution.error->name);
  EXPECT_EQ("boom", result.execution.error->message);

  result = run("var = ;");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("SyntaxError", result.execution.error->name);

  // Output before the error is kept.
  sink.stdoutText.clear();
  result = run("console.log('before'); throw new RangeError('no')");
  EXPECT_EQ("before\n", sink.stdoutText);
  EXPECT_EQ("RangeError", result.execution.error->name);
  EXPECT_EQ("no", result.execution.error->message);
}

TEST_F(SandboxTest, GlobalsPersist) {
  run("var counter = 1; function bump() { return ++counter; }");
  EXPECT_EQ("2", lastValue(run("bump()")));
  EXPECT_EQ("3", lastValue(run("bump()")));
  EXPECT_EQ("nb", sandbox.getNotebookId());
}

TEST_F(SandboxTest, NotebooksAreIsolated) {
  run("var secret = 42;", "a");
  EXPECT_EQ("\"undefined\"", lastValue(run("typeof secret", "b")));
  EXPECT_EQ("b", sandbox.getNotebookId());
  // Switching back starts from scratch too.
  EXPECT_EQ("\"undefined\"", lastValue(run("typeof secret", "a")));
}

TEST_F(SandboxTest, InjectedGlobals) {
  RunCell job = makeCell("x + y.length", "nb", 5000);
  job.globals = Node(node_map_arg, {{"x", 40}, {"y", Node(node_list_arg, {1, 2})}});
  EXPECT_EQ("42", lastValue(run(job)));
}

TEST_F(SandboxTest, Environment) {
  RunCell job = makeCell("process.env.FOO + ' ' + typeof process.env.HOME",
                         "nb", 5000);
  job.env = Node(node_map_arg,
                 {{"variables", Node(node_map_arg, {{"FOO", "bar"}})},
                  {"packages", Node(node_map_arg, {{"lodash", "^4.17.0"}})}});
  EXPECT_EQ("\"bar undefined\"", lastValue(run(job)));
  llvm::SmallString<128> manifest(sandbox.getSandboxDir());
  llvm::sys::path::append(manifest, "package.json");
  EXPECT_TRUE(llvm::sys::fs::exists(manifest));

  // Variables are replaced, not merged.
  EXPECT_EQ("\"undefined\"", lastValue(run("typeof process.env.FOO")));
}

TEST_F(SandboxTest, Timers) {
  auto result = run("setTimeout(function () { console.log('later'); }, 20);\n"
                    "var id = setTimeout(function () { console.log('never'); }, 10);\n"
                    "clearTimeout(id);\n"
                    "console.log('now');");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("now\nlater\n", sink.stdoutText);
}

TEST_F(SandboxTest, Intervals) {
  run("var n = 0;\n"
      "var id = setInterval(function () {\n"
      "  console.log(++n);\n"
      "  if (n === 3) clearInterval(id);\n"
      "}, 5);");
  EXPECT_EQ("1\n2\n3\n", sink.stdoutText);
}

TEST_F(SandboxTest, Promises) {
  EXPECT_EQ("5", lastValue(run("new Promise(function (resolve) {\n"
                               "  setTimeout(function () { resolve(5); }, 10);\n"
                               "})")));
  EXPECT_EQ("[1, 2]",
            lastValue(run("Promise.all([1, Promise.resolve(2)])")));

  run("Promise.resolve().then(function () { console.log('micro'); });\n"
      "console.log('sync');");
  EXPECT_EQ("sync\nmicro\n", sink.stdoutText);

  auto result = run("Promise.reject(new RangeError('nope'))");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("RangeError", result.execution.error->name);
}

TEST_F(SandboxTest, ModernSyntax) {
  auto result = run(
      "const double = x => x * 2;\n"
      "let [a, b = 5, ...rest] = [1, undefined, 3, 4];\n"
      "const {p, q: {r}, ...others} = {p: 1, q: {r: 2}, s: 3, t: 4};\n"
      "const name = 'kernel';\n"
      "`${double(a)}-${b}-${rest.length}-${p + r}-"
      "${Object.keys(others).join('')}-${name}`");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("\"2-5-2-3-st-kernel\"", lastValue(result));

  EXPECT_EQ("[1, 4, 9]",
            lastValue(run("const squares = [];\n"
                          "for (const n of [1, 2, 3]) squares.push(n * n);\n"
                          "squares")));
  EXPECT_EQ("6", lastValue(run("const add = (x, ...ys) => "
                               "ys.reduce((s, y) => s + y, x);\n"
                               "add(...[1, 2], 3)")));
}

TEST_F(SandboxTest, Classes) {
  auto result = run(
      "class Shape {\n"
      "  constructor(name) { this.name = name; }\n"
      "  area() { return 0; }\n"
      "  describe() { return `${this.name} with area ${this.area()}`; }\n"
      "  static create(name) { return new this(name); }\n"
      "}\n"
      "class Square extends Shape {\n"
      "  sides = 4;\n"
      "  constructor(size) { super('square'); this.size = size; }\n"
      "  area() { return this.size * this.size; }\n"
      "  get perimeter() { return this.sides * this.size; }\n"
      "  describe() { return super.describe() + '!'; }\n"
      "}\n"
      "const sq = new Square(3);\n"
      "[sq.describe(), sq.perimeter, sq instanceof Shape,\n"
      " Shape.create('blob').describe()]");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("[\"square with area 9!\", 12, true, \"blob with area 0\"]",
            lastValue(result));

  result = run("class NotFound extends Error {\n"
               "  constructor(what) { super(what + ' not found'); "
               "this.name = 'NotFound'; }\n"
               "}\n"
               "throw new NotFound('page')");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("NotFound", result.execution.error->name);
  EXPECT_EQ("page not found", result.execution.error->message);
}

TEST_F(SandboxTest, AsyncFunctions) {
  auto result = run(
      "async function delayed(value, ms) {\n"
      "  await new Promise(resolve => setTimeout(resolve, ms));\n"
      "  return value * 2;\n"
      "}\n"
      "const sum = async (...values) => {\n"
      "  let total = 0;\n"
      "  for (const v of values) total += await delayed(v, 5);\n"
      "  return total;\n"
      "};\n"
      "sum(1, 2, 3)");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("12", lastValue(result));
}

TEST_F(SandboxTest, TopLevelAwait) {
  auto result = run("const base = await Promise.resolve(40);\n"
                    "function inc(x) { return x + 1; }\n"
                    "let result = inc(base) + 1;\n"
                    "result");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("42", lastValue(result));
  // Declarations stay global.
  EXPECT_EQ("82", lastValue(run("result + base")));

  run("try {\n"
      "  await Promise.reject(new Error('x'));\n"
      "} catch (e) {\n"
      "  console.log('caught', e.message);\n"
      "}");
  EXPECT_EQ("caught x\n", sink.stdoutText);

  result = run("await Promise.reject(new RangeError('no'))");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("RangeError", result.execution.error->name);
}

TEST_F(SandboxTest, TopLevelAwaitTimeout) {
  auto start = std::chrono::steady_clock::now();
  auto result = run("await new Promise(r => setTimeout(r, 5000))", "nb", 100);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  EXPECT_LT(elapsed, std::chrono::milliseconds(350));
  EXPECT_EQ(ExecutionStatus::Aborted, result.execution.status);
  ASSERT_TRUE(result.execution.error.has_value());
  EXPECT_EQ("TimeoutError", result.execution.error->name);
  EXPECT_THAT(sink.stderrText,
              HasSubstr("[timeout] Execution exceeded 100ms and was stopped."));
}

TEST_F(SandboxTest, UnsupportedSyntax) {
  auto result = run("const a = {};\nconst b = a?.c;");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("SyntaxError", result.execution.error->name);
  EXPECT_EQ("Optional chaining (?.) is not supported (line 2)",
            result.execution.error->message);
}

TEST_F(SandboxTest, AsyncErrors) {
  auto result = run("setTimeout(function () { throw new Error('late'); }, 1);");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("late", result.execution.error->message);
}

TEST_F(SandboxTest, Timeout) {
  auto start = std::chrono::steady_clock::now();
  auto result =
      run("new Promise(function (r) { setTimeout(r, 5000); })", "nb", 100);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
  EXPECT_EQ(ExecutionStatus::Aborted, result.execution.status);
  ASSERT_TRUE(result.execution.error.has_value());
  EXPECT_EQ("TimeoutError", result.execution.error->name);
  EXPECT_EQ("Execution timed out after 100ms", result.execution.error->message);
  EXPECT_THAT(sink.stderrText,
              HasSubstr("[timeout] Execution exceeded 100ms and was stopped."));
  EXPECT_TRUE(result.outputs.empty());

  // Leftover timers don't leak into the next cell.
  sink.stdoutText.clear();
  EXPECT_EQ("2", lastValue(run("1 + 1")));
}

TEST_F(SandboxTest, Cancel) {
  CancellationToken token;
  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.cancel();
  });
  auto result = run(makeCell("setInterval(function () {}, 5);\n"
                             "new Promise(function () {})",
                             "nb", 60000),
                    token);
  canceller.join();
  EXPECT_EQ(ExecutionStatus::Aborted, result.execution.status);
  EXPECT_EQ("AbortError", result.execution.error->name);
  EXPECT_EQ("", sink.stderrText);
}

TEST_F(SandboxTest, FileSystem) {
  auto result = run("fs.mkdirSync('sub');\n"
                    "fs.writeFileSync('sub/a.txt', 'data');\n"
                    "fs.appendFileSync('sub/a.txt', '+more');\n"
                    "[fs.readFileSync('sub/a.txt', 'utf8'),\n"
                    " fs.existsSync('sub/b.txt'),\n"
                    " fs.readdirSync('sub').join(',')]");
  EXPECT_EQ(ExecutionStatus::Ok, result.execution.status);
  EXPECT_EQ("[\"data+more\", false, \"a.txt\"]", lastValue(result));
  llvm::SmallString<128> path(dir.get());
  llvm::sys::path::append(path, "nb", "sub", "a.txt");
  EXPECT_TRUE(llvm::sys::fs::exists(path));
  EXPECT_EQ("\"" + sandbox.getSandboxDir().str() + "\"",
            lastValue(run("process.cwd()")));

  EXPECT_EQ("false", lastValue(run("fs.unlinkSync('sub/a.txt');\n"
                                   "fs.existsSync('sub/a.txt')")));
}

TEST_F(SandboxTest, FileSystemConfinement) {
  auto result = run("fs.readFileSync('../other/secret.txt', 'utf8')");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_THAT(result.execution.error->message,
              HasSubstr("outside the sandbox"));

  result = run("fs.writeFileSync('/tmp/escaped.txt', 'x')");
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("false", lastValue(run("fs.existsSync('/etc/passwd')")));
}

TEST_F(SandboxTest, ResolvePath) {
  auto check = [](llvm::StringRef path) -> std::string {
    auto result = Sandbox::resolvePath("/w/nb", path);
    if (!result) {
      llvm::consumeError(result.takeError());
      return "<error>";
    }
    return *result;
  };
  EXPECT_EQ("/w/nb/a/b", check("a/b"));
  EXPECT_EQ("/w/nb/a", check("./a"));
  EXPECT_EQ("/w/nb", check("."));
  EXPECT_EQ("/w/nb/c", check("sub/../c"));
  EXPECT_EQ("/w/nb/x", check("/w/nb/x"));
  EXPECT_EQ("<error>", check(".."));
  EXPECT_EQ("<error>", check("../nb2/x"));
  EXPECT_EQ("<error>", check("/w/nb2"));
  EXPECT_EQ("<error>", check("/etc/passwd"));
}

TEST(SandboxDirNameTest, Sanitize) {
  EXPECT_EQ("nb-1_a.b", Sandbox::getSandboxDirName("nb-1_a.b"));
  EXPECT_EQ("a_b", Sandbox::getSandboxDirName("a/b"));
  EXPECT_EQ("__", Sandbox::getSandboxDirName(".."));
  EXPECT_EQ("_", Sandbox::getSandboxDirName(""));
  EXPECT_EQ("_etc_passwd", Sandbox::getSandboxDirName("/etc/passwd"));
}

TEST_F(SandboxTest, Handlers) {
  EXPECT_EQ("\"btn\"",
            lastValue(run("var clicks = 0;\n"
                          "registerHandler(function (ctx) {\n"
                          "  clicks++;\n"
                          "  console.log(ctx.event, ctx.payload.n, ctx.componentId);\n"
                          "  return clicks;\n"
                          "}, 'btn')")));

  InvokeHandler job;
  job.jobId = "h";
  job.handlerId = "btn";
  job.notebookId = "nb";
  job.event = "click";
  job.payload = Node(node_map_arg, {{"n", 3}});
  job.componentId = "c1";
  job.timeoutMs = 5000;
  CancellationToken token(CancellationToken::Clock::now() +
                          std::chrono::seconds(5));
  auto result = sandbox.invokeHandler(job, sink, token);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(ExecutionStatus::Ok, result->execution.status);
  EXPECT_EQ("click 3 c1\n", sink.stdoutText);
  EXPECT_EQ("1", lastValue(*result));

  job.handlerId = "nope";
  result = sandbox.invokeHandler(job, sink, token);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(ExecutionStatus::Error, result->execution.status);
  EXPECT_EQ("Unknown UI handler: nope", result->execution.error->message);
}

TEST_F(SandboxTest, TypeScriptWithoutTranspiler) {
  RunCell job = makeCell("var x: number = 1;", "nb", 5000);
  job.cell["language"] = "ts";
  auto result = run(job);
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("TranspileError", result.execution.error->name);
}

TEST(SandboxMemoryTest, HeapLimit) {
  TempDir dir;
  SandboxOptions options;
  options.workspaceRoot = dir.get().str();
  options.memoryLimit = 16 * 1024 * 1024;
  Sandbox sandbox(std::move(options));
  RecordingSink sink;
  CancellationToken token(CancellationToken::Clock::now() +
                          std::chrono::seconds(30));
  RunCell job;
  job.jobId = "big";
  job.notebookId = "nb";
  job.timeoutMs = 30000;
  job.code = "(function () {\n"
             "  var a = [];\n"
             "  for (var i = 0; i < 100000000; i++) a.push('item ' + i);\n"
             "})()";
  auto result = sandbox.runCell(job, sink, token);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(ExecutionStatus::Error, result->execution.status);

  // The heap is usable again once the garbage is collected.
  job.code = "1 + 1";
  result = sandbox.runCell(job, sink, token);
  ASSERT_TRUE(static_cast<bool>(result)) << llvm::toString(result.takeError());
  EXPECT_EQ(ExecutionStatus::Ok, result->execution.status);
}

void writeFile(llvm::StringRef path, llvm::StringRef contents) {
  ASSERT_FALSE(llvm::sys::fs::create_directories(
      llvm::sys::path::parent_path(path)));
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  ASSERT_FALSE(ec) << ec.message();
  os << contents;
}

std::string readFile(llvm::StringRef path) {
  auto buffer = llvm::MemoryBuffer::getFile(path);
  return buffer ? (*buffer)->getBuffer().str() : "";
}

// Packages come from a local directory, copied into place by a shell
// command that stands in for npm.
class PackagesTest : public ::testing::Test {
protected:
  PackagesTest() {
    registry = dir.get().str() + "/registry";
    writeFile(registry + "/greet/package.json",
              "{\"main\": \"lib/greet.js\"}\n");
    writeFile(registry + "/greet/lib/greet.js",
              "const punct = require('./punct');\n"
              "module.exports = (name) => `hi ${name}${punct}`;\n");
    writeFile(registry + "/greet/lib/punct.json", "\"!\"\n");
    workspace = dir.get().str() + "/work";
  }

  std::string copyCommand() const {
    return "echo run >> install.log && mkdir -p node_modules && cp -R '" +
           registry + "/greet' node_modules/";
  }

  std::unique_ptr<Sandbox> makeSandbox(const std::string &installer) {
    SandboxOptions options;
    options.workspaceRoot = workspace;
    options.memoryLimit = 64 * 1024 * 1024;
    options.installerCommand = installer;
    return std::make_unique<Sandbox>(std::move(options));
  }

  ExecutionResult run(Sandbox &sandbox, llvm::StringRef code,
                      const Node &packages) {
    RunCell job;
    job.jobId = "job";
    job.cell = Node(node_map_arg, {{"id", "c1"}, {"language", "js"}});
    job.code = code.str();
    job.notebookId = "nb";
    job.timeoutMs = 10000;
    job.env = Node(node_map_arg, {{"packages", packages}});
    CancellationToken token(CancellationToken::Clock::now() +
                            std::chrono::seconds(10));
    auto result = sandbox.runCell(job, sink, token);
    EXPECT_TRUE(static_cast<bool>(result))
        << llvm::toString(result.takeError());
    return result ? std::move(*result) : ExecutionResult();
  }

  std::string sandboxFile(llvm::StringRef name) const {
    return workspace + "/nb/" + name.str();
  }

  static std::string lastValue(const ExecutionResult &result) {
    for (const Node &output : result.outputs)
      if (output.get_value_or<llvm::StringRef>("type", "") == "display_data")
        return output.at_or_null("data").get_value_or<std::string>(
            "text/plain", "");
    return "";
  }

  TempDir dir;
  std::string registry;
  std::string workspace;
  RecordingSink sink;
};

TEST_F(PackagesTest, InstallAndRequire) {
  auto sandbox = makeSandbox(copyCommand());
  Node packages(node_map_arg, {{"greet", "^1.0.0"}});
  auto result = run(*sandbox, "const greet = require('greet');\ngreet('ada')",
                    packages);
  ASSERT_EQ(ExecutionStatus::Ok, result.execution.status)
      << result.execution.error->message;
  EXPECT_EQ("\"hi ada!\"", lastValue(result));
  EXPECT_EQ("[env] Installing dependencies: greet@^1.0.0\n"
            "[env] Install complete\n",
            sink.stdoutText);
  EXPECT_EQ("", sink.stderrText);
  EXPECT_THAT(readFile(sandboxFile("package.json")), HasSubstr("\"greet\""));

  // The same packages aren't installed again, and modules are cached.
  sink.stdoutText.clear();
  result = run(*sandbox, "require('greet') === greet", packages);
  EXPECT_EQ("true", lastValue(result));
  EXPECT_EQ("", sink.stdoutText);
  EXPECT_EQ("run\n", readFile(sandboxFile("install.log")));

  // Nor by a new worker using the same directory.
  auto restarted = makeSandbox(copyCommand());
  result = run(*restarted, "require('greet')('bo')", packages);
  EXPECT_EQ("\"hi bo!\"", lastValue(result));
  EXPECT_EQ("run\n", readFile(sandboxFile("install.log")));

  // A changed set is.
  packages["left"] = "1.0.0";
  result = run(*restarted, "require('greet')('cy')", packages);
  EXPECT_EQ("\"hi cy!\"", lastValue(result));
  EXPECT_EQ("[env] Installing dependencies: left@1.0.0, greet@^1.0.0\n"
            "[env] Install complete\n",
            sink.stdoutText);
  EXPECT_EQ("run\nrun\n", readFile(sandboxFile("install.log")));

  // Dropping every package clears them out.
  sink.stdoutText.clear();
  result = run(*restarted, "require('greet')", Node(node_map_arg));
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  EXPECT_EQ("Cannot find module 'greet'", result.execution.error->message);
  EXPECT_EQ("[env] Clearing all dependencies (no packages)\n",
            sink.stdoutText);
  EXPECT_FALSE(llvm::sys::fs::exists(sandboxFile("node_modules")));
}

TEST_F(PackagesTest, InstallFailure) {
  auto sandbox = makeSandbox("echo 'E404 greet not found' >&2; exit 1");
  Node packages(node_map_arg, {{"greet", "^1.0.0"}});
  auto result = run(*sandbox, "console.log('ran')", packages);
  EXPECT_EQ(ExecutionStatus::Error, result.execution.status);
  ASSERT_TRUE(result.execution.error.has_value());
  EXPECT_EQ("InstallError", result.execution.error->name);
  EXPECT_EQ("Failed to install notebook dependencies: E404 greet not found",
            result.execution.error->message);
  ASSERT_EQ(1u, result.outputs.size());
  EXPECT_EQ(Node("error"), result.outputs[0]["type"]);
  EXPECT_EQ("[env] Installing dependencies: greet@^1.0.0\n", sink.stdoutText);
  EXPECT_EQ("[env] Install failed: E404 greet not found\n", sink.stderrText);

  // The next job tries again.
  result = run(*sandbox, "1", packages);
  EXPECT_EQ("InstallError", result.execution.error->name);
  EXPECT_EQ("[env] Install failed: E404 greet not found\n"
            "[env] Install failed: E404 greet not found\n",
            sink.stderrText);
}

TEST_F(PackagesTest, RequireConfinement) {
  auto sandbox = makeSandbox("");
  Node none(node_map_arg);
  EXPECT_EQ("42", lastValue(run(*sandbox,
                                "fs.writeFileSync('util.js', "
                                "'exports.twice = x => x * 2;');\n"
                                "require('./util').twice(21)",
                                none)));
  EXPECT_EQ("true", lastValue(run(*sandbox, "require('fs') === fs", none)));
  EXPECT_EQ("\"MODULE_NOT_FOUND\"",
            lastValue(run(*sandbox,
                          "var code;\n"
                          "try { require('missing'); } catch (e) { code = e.code; }\n"
                          "code",
                          none)));

  for (const char *request : {"../other/x.js", "/etc/passwd",
                              "greet/../../util"}) {
    auto result = run(*sandbox, "require('" + std::string(request) + "')",
                      none);
    EXPECT_EQ(ExecutionStatus::Error, result.execution.status) << request;
    EXPECT_THAT(result.execution.error->message,
                HasSubstr("outside the sandbox"))
        << request;
  }

  // Syntax errors in a module name the file.
  auto result = run(*sandbox,
                    "fs.writeFileSync('bad.js', 'var a = b?.c;');\n"
                    "require('./bad')",
                    none);
  EXPECT_EQ("SyntaxError", result.execution.error->name);
  EXPECT_THAT(result.execution.error->message, HasSubstr("bad.js"));
  EXPECT_THAT(result.execution.error->message,
              HasSubstr("Optional chaining (?.) is not supported"));
}

TEST(ResolveModuleTest, Lookup) {
  TempDir dir;
  std::string root = dir.get().str();
  writeFile(root + "/node_modules/a/index.js", "");
  writeFile(root + "/node_modules/b/package.json", "{\"main\": \"main\"}");
  writeFile(root + "/node_modules/b/main.js", "");
  writeFile(root + "/lib.js", "");
  writeFile(root + "/data.json", "{}");
  writeFile(root + "/sub/index.js", "");

  auto check = [&](llvm::StringRef request,
                   llvm::StringRef from = "") -> std::string {
    auto result = Sandbox::resolveModule(
        root, request, from.empty() ? llvm::StringRef(root) : from);
    if (!result) {
      llvm::consumeError(result.takeError());
      return "<error>";
    }
    return llvm::StringRef(*result).substr(root.size()).str();
  };
  EXPECT_EQ("/node_modules/a/index.js", check("a"));
  EXPECT_EQ("/node_modules/b/main.js", check("b"));
  EXPECT_EQ("/lib.js", check("./lib"));
  EXPECT_EQ("/data.json", check("./data"));
  EXPECT_EQ("/sub/index.js", check("./sub"));
  EXPECT_EQ("/lib.js", check("../lib.js", root + "/sub"));
  EXPECT_EQ("<error>", check("c"));
  EXPECT_EQ("<error>", check("lib"));
  EXPECT_EQ("<error>", check("a/../../lib"));
  EXPECT_EQ("<error>", check("../x"));
  EXPECT_EQ("<error>", check("/etc/passwd"));
}

} // end anonymous namespace
