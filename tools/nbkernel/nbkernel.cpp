#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <linenoise.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include "nbkernel/Node.h"
#include "nbkernel/SessionClient.h"
#include "nbkernel/ToolSupport.h"
#include "nbkernel/WorkerPool.h"

using namespace nbkernel;
namespace cl = llvm::cl;
namespace net = boost::asio;

static cl::OptionCategory nbkernel_category("nbkernel options");

static cl::SubCommand RunCommand("run",
                                 "Run files as the cells of one session");
static cl::SubCommand ReplCommand("repl", "Start an interactive session");
static cl::SubCommand PingCommand("ping", "Check that the workers respond");

// Defaults of the pool options, after NBKERNEL_* variables are applied.
static const PoolOptions env_options = PoolOptions::fromEnvironment();

static cl::opt<unsigned> pool_size("pool-size",
                                   cl::desc("Number of shared workers"),
                                   cl::init(env_options.size),
                                   cl::cat(nbkernel_category),
                                   cl::sub(*cl::AllSubCommands));

static cl::opt<unsigned>
    timeout_ms("timeout-ms", cl::desc("Default timeout of a cell, in ms"),
               cl::init(env_options.perJobTimeoutMs),
               cl::cat(nbkernel_category), cl::sub(*cl::AllSubCommands));

static cl::opt<unsigned>
    memory_mb("memory-mb", cl::desc("Heap limit of each worker, in MiB"),
              cl::init(env_options.memoryMb), cl::cat(nbkernel_category),
              cl::sub(*cl::AllSubCommands));

static cl::opt<unsigned long long> max_output_bytes(
    "max-output-bytes",
    cl::desc("Kill cells that print more than this many bytes"),
    cl::init(env_options.maxOutputBytes), cl::cat(nbkernel_category),
    cl::sub(*cl::AllSubCommands));

static cl::opt<unsigned>
    batch_ms("batch-ms", cl::desc("Output coalescing interval, in ms"),
             cl::init(env_options.batchMs), cl::cat(nbkernel_category),
             cl::sub(*cl::AllSubCommands));

static cl::opt<unsigned> cancel_grace_ms(
    "cancel-grace-ms",
    cl::desc("How long a cancelled cell may take to stop, in ms"),
    cl::init(env_options.cancelGraceMs), cl::cat(nbkernel_category),
    cl::sub(*cl::AllSubCommands));

static cl::opt<std::string>
    worker_path("worker", cl::desc("Path of the nbkernel-worker program"),
                cl::init(env_options.workerPath), cl::cat(nbkernel_category),
                cl::sub(*cl::AllSubCommands));

static cl::opt<std::string>
    workspace("workspace",
              cl::desc("Directory that holds the notebook sandboxes"),
              cl::init(env_options.workspaceRoot), cl::cat(nbkernel_category),
              cl::sub(*cl::AllSubCommands));

static cl::opt<std::string> transpiler(
    "transpiler",
    cl::desc("Shell command that turns TypeScript on stdin into JavaScript"),
    cl::init(env_options.transpilerCommand), cl::cat(nbkernel_category),
    cl::sub(*cl::AllSubCommands));

static cl::opt<std::string> installer(
    "installer",
    cl::desc("Shell command that installs a notebook's packages (empty to "
             "disable)"),
    cl::init(env_options.installerCommand), cl::cat(nbkernel_category),
    cl::sub(*cl::AllSubCommands));

static cl::opt<std::string>
    notebook_id("notebook", cl::desc("Notebook id, which selects the sandbox"),
                cl::init("cli"), cl::cat(nbkernel_category),
                cl::sub(RunCommand), cl::sub(ReplCommand));

static cl::opt<bool> verbose("verbose",
                             cl::desc("Log worker lifecycle events"),
                             cl::cat(nbkernel_category),
                             cl::sub(*cl::AllSubCommands));

static cl::list<std::string> input_files(cl::Positional, cl::OneOrMore,
                                         cl::desc("<files>"),
                                         cl::cat(nbkernel_category),
                                         cl::sub(RunCommand));

static PoolOptions getPoolOptions() {
  PoolOptions options;
  options.size = pool_size;
  options.perJobTimeoutMs = timeout_ms;
  options.memoryMb = memory_mb;
  options.maxOutputBytes = max_output_bytes;
  options.batchMs = batch_ms;
  options.cancelGraceMs = cancel_grace_ms;
  options.workerPath = worker_path;
  options.workspaceRoot = workspace;
  options.transpilerCommand = transpiler;
  options.installerCommand = installer;
  options.verbose = verbose;
  return options;
}

static void printOutput(const Node &output) {
  llvm::StringRef type = output.get_value_or<llvm::StringRef>("type", "");
  if (type == "stream") {
    llvm::StringRef text = output.get_value_or<llvm::StringRef>("text", "");
    if (output.get_value_or<llvm::StringRef>("name", "") == "stderr")
      llvm::errs() << text;
    else
      llvm::outs() << text;
  } else if (type == "display_data") {
    const Node &data = output.at_or_null("data");
    if (data.contains("text/plain"))
      llvm::outs() << data.get_value_or<llvm::StringRef>("text/plain", "")
                   << "\n";
    else
      llvm::outs() << data << "\n";
  } else if (type == "error") {
    llvm::errs() << output.get_value_or<llvm::StringRef>("ename", "Error")
                 << ": "
                 << output.get_value_or<llvm::StringRef>("evalue", "")
                 << "\n";
    const Node &traceback = output.at_or_null("traceback");
    if (traceback.is_list())
      for (const Node &line : traceback.list_range())
        if (line.is<llvm::StringRef>())
          llvm::errs() << "    " << line.as<llvm::StringRef>() << "\n";
  }
  llvm::outs().flush();
  llvm::errs().flush();
}

// Run one cell to completion. Ctrl-C cancels it.
static bool runCell(net::io_context &ioContext, SessionClient &session,
                    llvm::StringRef cellId, llvm::StringRef language,
                    std::string code) {
  ExecuteOptions options;
  options.cell.insert_or_assign("id", Node(utf8_string_arg, cellId));
  options.cell.insert_or_assign("language", Node(utf8_string_arg, language));
  options.code = std::move(code);
  options.notebookId = notebook_id;
  options.onOutput = printOutput;

  bool done = false, ok = false;
  session.execute(std::move(options),
                  [&](llvm::Expected<ExecutionResult> result) {
                    done = true;
                    if (!result) {
                      llvm::errs() << getArgv0() << ": "
                                   << llvm::toString(result.takeError())
                                   << "\n";
                      return;
                    }
                    for (const Node &output : result->outputs)
                      printOutput(output);
                    ok = result->execution.status == ExecutionStatus::Ok;
                  });

  net::signal_set signals(ioContext, SIGINT);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (!ec)
      session.cancel();
  });
  ioContext.restart();
  while (!done)
    ioContext.run_one();
  signals.cancel();
  return ok;
}

static int Run() {
  net::io_context ioContext;
  WorkerPool pool(ioContext, getPoolOptions());
  SessionClient session(pool, "cli");
  bool allOk = true;
  for (const std::string &file : input_files) {
    auto buffer = llvm::MemoryBuffer::getFileOrSTDIN(file);
    if (!buffer) {
      llvm::errs() << getArgv0() << ": can't read " << file << ": "
                   << buffer.getError().message() << "\n";
      return 1;
    }
    llvm::StringRef extension = llvm::sys::path::extension(file);
    llvm::StringRef language =
        (extension == ".ts" || extension == ".tsx") ? "ts" : "js";
    if (!runCell(ioContext, session, llvm::sys::path::stem(file), language,
                 (*buffer)->getBuffer().str()))
      allOk = false;
  }
  session.release();
  return allOk ? 0 : 1;
}

static int Repl() {
  net::io_context ioContext;
  WorkerPool pool(ioContext, getPoolOptions());
  SessionClient session(pool, "repl");
  session.setStateResetHandler([] {
    llvm::errs() << "(the worker was restarted; earlier variables are gone)\n";
  });

  linenoiseSetMultiLine(1);
  linenoiseHistorySetMaxLen(1000);
  unsigned cellNumber = 0;
  while (char *line = linenoise("> ")) {
    llvm::StringRef input = llvm::StringRef(line).trim();
    linenoiseHistoryAdd(line);
    if (input == ".exit") {
      linenoiseFree(line);
      break;
    }
    if (input.consume_front(".timeout")) {
      unsigned ms;
      if (input.trim().getAsInteger(10, ms) || ms == 0)
        llvm::errs() << "usage: .timeout <ms>\n";
      else
        pool.setPerJobTimeoutMs(ms);
      llvm::outs() << "timeout: " << pool.getPerJobTimeoutMs() << " ms\n";
    } else if (!input.empty()) {
      runCell(ioContext, session, "repl" + std::to_string(++cellNumber), "js",
              input.str());
    }
    linenoiseFree(line);
  }
  session.release();
  return 0;
}

static int Ping() {
  net::io_context ioContext;
  WorkerPool pool(ioContext, getPoolOptions());
  bool done = false;
  unsigned responded = 0, asked = 0;
  pool.ping([&](unsigned r, unsigned a) {
    responded = r;
    asked = a;
    done = true;
  });
  while (!done)
    ioContext.run_one();
  llvm::outs() << responded << " of " << asked << " workers responded\n";
  for (int pid : pool.workerPids())
    llvm::outs() << "  worker " << pid << "\n";
  return asked > 0 && responded == asked ? 0 : 1;
}

int main(int argc, char **argv) {
  InitTool X(argc, argv);

  // Hide LLVM's options, since they're mostly irrelevant.
  ReorganizeOptions([](cl::Option *O) {
    if (!OptionHasCategory(*O, nbkernel_category)) {
      O->setHiddenFlag(cl::Hidden);
      O->addSubCommand(*cl::AllSubCommands);
    }
  });

  cl::ParseCommandLineOptions(argc, argv, "nbkernel code execution kernel");

  if (RunCommand) {
    return Run();
  } else if (ReplCommand) {
    return Repl();
  } else if (PingCommand) {
    return Ping();
  } else {
    cl::PrintHelpMessage(false, true);
    return 0;
  }
}
