// The worker process started by the nbkernel orchestrator. It reads jobs from
// the socket on fd 3 and runs them until the orchestrator closes the socket.

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

#include "nbkernel/ToolSupport.h"
#include "nbkernel/WorkerPool.h"
#include "nbkernel/WorkerServer.h"

using namespace nbkernel;
namespace cl = llvm::cl;

static cl::OptionCategory worker_category("nbkernel worker options");

static cl::opt<unsigned>
    memory_mb("memory-mb", cl::desc("Heap limit of the script engine, in MiB"),
              cl::init(256), cl::cat(worker_category));

static cl::opt<unsigned>
    batch_ms("batch-ms",
             cl::desc("How long to coalesce stdout and stderr text, in ms"),
             cl::init(25), cl::cat(worker_category));

static cl::opt<std::string> workspace(
    "workspace", cl::desc("Directory that holds the notebook sandboxes"),
    cl::init(PoolOptions::getDefaultWorkspaceRoot()), cl::cat(worker_category));

static cl::opt<std::string> transpiler(
    "transpiler",
    cl::desc("Shell command that turns TypeScript on stdin into JavaScript"),
    cl::init(std::string(
        llvm::StringRef::withNullAsEmpty(std::getenv("NBKERNEL_TRANSPILER")))),
    cl::cat(worker_category));

static cl::opt<std::string> installer(
    "installer",
    cl::desc("Shell command that installs a notebook's packages (empty to "
             "disable)"),
    cl::init(kDefaultInstallerCommand), cl::cat(worker_category));

static cl::opt<int> channel_fd("fd",
                               cl::desc("Descriptor connected to the "
                                        "orchestrator"),
                               cl::init(3), cl::Hidden,
                               cl::cat(worker_category));

int main(int argc, char **argv) {
  InitTool X(argc, argv);

  cl::HideUnrelatedOptions(worker_category);
  cl::ParseCommandLineOptions(argc, argv, "nbkernel worker");

  if (::fcntl(channel_fd, F_GETFD) < 0) {
    llvm::errs() << getArgv0() << ": fd " << channel_fd
                 << " is not open; this program is started by nbkernel\n";
    return 1;
  }

  // Writes to a closed socket are reported as errors instead.
  std::signal(SIGPIPE, SIG_IGN);

  WorkerOptions options;
  options.memoryMb = memory_mb;
  options.batchInterval = std::chrono::milliseconds(batch_ms);
  options.workspaceRoot = workspace;
  options.transpilerCommand = transpiler;
  options.installerCommand = installer;

  WorkerServer server(channel_fd, std::move(options));
  return server.serve();
}
