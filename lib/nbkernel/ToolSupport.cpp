#include "nbkernel/ToolSupport.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

using namespace nbkernel;

static const char *argv0 = "<program>";

bool nbkernel::OptionHasCategory(llvm::cl::Option &O,
                                 llvm::cl::OptionCategory &C) {
  for (llvm::cl::OptionCategory *C2 : O.Categories)
    if (C2 == &C)
      return true;
  return false;
}

static void printVersion(llvm::raw_ostream &os) {
  os << "nbkernel version " << NBKERNEL_VERSION << "\n";
}

InitTool::InitTool(int &argc, char **&argv) {
  llvm::setBugReportMsg(
      R"(
Fatal error! This is probably a bug in nbkernel.
Please include the whole error message when you report it.

)");

  // Like llvm::InitLLVM, but the pretty stack trace is registered after the
  // signal handler, so it's printed last, where people will see it.
  llvm::sys::PrintStackTraceOnErrorSignal(argv[0]);
  stack_printer.emplace(argc, argv);
  llvm::install_out_of_memory_new_handler();
  llvm::cl::SetVersionPrinter(printVersion);

  argv0 = argv[0];
}

llvm::StringRef nbkernel::getArgv0() { return argv0; }
