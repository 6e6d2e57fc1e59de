#ifndef NBKERNEL_TOOL_SUPPORT_H
#define NBKERNEL_TOOL_SUPPORT_H

// Utilities shared by the nbkernel tools.

#include <optional>

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/PrettyStackTrace.h>

namespace nbkernel {

bool OptionHasCategory(llvm::cl::Option &O, llvm::cl::OptionCategory &C);

template <typename F> static inline void ReorganizeOptions(F f) {
  // Reorganize options into subcommands.
  llvm::SmallVector<llvm::cl::Option *, 0> AllOptions;
  for (auto &I : llvm::cl::TopLevelSubCommand->OptionsMap)
    AllOptions.push_back(I.second);
  for (llvm::cl::Option *O : AllOptions) {
    if (O->isInAllSubCommands())
      continue; // --help, --version, etc.

    // Option::addSubCommand() only takes effect if the option is removed
    // before the change and re-added afterwards.
    O->removeArgument();
    f(O);
    O->addArgument();
  }
}

/// Sets up crash handlers and the --version printer. Create one at the top of
/// main().
class InitTool {
  std::optional<llvm::PrettyStackTraceProgram> stack_printer;

public:
  InitTool(int &argc, char **&argv);
};

llvm::StringRef getArgv0();

} // end namespace nbkernel

#endif // NBKERNEL_TOOL_SUPPORT_H
