#ifndef NBKERNEL_SANDBOX_H
#define NBKERNEL_SANDBOX_H

#include <cstddef>
#include <memory>
#include <string>

#include <duktape.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include "CancellationToken.h"
#include "FrameWriter.h"
#include "Node.h"
#include "Protocol.h"
#include "Transpiler.h"

namespace nbkernel {

struct SandboxOptions {
  /// Most memory the script heap may use, in bytes. 0 means no limit.
  std::size_t memoryLimit = 256 * 1024 * 1024;

  /// Each notebook gets its own directory under this one.
  std::string workspaceRoot;

  std::unique_ptr<Transpiler> transpiler;

  /// Shell command that installs the packages in package.json, run in the
  /// sandbox directory. Empty means packages are recorded but not installed.
  std::string installerCommand = kDefaultInstallerCommand;
};

/// Executes cell code and UI handlers inside the worker process.
///
/// There is one script heap at a time, belonging to one notebook. Jobs for
/// the same notebook reuse it, so globals persist from cell to cell; a job
/// for a different notebook destroys it and starts fresh. Jobs run on the
/// calling thread. The token may be fired from any other thread.
///
/// Packages declared in env.packages are installed into the sandbox
/// directory before the job runs, whenever the set differs from the one
/// last installed there. Cell code loads them with require(), which only
/// looks in <sandbox>/node_modules and in the sandbox itself.
class Sandbox {
public:
  explicit Sandbox(SandboxOptions options);
  ~Sandbox();

  Sandbox(const Sandbox &) = delete;
  Sandbox &operator=(const Sandbox &) = delete;

  /// Failures of user code are reported in the result. An error is returned
  /// only if the job couldn't be started at all (for example, the sandbox
  /// directory couldn't be created).
  llvm::Expected<ExecutionResult> runCell(const RunCell &job, OutputSink &sink,
                                          CancellationToken &token);
  llvm::Expected<ExecutionResult> invokeHandler(const InvokeHandler &job,
                                                OutputSink &sink,
                                                CancellationToken &token);

  /// The notebook that owns the current heap, or "" if there is none.
  llvm::StringRef getNotebookId() const { return notebookId; }

  /// The sandbox directory of the current notebook.
  llvm::StringRef getSandboxDir() const { return sandboxDir; }

  /// Map a notebook id to a safe directory name.
  static std::string getSandboxDirName(llvm::StringRef notebookId);

  /// Resolve a path used by cell code against the sandbox directory root.
  /// Fails if the result (after removing "." and "..") is outside root.
  static llvm::Expected<std::string> resolvePath(llvm::StringRef root,
                                                 llvm::StringRef path);

  /// Find the file require(request) loads when called from a module in
  /// fromDir. Bare names are looked up in <root>/node_modules only; relative
  /// and absolute requests must stay inside root.
  static llvm::Expected<std::string> resolveModule(llvm::StringRef root,
                                                   llvm::StringRef request,
                                                   llvm::StringRef fromDir);

  // Used by the native functions.
  bool checkAbort();
  void writeStream(FrameKind kind, llvm::StringRef text);
  void writeDisplay(const Node &output);

private:
  struct Allocator;
  class Job;

  llvm::Error prepare(llvm::StringRef notebookId, const Node &env,
                      const Node &globals);
  llvm::Error createHeap();
  void destroyHeap();
  llvm::Error installPackages(const Node &env);

  SandboxOptions options;
  std::unique_ptr<Allocator> allocator;
  duk_context *ctx = nullptr;
  std::string notebookId;
  std::string sandboxDir;

  // Only set while a job is running.
  OutputSink *sink = nullptr;
  CancellationToken *token = nullptr;
};

} // end namespace nbkernel

#endif // NBKERNEL_SANDBOX_H
