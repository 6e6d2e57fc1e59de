#ifndef NBKERNEL_TRANSPILER_H
#define NBKERNEL_TRANSPILER_H

#include <memory>
#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

namespace nbkernel {

/// Converts cell source into JavaScript the engine can run.
class Transpiler {
public:
  virtual ~Transpiler();

  /// language is the cell's "language" field ("js" or "ts").
  virtual llvm::Expected<std::string> transpile(llvm::StringRef language,
                                                llvm::StringRef source) = 0;

  /// JavaScript goes through downlevel(). TypeScript is piped through command
  /// (run with /bin/sh -c, source on stdin, result on stdout) and its output
  /// down-levelled too. If command is empty, only JavaScript is accepted.
  static std::unique_ptr<Transpiler> createDefault(llvm::StringRef command);
};

} // end namespace nbkernel

#endif // NBKERNEL_TRANSPILER_H
