#include "nbkernel/Transpiler.h"

#include "nbkernel/Downlevel.h"

#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/raw_ostream.h>

using namespace nbkernel;

Transpiler::~Transpiler() {}

// Longest we let an external transpiler run.
static constexpr unsigned TranspileTimeoutSeconds = 30;

static bool isJavaScript(llvm::StringRef language) {
  return language.empty() || language == "js" || language == "javascript";
}

namespace {
class DefaultTranspiler : public Transpiler {
public:
  explicit DefaultTranspiler(llvm::StringRef command) : command(command) {}

  llvm::Expected<std::string> transpile(llvm::StringRef language,
                                        llvm::StringRef source) override;

private:
  llvm::Expected<std::string> runCommand(llvm::StringRef source);

  std::string command;
};
} // end anonymous namespace

llvm::Expected<std::string>
DefaultTranspiler::transpile(llvm::StringRef language, llvm::StringRef source) {
  if (isJavaScript(language))
    return downlevel(source);
  if (language != "ts" && language != "typescript")
    return llvm::createStringError(
        std::make_error_code(std::errc::not_supported),
        "Unsupported cell language: " + language);
  if (command.empty())
    return llvm::createStringError(
        std::errc::not_supported,
        "TypeScript cells need a transpiler, but none is configured");
  auto javascript = runCommand(source);
  if (!javascript)
    return javascript.takeError();
  return downlevel(*javascript);
}

llvm::Expected<std::string>
DefaultTranspiler::runCommand(llvm::StringRef source) {
  llvm::SmallString<128> inPath, outPath, errPath;
  int inFD;
  if (std::error_code ec =
          llvm::sys::fs::createTemporaryFile("nbkernel-src", "ts", inFD, inPath))
    return llvm::errorCodeToError(ec);
  llvm::FileRemover inRemover(inPath);
  {
    llvm::raw_fd_ostream os(inFD, /*shouldClose=*/true);
    os << source;
  }
  if (std::error_code ec =
          llvm::sys::fs::createTemporaryFile("nbkernel-out", "js", outPath))
    return llvm::errorCodeToError(ec);
  llvm::FileRemover outRemover(outPath);
  if (std::error_code ec =
          llvm::sys::fs::createTemporaryFile("nbkernel-err", "txt", errPath))
    return llvm::errorCodeToError(ec);
  llvm::FileRemover errRemover(errPath);

  llvm::StringRef shell = "/bin/sh";
  llvm::StringRef args[] = {shell, "-c", command};
  llvm::Optional<llvm::StringRef> redirects[] = {
      llvm::StringRef(inPath), llvm::StringRef(outPath),
      llvm::StringRef(errPath)};
  std::string errMsg;
  int rc = llvm::sys::ExecuteAndWait(shell, args, llvm::None, redirects,
                                     TranspileTimeoutSeconds, 0, &errMsg);
  if (rc != 0) {
    std::string message = "Transpiler failed";
    if (!errMsg.empty())
      message += ": " + errMsg;
    auto errBuffer = llvm::MemoryBuffer::getFile(errPath);
    if (errBuffer && (*errBuffer)->getBufferSize())
      message += "\n" + (*errBuffer)->getBuffer().rtrim().str();
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument), message);
  }

  auto outBuffer = llvm::MemoryBuffer::getFile(outPath);
  if (!outBuffer)
    return llvm::errorCodeToError(outBuffer.getError());
  return (*outBuffer)->getBuffer().str();
}

std::unique_ptr<Transpiler>
Transpiler::createDefault(llvm::StringRef command) {
  return std::make_unique<DefaultTranspiler>(command);
}
