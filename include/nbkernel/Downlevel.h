#ifndef NBKERNEL_DOWNLEVEL_H
#define NBKERNEL_DOWNLEVEL_H

#include <string>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

namespace nbkernel {

/// A syntax error found while rewriting cell source. Reported to the user as
/// a SyntaxError.
class DownlevelError : public llvm::ErrorInfo<DownlevelError> {
public:
  static char ID;

  DownlevelError(std::string message, unsigned line)
      : messageText(std::move(message)), line(line) {}

  void log(llvm::raw_ostream &os) const override;

  std::error_code convertToErrorCode() const override {
    return llvm::inconvertibleErrorCode();
  }

  llvm::StringRef getMessage() const { return messageText; }
  unsigned getLine() const { return line; }

private:
  std::string messageText;
  unsigned line;
};

/// Rewrites modern JavaScript into the ES5 dialect Duktape runs.
///
/// Handled: arrow functions, let and const, classes (extends, super, fields,
/// static members, accessors), template literals, shorthand properties and
/// methods, computed keys, default and rest parameters, destructuring in
/// declarations, parameters and for-of heads, spread in array literals and
/// calls, for-of, optional catch bindings, and async functions with await.
///
/// Async bodies run as Duktape coroutines driven by the $nb runtime the
/// prelude installs. If await appears outside any function, the whole program
/// is wrapped in an async body: it then evaluates to a Promise for the value
/// of its last expression statement, and its top-level declarations are
/// hoisted so they stay global.
///
/// Constructs with no ES5 rendering (generators, optional chaining, nullish
/// coalescing, exponentiation, private members, tagged templates, modules)
/// are reported as a DownlevelError. Source that is already ES5 comes back
/// unchanged.
llvm::Expected<std::string> downlevel(llvm::StringRef source);

} // end namespace nbkernel

#endif // NBKERNEL_DOWNLEVEL_H
