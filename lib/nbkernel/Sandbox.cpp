#include "nbkernel/Sandbox.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <duktape.h>
#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/FileUtilities.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/Program.h>
#include <llvm/Support/raw_ostream.h>

#include "nbkernel/Downlevel.h"
#include "nbkernel/NodeVisitor.h"
#include "nbkernel/Support.h"

using namespace nbkernel;

namespace {
#include "prelude.inc"
}

// Heap allocator

// Every block is preceded by a header recording its size, so the allocator
// can keep a running total.
struct Sandbox::Allocator {
  static constexpr std::size_t HeaderSize = alignof(std::max_align_t);

  explicit Allocator(std::size_t limit) : limit(limit) {}

  std::size_t limit;
  std::size_t used = 0;

  bool fits(std::size_t oldSize, std::size_t newSize) const {
    return limit == 0 || newSize <= oldSize ||
           used - oldSize + newSize <= limit;
  }

  static std::size_t &sizeOf(void *base) {
    return *static_cast<std::size_t *>(base);
  }

  static void *baseOf(void *ptr) {
    return static_cast<char *>(ptr) - HeaderSize;
  }

  static void *alloc(void *udata, duk_size_t size) {
    auto &self = *static_cast<Allocator *>(udata);
    if (size == 0 || !self.fits(0, size))
      return nullptr;
    void *base = std::malloc(HeaderSize + size);
    if (!base)
      return nullptr;
    sizeOf(base) = size;
    self.used += size;
    return static_cast<char *>(base) + HeaderSize;
  }

  static void *realloc(void *udata, void *ptr, duk_size_t size) {
    auto &self = *static_cast<Allocator *>(udata);
    if (!ptr)
      return alloc(udata, size);
    if (size == 0) {
      free(udata, ptr);
      return nullptr;
    }
    void *base = baseOf(ptr);
    std::size_t oldSize = sizeOf(base);
    if (!self.fits(oldSize, size))
      return nullptr;
    void *newBase = std::realloc(base, HeaderSize + size);
    if (!newBase)
      return nullptr;
    sizeOf(newBase) = size;
    self.used = self.used - oldSize + size;
    return static_cast<char *>(newBase) + HeaderSize;
  }

  static void free(void *udata, void *ptr) {
    if (!ptr)
      return;
    auto &self = *static_cast<Allocator *>(udata);
    void *base = baseOf(ptr);
    self.used -= sizeOf(base);
    std::free(base);
  }
};

static void fatalHandler(void *, const char *Msg) {
  llvm::report_fatal_error(Msg);
}

// Pushing Nodes

namespace {
// Pushes a Node onto the Duktape stack as the equivalent JavaScript value.
class DuktapePusher : public NodeVisitor {
public:
  explicit DuktapePusher(duk_context *ctx) : ctx(ctx) {}

  void visitNode(const Node &value) override {
    NodeVisitor::visitNode(value);
    if (containers.empty())
      return;
    Container &parent = containers.back();
    if (parent.isMap)
      duk_put_prop(ctx, parent.index);
    else
      duk_put_prop_index(ctx, parent.index, parent.next++);
  }

  void visitNull() override { duk_push_null(ctx); }

  void visitBoolean(bool value) override { duk_push_boolean(ctx, value); }

  void visitUInt64(std::uint64_t value) override {
    duk_push_number(ctx, static_cast<duk_double_t>(value));
  }

  void visitInt64(std::int64_t value) override {
    duk_push_number(ctx, static_cast<duk_double_t>(value));
  }

  void visitFloat(double value) override { duk_push_number(ctx, value); }

  void visitString(llvm::StringRef value) override {
    duk_push_lstring(ctx, value.data(), value.size());
  }

  void visitBytes(BytesRef value) override {
    void *buffer = duk_push_fixed_buffer(ctx, value.size());
    if (!value.empty())
      std::memcpy(buffer, value.data(), value.size());
    duk_push_buffer_object(ctx, -1, 0, value.size(), DUK_BUFOBJ_UINT8ARRAY);
    duk_remove(ctx, -2);
  }

  void startList(const Node::List &) override {
    duk_push_array(ctx);
    containers.push_back({duk_get_top_index(ctx), 0, false});
  }

  void endList() override { containers.pop_back(); }

  void startMap(const Node::Map &) override {
    duk_push_object(ctx);
    containers.push_back({duk_get_top_index(ctx), 0, true});
  }

  void endMap() override { containers.pop_back(); }

private:
  struct Container {
    duk_idx_t index;
    duk_uarridx_t next;
    bool isMap;
  };

  duk_context *ctx;
  std::vector<Container> containers;
};
} // end anonymous namespace

static void pushNode(duk_context *ctx, const Node &value) {
  DuktapePusher(ctx).visitNode(value);
}

static std::string getString(duk_context *ctx, duk_idx_t idx) {
  duk_size_t size;
  const char *ptr = duk_get_lstring(ctx, idx, &size);
  return ptr ? sanitizeUTF8(llvm::StringRef(ptr, size)) : std::string();
}

static std::optional<std::string>
getStringProperty(duk_context *ctx, duk_idx_t idx, const char *key) {
  std::optional<std::string> result;
  duk_get_prop_string(ctx, idx, key);
  if (duk_is_string(ctx, -1))
    result = getString(ctx, -1);
  duk_pop(ctx);
  return result;
}

// Native functions
//
// Each native does its work in a helper that pushes exactly one value, either
// the result or an error object, and returns false for an error. Duktape may
// unwind with longjmp, so the throw happens only after the helper has
// returned and its locals are destroyed.

template <bool (*Helper)(duk_context *)>
static duk_ret_t native(duk_context *ctx) {
  if (!Helper(ctx))
    return duk_throw(ctx);
  return 1;
}

static Sandbox &getSandbox(duk_context *ctx) {
  duk_push_global_stash(ctx);
  duk_get_prop_literal(ctx, -1, DUK_HIDDEN_SYMBOL("Sandbox"));
  auto *sandbox = reinterpret_cast<Sandbox *>(duk_require_pointer(ctx, -1));
  duk_pop_2(ctx);
  return *sandbox;
}

static bool pushError(duk_context *ctx, const llvm::Twine &message) {
  std::string text = message.str();
  duk_push_error_object(ctx, DUK_ERR_ERROR, "%s", text.c_str());
  return false;
}

static bool pushAbortError(duk_context *ctx) {
  duk_push_error_object(ctx, DUK_ERR_ERROR, "Execution aborted");
  duk_push_literal(ctx, "AbortError");
  duk_put_prop_literal(ctx, -2, "name");
  return false;
}

static bool nativeWrite(duk_context *ctx) {
  duk_int_t kind = duk_require_int(ctx, 0);
  duk_size_t size;
  const char *text = duk_require_lstring(ctx, 1, &size);
  Sandbox &sandbox = getSandbox(ctx);
  if (sandbox.checkAbort())
    return pushAbortError(ctx);
  sandbox.writeStream(kind == 2 ? FrameKind::Stderr : FrameKind::Stdout,
                      llvm::StringRef(text, size));
  duk_push_undefined(ctx);
  return true;
}

static bool nativeEmitDisplay(duk_context *ctx) {
  duk_size_t size;
  const char *json = duk_require_lstring(ctx, 0, &size);
  Sandbox &sandbox = getSandbox(ctx);
  if (sandbox.checkAbort())
    return pushAbortError(ctx);
  auto data = Node::loadFromJSON(sanitizeUTF8(llvm::StringRef(json, size)));
  if (!data)
    return pushError(ctx, llvm::toString(data.takeError()));
  sandbox.writeDisplay(makeDisplayOutput(std::move(*data)));
  duk_push_undefined(ctx);
  return true;
}

static bool nativeCheckAbort(duk_context *ctx) {
  duk_push_boolean(ctx, getSandbox(ctx).checkAbort());
  return true;
}

// fs

static llvm::Expected<std::string> resolveArgument(duk_context *ctx,
                                                   duk_idx_t idx) {
  duk_size_t size;
  const char *path = duk_require_lstring(ctx, idx, &size);
  Sandbox &sandbox = getSandbox(ctx);
  if (sandbox.checkAbort())
    return llvm::createStringError(std::errc::operation_canceled,
                                   "Execution aborted");
  return Sandbox::resolvePath(sandbox.getSandboxDir(),
                              llvm::StringRef(path, size));
}

static bool fsReadFileSync(duk_context *ctx) {
  bool asText = duk_is_string(ctx, 1) || duk_is_object(ctx, 1);
  auto path = resolveArgument(ctx, 0);
  if (!path)
    return pushError(ctx, llvm::toString(path.takeError()));
  auto buffer = llvm::MemoryBuffer::getFile(*path, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer)
    return pushError(ctx, "Can't read " + *path + ": " +
                              buffer.getError().message());
  llvm::StringRef contents = (*buffer)->getBuffer();
  if (asText) {
    duk_push_lstring(ctx, contents.data(), contents.size());
  } else {
    void *data = duk_push_fixed_buffer(ctx, contents.size());
    if (!contents.empty())
      std::memcpy(data, contents.data(), contents.size());
    duk_push_buffer_object(ctx, -1, 0, contents.size(),
                           DUK_BUFOBJ_UINT8ARRAY);
    duk_remove(ctx, -2);
  }
  return true;
}

static bool writeFile(duk_context *ctx, llvm::sys::fs::OpenFlags flags) {
  llvm::StringRef data;
  if (duk_is_buffer_data(ctx, 1)) {
    duk_size_t size;
    void *ptr = duk_get_buffer_data(ctx, 1, &size);
    data = llvm::StringRef(static_cast<const char *>(ptr), size);
  } else {
    duk_size_t size;
    const char *ptr = duk_safe_to_lstring(ctx, 1, &size);
    data = llvm::StringRef(ptr, size);
  }
  auto path = resolveArgument(ctx, 0);
  if (!path)
    return pushError(ctx, llvm::toString(path.takeError()));
  std::error_code ec;
  llvm::raw_fd_ostream os(*path, ec, flags);
  if (ec)
    return pushError(ctx, "Can't write " + *path + ": " + ec.message());
  os << data;
  os.close();
  if (os.has_error()) {
    ec = os.error();
    os.clear_error();
    return pushError(ctx, "Can't write " + *path + ": " + ec.message());
  }
  duk_push_undefined(ctx);
  return true;
}

static bool fsWriteFileSync(duk_context *ctx) {
  return writeFile(ctx, llvm::sys::fs::OF_None);
}

static bool fsAppendFileSync(duk_context *ctx) {
  return writeFile(ctx, llvm::sys::fs::OF_Append);
}

static bool fsExistsSync(duk_context *ctx) {
  auto path = resolveArgument(ctx, 0);
  if (!path) {
    llvm::consumeError(path.takeError());
    duk_push_false(ctx);
    return true;
  }
  duk_push_boolean(ctx, llvm::sys::fs::exists(*path));
  return true;
}

static bool fsReaddirSync(duk_context *ctx) {
  auto path = resolveArgument(ctx, 0);
  if (!path)
    return pushError(ctx, llvm::toString(path.takeError()));
  std::vector<std::string> names;
  std::error_code ec;
  for (llvm::sys::fs::directory_iterator i(*path, ec), e; i != e && !ec;
       i.increment(ec))
    names.push_back(llvm::sys::path::filename(i->path()).str());
  if (ec)
    return pushError(ctx, "Can't list " + *path + ": " + ec.message());
  std::sort(names.begin(), names.end());
  duk_push_array(ctx);
  for (std::size_t i = 0; i < names.size(); ++i) {
    duk_push_lstring(ctx, names[i].data(), names[i].size());
    duk_put_prop_index(ctx, -2, static_cast<duk_uarridx_t>(i));
  }
  return true;
}

static bool fsMkdirSync(duk_context *ctx) {
  bool recursive = false;
  if (duk_is_object(ctx, 1)) {
    duk_get_prop_literal(ctx, 1, "recursive");
    recursive = duk_to_boolean(ctx, -1);
    duk_pop(ctx);
  }
  auto path = resolveArgument(ctx, 0);
  if (!path)
    return pushError(ctx, llvm::toString(path.takeError()));
  std::error_code ec =
      recursive ? llvm::sys::fs::create_directories(*path)
                : llvm::sys::fs::create_directory(*path,
                                                  /*IgnoreExisting=*/false);
  if (ec)
    return pushError(ctx, "Can't create " + *path + ": " + ec.message());
  duk_push_undefined(ctx);
  return true;
}

static bool fsUnlinkSync(duk_context *ctx) {
  auto path = resolveArgument(ctx, 0);
  if (!path)
    return pushError(ctx, llvm::toString(path.takeError()));
  if (std::error_code ec =
          llvm::sys::fs::remove(*path, /*IgnoreNonExisting=*/false))
    return pushError(ctx, "Can't remove " + *path + ": " + ec.message());
  duk_push_undefined(ctx);
  return true;
}

// Modules

static bool nativeResolveModule(duk_context *ctx) {
  duk_size_t size;
  const char *request = duk_require_lstring(ctx, 0, &size);
  std::string fromDir = duk_require_string(ctx, 1);
  Sandbox &sandbox = getSandbox(ctx);
  if (sandbox.checkAbort())
    return pushAbortError(ctx);
  auto path = Sandbox::resolveModule(sandbox.getSandboxDir(),
                                     llvm::StringRef(request, size), fromDir);
  if (!path) {
    std::string message;
    bool notFound = false;
    llvm::handleAllErrors(path.takeError(),
                          [&](const llvm::ErrorInfoBase &error) {
                            message = error.message();
                            notFound = error.convertToErrorCode() ==
                                       std::errc::no_such_file_or_directory;
                          });
    pushError(ctx, message);
    if (notFound) {
      duk_push_literal(ctx, "MODULE_NOT_FOUND");
      duk_put_prop_literal(ctx, -2, "code");
    }
    return false;
  }
  duk_push_lstring(ctx, path->data(), path->size());
  return true;
}

// Compile the source of a CommonJS module into its wrapper function.
static bool nativeCompileModule(duk_context *ctx) {
  duk_size_t size;
  const char *source = duk_require_lstring(ctx, 0, &size);
  std::string filename = duk_require_string(ctx, 1);
  // Kept on one line so line numbers match the file.
  std::string wrapped =
      "(function (exports, require, module, __filename, __dirname) {" +
      std::string(source, size) + "\n})";
  auto code = downlevel(wrapped);
  if (!code) {
    std::string message = llvm::toString(code.takeError());
    duk_push_error_object(ctx, DUK_ERR_SYNTAX_ERROR, "%s: %s",
                          filename.c_str(), message.c_str());
    return false;
  }
  duk_push_lstring(ctx, filename.data(), filename.size());
  if (duk_pcompile_lstring_filename(ctx, DUK_COMPILE_EVAL, code->data(),
                                    code->size()) != 0)
    return false;
  return duk_pcall(ctx, 0) == DUK_EXEC_SUCCESS;
}

static void defineNative(duk_context *ctx, const char *name,
                         duk_c_function func, duk_idx_t nargs) {
  duk_push_c_function(ctx, func, nargs);
  duk_push_string(ctx, name);
  duk_put_prop_literal(ctx, -2, "name");
  duk_put_prop_string(ctx, -2, name);
}

// Sandbox

// Connects the natives to the running job. The value stack is empty between
// jobs.
class Sandbox::Job {
public:
  Job(Sandbox &sandbox, OutputSink &sink, CancellationToken &token)
      : sandbox(sandbox) {
    sandbox.sink = &sink;
    sandbox.token = &token;
  }

  ~Job() {
    if (sandbox.ctx)
      duk_set_top(sandbox.ctx, 0);
    sandbox.sink = nullptr;
    sandbox.token = nullptr;
  }

private:
  Sandbox &sandbox;
};

Sandbox::Sandbox(SandboxOptions options) : options(std::move(options)) {
  if (this->options.workspaceRoot.empty()) {
    llvm::SmallString<128> root;
    llvm::sys::path::system_temp_directory(/*ErasedOnReboot=*/true, root);
    llvm::sys::path::append(root, "nbkernel");
    this->options.workspaceRoot = std::string(root);
  }
  if (!this->options.transpiler)
    this->options.transpiler = Transpiler::createDefault("");
}

Sandbox::~Sandbox() { destroyHeap(); }

std::string Sandbox::getSandboxDirName(llvm::StringRef notebookId) {
  std::string result;
  for (char c : notebookId)
    result += llvm::isAlnum(c) || c == '-' || c == '_' || c == '.' ? c : '_';
  if (result.find_first_not_of('.') == std::string::npos)
    std::replace(result.begin(), result.end(), '.', '_');
  if (result.empty())
    result = "_";
  return result;
}

llvm::Expected<std::string> Sandbox::resolvePath(llvm::StringRef root,
                                                 llvm::StringRef path) {
  llvm::SmallString<256> base(root);
  llvm::sys::path::remove_dots(base, /*remove_dot_dot=*/true);
  llvm::SmallString<256> result;
  if (llvm::sys::path::is_absolute(path)) {
    result = path;
  } else {
    result = base;
    llvm::sys::path::append(result, path);
  }
  llvm::sys::path::remove_dots(result, /*remove_dot_dot=*/true);
  llvm::StringRef resolved = result;
  if (resolved != base &&
      !(resolved.startswith(base) &&
        llvm::sys::path::is_separator(resolved[base.size()])))
    return llvm::createStringError(
        std::make_error_code(std::errc::permission_denied),
        "Path is outside the sandbox: " + path);
  return std::string(resolved);
}

// The file a module path names: itself, with .js or .json added, or a
// directory's package.json main entry or index file.
static std::optional<std::string> findModuleFile(llvm::StringRef root,
                                                 llvm::StringRef base) {
  for (const char *suffix : {"", ".js", ".json"}) {
    std::string path = (base + suffix).str();
    if (llvm::sys::fs::is_regular_file(path))
      return path;
  }
  if (!llvm::sys::fs::is_directory(base))
    return std::nullopt;

  llvm::SmallString<256> manifest(base);
  llvm::sys::path::append(manifest, "package.json");
  if (auto buffer = llvm::MemoryBuffer::getFile(manifest)) {
    auto package = Node::loadFromJSON((*buffer)->getBuffer());
    if (!package) {
      llvm::consumeError(package.takeError());
    } else {
      auto main = package->get_value_or<std::string>("main", "");
      if (!main.empty()) {
        llvm::SmallString<256> entry(base);
        llvm::sys::path::append(entry, main);
        auto confined = Sandbox::resolvePath(root, entry);
        if (!confined)
          llvm::consumeError(confined.takeError());
        else if (auto path = findModuleFile(root, *confined))
          return path;
      }
    }
  }

  for (const char *index : {"index.js", "index.json"}) {
    llvm::SmallString<256> path(base);
    llvm::sys::path::append(path, index);
    if (llvm::sys::fs::is_regular_file(path))
      return std::string(path);
  }
  return std::nullopt;
}

llvm::Expected<std::string> Sandbox::resolveModule(llvm::StringRef root,
                                                   llvm::StringRef request,
                                                   llvm::StringRef fromDir) {
  llvm::SmallString<256> modules(root);
  llvm::sys::path::append(modules, "node_modules");
  llvm::StringRef confine = root;
  llvm::SmallString<256> base;
  if (request == "." || request == ".." || request.startswith("./") ||
      request.startswith("../")) {
    base = fromDir;
    llvm::sys::path::append(base, request);
  } else if (llvm::sys::path::is_absolute(request)) {
    base = request;
  } else if (!request.empty()) {
    base = modules;
    llvm::sys::path::append(base, request);
    confine = modules;
  }

  if (!base.empty()) {
    auto resolved = resolvePath(confine, base);
    if (!resolved)
      return resolved.takeError();
    if (auto path = findModuleFile(root, *resolved))
      return *path;
  }
  return llvm::createStringError(
      std::make_error_code(std::errc::no_such_file_or_directory),
      "Cannot find module '" + request + "'");
}

bool Sandbox::checkAbort() { return token && token->isFired(); }

void Sandbox::writeStream(FrameKind kind, llvm::StringRef text) {
  if (sink)
    sink->writeStream(kind, sanitizeUTF8(text));
}

void Sandbox::writeDisplay(const Node &output) {
  if (sink)
    sink->writeDisplay(output);
}

llvm::Error Sandbox::createHeap() {
  allocator = std::make_unique<Allocator>(options.memoryLimit);
  ctx = duk_create_heap(Allocator::alloc, Allocator::realloc, Allocator::free,
                        allocator.get(), fatalHandler);
  if (!ctx)
    return llvm::createStringError(std::errc::not_enough_memory,
                                   "Couldn't create Duktape heap");

  duk_push_global_stash(ctx);
  duk_push_pointer(ctx, this);
  duk_put_prop_literal(ctx, -2, DUK_HIDDEN_SYMBOL("Sandbox"));
  defineNative(ctx, "write", native<nativeWrite>, 2);
  defineNative(ctx, "emitDisplay", native<nativeEmitDisplay>, 1);
  defineNative(ctx, "checkAbort", native<nativeCheckAbort>, 0);
  defineNative(ctx, "resolveModule", native<nativeResolveModule>, 2);
  defineNative(ctx, "compileModule", native<nativeCompileModule>, 2);
  duk_push_object(ctx); // fs
  defineNative(ctx, "readFileSync", native<fsReadFileSync>, 2);
  defineNative(ctx, "writeFileSync", native<fsWriteFileSync>, 2);
  defineNative(ctx, "appendFileSync", native<fsAppendFileSync>, 2);
  defineNative(ctx, "existsSync", native<fsExistsSync>, 1);
  defineNative(ctx, "readdirSync", native<fsReaddirSync>, 1);
  defineNative(ctx, "mkdirSync", native<fsMkdirSync>, 2);
  defineNative(ctx, "unlinkSync", native<fsUnlinkSync>, 1);
  duk_put_prop_literal(ctx, -2, "fs");
  duk_pop(ctx); // stash

  duk_push_literal(ctx, "prelude.js");
  if (duk_pcompile_lstring_filename(ctx, DUK_COMPILE_EVAL,
                                    reinterpret_cast<const char *>(prelude_js),
                                    prelude_js_len) == 0 &&
      duk_pcall(ctx, 0) == DUK_EXEC_SUCCESS) {
    duk_push_global_stash(ctx);
    if (duk_pcall(ctx, 1) == DUK_EXEC_SUCCESS) {
      duk_pop(ctx);
      return llvm::Error::success();
    }
  }
  std::string message = duk_safe_to_stacktrace(ctx, -1);
  destroyHeap();
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument),
      "Couldn't set up the script heap: " + message);
}

void Sandbox::destroyHeap() {
  if (ctx)
    duk_destroy_heap(ctx);
  ctx = nullptr;
  allocator.reset();
  notebookId.clear();
}

// Call stash[name] with the nargs values on top of the stack. Replaces them
// with the result or the error, and returns true on success.
static bool callStash(duk_context *ctx, const char *name, duk_idx_t nargs) {
  duk_push_global_stash(ctx);
  duk_get_prop_string(ctx, -1, name);
  duk_remove(ctx, -2);
  duk_insert(ctx, -(nargs + 1));
  return duk_pcall(ctx, nargs) == DUK_EXEC_SUCCESS;
}

static ExecutionError describeError(duk_context *ctx, duk_idx_t idx) {
  ExecutionError error;
  duk_dup(ctx, idx);
  if (!callStash(ctx, "describeError", 1)) {
    error.name = "Error";
    error.message = sanitizeUTF8(duk_safe_to_string(ctx, -1));
    duk_pop(ctx);
    return error;
  }
  error.name = getStringProperty(ctx, -1, "name").value_or("Error");
  error.message = getStringProperty(ctx, -1, "message").value_or("");
  error.stack = getStringProperty(ctx, -1, "stack");
  duk_pop(ctx);
  return error;
}

static void setError(ExecutionResult &result, ExecutionError error) {
  result.outputs.push_back(makeErrorOutput(error));
  result.execution.status = ExecutionStatus::Error;
  result.execution.error = std::move(error);
}

// Packages

// Records which packages the sandbox's node_modules holds.
static constexpr char InstalledPackagesFile[] = ".nbkernel-packages.json";

// Longest a package installation may take.
static constexpr unsigned InstallTimeoutSeconds = 600;

static llvm::Error writeJSONFile(llvm::StringRef dir, llvm::StringRef name,
                                 const Node &value) {
  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, name);
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  if (ec)
    return llvm::createStringError(ec, "Can't write " + name);
  os << value << "\n";
  os.close();
  if (os.has_error()) {
    ec = os.error();
    os.clear_error();
    return llvm::createStringError(ec, "Can't write " + name);
  }
  return llvm::Error::success();
}

static std::optional<Node> readInstalledPackages(llvm::StringRef dir) {
  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, InstalledPackagesFile);
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer)
    return std::nullopt;
  auto packages = Node::loadFromJSON((*buffer)->getBuffer());
  if (!packages) {
    llvm::consumeError(packages.takeError());
    return std::nullopt;
  }
  return std::move(*packages);
}

static void removeInSandbox(llvm::StringRef dir, llvm::StringRef name) {
  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, name);
  std::error_code ec = llvm::sys::fs::is_directory(path)
                           ? llvm::sys::fs::remove_directories(path)
                           : llvm::sys::fs::remove(path);
  if (ec)
    llvm::errs() << "nbkernel-worker: can't remove " << path << ": "
                 << ec.message() << "\n";
}

// Run the installer command in dir. The error holds what it wrote to stderr.
static llvm::Error runInstaller(llvm::StringRef command, llvm::StringRef dir) {
  llvm::SmallString<128> errPath;
  if (std::error_code ec = llvm::sys::fs::createTemporaryFile(
          "nbkernel-install", "txt", errPath))
    return llvm::errorCodeToError(ec);
  llvm::FileRemover errRemover(errPath);

  // ExecuteAndWait can't set the working directory, so the shell does.
  llvm::StringRef shell = "/bin/sh";
  llvm::StringRef args[] = {shell, "-c", "cd \"$0\" && eval \"$1\"", dir,
                            command};
  llvm::Optional<llvm::StringRef> redirects[] = {
      llvm::StringRef(""), llvm::StringRef(""), llvm::StringRef(errPath)};
  std::string errMsg;
  int rc = llvm::sys::ExecuteAndWait(shell, args, llvm::None, redirects,
                                     InstallTimeoutSeconds, 0, &errMsg);
  if (rc == 0)
    return llvm::Error::success();

  std::string message;
  auto errBuffer = llvm::MemoryBuffer::getFile(errPath);
  if (errBuffer)
    message = (*errBuffer)->getBuffer().trim().str();
  if (message.empty())
    message = !errMsg.empty() ? errMsg
                              : "installer exited with status " +
                                    std::to_string(rc);
  return llvm::createStringError(std::make_error_code(std::errc::io_error),
                                 message);
}

llvm::Error Sandbox::installPackages(const Node &env) {
  const Node &packages = env.at_or_null("packages");
  std::optional<Node> installed = readInstalledPackages(sandboxDir);
  bool empty = !packages.is_map() || packages.empty();

  if (empty) {
    if (!installed)
      return llvm::Error::success();
    writeStream(FrameKind::Stdout,
                "[env] Clearing all dependencies (no packages)\n");
    for (const char *name : {"node_modules", "package-lock.json",
                             "package.json", InstalledPackagesFile})
      removeInSandbox(sandboxDir, name);
    callStash(ctx, "clearModules", 0);
    duk_pop(ctx);
    return llvm::Error::success();
  }

  llvm::SmallString<256> modules(sandboxDir);
  llvm::sys::path::append(modules, "node_modules");
  if (installed && *installed == packages &&
      llvm::sys::fs::is_directory(modules))
    return llvm::Error::success();

  Node manifest(node_map_arg,
                {{"name", Node(utf8_string_arg, getSandboxDirName(notebookId))},
                 {"private", true},
                 {"dependencies", packages}});
  if (llvm::Error err = writeJSONFile(sandboxDir, "package.json", manifest))
    return err;
  if (options.installerCommand.empty())
    return llvm::Error::success();

  std::string list;
  llvm::raw_string_ostream listStream(list);
  for (const auto &item : packages.map_range()) {
    if (!list.empty())
      listStream << ", ";
    listStream << item.key() << "@";
    if (item.value().is_string())
      listStream << item.value().as<llvm::StringRef>();
    else
      listStream << item.value();
    listStream.flush();
  }
  writeStream(FrameKind::Stdout, "[env] Installing dependencies: " + list + "\n");

  if (llvm::Error err = runInstaller(options.installerCommand, sandboxDir)) {
    std::string message = llvm::toString(std::move(err));
    writeStream(FrameKind::Stderr, "[env] Install failed: " + message + "\n");
    removeInSandbox(sandboxDir, InstalledPackagesFile);
    return llvm::createStringError(
        std::make_error_code(std::errc::io_error),
        "Failed to install notebook dependencies: " + message);
  }
  writeStream(FrameKind::Stdout, "[env] Install complete\n");

  // Modules loaded before the install may be stale.
  callStash(ctx, "clearModules", 0);
  duk_pop(ctx);
  return writeJSONFile(sandboxDir, InstalledPackagesFile, packages);
}

llvm::Error Sandbox::prepare(llvm::StringRef newNotebookId, const Node &env,
                             const Node &globals) {
  if (!ctx || newNotebookId != notebookId) {
    destroyHeap();
    llvm::SmallString<256> dir(options.workspaceRoot);
    llvm::sys::path::append(dir, getSandboxDirName(newNotebookId));
    if (std::error_code ec = llvm::sys::fs::create_directories(dir))
      return llvm::createStringError(ec, "Can't create sandbox directory");
    sandboxDir = std::string(dir);
    if (llvm::Error err = createHeap())
      return err;
    notebookId = newNotebookId.str();
  }

  const Node &variables = env.at_or_null("variables");
  pushNode(ctx, variables.is_map() ? variables : Node(node_map_arg));
  duk_push_lstring(ctx, sandboxDir.data(), sandboxDir.size());
  if (!callStash(ctx, "setEnvironment", 2)) {
    std::string message = duk_safe_to_string(ctx, -1);
    duk_pop(ctx);
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument),
        "Can't set up the environment: " + message);
  }
  duk_pop(ctx);

  if (globals.is_map()) {
    duk_push_global_object(ctx);
    for (const auto &item : globals.map_range()) {
      pushNode(ctx, item.value());
      duk_put_prop_lstring(ctx, -2, item.key().data(), item.key().size());
    }
    duk_pop(ctx);
  }
  return llvm::Error::success();
}

// Settle the job whose completion value (or thrown error, if !ok) is on top
// of the stack. Thenables are awaited and pending timers are drained until
// the token fires.
static void complete(duk_context *ctx, OutputSink &sink,
                     CancellationToken &token, ExecutionResult &result,
                     bool ok, std::uint32_t timeoutMs) {
  bool settled = false;
  std::optional<ExecutionError> failure;

  if (!ok) {
    if (!token.isFired())
      failure = describeError(ctx, -1);
  } else if (!callStash(ctx, "track", 1)) {
    failure = describeError(ctx, -1);
  } else {
    duk_idx_t state = duk_get_top_index(ctx);
    while (!token.isFired()) {
      if (!callStash(ctx, "runMicrotasks", 0)) {
        failure = describeError(ctx, -1);
        break;
      }
      duk_pop(ctx);
      if (!callStash(ctx, "nextTimerDue", 0)) {
        failure = describeError(ctx, -1);
        break;
      }
      double due = duk_get_number_default(ctx, -1, -1);
      duk_pop(ctx);
      if (due < 0)
        break;
      auto delay = static_cast<std::int64_t>(due) - currentTimeMillis();
      if (delay > 0 &&
          token.waitUntil(CancellationToken::Clock::now() +
                          std::chrono::milliseconds(delay)))
        break;
      if (!callStash(ctx, "runDueTimers", 0)) {
        failure = describeError(ctx, -1);
        break;
      }
      duk_pop(ctx);
    }

    if (!failure && !token.isFired()) {
      if (callStash(ctx, "takeAsyncErrors", 0) &&
          duk_get_length(ctx, -1) > 0) {
        duk_get_prop_index(ctx, -1, 0);
        failure = describeError(ctx, -1);
        duk_pop(ctx);
      }
      duk_pop(ctx);
    }

    duk_get_prop_literal(ctx, state, "settled");
    settled = duk_get_boolean(ctx, -1);
    duk_pop(ctx);
    if (!failure && settled) {
      duk_get_prop_literal(ctx, state, "rejected");
      bool rejected = duk_get_boolean(ctx, -1);
      duk_pop(ctx);
      duk_get_prop_literal(ctx, state, "value");
      if (rejected) {
        failure = describeError(ctx, -1);
      } else if (!token.isFired() && callStash(ctx, "toDisplayData", 1) &&
                 duk_is_string(ctx, -1)) {
        auto data = Node::loadFromJSON(getString(ctx, -1));
        if (data)
          result.outputs.push_back(makeDisplayOutput(std::move(*data)));
        else
          llvm::consumeError(data.takeError());
      }
      duk_pop(ctx);
    }
  }

  callStash(ctx, "clearTimers", 0);
  duk_pop(ctx);

  if (token.isFired()) {
    result.outputs.clear();
    result.execution.status = ExecutionStatus::Aborted;
    if (token.getReason() == CancellationToken::Reason::TimedOut) {
      std::string ms = std::to_string(timeoutMs);
      sink.writeStream(FrameKind::Stderr,
                       "[timeout] Execution exceeded " + ms +
                           "ms and was stopped.\n");
      result.execution.error =
          ExecutionError{"TimeoutError", "Execution timed out after " + ms + "ms",
                         std::nullopt};
    } else {
      result.execution.error =
          ExecutionError{"AbortError", "Execution cancelled", std::nullopt};
    }
  } else if (failure) {
    setError(result, std::move(*failure));
  }
}

llvm::Expected<ExecutionResult>
Sandbox::runCell(const RunCell &job, OutputSink &sink,
                 CancellationToken &token) {
  ExecutionResult result;
  result.execution.started = currentTimeMillis();
  Job scope(*this, sink, token);
  if (llvm::Error err = prepare(job.notebookId, job.env, job.globals))
    return std::move(err);
  if (llvm::Error err = installPackages(job.env)) {
    setError(result, {"InstallError", llvm::toString(std::move(err)),
                      std::nullopt});
    result.execution.ended = currentTimeMillis();
    return result;
  }

  std::string language = job.cell.get_value_or<std::string>("language", "js");
  auto code = options.transpiler->transpile(language, job.code);
  if (!code) {
    ExecutionError error{"TranspileError", "", std::nullopt};
    llvm::handleAllErrors(
        code.takeError(),
        [&](const DownlevelError &e) {
          error.name = "SyntaxError";
          error.message = e.message();
        },
        [&](const llvm::ErrorInfoBase &e) { error.message = e.message(); });
    setError(result, std::move(error));
  } else {
    std::string filename =
        job.cell.get_value_or<std::string>("id", "cell") + ".js";
    duk_push_lstring(ctx, filename.data(), filename.size());
    bool ok = duk_pcompile_lstring_filename(ctx, DUK_COMPILE_EVAL,
                                            code->data(), code->size()) == 0;
    if (ok)
      ok = duk_pcall(ctx, 0) == DUK_EXEC_SUCCESS;
    complete(ctx, sink, token, result, ok, job.timeoutMs);
  }

  result.execution.ended = currentTimeMillis();
  return result;
}

llvm::Expected<ExecutionResult>
Sandbox::invokeHandler(const InvokeHandler &job, OutputSink &sink,
                       CancellationToken &token) {
  ExecutionResult result;
  result.execution.started = currentTimeMillis();
  Job scope(*this, sink, token);
  if (llvm::Error err = prepare(job.notebookId, job.env, job.globals))
    return std::move(err);
  if (llvm::Error err = installPackages(job.env)) {
    setError(result, {"InstallError", llvm::toString(std::move(err)),
                      std::nullopt});
    result.execution.ended = currentTimeMillis();
    return result;
  }

  duk_push_lstring(ctx, job.handlerId.data(), job.handlerId.size());
  bool known = callStash(ctx, "hasHandler", 1) && duk_get_boolean(ctx, -1);
  duk_pop(ctx);
  if (!known) {
    setError(result,
             {"Error", "Unknown UI handler: " + job.handlerId, std::nullopt});
  } else {
    Node context(node_map_arg, {{"event", Node(utf8_string_arg, job.event)},
                                {"payload", job.payload}});
    if (job.componentId)
      context["componentId"] = Node(utf8_string_arg, *job.componentId);
    if (job.cellId)
      context["cellId"] = Node(utf8_string_arg, *job.cellId);
    duk_push_lstring(ctx, job.handlerId.data(), job.handlerId.size());
    pushNode(ctx, context);
    bool ok = callStash(ctx, "callHandler", 2);
    complete(ctx, sink, token, result, ok, job.timeoutMs);
  }

  result.execution.ended = currentTimeMillis();
  return result;
}
