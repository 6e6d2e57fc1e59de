#include "nbkernel/Downlevel.h"

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/raw_ostream.h>

using namespace nbkernel;

char DownlevelError::ID = 0;

void DownlevelError::log(llvm::raw_ostream &os) const {
  os << messageText << " (line " << line << ")";
}

namespace {

enum class TokenKind {
  Name,
  Punct,
  Number,
  String,
  Regex,
  Template,       // `...` with no substitutions
  TemplateHead,   // `...${
  TemplateMiddle, // }...${
  TemplateTail,   // }...`
  End,
};

struct Token {
  TokenKind kind = TokenKind::End;
  llvm::StringRef text;
  // Whitespace and comments before the token, copied through unchanged so
  // line numbers in engine errors still match the cell.
  llvm::StringRef leading;
  bool newlineBefore = false;
  unsigned line = 1;
};

} // end anonymous namespace

static constexpr size_t None = ~size_t(0);

// Longest first.
static const char *const Punctuators[] = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=",
    "??=",  "=>",  "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "?.",
    "++",   "--",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=",  "|=",  "^=",
    "<<",   ">>",  "**",
};

static const char AsyncPrologue[] =
    "var $nb_this = $nb_ctx[0], $nb_args = $nb_ctx[1];";

static bool isReservedWord(llvm::StringRef word) {
  return llvm::StringSwitch<bool>(word)
      .Cases("break", "case", "catch", "class", "const", "continue", true)
      .Cases("debugger", "default", "delete", "do", "else", "enum", true)
      .Cases("export", "extends", "false", "finally", "for", "function", true)
      .Cases("if", "import", "in", "instanceof", "new", "null", true)
      .Cases("return", "super", "switch", "this", "throw", "true", true)
      .Cases("try", "typeof", "var", "void", "while", "with", true)
      .Cases("yield", "let", "static", "implements", "interface", true)
      .Cases("package", "private", "protected", "public", true)
      .Default(false);
}

// Reserved words that are operands themselves.
static bool isValueWord(llvm::StringRef word) {
  return llvm::StringSwitch<bool>(word)
      .Cases("this", "super", "null", "true", "false", true)
      .Default(false);
}

static bool canEndExpression(const Token &token) {
  switch (token.kind) {
  case TokenKind::Name:
    if (isValueWord(token.text))
      return true;
    return !isReservedWord(token.text) && token.text != "of" &&
           token.text != "await";
  case TokenKind::Punct:
    return token.text == ")" || token.text == "]" || token.text == "}" ||
           token.text == "++" || token.text == "--";
  case TokenKind::Number:
  case TokenKind::String:
  case TokenKind::Regex:
  case TokenKind::Template:
  case TokenKind::TemplateTail:
    return true;
  default:
    return false;
  }
}

static bool isIdentifierStart(unsigned char c) {
  return llvm::isAlpha(c) || c == '_' || c == '$' || c == '\\' || c >= 0x80;
}

static bool isIdentifierPart(unsigned char c) {
  return isIdentifierStart(c) || llvm::isDigit(c);
}

static llvm::Error syntaxError(const llvm::Twine &message, unsigned line) {
  return llvm::make_error<DownlevelError>(message.str(), line);
}

namespace {
class Lexer {
public:
  explicit Lexer(llvm::StringRef source) : source(source) {}

  llvm::Error run(std::vector<Token> &tokens);

private:
  llvm::Error skipSpace(bool &newline);
  llvm::Error scanString();
  llvm::Error scanTemplate(bool &isTail);
  llvm::Error scanRegex();
  void scanNumber();
  void scanPunct();

  char peek(size_t offset) const {
    return i + offset < source.size() ? source[i + offset] : 0;
  }

  llvm::StringRef source;
  size_t i = 0;
  unsigned line = 1;
};
} // end anonymous namespace

llvm::Error Lexer::skipSpace(bool &newline) {
  while (i < source.size()) {
    char c = source[i];
    llvm::StringRef rest = source.substr(i);
    if (c == '\n') {
      newline = true;
      ++line;
      ++i;
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f') {
      ++i;
    } else if (rest.startswith("\xc2\xa0")) {
      i += 2;
    } else if (rest.startswith("\xef\xbb\xbf")) {
      i += 3;
    } else if (rest.startswith("\xe2\x80\xa8") ||
               rest.startswith("\xe2\x80\xa9")) {
      newline = true;
      ++line;
      i += 3;
    } else if (rest.startswith("//") || (i == 0 && rest.startswith("#!"))) {
      while (i < source.size() && source[i] != '\n')
        ++i;
    } else if (rest.startswith("/*")) {
      size_t close = source.find("*/", i + 2);
      if (close == llvm::StringRef::npos)
        return syntaxError("Unterminated comment", line);
      size_t lines = source.slice(i, close).count('\n');
      if (lines) {
        newline = true;
        line += lines;
      }
      i = close + 2;
    } else {
      break;
    }
  }
  return llvm::Error::success();
}

llvm::Error Lexer::scanString() {
  unsigned start = line;
  char quote = source[i++];
  while (i < source.size()) {
    char c = source[i];
    if (c == '\\') {
      if (peek(1) == '\r' && peek(2) == '\n') {
        ++line;
        i += 3;
        continue;
      }
      if (peek(1) == '\n')
        ++line;
      i += 2;
      continue;
    }
    if (c == quote) {
      ++i;
      return llvm::Error::success();
    }
    if (c == '\n')
      break;
    ++i;
  }
  return syntaxError("Unterminated string literal", start);
}

// Called just past the opening ` or }.
llvm::Error Lexer::scanTemplate(bool &isTail) {
  unsigned start = line;
  while (i < source.size()) {
    char c = source[i];
    if (c == '\\') {
      if (peek(1) == '\n')
        ++line;
      i += 2;
      continue;
    }
    if (c == '`') {
      ++i;
      isTail = true;
      return llvm::Error::success();
    }
    if (c == '$' && peek(1) == '{') {
      i += 2;
      isTail = false;
      return llvm::Error::success();
    }
    if (c == '\n')
      ++line;
    ++i;
  }
  return syntaxError("Unterminated template literal", start);
}

llvm::Error Lexer::scanRegex() {
  ++i;
  bool inClass = false;
  while (i < source.size()) {
    char c = source[i];
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (c == '\n')
      break;
    if (c == '[') {
      inClass = true;
    } else if (c == ']') {
      inClass = false;
    } else if (c == '/' && !inClass) {
      ++i;
      while (i < source.size() && isIdentifierPart(source[i]))
        ++i;
      return llvm::Error::success();
    }
    ++i;
  }
  return syntaxError("Unterminated regular expression", line);
}

void Lexer::scanNumber() {
  if (source[i] == '0' && std::strchr("xXoObB", peek(1)) && peek(1)) {
    i += 2;
    while (i < source.size() &&
           (llvm::isAlnum(source[i]) || source[i] == '_'))
      ++i;
    return;
  }
  bool dot = false, exponent = false;
  while (i < source.size()) {
    char c = source[i];
    if (llvm::isDigit(c) || c == '_') {
      ++i;
    } else if (c == '.' && !dot && !exponent) {
      dot = true;
      ++i;
    } else if ((c == 'e' || c == 'E') && !exponent) {
      exponent = true;
      ++i;
      if (peek(0) == '+' || peek(0) == '-')
        ++i;
    } else {
      break;
    }
  }
  if (peek(0) == 'n')
    ++i;
}

void Lexer::scanPunct() {
  llvm::StringRef rest = source.substr(i);
  for (const char *punct : Punctuators) {
    if (!rest.startswith(punct))
      continue;
    // a?.5:1 is a conditional.
    if (llvm::StringRef(punct) == "?." && rest.size() > 2 &&
        llvm::isDigit(rest[2]))
      continue;
    i += std::strlen(punct);
    return;
  }
  ++i;
}

llvm::Error Lexer::run(std::vector<Token> &tokens) {
  // Open braces inside each pending template substitution.
  std::vector<unsigned> substitutions;
  for (;;) {
    size_t start = i;
    bool newline = false;
    if (llvm::Error err = skipSpace(newline))
      return err;
    Token token;
    token.leading = source.slice(start, i);
    token.newlineBefore = newline;
    token.line = line;
    if (i >= source.size()) {
      tokens.push_back(token);
      return llvm::Error::success();
    }

    size_t begin = i;
    unsigned char c = source[i];
    bool isTail = false;
    if (isIdentifierStart(c)) {
      token.kind = TokenKind::Name;
      while (i < source.size() && isIdentifierPart(source[i]))
        ++i;
    } else if (llvm::isDigit(c) || (c == '.' && llvm::isDigit(peek(1)))) {
      token.kind = TokenKind::Number;
      scanNumber();
    } else if (c == '"' || c == '\'') {
      token.kind = TokenKind::String;
      if (llvm::Error err = scanString())
        return err;
    } else if (c == '`') {
      ++i;
      if (llvm::Error err = scanTemplate(isTail))
        return err;
      token.kind = isTail ? TokenKind::Template : TokenKind::TemplateHead;
      if (!isTail)
        substitutions.push_back(0);
    } else if (c == '}' && !substitutions.empty() &&
               substitutions.back() == 0) {
      ++i;
      if (llvm::Error err = scanTemplate(isTail))
        return err;
      token.kind = isTail ? TokenKind::TemplateTail : TokenKind::TemplateMiddle;
      if (isTail)
        substitutions.pop_back();
    } else if (c == '/' &&
               (tokens.empty() ||
                (!canEndExpression(tokens.back()) &&
                 !(tokens.size() > 1 &&
                   tokens[tokens.size() - 2].kind == TokenKind::Punct &&
                   tokens[tokens.size() - 2].text == ".")))) {
      token.kind = TokenKind::Regex;
      if (llvm::Error err = scanRegex())
        return err;
    } else {
      token.kind = TokenKind::Punct;
      scanPunct();
      if (!substitutions.empty()) {
        if (c == '{')
          ++substitutions.back();
        else if (c == '}')
          --substitutions.back();
      }
    }
    token.text = source.slice(begin, i);
    tokens.push_back(token);
  }
}

static char openerOf(const Token &token) {
  if (token.kind == TokenKind::TemplateHead)
    return '`';
  if (token.kind == TokenKind::Punct &&
      (token.text == "(" || token.text == "[" || token.text == "{"))
    return token.text[0];
  return 0;
}

static char expectedOpener(const Token &token) {
  if (token.kind == TokenKind::TemplateMiddle ||
      token.kind == TokenKind::TemplateTail)
    return '`';
  if (token.kind != TokenKind::Punct)
    return 0;
  if (token.text == ")")
    return '(';
  if (token.text == "]")
    return '[';
  if (token.text == "}")
    return '{';
  return 0;
}

// Pairs every bracket and template head with its closer.
static llvm::Error matchBrackets(const std::vector<Token> &tokens,
                                 std::vector<size_t> &match) {
  match.assign(tokens.size(), None);
  std::vector<size_t> open;
  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &token = tokens[i];
    if (openerOf(token)) {
      open.push_back(i);
      continue;
    }
    char expected = expectedOpener(token);
    if (!expected)
      continue;
    if (open.empty() || openerOf(tokens[open.back()]) != expected)
      return syntaxError("Unexpected '" + token.text.take_front(1) + "'",
                         token.line);
    if (token.kind == TokenKind::TemplateMiddle)
      continue;
    match[open.back()] = i;
    match[i] = open.back();
    open.pop_back();
  }
  if (!open.empty()) {
    const Token &token = tokens[open.back()];
    return syntaxError("Unclosed '" + token.text.take_front(1) + "'",
                       token.line);
  }
  return llvm::Error::success();
}

static std::string quoteTemplate(llvm::StringRef raw) {
  std::string result = "\"";
  for (size_t i = 0; i < raw.size(); ++i) {
    char c = raw[i];
    llvm::StringRef rest = raw.substr(i);
    if (c == '\\' && i + 1 < raw.size()) {
      char next = raw[i + 1];
      if (next == '\n') {
        ++i;
      } else if (next == '\r') {
        i += rest.startswith("\\\r\n") ? 2 : 1;
      } else if (next == '`' || next == '$') {
        result += next;
        ++i;
      } else {
        result += c;
        result += next;
        ++i;
      }
    } else if (c == '"') {
      result += "\\\"";
    } else if (c == '\n') {
      result += "\\n";
    } else if (c == '\r') {
      result += "\\n";
      if (rest.startswith("\r\n"))
        ++i;
    } else if (rest.startswith("\xe2\x80\xa8")) {
      result += "\\u2028";
      i += 2;
    } else if (rest.startswith("\xe2\x80\xa9")) {
      result += "\\u2029";
      i += 2;
    } else {
      result += c;
    }
  }
  result += '"';
  return result;
}

// The literal text of a template token, without ` ${ or }.
static llvm::StringRef templateText(const Token &token) {
  llvm::StringRef text = token.text.drop_front(1);
  if (token.kind == TokenKind::Template ||
      token.kind == TokenKind::TemplateTail)
    return text.drop_back(1);
  return text.drop_back(2);
}

namespace {

struct Scope {
  // Outside every function. An await here switches to the async program
  // form.
  bool topLevel = false;
  bool isAsync = false;
  std::string thisName = "this";
  std::string argumentsName = "arguments";
  // Set inside methods of a class that extends another.
  std::string superName;
  bool superStatic = false;
  bool inConstructor = false;
  // Called on the instance right after super() returns.
  std::string fieldsName;
};

struct FunctionTraits {
  bool isAsync = false;
  std::string superName;
  bool superStatic = false;
  bool isConstructor = false;
  std::string fieldsName;
  // Emitted at the start of the body, after parameter defaults.
  std::string prologue;
};

struct ClassMember {
  enum Kind { Method, Getter, Setter, Field } kind = Method;
  bool isStatic = false;
  bool isAsync = false;
  size_t keyBegin = 0, keyEnd = 0;
  size_t params = None;
  size_t initBegin = None, initEnd = None;
};

class Rewriter {
public:
  Rewriter(const std::vector<Token> &tokens, const std::vector<size_t> &match)
      : tokens(tokens), match(match) {}

  llvm::Expected<std::string> run();

private:
  enum class DeclMode { Statement, Expression, ForHead, Hoisted };
  using Range = std::pair<size_t, size_t>;

  struct Params {
    std::string list;
    std::string prologue;
  };

  size_t last() const { return tokens.size() - 1; }
  const Token &at(size_t i) const { return tokens[std::min(i, last())]; }
  bool isPunct(size_t i, llvm::StringRef text) const {
    return at(i).kind == TokenKind::Punct && at(i).text == text;
  }
  bool isName(size_t i, llvm::StringRef text) const {
    return at(i).kind == TokenKind::Name && at(i).text == text;
  }
  bool isIdentifier(size_t i) const {
    return at(i).kind == TokenKind::Name && !isReservedWord(at(i).text);
  }
  bool isKey(size_t i) const {
    TokenKind kind = at(i).kind;
    return kind == TokenKind::Name || kind == TokenKind::String ||
           kind == TokenKind::Number;
  }
  bool isOpener(size_t i) const {
    return i < last() && match[i] != None && match[i] > i;
  }
  size_t skipGroup(size_t i) const { return isOpener(i) ? match[i] + 1 : i + 1; }
  bool isMemberName(size_t i) const {
    return i > 0 && i <= last() && isPunct(i - 1, ".");
  }
  bool endsOperand(size_t i) const {
    return isMemberName(i) || canEndExpression(at(i));
  }
  bool continuesExpression(size_t i) const;
  bool asiBreak(size_t i) const {
    return i > 0 && at(i).newlineBefore && endsOperand(i - 1) &&
           !continuesExpression(i);
  }
  bool startsBinding(size_t i) const {
    return isIdentifier(i) || isPunct(i, "[") || isPunct(i, "{");
  }
  bool isDeclarationStart(size_t i) const {
    return isName(i, "var") || isName(i, "const") ||
           (isName(i, "let") && startsBinding(i + 1));
  }
  bool isFunctionStart(size_t i) const {
    return isName(i, "function") ||
           (isName(i, "async") && isName(i + 1, "function") &&
            !at(i + 1).newlineBefore);
  }
  bool atStatementStart(size_t i) const;
  bool isExpressionStatement(size_t i) const;
  bool hasSpread(size_t open) const;
  bool usesThis(size_t begin, size_t end) const;
  unsigned countNewlines(size_t begin, size_t end) const;

  size_t scanExpressionEnd(size_t begin, size_t limit, bool stopAtComma,
                           bool stopAtIn) const;
  size_t scanStatementEnd(size_t i) const;
  size_t scanPrimaryEnd(size_t i) const;
  size_t scanUnaryEnd(size_t i) const;
  std::vector<Range> splitList(size_t begin, size_t end) const;

  void copy(size_t i) {
    out += tokens[i].leading;
    out += tokens[i].text;
  }
  void skip(size_t i) { out += tokens[i].leading; }
  std::string temp(llvm::StringRef prefix) {
    return ("$nb_" + prefix + llvm::Twine(nextTemp++)).str();
  }
  void fail(size_t i, const llvm::Twine &message);
  std::string render(size_t begin, size_t end, const Scope &scope);
  std::string renderFunction(size_t params, const FunctionTraits &traits);

  void emitUntil(size_t limit, const Scope &scope);
  void emitNext(const Scope &scope);
  bool emitKeyword(const Scope &scope);
  bool emitPunct(const Scope &scope);
  void emitTemplate(const Scope &scope);
  void emitArrow(const Scope &scope, size_t params, bool isAsync);
  void emitFunction(bool isAsync);
  void emitFunctionTail(const FunctionTraits &traits);
  Params renderParams(size_t open, size_t close, const Scope &scope);
  void emitDeclaration(const Scope &scope, DeclMode mode);
  void emitFor(const Scope &scope);
  void emitObject(const Scope &scope);
  void emitMember(const Scope &scope, size_t begin, size_t end);
  void emitClass(const Scope &scope, DeclMode mode);
  bool parseClassBody(size_t open, size_t close,
                      std::vector<ClassMember> &members);
  std::string memberKey(const ClassMember &member, const Scope &scope);
  std::string memberAccess(const ClassMember &member, const Scope &scope);
  void emitSuper(const Scope &scope);
  void emitAwait(const Scope &scope);
  void emitSpreadCall(const Scope &scope);
  std::string spreadList(size_t open, size_t close, const Scope &scope);
  std::string destructure(size_t open, const std::string &source,
                          const Scope &scope, std::vector<std::string> &names);
  void bindPattern(size_t open, const std::string &source, const Scope &scope,
                   std::vector<std::string> &names,
                   std::vector<std::string> &parts);
  void bindTarget(size_t begin, size_t end, const std::string &access,
                  const Scope &scope, std::vector<std::string> &names,
                  std::vector<std::string> &parts);
  void bindName(size_t i, const std::string &value,
                std::vector<std::string> &names,
                std::vector<std::string> &parts);
  void emitAsyncProgram();

  const std::vector<Token> &tokens;
  const std::vector<size_t> &match;
  size_t pos = 0;
  std::string out;
  unsigned nextTemp = 0;
  // Names the async program form declares globally.
  std::vector<std::string> hoisted;
  bool stopped = false;
  bool needsAsync = false;
  std::string failure;
  unsigned failureLine = 0;
};

} // end anonymous namespace

static Scope asyncScope(const Scope &outer) {
  Scope scope = outer;
  scope.topLevel = false;
  scope.isAsync = true;
  scope.thisName = "$nb_this";
  scope.argumentsName = "$nb_args";
  return scope;
}

void Rewriter::fail(size_t i, const llvm::Twine &message) {
  if (stopped)
    return;
  stopped = true;
  failure = message.str();
  failureLine = at(i).line;
}

bool Rewriter::continuesExpression(size_t i) const {
  const Token &token = at(i);
  switch (token.kind) {
  case TokenKind::Punct:
    return !(token.text == "{" || token.text == "}" || token.text == ";" ||
             token.text == "++" || token.text == "--" || token.text == "!" ||
             token.text == "~" || token.text == "..." || token.text == "#" ||
             token.text == "@");
  case TokenKind::Name:
    return token.text == "in" || token.text == "instanceof";
  case TokenKind::Template:
  case TokenKind::TemplateHead:
    return true;
  default:
    return false;
  }
}

bool Rewriter::atStatementStart(size_t i) const {
  if (i == 0)
    return true;
  if (isPunct(i - 1, ";") || isPunct(i - 1, "{") || isPunct(i - 1, "}"))
    return true;
  return at(i).newlineBefore && endsOperand(i - 1);
}

bool Rewriter::isExpressionStatement(size_t i) const {
  const Token &token = at(i);
  if (token.kind == TokenKind::End)
    return false;
  if (token.kind == TokenKind::Punct)
    return token.text != "{" && token.text != ";";
  if (token.kind != TokenKind::Name)
    return true;
  if (isIdentifier(i) && isPunct(i + 1, ":"))
    return false;
  if (isDeclarationStart(i) || isFunctionStart(i))
    return false;
  return !llvm::StringSwitch<bool>(token.text)
              .Cases("if", "for", "while", "do", "try", "switch", true)
              .Cases("return", "throw", "break", "continue", "debugger", true)
              .Cases("with", "class", "import", "export", true)
              .Default(false);
}

bool Rewriter::hasSpread(size_t open) const {
  for (size_t i = open + 1; i < match[open]; i = skipGroup(i))
    if (isPunct(i, "..."))
      return true;
  return false;
}

bool Rewriter::usesThis(size_t begin, size_t end) const {
  for (size_t i = begin; i < end && i < last(); ++i) {
    if (tokens[i].kind == TokenKind::Name && !isMemberName(i) &&
        (tokens[i].text == "this" || tokens[i].text == "super" ||
         tokens[i].text == "arguments"))
      return true;
  }
  return false;
}

unsigned Rewriter::countNewlines(size_t begin, size_t end) const {
  unsigned count = 0;
  for (size_t i = begin; i < end && i <= last(); ++i)
    count += tokens[i].leading.count('\n') + tokens[i].text.count('\n');
  return count;
}

std::vector<Rewriter::Range> Rewriter::splitList(size_t begin,
                                                 size_t end) const {
  std::vector<Range> items;
  size_t start = begin;
  for (size_t i = begin; i < end; i = skipGroup(i)) {
    if (isPunct(i, ",")) {
      items.push_back({start, i});
      start = i + 1;
    }
  }
  if (start < end)
    items.push_back({start, end});
  return items;
}

size_t Rewriter::scanExpressionEnd(size_t begin, size_t limit,
                                   bool stopAtComma, bool stopAtIn) const {
  unsigned conditionals = 0;
  size_t i = begin;
  while (i < limit && i < last()) {
    if (i > begin && asiBreak(i))
      break;
    const Token &token = tokens[i];
    if (token.kind == TokenKind::Punct) {
      llvm::StringRef text = token.text;
      if (text == ")" || text == "]" || text == "}" || text == ";")
        break;
      if (text == "," && stopAtComma)
        break;
      if (text == "?") {
        ++conditionals;
      } else if (text == ":") {
        if (!conditionals)
          break;
        --conditionals;
      }
    } else if (token.kind == TokenKind::TemplateMiddle ||
               token.kind == TokenKind::TemplateTail) {
      break;
    } else if (stopAtIn && token.kind == TokenKind::Name &&
               (token.text == "in" || token.text == "of") &&
               !isMemberName(i)) {
      break;
    }
    i = skipGroup(i);
  }
  return i;
}

size_t Rewriter::scanStatementEnd(size_t i) const {
  auto afterGroup = [&](size_t j, llvm::StringRef open) {
    return isPunct(j, open) ? match[j] + 1 : j;
  };
  const Token &token = at(i);
  if (token.kind == TokenKind::End)
    return i;
  if (isPunct(i, "{"))
    return match[i] + 1;
  if (isPunct(i, ";"))
    return i + 1;
  if (token.kind == TokenKind::Name) {
    llvm::StringRef word = token.text;
    if (word == "if") {
      size_t j = scanStatementEnd(afterGroup(i + 1, "("));
      if (isName(j, "else"))
        j = scanStatementEnd(j + 1);
      return j;
    }
    if (word == "for") {
      size_t j = isName(i + 1, "await") ? i + 2 : i + 1;
      return scanStatementEnd(afterGroup(j, "("));
    }
    if (word == "while" || word == "with")
      return scanStatementEnd(afterGroup(i + 1, "("));
    if (word == "do") {
      size_t j = scanStatementEnd(i + 1);
      if (isName(j, "while"))
        j = afterGroup(j + 1, "(");
      return isPunct(j, ";") ? j + 1 : j;
    }
    if (word == "try") {
      size_t j = afterGroup(i + 1, "{");
      if (isName(j, "catch"))
        j = afterGroup(afterGroup(j + 1, "("), "{");
      if (isName(j, "finally"))
        j = afterGroup(j + 1, "{");
      return j;
    }
    if (word == "switch")
      return afterGroup(afterGroup(i + 1, "("), "{");
    if (isFunctionStart(i)) {
      size_t j = word == "async" ? i + 2 : i + 1;
      if (isPunct(j, "*"))
        ++j;
      if (at(j).kind == TokenKind::Name)
        ++j;
      return afterGroup(afterGroup(j, "("), "{");
    }
    if (word == "class") {
      size_t j = i + 1;
      while (!isPunct(j, "{") && j < last())
        j = skipGroup(j);
      return afterGroup(j, "{");
    }
    if (isIdentifier(i) && isPunct(i + 1, ":"))
      return scanStatementEnd(i + 2);
    if ((word == "return" || word == "throw" || word == "break" ||
         word == "continue") &&
        at(i + 1).newlineBefore)
      return i + 1;
  }
  size_t j = scanExpressionEnd(i, last(), false, false);
  return isPunct(j, ";") ? j + 1 : j;
}

size_t Rewriter::scanPrimaryEnd(size_t i) const {
  if (isOpener(i))
    return match[i] + 1;
  if (isName(i, "new")) {
    if (isPunct(i + 1, "."))
      return i + 3;
    size_t j = scanPrimaryEnd(i + 1);
    for (;;) {
      if (isPunct(j, ".")) {
        j += 2;
      } else if (isPunct(j, "[")) {
        j = match[j] + 1;
      } else {
        break;
      }
    }
    return isPunct(j, "(") ? match[j] + 1 : j;
  }
  if (isFunctionStart(i))
    return scanStatementEnd(i);
  if (isName(i, "class")) {
    size_t j = i + 1;
    while (!isPunct(j, "{") && j < last())
      j = skipGroup(j);
    return isOpener(j) ? match[j] + 1 : j;
  }
  return i < last() ? i + 1 : i;
}

size_t Rewriter::scanUnaryEnd(size_t i) const {
  for (;;) {
    if (isPunct(i, "!") || isPunct(i, "~") || isPunct(i, "+") ||
        isPunct(i, "-") || isPunct(i, "++") || isPunct(i, "--") ||
        isName(i, "typeof") || isName(i, "void") || isName(i, "delete") ||
        isName(i, "await"))
      ++i;
    else
      break;
  }
  size_t j = scanPrimaryEnd(i);
  for (;;) {
    if (isPunct(j, ".")) {
      j += 2;
    } else if (isPunct(j, "[") || isPunct(j, "(") ||
               at(j).kind == TokenKind::TemplateHead) {
      j = match[j] + 1;
    } else if (at(j).kind == TokenKind::Template) {
      ++j;
    } else if ((isPunct(j, "++") || isPunct(j, "--")) &&
               !at(j).newlineBefore) {
      return j + 1;
    } else {
      return j;
    }
  }
}

std::string Rewriter::render(size_t begin, size_t end, const Scope &scope) {
  std::string saved;
  std::swap(saved, out);
  size_t savedPos = pos;
  pos = begin;
  emitUntil(end, scope);
  std::swap(saved, out);
  pos = savedPos;
  return saved;
}

std::string Rewriter::renderFunction(size_t params,
                                     const FunctionTraits &traits) {
  std::string saved;
  std::swap(saved, out);
  size_t savedPos = pos;
  pos = params;
  emitFunctionTail(traits);
  std::swap(saved, out);
  pos = savedPos;
  return saved;
}

void Rewriter::emitUntil(size_t limit, const Scope &scope) {
  while (pos < limit && pos < last() && !stopped)
    emitNext(scope);
}

void Rewriter::emitNext(const Scope &scope) {
  const Token &token = tokens[pos];
  switch (token.kind) {
  case TokenKind::Template:
  case TokenKind::TemplateHead:
    emitTemplate(scope);
    return;
  case TokenKind::Name:
    if (!isMemberName(pos) && emitKeyword(scope))
      return;
    break;
  case TokenKind::Punct:
    if (emitPunct(scope))
      return;
    break;
  default:
    break;
  }
  copy(pos++);
}

bool Rewriter::emitKeyword(const Scope &scope) {
  size_t i = pos;
  llvm::StringRef word = tokens[i].text;
  if (isPunct(i + 1, "=>") && !at(i + 1).newlineBefore &&
      !isReservedWord(word)) {
    emitArrow(scope, i, false);
    return true;
  }
  if (word == "function") {
    emitFunction(false);
    return true;
  }
  if (word == "async" && !at(i + 1).newlineBefore) {
    if (isName(i + 1, "function")) {
      skip(i);
      ++pos;
      emitFunction(true);
      return true;
    }
    if (isIdentifier(i + 1) && isPunct(i + 2, "=>")) {
      emitArrow(scope, i + 1, true);
      return true;
    }
    if (isPunct(i + 1, "(") && isPunct(match[i + 1] + 1, "=>")) {
      emitArrow(scope, i + 1, true);
      return true;
    }
    return false;
  }
  if (word == "class") {
    emitClass(scope, atStatementStart(i) ? DeclMode::Statement
                                         : DeclMode::Expression);
    return true;
  }
  if (isDeclarationStart(i)) {
    emitDeclaration(scope, DeclMode::Statement);
    return true;
  }
  if (word == "for") {
    emitFor(scope);
    return true;
  }
  if (word == "this" || word == "arguments") {
    skip(i);
    out += word == "this" ? scope.thisName : scope.argumentsName;
    ++pos;
    return true;
  }
  if (word == "super") {
    emitSuper(scope);
    return true;
  }
  if (word == "await") {
    if (scope.isAsync) {
      emitAwait(scope);
      return true;
    }
    if (scope.topLevel) {
      // Start over in the async program form.
      if (!stopped) {
        stopped = true;
        needsAsync = true;
      }
      return true;
    }
    return false;
  }
  if (word == "catch" && isPunct(i + 1, "{")) {
    copy(i);
    out += " ($nb_e)";
    ++pos;
    return true;
  }
  if ((word == "import" || word == "export") && atStatementStart(i) &&
      !isPunct(i + 1, "(") && !isPunct(i + 1, ".")) {
    fail(i, "import and export are not supported; use require()");
    return true;
  }
  if (word == "yield") {
    fail(i, "Generators are not supported");
    return true;
  }
  return false;
}

bool Rewriter::emitPunct(const Scope &scope) {
  size_t i = pos;
  llvm::StringRef text = tokens[i].text;
  if (text == "(") {
    if (isPunct(match[i] + 1, "=>") && !at(match[i] + 1).newlineBefore) {
      emitArrow(scope, i, false);
      return true;
    }
    if (i > 0 && endsOperand(i - 1) && hasSpread(i)) {
      emitSpreadCall(scope);
      return true;
    }
    return false;
  }
  if (text == "[") {
    if ((i == 0 || !endsOperand(i - 1)) && hasSpread(i)) {
      skip(i);
      out += spreadList(i, match[i], scope);
      skip(match[i]);
      pos = match[i] + 1;
      return true;
    }
    return false;
  }
  if (text == "{") {
    if (i == 0)
      return false;
    const Token &prev = tokens[i - 1];
    bool expression = false;
    if (prev.kind == TokenKind::Punct)
      expression = !(prev.text == ")" || prev.text == "]" ||
                     prev.text == "}" || prev.text == "{" ||
                     prev.text == ";" || prev.text == "++" ||
                     prev.text == "--");
    else if (prev.kind == TokenKind::Name && !isMemberName(i - 1))
      expression = llvm::StringSwitch<bool>(prev.text)
                       .Cases("return", "typeof", "void", "delete", "in",
                              "instanceof", true)
                       .Cases("new", "throw", "await", "yield", true)
                       .Default(false);
    else
      expression = prev.kind == TokenKind::TemplateHead ||
                   prev.kind == TokenKind::TemplateMiddle;
    if (!expression)
      return false;

    // Only rewrite when the braces hold members, not statements.
    size_t j = i + 1, close = match[i];
    bool object = j == close || isPunct(j, "...");
    if (isPunct(j, "["))
      object = isPunct(match[j] + 1, ":") || isPunct(match[j] + 1, "(");
    else if (isKey(j))
      object = isPunct(j + 1, ":") || isPunct(j + 1, ",") || j + 1 == close ||
               (isPunct(j + 1, "(") && isPunct(match[j + 1] + 1, "{")) ||
               ((isName(j, "get") || isName(j, "set") ||
                 isName(j, "async")) &&
                (isKey(j + 1) || isPunct(j + 1, "[")));
    if (!object)
      return false;
    emitObject(scope);
    return true;
  }
  if (text == "?.") {
    fail(i, "Optional chaining (?.) is not supported");
    return true;
  }
  if (text == "??" || text == "??=") {
    fail(i, "Nullish coalescing (??) is not supported");
    return true;
  }
  if (text == "**" || text == "**=") {
    fail(i, "The ** operator is not supported; use Math.pow()");
    return true;
  }
  if (text == "&&=" || text == "||=") {
    fail(i, "Logical assignment operators are not supported");
    return true;
  }
  if (text == "...") {
    fail(i, "Spread syntax is not supported here");
    return true;
  }
  if (text == "#") {
    fail(i, "Private class members are not supported");
    return true;
  }
  return false;
}

void Rewriter::emitTemplate(const Scope &scope) {
  size_t i = pos;
  if (i > 0 && (isIdentifier(i - 1) || isPunct(i - 1, ")") ||
                isPunct(i - 1, "]") || isMemberName(i - 1)))
    return fail(i, "Tagged templates are not supported");
  skip(i);
  if (tokens[i].kind == TokenKind::Template) {
    out += quoteTemplate(templateText(tokens[i]));
    pos = i + 1;
    return;
  }
  size_t tail = match[i];
  out += "(" + quoteTemplate(templateText(tokens[i]));
  for (size_t j = i + 1;;) {
    size_t k = j;
    while (k < tail && tokens[k].kind != TokenKind::TemplateMiddle)
      k = skipGroup(k);
    if (k == j)
      return fail(k, "Empty template substitution");
    out += " + String(" + render(j, k, scope) + ") + ";
    out += quoteTemplate(templateText(tokens[k]));
    if (k == tail)
      break;
    j = k + 1;
  }
  out += ")";
  pos = tail + 1;
}

void Rewriter::emitArrow(const Scope &scope, size_t params, bool isAsync) {
  bool parenthesized = isPunct(params, "(");
  size_t arrow = parenthesized ? match[params] + 1 : params + 1;
  size_t bodyBegin = arrow + 1;
  bool block = isPunct(bodyBegin, "{");
  size_t bodyEnd = block ? match[bodyBegin] + 1
                         : scanExpressionEnd(bodyBegin, last(), true, false);
  if (bodyEnd == bodyBegin)
    return fail(arrow, "Expected an expression after '=>'");

  Scope inner = scope;
  inner.topLevel = false;
  inner.isAsync = false;
  Params rendered;
  if (parenthesized)
    rendered = renderParams(params, match[params], inner);
  else
    rendered.list = tokens[params].text.str();
  bool bind = scope.thisName == "this" &&
              (isAsync || usesThis(bodyBegin, bodyEnd));

  if (isAsync)
    skip(params - 1);
  skip(params);
  out += "(function (" + rendered.list + ") {" + rendered.prologue;
  skip(arrow);

  Scope body = inner;
  if (isAsync) {
    out += " return $nb.async(" + (bind ? "this" : scope.thisName) + ", " +
           scope.argumentsName + ", function ($nb_ctx) { " + AsyncPrologue;
    body = asyncScope(inner);
  }
  if (block) {
    skip(bodyBegin);
    pos = bodyBegin + 1;
    emitUntil(bodyEnd - 1, body);
    skip(bodyEnd - 1);
  } else {
    out += " return (";
    pos = bodyBegin;
    emitUntil(bodyEnd, body);
    out += ");";
  }
  if (isAsync)
    out += " });";
  out += " })";
  if (bind)
    out += ".bind(this)";
  pos = bodyEnd;
}

void Rewriter::emitFunction(bool isAsync) {
  size_t i = pos;
  // The async keyword before it has already written the leading space.
  if (isAsync)
    out += tokens[i].text;
  else
    copy(i);
  ++i;
  if (isPunct(i, "*"))
    return fail(i, "Generator functions are not supported");
  if (at(i).kind == TokenKind::Name)
    copy(i++);
  pos = i;
  FunctionTraits traits;
  traits.isAsync = isAsync;
  emitFunctionTail(traits);
}

void Rewriter::emitFunctionTail(const FunctionTraits &traits) {
  size_t open = pos;
  if (!isPunct(open, "("))
    return fail(open, "Expected '(' to start a parameter list");
  size_t close = match[open];
  size_t bodyOpen = close + 1;
  if (!isPunct(bodyOpen, "{"))
    return fail(bodyOpen, "Expected '{' to start a function body");
  size_t bodyClose = match[bodyOpen];

  Scope inner;
  inner.superName = traits.superName;
  inner.superStatic = traits.superStatic;
  inner.inConstructor = traits.isConstructor;
  inner.fieldsName = traits.fieldsName;
  Params params = renderParams(open, close, inner);
  skip(open);
  out += "(" + params.list;
  skip(close);
  out += ")";
  copy(bodyOpen);
  out += params.prologue + traits.prologue;
  pos = bodyOpen + 1;
  if (traits.isAsync) {
    out += " return $nb.async(this, arguments, function ($nb_ctx) { ";
    out += AsyncPrologue;
    emitUntil(bodyClose, asyncScope(inner));
    skip(bodyClose);
    out += "}); }";
  } else {
    emitUntil(bodyClose, inner);
    copy(bodyClose);
  }
  pos = bodyClose + 1;
}

Rewriter::Params Rewriter::renderParams(size_t open, size_t close,
                                        const Scope &scope) {
  Params params;
  unsigned index = 0;
  for (const Range &item : splitList(open + 1, close)) {
    size_t begin = item.first, end = item.second;
    if (begin == end) {
      fail(begin, "Unexpected ',' in parameter list");
      break;
    }
    if (isPunct(begin, "...")) {
      if (!isIdentifier(begin + 1) || begin + 2 != end) {
        fail(begin, "A rest parameter must be a plain name");
        break;
      }
      params.prologue += " var " + tokens[begin + 1].text.str() +
                         " = Array.prototype.slice.call(arguments, " +
                         std::to_string(index) + ");";
      break;
    }
    size_t targetEnd;
    std::string name;
    bool pattern = isPunct(begin, "{") || isPunct(begin, "[");
    if (isIdentifier(begin)) {
      targetEnd = begin + 1;
      name = tokens[begin].text.str();
    } else if (pattern) {
      targetEnd = match[begin] + 1;
      name = temp("p");
    } else {
      fail(begin, "Unexpected token in parameter list");
      break;
    }
    if (index)
      params.list += ",";
    params.list += tokens[begin].leading.str() + name;
    if (isPunct(targetEnd, "=")) {
      params.prologue += " if (" + name + " === undefined) " + name +
                         " = (" + render(targetEnd + 1, end, scope) + ");";
    } else if (targetEnd != end) {
      fail(targetEnd, "Unexpected token in parameter list");
      break;
    }
    if (pattern) {
      std::vector<std::string> names;
      std::string bindings = destructure(begin, name, scope, names);
      if (!bindings.empty())
        params.prologue += " var " + bindings + ";";
    }
    ++index;
  }
  return params;
}

void Rewriter::emitDeclaration(const Scope &scope, DeclMode mode) {
  struct Declarator {
    size_t target, targetEnd;
    size_t init = None, initEnd = None;
    size_t comma = None;
  };

  size_t keyword = pos;
  llvm::StringRef kind = tokens[keyword].text;
  std::vector<Declarator> declarators;
  size_t i = keyword + 1;
  for (;;) {
    Declarator d;
    d.target = i;
    if (isIdentifier(i))
      d.targetEnd = i + 1;
    else if (isPunct(i, "{") || isPunct(i, "["))
      d.targetEnd = match[i] + 1;
    else
      return fail(i, "Expected a name after '" + kind + "'");
    i = d.targetEnd;
    if (isPunct(i, "=")) {
      d.init = i + 1;
      d.initEnd = scanExpressionEnd(d.init, last(), true,
                                    mode == DeclMode::ForHead);
      if (d.initEnd == d.init)
        return fail(i, "Expected an initializer after '='");
      i = d.initEnd;
    } else if (d.targetEnd != d.target + 1 &&
               !(mode == DeclMode::ForHead &&
                 (isName(i, "in") || isName(i, "of")))) {
      return fail(i, "A destructuring declaration needs an initializer");
    }
    if (isPunct(i, ",")) {
      d.comma = i++;
      declarators.push_back(d);
      continue;
    }
    declarators.push_back(d);
    break;
  }

  skip(keyword);
  if (mode == DeclMode::Hoisted) {
    std::vector<std::string> assignments;
    for (const Declarator &d : declarators) {
      if (d.targetEnd == d.target + 1) {
        std::string name = tokens[d.target].text.str();
        hoisted.push_back(name);
        if (d.init != None)
          assignments.push_back(name + " =" + render(d.init, d.initEnd, scope));
        else if (kind != "var")
          assignments.push_back(name + " = undefined");
        continue;
      }
      std::string source = temp("d");
      hoisted.push_back(source);
      assignments.push_back(source + " = (" +
                            render(d.init, d.initEnd, scope) + ")");
      std::string bindings = destructure(d.target, source, scope, hoisted);
      if (!bindings.empty())
        assignments.push_back(bindings);
    }
    out += llvm::join(assignments, ", ");
    pos = declarators.back().initEnd != None ? declarators.back().initEnd
                                             : declarators.back().targetEnd;
    return;
  }

  out += "var";
  for (const Declarator &d : declarators) {
    if (d.targetEnd == d.target + 1) {
      copy(d.target);
      if (d.init != None) {
        copy(d.init - 1);
        pos = d.init;
        emitUntil(d.initEnd, scope);
      }
    } else if (d.init == None) {
      // for (const [k, v] in ...) has nothing to bind from here.
      return fail(d.target, "Destructuring is not supported in for-in heads");
    } else {
      std::string source = temp("d");
      std::vector<std::string> names;
      out += " " + source + " = (" + render(d.init, d.initEnd, scope) + ")";
      std::string bindings = destructure(d.target, source, scope, names);
      if (!bindings.empty())
        out += ", " + bindings;
    }
    if (d.comma != None)
      copy(d.comma);
  }
  pos = declarators.back().initEnd != None ? declarators.back().initEnd
                                           : declarators.back().targetEnd;
}

void Rewriter::emitFor(const Scope &scope) {
  size_t keyword = pos, open = pos + 1;
  if (isName(open, "await"))
    return fail(open, "for await is not supported");
  if (!isPunct(open, "(")) {
    copy(pos++);
    return;
  }
  size_t close = match[open];
  size_t target = open + 1;
  bool declared = isDeclarationStart(target);
  if (declared)
    ++target;
  size_t targetEnd = None;
  if (isIdentifier(target))
    targetEnd = target + 1;
  else if (isPunct(target, "{") || isPunct(target, "["))
    targetEnd = match[target] + 1;

  if (targetEnd == None || !isName(targetEnd, "of")) {
    copy(keyword);
    copy(open);
    pos = open + 1;
    if (declared)
      emitDeclaration(scope, DeclMode::ForHead);
    return;
  }

  std::string index = temp("i"), items = temp("a");
  skip(keyword);
  out += "for (var " + index + " = 0, " + items + " = $nb.iter(" +
         render(targetEnd + 1, close, scope) + "); " + index + " < " + items +
         ".length; " + index + "++) {";
  std::string element = items + "[" + index + "]";
  if (targetEnd == target + 1) {
    out += declared ? " var " : " ";
    out += tokens[target].text.str() + " = " + element + ";";
  } else {
    if (!declared)
      return fail(target, "Destructuring assignment in for-of needs a "
                          "declaration");
    std::string source = temp("d");
    std::vector<std::string> names;
    out += " var " + source + " = " + element;
    std::string bindings = destructure(target, source, scope, names);
    if (!bindings.empty())
      out += ", " + bindings;
    out += ";";
  }
  size_t bodyEnd = scanStatementEnd(close + 1);
  skip(close);
  pos = close + 1;
  emitUntil(bodyEnd, scope);
  out += " }";
}

void Rewriter::emitObject(const Scope &scope) {
  size_t open = pos, close = match[open];
  std::vector<Range> members = splitList(open + 1, close);
  bool merged = false;
  for (const Range &member : members)
    if (member.first < member.second &&
        (isPunct(member.first, "...") || isPunct(member.first, "[")))
      merged = true;

  if (!merged) {
    copy(open);
    for (const Range &member : members) {
      if (member.first == member.second)
        return fail(member.first, "Unexpected ',' in object literal");
      emitMember(scope, member.first, member.second);
      if (member.second < close)
        copy(member.second);
    }
    copy(close);
    pos = close + 1;
    return;
  }

  // Spread and computed keys build the object in order.
  skip(open);
  out += "$nb.assign({}";
  bool inLiteral = false;
  for (const Range &member : members) {
    size_t begin = member.first, end = member.second;
    if (begin == end)
      return fail(begin, "Unexpected ',' in object literal");
    bool spread = isPunct(begin, "..."), computed = isPunct(begin, "[");
    if (spread || computed) {
      if (inLiteral)
        out += " }";
      inLiteral = false;
      out += ",";
      skip(begin);
    }
    if (spread) {
      out += render(begin + 1, end, scope);
    } else if (computed) {
      size_t keyEnd = match[begin] + 1;
      out += "$nb.prop(" + render(begin + 1, keyEnd - 1, scope) + ",";
      if (isPunct(keyEnd, ":"))
        out += render(keyEnd + 1, end, scope);
      else if (isPunct(keyEnd, "("))
        out += "function" + renderFunction(keyEnd, FunctionTraits());
      else
        return fail(keyEnd, "Expected ':' after a computed key");
      out += ")";
    } else {
      out += inLiteral ? "," : ", {";
      inLiteral = true;
      emitMember(scope, begin, end);
    }
    if (end < close)
      skip(end);
  }
  if (inLiteral)
    out += " }";
  out += ")";
  pos = close + 1;
}

void Rewriter::emitMember(const Scope &scope, size_t begin, size_t end) {
  const Token &first = tokens[begin];
  if (isPunct(begin, "*") || (isName(begin, "async") && isPunct(begin + 1, "*")))
    return fail(begin, "Generator methods are not supported");
  FunctionTraits traits;
  if ((isName(begin, "get") || isName(begin, "set")) && isKey(begin + 1) &&
      isPunct(begin + 2, "(")) {
    copy(begin);
    copy(begin + 1);
    pos = begin + 2;
    emitFunctionTail(traits);
  } else if (isName(begin, "async") && !at(begin + 1).newlineBefore &&
             isKey(begin + 1) && isPunct(begin + 2, "(")) {
    skip(begin);
    copy(begin + 1);
    out += ": function";
    pos = begin + 2;
    traits.isAsync = true;
    emitFunctionTail(traits);
  } else if (isKey(begin) && isPunct(begin + 1, "(")) {
    copy(begin);
    out += ": function";
    pos = begin + 1;
    emitFunctionTail(traits);
  } else if (isKey(begin) && isPunct(begin + 1, ":")) {
    copy(begin);
    copy(begin + 1);
    pos = begin + 2;
    emitUntil(end, scope);
    return;
  } else if (isIdentifier(begin) && end == begin + 1) {
    copy(begin);
    out += ": ";
    out += first.text == "arguments" ? scope.argumentsName : first.text.str();
    pos = end;
    return;
  } else {
    return fail(begin, "Unsupported object literal member");
  }
  if (pos != end)
    fail(pos, "Unexpected token after method body");
}

bool Rewriter::parseClassBody(size_t open, size_t close,
                              std::vector<ClassMember> &members) {
  for (size_t i = open + 1; i < close;) {
    if (isPunct(i, ";")) {
      ++i;
      continue;
    }
    ClassMember member;
    auto isModifier = [&](llvm::StringRef word) {
      return isName(i, word) && !isPunct(i + 1, "(") && !isPunct(i + 1, "=") &&
             !isPunct(i + 1, ";") && !isPunct(i + 1, "}");
    };
    if (isModifier("static")) {
      member.isStatic = true;
      ++i;
    }
    if (isPunct(i, "{")) {
      fail(i, "Static initialization blocks are not supported");
      return false;
    }
    if (isModifier("async") && !at(i + 1).newlineBefore) {
      member.isAsync = true;
      ++i;
    }
    if (isPunct(i, "*")) {
      fail(i, "Generator methods are not supported");
      return false;
    }
    if (isModifier("get")) {
      member.kind = ClassMember::Getter;
      ++i;
    } else if (isModifier("set")) {
      member.kind = ClassMember::Setter;
      ++i;
    }
    if (isPunct(i, "#")) {
      fail(i, "Private class members are not supported");
      return false;
    }
    member.keyBegin = i;
    if (isPunct(i, "[")) {
      i = match[i] + 1;
    } else if (isKey(i)) {
      ++i;
    } else {
      fail(i, "Unexpected token in class body");
      return false;
    }
    member.keyEnd = i;

    if (isPunct(i, "(")) {
      member.params = i;
      size_t body = match[i] + 1;
      if (!isPunct(body, "{")) {
        fail(body, "Expected '{' to start a method body");
        return false;
      }
      i = match[body] + 1;
    } else {
      if (member.kind != ClassMember::Method || member.isAsync) {
        fail(i, "Expected '(' after a method name");
        return false;
      }
      member.kind = ClassMember::Field;
      if (isPunct(i, "=")) {
        member.initBegin = i + 1;
        member.initEnd = scanExpressionEnd(i + 1, close, false, false);
        if (member.initEnd == member.initBegin) {
          fail(i, "Expected an initializer after '='");
          return false;
        }
        i = member.initEnd;
      }
      if (isPunct(i, ";")) {
        ++i;
      } else if (i < close && !at(i).newlineBefore) {
        fail(i, "Expected ';' after a class field");
        return false;
      }
    }
    members.push_back(member);
  }
  return true;
}

std::string Rewriter::memberKey(const ClassMember &member,
                                const Scope &scope) {
  const Token &key = tokens[member.keyBegin];
  if (isPunct(member.keyBegin, "["))
    return "(" + render(member.keyBegin + 1, member.keyEnd - 1, scope) + ")";
  if (key.kind == TokenKind::Name)
    return "\"" + key.text.str() + "\"";
  return key.text.str();
}

std::string Rewriter::memberAccess(const ClassMember &member,
                                   const Scope &scope) {
  const Token &key = tokens[member.keyBegin];
  if (key.kind == TokenKind::Name)
    return "." + key.text.str();
  return "[" + memberKey(member, scope) + "]";
}

void Rewriter::emitClass(const Scope &scope, DeclMode mode) {
  size_t start = pos, i = pos + 1;
  std::string name;
  if (isIdentifier(i))
    name = tokens[i++].text.str();
  size_t baseBegin = None, baseEnd = None;
  if (isName(i, "extends")) {
    baseBegin = i + 1;
    for (i = baseBegin; !isPunct(i, "{") && i < last(); i = skipGroup(i))
      ;
    baseEnd = i;
    if (baseEnd == baseBegin)
      return fail(i, "Expected a class to extend");
  }
  if (!isPunct(i, "{"))
    return fail(i, "Expected '{' to start a class body");
  size_t open = i, close = match[open];
  std::vector<ClassMember> members;
  if (!parseClassBody(open, close, members))
    return;

  bool derived = baseBegin != None;
  std::string className = name.empty() ? "$nb_class" : name;
  std::string superName = derived ? "$nb_super" : "";
  const ClassMember *constructor = nullptr;
  bool hasFields = false;
  for (const ClassMember &member : members) {
    const Token &key = tokens[member.keyBegin];
    if (member.kind == ClassMember::Field && !member.isStatic)
      hasFields = true;
    if (member.kind == ClassMember::Method && !member.isStatic &&
        (key.text == "constructor" || key.text == "'constructor'" ||
         key.text == "\"constructor\""))
      constructor = &member;
  }
  if (constructor && constructor->isAsync)
    return fail(constructor->keyBegin, "A constructor cannot be async");

  std::string text = "(function (" + superName + ") {";
  if (constructor) {
    FunctionTraits traits;
    traits.superName = superName;
    traits.isConstructor = true;
    if (hasFields && derived)
      traits.fieldsName = "$nb_fields";
    else if (hasFields)
      traits.prologue = " $nb_fields.call(this);";
    text += " function " + className +
            renderFunction(constructor->params, traits);
  } else {
    text += " function " + className + "() {";
    if (derived)
      text += " $nb.superCall(this, $nb_super, arguments);";
    if (hasFields)
      text += " $nb_fields.call(this);";
    text += " }";
  }
  if (derived)
    text += " $nb.inherits(" + className + ", $nb_super);";

  auto fieldValue = [&](const ClassMember &member, const Scope &fieldScope) {
    if (member.initBegin == None)
      return std::string("undefined");
    return "(" + render(member.initBegin, member.initEnd, fieldScope) + ")";
  };
  if (hasFields) {
    Scope fieldScope;
    fieldScope.superName = superName;
    text += " function $nb_fields() {";
    for (const ClassMember &member : members)
      if (member.kind == ClassMember::Field && !member.isStatic)
        text += " this" + memberAccess(member, scope) + " = " +
                fieldValue(member, fieldScope) + ";";
    text += " }";
  }
  for (const ClassMember &member : members) {
    if (&member == constructor ||
        (member.kind == ClassMember::Field && !member.isStatic))
      continue;
    if (member.kind == ClassMember::Field) {
      Scope staticScope;
      staticScope.thisName = className;
      staticScope.superName = superName;
      staticScope.superStatic = true;
      text += " " + className + memberAccess(member, scope) + " = " +
              fieldValue(member, staticScope) + ";";
      continue;
    }
    FunctionTraits traits;
    traits.isAsync = member.isAsync;
    traits.superName = superName;
    traits.superStatic = member.isStatic;
    const char *kind = member.kind == ClassMember::Getter   ? "get"
                       : member.kind == ClassMember::Setter ? "set"
                                                            : "value";
    text += " $nb.method(" + className +
            (member.isStatic ? "" : ".prototype") + ", " +
            memberKey(member, scope) + ", function" +
            renderFunction(member.params, traits) + ", \"" + kind + "\");";
  }
  text += " return " + className + "; })(";
  if (derived)
    text += render(baseBegin, baseEnd, scope);
  text += ")";
  if (stopped)
    return;

  // Keep the lines after the class where they were.
  unsigned source = countNewlines(start + 1, close + 1);
  unsigned generated = llvm::StringRef(text).count('\n');
  skip(start);
  if (mode == DeclMode::Statement && !name.empty()) {
    out += "var " + name + " = " + text + ";";
  } else if (mode == DeclMode::Hoisted && !name.empty()) {
    hoisted.push_back(name);
    out += name + " = " + text;
  } else {
    out += text;
  }
  if (source > generated)
    out.append(source - generated, '\n');
  pos = close + 1;
}

void Rewriter::emitSuper(const Scope &scope) {
  size_t i = pos;
  if (scope.superName.empty())
    return fail(i, "'super' is only supported in classes that extend "
                   "another class");
  const std::string &self = scope.thisName;
  if (isPunct(i + 1, "(")) {
    if (!scope.inConstructor)
      return fail(i, "'super()' is only valid in a constructor");
    size_t open = i + 1, close = match[open];
    std::string args = hasSpread(open)
                           ? spreadList(open, close, scope)
                           : "[" + render(open + 1, close, scope) + "]";
    std::string call = "$nb.superCall(" + self + ", " + scope.superName +
                       ", " + args + ")";
    if (!scope.fieldsName.empty())
      call = "(" + call + ", " + scope.fieldsName + ".call(" + self + "))";
    skip(i);
    out += call;
    pos = close + 1;
    return;
  }

  std::string member;
  size_t next;
  if (isPunct(i + 1, ".") && at(i + 2).kind == TokenKind::Name) {
    member = "." + tokens[i + 2].text.str();
    next = i + 3;
  } else if (isPunct(i + 1, "[")) {
    member = "[" + render(i + 2, match[i + 1], scope) + "]";
    next = match[i + 1] + 1;
  } else {
    return fail(i, "Unexpected 'super'");
  }
  skip(i);
  out += scope.superName + (scope.superStatic ? "" : ".prototype") + member;
  if (!isPunct(next, "(")) {
    pos = next;
    return;
  }
  size_t close = match[next];
  if (hasSpread(next)) {
    out += ".apply(" + self + ", " + spreadList(next, close, scope) + ")";
  } else {
    std::string args = render(next + 1, close, scope);
    out += ".call(" + self;
    if (!llvm::StringRef(args).trim().empty())
      out += ", " + args;
    out += ")";
  }
  pos = close + 1;
}

void Rewriter::emitAwait(const Scope &scope) {
  size_t i = pos;
  size_t end = scanUnaryEnd(i + 1);
  if (end == i + 1)
    return fail(i, "Expected an expression after 'await'");
  skip(i);
  out += "$nb.await(";
  pos = i + 1;
  emitUntil(end, scope);
  out += ")";
}

// f(...xs) and a.b.f(...xs) become .apply() calls. The callee has already
// been written out, so only plain dotted names can be given a receiver.
void Rewriter::emitSpreadCall(const Scope &scope) {
  size_t open = pos, close = match[open];
  size_t callee = open - 1;
  if (at(callee).kind != TokenKind::Name || isName(callee, "super"))
    return fail(open, "Spread arguments are only supported when calling a "
                      "named function or method");
  size_t chain = callee;
  while (chain >= 2 && isPunct(chain - 1, ".") &&
         at(chain - 2).kind == TokenKind::Name)
    chain -= 2;
  if (chain > 0 && (isPunct(chain - 1, ".") || isName(chain - 1, "new") ||
                    isPunct(chain - 1, "?.")))
    return fail(open, "Spread arguments are only supported when calling a "
                      "named function or method");
  std::string receiver = "undefined";
  if (chain != callee) {
    receiver.clear();
    for (size_t k = chain; k < callee - 1; k += 2) {
      if (k != chain)
        receiver += ".";
      llvm::StringRef part = tokens[k].text;
      if (k == chain && part == "this")
        receiver += scope.thisName;
      else if (k == chain && part == "arguments")
        receiver += scope.argumentsName;
      else
        receiver += part.str();
    }
  }
  skip(open);
  out += ".apply(" + receiver + ", " + spreadList(open, close, scope) + ")";
  pos = close + 1;
}

std::string Rewriter::spreadList(size_t open, size_t close,
                                 const Scope &scope) {
  std::vector<std::string> parts;
  for (const Range &item : splitList(open + 1, close)) {
    if (isPunct(item.first, "..."))
      parts.push_back("$nb.iter(" + render(item.first + 1, item.second, scope) +
                      ")");
    else
      parts.push_back("[" + render(item.first, item.second, scope) + "]");
  }
  return "[].concat(" + llvm::join(parts, ", ") + ")";
}

std::string Rewriter::destructure(size_t open, const std::string &source,
                                  const Scope &scope,
                                  std::vector<std::string> &names) {
  std::vector<std::string> parts;
  bindPattern(open, source, scope, names, parts);
  return llvm::join(parts, ", ");
}

void Rewriter::bindPattern(size_t open, const std::string &source,
                           const Scope &scope, std::vector<std::string> &names,
                           std::vector<std::string> &parts) {
  size_t close = match[open];
  if (isPunct(open, "[")) {
    std::string items = temp("d");
    names.push_back(items);
    parts.push_back(items + " = $nb.iter(" + source + ")");
    unsigned index = 0;
    for (const Range &item : splitList(open + 1, close)) {
      if (item.first == item.second) {
        ++index;
        continue;
      }
      if (isPunct(item.first, "...")) {
        if (!isIdentifier(item.first + 1))
          return fail(item.first, "A rest element must be a plain name");
        bindName(item.first + 1,
                 items + ".slice(" + std::to_string(index) + ")", names,
                 parts);
        return;
      }
      bindTarget(item.first, item.second,
                 items + "[" + std::to_string(index) + "]", scope, names,
                 parts);
      ++index;
    }
    return;
  }

  std::vector<std::string> keys;
  for (const Range &item : splitList(open + 1, close)) {
    size_t begin = item.first, end = item.second;
    if (begin == end)
      continue;
    if (isPunct(begin, "...")) {
      if (!isIdentifier(begin + 1))
        return fail(begin, "A rest element must be a plain name");
      bindName(begin + 1,
               "$nb.rest(" + source + ", [" + llvm::join(keys, ", ") + "])",
               names, parts);
      return;
    }
    const Token &key = tokens[begin];
    std::string access;
    size_t next = begin + 1;
    if (isPunct(begin, "[")) {
      std::string expr = render(begin + 1, match[begin], scope);
      access = source + "[" + expr + "]";
      keys.push_back("(" + expr + ")");
      next = match[begin] + 1;
    } else if (key.kind == TokenKind::Name) {
      access = source + "." + key.text.str();
      keys.push_back("\"" + key.text.str() + "\"");
    } else if (key.kind == TokenKind::String || key.kind == TokenKind::Number) {
      access = source + "[" + key.text.str() + "]";
      keys.push_back(key.text.str());
    } else {
      return fail(begin, "Unexpected token in destructuring pattern");
    }
    if (isPunct(next, ":"))
      bindTarget(next + 1, end, access, scope, names, parts);
    else if (isIdentifier(begin))
      bindTarget(begin, end, access, scope, names, parts);
    else
      return fail(next, "Expected ':' in destructuring pattern");
  }
}

void Rewriter::bindTarget(size_t begin, size_t end, const std::string &access,
                          const Scope &scope, std::vector<std::string> &names,
                          std::vector<std::string> &parts) {
  size_t targetEnd;
  if (isIdentifier(begin))
    targetEnd = begin + 1;
  else if (isPunct(begin, "{") || isPunct(begin, "["))
    targetEnd = match[begin] + 1;
  else
    return fail(begin, "Unexpected token in destructuring pattern");

  std::string value = access;
  if (isPunct(targetEnd, "=")) {
    std::string raw = temp("d");
    names.push_back(raw);
    parts.push_back(raw + " = " + access);
    value = raw + " === undefined ? (" + render(targetEnd + 1, end, scope) +
            ") : " + raw;
  } else if (targetEnd != end) {
    return fail(targetEnd, "Unexpected token in destructuring pattern");
  }
  if (targetEnd == begin + 1)
    return bindName(begin, value, names, parts);
  std::string nested = temp("d");
  names.push_back(nested);
  parts.push_back(nested + " = " + value);
  bindPattern(begin, nested, scope, names, parts);
}

void Rewriter::bindName(size_t i, const std::string &value,
                        std::vector<std::string> &names,
                        std::vector<std::string> &parts) {
  names.push_back(tokens[i].text.str());
  parts.push_back(tokens[i].text.str() + " = " + value);
}

// The whole program runs as one async body. Declarations are hoisted out so
// they stay global, and the last expression statement becomes the result.
void Rewriter::emitAsyncProgram() {
  Scope body = asyncScope(Scope());
  std::vector<Range> statements;
  for (size_t i = 0; i < last();) {
    size_t end = std::max(scanStatementEnd(i), i + 1);
    statements.push_back({i, end});
    i = end;
  }
  size_t result = None;
  for (size_t k = statements.size(); k-- > 0;) {
    if (isPunct(statements[k].first, ";"))
      continue;
    if (isExpressionStatement(statements[k].first))
      result = k;
    break;
  }

  std::string functions;
  out = "$nb.async(this, [], function ($nb_ctx) { ";
  out += AsyncPrologue;
  for (size_t k = 0; k < statements.size() && !stopped; ++k) {
    size_t begin = statements[k].first, end = statements[k].second;
    pos = begin;
    if (isFunctionStart(begin)) {
      functions += render(begin, end, Scope()) + "\n";
      out.append(countNewlines(begin, end), '\n');
      continue;
    }
    if (isDeclarationStart(begin)) {
      emitDeclaration(body, DeclMode::Hoisted);
      emitUntil(end, body);
    } else if (isName(begin, "class") && isIdentifier(begin + 1)) {
      emitClass(body, DeclMode::Hoisted);
      out += ";";
      emitUntil(end, body);
    } else if (k == result) {
      size_t exprEnd = isPunct(end - 1, ";") ? end - 1 : end;
      out += "return (";
      emitUntil(exprEnd, body);
      out += ");";
      if (exprEnd != end)
        skip(exprEnd);
      continue;
    } else {
      emitUntil(end, body);
    }
    if (!isPunct(end - 1, ";") && !isPunct(end - 1, "}"))
      out += ";";
  }
  skip(last());
  out += "\n})";

  std::vector<std::string> names;
  llvm::StringSet<> seen;
  for (const std::string &name : hoisted)
    if (seen.insert(name).second)
      names.push_back(name);
  std::string prefix;
  if (!names.empty())
    prefix = "var " + llvm::join(names, ", ") + "; ";
  out = prefix + out;
  if (!functions.empty())
    out += ";\n" + functions;
}

llvm::Expected<std::string> Rewriter::run() {
  Scope program;
  program.topLevel = true;
  emitUntil(last(), program);
  if (!stopped) {
    skip(last());
    return std::move(out);
  }
  if (needsAsync) {
    out.clear();
    pos = 0;
    nextTemp = 0;
    hoisted.clear();
    stopped = false;
    needsAsync = false;
    emitAsyncProgram();
    if (!stopped)
      return std::move(out);
  }
  return syntaxError(failure, failureLine);
}

llvm::Expected<std::string> nbkernel::downlevel(llvm::StringRef source) {
  std::vector<Token> tokens;
  if (llvm::Error err = Lexer(source).run(tokens))
    return std::move(err);
  std::vector<size_t> match;
  if (llvm::Error err = matchBrackets(tokens, match))
    return std::move(err);
  return Rewriter(tokens, match).run();
}
