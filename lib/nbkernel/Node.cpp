#include "nbkernel/Node.h"

#include <cmath>
#include <limits>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/ConvertUTF.h>
#include <llvm/Support/JSON.h>
#include <llvm/Support/raw_os_ostream.h>
#include <llvm/Support/raw_ostream.h>
#include <system_error>

#include "nbkernel/CBOREncoder.h"
#include "nbkernel/JSONEncoder.h"

using namespace nbkernel;

using std::int64_t;
using std::uint64_t;

void Node::validateUTF8() const {
  const auto &Str = std::get<StringStorage>(variant_);
  auto Ptr = reinterpret_cast<const llvm::UTF8 *>(Str.data());
  if (!llvm::isLegalUTF8String(&Ptr, Ptr + Str.size()))
    llvm::report_fatal_error("invalid UTF-8 in string value");
}

void Node::validateKeysUTF8() const {
  const auto &map = std::get<Map>(variant_);
  for (const auto &Item : map) {
    auto Ptr = reinterpret_cast<const llvm::UTF8 *>(Item.key().data());
    if (!llvm::isLegalUTF8String(&Ptr, Ptr + Item.key().size()))
      llvm::report_fatal_error("invalid UTF-8 in map key");
  }
}

Node::Node() : variant_() {}

Node::Node(std::nullptr_t) : variant_() {}

Node::Node(bool val) : variant_(val) {}

Node::Node(double Float) : variant_(Float) {}

Node::Node(const char *Str) : variant_(StringStorage(Str)) { validateUTF8(); }

Node::Node(UTF8StringArg, const llvm::StringRef &sr)
    : variant_(StringStorage(sr)) {
  validateUTF8();
}

Node::Node(BytesRef bytes) : Node(byte_string_arg, bytes) {}

Node::Node(NodeListArg) : Node(List()) {}

Node::Node(NodeListArg, std::initializer_list<Node> init) : Node(List(init)) {}

Node::Node(const List &list) : variant_(list) {}
Node::Node(List &&list) : variant_(std::move(list)) {}

Node::Node(NodeMapArg) : Node(Map()) {}

Node::Node(NodeMapArg,
           std::initializer_list<std::pair<llvm::StringRef, Node>> init)
    : Node(Map(init)) {}

Node::Node(const Map &map) : variant_(map) { validateKeysUTF8(); }
Node::Node(Map &&map) : variant_(std::move(map)) { validateKeysUTF8(); }

bool Node::operator==(const Node &other) const { return compare(other) == 0; }

bool Node::operator!=(const Node &other) const { return compare(other) != 0; }

bool Node::operator<(const Node &other) const { return compare(other) < 0; }

int Node::compare(const Node &other) const {
  Kind kind_left = kind(), kind_right = other.kind();
  if (kind_left < kind_right)
    return -1;
  else if (kind_left > kind_right)
    return 1;
  if (kind_left == Kind::Integer) {
    bool signed_left = is<std::int64_t>();
    bool signed_right = other.is<std::int64_t>();
    if (signed_left && signed_right) {
      auto left = as<std::int64_t>(), right = other.as<std::int64_t>();
      return left < right ? -1 : left == right ? 0 : 1;
    } else if (!signed_left && !signed_right) {
      auto left = as<std::uint64_t>(), right = other.as<std::uint64_t>();
      return left < right ? -1 : left == right ? 0 : 1;
    } else {
      return signed_left ? -1 : 1;
    }
  }
  return variant_ < other.variant_ ? -1 : variant_ == other.variant_ ? 0 : 1;
}

Kind Node::kind() const {
  return std::visit(Overloaded{
                        [](const std::monostate &) { return Kind::Null; },
                        [](const bool &) { return Kind::Boolean; },
                        [](const std::int64_t &) { return Kind::Integer; },
                        [](const std::uint64_t &) { return Kind::Integer; },
                        [](const double &) { return Kind::Float; },
                        [](const StringStorage &) { return Kind::String; },
                        [](const BytesStorage &) { return Kind::Bytes; },
                        [](const List &) { return Kind::List; },
                        [](const Map &) { return Kind::Map; },
                    },
                    variant_);
}

std::size_t Node::size() const {
  return std::visit(
      Overloaded{
          [](const StringStorage &val) -> std::size_t { return val.size(); },
          [](const BytesStorage &val) -> std::size_t { return val.size(); },
          [](const List &List) -> std::size_t { return List.size(); },
          [](const Map &Map) -> std::size_t { return Map.size(); },
          [](const auto &) -> std::size_t { return 0; },
      },
      variant_);
}

bool Node::empty() const noexcept { return size() == 0; }

void Node::clear() {
  std::visit(Overloaded{
                 [](List &val) { val.clear(); },
                 [](Map &val) { val.clear(); },
                 [](auto &) {},
             },
             variant_);
}

Node &Node::operator[](std::size_t i) { return at(i); }

const Node &Node::operator[](std::size_t i) const { return at(i); }

Node &Node::at(std::size_t i) { return std::get<List>(variant_).at(i); }

const Node &Node::at(std::size_t i) const {
  return std::get<List>(variant_).at(i);
}

Range<Node::List::iterator> Node::list_range() {
  auto &value = std::get<List>(variant_);
  return Range(value.begin(), value.end());
}

Range<Node::List::const_iterator> Node::list_range() const {
  const auto &value = std::get<List>(variant_);
  return Range(value.begin(), value.end());
}

Node &Node::operator[](const llvm::StringRef &name) {
  return std::get<Map>(variant_).try_emplace(name).first->value();
}

const Node &Node::operator[](const llvm::StringRef &name) const {
  return at(name);
}

bool Node::contains(const llvm::StringRef &key) const noexcept {
  if (const Map *value = std::get_if<Map>(&variant_))
    return value->find(key) != value->end();
  return false;
}

Node &Node::at(const llvm::StringRef &name) {
  auto &value = std::get<Map>(variant_);
  auto iter = value.find(name);
  if (iter == value.end())
    llvm::report_fatal_error(llvm::Twine("Key \"" + std::string(name) + "\" not found"));
  return iter->value();
}

const Node &Node::at(const llvm::StringRef &name) const {
  const auto &value = std::get<Map>(variant_);
  auto iter = value.find(name);
  if (iter == value.end())
    llvm::report_fatal_error(llvm::Twine("Key \"" + std::string(name) + "\" not found"));
  return iter->value();
}

const Node &Node::at_or_null(const llvm::StringRef &name) const {
  static const Node null_node = nullptr;
  const Map *value = std::get_if<Map>(&variant_);
  if (!value)
    return null_node;
  auto iter = value->find(name);
  return iter == value->end() ? null_node : iter->value();
}

void Node::erase(const llvm::StringRef &name) {
  std::get<Map>(variant_).erase(name);
}

Range<Node::Map::iterator> Node::map_range() {
  auto &value = std::get<Map>(variant_);
  return Range(value.begin(), value.end());
}

Range<Node::Map::const_iterator> Node::map_range() const {
  const auto &value = std::get<Map>(variant_);
  return Range(value.begin(), value.end());
}

llvm::raw_ostream &nbkernel::operator<<(llvm::raw_ostream &os,
                                        const Node &value) {
  JSONEncoder(os).visitNode(value);
  return os;
}

std::ostream &nbkernel::operator<<(std::ostream &os, const Node &value) {
  llvm::raw_os_ostream raw_os(os);
  raw_os << value;
  return os;
}

// CBOR

static double decode_float(std::uint64_t value, int total_size,
                           int mantissa_size, int exponent_bias) {
  std::uint64_t exponent_mask = (1ull << (total_size - mantissa_size - 1)) - 1;
  std::uint64_t exponent = (value >> mantissa_size) & exponent_mask;
  std::uint64_t mantissa = value & ((1ull << mantissa_size) - 1);
  double result;
  if (exponent == 0)
    result = std::ldexp(static_cast<double>(mantissa),
                        1 - (mantissa_size + exponent_bias)); // denormal
  else if (exponent == exponent_mask)
    result = mantissa == 0 ? INFINITY : NAN;
  else
    result = std::ldexp(static_cast<double>(mantissa + (1ull << mantissa_size)),
                        static_cast<int>(exponent) -
                            (mantissa_size + exponent_bias));
  return value & (1ull << (total_size - 1)) ? -result : result;
}

static llvm::Error createInvalidCBORError(llvm::StringRef message) {
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument),
      "Invalid CBOR: " + message);
}

static llvm::Error createUnsupportedCBORError(llvm::StringRef message) {
  return llvm::createStringError(std::make_error_code(std::errc::not_supported),
                                 "Unsupported CBOR: " + message);
}

// Limit on List/Map nesting, so hostile input can't exhaust the stack.
static constexpr unsigned MaxCBORDepth = 256;

static llvm::Expected<Node> loadCBORItem(BytesRef &in, unsigned depth);

llvm::Expected<Node> Node::loadFromCBOR(BytesRef in) {
  auto result = loadFromCBORSequence(in);
  if (!result)
    return result.takeError();
  if (!in.empty())
    return createInvalidCBORError("extra bytes after CBOR node");
  return *result;
}

llvm::Expected<Node> Node::loadFromCBORSequence(BytesRef &in) {
  return loadCBORItem(in, 0);
}

static llvm::Expected<Node> loadCBORItem(BytesRef &in, unsigned depth) {
  if (depth > MaxCBORDepth)
    return createUnsupportedCBORError("nesting too deep");

  auto start = [&](int &major_type, int &minor_type, std::uint64_t &additional,
                   bool &indefinite) -> llvm::Error {
    if (in.empty())
      return createInvalidCBORError("unexpected end of input");
    major_type = in.front() >> 5;
    minor_type = in.front() & 0x1f;
    in = in.drop_front();

    indefinite = false;
    additional = 0;
    if (minor_type < 24) {
      additional = minor_type;
    } else if (minor_type < 28) {
      unsigned num_bytes = 1 << (minor_type - 24);
      if (in.size() < num_bytes)
        return createInvalidCBORError("truncated head");
      while (num_bytes--) {
        additional = additional << 8 | in.front();
        in = in.drop_front();
      }
    } else if (minor_type == 31 && major_type >= 2 && major_type <= 5) {
      indefinite = true;
    } else {
      return createInvalidCBORError("invalid minor type");
    }
    return llvm::Error::success();
  };

  int major_type, minor_type;
  bool indefinite;
  std::uint64_t additional;
  bool in_middle_of_string = false;

  auto next_string = [&]() -> llvm::Expected<bool> {
    if (!indefinite && in_middle_of_string)
      return false;
    in_middle_of_string = true;
    if (!indefinite)
      return true;
    if (!in.empty() && in.front() == 0xff) {
      in = in.drop_front();
      return false;
    }
    int inner_major_type, inner_minor_type;
    bool inner_indefinite;
    if (auto error = start(inner_major_type, inner_minor_type, additional,
                           inner_indefinite))
      return std::move(error);
    if (inner_major_type != major_type || inner_indefinite)
      return createInvalidCBORError("invalid indefinite-length string");
    return true;
  };

  auto next_item = [&] {
    if (indefinite) {
      if (!in.empty() && in.front() == 0xff) {
        in = in.drop_front();
        return false;
      }
      return !in.empty();
    }
    return additional-- > 0;
  };

  if (auto error = start(major_type, minor_type, additional, indefinite))
    return std::move(error);
  if (major_type == 6)
    return createUnsupportedCBORError("tags are not supported");

  switch (major_type) {
  case 0:
    return Node(additional);
  case 1:
    if (additional > std::uint64_t(std::numeric_limits<std::int64_t>::max()))
      return createUnsupportedCBORError("integer too large");
    return Node(-std::int64_t(additional) - 1);
  case 2:
  case 3: {
    std::string result;
    while (true) {
      auto next = next_string();
      if (!next)
        return next.takeError();
      if (!*next)
        break;
      if (in.size() < additional)
        return createInvalidCBORError("missing data from string");
      result.append(reinterpret_cast<const char *>(in.data()), additional);
      in = in.drop_front(additional);
    }
    if (major_type == 2)
      return Node(byte_string_arg, result);
    auto ptr = reinterpret_cast<const llvm::UTF8 *>(result.data());
    if (!llvm::isLegalUTF8String(&ptr, ptr + result.size()))
      return createInvalidCBORError("invalid UTF-8 in string value");
    return Node(utf8_string_arg, result);
  }
  case 4: {
    Node::List result;
    while (next_item()) {
      auto item = loadCBORItem(in, depth + 1);
      if (!item)
        return item.takeError();
      result.emplace_back(std::move(*item));
    }
    return Node(std::move(result));
  }
  case 5: {
    Node::Map result;
    while (next_item()) {
      auto key = loadCBORItem(in, depth + 1);
      if (!key)
        return key.takeError();
      if (!key->is<llvm::StringRef>())
        return createUnsupportedCBORError("map keys must be strings");
      auto value = loadCBORItem(in, depth + 1);
      if (!value)
        return value.takeError();
      result.insert_or_assign(key->as<llvm::StringRef>(), std::move(*value));
    }
    return Node(std::move(result));
  }
  case 7:
    switch (minor_type) {
    case 20:
      return Node(false);
    case 21:
      return Node(true);
    case 22:
      return Node(nullptr);
    case 23: // undefined
      return Node(nullptr);
    case 25:
      return Node(decode_float(additional, 16, 10, 15));
    case 26:
      return Node(decode_float(additional, 32, 23, 127));
    case 27:
      return Node(decode_float(additional, 64, 52, 1023));
    }
    return createUnsupportedCBORError("unsupported simple value");
  default:
    llvm_unreachable("impossible major type");
  }
}

std::vector<std::uint8_t> Node::saveAsCBOR() const {
  std::vector<std::uint8_t> out;
  CBOREncoder(out).visitNode(*this);
  return out;
}

// JSON

static llvm::Error createInvalidJSONError(llvm::StringRef message) {
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument),
      "Invalid JSON: " + message);
}

static void skipJSONSpace(llvm::StringRef &json) {
  json = json.ltrim(" \t\r\n");
}

static llvm::Expected<std::string> consumeJSONString(llvm::StringRef &json) {
  skipJSONSpace(json);
  if (!json.startswith("\""))
    return createInvalidJSONError("Expected '\"'");
  size_t i = 1;
  while (i < json.size() && json[i] != '"') {
    i = json.find_first_of("\"\\", i);
    if (i < json.size() && json[i] == '\\')
      i += 2;
  }
  if (i >= json.size())
    return createInvalidJSONError("Invalid string");
  i += 1;
  // llvm::json handles the escape sequences (including surrogate pairs).
  auto valueOrErr = llvm::json::parse(json.take_front(i));
  if (!valueOrErr)
    return valueOrErr.takeError();
  json = json.drop_front(i);
  return valueOrErr->getAsString()->str();
}

static llvm::Expected<Node> consumeJSONNumber(llvm::StringRef &json) {
  size_t length = json.find_first_not_of("+-0123456789.eE");
  llvm::StringRef token = json.take_front(length);
  json = json.drop_front(token.size());
  if (token.find_first_of(".eE") == llvm::StringRef::npos) {
    if (token.startswith("-")) {
      int64_t value;
      if (!token.getAsInteger(10, value))
        return Node(value);
    } else {
      uint64_t value;
      if (!token.getAsInteger(10, value))
        return Node(value);
    }
    // Too large for 64 bits; fall back to a float.
  }
  double value;
  if (token.getAsDouble(value))
    return createInvalidJSONError("Invalid number");
  return Node(value);
}

static llvm::Expected<Node> consumeJSON(llvm::StringRef &json,
                                        unsigned depth) {
  // llvm::json::parse doesn't support the full range of uint64_t, and it
  // builds an intermediate llvm::json::Value we don't need. So we parse the
  // JSON ourselves.
  if (depth > MaxCBORDepth)
    return createInvalidJSONError("Nesting too deep");
  skipJSONSpace(json);
  if (json.empty())
    return createInvalidJSONError("Missing value");
  char c = json.front();
  if (c == 'f') {
    if (json.consume_front("false"))
      return Node(false);
  } else if (c == 't') {
    if (json.consume_front("true"))
      return Node(true);
  } else if (c == 'n') {
    if (json.consume_front("null"))
      return Node(nullptr);
  } else if (c == '-' || (c >= '0' && c <= '9')) {
    return consumeJSONNumber(json);
  } else if (c == '"') {
    auto valueOrErr = consumeJSONString(json);
    if (!valueOrErr)
      return valueOrErr.takeError();
    return Node(utf8_string_arg, *valueOrErr);
  } else if (c == '[') {
    Node result(node_list_arg);
    json = json.drop_front();
    skipJSONSpace(json);
    if (!json.startswith("]")) {
      do {
        auto valueOrErr = consumeJSON(json, depth + 1);
        if (!valueOrErr)
          return valueOrErr.takeError();
        result.emplace_back(std::move(*valueOrErr));
        skipJSONSpace(json);
      } while (json.consume_front(","));
    }
    if (!json.consume_front("]"))
      return createInvalidJSONError("Expected ']'");
    return result;
  } else if (c == '{') {
    Node result(node_map_arg);
    json = json.drop_front();
    skipJSONSpace(json);
    if (!json.startswith("}")) {
      do {
        auto keyOrErr = consumeJSONString(json);
        if (!keyOrErr)
          return keyOrErr.takeError();
        skipJSONSpace(json);
        if (!json.consume_front(":"))
          return createInvalidJSONError("Expected ':' in object");
        auto valueOrErr = consumeJSON(json, depth + 1);
        if (!valueOrErr)
          return valueOrErr.takeError();
        // Like JSON.parse, the last duplicate key wins.
        result.insert_or_assign(*keyOrErr, std::move(*valueOrErr));
        skipJSONSpace(json);
      } while (json.consume_front(","));
    }
    if (!json.consume_front("}"))
      return createInvalidJSONError("Expected '}'");
    return result;
  }
  return createInvalidJSONError("Unexpected character");
}

llvm::Expected<Node> Node::loadFromJSON(llvm::StringRef json) {
  auto valueOrErr = consumeJSON(json, 0);
  if (!valueOrErr)
    return valueOrErr.takeError();
  skipJSONSpace(json);
  if (!json.empty())
    return createInvalidJSONError("Extra characters after JSON value");
  return *valueOrErr;
}
