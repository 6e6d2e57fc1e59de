#ifndef NBKERNEL_CBORENCODER_H
#define NBKERNEL_CBORENCODER_H

#include <cstdint>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include "NodeVisitor.h"

namespace nbkernel {

/// Visitor that encodes Nodes in CBOR format. This is the encoding used for
/// control messages and display payloads on the worker channel. Floats are
/// always written as 64-bit values, so JavaScript numbers survive unchanged.
///
/// https://www.rfc-editor.org/rfc/rfc8949.html
class CBOREncoder : public NodeVisitor {
public:
  CBOREncoder(std::vector<std::uint8_t> &out);
  virtual ~CBOREncoder();

  void visitNull() override;
  void visitBoolean(bool value) override;
  void visitUInt64(std::uint64_t value) override;
  void visitInt64(std::int64_t value) override;
  void visitFloat(double value) override;
  void visitString(llvm::StringRef value) override;
  void visitBytes(BytesRef value) override;
  void startList(const Node::List &value) override;
  void startMap(const Node::Map &value) override;

private:
  /// Append the head of a data item, with the shortest encoding of argument.
  void encodeHead(int major_type, std::uint64_t argument);
  void appendBigEndian(std::uint64_t value, int num_bytes);

  std::vector<std::uint8_t> &out;
};

} // end namespace nbkernel

#endif // NBKERNEL_CBORENCODER_H
