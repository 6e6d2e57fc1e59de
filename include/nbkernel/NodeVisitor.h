#ifndef NBKERNEL_NODEVISITOR_H
#define NBKERNEL_NODEVISITOR_H

#include <cstdint>

#include <llvm/ADT/StringRef.h>

#include "Node.h"

namespace nbkernel {

/// Visitor for various kinds of Nodes. The default implementations of
/// visitList and visitMap call the start/end hooks and recurse into each
/// item; the other methods do nothing.
class NodeVisitor {
public:
  virtual ~NodeVisitor();
  virtual void visitNode(const Node &value);
  virtual void visitNull();
  virtual void visitBoolean(bool value);
  virtual void visitUInt64(std::uint64_t value);
  virtual void visitInt64(std::int64_t value);
  virtual void visitFloat(double value);
  virtual void visitString(llvm::StringRef value);
  virtual void visitBytes(BytesRef value);
  virtual void visitList(const Node::List &value);
  virtual void visitMap(const Node::Map &value);
  virtual void startList(const Node::List &value);
  virtual void endList();
  virtual void startMap(const Node::Map &value);
  virtual void visitKey(llvm::StringRef value);
  virtual void endMap();
};

} // end namespace nbkernel

#endif // NBKERNEL_NODEVISITOR_H
