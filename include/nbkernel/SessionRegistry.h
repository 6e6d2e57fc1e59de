#ifndef NBKERNEL_SESSIONREGISTRY_H
#define NBKERNEL_SESSIONREGISTRY_H

#include <cstddef>
#include <memory>

#include <llvm/ADT/StringMap.h>
#include <llvm/ADT/StringRef.h>

#include "SessionClient.h"
#include "WorkerPool.h"

namespace nbkernel {

/// Owns the SessionClient of every open session, by session id. A server
/// creates one alongside its WorkerPool and destroys it before the pool, so
/// every session's worker is released at shutdown.
class SessionRegistry {
public:
  explicit SessionRegistry(WorkerPool &pool,
                           SessionMode mode = SessionMode::Sticky);
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  SessionClient &getOrCreate(llvm::StringRef sessionId);

  /// Returns nullptr if there is no such session.
  SessionClient *find(llvm::StringRef sessionId);

  /// Release and forget a session. Returns false if there was none.
  bool release(llvm::StringRef sessionId);

  void releaseAll();

  std::size_t size() const { return sessions.size(); }

private:
  WorkerPool &pool;
  SessionMode mode;
  llvm::StringMap<std::unique_ptr<SessionClient>> sessions;
};

} // end namespace nbkernel

#endif // NBKERNEL_SESSIONREGISTRY_H
