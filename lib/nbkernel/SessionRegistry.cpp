#include "nbkernel/SessionRegistry.h"

using namespace nbkernel;

SessionRegistry::SessionRegistry(WorkerPool &pool, SessionMode mode)
    : pool(pool), mode(mode) {}

SessionRegistry::~SessionRegistry() { releaseAll(); }

SessionClient &SessionRegistry::getOrCreate(llvm::StringRef sessionId) {
  auto &session = sessions[sessionId];
  if (!session)
    session = std::make_unique<SessionClient>(pool, sessionId.str(), mode);
  return *session;
}

SessionClient *SessionRegistry::find(llvm::StringRef sessionId) {
  auto it = sessions.find(sessionId);
  if (it == sessions.end())
    return nullptr;
  return it->second.get();
}

bool SessionRegistry::release(llvm::StringRef sessionId) {
  auto it = sessions.find(sessionId);
  if (it == sessions.end())
    return false;
  // Take the session out first; its release may run result handlers that
  // look it up again.
  std::unique_ptr<SessionClient> session = std::move(it->second);
  sessions.erase(it);
  session->release();
  return true;
}

void SessionRegistry::releaseAll() {
  while (!sessions.empty())
    release(sessions.begin()->getKey());
}
