#include "PatchDispatcher.hpp"

namespace lp {
PatchDispatcher::PatchDispatcher()
    : registry(make_shared<SessionRegistry>()),
      queue(make_shared<PatchQueue>()) {}

PatchDispatcher::PatchDispatcher(shared_ptr<SessionRegistry> _registry,
                                 shared_ptr<PatchQueue> _queue)
    : registry(_registry), queue(_queue) {}

void PatchDispatcher::queuePatch(const string& sessionId, const Patch& patch,
                                 std::function<void()> cleanup) {
  CleanupAction action(std::move(cleanup));
  if (sessionId.empty() || patch.targetId.empty()) {
    VLOG(2) << "Patch " << patch << " has no session or target, cleaning up";
    runCleanup(&action, sessionId, patch.targetId);
    return;
  }

  queue->enqueue(sessionId, patch);
  if (!action.empty()) {
    // The superseded cleanup is dropped here, outside the queue lock
    CleanupAction previous =
        queue->replaceCleanup(sessionId, patch.targetId, std::move(action));
  }
  try {
    flushPending(sessionId);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Push to session " << sessionId
                 << " failed, patch stays queued: " << e.what();
  }
}

vector<Patch> PatchDispatcher::drainPatches(const string& sessionId) {
  if (sessionId.empty()) {
    return {};
  }
  return queue->drain(sessionId);
}

void PatchDispatcher::notifyInvalid(const string& sessionId,
                                    const string& targetId) {
  if (sessionId.empty() || targetId.empty()) {
    return;
  }
  CleanupAction cleanup = queue->takeCleanup(sessionId, targetId);
  if (cleanup.empty()) {
    VLOG(1) << "No cleanup registered for #" << targetId << " in session "
            << sessionId;
    return;
  }
  VLOG(1) << "Target #" << targetId << " is gone from session " << sessionId
          << ", running its cleanup";
  runCleanup(&cleanup, sessionId, targetId);
}

void PatchDispatcher::attachConnection(
    const string& sessionId, shared_ptr<WebSocketConnection> connection) {
  registry->registerConnection(sessionId, connection);
  flushPending(sessionId);
}

void PatchDispatcher::detachConnection(
    const string& sessionId, shared_ptr<WebSocketConnection> connection) {
  registry->unregisterConnection(sessionId, connection);
}

bool PatchDispatcher::flushPending(const string& sessionId) {
  if (sessionId.empty()) {
    return false;
  }
  auto flushMutex = sessionFlushMutex(sessionId);
  lock_guard<std::mutex> guard(*flushMutex);
  vector<QueuedPatch> queued = queue->snapshot(sessionId);
  if (queued.empty()) {
    return false;
  }
  vector<Patch> patches;
  patches.reserve(queued.size());
  for (const auto& entry : queued) {
    patches.push_back(entry.patch);
  }
  if (!registry->sendPatches(sessionId, patches)) {
    VLOG(2) << "No open connection took " << patches.size()
            << " patches for session " << sessionId << ", keeping them";
    return false;
  }
  queue->removeThrough(sessionId, queued.back().sequence);
  return true;
}

int PatchDispatcher::broadcastReload() { return registry->broadcastReload(); }

shared_ptr<std::mutex> PatchDispatcher::sessionFlushMutex(
    const string& sessionId) {
  lock_guard<std::mutex> guard(flushMapMutex);
  auto& flushMutex = flushMutexes[sessionId];
  if (!flushMutex) {
    flushMutex.reset(new std::mutex());
  }
  return flushMutex;
}

void PatchDispatcher::runCleanup(CleanupAction* cleanup,
                                 const string& sessionId,
                                 const string& targetId) {
  try {
    cleanup->invoke();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Cleanup for #" << targetId << " in session " << sessionId
                 << " threw: " << e.what();
  }
}
}  // namespace lp
