#ifndef __LP_PATCH_DISPATCHER__
#define __LP_PATCH_DISPATCHER__

#include "Headers.hpp"
#include "PatchQueue.hpp"
#include "SessionRegistry.hpp"

namespace lp {
/**
 * @brief Entry point for code that wants to update open pages.
 *
 * A queued patch is pushed immediately to the session's open sockets; if none
 * accepts it, it stays queued until the page polls for it or a socket opens.
 * Safe to call from any thread.
 */
class PatchDispatcher {
 public:
  PatchDispatcher();
  PatchDispatcher(shared_ptr<SessionRegistry> _registry,
                  shared_ptr<PatchQueue> _queue);

  /**
   * @brief Queues a patch for a session and tries to push it right away.
   *
   * With an empty session or target id nothing is queued and `cleanup` runs
   * immediately. Otherwise `cleanup` (if set) replaces the one stored for
   * (session, target) and runs when the browser reports the target missing.
   * Never throws; exceptions from `cleanup` are logged.
   */
  void queuePatch(const string& sessionId, const Patch& patch,
                  std::function<void()> cleanup = nullptr);

  /** @brief Removes and returns all pending patches for the session. */
  vector<Patch> drainPatches(const string& sessionId);

  /**
   * @brief The browser could not find `targetId`: runs and forgets the stored
   * cleanup, if any.
   */
  void notifyInvalid(const string& sessionId, const string& targetId);

  /**
   * @brief Registers a freshly upgraded socket and flushes anything that was
   * queued before it opened.
   */
  void attachConnection(const string& sessionId,
                        shared_ptr<WebSocketConnection> connection);
  void detachConnection(const string& sessionId,
                        shared_ptr<WebSocketConnection> connection);

  /**
   * @brief Pushes the session's pending patches. Delivered entries are
   * removed from the queue.
   * @return true if at least one connection accepted them.
   */
  bool flushPending(const string& sessionId);

  int broadcastReload();

  inline shared_ptr<SessionRegistry> getRegistry() { return registry; }
  inline shared_ptr<PatchQueue> getQueue() { return queue; }

 protected:
  void runCleanup(CleanupAction* cleanup, const string& sessionId,
                  const string& targetId);
  /**
   * @brief Returns the lock that keeps a session's pushes in order. Sessions
   * never wait on each other's socket writes.
   */
  shared_ptr<std::mutex> sessionFlushMutex(const string& sessionId);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<PatchQueue> queue;
  std::mutex flushMapMutex;
  unordered_map<string, shared_ptr<std::mutex>> flushMutexes;
};
}  // namespace lp

#endif  // __LP_PATCH_DISPATCHER__
