#ifndef __LP_PATCH_QUEUE__
#define __LP_PATCH_QUEUE__

#include "Headers.hpp"
#include "Patch.hpp"

namespace lp {
/**
 * @brief A zero-argument action that runs at most once.
 *
 * The function is moved out before it is called, so a second invoke() (or an
 * invoke() on a moved-from action) does nothing.
 */
class CleanupAction {
 public:
  CleanupAction() {}
  CleanupAction(std::function<void()> _fn) : fn(std::move(_fn)) {}

  CleanupAction(CleanupAction&& other) : fn(std::move(other.fn)) {
    other.fn = nullptr;
  }
  CleanupAction& operator=(CleanupAction&& other) {
    fn = std::move(other.fn);
    other.fn = nullptr;
    return *this;
  }
  CleanupAction(const CleanupAction&) = delete;
  CleanupAction& operator=(const CleanupAction&) = delete;

  inline bool empty() const { return !fn; }

  /**
   * @brief Runs the action if it has not run yet.
   * @return true if the action ran. Exceptions from the action propagate.
   */
  bool invoke() {
    if (!fn) {
      return false;
    }
    auto toRun = std::move(fn);
    fn = nullptr;
    toRun();
    return true;
  }

 private:
  std::function<void()> fn;
};

struct QueuedPatch {
  uint64_t sequence;
  Patch patch;
};

/**
 * @brief Per-session FIFO of patches waiting for delivery, plus the cleanup
 * table keyed by (session, target id).
 *
 * Every queued patch gets a sequence number so that a push can remove exactly
 * the entries it delivered even if more were queued meanwhile.
 */
class PatchQueue {
 public:
  PatchQueue();

  /** @brief Appends a patch and returns its sequence number. */
  uint64_t enqueue(const string& sessionId, const Patch& patch);
  /** @brief Copies the session's pending entries in order. */
  vector<QueuedPatch> snapshot(const string& sessionId);
  /**
   * @brief Removes the session's entries whose sequence is <= lastSequence.
   */
  void removeThrough(const string& sessionId, uint64_t lastSequence);
  /** @brief Atomically pops every pending patch of the session. */
  vector<Patch> drain(const string& sessionId);

  /**
   * @brief Stores a cleanup under (session, target).
   * @return The cleanup it replaced (possibly empty). The caller destroys it
   * outside of the queue lock.
   */
  CleanupAction replaceCleanup(const string& sessionId, const string& targetId,
                               CleanupAction cleanup);
  /** @brief Removes and returns the cleanup for (session, target). */
  CleanupAction takeCleanup(const string& sessionId, const string& targetId);

  int pendingCount();
  int pendingCount(const string& sessionId);
  int cleanupCount();

 protected:
  std::recursive_mutex queueMutex;
  uint64_t nextSequence;
  unordered_map<string, deque<QueuedPatch>> pending;
  map<pair<string, string>, CleanupAction> cleanups;
};
}  // namespace lp

#endif  // __LP_PATCH_QUEUE__
