#include "PatchQueue.hpp"

namespace lp {
PatchQueue::PatchQueue() : nextSequence(1) {}

uint64_t PatchQueue::enqueue(const string& sessionId, const Patch& patch) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  uint64_t sequence = nextSequence++;
  pending[sessionId].push_back(QueuedPatch{sequence, patch});
  VLOG(2) << "Queued " << patch << " for session " << sessionId << " as "
          << sequence;
  return sequence;
}

vector<QueuedPatch> PatchQueue::snapshot(const string& sessionId) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  auto it = pending.find(sessionId);
  if (it == pending.end()) {
    return {};
  }
  return vector<QueuedPatch>(it->second.begin(), it->second.end());
}

void PatchQueue::removeThrough(const string& sessionId,
                               uint64_t lastSequence) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  auto it = pending.find(sessionId);
  if (it == pending.end()) {
    return;
  }
  auto& entries = it->second;
  while (!entries.empty() && entries.front().sequence <= lastSequence) {
    entries.pop_front();
  }
  if (entries.empty()) {
    pending.erase(it);
  }
}

vector<Patch> PatchQueue::drain(const string& sessionId) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  vector<Patch> patches;
  auto it = pending.find(sessionId);
  if (it == pending.end()) {
    return patches;
  }
  for (auto& entry : it->second) {
    patches.push_back(std::move(entry.patch));
  }
  pending.erase(it);
  return patches;
}

CleanupAction PatchQueue::replaceCleanup(const string& sessionId,
                                         const string& targetId,
                                         CleanupAction cleanup) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  auto key = make_pair(sessionId, targetId);
  CleanupAction previous;
  auto it = cleanups.find(key);
  if (it != cleanups.end()) {
    previous = std::move(it->second);
    it->second = std::move(cleanup);
  } else {
    cleanups.emplace(key, std::move(cleanup));
  }
  return previous;
}

CleanupAction PatchQueue::takeCleanup(const string& sessionId,
                                      const string& targetId) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  auto it = cleanups.find(make_pair(sessionId, targetId));
  if (it == cleanups.end()) {
    return CleanupAction();
  }
  CleanupAction cleanup = std::move(it->second);
  cleanups.erase(it);
  return cleanup;
}

int PatchQueue::pendingCount() {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  int count = 0;
  for (const auto& it : pending) {
    count += int(it.second.size());
  }
  return count;
}

int PatchQueue::pendingCount(const string& sessionId) {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  auto it = pending.find(sessionId);
  if (it == pending.end()) {
    return 0;
  }
  return int(it->second.size());
}

int PatchQueue::cleanupCount() {
  lock_guard<std::recursive_mutex> guard(queueMutex);
  return int(cleanups.size());
}
}  // namespace lp
