#include "ClientReconciler.hpp"

namespace lp {
const std::chrono::milliseconds ClientReconciler::POLL_PERIOD(1500);
const std::chrono::milliseconds ClientReconciler::BACKOFF_BASE(1200);
const std::chrono::milliseconds ClientReconciler::BACKOFF_MAX(10000);

ClientReconciler::ClientReconciler(
    shared_ptr<Document> _document,
    std::function<void(const string&)> _reportInvalid)
    : document(_document),
      reportInvalid(std::move(_reportInvalid)),
      state(ReconcilerState::CONNECTING),
      attempt(0) {}

vector<ReconcilerAction> ClientReconciler::start(TimePoint now) {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  vector<ReconcilerAction> actions;
  state = ReconcilerState::CONNECTING;
  actions.push_back(ReconcilerAction::OPEN_SOCKET);
  startPolling(now, &actions);
  return actions;
}

vector<ReconcilerAction> ClientReconciler::onOpen(TimePoint now) {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  VLOG(1) << "Socket open, polling stopped";
  state = ReconcilerState::CONNECTED;
  attempt = 0;
  reconnectAt.reset();
  nextPollAt.reset();
  // Catch anything queued while the socket was down
  return {ReconcilerAction::POLL};
}

vector<ReconcilerAction> ClientReconciler::onDisconnect(TimePoint now) {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  vector<ReconcilerAction> actions;
  state = ReconcilerState::RECONNECT_WAIT;
  scheduleReconnect(now);
  startPolling(now, &actions);
  return actions;
}

vector<ReconcilerAction> ClientReconciler::tick(TimePoint now) {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  vector<ReconcilerAction> actions;
  if (state == ReconcilerState::RECONNECT_WAIT && reconnectAt &&
      now >= *reconnectAt) {
    reconnectAt.reset();
    state = ReconcilerState::CONNECTING;
    actions.push_back(ReconcilerAction::OPEN_SOCKET);
  }
  if (state != ReconcilerState::CONNECTED && nextPollAt &&
      now >= *nextPollAt) {
    nextPollAt = now + POLL_PERIOD;
    actions.push_back(ReconcilerAction::POLL);
  }
  return actions;
}

void ClientReconciler::scheduleReconnect(TimePoint now) {
  if (reconnectAt) {
    return;
  }
  auto delay = backoffDelay(attempt);
  attempt = min(attempt + 1, MAX_ATTEMPT);
  reconnectAt = now + delay;
  VLOG(1) << "Reconnecting in " << delay.count() << "ms";
}

void ClientReconciler::startPolling(TimePoint now,
                                    vector<ReconcilerAction>* actions) {
  if (nextPollAt) {
    return;
  }
  actions->push_back(ReconcilerAction::POLL);
  nextPollAt = now + POLL_PERIOD;
}

std::chrono::milliseconds ClientReconciler::backoffDelay(int attempt) {
  attempt = max(0, min(attempt, MAX_ATTEMPT));
  std::chrono::milliseconds delay = BACKOFF_BASE * (1 << attempt);
  return min(delay, BACKOFF_MAX);
}

void ClientReconciler::handleMessage(const string& text) {
  json message;
  try {
    message = json::parse(text);
  } catch (const json::exception& je) {
    VLOG(1) << "Ignoring malformed message: " << je.what();
    return;
  }
  if (!message.is_object()) {
    return;
  }
  auto typeIt = message.find("type");
  if (typeIt == message.end() || !typeIt->is_string()) {
    return;
  }
  string type = typeIt->get<string>();
  if (type == "patch") {
    auto it = message.find("patches");
    if (it != message.end()) {
      applyJsonPatches(*it);
    }
  } else if (type == "reload") {
    LOG(INFO) << "Server asked for a reload";
    document->reload();
  }
}

void ClientReconciler::handlePollResponse(const string& body) {
  json response;
  try {
    response = json::parse(body);
  } catch (const json::exception& je) {
    VLOG(1) << "Ignoring malformed poll response: " << je.what();
    return;
  }
  if (!response.is_object()) {
    return;
  }
  auto it = response.find("patches");
  if (it != response.end()) {
    applyJsonPatches(*it);
  }
}

void ClientReconciler::applyJsonPatches(const json& patches) {
  if (!patches.is_array()) {
    return;
  }
  for (const auto& entry : patches) {
    if (!entry.is_object()) {
      continue;
    }
    try {
      applyPatch(entry.get<Patch>());
    } catch (const json::exception& je) {
      VLOG(1) << "Skipping malformed patch: " << je.what();
    }
  }
}

void ClientReconciler::applyPatches(const vector<Patch>& patches) {
  for (const auto& patch : patches) {
    applyPatch(patch);
  }
}

void ClientReconciler::applyPatch(const Patch& patch) {
  if (patch.targetId.empty()) {
    return;
  }
  if (!document->hasElement(patch.targetId)) {
    VLOG(1) << "Target #" << patch.targetId << " is missing, reporting it";
    if (reportInvalid) {
      reportInvalid(patch.targetId);
    }
    return;
  }
  VLOG(2) << "Applying " << patch;
  switch (patch.swap) {
    case SwapMode::INLINE:
      document->setInner(patch.targetId, patch.html);
      break;
    case SwapMode::OUTLINE:
      document->replaceOuter(patch.targetId, patch.html);
      break;
    case SwapMode::APPEND:
      document->insertAtEnd(patch.targetId, patch.html);
      break;
    case SwapMode::PREPEND:
      document->insertAtStart(patch.targetId, patch.html);
      break;
    case SwapMode::NONE:
      break;
  }
}

ReconcilerState ClientReconciler::getState() {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  return state;
}

int ClientReconciler::getAttempt() {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  return attempt;
}

bool ClientReconciler::isPolling() {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  return bool(nextPollAt);
}

optional<ClientReconciler::TimePoint> ClientReconciler::nextDeadline() {
  lock_guard<std::recursive_mutex> guard(reconcilerMutex);
  if (reconnectAt && nextPollAt) {
    return min(*reconnectAt, *nextPollAt);
  }
  if (reconnectAt) {
    return reconnectAt;
  }
  return nextPollAt;
}
}  // namespace lp
