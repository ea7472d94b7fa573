#include "SessionRegistry.hpp"

namespace lp {
SessionRegistry::SessionRegistry() {}

void SessionRegistry::registerConnection(
    const string& sessionId, shared_ptr<WebSocketConnection> connection) {
  if (sessionId.empty() || !connection) {
    return;
  }
  lock_guard<std::recursive_mutex> guard(registryMutex);
  auto& connections = sessions[sessionId];
  if (find(connections.begin(), connections.end(), connection) ==
      connections.end()) {
    connections.push_back(connection);
  }
  VLOG(1) << "Registered connection " << connection->getId()
          << " for session " << sessionId << " (" << connections.size()
          << " open)";
}

void SessionRegistry::unregisterConnection(
    const string& sessionId, shared_ptr<WebSocketConnection> connection) {
  lock_guard<std::recursive_mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return;
  }
  auto& connections = it->second;
  connections.erase(
      std::remove(connections.begin(), connections.end(), connection),
      connections.end());
  if (connections.empty()) {
    sessions.erase(it);
  }
  if (connection) {
    VLOG(1) << "Unregistered connection " << connection->getId()
            << " from session " << sessionId;
  }
}

bool SessionRegistry::sendPatches(const string& sessionId,
                                  const vector<Patch>& patches) {
  if (sessionId.empty() || patches.empty()) {
    return false;
  }
  vector<pair<string, shared_ptr<WebSocketConnection>>> targets;
  {
    lock_guard<std::recursive_mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return false;
    }
    for (const auto& connection : it->second) {
      targets.push_back(make_pair(sessionId, connection));
    }
  }
  string message = envelopeToString(makePatchEnvelope(patches));
  int delivered = deliver(targets, message);
  VLOG(2) << "Sent " << patches.size() << " patches to " << delivered << "/"
          << targets.size() << " connections of session " << sessionId;
  return delivered > 0;
}

int SessionRegistry::broadcastReload() {
  vector<pair<string, shared_ptr<WebSocketConnection>>> targets;
  {
    lock_guard<std::recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      for (const auto& connection : it.second) {
        targets.push_back(make_pair(it.first, connection));
      }
    }
  }
  int delivered = deliver(targets, envelopeToString(makeReloadEnvelope()));
  LOG(INFO) << "Reload broadcast reached " << delivered << " connections";
  return delivered;
}

int SessionRegistry::deliver(
    const vector<pair<string, shared_ptr<WebSocketConnection>>>& targets,
    const string& message) {
  int delivered = 0;
  for (const auto& target : targets) {
    if (target.second->send(message)) {
      delivered++;
    } else {
      unregisterConnection(target.first, target.second);
    }
  }
  return delivered;
}

void SessionRegistry::closeAll() {
  vector<shared_ptr<WebSocketConnection>> connections;
  {
    lock_guard<std::recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      connections.insert(connections.end(), it.second.begin(),
                         it.second.end());
    }
    sessions.clear();
  }
  for (auto& connection : connections) {
    connection->shutdown();
  }
}

int SessionRegistry::sessionCount() {
  lock_guard<std::recursive_mutex> guard(registryMutex);
  return int(sessions.size());
}

int SessionRegistry::connectionCount() {
  lock_guard<std::recursive_mutex> guard(registryMutex);
  int count = 0;
  for (const auto& it : sessions) {
    count += int(it.second.size());
  }
  return count;
}

int SessionRegistry::connectionCount(const string& sessionId) {
  lock_guard<std::recursive_mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return 0;
  }
  return int(it->second.size());
}
}  // namespace lp
