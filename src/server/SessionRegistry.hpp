#ifndef __LP_SESSION_REGISTRY__
#define __LP_SESSION_REGISTRY__

#include "Headers.hpp"
#include "Patch.hpp"
#include "WebSocketConnection.hpp"

namespace lp {
/**
 * @brief Maps a session id to the live connections (browser tabs) of that
 * session.
 *
 * Delivery copies the connection list under the lock and writes to the
 * sockets after releasing it, so a slow tab never blocks registration.
 * Connections whose write fails are unregistered.
 */
class SessionRegistry {
 public:
  SessionRegistry();
  virtual ~SessionRegistry() {}

  /** @brief Adds a connection to a session. Ignored for an empty session. */
  void registerConnection(const string& sessionId,
                          shared_ptr<WebSocketConnection> connection);
  /** @brief Removes a connection, dropping the session entry when empty. */
  void unregisterConnection(const string& sessionId,
                            shared_ptr<WebSocketConnection> connection);

  /**
   * @brief Sends one patch envelope to every connection of the session.
   * @return true iff at least one connection accepted the frame.
   */
  bool sendPatches(const string& sessionId, const vector<Patch>& patches);

  /**
   * @brief Asks every connected tab of every session to reload.
   * @return The number of connections that accepted the message.
   */
  int broadcastReload();

  /** @brief Shuts down every registered connection. */
  void closeAll();

  int sessionCount();
  int connectionCount();
  int connectionCount(const string& sessionId);

 protected:
  /**
   * @brief Sends `message` to each connection and unregisters the ones that
   * fail.
   */
  int deliver(const vector<pair<string, shared_ptr<WebSocketConnection>>>&
                  targets,
              const string& message);

  std::recursive_mutex registryMutex;
  unordered_map<string, vector<shared_ptr<WebSocketConnection>>> sessions;
};
}  // namespace lp

#endif  // __LP_SESSION_REGISTRY__
