#ifndef __LP_PATCH_CLIENT__
#define __LP_PATCH_CLIENT__

#include "ClientReconciler.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace httplib {
class Client;
}

namespace lp {
/**
 * @brief Headless page session: keeps a WebSocket to the server, polls while
 * it is down and applies everything it receives to a Document.
 *
 * The session cookie is adopted from the first response that sets one, so a
 * client started without a session id gets one from the server.
 */
class PatchClient {
 public:
  PatchClient(shared_ptr<SocketHandler> _socketHandler,
              const SocketEndpoint& _serverEndpoint,
              shared_ptr<Document> _document, const string& _sessionId = "");
  ~PatchClient();

  /**
   * @brief Connects and performs the opening handshake.
   * @return false if the server is unreachable or refuses the upgrade.
   */
  bool openSocket();
  void closeSocket();
  bool isConnected();

  /**
   * @brief Fetches and applies the session's queued patches over HTTP.
   * @return false if the request failed.
   */
  bool poll();
  /** @brief Tells the server a patch target does not exist. */
  void reportInvalid(const string& targetId);

  /**
   * @brief Waits up to `timeout` for socket data and handles every complete
   * frame.
   * @return The number of text messages handled.
   */
  int pump(std::chrono::milliseconds timeout);

  /** @brief Sends a masked ping; the server's pong is consumed by pump(). */
  bool sendPing(const string& payload);

  /**
   * @brief Drives the reconciler (socket, polling, backoff) until `halt` is
   * set.
   */
  void run(const atomic<bool>& halt);

  string getSessionId();
  inline shared_ptr<ClientReconciler> getReconciler() { return reconciler; }
  inline int64_t getPongCount() { return pongCount; }

 protected:
  void perform(const vector<ReconcilerAction>& actions);
  void handleDisconnect();
  /** @brief Decodes and dispatches every complete frame in the buffer. */
  int processBuffer();
  void adoptSessionCookie(const string& setCookie);
  string cookieHeader();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<Document> document;
  shared_ptr<ClientReconciler> reconciler;
  unique_ptr<httplib::Client> httpClient;

  std::recursive_mutex clientMutex;
  string sessionId;
  int socketFd;
  string buffer;
  atomic<int64_t> pongCount;
};
}  // namespace lp

#endif  // __LP_PATCH_CLIENT__
