#ifndef __LP_WEBSOCKET_CONNECTION__
#define __LP_WEBSOCKET_CONNECTION__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SocketHandler.hpp"
#include "WebSocketCodec.hpp"

namespace lp {
/**
 * @brief One upgraded browser socket belonging to a session.
 *
 * Senders on any thread push text frames through send(); a dedicated thread
 * runs run() to answer pings and notice when the peer goes away. The socket
 * is shut down as soon as the connection is marked closed, but only the
 * receive loop (or the destructor, if the loop never ran) closes the
 * descriptor, so no other thread can observe a recycled fd.
 */
class WebSocketConnection {
 public:
  WebSocketConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd,
                      const string& _sessionId);

  virtual ~WebSocketConnection();

  /**
   * @brief Sends a text frame.
   * @return false if the connection is closed or the write failed. A failed
   * write closes the connection.
   */
  virtual bool send(const string& text);
  virtual bool sendJson(const json& value);

  /**
   * @brief Receive loop. Returns once the peer closes, a read fails, or
   * shutdown() is called.
   */
  virtual void run();

  /**
   * @brief Stops the receive loop and shuts the socket down. Idempotent.
   */
  virtual void shutdown();

  bool isOpen();

  inline const string& getSessionId() const { return sessionId; }
  inline int getSocketFd() const { return socketFd; }
  inline int64_t getId() const { return id; }

 protected:
  bool sendFrame(uint8_t opcode, const string& payload);
  void markClosed();
  void releaseSocket();

  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  string sessionId;
  int64_t id;

  std::mutex sendMutex;
  std::recursive_mutex connectionMutex;
  bool closed;
  bool released;
  atomic<bool> shuttingDown;
};
}  // namespace lp

#endif  // __LP_WEBSOCKET_CONNECTION__
